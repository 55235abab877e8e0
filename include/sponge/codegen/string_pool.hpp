#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace sponge::codegen {

struct PooledString { std::string label; std::string text; };

// Program-wide literal table, deduplicated by exact text. Labels are
// str_0, str_1, ... in first-use order.
class StringPool {
public:
    std::string intern(const std::string& text);
    const std::vector<PooledString>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    static std::string length_label(const std::string& label){ return label + "_len"; }
private:
    std::vector<PooledString> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace sponge::codegen
