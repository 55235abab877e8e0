#pragma once
#include <string>

namespace sponge::codegen {

// Hands out assembler-local labels. One allocator per code generation run, so
// ids are unique across every function of the program and restart at 0 for
// the next run.
class LabelAllocator {
public:
    explicit LabelAllocator(std::string prefix) : prefix_(std::move(prefix)) {}
    std::string make(const std::string& base){ return prefix_ + base + "_" + std::to_string(next_++); }
    int issued() const { return next_; }
private:
    std::string prefix_;
    int next_ = 0;
};

} // namespace sponge::codegen
