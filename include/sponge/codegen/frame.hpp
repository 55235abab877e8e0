// Stack frame layout for one function.
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "sponge/ir.hpp"

namespace sponge::codegen {

struct FramePlan {
    std::vector<std::string> order;              // slot order: params, then first stores
    std::unordered_map<std::string, int> offsets; // negative offset from the frame pointer
    int size = 0;                                 // bytes reserved below the frame pointer, multiple of 16

    std::optional<int> slot(const std::string& name) const {
        auto it = offsets.find(name);
        if(it==offsets.end()) return std::nullopt;
        return it->second;
    }
};

inline constexpr int kSlotSize = 8;

// One 8-byte slot per distinct local name. Names stored in either branch of an
// if share a single slot.
FramePlan plan_frame(const ir::Function& fn);

} // namespace sponge::codegen
