#include "sponge/codegen/string_pool.hpp"

namespace sponge::codegen {

std::string StringPool::intern(const std::string& text){
    auto it = index_.find(text);
    if(it!=index_.end()) return entries_[it->second].label;
    size_t id = entries_.size();
    entries_.push_back(PooledString{"str_"+std::to_string(id), text});
    index_.emplace(text, id);
    return entries_.back().label;
}

} // namespace sponge::codegen
