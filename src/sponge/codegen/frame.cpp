#include "sponge/codegen/frame.hpp"

namespace sponge::codegen {

namespace {

void add_slot(FramePlan& plan, const std::string& name){
    if(plan.offsets.count(name)) return;
    plan.order.push_back(name);
    plan.offsets[name] = -kSlotSize * static_cast<int>(plan.order.size());
}

void collect_stores(FramePlan& plan, const std::vector<ir::InstPtr>& body){
    for(auto& ip : body){
        if(auto* s = std::get_if<ir::StoreVar>(&ip->data)) add_slot(plan, s->name);
        else if(auto* f = std::get_if<ir::If>(&ip->data)){
            collect_stores(plan, f->then_body);
            collect_stores(plan, f->else_body);
        }
    }
}

} // namespace

FramePlan plan_frame(const ir::Function& fn){
    FramePlan plan;
    for(auto& p : fn.params) add_slot(plan, p.name);
    collect_stores(plan, fn.body);
    int raw = kSlotSize * static_cast<int>(plan.order.size());
    plan.size = (raw + 15) & ~15;
    return plan;
}

} // namespace sponge::codegen
