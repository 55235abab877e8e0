#include "sponge/ir.hpp"
#include <sstream>

namespace sponge::ir {

namespace {

std::string join_args(const std::vector<ExprPtr>& args){
    std::string s;
    for(size_t i=0;i<args.size();++i){ if(i) s += ", "; s += to_string(*args[i]); }
    return s;
}

void dump_body(std::ostringstream& os, const std::vector<InstPtr>& body, int depth){
    std::string pad(static_cast<size_t>(depth)*2, ' ');
    for(auto& ip : body){
        const Inst& inst = *ip;
        if(auto* s = std::get_if<StoreVar>(&inst.data)){
            os << pad << "store " << s->name << " = " << to_string(*s->value) << "\n";
        } else if(auto* r = std::get_if<Return>(&inst.data)){
            os << pad << "return " << to_string(*r->value) << "\n";
        } else if(auto* f = std::get_if<If>(&inst.data)){
            os << pad << "if " << to_string(*f->cond) << "\n";
            dump_body(os, f->then_body, depth+1);
            os << pad << "else\n";
            dump_body(os, f->else_body, depth+1);
            os << pad << "endif\n";
        } else if(auto* p = std::get_if<Println>(&inst.data)){
            os << pad << "println " << to_string(*p->value) << "\n";
        } else if(auto* c = std::get_if<CallFunc>(&inst.data)){
            os << pad << "call " << c->name << "(" << join_args(c->args) << ")\n";
        }
    }
}

} // namespace

std::string to_string(const Expr& e){
    std::string body;
    if(auto* i = std::get_if<Int>(&e.data)) body = std::to_string(i->value);
    else if(auto* s = std::get_if<Str>(&e.data)) body = "\"" + s->value + "\"";
    else if(auto* v = std::get_if<Var>(&e.data)) body = v->name;
    else if(auto* b = std::get_if<Binary>(&e.data)) body = "(" + to_string(*b->lhs) + " " + b->op + " " + to_string(*b->rhs) + ")";
    else if(auto* c = std::get_if<Call>(&e.data)) body = c->name + "(" + join_args(c->args) + ")";
    return body + ":" + sponge::to_string(e.type);
}

std::string to_string(const Program& p){
    std::ostringstream os;
    for(auto& fn : p.functions){
        os << "func " << fn.name << "(";
        for(size_t i=0;i<fn.params.size();++i){
            if(i) os << ", ";
            os << fn.params[i].name << ": " << sponge::to_string(fn.params[i].type);
        }
        os << "): " << sponge::to_string(fn.ret) << "\n";
        dump_body(os, fn.body, 1);
    }
    return os.str();
}

} // namespace sponge::ir
