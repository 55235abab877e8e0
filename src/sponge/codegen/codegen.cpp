#include "sponge/codegen/codegen.hpp"
#include "sponge/features.hpp"
#include <cstdio>

namespace sponge::codegen {

namespace {

bool known_operator(const std::string& op){
    return op=="+" || op=="-" || op=="*" || op=="/" || op==">" || op=="<" || op=="==" || op=="!=";
}

} // namespace

std::optional<std::string> static_string(const ir::Expr& e){
    if(auto* s = std::get_if<ir::Str>(&e.data)) return s->value;
    if(auto* b = std::get_if<ir::Binary>(&e.data)){
        if(b->op!="+" || e.type!=TypeName::String) return std::nullopt;
        auto l = static_string(*b->lhs);
        if(!l) return std::nullopt;
        auto r = static_string(*b->rhs);
        if(!r) return std::nullopt;
        return *l + *r;
    }
    return std::nullopt;
}

void CodeGenerator::fail(const char* code, const std::string& message, const std::string& hint){
    throw compile_error(make_diagnostic(Stage::Codegen, code, message, hint, line_, col_));
}

int CodeGenerator::slot_of(const std::string& name){
    auto s = frame_->slot(name);
    if(!s) fail("E0403", "no stack slot for variable '"+name+"'");
    return *s;
}

void CodeGenerator::run(const ir::Program& prog){
    trace_ = debug_codegen_enabled();
    if(!prog.find("main")) fail("E0401", "program has no 'main' function", "define 'func main(): int'");
    out_.beginModule();
    out_.emitEntry(mangle("main"));
    for(auto& fn : prog.functions) gen_function(fn);
    out_.endModule();
}

void CodeGenerator::gen_function(const ir::Function& fn){
    FramePlan plan = plan_frame(fn);
    frame_ = &plan;
    exit_label_ = ctx_.labels.make("exit");
    std::vector<int> params;
    for(auto& p : fn.params) params.push_back(*plan.slot(p.name));
    if(trace_) std::fprintf(stderr, "[dbg][codegen] function '%s' slots=%zu frame=%d\n", fn.name.c_str(), plan.order.size(), plan.size);
    out_.beginFunction(mangle(fn.name), plan, params);
    gen_block(fn.body);
    out_.endFunction(exit_label_);
    frame_ = nullptr;
}

void CodeGenerator::gen_block(const std::vector<ir::InstPtr>& body){
    for(auto& ip : body) gen_inst(*ip);
}

void CodeGenerator::gen_inst(const ir::Inst& inst){
    line_ = inst.line; col_ = inst.col;
    if(auto* s = std::get_if<ir::StoreVar>(&inst.data)){
        gen_expr(*s->value);
        out_.storeSlot(slot_of(s->name));
    } else if(auto* r = std::get_if<ir::Return>(&inst.data)){
        gen_expr(*r->value);
        out_.jump(exit_label_);
    } else if(auto* f = std::get_if<ir::If>(&inst.data)){
        std::string then_l = ctx_.labels.make("then");
        std::string else_l = ctx_.labels.make("else");
        std::string end_l = ctx_.labels.make("endif");
        gen_expr(*f->cond);
        out_.branchIfZero(else_l);
        out_.label(then_l);
        gen_block(f->then_body);
        out_.jump(end_l);
        out_.label(else_l);
        gen_block(f->else_body);
        out_.label(end_l);
    } else if(auto* p = std::get_if<ir::Println>(&inst.data)){
        gen_print(*p->value, true);
    } else if(auto* c = std::get_if<ir::CallFunc>(&inst.data)){
        if(c->name=="print"){
            for(auto& a : c->args) gen_print(*a, false);
        } else {
            gen_call(c->name, c->args);
        }
    }
}

void CodeGenerator::gen_print(const ir::Expr& value, bool newline){
    if(value.type!=TypeName::String)
        fail("E0404", "printing integers is not supported", "only string values can be printed");
    if(auto text = static_string(value)){
        out_.printLiteral(ctx_.strings.intern(*text), newline);
        return;
    }
    gen_expr(value);
    out_.printResult(newline);
}

void CodeGenerator::gen_call(const std::string& name, const std::vector<ir::ExprPtr>& args){
    for(size_t i = args.size(); i-- > 0;){
        gen_expr(*args[i]);
        out_.pushResult();
    }
    out_.callFunction(mangle(name), args.size());
}

void CodeGenerator::gen_expr(const ir::Expr& e){
    if(auto* i = std::get_if<ir::Int>(&e.data)){ out_.loadInt(i->value); return; }
    if(auto* s = std::get_if<ir::Str>(&e.data)){ out_.loadString(ctx_.strings.intern(s->value)); return; }
    if(auto* v = std::get_if<ir::Var>(&e.data)){ out_.loadSlot(slot_of(v->name)); return; }
    if(auto* c = std::get_if<ir::Call>(&e.data)){ gen_call(c->name, c->args); return; }
    auto& b = std::get<ir::Binary>(e.data);
    if(!known_operator(b.op)) fail("E0402", "unknown binary operator '"+b.op+"'");
    if(e.type==TypeName::String){
        auto text = static_string(e);
        if(!text) fail("E0405", "string concatenation needs both operands known at compile time", "concatenate literals only");
        out_.loadString(ctx_.strings.intern(*text));
        return;
    }
    gen_expr(*b.lhs);
    out_.pushResult();
    gen_expr(*b.rhs);
    out_.binary(b.op);
}

CodegenResult generate(const ir::Program& prog, const TargetInfo& target){
    CodegenResult r;
    CodegenContext ctx(target);
    std::unique_ptr<AsmEmitter> emitter = target.arch==Arch::X86_64 ? make_x64_nasm_emitter(ctx) : make_aarch64_gas_emitter(ctx);
    CodeGenerator gen(ctx, *emitter);
    try {
        gen.run(prog);
    } catch(const compile_error& e){
        r.errors.push_back(e.diag);
        return r;
    }
    r.assembly = emitter->str();
    r.success = true;
    return r;
}

} // namespace sponge::codegen
