#include "sponge/semantic.hpp"
#include "sponge/features.hpp"
#include <cstdio>

namespace sponge {

bool is_builtin(const std::string& name){ return name=="println" || name=="print"; }

void SemanticAnalyzer::reset(){
    functions_.clear();
    function_names_.clear();
    vars_.clear();
    current_ = nullptr;
}

void SemanticAnalyzer::error_code(int line, int col, const std::string& code, const std::string& msg, const std::string& hint){
    throw compile_error(make_diagnostic(Stage::Semantic, code, msg, hint, line, col));
}

void SemanticAnalyzer::type_mismatch(int line, int col, const std::string& code, const std::string& role, TypeName expected, TypeName found){
    auto d = make_diagnostic(Stage::Semantic, code, role+" type mismatch", std::string("ensure ")+role+" has type "+to_string(expected), line, col);
    add_mismatch_notes(d, to_string(expected), to_string(found));
    throw compile_error(std::move(d));
}

AnalyzeResult SemanticAnalyzer::analyze(const ast::Program& prog){
    AnalyzeResult r;
    reset();
    trace_ = debug_sema_enabled();
    try {
        collect_functions(prog);
        for(auto& fn : prog.functions) r.program.functions.push_back(lower_function(fn));
    } catch(const compile_error& e){
        r.program.functions.clear();
        r.errors.push_back(e.diag);
        return r;
    }
    r.success = true;
    return r;
}

void SemanticAnalyzer::collect_functions(const ast::Program& prog){
    for(auto& fn : prog.functions){
        if(is_builtin(fn.name))
            error_code(fn.line, fn.col, "E0313", "function '"+fn.name+"' shadows a builtin", "rename the function");
        if(functions_.count(fn.name))
            error_code(fn.line, fn.col, "E0312", "duplicate definition of function '"+fn.name+"'", "each function name may be defined once");
        // the entry block calls main with no arguments and exits with its result
        if(fn.name=="main" && (!fn.params.empty() || fn.ret!=TypeName::Int))
            error_code(fn.line, fn.col, "E0314", "'main' must take no parameters and return int", "declare it as 'func main(): int'");
        functions_[fn.name] = FunctionSig{fn.name, fn.params, fn.ret};
        function_names_.push_back(fn.name);
    }
}

const FunctionSig& SemanticAnalyzer::lookup_function(const std::string& name, int line, int col){
    auto it = functions_.find(name);
    if(it==functions_.end()){
        auto d = make_diagnostic(Stage::Semantic, "E0302", "unknown function '"+name+"'", "declare the function with 'func'", line, col);
        append_suggestions(d, fuzzy_candidates(name, function_names_));
        throw compile_error(std::move(d));
    }
    return it->second;
}

ir::Function SemanticAnalyzer::lower_function(const ast::Function& fn){
    current_ = &fn;
    vars_.clear();
    ir::Function out;
    out.name = fn.name;
    out.ret = fn.ret;
    for(auto& p : fn.params){
        vars_[p.name] = p.type;
        out.params.push_back(ir::Param{p.name, p.type});
    }
    lower_block(fn.body, out.body);
    if(trace_) std::fprintf(stderr, "[dbg][sema] lowered '%s' insts=%zu vars=%zu\n", fn.name.c_str(), out.body.size(), vars_.size());
    return out;
}

void SemanticAnalyzer::lower_block(const std::vector<ast::StmtPtr>& stmts, std::vector<ir::InstPtr>& out){
    for(auto& s : stmts) out.push_back(lower_statement(*s));
}

ir::InstPtr SemanticAnalyzer::lower_statement(const ast::Stmt& s){
    if(auto* let = std::get_if<ast::LetStmt>(&s.data)){
        auto init = lower_expr(*let->init);
        if(init->type != let->type) type_mismatch(s.line, s.col, "E0305", "initializer of '"+let->name+"'", let->type, init->type);
        vars_[let->name] = let->type;
        return ir::make_inst(ir::StoreVar{let->name, std::move(init)}, s.line, s.col);
    }
    if(auto* ret = std::get_if<ast::ReturnStmt>(&s.data)){
        auto v = lower_expr(*ret->value);
        if(v->type != current_->ret) type_mismatch(s.line, s.col, "E0307", "return value of '"+current_->name+"'", current_->ret, v->type);
        return ir::make_inst(ir::Return{std::move(v)}, s.line, s.col);
    }
    if(auto* ifs = std::get_if<ast::IfStmt>(&s.data)){
        ir::If out;
        out.cond = lower_expr(*ifs->cond);
        if(out.cond->type != TypeName::Int) type_mismatch(s.line, s.col, "E0306", "if condition", TypeName::Int, out.cond->type);
        lower_block(ifs->then_body, out.then_body);
        lower_block(ifs->else_body, out.else_body);
        return ir::make_inst(std::move(out), s.line, s.col);
    }
    auto& es = std::get<ast::ExprStmt>(s.data);
    if(auto* call = std::get_if<ast::CallExpr>(&es.expr->data)) return lower_statement_call(*call, s);
    auto v = lower_expr(*es.expr);
    return ir::make_inst(ir::StoreVar{ir::kDiscardName, std::move(v)}, s.line, s.col);
}

ir::InstPtr SemanticAnalyzer::lower_statement_call(const ast::CallExpr& call, const ast::Stmt& s){
    if(call.callee=="println"){
        if(call.args.size()!=1)
            error_code(s.line, s.col, "E0309", "println expects exactly 1 argument, got "+std::to_string(call.args.size()));
        auto arg = lower_expr(*call.args[0]);
        if(arg->type != TypeName::String) type_mismatch(s.line, s.col, "E0310", "println argument", TypeName::String, arg->type);
        return ir::make_inst(ir::Println{std::move(arg)}, s.line, s.col);
    }
    if(call.callee=="print"){
        ir::CallFunc out{"print", {}};
        for(auto& a : call.args) out.args.push_back(lower_expr(*a));
        return ir::make_inst(std::move(out), s.line, s.col);
    }
    const FunctionSig& sig = lookup_function(call.callee, s.line, s.col);
    auto args = lower_user_call_args(sig, call, s.line, s.col);
    return ir::make_inst(ir::CallFunc{call.callee, std::move(args)}, s.line, s.col);
}

std::vector<ir::ExprPtr> SemanticAnalyzer::lower_user_call_args(const FunctionSig& sig, const ast::CallExpr& call, int line, int col){
    if(call.args.size()!=sig.params.size())
        error_code(line, col, "E0303", "function '"+sig.name+"' expects "+std::to_string(sig.params.size())+" argument(s), got "+std::to_string(call.args.size()));
    std::vector<ir::ExprPtr> args;
    for(size_t i=0;i<call.args.size();++i){
        auto a = lower_expr(*call.args[i]);
        if(a->type != sig.params[i].type)
            type_mismatch(call.args[i]->line, call.args[i]->col, "E0304", "argument '"+sig.params[i].name+"' of '"+sig.name+"'", sig.params[i].type, a->type);
        args.push_back(std::move(a));
    }
    return args;
}

ir::ExprPtr SemanticAnalyzer::lower_expr(const ast::Expr& e){
    if(auto* i = std::get_if<ast::IntLiteral>(&e.data)) return ir::make_expr(ir::Int{i->value}, TypeName::Int);
    if(auto* s = std::get_if<ast::StringLiteral>(&e.data)) return ir::make_expr(ir::Str{s->value}, TypeName::String);
    if(auto* v = std::get_if<ast::VarRef>(&e.data)){
        auto it = vars_.find(v->name);
        if(it==vars_.end()){
            auto d = make_diagnostic(Stage::Semantic, "E0301", "unknown variable '"+v->name+"'", "declare it with 'let' before use", e.line, e.col);
            std::vector<std::string> pool;
            for(auto& kv : vars_) pool.push_back(kv.first);
            append_suggestions(d, fuzzy_candidates(v->name, pool));
            throw compile_error(std::move(d));
        }
        return ir::make_expr(ir::Var{v->name}, it->second);
    }
    if(auto* b = std::get_if<ast::BinaryExpr>(&e.data)) return lower_binary(*b, e);
    auto& call = std::get<ast::CallExpr>(e.data);
    if(is_builtin(call.callee))
        error_code(e.line, e.col, "E0311", "builtin '"+call.callee+"' cannot be used as a value", "call it as a statement");
    const FunctionSig& sig = lookup_function(call.callee, e.line, e.col);
    auto args = lower_user_call_args(sig, call, e.line, e.col);
    return ir::make_expr(ir::Call{call.callee, std::move(args)}, sig.ret);
}

ir::ExprPtr SemanticAnalyzer::lower_binary(const ast::BinaryExpr& b, const ast::Expr& at){
    auto lhs = lower_expr(*b.lhs);
    auto rhs = lower_expr(*b.rhs);
    TypeName result = TypeName::Int;
    if(b.op=="+" && lhs->type==TypeName::String && rhs->type==TypeName::String){
        result = TypeName::String;
    } else if(lhs->type!=TypeName::Int || rhs->type!=TypeName::Int){
        auto d = make_diagnostic(Stage::Semantic, "E0308", "invalid operand types for '"+b.op+"'",
                                 b.op=="+" ? "'+' takes two ints or two strings" : "operands must be int", at.line, at.col);
        add_mismatch_notes(d, b.op=="+" ? "int + int or string + string" : "int "+b.op+" int",
                           std::string(to_string(lhs->type))+" "+b.op+" "+to_string(rhs->type));
        throw compile_error(std::move(d));
    }
    return ir::make_expr(ir::Binary{std::move(lhs), b.op, std::move(rhs)}, result);
}

AnalyzeResult analyze(const ast::Program& prog){
    SemanticAnalyzer a;
    return a.analyze(prog);
}

} // namespace sponge
