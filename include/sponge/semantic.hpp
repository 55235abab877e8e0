// Type checking and lowering of the AST into the typed IR.
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "sponge/ast.hpp"
#include "sponge/diagnostics.hpp"
#include "sponge/ir.hpp"

namespace sponge {

struct AnalyzeResult {
    bool success{false};
    ir::Program program;
    std::vector<Diagnostic> errors;
};

// Statement-only builtins. They are never entered in the function table.
bool is_builtin(const std::string& name);

struct FunctionSig { std::string name; std::vector<ast::Param> params; TypeName ret = TypeName::Int; };

class SemanticAnalyzer {
public:
    AnalyzeResult analyze(const ast::Program& prog);
private:
    // whole program, forward references allowed
    std::unordered_map<std::string, FunctionSig> functions_;
    std::vector<std::string> function_names_;
    // per function: one flat table, later lets overwrite earlier ones
    std::unordered_map<std::string, TypeName> vars_;
    const ast::Function* current_ = nullptr;
    bool trace_ = false;

    void reset();
    void collect_functions(const ast::Program& prog);
    ir::Function lower_function(const ast::Function& fn);
    void lower_block(const std::vector<ast::StmtPtr>& stmts, std::vector<ir::InstPtr>& out);
    ir::InstPtr lower_statement(const ast::Stmt& s);
    ir::InstPtr lower_statement_call(const ast::CallExpr& call, const ast::Stmt& s);
    ir::ExprPtr lower_expr(const ast::Expr& e);
    ir::ExprPtr lower_binary(const ast::BinaryExpr& b, const ast::Expr& at);
    std::vector<ir::ExprPtr> lower_user_call_args(const FunctionSig& sig, const ast::CallExpr& call, int line, int col);
    const FunctionSig& lookup_function(const std::string& name, int line, int col);

    [[noreturn]] void error_code(int line, int col, const std::string& code, const std::string& msg, const std::string& hint = "");
    [[noreturn]] void type_mismatch(int line, int col, const std::string& code, const std::string& role, TypeName expected, TypeName found);
};

AnalyzeResult analyze(const ast::Program& prog);

} // namespace sponge
