// Parsed program representation. Built once by the parser and never mutated.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "sponge/types.hpp"

namespace sponge::ast {

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

struct IntLiteral { int64_t value = 0; };
struct StringLiteral { std::string value; };
struct VarRef { std::string name; };
struct BinaryExpr { ExprPtr lhs; std::string op; ExprPtr rhs; };
struct CallExpr { std::string callee; std::vector<ExprPtr> args; };

using expr_data = std::variant<IntLiteral, StringLiteral, VarRef, BinaryExpr, CallExpr>;

struct Expr {
    expr_data data;
    int line = 0;
    int col = 0;
};

struct LetStmt { std::string name; TypeName type = TypeName::Int; ExprPtr init; };
struct ExprStmt { ExprPtr expr; };
struct ReturnStmt { ExprPtr value; };
struct IfStmt { ExprPtr cond; std::vector<StmtPtr> then_body; std::vector<StmtPtr> else_body; };

using stmt_data = std::variant<LetStmt, ExprStmt, ReturnStmt, IfStmt>;

struct Stmt {
    stmt_data data;
    int line = 0;
    int col = 0;
};

struct Param { std::string name; TypeName type = TypeName::Int; };

struct Function {
    std::string name;
    std::vector<Param> params;
    TypeName ret = TypeName::Int;
    std::vector<StmtPtr> body;
    int line = 0;
    int col = 0;
};

struct Program {
    std::vector<Function> functions; // declaration order
};

inline ExprPtr make_expr(expr_data d, int line, int col){ return std::make_unique<Expr>(Expr{std::move(d), line, col}); }
inline StmtPtr make_stmt(stmt_data d, int line, int col){ return std::make_unique<Stmt>(Stmt{std::move(d), line, col}); }

} // namespace sponge::ast
