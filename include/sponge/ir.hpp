// Typed intermediate representation produced by semantic analysis.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "sponge/types.hpp"

namespace sponge::ir {

struct Expr;
struct Inst;
using ExprPtr = std::unique_ptr<Expr>;
using InstPtr = std::unique_ptr<Inst>;

struct Int { int64_t value = 0; };
struct Str { std::string value; };
struct Var { std::string name; };
struct Binary { ExprPtr lhs; std::string op; ExprPtr rhs; };
struct Call { std::string name; std::vector<ExprPtr> args; };

using expr_data = std::variant<Int, Str, Var, Binary, Call>;

struct Expr {
    expr_data data;
    TypeName type = TypeName::Int; // result type, fixed during lowering
};

struct StoreVar { std::string name; ExprPtr value; };
struct Return { ExprPtr value; };
struct If { ExprPtr cond; std::vector<InstPtr> then_body; std::vector<InstPtr> else_body; };
struct Println { ExprPtr value; };
struct CallFunc { std::string name; std::vector<ExprPtr> args; };

using inst_data = std::variant<StoreVar, Return, If, Println, CallFunc>;

struct Inst {
    inst_data data;
    int line = 0;
    int col = 0;
};

struct Param { std::string name; TypeName type = TypeName::Int; };

struct Function {
    std::string name;
    std::vector<Param> params;
    TypeName ret = TypeName::Int;
    std::vector<InstPtr> body;
};

struct Program {
    std::vector<Function> functions;
    const Function* find(const std::string& name) const {
        for(auto& f : functions) if(f.name==name) return &f;
        return nullptr;
    }
};

// Name that expression statements with no effect of their own are stored under.
inline constexpr const char* kDiscardName = "$discard";

inline ExprPtr make_expr(expr_data d, TypeName t){ return std::make_unique<Expr>(Expr{std::move(d), t}); }
inline InstPtr make_inst(inst_data d, int line, int col){ return std::make_unique<Inst>(Inst{std::move(d), line, col}); }

// Textual dumps used by the driver (--emit=ir) and tests.
std::string to_string(const Expr& e);
std::string to_string(const Program& p);

} // namespace sponge::ir
