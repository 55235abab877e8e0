// IR -> assembly text.
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "sponge/codegen/emitter.hpp"
#include "sponge/codegen/target.hpp"
#include "sponge/diagnostics.hpp"
#include "sponge/ir.hpp"

namespace sponge::codegen {

struct CodegenResult {
    bool success{false};
    std::string assembly;
    std::vector<Diagnostic> errors;
};

// Label a user function is emitted under.
inline std::string mangle(const std::string& name){ return "fn_" + name; }

class CodeGenerator {
public:
    CodeGenerator(CodegenContext& ctx, AsmEmitter& out) : ctx_(ctx), out_(out) {}
    void run(const ir::Program& prog);
private:
    CodegenContext& ctx_;
    AsmEmitter& out_;
    const FramePlan* frame_ = nullptr;
    std::string exit_label_;
    int line_ = -1, col_ = -1; // instruction being emitted, for diagnostics
    bool trace_ = false;

    void gen_function(const ir::Function& fn);
    void gen_block(const std::vector<ir::InstPtr>& body);
    void gen_inst(const ir::Inst& inst);
    void gen_expr(const ir::Expr& e);
    void gen_call(const std::string& name, const std::vector<ir::ExprPtr>& args);
    void gen_print(const ir::Expr& value, bool newline);
    int slot_of(const std::string& name);
    [[noreturn]] void fail(const char* code, const std::string& message, const std::string& hint = {});
};

// Text of a string expression known at compile time (literals and their
// concatenations).
std::optional<std::string> static_string(const ir::Expr& e);

CodegenResult generate(const ir::Program& prog, const TargetInfo& target);

} // namespace sponge::codegen
