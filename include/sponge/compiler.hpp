// Pipeline facade: lex -> parse -> analyze -> generate, stopping at the first
// failing stage.
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "sponge/codegen/target.hpp"
#include "sponge/diagnostics.hpp"
#include "sponge/lexer.hpp"
#include "sponge/semantic.hpp"

namespace sponge {

struct CompileOptions {
    LexOptions lex;
};

struct CompileResult {
    bool success{false};
    std::string assembly;
    std::vector<Diagnostic> errors;
};

// Lex, parse and analyze. Errors come from whichever stage failed first.
AnalyzeResult compile_to_ir(std::string_view source, const CompileOptions& opts = {});

CompileResult compile(std::string_view source, const codegen::TargetInfo& target, const CompileOptions& opts = {});

} // namespace sponge
