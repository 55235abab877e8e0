#include "sponge/compiler.hpp"
#include "sponge/codegen/codegen.hpp"
#include "sponge/parser.hpp"

namespace sponge {

AnalyzeResult compile_to_ir(std::string_view source, const CompileOptions& opts){
    AnalyzeResult out;
    LexResult lr = lex(source, opts.lex);
    if(!lr.success){ out.errors = std::move(lr.errors); return out; }
    ParseResult pr = parse(lr.tokens);
    if(!pr.success){ out.errors = std::move(pr.errors); return out; }
    return analyze(pr.program);
}

CompileResult compile(std::string_view source, const codegen::TargetInfo& target, const CompileOptions& opts){
    CompileResult r;
    AnalyzeResult ar = compile_to_ir(source, opts);
    if(!ar.success){ r.errors = std::move(ar.errors); return r; }
    codegen::CodegenResult cg = codegen::generate(ar.program, target);
    if(!cg.success){ r.errors = std::move(cg.errors); return r; }
    r.assembly = std::move(cg.assembly);
    r.success = true;
    return r;
}

} // namespace sponge
