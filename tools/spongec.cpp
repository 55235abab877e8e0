// spongec: compile a .sp file to assembly text.
#include <cstdio>
#include <cstdlib>
#include <string>
#include "sponge/compiler.hpp"
#include "sponge/codegen/codegen.hpp"
#include "sponge/diagnostics_json.hpp"
#include "sponge/env.hpp"
#include "sponge/ir.hpp"
#include "sponge/parser.hpp"

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

using namespace sponge;

static void spongeFatalHandler(void* userData, const char* reason, bool genCrashDiag){
    (void)userData; (void)genCrashDiag;
    std::fprintf(stderr, "[fatal][llvm] %s\n", reason ? reason : "<null reason>");
    llvm::sys::PrintStackTrace(llvm::errs());
}

static void installFatalHandler(){
    llvm::install_fatal_error_handler(spongeFatalHandler);
    llvm::EnablePrettyStackTrace();
    llvm::sys::AddSignalHandler([](void*){
        std::fprintf(stderr, "[fatal][signal] caught fatal signal, printing stack trace...\n");
        llvm::sys::PrintStackTrace(llvm::errs());
    }, nullptr);
    std::fprintf(stderr, "[diag] Installed LLVM fatal error handler (SPONGE_INSTALL_FATAL_HANDLER=1)\n");
}

static int usage(){
    llvm::errs() << "usage: spongec <input.sp> [-o out] [--target triple] [--emit=tokens|ir|asm]\n";
    return 2;
}

static int report(const std::vector<Diagnostic>& errors){
    for(auto& d : errors) llvm::errs() << format_diagnostic(d);
    maybe_print_json(false, errors);
    return 1;
}

int main(int argc, char** argv){
    CompileEnv env = detectEnv();
    if(env.installFatalHandler) installFatalHandler();

    std::string input, output, emit = "asm";
    std::string triple = env.targetTriple;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="-o"){ if(++i>=argc) return usage(); output = argv[i]; }
        else if(a=="--target"){ if(++i>=argc) return usage(); triple = argv[i]; }
        else if(a.rfind("--emit=",0)==0) emit = a.substr(7);
        else if(a=="-h" || a=="--help"){ usage(); return 0; }
        else if(!a.empty() && a[0]=='-') return usage();
        else if(input.empty()) input = a;
        else return usage();
    }
    if(input.empty() || (emit!="asm" && emit!="ir" && emit!="tokens")) return usage();

    auto buf = llvm::MemoryBuffer::getFile(input);
    if(!buf){
        llvm::errs() << "spongec: cannot read '" << input << "': " << buf.getError().message() << "\n";
        return 2;
    }
    std::string_view source((*buf)->getBufferStart(), (*buf)->getBufferSize());

    CompileOptions opts;
    opts.lex.strict = env.strictLex;

    std::string text;
    LexResult lr = lex(source, opts.lex);
    if(!lr.success) return report(lr.errors);
    if(env.dumpTokens) llvm::errs() << dump_tokens(lr.tokens);
    if(emit=="tokens"){
        text = dump_tokens(lr.tokens);
    } else {
        ParseResult pr = parse(lr.tokens);
        if(!pr.success) return report(pr.errors);
        AnalyzeResult ar = analyze(pr.program);
        if(!ar.success) return report(ar.errors);
        if(env.dumpIR) llvm::errs() << ir::to_string(ar.program);
        if(emit=="ir"){
            text = ir::to_string(ar.program);
        } else {
            codegen::TargetResult tr = codegen::select_target(triple, env.entryStyle);
            if(!tr.success) return report(tr.errors);
            codegen::CodegenResult cg = codegen::generate(ar.program, tr.target);
            if(!cg.success) return report(cg.errors);
            text = std::move(cg.assembly);
        }
    }
    maybe_print_json(true, {});

    if(output.empty()){
        llvm::outs() << text;
        return 0;
    }
    std::error_code ec;
    llvm::raw_fd_ostream os(output, ec, llvm::sys::fs::OF_None);
    if(ec){
        llvm::errs() << "spongec: cannot write '" << output << "': " << ec.message() << "\n";
        return 2;
    }
    os << text;
    return 0;
}
