#pragma once
#include <string>

namespace sponge {

// Driver configuration gathered from SPONGE_* environment variables.
struct CompileEnv {
    std::string targetTriple; // empty = host
    std::string entryStyle;   // "", "start" or "libc"
    bool strictLex = false;
    bool dumpTokens = false;
    bool dumpIR = false;
    bool installFatalHandler = false;
};

// Detect compile environment from process env vars.
CompileEnv detectEnv();

} // namespace sponge
