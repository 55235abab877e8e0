#include "sponge/env.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace sponge {

CompileEnv detectEnv(){
    CompileEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("SPONGE_TARGET_TRIPLE")) e.targetTriple = v;

    // Entry style, case-insensitive
    if (const char* v = get("SPONGE_ENTRY")) {
        e.entryStyle = v;
        std::transform(e.entryStyle.begin(), e.entryStyle.end(), e.entryStyle.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    }

    if (const char* v = get("SPONGE_STRICT_LEX")) e.strictLex = (std::string(v) == "1");
    if (const char* v = get("SPONGE_DUMP_TOKENS")) e.dumpTokens = (std::string(v) == "1");
    if (const char* v = get("SPONGE_DUMP_IR")) e.dumpIR = (std::string(v) == "1");
    if (const char* v = get("SPONGE_INSTALL_FATAL_HANDLER")) e.installFatalHandler = (std::string(v) == "1");

    return e;
}

} // namespace sponge
