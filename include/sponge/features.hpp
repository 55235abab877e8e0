#pragma once
#include <cstdlib>

namespace sponge {
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
inline bool debug_lex_enabled(){ return flag_enabled("SPONGE_DEBUG_LEX"); }
inline bool debug_parse_enabled(){ return flag_enabled("SPONGE_DEBUG_PARSE"); }
inline bool debug_sema_enabled(){ return flag_enabled("SPONGE_DEBUG_SEMA"); }
inline bool debug_codegen_enabled(){ return flag_enabled("SPONGE_DEBUG_CODEGEN"); }
}
