// The language has exactly two value types.
#pragma once

namespace sponge {

enum class TypeName { Int, String };

inline const char* to_string(TypeName t){ return t==TypeName::Int ? "int" : "string"; }

} // namespace sponge
