// diagnostics_json.hpp - JSON serialization for compile diagnostics
#pragma once
#include "sponge/diagnostics.hpp"
#include <string>
#include <vector>

namespace sponge {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors);

// If SPONGE_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(bool success, const std::vector<Diagnostic>& errors);

} // namespace sponge
