#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "sponge/diagnostics.hpp"
#include "sponge/token.hpp"

namespace sponge {

struct LexOptions {
    // Unrecognized characters and a bare '!' become E0102/E0103 instead of being skipped.
    bool strict = false;
};

struct LexResult {
    bool success{false};
    std::vector<Token> tokens; // always terminated by an Eof token on success
    std::vector<Diagnostic> errors;
};

// Tokenize a whole compilation unit.
LexResult lex(std::string_view source, const LexOptions& opts = {});

// One token per line: "3:5 identifier 'x'"
std::string dump_tokens(const std::vector<Token>& tokens);

} // namespace sponge
