// Token vocabulary produced by the lexer and consumed by the parser.
#pragma once
#include <cstdint>
#include <string>

namespace sponge {

enum class TokenKind {
    // keywords
    Func, Let, Return, If, Else,
    // type names
    KwInt, KwString,
    // literals / names
    IntLit, StrLit, Ident,
    // punctuation
    LParen, RParen, LBrace, RBrace, Comma, Colon, Semicolon,
    // operators
    Plus, Minus, Star, Slash, Greater, Less, Assign, EqEq, NotEq,
    Eof
};

struct Token {
    TokenKind kind = TokenKind::Eof;
    std::string text;      // identifier name, string body, or the lexeme
    int64_t int_value = 0; // IntLit only
    int line = 0;
    int col = 0;
};

// Human readable description used in parse diagnostics ("'('", "identifier", ...).
const char* token_kind_name(TokenKind k);

// Operator symbol for binary operator tokens, nullptr otherwise.
const char* binary_op_symbol(TokenKind k);

std::string describe(const Token& t);

} // namespace sponge
