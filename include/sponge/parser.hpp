#pragma once
#include <cstddef>
#include <vector>
#include "sponge/ast.hpp"
#include "sponge/diagnostics.hpp"
#include "sponge/token.hpp"

namespace sponge {

struct ParseResult {
    bool success{false};
    ast::Program program;
    std::vector<Diagnostic> errors; // at most one: parsing stops at the first mismatch
};

// Recursive-descent parser with one token of lookahead.
class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens) : toks_(tokens) {}
    ParseResult parse_program();
private:
    const std::vector<Token>& toks_;
    size_t pos_ = 0;
    bool trace_ = false;

    const Token& peek() const;
    const Token& peek_next() const;
    const Token& advance();
    bool check(TokenKind k) const { return peek().kind == k; }
    const Token& expect(TokenKind k, const char* context);
    [[noreturn]] void fail(const Token& at, const char* code, const std::string& message, const std::string& hint = {});

    ast::Function parse_function();
    TypeName parse_type();
    std::vector<ast::StmtPtr> parse_block();
    ast::StmtPtr parse_statement();
    ast::ExprPtr parse_expr();
    ast::ExprPtr parse_primary();
};

ParseResult parse(const std::vector<Token>& tokens);

} // namespace sponge
