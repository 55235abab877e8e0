#include "sponge/parser.hpp"
#include "sponge/features.hpp"
#include <cstdio>

namespace sponge {

const Token& Parser::peek() const {
    static const Token eof_token{};
    if(toks_.empty()) return eof_token;
    return pos_ < toks_.size() ? toks_[pos_] : toks_.back();
}

const Token& Parser::peek_next() const {
    if(toks_.empty()) return peek();
    return pos_+1 < toks_.size() ? toks_[pos_+1] : toks_.back();
}

const Token& Parser::advance(){
    const Token& t = peek();
    if(pos_ < toks_.size()) ++pos_;
    return t;
}

void Parser::fail(const Token& at, const char* code, const std::string& message, const std::string& hint){
    throw compile_error(make_diagnostic(Stage::Parse, code, message, hint, at.line, at.col));
}

const Token& Parser::expect(TokenKind k, const char* context){
    if(!check(k)){
        const Token& t = peek();
        fail(t, "E0201", std::string("expected ")+token_kind_name(k)+" "+context+", found "+describe(t));
    }
    return advance();
}

ParseResult Parser::parse_program(){
    ParseResult r;
    trace_ = debug_parse_enabled();
    try {
        while(!check(TokenKind::Eof)){
            r.program.functions.push_back(parse_function());
            if(trace_) std::fprintf(stderr, "[dbg][parse] function '%s' params=%zu stmts=%zu\n", r.program.functions.back().name.c_str(), r.program.functions.back().params.size(), r.program.functions.back().body.size());
        }
    } catch(const compile_error& e){
        r.program.functions.clear();
        r.errors.push_back(e.diag);
        return r;
    }
    r.success = true;
    return r;
}

// func IDENT ( [IDENT : TYPE {, IDENT : TYPE}] ) : TYPE { stmt* }
ast::Function Parser::parse_function(){
    const Token& kw = expect(TokenKind::Func, "to start a function");
    ast::Function fn;
    fn.line = kw.line; fn.col = kw.col;
    if(!check(TokenKind::Ident)) fail(peek(), "E0204", "expected function name, found "+describe(peek()));
    fn.name = advance().text;
    expect(TokenKind::LParen, "after function name");
    if(!check(TokenKind::RParen)){
        while(true){
            if(!check(TokenKind::Ident)) fail(peek(), "E0204", "expected parameter name, found "+describe(peek()));
            ast::Param p;
            p.name = advance().text;
            expect(TokenKind::Colon, "after parameter name");
            p.type = parse_type();
            fn.params.push_back(std::move(p));
            if(!check(TokenKind::Comma)) break;
            advance();
        }
    }
    expect(TokenKind::RParen, "to close the parameter list");
    expect(TokenKind::Colon, "before the return type");
    fn.ret = parse_type();
    fn.body = parse_block();
    return fn;
}

TypeName Parser::parse_type(){
    if(check(TokenKind::KwInt)){ advance(); return TypeName::Int; }
    if(check(TokenKind::KwString)){ advance(); return TypeName::String; }
    fail(peek(), "E0202", "expected type name, found "+describe(peek()), "types are 'int' and 'string'");
}

std::vector<ast::StmtPtr> Parser::parse_block(){
    expect(TokenKind::LBrace, "to open a block");
    std::vector<ast::StmtPtr> body;
    while(!check(TokenKind::RBrace)){
        if(check(TokenKind::Eof)) fail(peek(), "E0201", "expected '}' to close the block, found end of input");
        body.push_back(parse_statement());
    }
    advance();
    return body;
}

ast::StmtPtr Parser::parse_statement(){
    const Token& first = peek();
    int line = first.line, col = first.col;
    switch(first.kind){
        case TokenKind::Let: {
            advance();
            if(!check(TokenKind::Ident)) fail(peek(), "E0204", "expected variable name after 'let', found "+describe(peek()));
            ast::LetStmt s;
            s.name = advance().text;
            expect(TokenKind::Colon, "after variable name");
            s.type = parse_type();
            expect(TokenKind::Assign, "in let binding");
            s.init = parse_expr();
            expect(TokenKind::Semicolon, "after let binding");
            return ast::make_stmt(std::move(s), line, col);
        }
        case TokenKind::Return: {
            advance();
            ast::ReturnStmt s;
            s.value = parse_expr();
            expect(TokenKind::Semicolon, "after return value");
            return ast::make_stmt(std::move(s), line, col);
        }
        case TokenKind::If: {
            advance();
            ast::IfStmt s;
            s.cond = parse_expr();
            s.then_body = parse_block();
            expect(TokenKind::Else, "after if block ('else' is required)");
            s.else_body = parse_block();
            return ast::make_stmt(std::move(s), line, col);
        }
        default: {
            ast::ExprStmt s;
            s.expr = parse_expr();
            expect(TokenKind::Semicolon, "after expression statement");
            return ast::make_stmt(std::move(s), line, col);
        }
    }
}

// All binary operators share one precedence level and associate to the left:
// 1 + 2 * 3 parses as (1 + 2) * 3.
ast::ExprPtr Parser::parse_expr(){
    auto lhs = parse_primary();
    while(const char* op = binary_op_symbol(peek().kind)){
        const Token& opTok = advance();
        auto rhs = parse_primary();
        lhs = ast::make_expr(ast::BinaryExpr{std::move(lhs), op, std::move(rhs)}, opTok.line, opTok.col);
    }
    return lhs;
}

ast::ExprPtr Parser::parse_primary(){
    const Token& t = peek();
    switch(t.kind){
        case TokenKind::IntLit:
            advance();
            return ast::make_expr(ast::IntLiteral{t.int_value}, t.line, t.col);
        case TokenKind::StrLit:
            advance();
            return ast::make_expr(ast::StringLiteral{t.text}, t.line, t.col);
        case TokenKind::Ident: {
            if(peek_next().kind != TokenKind::LParen){
                advance();
                return ast::make_expr(ast::VarRef{t.text}, t.line, t.col);
            }
            advance();
            advance(); // '('
            ast::CallExpr call;
            call.callee = t.text;
            if(!check(TokenKind::RParen)){
                while(true){
                    call.args.push_back(parse_expr());
                    if(!check(TokenKind::Comma)) break;
                    advance();
                }
            }
            expect(TokenKind::RParen, "to close the argument list");
            return ast::make_expr(std::move(call), t.line, t.col);
        }
        case TokenKind::LParen: {
            advance();
            auto inner = parse_expr();
            expect(TokenKind::RParen, "to close the parenthesized expression");
            return inner;
        }
        default:
            fail(t, "E0203", "expected expression, found "+describe(t));
    }
}

ParseResult parse(const std::vector<Token>& tokens){
    Parser p(tokens);
    return p.parse_program();
}

} // namespace sponge
