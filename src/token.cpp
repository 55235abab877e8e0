#include "sponge/token.hpp"

namespace sponge {

const char* token_kind_name(TokenKind k){
    switch(k){
        case TokenKind::Func: return "'func'";
        case TokenKind::Let: return "'let'";
        case TokenKind::Return: return "'return'";
        case TokenKind::If: return "'if'";
        case TokenKind::Else: return "'else'";
        case TokenKind::KwInt: return "'int'";
        case TokenKind::KwString: return "'string'";
        case TokenKind::IntLit: return "integer literal";
        case TokenKind::StrLit: return "string literal";
        case TokenKind::Ident: return "identifier";
        case TokenKind::LParen: return "'('";
        case TokenKind::RParen: return "')'";
        case TokenKind::LBrace: return "'{'";
        case TokenKind::RBrace: return "'}'";
        case TokenKind::Comma: return "','";
        case TokenKind::Colon: return "':'";
        case TokenKind::Semicolon: return "';'";
        case TokenKind::Plus: return "'+'";
        case TokenKind::Minus: return "'-'";
        case TokenKind::Star: return "'*'";
        case TokenKind::Slash: return "'/'";
        case TokenKind::Greater: return "'>'";
        case TokenKind::Less: return "'<'";
        case TokenKind::Assign: return "'='";
        case TokenKind::EqEq: return "'=='";
        case TokenKind::NotEq: return "'!='";
        case TokenKind::Eof: return "end of input";
    }
    return "token";
}

const char* binary_op_symbol(TokenKind k){
    switch(k){
        case TokenKind::Plus: return "+";
        case TokenKind::Minus: return "-";
        case TokenKind::Star: return "*";
        case TokenKind::Slash: return "/";
        case TokenKind::Greater: return ">";
        case TokenKind::Less: return "<";
        case TokenKind::EqEq: return "==";
        case TokenKind::NotEq: return "!=";
        default: return nullptr;
    }
}

std::string describe(const Token& t){
    switch(t.kind){
        case TokenKind::Ident: return "identifier '"+t.text+"'";
        case TokenKind::IntLit: return "integer literal "+std::to_string(t.int_value);
        case TokenKind::StrLit: return "string literal \""+t.text+"\"";
        default: return token_kind_name(t.kind);
    }
}

} // namespace sponge
