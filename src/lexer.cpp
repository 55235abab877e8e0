#include "sponge/lexer.hpp"
#include "sponge/features.hpp"
#include <tao/pegtl.hpp>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <unordered_map>

namespace sponge {

namespace grammar {
using namespace tao::pegtl;

// Token grammar. The unit is a flat stream of tokens; every byte is consumed by
// exactly one alternative, the last of which swallows anything unrecognized.
struct ws_char : one<' ','\t','\r','\n'> {};
struct eq_eq_tok : two<'='> {};
struct assign_tok : one<'='> {};
struct not_eq_tok : seq< one<'!'>, one<'='> > {};
struct bang_tok : one<'!'> {};
struct punct_tok : one<'(',')','{','}',',',':',';','+','-','*','/','>','<'> {};
// body is verbatim; an unterminated literal runs to the end of input
struct str_lit : seq< one<'"'>, star< not_one<'"'> >, opt< one<'"'> > > {};
struct int_lit : plus< digit > {};
struct ident_tok : identifier {};
struct unknown_char : any {};
struct token_rule : sor< ws_char, eq_eq_tok, assign_tok, not_eq_tok, bang_tok, punct_tok, str_lit, int_lit, ident_tok, unknown_char > {};
struct unit_rule : seq< star< token_rule >, eof > {};

} // namespace grammar

namespace {

struct lex_state {
    const LexOptions* opts = nullptr;
    bool trace = false;
    std::vector<Token> tokens;

    void push(TokenKind k, std::string text, int line, int col, int64_t v = 0){
        Token t; t.kind = k; t.text = std::move(text); t.int_value = v; t.line = line; t.col = col;
        if(trace) std::fprintf(stderr, "[dbg][lex] %d:%d %s\n", line, col, describe(t).c_str());
        tokens.push_back(std::move(t));
    }
};

template<typename ActionInput>
static int line_of(const ActionInput& in){ return static_cast<int>(in.position().line); }
template<typename ActionInput>
static int col_of(const ActionInput& in){ return static_cast<int>(in.position().column); }

const std::unordered_map<std::string, TokenKind>& keyword_table(){
    static const std::unordered_map<std::string, TokenKind> table = {
        {"func", TokenKind::Func}, {"let", TokenKind::Let}, {"return", TokenKind::Return},
        {"if", TokenKind::If}, {"else", TokenKind::Else},
        {"int", TokenKind::KwInt}, {"string", TokenKind::KwString},
    };
    return table;
}

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

template<>
struct action<grammar::eq_eq_tok> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(TokenKind::EqEq, "==", line_of(in), col_of(in)); }
};

template<>
struct action<grammar::assign_tok> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(TokenKind::Assign, "=", line_of(in), col_of(in)); }
};

template<>
struct action<grammar::not_eq_tok> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){ st.push(TokenKind::NotEq, "!=", line_of(in), col_of(in)); }
};

template<>
struct action<grammar::bang_tok> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        if(st.opts->strict)
            throw compile_error(make_diagnostic(Stage::Lex, "E0103", "'!' must be followed by '='", "use '!=' for inequality", line_of(in), col_of(in)));
        if(st.trace) std::fprintf(stderr, "[dbg][lex] %d:%d skipped bare '!'\n", line_of(in), col_of(in));
    }
};

template<>
struct action<grammar::punct_tok> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        const std::string s = in.string();
        TokenKind k = TokenKind::Eof;
        switch(s[0]){
            case '(': k = TokenKind::LParen; break;
            case ')': k = TokenKind::RParen; break;
            case '{': k = TokenKind::LBrace; break;
            case '}': k = TokenKind::RBrace; break;
            case ',': k = TokenKind::Comma; break;
            case ':': k = TokenKind::Colon; break;
            case ';': k = TokenKind::Semicolon; break;
            case '+': k = TokenKind::Plus; break;
            case '-': k = TokenKind::Minus; break;
            case '*': k = TokenKind::Star; break;
            case '/': k = TokenKind::Slash; break;
            case '>': k = TokenKind::Greater; break;
            case '<': k = TokenKind::Less; break;
        }
        st.push(k, s, line_of(in), col_of(in));
    }
};

template<>
struct action<grammar::str_lit> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        std::string s = in.string();
        std::string body = s.substr(1);
        // the body cannot contain '"', so a trailing quote is always the terminator
        if(!body.empty() && body.back()=='"') body.pop_back();
        st.push(TokenKind::StrLit, std::move(body), line_of(in), col_of(in));
    }
};

template<>
struct action<grammar::int_lit> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        const std::string s = in.string();
        int64_t v = 0;
        auto res = std::from_chars(s.data(), s.data()+s.size(), v);
        if(res.ec == std::errc::result_out_of_range || res.ptr != s.data()+s.size()){
            auto d = make_diagnostic(Stage::Lex, "E0101", "integer literal '"+s+"' does not fit in 64 bits", "literals must be at most 9223372036854775807", line_of(in), col_of(in));
            throw compile_error(std::move(d));
        }
        st.push(TokenKind::IntLit, s, line_of(in), col_of(in), v);
    }
};

template<>
struct action<grammar::ident_tok> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        std::string s = in.string();
        auto &kw = keyword_table();
        auto it = kw.find(s);
        st.push(it==kw.end()? TokenKind::Ident : it->second, std::move(s), line_of(in), col_of(in));
    }
};

template<>
struct action<grammar::unknown_char> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        if(st.opts->strict){
            std::string s = in.string();
            char buf[8]; std::snprintf(buf, sizeof(buf), "0x%02X", (unsigned)(unsigned char)s[0]);
            throw compile_error(make_diagnostic(Stage::Lex, "E0102", std::string("unexpected character ")+buf, "remove the character or unset SPONGE_STRICT_LEX", line_of(in), col_of(in)));
        }
        if(st.trace) std::fprintf(stderr, "[dbg][lex] %d:%d skipped unrecognized byte\n", line_of(in), col_of(in));
    }
};

} // namespace

LexResult lex(std::string_view source, const LexOptions& opts){
    LexResult r;
    lex_state st;
    st.opts = &opts;
    st.trace = debug_lex_enabled();
    tao::pegtl::memory_input<> in(source.data(), source.size(), "source");
    try {
        tao::pegtl::parse< grammar::unit_rule, action >(in, st);
    } catch(const compile_error& e){
        r.errors.push_back(e.diag);
        return r;
    }
    auto end = in.position();
    st.push(TokenKind::Eof, "", static_cast<int>(end.line), static_cast<int>(end.column));
    r.tokens = std::move(st.tokens);
    r.success = true;
    return r;
}

std::string dump_tokens(const std::vector<Token>& tokens){
    std::ostringstream os;
    for(auto &t : tokens) os << t.line << ":" << t.col << " " << describe(t) << "\n";
    return os.str();
}

} // namespace sponge
