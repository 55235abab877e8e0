// Diagnostics shared by every pipeline stage.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace sponge {

enum class Stage { Lex, Parse, Semantic, Codegen, Config };

const char* stage_name(Stage s);

struct Note { std::string message; int line=-1; int col=-1; };

struct Diagnostic {
    Stage stage = Stage::Lex;
    std::string code;     // e.g. E0301
    std::string message;
    std::string hint;
    int line=-1;
    int col=-1;
    std::vector<Note> notes;
};

// Raised inside a stage on its first failure; the stage entry point converts it
// into a failed result, so it never escapes the public API.
struct compile_error : std::runtime_error {
    Diagnostic diag;
    explicit compile_error(Diagnostic d) : std::runtime_error(d.message), diag(std::move(d)) {}
};

// Small builder used by the stages (mirrors ErrorReporter::make_error).
inline Diagnostic make_diagnostic(Stage stage, std::string code, std::string message, std::string hint, int line, int col){
    return Diagnostic{stage, std::move(code), std::move(message), std::move(hint), line, col, {}};
}

// Attaches "expected: X" / "   found: Y" notes.
void add_mismatch_notes(Diagnostic& d, const std::string& expected, const std::string& found);

// "did you mean a, b or c" note; gated off by SPONGE_SUGGEST=0.
int edit_distance(const std::string& a, const std::string& b);
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);
void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs);

// error[E0301] (semantic): unknown variable 'x' (line 3:9)
//   hint: ...
//   note: ...
std::string format_diagnostic(const Diagnostic& d);

} // namespace sponge
