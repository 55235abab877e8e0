#include "sponge/diagnostics.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace sponge {

const char* stage_name(Stage s){
    switch(s){
        case Stage::Lex: return "lex";
        case Stage::Parse: return "parse";
        case Stage::Semantic: return "semantic";
        case Stage::Codegen: return "codegen";
        case Stage::Config: return "config";
    }
    return "unknown";
}

void add_mismatch_notes(Diagnostic& d, const std::string& expected, const std::string& found){
    d.notes.push_back(Note{"expected: "+expected, d.line, d.col});
    d.notes.push_back(Note{"   found: "+found, d.line, d.col});
}

// Levenshtein distance over two rolling rows.
int edit_distance(const std::string& a, const std::string& b){
    std::vector<int> prev(b.size()+1), cur(b.size()+1);
    for(size_t j=0;j<=b.size();++j) prev[j] = static_cast<int>(j);
    for(size_t i=1;i<=a.size();++i){
        cur[0] = static_cast<int>(i);
        for(size_t j=1;j<=b.size();++j){
            int subst = prev[j-1] + (a[i-1]==b[j-1] ? 0 : 1);
            cur[j] = std::min({prev[j]+1, cur[j-1]+1, subst});
        }
        prev.swap(cur);
    }
    return prev[b.size()];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out;
    for(auto &c: pool){ if(c.empty() || c==target) continue; if(edit_distance(target,c)<=maxDist) out.push_back(c); }
    std::sort(out.begin(), out.end());
    if(out.size()>5) out.resize(5);
    return out;
}

void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs){
    if(suggs.empty()) return;
    if(const char* env = std::getenv("SPONGE_SUGGEST")){ if(env[0]=='0') return; }
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+="'"+suggs[i]+"'"; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    d.notes.push_back(Note{msg,d.line,d.col});
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os << "error";
    if(!d.code.empty()) os << "[" << d.code << "]";
    os << " (" << stage_name(d.stage) << "): " << d.message;
    if(d.line>=0) os << " (line " << d.line << ":" << d.col << ")";
    os << "\n";
    if(!d.hint.empty()) os << "  hint: " << d.hint << "\n";
    for(auto &n : d.notes) os << "  note: " << n.message << "\n";
    return os.str();
}

} // namespace sponge
