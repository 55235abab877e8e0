#include "sponge/diagnostics_json.hpp"
#include <cstdio>
#include <cstdlib>

namespace sponge {

namespace {

const char kHex[] = "0123456789abcdef";

// Appends JSON tokens to a string, inserting commas between members.
class JsonWriter {
public:
    explicit JsonWriter(std::string& out) : out_(out) {}

    void begin_object(){ separate(); out_ += '{'; first_ = true; }
    void end_object(){ out_ += '}'; first_ = false; }
    void begin_array(){ separate(); out_ += '['; first_ = true; }
    void end_array(){ out_ += ']'; first_ = false; }

    JsonWriter& key(const char* k){ separate(); append_string(out_, k); out_ += ':'; first_ = true; return *this; }
    void value(const std::string& s){ separate(); append_string(out_, s); }
    void value(int n){ separate(); out_ += std::to_string(n); }
    void value(bool b){ separate(); out_ += b ? "true" : "false"; }

    static void append_string(std::string& out, const std::string& s){
        out += '"';
        for(unsigned char c : s){
            if(c=='"' || c=='\\'){ out += '\\'; out += static_cast<char>(c); }
            else if(c=='\n') out += "\\n";
            else if(c=='\r') out += "\\r";
            else if(c=='\t') out += "\\t";
            else if(c < 0x20){ out += "\\u00"; out += kHex[c >> 4]; out += kHex[c & 0xF]; }
            else out += static_cast<char>(c);
        }
        out += '"';
    }

private:
    void separate(){ if(!first_) out_ += ','; first_ = false; }

    std::string& out_;
    bool first_ = true;
};

void write_diagnostic(JsonWriter& w, const Diagnostic& d){
    w.begin_object();
    w.key("stage").value(std::string(stage_name(d.stage)));
    w.key("code").value(d.code);
    w.key("message").value(d.message);
    w.key("hint").value(d.hint);
    w.key("line").value(d.line);
    w.key("col").value(d.col);
    w.key("notes").begin_array();
    for(auto& n : d.notes){
        w.begin_object();
        w.key("message").value(n.message);
        w.key("line").value(n.line);
        w.key("col").value(n.col);
        w.end_object();
    }
    w.end_array();
    w.end_object();
}

} // namespace

std::string json_escape(const std::string& s){
    std::string out;
    JsonWriter::append_string(out, s);
    return out;
}

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors){
    std::string out;
    JsonWriter w(out);
    w.begin_object();
    w.key("success").value(success);
    w.key("errors").begin_array();
    for(auto& d : errors) write_diagnostic(w, d);
    w.end_array();
    w.end_object();
    return out;
}

void maybe_print_json(bool success, const std::vector<Diagnostic>& errors){
    const char* env = std::getenv("SPONGE_DIAG_JSON");
    if(!env || env[0]!='1') return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(success, errors).c_str());
}

} // namespace sponge
