#include <cassert>
#include <iostream>
#include <string>
#include "sponge/compiler.hpp"
#include "sponge/diagnostics.hpp"
#include "sponge/diagnostics_json.hpp"

using namespace sponge;

static void test_format(){
    auto d = make_diagnostic(Stage::Semantic, "E0301", "unknown variable 'x'", "declare it with 'let' before use", 3, 9);
    d.notes.push_back(Note{"did you mean 'y'", 3, 9});
    std::string s = format_diagnostic(d);
    assert(s == "error[E0301] (semantic): unknown variable 'x' (line 3:9)\n"
                "  hint: declare it with 'let' before use\n"
                "  note: did you mean 'y'\n");
    auto cfg = make_diagnostic(Stage::Config, "E0501", "unsupported", "", -1, -1);
    assert(format_diagnostic(cfg) == "error[E0501] (config): unsupported\n");
}

static void test_suggestion_helpers(){
    assert(edit_distance("count","cout")==1);
    assert(edit_distance("","abc")==3);
    assert(edit_distance("same","same")==0);
    // no length cap: one insertion in front of a long name is still distance 1
    std::string long_name(100, 'a');
    assert(edit_distance("x"+long_name, long_name)==1);
    auto c = fuzzy_candidates("valu", {"value","val","other","valu"});
    assert(c.size()==2 && c[0]=="val" && c[1]=="value");
    Diagnostic d;
    append_suggestions(d, {"a","b","c"});
    assert(d.notes.size()==1 && d.notes[0].message=="did you mean 'a', 'b' or 'c'");
    Diagnostic none;
    append_suggestions(none, {});
    assert(none.notes.empty());
}

static void test_json(){
    assert(json_escape("a\"b\\c\n")=="\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string("\x01\t"))=="\"\\u0001\\t\"");
    auto ok = diagnostics_to_json(true, {});
    assert(ok=="{\"success\":true,\"errors\":[]}");

    auto d = make_diagnostic(Stage::Codegen, "E0404", "say \"hi\"", "", -1, -1);
    d.notes.push_back(Note{"n1", 2, 3});
    d.notes.push_back(Note{"n2", -1, -1});
    assert(diagnostics_to_json(false, {d, d}) ==
        "{\"success\":false,\"errors\":["
        "{\"stage\":\"codegen\",\"code\":\"E0404\",\"message\":\"say \\\"hi\\\"\",\"hint\":\"\",\"line\":-1,\"col\":-1,"
        "\"notes\":[{\"message\":\"n1\",\"line\":2,\"col\":3},{\"message\":\"n2\",\"line\":-1,\"col\":-1}]},"
        "{\"stage\":\"codegen\",\"code\":\"E0404\",\"message\":\"say \\\"hi\\\"\",\"hint\":\"\",\"line\":-1,\"col\":-1,"
        "\"notes\":[{\"message\":\"n1\",\"line\":2,\"col\":3},{\"message\":\"n2\",\"line\":-1,\"col\":-1}]}"
        "]}");

    auto r = compile_to_ir("func main(): int { let s: string = 5; return 0; }");
    assert(!r.success);
    auto js = diagnostics_to_json(false, r.errors);
    assert(js.find("\"success\":false")!=std::string::npos);
    assert(js.find("\"stage\":\"semantic\"")!=std::string::npos);
    assert(js.find("\"code\":\"E0305\"")!=std::string::npos);
    assert(js.find("\"line\":1")!=std::string::npos);
    auto notes = js.find("\"notes\":[");
    assert(notes!=std::string::npos);
    assert(js.find("expected: string", notes)!=std::string::npos);
    assert(js.find("   found: int", notes)!=std::string::npos);
}

static void test_stage_tags(){
    assert(compile_to_ir("func main(): int { return 99999999999999999999; }").errors[0].stage==Stage::Lex);
    assert(compile_to_ir("func main() int { }").errors[0].stage==Stage::Parse);
    assert(compile_to_ir("func main(): int { return x; }").errors[0].stage==Stage::Semantic);
    assert(std::string(stage_name(Stage::Codegen))=="codegen");
}

void run_diagnostics_tests(){
    std::cout << "[diagnostics] tests...\n";
    test_format();
    test_suggestion_helpers();
    test_json();
    test_stage_tags();
    std::cout << "[diagnostics] tests passed\n";
}
