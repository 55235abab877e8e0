#include <cassert>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include "sponge/compiler.hpp"

using namespace sponge;
using namespace sponge::codegen;

static TargetInfo target(const char* triple, const char* entry = ""){
    auto tr = select_target(triple, entry);
    assert(tr.success);
    return tr.target;
}

static std::string compile_ok(const std::string& src, const TargetInfo& t){
    auto r = compile(src, t);
    if(!r.success){
        for(auto& e : r.errors) std::cerr << format_diagnostic(e);
        assert(false && "compile failed");
    }
    return r.assembly;
}

static bool has(const std::string& hay, const std::string& needle){ return hay.find(needle)!=std::string::npos; }

static size_t count(const std::string& hay, const std::string& needle){
    size_t n=0;
    for(size_t pos=hay.find(needle); pos!=std::string::npos; pos=hay.find(needle, pos+needle.size())) ++n;
    return n;
}

static const char* kLinux = "x86_64-unknown-linux-gnu";

static void test_linux_hello(){
    std::string a = compile_ok("func main(): int { println(\"hi\"); return 0; }", target(kLinux));
    assert(has(a, "default rel\n"));
    assert(has(a, "global _start\n"));
    assert(!has(a, "extern"));
    assert(has(a, "_start:\n    call fn_main\n    mov rdi, rax\n    mov rax, 60\n    syscall\n"));
    assert(has(a, "fn_main:\n    push rbp\n    mov rbp, rsp\n"));
    assert(has(a, "    lea rsi, [rel str_0]\n    mov rdx, str_0_len\n    syscall\n"));
    assert(has(a, "    lea rsi, [rel newline]\n    mov rdx, 1\n"));
    assert(has(a, "section .data\n"));
    assert(has(a, "newline db 10\n"));
    assert(has(a, "str_0 db \"hi\", 0\nstr_0_len equ $ - str_0 - 1\n"));
    assert(has(a, ".exit_0:\n    mov rsp, rbp\n    pop rbp\n    ret\n"));
}

static void test_pooled_once(){
    std::string a = compile_ok("func main(): int { println(\"x\"); println(\"x\"); return 0; }", target(kLinux));
    assert(count(a, "str_0 db")==1);
    assert(count(a, "[rel str_0]")==2);
    assert(!has(a, "str_1"));
}

static void test_return_value_and_frame(){
    std::string a = compile_ok("func main(): int { let x: int = 1 + 2 * 3; return x + 33; }", target(kLinux));
    assert(has(a, "    sub rsp, 16\n"));
    assert(has(a, "    mov rax, 1\n    push rax\n    mov rax, 2\n    mov rcx, rax\n    pop rax\n    add rax, rcx\n"));
    assert(has(a, "    imul rax, rcx\n"));
    assert(has(a, "    mov [rbp-8], rax\n"));
    assert(has(a, "    mov rax, [rbp-8]\n"));
    assert(has(a, "    jmp .exit_0\n"));
    // no data section without strings
    assert(!has(a, "section .data"));
}

static void test_operators(){
    std::string a = compile_ok(
        "func main(): int { let a: int = 8 / 2; let b: int = a > 1; let c: int = a < 1; let d: int = a == 1; let e: int = a != 1; return a - b; }",
        target(kLinux));
    assert(has(a, "    cqo\n    idiv rcx\n"));
    assert(has(a, "    cmp rax, rcx\n    setg al\n    movzx rax, al\n"));
    assert(has(a, "setl al"));
    assert(has(a, "sete al"));
    assert(has(a, "setne al"));
    assert(has(a, "sub rax, rcx"));
}

static void test_calls_stack_passing(){
    std::string a = compile_ok(
        "func sub(a: int, b: int): int { return a - b; }\nfunc main(): int { return sub(10, 3); }",
        target(kLinux));
    // right to left
    size_t three = a.find("    mov rax, 3\n    push rax\n");
    size_t ten = a.find("    mov rax, 10\n    push rax\n");
    assert(three!=std::string::npos && ten!=std::string::npos && three < ten);
    assert(has(a, "    call fn_sub\n    add rsp, 16\n"));
    // callee copies its arguments into slots
    assert(has(a, "fn_sub:\n    push rbp\n    mov rbp, rsp\n    sub rsp, 16\n    mov rax, [rbp+16]\n    mov [rbp-8], rax\n    mov rax, [rbp+24]\n    mov [rbp-16], rax\n"));
}

static void test_if_labels_unique(){
    std::string a = compile_ok(
        "func f(n: int): int { if n > 1 { return 1; } else { return 2; } }\n"
        "func main(): int { if f(3) == 1 { println(\"one\"); } else { println(\"other\"); } return 0; }",
        target(kLinux));
    std::set<std::string> seen;
    std::istringstream in(a);
    std::string line;
    size_t defs = 0;
    while(std::getline(in, line)){
        if(line.empty() || line[0]!='.' || line.back()!=':') continue;
        ++defs;
        assert(seen.insert(line).second && "label defined twice");
    }
    assert(defs==8); // exit, then, else, endif for each function
    assert(has(a, "    cmp rax, 0\n    je .else_2\n.then_1:\n"));
    assert(has(a, "    jmp .endif_3\n.else_2:\n"));
}

static void test_macos_printf(){
    std::string a = compile_ok("func main(): int { println(\"hi\"); print(\"a\"); return 0; }", target("x86_64-apple-macosx"));
    assert(has(a, "global _main\n"));
    assert(has(a, "extern _printf\n"));
    assert(has(a, "_main:\n    push rbp\n    mov rbp, rsp\n    call fn_main\n    pop rbp\n    ret\n"));
    assert(has(a, "    lea rsi, [rel str_0]\n    lea rdi, [rel fmt_s_nl]\n    mov rax, rsp\n    and rsp, -16\n    push rax\n    sub rsp, 8\n    xor eax, eax\n    call _printf\n    add rsp, 8\n    pop rsp\n"));
    assert(has(a, "lea rdi, [rel fmt_s]\n"));
    assert(has(a, "fmt_s db \"%s\", 0\n"));
    assert(has(a, "fmt_s_nl db \"%s\", 10, 0\n"));
    assert(!has(a, "syscall"));
    assert(!has(a, "newline db"));
}

static void test_macos_raw(){
    std::string a = compile_ok("func main(): int { println(\"hi\"); return 0; }", target("x86_64-apple-macosx", "start"));
    assert(has(a, "global _start\n"));
    assert(has(a, "mov rax, 0x2000004\n"));
    assert(has(a, "mov rax, 0x2000001\n"));
}

static void test_windows(){
    std::string a = compile_ok("func main(): int { println(\"hi\"); return 0; }", target("x86_64-pc-windows-msvc"));
    assert(has(a, "global main\n"));
    assert(has(a, "extern printf\n"));
    assert(has(a, "\nmain:\n"));
    assert(has(a, "    lea rdx, [rel str_0]\n    lea rcx, [rel fmt_s_nl]\n"));
    assert(has(a, "    sub rsp, 40\n    xor eax, eax\n    call printf\n    add rsp, 40\n"));
    assert(!has(a, "wrt ..plt"));
}

static void test_linux_libc(){
    std::string a = compile_ok("func main(): int { println(\"hi\"); return 0; }", target(kLinux, "libc"));
    assert(has(a, "global main\n"));
    assert(has(a, "extern printf\n"));
    assert(has(a, "call printf wrt ..plt\n"));
}

static void test_dynamic_strings(){
    std::string a = compile_ok(
        "func pick(n: int): string { if n > 0 { return \"pos\"; } else { return \"neg\"; } }\n"
        "func main(): int { let s: string = pick(1); println(s); let t: string = \"sponge\" + \"lang\"; println(t); return 0; }",
        target(kLinux));
    assert(has(a, "    mov rsi, rax\n    xor rdx, rdx\n"));
    assert(has(a, "    cmp byte [rsi+rdx], 0\n"));
    assert(has(a, ".strlen_"));
    assert(has(a, "db \"spongelang\", 0\n"));
    assert(!has(a, "db \"sponge\", 0"));
}

static void test_codegen_errors(){
    auto t = target(kLinux);
    auto no_main = compile("func helper(): int { return 0; }", t);
    assert(!no_main.success && no_main.errors[0].code=="E0401");
    assert(no_main.errors[0].stage==Stage::Codegen);

    auto int_print = compile("func main(): int { print(1); return 0; }", t);
    assert(!int_print.success && int_print.errors[0].code=="E0404");
    assert(int_print.errors[0].line==1);

    auto runtime_concat = compile("func main(): int { let a: string = \"x\"; let b: string = a + \"y\"; return 0; }", t);
    assert(!runtime_concat.success && runtime_concat.errors[0].code=="E0405");

    // never reaches codegen
    auto sema = compile("func main(): int { let s: string = 1; return 0; }", t);
    assert(!sema.success && sema.errors[0].stage==Stage::Semantic && sema.errors[0].code=="E0305");
}

void run_codegen_x64_tests(){
    std::cout << "[codegen-x64] tests...\n";
    test_linux_hello();
    test_pooled_once();
    test_return_value_and_frame();
    test_operators();
    test_calls_stack_passing();
    test_if_labels_unique();
    test_macos_printf();
    test_macos_raw();
    test_windows();
    test_linux_libc();
    test_dynamic_strings();
    test_codegen_errors();
    std::cout << "[codegen-x64] tests passed\n";
}
