#include "sponge/compiler.hpp"
#include "sponge/codegen/target.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_compile; size_t asm_bytes; };

static RunResult bench_case(const char* name, const std::string& program, const sponge::codegen::TargetInfo& target){
    auto t0 = Clock::now();
    auto res = sponge::compile(program, target);
    auto t1 = Clock::now();
    if(!res.success){
        std::cerr << "[bench] case '" << name << "' failed: " << (res.errors.empty() ? std::string("?") : res.errors.front().message) << "\n";
        return {0.0, 0};
    }
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), res.assembly.size() };
}

// Many small functions chained through calls, each with a branch.
static std::string many_functions(int n){
    std::string s;
    for(int i=0;i<n;++i){
        s += "func f" + std::to_string(i) + "(a: int, b: int): int {\n";
        s += "    let t: int = a * 3 + b - " + std::to_string(i) + ";\n";
        s += "    if t > 100 {\n        let r: int = t / 2;\n    } else {\n        let r: int = t + 1;\n    }\n";
        if(i) s += "    return f" + std::to_string(i-1) + "(r, a);\n";
        else s += "    return r;\n";
        s += "}\n";
    }
    s += "func main(): int {\n    return f" + std::to_string(n-1) + "(1, 2);\n}\n";
    return s;
}

// One long function with many distinct literals and locals.
static std::string long_body(int n){
    std::string s = "func main(): int {\n";
    for(int i=0;i<n;++i){
        s += "    let v" + std::to_string(i) + ": int = " + std::to_string(i) + " + 1 * 2 - 3;\n";
        s += "    println(\"line " + std::to_string(i % 50) + "\");\n";
    }
    s += "    return 0;\n}\n";
    return s;
}

int main(){
    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;
    cases.push_back({"many_functions", many_functions(2000)});
    cases.push_back({"long_body", long_body(5000)});

    const char* triples[] = {"x86_64-unknown-linux-gnu", "arm64-apple-macosx"};
    std::cout << "name,target,ms_compile,asm_bytes\n";
    for(const char* triple : triples){
        auto tr = sponge::codegen::select_target(triple);
        if(!tr.success){ std::cerr << "[bench] cannot select " << triple << "\n"; return 1; }
        for(const auto& c : cases){
            auto r = bench_case(c.name, c.prog, tr.target);
            std::cout << c.name << "," << triple << "," << r.ms_compile << "," << r.asm_bytes << "\n";
        }
    }
    return 0;
}
