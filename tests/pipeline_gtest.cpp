#include <gtest/gtest.h>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "sponge/codegen/frame.hpp"
#include "sponge/compiler.hpp"
#include "sponge/ir.hpp"
#if !defined(_WIN32)
#include <sys/wait.h>
#endif

using namespace sponge;

namespace {

codegen::TargetInfo linux_x64(){
    auto tr = codegen::select_target("x86_64-unknown-linux-gnu");
    EXPECT_TRUE(tr.success);
    return tr.target;
}

size_t count(const std::string& hay, const std::string& needle){
    size_t n=0;
    for(size_t pos=hay.find(needle); pos!=std::string::npos; pos=hay.find(needle, pos+needle.size())) ++n;
    return n;
}

bool on_path(const char* tool){
#if defined(_WIN32)
    (void)tool;
    return false;
#else
    std::string cmd = std::string("command -v ") + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str())==0;
#endif
}

bool host_is_linux_x64(){
    auto tr = codegen::select_target("");
    return tr.success && tr.target.arch==codegen::Arch::X86_64 && tr.target.os==codegen::OS::Linux;
}

// Assembles and links with nasm + ld, then runs the binary. Returns the exit
// status, or -1 when any step fails.
int build_and_run(const std::string& assembly, const std::string& stem, std::string* stdout_text){
#if defined(_WIN32)
    (void)assembly; (void)stem; (void)stdout_text;
    return -1;
#else
    auto dir = std::filesystem::temp_directory_path();
    auto asmPath = dir/(stem + ".asm");
    auto objPath = dir/(stem + ".o");
    auto exePath = dir/stem;
    { std::ofstream out(asmPath); out << assembly; }
    std::string build = "nasm -f elf64 " + asmPath.string() + " -o " + objPath.string() + " && ld " + objPath.string() + " -o " + exePath.string();
    if(std::system(build.c_str())!=0) return -1;
    FILE* p = popen(exePath.string().c_str(), "r");
    if(!p) return -1;
    std::array<char, 256> buf{};
    std::string out;
    while(fgets(buf.data(), (int)buf.size(), p)) out += buf.data();
    int status = pclose(p);
    if(stdout_text) *stdout_text = out;
    if(!WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
#endif
}

} // namespace

TEST(Pipeline, PreservesFunctionOrderAndFindsMain){
    auto r = compile_to_ir("func c(): int { return 1; }\nfunc a(): int { return 2; }\nfunc main(): int { return a(); }");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.program.functions.size(), 3u);
    EXPECT_EQ(r.program.functions[0].name, "c");
    EXPECT_EQ(r.program.functions[1].name, "a");
    EXPECT_EQ(r.program.functions[2].name, "main");
    EXPECT_NE(r.program.find("main"), nullptr);
}

TEST(Pipeline, FlatPrecedenceStoresNine){
    auto r = compile_to_ir("func main(): int { let x: int = 1 + 2 * 3; return x; }");
    ASSERT_TRUE(r.success);
    auto& store = std::get<ir::StoreVar>(r.program.functions[0].body[0]->data);
    EXPECT_EQ(store.name, "x");
    EXPECT_EQ(ir::to_string(*store.value), "((1:int + 2:int):int * 3:int):int");
}

TEST(Pipeline, PrintlnLiteralPooledOnce){
    auto r = compile("func main(): int { println(\"x\"); println(\"x\"); return 0; }", linux_x64());
    ASSERT_TRUE(r.success);
    EXPECT_EQ(count(r.assembly, "str_0 db \"x\", 0"), 1u);
    EXPECT_EQ(count(r.assembly, "[rel str_0]"), 2u);
    EXPECT_EQ(r.assembly.find("str_1"), std::string::npos);
}

TEST(Pipeline, StringLetWithIntFailsBeforeCodegen){
    auto r = compile("func main(): int { let s: string = 1 + 2; return 0; }", linux_x64());
    ASSERT_FALSE(r.success);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E0305");
    EXPECT_EQ(r.errors[0].stage, Stage::Semantic);
    EXPECT_TRUE(r.assembly.empty());
}

TEST(Pipeline, UndeclaredCallIsNotABuiltin){
    auto r = compile("func main(): int { printline(\"x\"); return 0; }", linux_x64());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.errors[0].code, "E0302");
}

TEST(Pipeline, RuntimeConcatenationTypeChecksButIsACodegenGap){
    const char* src =
        "func bang(a: string): string { return a + \"!\"; }\n"
        "func main(): int { println(bang(\"hi\")); return 0; }";
    auto ir = compile_to_ir(src);
    ASSERT_TRUE(ir.success);
    EXPECT_EQ(ir.program.functions[0].name, "bang");

    auto r = compile(src, linux_x64());
    ASSERT_FALSE(r.success);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E0405");
    EXPECT_EQ(r.errors[0].stage, Stage::Codegen);
    EXPECT_EQ(r.errors[0].line, 1);
    EXPECT_TRUE(r.assembly.empty());

    // two literals fold into one pooled string
    auto folded = compile("func main(): int { println(\"a\" + \"b\"); return 0; }", linux_x64());
    ASSERT_TRUE(folded.success);
    EXPECT_EQ(count(folded.assembly, "db \"ab\", 0"), 1u);
}

TEST(Pipeline, MainSignatureIsChecked){
    auto params = compile_to_ir("func main(n: int): int { return n; }");
    ASSERT_FALSE(params.success);
    EXPECT_EQ(params.errors[0].code, "E0314");
    auto str = compile("func main(): string { return \"x\"; }", linux_x64());
    ASSERT_FALSE(str.success);
    EXPECT_EQ(str.errors[0].code, "E0314");
    EXPECT_EQ(str.errors[0].stage, Stage::Semantic);
}

TEST(Pipeline, SiblingBranchesShareOneSlot){
    auto r = compile_to_ir("func main(): int { if 1 { let v: int = 1; } else { let v: int = 2; } return v; }");
    ASSERT_TRUE(r.success);
    auto plan = codegen::plan_frame(r.program.functions[0]);
    ASSERT_EQ(plan.order.size(), 1u);
    EXPECT_EQ(plan.order[0], "v");
    EXPECT_EQ(plan.size, 16);
}

TEST(Pipeline, LabelsRestartPerRun){
    auto t = linux_x64();
    const char* src = "func main(): int { if 1 { return 1; } else { return 2; } }";
    auto first = compile(src, t);
    auto second = compile(src, t);
    ASSERT_TRUE(first.success && second.success);
    EXPECT_EQ(first.assembly, second.assembly);
}

TEST(Execution, MainReturnValueIsExitStatus){
    if(!host_is_linux_x64() || !on_path("nasm") || !on_path("ld")) GTEST_SKIP() << "nasm/ld or x86_64 linux host not available";
    auto r = compile("func main(): int { return 42; }", linux_x64());
    ASSERT_TRUE(r.success);
    EXPECT_EQ(build_and_run(r.assembly, "sponge_exit42", nullptr), 42);
}

TEST(Execution, PrintlnWritesLine){
    if(!host_is_linux_x64() || !on_path("nasm") || !on_path("ld")) GTEST_SKIP() << "nasm/ld or x86_64 linux host not available";
    auto r = compile(
        "func pick(n: int): string { if n > 1 { return \"big\"; } else { return \"small\"; } }\n"
        "func main(): int { println(\"hi\"); println(pick(5)); print(\"a\", \"b\"); println(\"\"); return 9 - 2 * 3; }",
        linux_x64());
    ASSERT_TRUE(r.success);
    std::string out;
    EXPECT_EQ(build_and_run(r.assembly, "sponge_println", &out), 21);
    EXPECT_EQ(out, "hi\nbig\nab\n");
}
