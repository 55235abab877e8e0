// Target descriptors: architecture x OS x entry style, chosen once per run.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "sponge/diagnostics.hpp"

namespace sponge::codegen {

enum class Arch { X86_64, AArch64 };
enum class OS { Linux, MacOS, Windows };
enum class EntryStyle {
    Start, // raw _start, output through write/exit system calls
    Libc   // C runtime entry, output through printf
};

struct TargetInfo {
    Arch arch = Arch::X86_64;
    OS os = OS::Linux;
    EntryStyle entry = EntryStyle::Start;
    std::string triple;

    // C ABI argument registers for printf (format, value)
    std::vector<std::string> c_arg_regs;
    int shadow_space = 0;          // Windows x64 home area
    bool variadic_on_stack = false; // Darwin arm64 passes variadic arguments in memory

    // Raw system call numbers, meaningful only for EntryStyle::Start.
    int64_t sys_write = 0;
    int64_t sys_exit = 0;

    bool is_darwin() const { return os==OS::MacOS; }
    bool uses_syscalls() const { return entry==EntryStyle::Start; }
    // External C symbols carry a leading underscore on Mach-O only; glibc's crt1
    // and the Windows CRT call plain main.
    std::string c_symbol(const std::string& name) const { return is_darwin() ? "_"+name : name; }
    std::string entry_symbol() const { return entry==EntryStyle::Start ? "_start" : c_symbol("main"); }
    // Prefix for assembler-local labels (".exit_3", ".Lexit_3", "Lexit_3").
    const char* local_label_prefix() const;
    const char* arch_name() const { return arch==Arch::X86_64 ? "x86_64" : "aarch64"; }
};

struct TargetResult {
    bool success{false};
    TargetInfo target;
    std::vector<Diagnostic> errors;
};

// Host triple as reported by LLVM.
std::string host_triple();

// Builds the descriptor for a triple ("" selects the host). entry_override is
// "", "start" or "libc".
TargetResult select_target(const std::string& triple, const std::string& entry_override = "");

} // namespace sponge::codegen
