#include "sponge/codegen/target.hpp"
#include "sponge/features.hpp"
#include <cstdio>

#include <llvm/Config/llvm-config.h>
#if LLVM_VERSION_MAJOR >= 17
#include <llvm/TargetParser/Host.h>
#include <llvm/TargetParser/Triple.h>
#else
#include <llvm/ADT/Triple.h>
#include <llvm/Support/Host.h>
#endif

namespace sponge::codegen {

const char* TargetInfo::local_label_prefix() const {
    if(arch==Arch::X86_64) return ".";
    return is_darwin() ? "L" : ".L";
}

std::string host_triple(){ return llvm::sys::getDefaultTargetTriple(); }

static Diagnostic config_error(const char* code, std::string message, std::string hint){
    return make_diagnostic(Stage::Config, code, std::move(message), std::move(hint), -1, -1);
}

TargetResult select_target(const std::string& triple, const std::string& entry_override){
    TargetResult r;
    std::string name = triple.empty() ? host_triple() : triple;
    llvm::Triple T(llvm::Triple::normalize(name));
    TargetInfo& t = r.target;
    t.triple = T.str();

    switch(T.getArch()){
        case llvm::Triple::x86_64: t.arch = Arch::X86_64; break;
        case llvm::Triple::aarch64: t.arch = Arch::AArch64; break;
        default:
            r.errors.push_back(config_error("E0501", "unsupported target architecture '"+T.getArchName().str()+"' in '"+name+"'", "supported architectures are x86_64 and aarch64"));
            return r;
    }
    if(T.isOSDarwin()) t.os = OS::MacOS;
    else if(T.isOSWindows()) t.os = OS::Windows;
    else if(T.isOSLinux()) t.os = OS::Linux;
    else {
        r.errors.push_back(config_error("E0501", "unsupported target operating system '"+T.getOSName().str()+"' in '"+name+"'", "supported systems are linux, macos and windows"));
        return r;
    }
    if(t.os==OS::Windows && t.arch==Arch::AArch64){
        r.errors.push_back(config_error("E0502", "aarch64 windows is not supported", "use an x86_64-pc-windows-msvc triple"));
        return r;
    }

    // Linux starts raw; macOS and Windows go through the C runtime.
    t.entry = t.os==OS::Linux ? EntryStyle::Start : EntryStyle::Libc;
    if(entry_override=="start") t.entry = EntryStyle::Start;
    else if(entry_override=="libc") t.entry = EntryStyle::Libc;
    else if(!entry_override.empty()){
        r.errors.push_back(config_error("E0502", "unknown entry style '"+entry_override+"'", "SPONGE_ENTRY accepts 'start' or 'libc'"));
        return r;
    }
    if(t.os==OS::Windows && t.entry==EntryStyle::Start){
        r.errors.push_back(config_error("E0502", "raw _start entry is not available on windows", "unset SPONGE_ENTRY or use 'libc'"));
        return r;
    }

    if(t.arch==Arch::X86_64){
        if(t.os==OS::Windows){ t.c_arg_regs = {"rcx","rdx"}; t.shadow_space = 32; }
        else t.c_arg_regs = {"rdi","rsi"};
        if(t.os==OS::MacOS){ t.sys_write = 0x2000004; t.sys_exit = 0x2000001; }
        else { t.sys_write = 1; t.sys_exit = 60; }
    } else {
        t.c_arg_regs = {"x0","x1"};
        t.variadic_on_stack = t.os==OS::MacOS;
        if(t.os==OS::MacOS){ t.sys_write = 4; t.sys_exit = 1; }
        else { t.sys_write = 64; t.sys_exit = 93; }
    }
    if(debug_codegen_enabled())
        std::fprintf(stderr, "[dbg][codegen] target %s arch=%s entry=%s\n", t.triple.c_str(), t.arch_name(), t.entry_symbol().c_str());
    r.success = true;
    return r;
}

} // namespace sponge::codegen
