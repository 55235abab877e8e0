#include "sponge/codegen/x64_nasm.hpp"
#include <cstdio>

namespace sponge::codegen {

namespace {

std::string frame_operand(int offset){
    if(offset < 0) return "[rbp-" + std::to_string(-offset) + "]";
    return "[rbp+" + std::to_string(offset) + "]";
}

std::string imm(int64_t v){
    if(v > 0xFFFF){
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%llX", static_cast<unsigned long long>(v));
        return buf;
    }
    return std::to_string(v);
}

} // namespace

std::string nasm_db(const std::string& text){
    std::string out;
    std::string run;
    auto flush = [&](){
        if(run.empty()) return;
        if(!out.empty()) out += ", ";
        out += "\"" + run + "\"";
        run.clear();
    };
    for(unsigned char c : text){
        if(c >= 0x20 && c < 0x7F && c != '"'){ run += static_cast<char>(c); continue; }
        flush();
        if(!out.empty()) out += ", ";
        out += std::to_string(static_cast<int>(c));
    }
    flush();
    if(!out.empty()) out += ", ";
    return out + "0";
}

void X64NasmEmitter::beginModule(){
    const TargetInfo& t = ctx_.target;
    out_ << "; " << t.triple << "\n";
    out_ << "default rel\n";
    out_ << "section .text\n";
    out_ << "global " << t.entry_symbol() << "\n";
    if(!t.uses_syscalls()) out_ << "extern " << t.c_symbol("printf") << "\n";
    out_ << "\n";
}

void X64NasmEmitter::emitEntry(const std::string& main_label){
    const TargetInfo& t = ctx_.target;
    out_ << t.entry_symbol() << ":\n";
    if(t.uses_syscalls()){
        ins("call " + main_label);
        ins("mov rdi, rax");
        ins("mov rax, " + imm(t.sys_exit));
        ins("syscall");
    } else {
        ins("push rbp");
        ins("mov rbp, rsp");
        ins("call " + main_label);
        ins("pop rbp");
        ins("ret");
    }
    out_ << "\n";
}

void X64NasmEmitter::beginFunction(const std::string& label, const FramePlan& frame, const std::vector<int>& param_offsets){
    out_ << label << ":\n";
    ins("push rbp");
    ins("mov rbp, rsp");
    if(frame.size > 0) ins("sub rsp, " + std::to_string(frame.size));
    // arguments sit above the saved rbp and return address, first argument lowest
    for(size_t i=0;i<param_offsets.size();++i){
        ins("mov rax, " + frame_operand(16 + 8*static_cast<int>(i)));
        ins("mov " + frame_operand(param_offsets[i]) + ", rax");
    }
}

void X64NasmEmitter::endFunction(const std::string& exit_label){
    out_ << exit_label << ":\n";
    ins("mov rsp, rbp");
    ins("pop rbp");
    ins("ret");
    out_ << "\n";
}

void X64NasmEmitter::endModule(){
    if(ctx_.strings.empty() && !ctx_.needs_newline && !ctx_.needs_fmt && !ctx_.needs_fmt_nl) return;
    out_ << "section .data\n";
    if(ctx_.needs_newline) out_ << "newline db 10\n";
    if(ctx_.needs_fmt) out_ << "fmt_s db \"%s\", 0\n";
    if(ctx_.needs_fmt_nl) out_ << "fmt_s_nl db \"%s\", 10, 0\n";
    for(auto& s : ctx_.strings.entries()){
        out_ << s.label << " db " << nasm_db(s.text) << "\n";
        out_ << StringPool::length_label(s.label) << " equ $ - " << s.label << " - 1\n";
    }
}

void X64NasmEmitter::loadInt(int64_t value){ ins("mov rax, " + imm(value)); }
void X64NasmEmitter::loadString(const std::string& label){ ins("lea rax, [rel " + label + "]"); }
void X64NasmEmitter::loadSlot(int offset){ ins("mov rax, " + frame_operand(offset)); }
void X64NasmEmitter::storeSlot(int offset){ ins("mov " + frame_operand(offset) + ", rax"); }
void X64NasmEmitter::pushResult(){ ins("push rax"); }

void X64NasmEmitter::binary(const std::string& op){
    ins("mov rcx, rax");
    ins("pop rax");
    if(op=="+") ins("add rax, rcx");
    else if(op=="-") ins("sub rax, rcx");
    else if(op=="*") ins("imul rax, rcx");
    else if(op=="/"){ ins("cqo"); ins("idiv rcx"); }
    else {
        const char* set = op==">" ? "setg" : op=="<" ? "setl" : op=="==" ? "sete" : "setne";
        ins("cmp rax, rcx");
        ins(std::string(set) + " al");
        ins("movzx rax, al");
    }
}

void X64NasmEmitter::callFunction(const std::string& label, size_t nargs){
    ins("call " + label);
    if(nargs) ins("add rsp, " + std::to_string(8*nargs));
}

void X64NasmEmitter::branchIfZero(const std::string& label){
    ins("cmp rax, 0");
    ins("je " + label);
}

void X64NasmEmitter::jump(const std::string& label){ ins("jmp " + label); }
void X64NasmEmitter::label(const std::string& name){ out_ << name << ":\n"; }

void X64NasmEmitter::writeSyscall(const std::string& addr_operand, const std::string& len_operand){
    ins("mov rax, " + imm(ctx_.target.sys_write));
    ins("mov rdi, 1");
    ins("lea rsi, " + addr_operand);
    ins("mov rdx, " + len_operand);
    ins("syscall");
}

void X64NasmEmitter::writeNewline(){
    ctx_.needs_newline = true;
    writeSyscall("[rel newline]", "1");
}

void X64NasmEmitter::callPrintf(const std::string& value_source, bool is_address, bool newline){
    const TargetInfo& t = ctx_.target;
    const std::string& fmt_reg = t.c_arg_regs[0];
    const std::string& val_reg = t.c_arg_regs[1];
    if(is_address) ins("lea " + val_reg + ", " + value_source);
    else ins("mov " + val_reg + ", " + value_source);
    if(newline) ctx_.needs_fmt_nl = true; else ctx_.needs_fmt = true;
    ins("lea " + fmt_reg + ", [rel " + (newline ? "fmt_s_nl" : "fmt_s") + "]");
    // realign to 16 bytes around the C call and restore the original rsp afterwards
    int pad = 8 + t.shadow_space;
    ins("mov rax, rsp");
    ins("and rsp, -16");
    ins("push rax");
    ins("sub rsp, " + std::to_string(pad));
    ins("xor eax, eax");
    if(t.os==OS::Linux) ins("call " + t.c_symbol("printf") + " wrt ..plt");
    else ins("call " + t.c_symbol("printf"));
    ins("add rsp, " + std::to_string(pad));
    ins("pop rsp");
}

void X64NasmEmitter::printLiteral(const std::string& label, bool newline){
    if(!ctx_.target.uses_syscalls()){
        callPrintf("[rel " + label + "]", true, newline);
        return;
    }
    writeSyscall("[rel " + label + "]", StringPool::length_label(label));
    if(newline) writeNewline();
}

void X64NasmEmitter::printResult(bool newline){
    if(!ctx_.target.uses_syscalls()){
        callPrintf("rax", false, newline);
        return;
    }
    std::string loop = ctx_.labels.make("strlen");
    std::string done = ctx_.labels.make("strlen_done");
    ins("mov rsi, rax");
    ins("xor rdx, rdx");
    label(loop);
    ins("cmp byte [rsi+rdx], 0");
    ins("je " + done);
    ins("inc rdx");
    ins("jmp " + loop);
    label(done);
    ins("mov rax, " + imm(ctx_.target.sys_write));
    ins("mov rdi, 1");
    ins("syscall");
    if(newline) writeNewline();
}

std::unique_ptr<AsmEmitter> make_x64_nasm_emitter(CodegenContext& ctx){
    return std::make_unique<X64NasmEmitter>(ctx);
}

} // namespace sponge::codegen
