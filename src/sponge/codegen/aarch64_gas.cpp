#include "sponge/codegen/aarch64_gas.hpp"
#include <cstdio>

namespace sponge::codegen {

std::string gas_escape(const std::string& text){
    std::string out;
    for(unsigned char c : text){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if(c < 0x20 || c >= 0x7F){
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\%03o", static_cast<unsigned>(c));
                    out += buf;
                } else out += static_cast<char>(c);
        }
    }
    return out;
}

void AArch64GasEmitter::moveImmediate(const std::string& reg, int64_t value){
    uint64_t u = static_cast<uint64_t>(value);
    if(u <= 0xFFFF){ ins("mov " + reg + ", #" + std::to_string(u)); return; }
    bool first = true;
    for(int shift = 0; shift < 64; shift += 16){
        unsigned chunk = static_cast<unsigned>((u >> shift) & 0xFFFF);
        if(chunk == 0) continue;
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%s %s, #0x%X, lsl #%d", first ? "movz" : "movk", reg.c_str(), chunk, shift);
        ins(buf);
        first = false;
    }
}

void AArch64GasEmitter::address(const std::string& reg, const std::string& symbol){
    if(ctx_.target.is_darwin()){
        ins("adrp " + reg + ", " + symbol + "@PAGE");
        ins("add " + reg + ", " + reg + ", " + symbol + "@PAGEOFF");
    } else {
        ins("adrp " + reg + ", " + symbol);
        ins("add " + reg + ", " + reg + ", :lo12:" + symbol);
    }
}

// Unscaled loads and stores reach -256..255; further slots go through x9.
std::string AArch64GasEmitter::frameOperand(int offset){
    if(offset >= -256 && offset <= 255) return "[x29, #" + std::to_string(offset) + "]";
    int64_t magnitude = offset < 0 ? -static_cast<int64_t>(offset) : offset;
    const char* op = offset < 0 ? "sub" : "add";
    if(magnitude <= 4095) ins(std::string(op) + " x9, x29, #" + std::to_string(magnitude));
    else {
        moveImmediate("x9", magnitude);
        ins(std::string(op) + " x9, x29, x9");
    }
    return "[x9]";
}

void AArch64GasEmitter::adjustSp(const char* mnemonic, int64_t bytes){
    if(bytes == 0) return;
    if(bytes <= 4095){ ins(std::string(mnemonic) + " sp, sp, #" + std::to_string(bytes)); return; }
    moveImmediate("x9", bytes);
    ins(std::string(mnemonic) + " sp, sp, x9");
}

void AArch64GasEmitter::syscall(int64_t number){
    if(ctx_.target.is_darwin()){
        moveImmediate("x16", number);
        ins("svc #0x80");
    } else {
        moveImmediate("x8", number);
        ins("svc #0");
    }
}

void AArch64GasEmitter::beginModule(){
    const TargetInfo& t = ctx_.target;
    out_ << "// " << t.triple << "\n";
    out_ << ".text\n";
    out_ << ".globl " << t.entry_symbol() << "\n";
    out_ << ".p2align 2\n\n";
}

void AArch64GasEmitter::emitEntry(const std::string& main_label){
    const TargetInfo& t = ctx_.target;
    out_ << t.entry_symbol() << ":\n";
    if(t.uses_syscalls()){
        ins("bl " + main_label);
        syscall(t.sys_exit); // status already in x0
    } else {
        ins("stp x29, x30, [sp, #-16]!");
        ins("mov x29, sp");
        ins("bl " + main_label);
        ins("ldp x29, x30, [sp], #16");
        ins("ret");
    }
    out_ << "\n";
}

void AArch64GasEmitter::beginFunction(const std::string& label, const FramePlan& frame, const std::vector<int>& param_offsets){
    out_ << label << ":\n";
    ins("stp x29, x30, [sp, #-16]!");
    ins("mov x29, sp");
    adjustSp("sub", frame.size);
    // each pushed argument occupies 16 bytes above the saved x29/x30 pair
    for(size_t i=0;i<param_offsets.size();++i){
        ins("ldr x0, [x29, #" + std::to_string(16 + 16*i) + "]");
        std::string dst = frameOperand(param_offsets[i]);
        ins("str x0, " + dst);
    }
}

void AArch64GasEmitter::endFunction(const std::string& exit_label){
    out_ << exit_label << ":\n";
    ins("mov sp, x29");
    ins("ldp x29, x30, [sp], #16");
    ins("ret");
    out_ << "\n";
}

void AArch64GasEmitter::endModule(){
    if(ctx_.strings.empty() && !ctx_.needs_newline && !ctx_.needs_fmt && !ctx_.needs_fmt_nl) return;
    out_ << ".data\n";
    if(ctx_.needs_newline) out_ << "newline:\n    .byte 10\n";
    if(ctx_.needs_fmt) out_ << "fmt_s:\n    .asciz \"%s\"\n";
    if(ctx_.needs_fmt_nl) out_ << "fmt_s_nl:\n    .asciz \"%s\\n\"\n";
    for(auto& s : ctx_.strings.entries()){
        out_ << s.label << ":\n    .asciz \"" << gas_escape(s.text) << "\"\n";
        out_ << ".set " << StringPool::length_label(s.label) << ", . - " << s.label << " - 1\n";
    }
}

void AArch64GasEmitter::loadInt(int64_t value){ moveImmediate("x0", value); }
void AArch64GasEmitter::loadString(const std::string& label){ address("x0", label); }

void AArch64GasEmitter::loadSlot(int offset){
    std::string src = frameOperand(offset);
    ins("ldr x0, " + src);
}

void AArch64GasEmitter::storeSlot(int offset){
    std::string dst = frameOperand(offset);
    ins("str x0, " + dst);
}

void AArch64GasEmitter::pushResult(){ ins("str x0, [sp, #-16]!"); }

void AArch64GasEmitter::binary(const std::string& op){
    ins("mov x1, x0");
    ins("ldr x0, [sp], #16");
    if(op=="+") ins("add x0, x0, x1");
    else if(op=="-") ins("sub x0, x0, x1");
    else if(op=="*") ins("mul x0, x0, x1");
    else if(op=="/") ins("sdiv x0, x0, x1");
    else {
        const char* cond = op==">" ? "gt" : op=="<" ? "lt" : op=="==" ? "eq" : "ne";
        ins("cmp x0, x1");
        ins(std::string("cset x0, ") + cond);
    }
}

void AArch64GasEmitter::callFunction(const std::string& label, size_t nargs){
    ins("bl " + label);
    adjustSp("add", static_cast<int64_t>(16*nargs));
}

void AArch64GasEmitter::branchIfZero(const std::string& label){
    ins("cmp x0, #0");
    ins("b.eq " + label);
}

void AArch64GasEmitter::jump(const std::string& label){ ins("b " + label); }
void AArch64GasEmitter::label(const std::string& name){ out_ << name << ":\n"; }

void AArch64GasEmitter::writeNewline(){
    ctx_.needs_newline = true;
    ins("mov x0, #1");
    address("x1", "newline");
    ins("mov x2, #1");
    syscall(ctx_.target.sys_write);
}

// Expects the string pointer in x1.
void AArch64GasEmitter::callPrintf(bool newline){
    const TargetInfo& t = ctx_.target;
    if(newline) ctx_.needs_fmt_nl = true; else ctx_.needs_fmt = true;
    address("x0", newline ? "fmt_s_nl" : "fmt_s");
    if(t.variadic_on_stack){
        ins("sub sp, sp, #16");
        ins("str x1, [sp]");
        ins("bl " + t.c_symbol("printf"));
        ins("add sp, sp, #16");
    } else {
        ins("bl " + t.c_symbol("printf"));
    }
}

void AArch64GasEmitter::printLiteral(const std::string& label, bool newline){
    if(!ctx_.target.uses_syscalls()){
        address("x1", label);
        callPrintf(newline);
        return;
    }
    ins("mov x0, #1");
    address("x1", label);
    ins("ldr x2, =" + StringPool::length_label(label));
    syscall(ctx_.target.sys_write);
    if(newline) writeNewline();
}

void AArch64GasEmitter::printResult(bool newline){
    if(!ctx_.target.uses_syscalls()){
        ins("mov x1, x0");
        callPrintf(newline);
        return;
    }
    std::string loop = ctx_.labels.make("strlen");
    std::string done = ctx_.labels.make("strlen_done");
    ins("mov x1, x0");
    ins("mov x2, #0");
    label(loop);
    ins("ldrb w3, [x1, x2]");
    ins("cbz w3, " + done);
    ins("add x2, x2, #1");
    ins("b " + loop);
    label(done);
    ins("mov x0, #1");
    syscall(ctx_.target.sys_write);
    if(newline) writeNewline();
}

std::unique_ptr<AsmEmitter> make_aarch64_gas_emitter(CodegenContext& ctx){
    return std::make_unique<AArch64GasEmitter>(ctx);
}

} // namespace sponge::codegen
