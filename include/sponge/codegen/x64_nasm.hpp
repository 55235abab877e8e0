// x86-64 backend, NASM syntax (elf64, macho64 and win64 object formats).
#pragma once
#include <sstream>
#include "sponge/codegen/emitter.hpp"

namespace sponge::codegen {

class X64NasmEmitter : public AsmEmitter {
public:
    explicit X64NasmEmitter(CodegenContext& ctx) : ctx_(ctx) {}

    void beginModule() override;
    void emitEntry(const std::string& main_label) override;
    void beginFunction(const std::string& label, const FramePlan& frame, const std::vector<int>& param_offsets) override;
    void endFunction(const std::string& exit_label) override;
    void endModule() override;

    void loadInt(int64_t value) override;
    void loadString(const std::string& label) override;
    void loadSlot(int offset) override;
    void storeSlot(int offset) override;
    void pushResult() override;
    void binary(const std::string& op) override;
    void callFunction(const std::string& label, size_t nargs) override;

    void branchIfZero(const std::string& label) override;
    void jump(const std::string& label) override;
    void label(const std::string& name) override;

    void printLiteral(const std::string& label, bool newline) override;
    void printResult(bool newline) override;

    std::string str() const override { return out_.str(); }
private:
    CodegenContext& ctx_;
    std::ostringstream out_;

    void ins(const std::string& text){ out_ << "    " << text << "\n"; }
    void writeSyscall(const std::string& addr_operand, const std::string& len_operand);
    void writeNewline();
    void callPrintf(const std::string& value_source, bool is_address, bool newline);
};

// "str_0 db "hi", 10, 0"
std::string nasm_db(const std::string& text);

} // namespace sponge::codegen
