// AArch64 backend, GNU as syntax (ELF and Mach-O flavours).
#pragma once
#include <sstream>
#include "sponge/codegen/emitter.hpp"

namespace sponge::codegen {

class AArch64GasEmitter : public AsmEmitter {
public:
    explicit AArch64GasEmitter(CodegenContext& ctx) : ctx_(ctx) {}

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
    void moveImmediate(const std::string& reg, int64_t value);
    void address(const std::string& reg, const std::string& symbol);
    std::string frameOperand(int offset);
    void adjustSp(const char* mnemonic, int64_t bytes);
    void syscall(int64_t number);
    void writeNewline();
    void callPrintf(bool newline);
};

// Escaped body for .asciz
std::string gas_escape(const std::string& text);

} // namespace sponge::codegen
