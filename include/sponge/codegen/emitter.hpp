// Backend interface used by the code generator. The generator walks the IR and
// drives a stack-machine style sequence of hooks; each backend renders them in
// its assembler dialect.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "sponge/codegen/frame.hpp"
#include "sponge/codegen/labels.hpp"
#include "sponge/codegen/string_pool.hpp"
#include "sponge/codegen/target.hpp"

namespace sponge::codegen {

// Per-run state shared by the generator and the backend.
struct CodegenContext {
    explicit CodegenContext(const TargetInfo& t) : target(t), labels(t.local_label_prefix()) {}
    const TargetInfo& target;
    LabelAllocator labels;
    StringPool strings;
    // auxiliary data the backend must emit at the end
    bool needs_newline = false;  // single '\n' byte for raw writes
    bool needs_fmt = false;      // "%s"
    bool needs_fmt_nl = false;   // "%s\n"
};

class AsmEmitter {
public:
    virtual ~AsmEmitter() = default;

    virtual void beginModule() = 0;
    // Process entry: call main_label, exit with its result.
    virtual void emitEntry(const std::string& main_label) = 0;
    // param_offsets[i] is the frame slot receiving the i-th stack argument.
    virtual void beginFunction(const std::string& label, const FramePlan& frame, const std::vector<int>& param_offsets) = 0;
    virtual void endFunction(const std::string& exit_label) = 0;
    virtual void endModule() = 0;

    // Expression evaluation; the result register holds the value afterwards.
    virtual void loadInt(int64_t value) = 0;
    virtual void loadString(const std::string& label) = 0;
    virtual void loadSlot(int offset) = 0;
    virtual void storeSlot(int offset) = 0;
    virtual void pushResult() = 0;
    // Left operand on the stack, right operand in the result register.
    virtual void binary(const std::string& op) = 0;
    // Arguments already pushed, first argument on top.
    virtual void callFunction(const std::string& label, size_t nargs) = 0;

    virtual void branchIfZero(const std::string& label) = 0;
    virtual void jump(const std::string& label) = 0;
    virtual void label(const std::string& name) = 0;

    virtual void printLiteral(const std::string& label, bool newline) = 0;
    // String pointer in the result register.
    virtual void printResult(bool newline) = 0;

    virtual std::string str() const = 0;
};

std::unique_ptr<AsmEmitter> make_x64_nasm_emitter(CodegenContext& ctx);
std::unique_ptr<AsmEmitter> make_aarch64_gas_emitter(CodegenContext& ctx);

} // namespace sponge::codegen
