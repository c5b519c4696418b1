#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zkrv {

enum class ExecutionErrorKind {
    Fail,
    PcOutOfBounds,
    DisabledOperation,
    InvalidInstruction,
    ImmediateWrite,
    InvalidMemoryAccess,
    InputExhausted,
    HintOutOfBounds,
    PublicValueIndexOutOfBounds,
    PublicValueNotEqual,
    InvalidPhantomInstruction,
    ModularPrecondition,
    TraceHeightOverflow,
    SegmentationFailure,
};

const char* to_string(ExecutionErrorKind kind);

/**
 * ExecutionError - fatal interpreter error
 *
 * Carries the pc of the failing instruction and, when dispatch got that
 * far, the opcode name.
 */
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ExecutionErrorKind kind, uint32_t pc, const std::string& detail,
                   const std::string& opcode_name = "")
        : std::runtime_error(format(kind, pc, detail, opcode_name)),
          kind_(kind), pc_(pc), opcode_name_(opcode_name), detail_(detail) {}

    ExecutionErrorKind kind() const { return kind_; }
    uint32_t pc() const { return pc_; }
    const std::string& opcode_name() const { return opcode_name_; }

    const std::string& detail() const { return detail_; }

    // Same error located at pc within the named opcode
    ExecutionError with_context(uint32_t pc, const std::string& opcode_name) const;

private:
    ExecutionErrorKind kind_;
    uint32_t pc_;
    std::string opcode_name_;
    std::string detail_;

    static std::string format(ExecutionErrorKind kind, uint32_t pc, const std::string& detail,
                              const std::string& opcode_name);
};

} // namespace zkrv
