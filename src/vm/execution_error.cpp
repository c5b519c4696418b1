#include "vm/execution_error.hpp"
#include <sstream>

namespace zkrv {

const char* to_string(ExecutionErrorKind kind) {
    switch (kind) {
        case ExecutionErrorKind::Fail: return "Fail";
        case ExecutionErrorKind::PcOutOfBounds: return "PcOutOfBounds";
        case ExecutionErrorKind::DisabledOperation: return "DisabledOperation";
        case ExecutionErrorKind::InvalidInstruction: return "InvalidInstruction";
        case ExecutionErrorKind::ImmediateWrite: return "ImmediateWrite";
        case ExecutionErrorKind::InvalidMemoryAccess: return "InvalidMemoryAccess";
        case ExecutionErrorKind::InputExhausted: return "InputExhausted";
        case ExecutionErrorKind::HintOutOfBounds: return "HintOutOfBounds";
        case ExecutionErrorKind::PublicValueIndexOutOfBounds: return "PublicValueIndexOutOfBounds";
        case ExecutionErrorKind::PublicValueNotEqual: return "PublicValueNotEqual";
        case ExecutionErrorKind::InvalidPhantomInstruction: return "InvalidPhantomInstruction";
        case ExecutionErrorKind::ModularPrecondition: return "ModularPrecondition";
        case ExecutionErrorKind::TraceHeightOverflow: return "TraceHeightOverflow";
        case ExecutionErrorKind::SegmentationFailure: return "SegmentationFailure";
    }
    return "Unknown";
}

std::string ExecutionError::format(ExecutionErrorKind kind, uint32_t pc, const std::string& detail,
                                   const std::string& opcode_name) {
    std::ostringstream oss;
    oss << "execution error " << to_string(kind) << " at pc 0x" << std::hex << pc << std::dec;
    if (!opcode_name.empty()) {
        oss << " (" << opcode_name << ")";
    }
    if (!detail.empty()) {
        oss << ": " << detail;
    }
    return oss.str();
}

ExecutionError ExecutionError::with_context(uint32_t pc, const std::string& opcode_name) const {
    return ExecutionError(kind_, pc, detail_, opcode_name);
}

} // namespace zkrv
