#include "system/terminate.hpp"
#include "vm/execution_error.hpp"
#include "vm/opcode.hpp"
#include "vm/program.hpp"
#include <string>

namespace zkrv {

void TerminateAir::eval(AirBuilder& builder) const {
    auto main = builder.main();
    const Expr is_valid = main.local(0);
    const Expr pc = main.local(1);
    const Expr ts = main.local(2);
    const Expr exit_code = main.local(3);
    const Expr next_pc = pc + static_cast<int64_t>(DEFAULT_PC_STEP);

    builder.assert_bool(is_valid);
    BitwiseOperationLookupBus::send_range(builder, exit_code, Expr(), is_valid);
    ProgramBus::lookup(builder, is_valid, pc, Expr::from_u64(opcode(SystemOpcode::TERMINATE)),
                       {Expr(), Expr(), exit_code});
    ExecutionBridge::execute(builder, is_valid, pc, ts, next_pc, ts);
    builder.push_send(bus::TERMINATE, {next_pc, ts, exit_code}, is_valid);
}

TerminateChip::TerminateChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise)
    : air_(std::make_shared<TerminateAir>()), bitwise_(std::move(bitwise)) {}

ExecutionState TerminateChip::execute(MemoryController& /*memory*/, const Instruction& instruction,
                                      ExecutionState from_state) {
    const uint64_t code = instruction.c.value();
    if (code > 0xFF || !instruction.a.is_zero() || !instruction.b.is_zero()) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "TERMINATE takes a one-byte exit code in c, got " + instruction.to_string());
    }
    bitwise_->request_range(static_cast<uint32_t>(code), 0);
    records_.push_back(Record{from_state, static_cast<uint32_t>(code)});
    exit_code_ = static_cast<uint32_t>(code);
    return ExecutionState(from_state.pc + DEFAULT_PC_STEP, from_state.timestamp);
}

AirProofInput TerminateChip::generate_air_proof_input() {
    RowMajorMatrix<BFieldElement> trace(TerminateAir::WIDTH, padded_height(records_.size()));
    for (size_t i = 0; i < records_.size(); ++i) {
        BFieldElement* row = trace.row_mut(i);
        row[0] = BFieldElement::one();
        row[1] = BFieldElement(records_[i].from_state.pc);
        row[2] = BFieldElement(records_[i].from_state.timestamp);
        row[3] = BFieldElement(records_[i].exit_code);
    }
    records_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

} // namespace zkrv
