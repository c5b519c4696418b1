#pragma once

#include "primitives/bitwise_op_lookup.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace zkrv {

/**
 * TerminateAir - one row per executed TERMINATE
 *
 * Instruction: c = exit code (one byte)
 * Columns: is_valid, pc, timestamp, exit_code
 *
 * Steps pc past the instruction without touching memory and hands
 * (pc + 4, timestamp, exit_code) to the connector on the terminate bus.
 */
class TerminateAir : public Air {
public:
    static constexpr size_t WIDTH = 4;

    std::string name() const override { return "TerminateAir"; }
    size_t width() const override { return WIDTH; }
    void eval(AirBuilder& builder) const override;
};

class TerminateChip : public Chip, public InstructionExecutor {
public:
    explicit TerminateChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise);

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override;
    std::string get_opcode_name(uint32_t /*opcode*/) const override { return "TERMINATE"; }

    // Exit code of the last TERMINATE executed, if any
    const std::optional<uint32_t>& exit_code() const { return exit_code_; }

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size(); }
    size_t trace_width() const override { return TerminateAir::WIDTH; }
    AirProofInput generate_air_proof_input() override;

private:
    struct Record {
        ExecutionState from_state;
        uint32_t exit_code = 0;
    };

    std::shared_ptr<TerminateAir> air_;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::vector<Record> records_;
    std::optional<uint32_t> exit_code_;
};

} // namespace zkrv
