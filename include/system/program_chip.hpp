#pragma once

#include "fri/two_adic_pcs.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include "vm/program.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace zkrv {

// Opcode of program padding rows; no executor claims it
constexpr uint32_t PROGRAM_PADDING_OPCODE = 0x7FFFFFF;

/**
 * ProgramAir - the committed program and how often each slot ran
 *
 * Cached partition: pc, opcode, a, b, c, d, e, f, g
 * Common partition: execution_frequency
 *
 * Every row receives its instruction on the program bus with the
 * frequency as count. Padding rows carry PROGRAM_PADDING_OPCODE, so a
 * nonzero frequency there cannot be balanced by any executor.
 */
class ProgramAir : public Air {
public:
    static constexpr size_t CACHED_WIDTH = 2 + NUM_OPERANDS;

    std::string name() const override { return "ProgramAir"; }
    size_t width() const override { return 1; }
    std::vector<size_t> cached_main_widths() const override { return {CACHED_WIDTH}; }
    void eval(AirBuilder& builder) const override;
};

/**
 * VmCommittedExe - an executable with its program trace committed
 *
 * The commitment is the Merkle root of the program trace LDE and is
 * shared by every segment proof of every run of the executable. With
 * persistent memory the initial image is bound by its Merkle root.
 */
struct VmCommittedExe {
    VmExe exe;
    std::shared_ptr<const CommittedMatrix> committed_program;
    std::optional<Digest> init_memory_root;

    static VmCommittedExe commit(VmExe exe, const TwoAdicPcs& pcs);

    Digest program_commit() const { return committed_program->root(); }
};

/**
 * ProgramChip - instruction fetch with execution frequency counting
 */
class ProgramChip : public Chip {
public:
    ProgramChip();

    // The committed trace must belong to this program
    void set_program(const Program& program, std::shared_ptr<const CommittedMatrix> committed);
    void set_program(const Program& program);

    /**
     * Fetch the instruction at pc and count the fetch.
     * Throws ExecutionError(PcOutOfBounds) outside the program.
     */
    const Instruction& get_instruction(uint32_t pc);

    const Program& program() const { return program_; }
    const std::vector<uint32_t>& frequencies() const { return frequencies_; }

    // Cached trace of a program: one row per slot, padded to a power of two
    static RowMajorMatrix<BFieldElement> generate_cached_trace(const Program& program);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return program_.len(); }
    size_t trace_width() const override { return 1; }

    // Requires a committed program trace
    AirProofInput generate_air_proof_input() override;

private:
    std::shared_ptr<ProgramAir> air_;
    Program program_;
    std::shared_ptr<const CommittedMatrix> committed_;
    std::vector<uint32_t> frequencies_;
};

} // namespace zkrv
