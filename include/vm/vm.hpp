#pragma once

#include "stark/codec.hpp"
#include "stark/keygen.hpp"
#include "stark/proof.hpp"
#include "stark/prover.hpp"
#include "vm/config.hpp"
#include "vm/program.hpp"
#include "vm/segment.hpp"
#include "vm/vm_state.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace zkrv {

/**
 * VmExecutorResult - outcome of a run without trace generation
 */
struct VmExecutorResult {
    ExecutionState final_state;
    std::optional<uint32_t> exit_code;
    std::vector<std::optional<BFieldElement>> public_values;
    // Memory contents after the last instruction
    MemoryImage final_memory;
    size_t num_segments = 0;
    size_t num_instructions = 0;
};

/**
 * SegmentResult - one executed segment with the traces it produced
 */
struct SegmentResult {
    ExecutionState initial_state;
    ExecutionState final_state;
    SegmentStatus status = SegmentStatus::Fresh;
    std::optional<uint32_t> exit_code;
    size_t num_instructions = 0;
    ProofInput proof_input;
    FinalMemory final_memory;
};

/**
 * VmExecutor - runs an executable segment by segment
 *
 * Each segment starts at timestamp INITIAL_TIMESTAMP from the previous
 * segment's final pc, memory image, Merkle tree and revealed values. The
 * input streams are shared across segments.
 */
class VmExecutor {
public:
    explicit VmExecutor(VmConfig config, std::shared_ptr<const SegmentationStrategy> strategy = nullptr);

    const VmConfig& config() const { return config_; }

    VmExecutorResult execute(const VmExe& exe, std::vector<std::vector<uint8_t>> inputs) const;

    // Requires a program committed with this configuration's PCS
    std::vector<SegmentResult> execute_and_generate(const VmCommittedExe& exe,
                                                    std::vector<std::vector<uint8_t>> inputs) const;

private:
    VmConfig config_;
    std::shared_ptr<const SegmentationStrategy> strategy_;

    void execute_segments(const VmExe& exe, std::shared_ptr<const CommittedMatrix> committed,
                          std::vector<std::vector<uint8_t>> inputs,
                          const std::function<void(ExecutionSegment&, ExecutionState)>& on_segment) const;
};

inline ProgramCommitment program_commitment(const VmCommittedExe& exe) {
    return ProgramCommitment{exe.program_commit(), exe.exe.pc_start, exe.exe.program.pc_base(),
                             exe.exe.program.len(), exe.init_memory_root};
}

/**
 * Single digest identifying an executable with persistent memory:
 * compress(compress(H(program_commit), H(init_memory_root)), H(pc_start, 0, ..., 0))
 */
Digest compute_exe_commit(const Digest& program_commit, const Digest& init_memory_root, uint32_t pc_start);

enum class VmVerificationErrorKind {
    InitialPcMismatch,
    InitialTimestampMismatch,
    InitialMemoryRootMismatch,
    IsTerminateMismatch,
    ExitCodeMismatch,
    ProgramCommitMismatch,
    PublicValuesMismatch,
    UnexpectedPvs,
    StarkError,
};

const char* to_string(VmVerificationErrorKind kind);

/**
 * VmVerificationError - a chain of segment proofs that does not fit together
 *
 * StarkError wraps a VerificationError of a single segment proof.
 */
class VmVerificationError : public std::runtime_error {
public:
    VmVerificationError(VmVerificationErrorKind kind, size_t segment, const std::string& detail)
        : std::runtime_error(std::string("segment ") + std::to_string(segment) + ": " + to_string(kind) +
                             (detail.empty() ? "" : ": " + detail)),
          kind_(kind), segment_(segment) {}

    VmVerificationErrorKind kind() const { return kind_; }
    size_t segment() const { return segment_; }

private:
    VmVerificationErrorKind kind_;
    size_t segment_;
};

/**
 * VerifiedExecution - what a verified chain of segment proofs establishes
 */
struct VerifiedExecution {
    uint32_t exit_code = 0;
    uint32_t final_pc = 0;
    // Public values revealed over the whole run, zero where never revealed
    std::vector<BFieldElement> public_values;
    std::optional<Digest> final_memory_root;
    // Persistent memory only
    std::optional<Digest> exe_commit;
};

/**
 * VirtualMachine - keygen, program commitment, proving and verification
 * for one VM configuration
 */
class VirtualMachine {
public:
    explicit VirtualMachine(VmConfig config, std::shared_ptr<const SegmentationStrategy> strategy = nullptr);

    const VmConfig& config() const { return config_; }
    const VmExecutor& executor() const { return executor_; }

    // One AIR per chip of the configuration, in chip complex order
    MultiStarkProvingKey keygen() const;

    // Commits the program trace and, with continuations, the initial memory image
    VmCommittedExe commit_program(VmExe exe) const;

    VmExecutorResult execute(const VmExe& exe, std::vector<std::vector<uint8_t>> inputs) const {
        return executor_.execute(exe, std::move(inputs));
    }

    std::vector<SegmentResult> execute_and_generate(const VmCommittedExe& exe,
                                                    std::vector<std::vector<uint8_t>> inputs) const {
        return executor_.execute_and_generate(exe, std::move(inputs));
    }

    // One proof per segment
    std::vector<Proof> prove(const MultiStarkProvingKey& pk, const VmCommittedExe& exe,
                             std::vector<std::vector<uint8_t>> inputs) const;

    /**
     * Verify every segment proof and the links between consecutive
     * segments: program commitment, pc and timestamp continuity, Merkle
     * root continuity starting from the committed initial image,
     * termination only in the last segment with exit code 0,
     * DEFAULT_SUSPEND_EXIT_CODE elsewhere, and revealed values that never
     * change once set. Throws VmVerificationError.
     */
    VerifiedExecution verify_segment_proofs(const MultiStarkVerifyingKey& vk, const ProgramCommitment& commitment,
                                            const std::vector<Proof>& proofs) const;

private:
    VmConfig config_;
    VmExecutor executor_;
};

} // namespace zkrv
