#pragma once

#include "memory/memory_controller.hpp"
#include "vm/chip_complex.hpp"
#include "vm/config.hpp"
#include "vm/program.hpp"
#include "vm/vm_state.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zkrv {

/**
 * SegmentationStrategy - decides after every instruction whether the
 * running segment has grown large enough to be cut
 */
class SegmentationStrategy {
public:
    virtual ~SegmentationStrategy() = default;

    /**
     * air_names and heights are the instruction executors' names and
     * unpadded trace heights; instructions and timestamp_delta count from
     * the segment start.
     */
    virtual bool should_segment(const std::vector<std::string>& air_names, const std::vector<size_t>& heights,
                                size_t instructions, uint32_t timestamp_delta) const = 0;
};

// Cuts when the instruction count or the timestamp delta reaches
// max_segment_len, or an executor trace reaches max_trace_height
class DefaultSegmentationStrategy : public SegmentationStrategy {
public:
    DefaultSegmentationStrategy(size_t max_segment_len, size_t max_trace_height)
        : max_segment_len_(max_segment_len), max_trace_height_(max_trace_height) {}

    static std::shared_ptr<const SegmentationStrategy> from_config(const SystemConfig& config) {
        return std::make_shared<DefaultSegmentationStrategy>(config.max_segment_len, config.max_trace_height);
    }

    bool should_segment(const std::vector<std::string>& air_names, const std::vector<size_t>& heights,
                        size_t instructions, uint32_t timestamp_delta) const override;

private:
    size_t max_segment_len_;
    size_t max_trace_height_;
};

enum class SegmentStatus {
    Fresh,
    Running,
    Segmented,
    Terminated,
};

/**
 * ExecutionSegment - one contiguous run proved by a single multi-AIR proof
 *
 * Owns its chip complex and memory controller. The memory starts from
 * the given image (and, with continuations, the previous segment's final
 * Merkle tree); the timestamp restarts at INITIAL_TIMESTAMP.
 *
 * Fresh --execute_from_state--> Running --> Segmented | Terminated
 */
class ExecutionSegment {
public:
    struct InitialMemory {
        MemoryImage image;
        // Final tree of the previous segment; absent for the first segment
        std::optional<MemoryMerkleTree> tree;
    };

    ExecutionSegment(const VmConfig& config, const Program& program,
                     std::shared_ptr<const CommittedMatrix> committed_program, std::shared_ptr<Streams> streams,
                     InitialMemory initial_memory, const std::vector<std::optional<BFieldElement>>& revealed = {});

    /**
     * Run from state until TERMINATE or until the strategy cuts the
     * segment. A cut without continuations is
     * ExecutionError(SegmentationFailure). Errors carry the failing pc and
     * opcode name.
     */
    void execute_from_state(ExecutionState state, const SegmentationStrategy& strategy);

    SegmentStatus status() const { return status_; }
    bool is_terminated() const { return status_ == SegmentStatus::Terminated; }
    ExecutionState final_state() const;
    std::optional<uint32_t> exit_code() const { return exit_code_; }
    size_t num_instructions() const { return num_instructions_; }

    // Available once the segment stopped
    const FinalMemory& final_memory() const;

    // Revealed public value bytes up to the end of this segment
    const std::vector<std::optional<BFieldElement>>& public_values() const {
        return chip_complex_->public_values_chip().values();
    }

    VmChipComplex& chip_complex() { return *chip_complex_; }
    const MemoryController& memory() const { return *memory_; }

    // Traces of every AIR; requires a committed program and a stopped segment
    ProofInput generate_proof_input();

private:
    VmConfig config_;
    std::unique_ptr<VmChipComplex> chip_complex_;
    std::unique_ptr<MemoryController> memory_;
    SegmentStatus status_ = SegmentStatus::Fresh;
    ExecutionState final_state_;
    std::optional<uint32_t> exit_code_;
    size_t num_instructions_ = 0;
    std::optional<FinalMemory> final_memory_;

    void finish(ExecutionState state);
};

} // namespace zkrv
