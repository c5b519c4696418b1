#pragma once

#include "primitives/var_range.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include "vm/config.hpp"
#include "vm/vm_state.hpp"
#include <memory>
#include <optional>

namespace zkrv {

// Exit code published by a segment that was cut rather than terminated
constexpr uint32_t DEFAULT_SUSPEND_EXIT_CODE = 42;

enum class ExitCode : uint32_t {
    Success = 0,
    Error = 1,
};

/**
 * VmConnectorPvs - public values of the connector AIR
 */
struct VmConnectorPvs {
    static constexpr size_t LEN = 6;

    uint32_t initial_pc = 0;
    uint32_t initial_timestamp = 0;
    uint32_t final_pc = 0;
    uint32_t final_timestamp = 0;
    uint32_t exit_code = 0;
    bool is_terminate = false;

    std::vector<BFieldElement> to_field_elements() const;
    static VmConnectorPvs from_field_elements(const std::vector<BFieldElement>& pvs);
};

/**
 * VmConnectorAir - opens and closes the execution bus of a segment
 *
 * Two rows: the begin row sends the segment's initial (pc, timestamp),
 * the end row receives its final (pc, timestamp) and, if the segment ended
 * with TERMINATE, the (pc, timestamp, exit_code) the terminate row sent.
 * The timestamp never decreases across the segment.
 *
 * Preprocessed: is_begin
 * Main: pc, timestamp, is_terminate, exit_code, ts_delta_limbs[L]
 */
class VmConnectorAir : public Air {
public:
    explicit VmConnectorAir(const MemoryConfig& config)
        : clk_max_bits_(config.clk_max_bits), decomp_(config.decomp) {}

    std::string name() const override { return "VmConnectorAir"; }
    size_t width() const override { return 4 + num_delta_limbs(); }
    size_t num_public_values() const override { return VmConnectorPvs::LEN; }
    std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const override;
    void eval(AirBuilder& builder) const override;

    size_t num_delta_limbs() const { return (clk_max_bits_ + decomp_ - 1) / decomp_; }
    size_t clk_max_bits() const { return clk_max_bits_; }

private:
    size_t clk_max_bits_;
    size_t decomp_;
};

class VmConnectorChip : public Chip {
public:
    VmConnectorChip(const MemoryConfig& config, std::shared_ptr<VariableRangeCheckerChip> range_checker);

    void begin(ExecutionState state);

    // exit_code is set iff the segment ended with TERMINATE
    void end(ExecutionState state, std::optional<uint32_t> exit_code);

    const std::optional<ExecutionState>& initial_state() const { return initial_; }
    const std::optional<ExecutionState>& final_state() const { return final_; }
    bool is_terminated() const { return exit_code_.has_value(); }
    VmConnectorPvs public_values() const;

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return 2; }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    std::shared_ptr<VmConnectorAir> air_;
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
    std::optional<ExecutionState> initial_;
    std::optional<ExecutionState> final_;
    std::optional<uint32_t> exit_code_;
};

} // namespace zkrv
