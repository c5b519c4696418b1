#pragma once

#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "system/poseidon2_periphery.hpp"
#include "vm/chip.hpp"
#include <memory>
#include <vector>

namespace zkrv {

/**
 * VolatileBoundaryAir - initial and final state of every touched block
 *
 * Each valid row sends (as, ptr, 0, 0) and receives (as, ptr, data, ts)
 * on the memory bus. Valid rows come first and their (as, ptr) keys are
 * strictly increasing, so no address can be initialized twice.
 *
 * Columns: is_valid, as, ptr, data[4], timestamp, compare,
 *          diff_marker[2], diff_val, lt_limbs[L]
 */
class VolatileBoundaryAir : public Air {
public:
    explicit VolatileBoundaryAir(const MemoryConfig& config);

    std::string name() const override { return "VolatileBoundaryAir"; }
    size_t width() const override { return 12 + lt_.num_limbs(); }
    void eval(AirBuilder& builder) const override;

    const AssertLtSubAir& lt() const { return lt_; }

private:
    AssertLtSubAir lt_;
};

class VolatileBoundaryChip : public Chip {
public:
    VolatileBoundaryChip(const MemoryConfig& config, std::shared_ptr<VariableRangeCheckerChip> range_checker);

    // Blocks must be sorted by (as, ptr) without duplicates
    void set_final_memory(std::vector<TouchedBlock> blocks);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return blocks_.size(); }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    std::shared_ptr<VolatileBoundaryAir> air_;
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
    std::vector<TouchedBlock> blocks_;
};

/**
 * PersistentBoundaryAir - touched chunks entering and leaving a segment
 *
 * An initial row sends each block of the chunk at timestamp 0, a final
 * row receives each block at its last timestamp. Both rows hash the chunk
 * on the direct compression bus and receive the leaf on the Merkle bus
 * with tag 0 (initial) or 1 (final).
 *
 * Columns: is_initial, is_final, as, chunk_label, values[8], hash[8], timestamps[2]
 */
class PersistentBoundaryAir : public Air {
public:
    static constexpr size_t WIDTH = 4 + CHUNK + Digest::LEN + BLOCKS_PER_CHUNK;

    explicit PersistentBoundaryAir(const MemoryConfig& config) : config_(config) {}

    std::string name() const override { return "PersistentBoundaryAir<8>"; }
    size_t width() const override { return WIDTH; }
    void eval(AirBuilder& builder) const override;

private:
    MemoryConfig config_;
};

class PersistentBoundaryChip : public Chip {
public:
    PersistentBoundaryChip(const MemoryConfig& config, std::shared_ptr<Poseidon2PeripheryChip> poseidon2);

    void set_touched_chunks(std::vector<TouchedChunk> chunks);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return 2 * chunks_.size(); }
    size_t trace_width() const override { return PersistentBoundaryAir::WIDTH; }
    AirProofInput generate_air_proof_input() override;

private:
    std::shared_ptr<PersistentBoundaryAir> air_;
    std::shared_ptr<Poseidon2PeripheryChip> poseidon2_;
    std::vector<TouchedChunk> chunks_;
};

} // namespace zkrv
