#pragma once

#include "primitives/poseidon2_air.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include <map>
#include <mutex>

namespace zkrv {

/**
 * Poseidon2PeripheryAir - answers compression and permutation lookups
 *
 * Each row is one distinct permutation input with two multiplicities:
 * receives (left, right, out[0..8]) on the direct bus and
 * (in, out) on the permute bus.
 */
class Poseidon2PeripheryAir : public Air {
public:
    static constexpr size_t MULT_COMPRESS = Poseidon2SubAir::WIDTH;
    static constexpr size_t MULT_PERMUTE = Poseidon2SubAir::WIDTH + 1;
    static constexpr size_t WIDTH = Poseidon2SubAir::WIDTH + 2;

    std::string name() const override { return "Poseidon2PeripheryAir"; }
    size_t width() const override { return WIDTH; }
    void eval(AirBuilder& builder) const override;
};

/**
 * Poseidon2PeripheryChip - records every compression and permutation the
 * other chips look up, and proves them
 */
class Poseidon2PeripheryChip : public Chip {
public:
    Poseidon2PeripheryChip();

    // Compute and count compress(left, right)
    Digest compress(const Digest& left, const Digest& right);

    Poseidon2::State permute(const Poseidon2::State& input);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override;
    size_t trace_width() const override { return Poseidon2PeripheryAir::WIDTH; }
    AirProofInput generate_air_proof_input() override;

private:
    struct Counts {
        uint32_t compress = 0;
        uint32_t permute = 0;
    };

    std::shared_ptr<Poseidon2PeripheryAir> air_;
    mutable std::mutex mutex_;
    std::map<Poseidon2::State, Counts> records_;
};

} // namespace zkrv
