#pragma once

#include "air/air.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include <atomic>
#include <cstdint>
#include <vector>

namespace zkrv {

/**
 * VariableRangeCheckerBus - (value, bits) lookups proving value < 2^bits
 */
struct VariableRangeCheckerBus {
    size_t range_max_bits = 17;

    void range_check(AirBuilder& builder, const Expr& value, size_t bits, const Expr& count) const {
        builder.push_send(bus::RANGE_CHECKER, {value, Expr::from_u64(bits)}, count);
    }

    // Bit count chosen per row, e.g. a shift amount
    void range_check(AirBuilder& builder, const Expr& value, const Expr& bits, const Expr& count) const {
        builder.push_send(bus::RANGE_CHECKER, {value, bits}, count);
    }

    /**
     * Range check a value of max_bits bits given as decomp-bit limbs.
     * The top limb is checked against the remaining bit count.
     */
    void range_check_limbs(AirBuilder& builder, const std::vector<Expr>& limbs, size_t max_bits,
                           const Expr& count) const;
};

class VariableRangeCheckerAir : public Air {
public:
    explicit VariableRangeCheckerAir(size_t range_max_bits) : range_max_bits_(range_max_bits) {}

    std::string name() const override { return "VariableRangeCheckerAir"; }
    size_t width() const override { return 1; }
    std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const override;
    void eval(AirBuilder& builder) const override;

    size_t range_max_bits() const { return range_max_bits_; }

private:
    size_t range_max_bits_;
};

/**
 * VariableRangeCheckerChip - lookup table of every (value, bits) pair
 * with bits <= range_max_bits
 *
 * Row of (value, bits) is 2^bits - 1 + value. Counts are atomic so trace
 * generators may add to them concurrently.
 */
class VariableRangeCheckerChip : public Chip {
public:
    explicit VariableRangeCheckerChip(size_t range_max_bits);

    VariableRangeCheckerBus bus() const { return VariableRangeCheckerBus{range_max_bits_}; }
    size_t range_max_bits() const { return range_max_bits_; }

    // Throws std::out_of_range when value >= 2^bits
    void add_count(uint32_t value, size_t bits);

    /**
     * Split value (< 2^bits) into decomp-bit limbs, counting every limb.
     * The top limb is counted against the remaining bit count.
     */
    void decompose(uint32_t value, size_t bits, BFieldElement* limbs, size_t num_limbs);

    uint32_t count(uint32_t value, size_t bits) const;

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return counts_.size(); }
    size_t trace_width() const override { return 1; }
    AirProofInput generate_air_proof_input() override;

private:
    size_t range_max_bits_;
    std::shared_ptr<VariableRangeCheckerAir> air_;
    std::vector<std::atomic<uint32_t>> counts_;
};

} // namespace zkrv
