#pragma once

#include "air/air.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <vector>

namespace zkrv {

/**
 * RangeTupleCheckerBus - lookups proving x < sizes[0] and y < sizes[1]
 */
struct RangeTupleCheckerBus {
    std::array<uint32_t, 2> sizes = {256, 2048};

    static void send(AirBuilder& builder, const Expr& x, const Expr& y, const Expr& count) {
        builder.push_send(bus::RANGE_TUPLE, {x, y}, count);
    }
};

class RangeTupleCheckerAir : public Air {
public:
    explicit RangeTupleCheckerAir(std::array<uint32_t, 2> sizes) : sizes_(sizes) {}

    std::string name() const override { return "RangeTupleCheckerAir<2>"; }
    size_t width() const override { return 1; }
    std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const override;
    void eval(AirBuilder& builder) const override;

private:
    std::array<uint32_t, 2> sizes_;
};

class RangeTupleCheckerChip : public Chip {
public:
    // Both sizes must be powers of two
    explicit RangeTupleCheckerChip(std::array<uint32_t, 2> sizes);

    RangeTupleCheckerBus bus() const { return RangeTupleCheckerBus{sizes_}; }
    const std::array<uint32_t, 2>& sizes() const { return sizes_; }

    void add_count(uint32_t x, uint32_t y);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return counts_.size(); }
    size_t trace_width() const override { return 1; }
    AirProofInput generate_air_proof_input() override;

private:
    std::array<uint32_t, 2> sizes_;
    std::shared_ptr<RangeTupleCheckerAir> air_;
    std::vector<std::atomic<uint32_t>> counts_;
};

} // namespace zkrv
