#pragma once

#include "air/air.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include <atomic>
#include <cstdint>
#include <vector>

namespace zkrv {

/**
 * BitwiseOperationLookupBus - byte-pair range checks and byte XOR lookups
 */
struct BitwiseOperationLookupBus {
    static void send_range(AirBuilder& builder, const Expr& x, const Expr& y, const Expr& count) {
        builder.push_send(bus::BITWISE, {x, y, Expr(), Expr()}, count);
    }
    static void send_xor(AirBuilder& builder, const Expr& x, const Expr& y, const Expr& z, const Expr& count) {
        builder.push_send(bus::BITWISE, {x, y, z, Expr(BFieldElement::one())}, count);
    }
};

class BitwiseOperationLookupAir : public Air {
public:
    static constexpr size_t NUM_BITS = 8;

    std::string name() const override { return "BitwiseOperationLookupAir<8>"; }
    size_t width() const override { return 2; }
    std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const override;
    void eval(AirBuilder& builder) const override;
};

/**
 * BitwiseOperationLookupChip - table over all (x, y) byte pairs
 *
 * Row x * 256 + y holds (x, y, x ^ y); the two multiplicity columns count
 * range-pair and XOR requests.
 */
class BitwiseOperationLookupChip : public Chip {
public:
    static constexpr size_t NUM_BITS = BitwiseOperationLookupAir::NUM_BITS;
    static constexpr size_t NUM_ROWS = size_t{1} << (2 * NUM_BITS);

    BitwiseOperationLookupChip();

    // Counts a range check of both bytes; throws std::out_of_range otherwise
    void request_range(uint32_t x, uint32_t y);
    uint32_t request_xor(uint32_t x, uint32_t y);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return NUM_ROWS; }
    size_t trace_width() const override { return 2; }
    AirProofInput generate_air_proof_input() override;

private:
    std::shared_ptr<BitwiseOperationLookupAir> air_;
    std::vector<std::atomic<uint32_t>> count_range_;
    std::vector<std::atomic<uint32_t>> count_xor_;

    static size_t index(uint32_t x, uint32_t y);
};

} // namespace zkrv
