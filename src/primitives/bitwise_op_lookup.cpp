#include "primitives/bitwise_op_lookup.hpp"
#include <stdexcept>
#include <string>

namespace zkrv {

std::optional<RowMajorMatrix<BFieldElement>> BitwiseOperationLookupAir::preprocessed_trace() const {
    const size_t n = size_t{1} << NUM_BITS;
    RowMajorMatrix<BFieldElement> trace(3, n * n);
    for (size_t x = 0; x < n; ++x) {
        for (size_t y = 0; y < n; ++y) {
            const size_t row = x * n + y;
            trace.set(row, 0, BFieldElement(x));
            trace.set(row, 1, BFieldElement(y));
            trace.set(row, 2, BFieldElement(x ^ y));
        }
    }
    return trace;
}

void BitwiseOperationLookupAir::eval(AirBuilder& builder) const {
    auto prep = builder.preprocessed();
    auto main = builder.main();
    builder.push_receive(bus::BITWISE, {prep.local(0), prep.local(1), Expr(), Expr()}, main.local(0));
    builder.push_receive(bus::BITWISE, {prep.local(0), prep.local(1), prep.local(2), Expr(BFieldElement::one())},
                         main.local(1));
}

BitwiseOperationLookupChip::BitwiseOperationLookupChip()
    : air_(std::make_shared<BitwiseOperationLookupAir>()), count_range_(NUM_ROWS), count_xor_(NUM_ROWS) {}

size_t BitwiseOperationLookupChip::index(uint32_t x, uint32_t y) {
    if (x >= (1u << NUM_BITS) || y >= (1u << NUM_BITS)) {
        throw std::out_of_range("bitwise lookup operands (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") exceed " + std::to_string(NUM_BITS) + " bits");
    }
    return (size_t{x} << NUM_BITS) + y;
}

void BitwiseOperationLookupChip::request_range(uint32_t x, uint32_t y) {
    count_range_[index(x, y)].fetch_add(1, std::memory_order_relaxed);
}

uint32_t BitwiseOperationLookupChip::request_xor(uint32_t x, uint32_t y) {
    count_xor_[index(x, y)].fetch_add(1, std::memory_order_relaxed);
    return x ^ y;
}

AirProofInput BitwiseOperationLookupChip::generate_air_proof_input() {
    AirProofInput input;
    input.common_main = RowMajorMatrix<BFieldElement>(2, NUM_ROWS);
    for (size_t row = 0; row < NUM_ROWS; ++row) {
        input.common_main.set(row, 0, BFieldElement(count_range_[row].exchange(0, std::memory_order_relaxed)));
        input.common_main.set(row, 1, BFieldElement(count_xor_[row].exchange(0, std::memory_order_relaxed)));
    }
    return input;
}

} // namespace zkrv
