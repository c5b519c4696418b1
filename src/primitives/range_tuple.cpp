#include "primitives/range_tuple.hpp"
#include <stdexcept>
#include <string>

namespace zkrv {

std::optional<RowMajorMatrix<BFieldElement>> RangeTupleCheckerAir::preprocessed_trace() const {
    RowMajorMatrix<BFieldElement> trace(2, size_t{sizes_[0]} * sizes_[1]);
    for (uint32_t x = 0; x < sizes_[0]; ++x) {
        for (uint32_t y = 0; y < sizes_[1]; ++y) {
            const size_t row = size_t{x} * sizes_[1] + y;
            trace.set(row, 0, BFieldElement(x));
            trace.set(row, 1, BFieldElement(y));
        }
    }
    return trace;
}

void RangeTupleCheckerAir::eval(AirBuilder& builder) const {
    auto prep = builder.preprocessed();
    builder.push_receive(bus::RANGE_TUPLE, {prep.local(0), prep.local(1)}, builder.main().local(0));
}

RangeTupleCheckerChip::RangeTupleCheckerChip(std::array<uint32_t, 2> sizes)
    : sizes_(sizes), air_(std::make_shared<RangeTupleCheckerAir>(sizes)),
      counts_(size_t{sizes[0]} * sizes[1]) {
    for (uint32_t s : sizes) {
        if (s == 0 || (s & (s - 1)) != 0) {
            throw std::invalid_argument("range tuple size " + std::to_string(s) + " is not a power of two");
        }
    }
}

void RangeTupleCheckerChip::add_count(uint32_t x, uint32_t y) {
    if (x >= sizes_[0] || y >= sizes_[1]) {
        throw std::out_of_range("range tuple (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") outside [" + std::to_string(sizes_[0]) + ", " + std::to_string(sizes_[1]) + ")");
    }
    counts_[size_t{x} * sizes_[1] + y].fetch_add(1, std::memory_order_relaxed);
}

AirProofInput RangeTupleCheckerChip::generate_air_proof_input() {
    AirProofInput input;
    input.common_main = RowMajorMatrix<BFieldElement>(1, counts_.size());
    for (size_t row = 0; row < counts_.size(); ++row) {
        input.common_main.set(row, 0, BFieldElement(counts_[row].exchange(0, std::memory_order_relaxed)));
    }
    return input;
}

} // namespace zkrv
