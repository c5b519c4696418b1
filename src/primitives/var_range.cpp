#include "primitives/var_range.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace zkrv {

void VariableRangeCheckerBus::range_check_limbs(AirBuilder& builder, const std::vector<Expr>& limbs,
                                                size_t max_bits, const Expr& count) const {
    size_t remaining = max_bits;
    for (const auto& limb : limbs) {
        const size_t bits = std::min(remaining, range_max_bits);
        range_check(builder, limb, bits, count);
        remaining -= bits;
    }
}

std::optional<RowMajorMatrix<BFieldElement>> VariableRangeCheckerAir::preprocessed_trace() const {
    const size_t height = size_t{1} << (range_max_bits_ + 1);
    RowMajorMatrix<BFieldElement> trace(2, height);
    size_t row = 0;
    for (size_t bits = 0; bits <= range_max_bits_; ++bits) {
        for (uint64_t value = 0; value < (uint64_t{1} << bits); ++value) {
            trace.set(row, 0, BFieldElement(value));
            trace.set(row, 1, BFieldElement(bits));
            ++row;
        }
    }
    // The last row stays (0, 0) with multiplicity 0
    return trace;
}

void VariableRangeCheckerAir::eval(AirBuilder& builder) const {
    auto prep = builder.preprocessed();
    auto main = builder.main();
    builder.push_receive(bus::RANGE_CHECKER, {prep.local(0), prep.local(1)}, main.local(0));
}

VariableRangeCheckerChip::VariableRangeCheckerChip(size_t range_max_bits)
    : range_max_bits_(range_max_bits),
      air_(std::make_shared<VariableRangeCheckerAir>(range_max_bits)),
      counts_(size_t{1} << (range_max_bits + 1)) {}

void VariableRangeCheckerChip::add_count(uint32_t value, size_t bits) {
    if (bits > range_max_bits_ || (uint64_t{value} >> bits) != 0) {
        throw std::out_of_range("range check of " + std::to_string(value) + " against " + std::to_string(bits) +
                                " bits");
    }
    const size_t row = ((size_t{1} << bits) - 1) + value;
    counts_[row].fetch_add(1, std::memory_order_relaxed);
}

void VariableRangeCheckerChip::decompose(uint32_t value, size_t bits, BFieldElement* limbs, size_t num_limbs) {
    if (bits < 32 && (uint64_t{value} >> bits) != 0) {
        throw std::out_of_range("value " + std::to_string(value) + " exceeds " + std::to_string(bits) + " bits");
    }
    size_t remaining = bits;
    uint32_t rest = value;
    for (size_t i = 0; i < num_limbs; ++i) {
        const size_t limb_bits = std::min(remaining, range_max_bits_);
        const uint32_t mask = limb_bits >= 32 ? 0xFFFFFFFFu : ((1u << limb_bits) - 1);
        const uint32_t limb = rest & mask;
        limbs[i] = BFieldElement(limb);
        add_count(limb, limb_bits);
        rest = limb_bits >= 32 ? 0 : rest >> limb_bits;
        remaining -= limb_bits;
    }
}

uint32_t VariableRangeCheckerChip::count(uint32_t value, size_t bits) const {
    return counts_.at(((size_t{1} << bits) - 1) + value).load(std::memory_order_relaxed);
}

AirProofInput VariableRangeCheckerChip::generate_air_proof_input() {
    AirProofInput input;
    input.common_main = RowMajorMatrix<BFieldElement>(1, counts_.size());
    for (size_t row = 0; row < counts_.size(); ++row) {
        input.common_main.set(row, 0, BFieldElement(counts_[row].exchange(0, std::memory_order_relaxed)));
    }
    return input;
}

} // namespace zkrv
