#include "system/public_values.hpp"
#include "vm/execution_error.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace zkrv {

PublicValuesAir::PublicValuesAir(size_t num_public_values) : num_value_bytes_(num_public_values) {
    if (num_public_values % PUBLIC_VALUE_SLOT_BYTES != 0) {
        throw std::invalid_argument("number of public values must be a multiple of " +
                                    std::to_string(PUBLIC_VALUE_SLOT_BYTES));
    }
}

std::optional<RowMajorMatrix<BFieldElement>> PublicValuesAir::preprocessed_trace() const {
    const size_t slots = num_slots();
    RowMajorMatrix<BFieldElement> trace(1 + slots, padded_height(slots));
    for (size_t s = 0; s < slots; ++s) {
        trace.set(s, 0, BFieldElement(s));
        trace.set(s, 1 + s, BFieldElement::one());
    }
    return trace;
}

void PublicValuesAir::eval(AirBuilder& builder) const {
    auto prep = builder.preprocessed();
    auto main = builder.main();
    const size_t slots = num_slots();

    for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
        Expr expected;
        for (size_t s = 0; s < slots; ++s) {
            expected += prep.local(1 + s) * builder.public_value(s * PUBLIC_VALUE_SLOT_BYTES + j);
        }
        builder.assert_eq(main.local(1 + j), expected);
    }

    Expr revealed;
    for (size_t s = 0; s < slots; ++s) {
        revealed += prep.local(1 + s) * builder.public_value(revealed_flag_index(s));
    }
    builder.assert_zero(main.local(0) * (1 - revealed));
    for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
        builder.assert_zero((1 - revealed) * main.local(1 + j));
    }

    std::vector<Expr> fields{prep.local(0)};
    for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
        fields.push_back(main.local(1 + j));
    }
    builder.push_receive(bus::PUBLIC_VALUES, std::move(fields), main.local(0));
}

PublicValuesChip::PublicValuesChip(size_t num_public_values)
    : air_(std::make_shared<PublicValuesAir>(num_public_values)),
      values_(num_public_values),
      multiplicities_(num_public_values / PUBLIC_VALUE_SLOT_BYTES, 0) {}

void PublicValuesChip::reveal(uint32_t byte_offset, const std::vector<BFieldElement>& bytes) {
    if (byte_offset % PUBLIC_VALUE_SLOT_BYTES != 0 || bytes.size() != PUBLIC_VALUE_SLOT_BYTES ||
        size_t{byte_offset} + PUBLIC_VALUE_SLOT_BYTES > values_.size()) {
        throw ExecutionError(ExecutionErrorKind::PublicValueIndexOutOfBounds, 0,
                             "offset " + std::to_string(byte_offset) + " with " + std::to_string(values_.size()) +
                                 " public values");
    }
    for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
        const auto& existing = values_[byte_offset + j];
        if (existing && *existing != bytes[j]) {
            throw ExecutionError(ExecutionErrorKind::PublicValueNotEqual, 0,
                                 "public value " + std::to_string(byte_offset + j) + " already set to " +
                                     std::to_string(existing->value()));
        }
    }
    for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
        values_[byte_offset + j] = bytes[j];
    }
    ++multiplicities_[byte_offset / PUBLIC_VALUE_SLOT_BYTES];
}

std::vector<BFieldElement> PublicValuesChip::public_values() const {
    std::vector<BFieldElement> out;
    out.reserve(air_->num_public_values());
    for (const auto& v : values_) {
        out.push_back(v.value_or(BFieldElement::zero()));
    }
    for (size_t s = 0; s < air_->num_slots(); ++s) {
        out.push_back(values_[s * PUBLIC_VALUE_SLOT_BYTES] ? BFieldElement::one() : BFieldElement::zero());
    }
    return out;
}

void PublicValuesChip::seed(const std::vector<std::optional<BFieldElement>>& values) {
    if (values.size() != values_.size()) {
        throw std::invalid_argument("expected " + std::to_string(values_.size()) + " public values, got " +
                                    std::to_string(values.size()));
    }
    values_ = values;
}

AirProofInput PublicValuesChip::generate_air_proof_input() {
    const size_t slots = air_->num_slots();
    RowMajorMatrix<BFieldElement> trace(air_->width(), padded_height(slots));
    const std::vector<BFieldElement> pvs = public_values();
    for (size_t s = 0; s < slots; ++s) {
        BFieldElement* row = trace.row_mut(s);
        row[0] = BFieldElement(multiplicities_[s]);
        for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
            row[1 + j] = pvs[s * PUBLIC_VALUE_SLOT_BYTES + j];
        }
    }

    AirProofInput input;
    input.common_main = std::move(trace);
    input.public_values = pvs;
    std::fill(multiplicities_.begin(), multiplicities_.end(), 0);
    return input;
}

} // namespace zkrv
