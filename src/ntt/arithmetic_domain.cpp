#include "ntt/arithmetic_domain.hpp"
#include <stdexcept>

namespace zkrv {

size_t log2_ceil(size_t n) {
    size_t k = 0;
    while ((size_t{1} << k) < n) {
        ++k;
    }
    return k;
}

size_t log2_strict(size_t n) {
    if (n == 0 || (n & (n - 1)) != 0) {
        throw std::invalid_argument("Expected a power of two, got " + std::to_string(n));
    }
    return log2_ceil(n);
}

ArithmeticDomain ArithmeticDomain::of_length(size_t length) {
    ArithmeticDomain d;
    d.length = length;
    d.offset = BFieldElement::one();
    d.generator = BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log2_strict(length)));
    return d;
}

ArithmeticDomain ArithmeticDomain::with_offset(BFieldElement new_offset) const {
    ArithmeticDomain d = *this;
    d.offset = new_offset;
    return d;
}

size_t ArithmeticDomain::log_length() const {
    return log2_strict(length);
}

BFieldElement ArithmeticDomain::element(size_t index) const {
    return offset * generator.pow(index);
}

std::vector<BFieldElement> ArithmeticDomain::values() const {
    std::vector<BFieldElement> out(length);
    BFieldElement acc = offset;
    for (size_t i = 0; i < length; ++i) {
        out[i] = acc;
        acc *= generator;
    }
    return out;
}

BFieldElement ArithmeticDomain::vanishing(BFieldElement x) const {
    return (x / offset).pow(length) - BFieldElement::one();
}

XFieldElement ArithmeticDomain::vanishing(const XFieldElement& x) const {
    return (x * offset.inverse()).pow(length) - BFieldElement::one();
}

} // namespace zkrv
