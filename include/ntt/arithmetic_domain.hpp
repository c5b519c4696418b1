#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <vector>

namespace zkrv {

/**
 * ArithmeticDomain - multiplicative coset offset * <generator> of power-of-two size
 */
struct ArithmeticDomain {
    size_t length = 1;
    BFieldElement offset = BFieldElement::one();
    BFieldElement generator = BFieldElement::one();

    static ArithmeticDomain of_length(size_t length);
    ArithmeticDomain with_offset(BFieldElement new_offset) const;

    size_t log_length() const;
    BFieldElement element(size_t index) const;
    std::vector<BFieldElement> values() const;

    // Z_H(x) = (x / offset)^n - 1
    BFieldElement vanishing(BFieldElement x) const;
    XFieldElement vanishing(const XFieldElement& x) const;
};

// Smallest k with 2^k >= n
size_t log2_ceil(size_t n);

// Exact log2 of a power of two, throws otherwise
size_t log2_strict(size_t n);

} // namespace zkrv
