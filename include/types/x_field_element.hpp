#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <string>
#include <vector>

namespace zkrv {

/**
 * XFieldElement - Extension Field Element
 *
 * Element of the degree-4 binomial extension of BabyBear.
 * Represented as a0 + a1*X + a2*X^2 + a3*X^3 where X^4 = 11.
 */
class XFieldElement {
public:
    static constexpr size_t EXTENSION_DEGREE = 4;

    // Non-residue W with X^4 = W
    static constexpr uint32_t W = 11U;

    // Constructors
    constexpr XFieldElement() : coeffs_{} {}

    constexpr XFieldElement(BFieldElement c0, BFieldElement c1, BFieldElement c2, BFieldElement c3)
        : coeffs_{c0, c1, c2, c3} {}

    // Construct from a base field element (embed as constant polynomial)
    constexpr explicit XFieldElement(BFieldElement base)
        : coeffs_{base, BFieldElement::zero(), BFieldElement::zero(), BFieldElement::zero()} {}

    static XFieldElement from_coefficients(const std::array<BFieldElement, EXTENSION_DEGREE>& c) {
        return XFieldElement(c[0], c[1], c[2], c[3]);
    }

    // Factory methods
    static constexpr XFieldElement zero() {
        return XFieldElement();
    }

    static constexpr XFieldElement one() {
        return XFieldElement(BFieldElement::one());
    }

    // The basis element X
    static constexpr XFieldElement x() {
        return XFieldElement(BFieldElement::zero(), BFieldElement::one(), BFieldElement::zero(), BFieldElement::zero());
    }

    // Accessors
    constexpr const std::array<BFieldElement, EXTENSION_DEGREE>& coefficients() const { return coeffs_; }
    constexpr BFieldElement coeff(size_t i) const { return coeffs_[i]; }

    // Arithmetic operations
    XFieldElement operator+(const XFieldElement& rhs) const;
    XFieldElement operator-(const XFieldElement& rhs) const;
    XFieldElement operator*(const XFieldElement& rhs) const;
    XFieldElement operator/(const XFieldElement& rhs) const;
    XFieldElement operator-() const;

    XFieldElement& operator+=(const XFieldElement& rhs);
    XFieldElement& operator-=(const XFieldElement& rhs);
    XFieldElement& operator*=(const XFieldElement& rhs);
    XFieldElement& operator/=(const XFieldElement& rhs);

    // Mixed arithmetic with BFieldElement
    XFieldElement operator+(const BFieldElement& rhs) const;
    XFieldElement operator-(const BFieldElement& rhs) const;
    XFieldElement operator*(const BFieldElement& rhs) const;
    XFieldElement& operator+=(const BFieldElement& rhs);
    XFieldElement& operator*=(const BFieldElement& rhs);

    // Comparison
    bool operator==(const XFieldElement& rhs) const { return coeffs_ == rhs.coeffs_; }
    bool operator!=(const XFieldElement& rhs) const { return coeffs_ != rhs.coeffs_; }

    // Field operations
    XFieldElement inverse() const;
    XFieldElement pow(uint64_t exp) const;
    XFieldElement square() const { return *this * *this; }
    bool is_zero() const;
    bool is_one() const;

    // True when the element lies in the base field
    bool is_base() const;

    // String representation
    std::string to_string() const;

    // Batch inversion for efficiency
    static std::vector<XFieldElement> batch_inversion(const std::vector<XFieldElement>& elements);

    friend std::ostream& operator<<(std::ostream& os, const XFieldElement& elem);
    friend XFieldElement operator+(const BFieldElement& lhs, const XFieldElement& rhs);
    friend XFieldElement operator-(const BFieldElement& lhs, const XFieldElement& rhs);
    friend XFieldElement operator*(const BFieldElement& lhs, const XFieldElement& rhs);

private:
    std::array<BFieldElement, EXTENSION_DEGREE> coeffs_;
};

// Type alias for convenience
using XFE = XFieldElement;

} // namespace zkrv
