#pragma once

#include <cstdint>
#include <string>
#include <ostream>
#include <array>
#include <vector>

namespace zkrv {

/**
 * BFieldElement - Base Field Element
 *
 * Element of the BabyBear prime field with modulus p = 15 * 2^27 + 1.
 * Values are kept in canonical form [0, p).
 */
class BFieldElement {
public:
    // The BabyBear prime: 2^31 - 2^27 + 1
    static constexpr uint32_t MODULUS = 2013265921U;

    // Generator of the multiplicative group
    static constexpr uint32_t GENERATOR = 31U;

    // p - 1 = 2^27 * 15
    static constexpr uint32_t TWO_ADICITY = 27U;

    // Number of bits needed to hold any canonical value
    static constexpr uint32_t BITS = 31U;

    // Constructors
    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(static_cast<uint32_t>(value % MODULUS)) {}

    // Signed embedding: -1 maps to p - 1
    static BFieldElement from_i64(int64_t value);

    // Factory methods
    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }
    static constexpr BFieldElement two() { return BFieldElement(2); }
    static constexpr BFieldElement generator() { return BFieldElement(GENERATOR); }

    // Accessors
    constexpr uint32_t value() const { return value_; }

    // Arithmetic operations
    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;
    BFieldElement operator/(const BFieldElement& rhs) const;
    BFieldElement operator-() const;

    BFieldElement& operator+=(const BFieldElement& rhs);
    BFieldElement& operator-=(const BFieldElement& rhs);
    BFieldElement& operator*=(const BFieldElement& rhs);
    BFieldElement& operator/=(const BFieldElement& rhs);

    // Comparison
    bool operator==(const BFieldElement& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const BFieldElement& rhs) const { return value_ != rhs.value_; }
    bool operator<(const BFieldElement& rhs) const { return value_ < rhs.value_; }

    // Field operations
    BFieldElement inverse() const;
    BFieldElement pow(uint64_t exp) const;
    BFieldElement square() const { return *this * *this; }
    BFieldElement halve() const;
    bool is_zero() const { return value_ == 0; }
    bool is_one() const { return value_ == 1; }

    static std::vector<BFieldElement> batch_inversion(const std::vector<BFieldElement>& elements);

    // Primitive root of unity for NTT
    static BFieldElement primitive_root_of_unity(uint32_t log2_order);

    // String representation
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint32_t value_;
};

// Type alias for convenience
using BFE = BFieldElement;

} // namespace zkrv
