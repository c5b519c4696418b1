#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <string>
#include <vector>

namespace zkrv {

/**
 * Digest - 8-element hash digest (Poseidon2 output)
 *
 * Used for Merkle roots, commitments and program identities.
 */
class Digest {
public:
    static constexpr size_t LEN = 8;

    // Constructors
    Digest() : elements_{} {}

    explicit Digest(const std::array<BFieldElement, LEN>& elements)
        : elements_(elements) {}

    // Factory methods
    static Digest zero() { return Digest(); }

    // Accessors
    const std::array<BFieldElement, LEN>& elements() const { return elements_; }
    BFieldElement operator[](size_t i) const { return elements_[i]; }
    BFieldElement& operator[](size_t i) { return elements_[i]; }

    // Convert to vector of BFieldElements
    std::vector<BFieldElement> to_b_field_elements() const {
        return std::vector<BFieldElement>(elements_.begin(), elements_.end());
    }

    // Comparison
    bool operator==(const Digest& rhs) const { return elements_ == rhs.elements_; }
    bool operator!=(const Digest& rhs) const { return !(*this == rhs); }
    bool operator<(const Digest& rhs) const;

    // Hex representation: 4 little-endian bytes per element
    std::string to_hex() const;
    static Digest from_hex(const std::string& hex);

    friend std::ostream& operator<<(std::ostream& os, const Digest& digest);

private:
    std::array<BFieldElement, LEN> elements_;
};

} // namespace zkrv
