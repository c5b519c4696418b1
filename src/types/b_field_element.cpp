#include "types/b_field_element.hpp"
#include <sstream>
#include <stdexcept>

namespace zkrv {

BFieldElement BFieldElement::from_i64(int64_t value) {
    int64_t r = value % static_cast<int64_t>(MODULUS);
    if (r < 0) {
        r += MODULUS;
    }
    return BFieldElement(static_cast<uint64_t>(r));
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    // Both operands are < 2^31 so the sum fits in 32 bits
    uint32_t sum = value_ + rhs.value_;
    if (sum >= MODULUS) {
        sum -= MODULUS;
    }
    BFieldElement r;
    r.value_ = sum;
    return r;
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    uint32_t diff = value_ - rhs.value_;
    if (value_ < rhs.value_) {
        diff += MODULUS;
    }
    BFieldElement r;
    r.value_ = diff;
    return r;
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    uint64_t product = static_cast<uint64_t>(value_) * static_cast<uint64_t>(rhs.value_);
    BFieldElement r;
    r.value_ = static_cast<uint32_t>(product % MODULUS);
    return r;
}

BFieldElement BFieldElement::operator-() const {
    if (value_ == 0) return *this;
    BFieldElement r;
    r.value_ = MODULUS - value_;
    return r;
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

BFieldElement& BFieldElement::operator/=(const BFieldElement& rhs) {
    *this = *this / rhs;
    return *this;
}

BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement result = BFieldElement::one();
    BFieldElement base = *this;

    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }

    return result;
}

BFieldElement BFieldElement::halve() const {
    // (p + 1) / 2 is the inverse of two
    uint32_t v = value_;
    BFieldElement r;
    r.value_ = (v & 1U) ? static_cast<uint32_t>((static_cast<uint64_t>(v) + MODULUS) >> 1) : (v >> 1);
    return r;
}

BFieldElement BFieldElement::inverse() const {
    if (value_ == 0) {
        throw std::domain_error("Cannot invert zero");
    }

    // Fermat's little theorem: a^(-1) = a^(p-2) mod p
    return pow(MODULUS - 2);
}

BFieldElement BFieldElement::operator/(const BFieldElement& rhs) const {
    return *this * rhs.inverse();
}

std::vector<BFieldElement> BFieldElement::batch_inversion(const std::vector<BFieldElement>& elements) {
    if (elements.empty()) {
        return {};
    }

    // Montgomery's trick: one inversion plus 3(n-1) multiplications
    std::vector<BFieldElement> prefix(elements.size());
    BFieldElement acc = BFieldElement::one();
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].is_zero()) {
            throw std::domain_error("Cannot invert zero");
        }
        prefix[i] = acc;
        acc *= elements[i];
    }

    BFieldElement inv = acc.inverse();
    std::vector<BFieldElement> result(elements.size());
    for (size_t i = elements.size(); i-- > 0;) {
        result[i] = inv * prefix[i];
        inv *= elements[i];
    }
    return result;
}

BFieldElement BFieldElement::primitive_root_of_unity(uint32_t log2_order) {
    if (log2_order > TWO_ADICITY) {
        throw std::invalid_argument("No primitive root of unity of order 2^" +
                                    std::to_string(log2_order) + " in BabyBear");
    }
    // g^((p-1) / 2^k) has exact order 2^k since g generates the whole group
    uint64_t exponent = (static_cast<uint64_t>(MODULUS) - 1) >> log2_order;
    return generator().pow(exponent);
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace zkrv
