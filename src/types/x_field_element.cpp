#include "types/x_field_element.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>

namespace zkrv {

XFieldElement XFieldElement::operator+(const XFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] + rhs.coeffs_[0],
        coeffs_[1] + rhs.coeffs_[1],
        coeffs_[2] + rhs.coeffs_[2],
        coeffs_[3] + rhs.coeffs_[3]
    );
}

XFieldElement XFieldElement::operator-(const XFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] - rhs.coeffs_[0],
        coeffs_[1] - rhs.coeffs_[1],
        coeffs_[2] - rhs.coeffs_[2],
        coeffs_[3] - rhs.coeffs_[3]
    );
}

XFieldElement XFieldElement::operator*(const XFieldElement& rhs) const {
    // Schoolbook product reduced with X^4 = W
    const auto& a = coeffs_;
    const auto& b = rhs.coeffs_;
    const BFieldElement w(W);

    BFieldElement c0 = a[0] * b[0] + w * (a[1] * b[3] + a[2] * b[2] + a[3] * b[1]);
    BFieldElement c1 = a[0] * b[1] + a[1] * b[0] + w * (a[2] * b[3] + a[3] * b[2]);
    BFieldElement c2 = a[0] * b[2] + a[1] * b[1] + a[2] * b[0] + w * (a[3] * b[3]);
    BFieldElement c3 = a[0] * b[3] + a[1] * b[2] + a[2] * b[1] + a[3] * b[0];

    return XFieldElement(c0, c1, c2, c3);
}

XFieldElement XFieldElement::operator-() const {
    return XFieldElement(-coeffs_[0], -coeffs_[1], -coeffs_[2], -coeffs_[3]);
}

XFieldElement& XFieldElement::operator+=(const XFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

XFieldElement& XFieldElement::operator-=(const XFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

XFieldElement& XFieldElement::operator*=(const XFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

XFieldElement& XFieldElement::operator/=(const XFieldElement& rhs) {
    *this = *this / rhs;
    return *this;
}

XFieldElement XFieldElement::operator+(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] + rhs, coeffs_[1], coeffs_[2], coeffs_[3]);
}

XFieldElement XFieldElement::operator-(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] - rhs, coeffs_[1], coeffs_[2], coeffs_[3]);
}

XFieldElement XFieldElement::operator*(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] * rhs, coeffs_[1] * rhs, coeffs_[2] * rhs, coeffs_[3] * rhs);
}

XFieldElement& XFieldElement::operator+=(const BFieldElement& rhs) {
    coeffs_[0] += rhs;
    return *this;
}

XFieldElement& XFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

XFieldElement operator+(const BFieldElement& lhs, const XFieldElement& rhs) {
    return rhs + lhs;
}

XFieldElement operator-(const BFieldElement& lhs, const XFieldElement& rhs) {
    return XFieldElement(lhs) - rhs;
}

XFieldElement operator*(const BFieldElement& lhs, const XFieldElement& rhs) {
    return rhs * lhs;
}

bool XFieldElement::is_zero() const {
    return coeffs_[0].is_zero() && coeffs_[1].is_zero() && coeffs_[2].is_zero() && coeffs_[3].is_zero();
}

bool XFieldElement::is_one() const {
    return coeffs_[0].is_one() && is_base();
}

bool XFieldElement::is_base() const {
    return coeffs_[1].is_zero() && coeffs_[2].is_zero() && coeffs_[3].is_zero();
}

XFieldElement XFieldElement::pow(uint64_t exp) const {
    XFieldElement result = XFieldElement::one();
    XFieldElement base = *this;
    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }
    return result;
}

XFieldElement XFieldElement::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }

    // Split a = e(Y) + X*o(Y) with Y = X^2, Y^2 = W. Then
    // a * (e - X*o) = e^2 - Y*o^2 =: n0 + n1*Y, whose norm n0^2 - W*n1^2 lies in F.
    const auto& a = coeffs_;
    const BFieldElement w(W);
    const BFieldElement two = BFieldElement::two();

    BFieldElement n0 = a[0] * a[0] + w * a[2] * a[2] - two * w * a[1] * a[3];
    BFieldElement n1 = two * a[0] * a[2] - a[1] * a[1] - w * a[3] * a[3];
    BFieldElement norm = n0 * n0 - w * n1 * n1;
    BFieldElement norm_inv = norm.inverse();

    BFieldElement m0 = n0 * norm_inv;
    BFieldElement m1 = -n1 * norm_inv;

    return XFieldElement(
        a[0] * m0 + w * a[2] * m1,
        -(a[1] * m0 + w * a[3] * m1),
        a[0] * m1 + a[2] * m0,
        -(a[1] * m1 + a[3] * m0)
    );
}

XFieldElement XFieldElement::operator/(const XFieldElement& rhs) const {
    return *this * rhs.inverse();
}

std::vector<XFieldElement> XFieldElement::batch_inversion(const std::vector<XFieldElement>& elements) {
    if (elements.empty()) {
        return {};
    }
    std::vector<XFieldElement> prefix(elements.size());
    XFieldElement acc = XFieldElement::one();
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].is_zero()) {
            throw std::domain_error("Cannot invert zero");
        }
        prefix[i] = acc;
        acc *= elements[i];
    }
    XFieldElement inv = acc.inverse();
    std::vector<XFieldElement> result(elements.size());
    for (size_t i = elements.size(); i-- > 0;) {
        result[i] = inv * prefix[i];
        inv *= elements[i];
    }
    return result;
}

std::string XFieldElement::to_string() const {
    std::ostringstream oss;
    oss << "(" << coeffs_[0] << ", " << coeffs_[1] << ", " << coeffs_[2] << ", " << coeffs_[3] << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const XFieldElement& elem) {
    return os << elem.to_string();
}

} // namespace zkrv
