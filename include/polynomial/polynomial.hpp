#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <vector>
#include <algorithm>

namespace zkrv {

/**
 * Dense univariate polynomial p(x) = c0 + c1 x + ... + c_{n-1} x^{n-1}
 *
 * Used for the FRI final polynomial and for opening evaluations.
 */
template <typename Field>
class Polynomial {
public:
    Polynomial() = default;
    explicit Polynomial(std::vector<Field> coefficients) : coeffs_(std::move(coefficients)) {}

    const std::vector<Field>& coefficients() const { return coeffs_; }

    // Degree of the highest non-zero coefficient; -1 for the zero polynomial
    long degree() const {
        for (size_t i = coeffs_.size(); i-- > 0;) {
            if (!coeffs_[i].is_zero()) {
                return static_cast<long>(i);
            }
        }
        return -1;
    }

    void truncate_trailing_zeros() {
        while (!coeffs_.empty() && coeffs_.back().is_zero()) {
            coeffs_.pop_back();
        }
    }

    // Horner evaluation; the point may live in an extension of Field
    template <typename Point>
    Point evaluate(const Point& x) const {
        Point result = Point::zero();
        for (size_t i = coeffs_.size(); i-- > 0;) {
            result = result * x + coeffs_[i];
        }
        return result;
    }

    Polynomial operator+(const Polynomial& other) const {
        std::vector<Field> out(std::max(coeffs_.size(), other.coeffs_.size()), Field::zero());
        for (size_t i = 0; i < coeffs_.size(); ++i) out[i] += coeffs_[i];
        for (size_t i = 0; i < other.coeffs_.size(); ++i) out[i] += other.coeffs_[i];
        return Polynomial(std::move(out));
    }

    Polynomial operator-(const Polynomial& other) const {
        std::vector<Field> out(std::max(coeffs_.size(), other.coeffs_.size()), Field::zero());
        for (size_t i = 0; i < coeffs_.size(); ++i) out[i] += coeffs_[i];
        for (size_t i = 0; i < other.coeffs_.size(); ++i) out[i] -= other.coeffs_[i];
        return Polynomial(std::move(out));
    }

    Polynomial operator*(const Polynomial& other) const {
        if (coeffs_.empty() || other.coeffs_.empty()) {
            return Polynomial();
        }
        std::vector<Field> out(coeffs_.size() + other.coeffs_.size() - 1, Field::zero());
        for (size_t i = 0; i < coeffs_.size(); ++i) {
            for (size_t j = 0; j < other.coeffs_.size(); ++j) {
                out[i + j] += coeffs_[i] * other.coeffs_[j];
            }
        }
        return Polynomial(std::move(out));
    }

    Polynomial scale(const Field& s) const {
        std::vector<Field> out(coeffs_);
        for (auto& c : out) c *= s;
        return Polynomial(std::move(out));
    }

    /**
     * Synthetic division by (x - z). Returns the quotient; the remainder
     * p(z) is written to *remainder when requested.
     */
    Polynomial divide_by_linear(const Field& z, Field* remainder = nullptr) const {
        if (coeffs_.empty()) {
            if (remainder) *remainder = Field::zero();
            return Polynomial();
        }
        std::vector<Field> q(coeffs_.size() - 1, Field::zero());
        Field carry = Field::zero();
        for (size_t i = coeffs_.size(); i-- > 0;) {
            Field cur = coeffs_[i] + carry * z;
            if (i > 0) {
                q[i - 1] = cur;
            } else if (remainder) {
                *remainder = cur;
            }
            carry = cur;
        }
        return Polynomial(std::move(q));
    }

private:
    std::vector<Field> coeffs_;
};

using BPolynomial = Polynomial<BFieldElement>;
using XPolynomial = Polynomial<XFieldElement>;

} // namespace zkrv
