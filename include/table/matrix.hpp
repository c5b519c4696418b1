#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace zkrv {

/**
 * RowMajorMatrix - dense row-major table of field elements
 *
 * The storage shape for every trace partition, LDE and quotient chunk.
 */
template <typename F>
class RowMajorMatrix {
public:
    RowMajorMatrix() = default;

    RowMajorMatrix(size_t width, size_t height)
        : width_(width), height_(height), values_(width * height, F::zero()) {}

    RowMajorMatrix(std::vector<F> values, size_t width)
        : width_(width), height_(width == 0 ? 0 : values.size() / width), values_(std::move(values)) {
        if (width_ != 0 && values_.size() % width_ != 0) {
            throw std::invalid_argument("Matrix values not a multiple of width " + std::to_string(width_));
        }
    }

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    bool empty() const { return height_ == 0 || width_ == 0; }

    const F* row(size_t r) const { return values_.data() + r * width_; }
    F* row_mut(size_t r) { return values_.data() + r * width_; }

    std::vector<F> row_vec(size_t r) const {
        return std::vector<F>(row(r), row(r) + width_);
    }

    F get(size_t r, size_t c) const { return values_[r * width_ + c]; }
    void set(size_t r, size_t c, F value) { values_[r * width_ + c] = value; }

    F& at(size_t r, size_t c) {
        if (r >= height_ || c >= width_) {
            throw std::out_of_range("Matrix index (" + std::to_string(r) + ", " +
                                    std::to_string(c) + ") out of range");
        }
        return values_[r * width_ + c];
    }

    std::vector<F> column(size_t c) const {
        std::vector<F> out(height_);
        for (size_t r = 0; r < height_; ++r) {
            out[r] = values_[r * width_ + c];
        }
        return out;
    }

    // Append zero rows until the height is new_height
    void pad_to_height(size_t new_height) {
        if (new_height < height_) {
            throw std::invalid_argument("Cannot shrink matrix by padding");
        }
        values_.resize(new_height * width_, F::zero());
        height_ = new_height;
    }

    const std::vector<F>& values() const { return values_; }
    std::vector<F>& values() { return values_; }

private:
    size_t width_ = 0;
    size_t height_ = 0;
    std::vector<F> values_;
};

// Expand extension-field columns into 4 base columns each
inline RowMajorMatrix<BFieldElement> flatten_to_base(const RowMajorMatrix<XFieldElement>& m) {
    RowMajorMatrix<BFieldElement> out(m.width() * XFieldElement::EXTENSION_DEGREE, m.height());
    for (size_t r = 0; r < m.height(); ++r) {
        for (size_t c = 0; c < m.width(); ++c) {
            const XFieldElement value = m.get(r, c);
            for (size_t k = 0; k < XFieldElement::EXTENSION_DEGREE; ++k) {
                out.set(r, c * XFieldElement::EXTENSION_DEGREE + k, value.coeff(k));
            }
        }
    }
    return out;
}

} // namespace zkrv
