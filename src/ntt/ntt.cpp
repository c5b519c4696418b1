#include "ntt/ntt.hpp"
#include <stdexcept>
#include <omp.h>

namespace zkrv {

template <typename F>
void NTT::bit_reverse_permutation(std::vector<F>& data) {
    size_t n = data.size();
    size_t log_n = log2_strict(n);

    for (size_t i = 0; i < n; i++) {
        size_t rev = 0;
        for (size_t j = 0; j < log_n; j++) {
            if (i & (size_t{1} << j)) {
                rev |= (size_t{1} << (log_n - 1 - j));
            }
        }
        if (i < rev) {
            std::swap(data[i], data[rev]);
        }
    }
}

template <typename F>
void NTT::ntt_core(std::vector<F>& data, BFieldElement omega) {
    size_t n = data.size();

    bit_reverse_permutation(data);

    // Iterative Cooley-Tukey
    for (size_t len = 2; len <= n; len *= 2) {
        BFieldElement omega_len = omega.pow(n / len);
        std::vector<BFieldElement> twiddles(len / 2);
        BFieldElement w = BFieldElement::one();
        for (size_t j = 0; j < len / 2; j++) {
            twiddles[j] = w;
            w *= omega_len;
        }

        for (size_t i = 0; i < n; i += len) {
            for (size_t j = 0; j < len / 2; j++) {
                F u = data[i + j];
                F v = data[i + j + len / 2] * twiddles[j];
                data[i + j] = u + v;
                data[i + j + len / 2] = u - v;
            }
        }
    }
}

template <typename F>
void NTT::forward(std::vector<F>& coeffs) {
    size_t n = coeffs.size();
    size_t log_n = log2_strict(n);
    ntt_core(coeffs, BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log_n)));
}

template <typename F>
void NTT::inverse(std::vector<F>& evals) {
    size_t n = evals.size();
    size_t log_n = log2_strict(n);
    BFieldElement omega = BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log_n));
    ntt_core(evals, omega.inverse());

    BFieldElement n_inv = BFieldElement(n).inverse();
    for (auto& v : evals) {
        v = v * n_inv;
    }
}

template <typename F>
std::vector<F> NTT::interpolate(const std::vector<F>& column) {
    std::vector<F> coeffs = column;
    inverse(coeffs);
    return coeffs;
}

template <typename F>
std::vector<F> NTT::coset_interpolate(const std::vector<F>& evals, BFieldElement offset) {
    std::vector<F> coeffs = interpolate(evals);
    // f(offset * x) has coefficients c_i * offset^i
    BFieldElement inv = offset.inverse();
    BFieldElement scale = BFieldElement::one();
    for (auto& c : coeffs) {
        c = c * scale;
        scale *= inv;
    }
    return coeffs;
}

template <typename F>
std::vector<F> NTT::evaluate_on_coset(
    const std::vector<F>& coeffs,
    size_t domain_length,
    BFieldElement offset
) {
    if (coeffs.size() > domain_length) {
        for (size_t i = domain_length; i < coeffs.size(); ++i) {
            if (!coeffs[i].is_zero()) {
                throw std::invalid_argument("Polynomial degree exceeds evaluation domain");
            }
        }
    }

    std::vector<F> extended(domain_length, F::zero());
    BFieldElement scale = BFieldElement::one();
    for (size_t i = 0; i < coeffs.size() && i < domain_length; i++) {
        extended[i] = coeffs[i] * scale;
        scale *= offset;
    }

    forward(extended);
    return extended;
}

template void NTT::forward<BFieldElement>(std::vector<BFieldElement>&);
template void NTT::forward<XFieldElement>(std::vector<XFieldElement>&);
template void NTT::inverse<BFieldElement>(std::vector<BFieldElement>&);
template void NTT::inverse<XFieldElement>(std::vector<XFieldElement>&);
template std::vector<BFieldElement> NTT::interpolate<BFieldElement>(const std::vector<BFieldElement>&);
template std::vector<XFieldElement> NTT::interpolate<XFieldElement>(const std::vector<XFieldElement>&);
template std::vector<BFieldElement> NTT::coset_interpolate<BFieldElement>(const std::vector<BFieldElement>&, BFieldElement);
template std::vector<XFieldElement> NTT::coset_interpolate<XFieldElement>(const std::vector<XFieldElement>&, BFieldElement);
template std::vector<BFieldElement> NTT::evaluate_on_coset<BFieldElement>(const std::vector<BFieldElement>&, size_t, BFieldElement);
template std::vector<XFieldElement> NTT::evaluate_on_coset<XFieldElement>(const std::vector<XFieldElement>&, size_t, BFieldElement);

// LDE Implementation

std::vector<BFieldElement> LDE::extend_column(
    const std::vector<BFieldElement>& trace_column,
    size_t log_blowup,
    BFieldElement shift
) {
    std::vector<BFieldElement> coeffs = NTT::interpolate(trace_column);
    return NTT::evaluate_on_coset(coeffs, trace_column.size() << log_blowup, shift);
}

RowMajorMatrix<BFieldElement> LDE::extend_matrix(
    const RowMajorMatrix<BFieldElement>& trace,
    size_t log_blowup,
    BFieldElement shift
) {
    const size_t width = trace.width();
    const size_t lde_height = trace.height() << log_blowup;
    RowMajorMatrix<BFieldElement> lde(width, lde_height);

    #pragma omp parallel for schedule(dynamic)
    for (size_t c = 0; c < width; c++) {
        std::vector<BFieldElement> column = trace.column(c);
        std::vector<BFieldElement> extended = extend_column(column, log_blowup, shift);
        for (size_t r = 0; r < lde_height; r++) {
            lde.set(r, c, extended[r]);
        }
    }

    return lde;
}

} // namespace zkrv
