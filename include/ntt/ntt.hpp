#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include "ntt/arithmetic_domain.hpp"
#include "table/matrix.hpp"
#include <vector>

namespace zkrv {

/**
 * Number Theoretic Transform (NTT) over BabyBear
 *
 * Used for:
 * - Interpolation: evaluations -> polynomial coefficients (inverse NTT)
 * - Evaluation: polynomial coefficients -> evaluations (forward NTT)
 *
 * Instantiated for BFieldElement and XFieldElement values; twiddles always
 * live in the base field.
 */
class NTT {
public:
    /**
     * Forward NTT: given coefficients [c0, ..., c_{n-1}] compute
     * [f(w^0), ..., f(w^{n-1})] for the primitive n-th root w.
     */
    template <typename F>
    static void forward(std::vector<F>& coeffs);

    /**
     * Inverse NTT: evaluations on the n-th roots of unity -> coefficients.
     */
    template <typename F>
    static void inverse(std::vector<F>& evals);

    template <typename F>
    static std::vector<F> interpolate(const std::vector<F>& column);

    /**
     * Interpolate evaluations given on the coset offset * <w>.
     */
    template <typename F>
    static std::vector<F> coset_interpolate(const std::vector<F>& evals, BFieldElement offset);

    /**
     * Evaluate polynomial on the coset offset * <w> of size domain_length.
     * Coefficients beyond domain_length must be zero.
     */
    template <typename F>
    static std::vector<F> evaluate_on_coset(
        const std::vector<F>& coeffs,
        size_t domain_length,
        BFieldElement offset
    );

private:
    template <typename F>
    static void bit_reverse_permutation(std::vector<F>& data);

    template <typename F>
    static void ntt_core(std::vector<F>& data, BFieldElement omega);
};

/**
 * Low-Degree Extension of trace matrices
 *
 * Interpolates each column over the trace subgroup H and evaluates it on
 * the coset shift * H' with |H'| = |H| * 2^log_blowup, natural order.
 */
class LDE {
public:
    static std::vector<BFieldElement> extend_column(
        const std::vector<BFieldElement>& trace_column,
        size_t log_blowup,
        BFieldElement shift
    );

    static RowMajorMatrix<BFieldElement> extend_matrix(
        const RowMajorMatrix<BFieldElement>& trace,
        size_t log_blowup,
        BFieldElement shift
    );
};

} // namespace zkrv
