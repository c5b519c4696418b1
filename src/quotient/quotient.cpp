#include "quotient/quotient.hpp"
#include "air/symbolic_dag.hpp"
#include "common/debug_control.hpp"
#include "fri/fri.hpp"
#include "ntt/arithmetic_domain.hpp"
#include "ntt/ntt.hpp"
#include <algorithm>
#include <chrono>
#include <omp.h>
#include <stdexcept>

#ifdef ZKRV_USE_TBB
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#endif

namespace zkrv {

namespace {

constexpr size_t D = XFieldElement::EXTENSION_DEGREE;

/**
 * Reads variables for quotient-domain point k from the LDE rows
 * k * stride (local) and k * stride + blowup (next).
 */
class LdeRowSource : public VariableSource<BFieldElement> {
public:
    LdeRowSource(const QuotientInputs& inputs, size_t stride, size_t blowup,
                 const std::vector<BFieldElement>& is_first, const std::vector<BFieldElement>& is_last,
                 const std::vector<BFieldElement>& is_transition)
        : inputs_(inputs), stride_(stride), blowup_(blowup),
          is_first_(is_first), is_last_(is_last), is_transition_(is_transition) {
        lde_height_ = inputs.mains.back()->lde.height();
    }

    void set_point(size_t k) { k_ = k; }

    BFieldElement base(const SymbolicVariable& var) const override {
        switch (var.entry) {
            case Entry::Preprocessed: return inputs_.preprocessed->lde.get(row_of(var), var.index);
            case Entry::Main: return inputs_.mains[var.part_index]->lde.get(row_of(var), var.index);
            case Entry::Public: return inputs_.public_values[var.index];
            default: break;
        }
        throw std::logic_error("extension variable read as base value");
    }

    XFieldElement extension(const SymbolicVariable& var) const override {
        switch (var.entry) {
            case Entry::Permutation: {
                const BFieldElement* row = inputs_.permutation->lde.row(row_of(var)) + var.index * D;
                return XFieldElement(row[0], row[1], row[2], row[3]);
            }
            case Entry::Challenge: return inputs_.challenges.at(var.index);
            case Entry::Exposed: return inputs_.exposed_values.at(var.index);
            default: break;
        }
        throw std::logic_error("base variable read as extension value");
    }

    BFieldElement is_first_row() const override { return is_first_[k_]; }
    BFieldElement is_last_row() const override { return is_last_[k_]; }
    BFieldElement is_transition() const override { return is_transition_[k_]; }

private:
    const QuotientInputs& inputs_;
    size_t stride_;
    size_t blowup_;
    const std::vector<BFieldElement>& is_first_;
    const std::vector<BFieldElement>& is_last_;
    const std::vector<BFieldElement>& is_transition_;
    size_t lde_height_ = 0;
    size_t k_ = 0;

    size_t row_of(const SymbolicVariable& var) const {
        return (k_ * stride_ + var.offset * blowup_) & (lde_height_ - 1);
    }
};

} // namespace

RowMajorMatrix<BFieldElement> Quotient::compute_quotient_chunks(const QuotientInputs& inputs,
                                                                const XFieldElement& alpha,
                                                                size_t log_blowup) {
    auto t0 = std::chrono::high_resolution_clock::now();
    const StarkVerifyingKey& vk = *inputs.vk;
    const size_t n = size_t{1} << inputs.log_height;
    const size_t blowup = size_t{1} << log_blowup;
    const size_t qd = vk.quotient_degree;
    if (qd > blowup) {
        throw std::logic_error("quotient degree exceeds blowup for " + vk.air_name);
    }
    const size_t stride = blowup / qd;
    const size_t qn = qd * n;

    // Selectors and 1 / Z_H on g * H_{qd n}
    const ArithmeticDomain quotient_domain = ArithmeticDomain::of_length(qn).with_offset(Fri::shift());
    const std::vector<BFieldElement> xs = quotient_domain.values();
    const BFieldElement omega_inv = BFieldElement::primitive_root_of_unity(
        static_cast<uint32_t>(inputs.log_height)).inverse();
    std::vector<BFieldElement> zh(qn), x_minus_one(qn), x_minus_last(qn);
    for (size_t k = 0; k < qn; ++k) {
        zh[k] = xs[k].pow(n) - BFieldElement::one();
        x_minus_one[k] = xs[k] - BFieldElement::one();
        x_minus_last[k] = xs[k] - omega_inv;
    }
    std::vector<BFieldElement> inv_zh = BFieldElement::batch_inversion(zh);
    std::vector<BFieldElement> inv_first = BFieldElement::batch_inversion(x_minus_one);
    std::vector<BFieldElement> inv_last = BFieldElement::batch_inversion(x_minus_last);
    std::vector<BFieldElement> is_first(qn), is_last(qn);
    for (size_t k = 0; k < qn; ++k) {
        is_first[k] = zh[k] * inv_first[k];
        is_last[k] = zh[k] * inv_last[k];
    }

    std::vector<XFieldElement> q_values(qn);
    auto eval_range = [&](size_t begin, size_t end) {
        DagEvaluator<BFieldElement> evaluator(vk.constraints);
        LdeRowSource source(inputs, stride, blowup, is_first, is_last, x_minus_last);
        for (size_t k = begin; k < end; ++k) {
            source.set_point(k);
            evaluator.evaluate(source);
            q_values[k] = evaluator.fold_roots(alpha) * inv_zh[k];
        }
    };

#ifdef ZKRV_USE_TBB
    tbb::parallel_for(tbb::blocked_range<size_t>(0, qn, 256), [&](const tbb::blocked_range<size_t>& r) {
        eval_range(r.begin(), r.end());
    });
#else
    #pragma omp parallel
    {
        const size_t threads = static_cast<size_t>(omp_get_num_threads());
        const size_t tid = static_cast<size_t>(omp_get_thread_num());
        const size_t per = (qn + threads - 1) / threads;
        eval_range(std::min(qn, tid * per), std::min(qn, (tid + 1) * per));
    }
#endif

    std::vector<XFieldElement> coeffs = NTT::coset_interpolate(q_values, Fri::shift());

    RowMajorMatrix<BFieldElement> chunks(D * qd, n);
    for (size_t i = 0; i < qd; ++i) {
        std::vector<XFieldElement> chunk(coeffs.begin() + static_cast<std::ptrdiff_t>(i * n),
                                         coeffs.begin() + static_cast<std::ptrdiff_t>((i + 1) * n));
        NTT::forward(chunk);
        for (size_t row = 0; row < n; ++row) {
            for (size_t k = 0; k < D; ++k) {
                chunks.set(row, i * D + k, chunk[row].coeff(k));
            }
        }
    }

    ZKRV_IF_PROFILE {
        auto ms = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - t0).count();
        printf("  [quotient] %s: %zu points, degree %zu, %.2f ms\n", vk.air_name.c_str(), qn, qd, ms);
    }
    return chunks;
}

XFieldElement Quotient::recompose(const std::vector<XFieldElement>& opened_chunk_columns,
                                  const XFieldElement& zeta, size_t log_height) {
    if (opened_chunk_columns.size() % D != 0) {
        throw std::invalid_argument("quotient columns not a multiple of the extension degree");
    }
    const size_t qd = opened_chunk_columns.size() / D;
    const XFieldElement zeta_n = zeta.pow(size_t{1} << log_height);
    XFieldElement acc = XFieldElement::zero();
    XFieldElement power = XFieldElement::one();
    for (size_t i = 0; i < qd; ++i) {
        acc += power * recompose_extension(&opened_chunk_columns[i * D]);
        power *= zeta_n;
    }
    return acc;
}

XFieldElement Quotient::recompose_extension(const XFieldElement* base_columns) {
    XFieldElement acc = XFieldElement::zero();
    XFieldElement basis = XFieldElement::one();
    for (size_t k = 0; k < D; ++k) {
        acc += basis * base_columns[k];
        basis *= XFieldElement::x();
    }
    return acc;
}

} // namespace zkrv
