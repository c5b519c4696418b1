#include "air/logup.hpp"
#include "stark/errors.hpp"
#include <algorithm>
#include <omp.h>

namespace zkrv {
namespace logup {

namespace {

SymbolicExpression challenge(uint32_t index) {
    SymbolicVariable var;
    var.entry = Entry::Challenge;
    var.index = index;
    return SymbolicExpression::variable(var);
}

SymbolicExpression permutation(uint32_t column, uint32_t offset) {
    SymbolicVariable var;
    var.entry = Entry::Permutation;
    var.index = column;
    var.offset = offset;
    return SymbolicExpression::variable(var);
}

SymbolicExpression exposed(uint32_t index) {
    SymbolicVariable var;
    var.entry = Entry::Exposed;
    var.index = index;
    return SymbolicExpression::variable(var);
}

size_t fields_degree(const SymbolicInteraction& interaction) {
    size_t degree = 0;
    for (const auto& f : interaction.fields) {
        degree = std::max(degree, f.degree_multiple());
    }
    return degree;
}

} // namespace

SymbolicExpression denominator(const SymbolicInteraction& interaction) {
    SymbolicExpression beta = challenge(CHALLENGE_BETA);
    SymbolicExpression acc = challenge(CHALLENGE_ALPHA) + static_cast<int64_t>(interaction.bus + 1);
    SymbolicExpression beta_power = beta;
    for (const auto& field : interaction.fields) {
        acc += beta_power * field;
        beta_power *= beta;
    }
    return acc;
}

SymbolicExpression signed_count(const SymbolicInteraction& interaction) {
    return interaction.type == InteractionType::Send ? interaction.count : -interaction.count;
}

size_t chunk_degree(const std::vector<SymbolicInteraction>& interactions, const std::vector<size_t>& members) {
    size_t denominators = 0;
    for (size_t i : members) {
        denominators += fields_degree(interactions[i]);
    }
    // phi * prod(d) has degree 1 + sum(deg d)
    size_t degree = 1 + denominators;
    for (size_t k : members) {
        size_t term = interactions[k].count.degree_multiple() + denominators - fields_degree(interactions[k]);
        degree = std::max(degree, term);
    }
    return degree;
}

InteractionChunks partition(const std::vector<SymbolicInteraction>& interactions, size_t max_degree,
                            const std::string& air_name) {
    InteractionChunks result;
    std::vector<size_t> current;
    for (size_t i = 0; i < interactions.size(); ++i) {
        if (chunk_degree(interactions, {i}) > max_degree) {
            throw KeygenError(KeygenErrorKind::DegreeTooHigh, air_name,
                              "interaction " + std::to_string(i) + " on bus " +
                                  std::to_string(interactions[i].bus) + " exceeds degree " +
                                  std::to_string(max_degree));
        }
        std::vector<size_t> candidate = current;
        candidate.push_back(i);
        if (chunk_degree(interactions, candidate) <= max_degree) {
            current = std::move(candidate);
        } else {
            result.chunks.push_back(std::move(current));
            current = {i};
        }
    }
    if (!current.empty()) {
        result.chunks.push_back(std::move(current));
    }
    return result;
}

void append_constraints(const std::vector<SymbolicInteraction>& interactions, const InteractionChunks& chunks,
                        std::vector<SymbolicExpression>& constraints) {
    if (chunks.chunks.empty()) {
        return;
    }
    std::vector<SymbolicExpression> denominators;
    denominators.reserve(interactions.size());
    for (const auto& interaction : interactions) {
        denominators.push_back(denominator(interaction));
    }

    std::vector<SymbolicExpression> phi_local;
    std::vector<SymbolicExpression> phi_next;
    for (size_t c = 0; c < chunks.chunks.size(); ++c) {
        const auto& members = chunks.chunks[c];
        SymbolicExpression phi = permutation(static_cast<uint32_t>(c), 0);
        phi_local.push_back(phi);
        phi_next.push_back(permutation(static_cast<uint32_t>(c), 1));

        // phi * prod(d) - sum_k count_k * prod_{l != k} d_l
        SymbolicExpression product = SymbolicExpression::from_u64(1);
        for (size_t i : members) {
            product *= denominators[i];
        }
        SymbolicExpression numerator;
        for (size_t k : members) {
            SymbolicExpression term = signed_count(interactions[k]);
            for (size_t l : members) {
                if (l != k) {
                    term *= denominators[l];
                }
            }
            numerator += term;
        }
        constraints.push_back(phi * product - numerator);
    }

    auto acc_col = static_cast<uint32_t>(chunks.running_sum_column());
    SymbolicExpression acc = permutation(acc_col, 0);
    SymbolicExpression acc_next = permutation(acc_col, 1);
    constraints.push_back(SymbolicExpression::is_first_row() * (acc - sum_of(phi_local)));
    constraints.push_back(SymbolicExpression::is_transition() * (acc_next - acc - sum_of(phi_next)));
    constraints.push_back(SymbolicExpression::is_last_row() * (acc - exposed(EXPOSED_CUMULATIVE_SUM)));
}

std::vector<SymbolicExpression> interaction_roots(const std::vector<SymbolicInteraction>& interactions) {
    std::vector<SymbolicExpression> roots;
    for (const auto& interaction : interactions) {
        roots.insert(roots.end(), interaction.fields.begin(), interaction.fields.end());
        roots.push_back(interaction.count);
    }
    return roots;
}

PermutationTrace generate_trace(const std::vector<SymbolicInteraction>& interactions,
                                const InteractionChunks& chunks,
                                const SymbolicDag& interaction_dag,
                                const RowMajorMatrix<BFieldElement>* preprocessed,
                                const std::vector<const RowMajorMatrix<BFieldElement>*>& mains,
                                const std::vector<BFieldElement>& public_values,
                                const XFieldElement& alpha, const XFieldElement& beta) {
    PermutationTrace out;
    const size_t width = chunks.num_columns();
    if (width == 0) {
        out.cumulative_sum = XFieldElement::zero();
        return out;
    }
    const size_t height = mains.back()->height();
    const size_t n_int = interactions.size();

    size_t max_fields = 0;
    for (const auto& interaction : interactions) {
        max_fields = std::max(max_fields, interaction.fields.size());
    }
    std::vector<XFieldElement> beta_powers(max_fields + 1);
    beta_powers[0] = XFieldElement::one();
    for (size_t j = 1; j <= max_fields; ++j) {
        beta_powers[j] = beta_powers[j - 1] * beta;
    }

    // denominators[row * n_int + i], signed counts alongside
    std::vector<XFieldElement> denominators(height * n_int);
    std::vector<BFieldElement> counts(height * n_int);
    const std::vector<XFieldElement> no_ext;

    #pragma omp parallel
    {
        DagEvaluator<BFieldElement> evaluator(interaction_dag);
        TraceRowSource source(preprocessed, mains, nullptr, public_values, no_ext, no_ext, height);
        #pragma omp for schedule(static)
        for (size_t row = 0; row < height; ++row) {
            source.set_row(row);
            evaluator.evaluate(source);
            size_t root = 0;
            for (size_t i = 0; i < n_int; ++i) {
                const auto& interaction = interactions[i];
                XFieldElement d = alpha + BFieldElement(interaction.bus + 1);
                for (size_t j = 0; j < interaction.fields.size(); ++j) {
                    d += beta_powers[j + 1] * evaluator.base_value(interaction_dag.roots[root++]);
                }
                BFieldElement count = evaluator.base_value(interaction_dag.roots[root++]);
                denominators[row * n_int + i] = d;
                counts[row * n_int + i] = interaction.type == InteractionType::Send ? count : -count;
            }
        }
    }

    std::vector<XFieldElement> inverses = XFieldElement::batch_inversion(denominators);

    out.trace = RowMajorMatrix<XFieldElement>(width, height);
    XFieldElement running = XFieldElement::zero();
    for (size_t row = 0; row < height; ++row) {
        XFieldElement row_sum = XFieldElement::zero();
        for (size_t c = 0; c < chunks.chunks.size(); ++c) {
            XFieldElement phi = XFieldElement::zero();
            for (size_t i : chunks.chunks[c]) {
                phi += inverses[row * n_int + i] * counts[row * n_int + i];
            }
            out.trace.set(row, c, phi);
            row_sum += phi;
        }
        running += row_sum;
        out.trace.set(row, chunks.running_sum_column(), running);
    }
    out.cumulative_sum = running;
    return out;
}

TraceRowSource::TraceRowSource(const RowMajorMatrix<BFieldElement>* preprocessed,
                               const std::vector<const RowMajorMatrix<BFieldElement>*>& mains,
                               const RowMajorMatrix<XFieldElement>* permutation,
                               const std::vector<BFieldElement>& public_values,
                               const std::vector<XFieldElement>& challenges,
                               const std::vector<XFieldElement>& exposed,
                               size_t height)
    : preprocessed_(preprocessed),
      mains_(mains),
      permutation_(permutation),
      public_values_(public_values),
      challenges_(challenges),
      exposed_(exposed),
      height_(height) {}

BFieldElement TraceRowSource::base(const SymbolicVariable& var) const {
    switch (var.entry) {
        case Entry::Preprocessed: return preprocessed_->get(row_of(var), var.index);
        case Entry::Main: return mains_[var.part_index]->get(row_of(var), var.index);
        case Entry::Public: return public_values_[var.index];
        default: break;
    }
    throw std::logic_error("extension variable read as base value");
}

XFieldElement TraceRowSource::extension(const SymbolicVariable& var) const {
    switch (var.entry) {
        case Entry::Permutation:
            if (permutation_ == nullptr) {
                throw std::logic_error("permutation trace not available");
            }
            return permutation_->get(row_of(var), var.index);
        case Entry::Challenge: return challenges_.at(var.index);
        case Entry::Exposed: return exposed_.at(var.index);
        default: break;
    }
    throw std::logic_error("base variable read as extension value");
}

BFieldElement TraceRowSource::is_first_row() const {
    return row_ == 0 ? BFieldElement::one() : BFieldElement::zero();
}

BFieldElement TraceRowSource::is_last_row() const {
    return row_ + 1 == height_ ? BFieldElement::one() : BFieldElement::zero();
}

BFieldElement TraceRowSource::is_transition() const {
    return row_ + 1 == height_ ? BFieldElement::zero() : BFieldElement::one();
}

} // namespace logup
} // namespace zkrv
