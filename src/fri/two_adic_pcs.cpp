#include "fri/two_adic_pcs.hpp"
#include "ntt/ntt.hpp"
#include "stark/errors.hpp"
#include "common/debug_control.hpp"
#include <map>
#include <omp.h>

namespace zkrv {

Commitment PcsProverData::commitment() const {
    Commitment c;
    c.reserve(matrices.size());
    for (const auto& m : matrices) {
        c.push_back(m->root());
    }
    return c;
}

TwoAdicPcs::TwoAdicPcs(const FriParameters& params) : params_(params), fri_(params) {}

std::shared_ptr<const CommittedMatrix> TwoAdicPcs::commit_matrix(RowMajorMatrix<BFieldElement> trace) const {
    if (trace.height() == 0 || (trace.height() & (trace.height() - 1)) != 0) {
        throw ProverError(ProverErrorKind::TraceShapeMismatch,
                          "trace height " + std::to_string(trace.height()) + " is not a power of two");
    }
    if (trace.height() < params_.final_poly_len()) {
        throw ProverError(ProverErrorKind::TraceShapeMismatch, "trace shorter than the FRI final polynomial");
    }
    auto committed = std::make_shared<CommittedMatrix>();
    committed->log_height = log2_strict(trace.height());
    committed->lde = LDE::extend_matrix(trace, params_.log_blowup, Fri::shift());
    committed->tree = std::make_unique<MerkleTree>(MerkleTree::from_matrix_rows(committed->lde));
    committed->trace = std::move(trace);
    return committed;
}

PcsProverData TwoAdicPcs::commit(std::vector<RowMajorMatrix<BFieldElement>> traces) const {
    PcsProverData data;
    for (auto& t : traces) {
        data.matrices.push_back(commit_matrix(std::move(t)));
    }
    return data;
}

std::vector<XFieldElement> TwoAdicPcs::evaluate_columns(const RowMajorMatrix<BFieldElement>& trace,
                                                        const XFieldElement& point) {
    // p(z) = (z^n - 1) / n * sum_j w^j p(w^j) / (z - w^j)
    const size_t n = trace.height();
    const BFieldElement omega = BFieldElement::primitive_root_of_unity(
        static_cast<uint32_t>(log2_strict(n)));

    std::vector<XFieldElement> diffs(n);
    std::vector<BFieldElement> powers(n);
    BFieldElement w = BFieldElement::one();
    for (size_t j = 0; j < n; ++j) {
        powers[j] = w;
        diffs[j] = point - w;
        w *= omega;
    }
    std::vector<XFieldElement> inv = XFieldElement::batch_inversion(diffs);
    for (size_t j = 0; j < n; ++j) {
        inv[j] *= powers[j];
    }
    XFieldElement scale = (point.pow(n) - BFieldElement::one()) * BFieldElement(n).inverse();

    std::vector<XFieldElement> out(trace.width(), XFieldElement::zero());
    #pragma omp parallel for schedule(static) if (trace.width() >= 8)
    for (size_t c = 0; c < trace.width(); ++c) {
        XFieldElement acc = XFieldElement::zero();
        for (size_t j = 0; j < n; ++j) {
            acc += inv[j] * trace.get(j, c);
        }
        out[c] = acc * scale;
    }
    return out;
}

namespace {

// Per LDE height: running power of alpha and the reduced-opening accumulator
struct ReducedAccumulator {
    XFieldElement alpha_pow = XFieldElement::one();
    std::vector<XFieldElement> values;
};

} // namespace

std::pair<OpenedValues, PcsProof> TwoAdicPcs::open(const std::vector<ProverRound>& rounds,
                                                   DuplexChallenger& challenger) const {
    OpenedValues opened(rounds.size());
    for (size_t r = 0; r < rounds.size(); ++r) {
        const auto& round = rounds[r];
        if (round.points.size() != round.data->matrices.size()) {
            throw ProverError(ProverErrorKind::InvalidInput, "opening points do not match matrices");
        }
        opened[r].resize(round.points.size());
        for (size_t m = 0; m < round.points.size(); ++m) {
            for (const auto& z : round.points[m]) {
                opened[r][m].push_back(evaluate_columns(round.data->matrices[m]->trace, z));
            }
        }
    }

    for (const auto& round_values : opened) {
        for (const auto& matrix_values : round_values) {
            for (const auto& point_values : matrix_values) {
                challenger.observe_ext_slice(point_values);
            }
        }
    }

    const XFieldElement alpha = challenger.sample_ext();

    // Reduced openings: sum alpha^k (p_k(x) - p_k(z)) / (x - z) per LDE height
    std::map<size_t, ReducedAccumulator, std::greater<size_t>> reduced;
    for (size_t r = 0; r < rounds.size(); ++r) {
        const auto& round = rounds[r];
        for (size_t m = 0; m < round.data->matrices.size(); ++m) {
            const CommittedMatrix& cm = *round.data->matrices[m];
            const size_t log_lde = cm.log_height + params_.log_blowup;
            const size_t lde_height = size_t{1} << log_lde;
            ReducedAccumulator& acc = reduced[log_lde];
            if (acc.values.empty()) {
                acc.values.assign(lde_height, XFieldElement::zero());
            }

            std::vector<BFieldElement> xs = ArithmeticDomain::of_length(lde_height).with_offset(Fri::shift()).values();

            for (size_t p = 0; p < round.points[m].size(); ++p) {
                const XFieldElement& z = round.points[m][p];
                const auto& values = opened[r][m][p];

                std::vector<XFieldElement> alpha_pows(cm.width());
                XFieldElement constant = XFieldElement::zero();
                for (size_t c = 0; c < cm.width(); ++c) {
                    alpha_pows[c] = acc.alpha_pow;
                    constant += acc.alpha_pow * values[c];
                    acc.alpha_pow *= alpha;
                }

                std::vector<XFieldElement> denoms(lde_height);
                for (size_t i = 0; i < lde_height; ++i) {
                    denoms[i] = XFieldElement(xs[i]) - z;
                }
                std::vector<XFieldElement> inv = XFieldElement::batch_inversion(denoms);

                #pragma omp parallel for schedule(static)
                for (size_t i = 0; i < lde_height; ++i) {
                    const BFieldElement* row = cm.lde.row(i);
                    XFieldElement sum = XFieldElement::zero();
                    for (size_t c = 0; c < cm.width(); ++c) {
                        sum += alpha_pows[c] * row[c];
                    }
                    acc.values[i] += (sum - constant) * inv[i];
                }
            }
        }
    }

    Fri::Inputs fri_inputs;
    for (auto& [log_h, acc] : reduced) {
        fri_inputs.emplace(log_h, std::move(acc.values));
    }

    PcsProof proof;
    std::vector<size_t> query_indices;
    proof.fri_proof = fri_.prove(fri_inputs, challenger, query_indices);

    const size_t log_max = fri_inputs.begin()->first;
    for (size_t index : query_indices) {
        std::vector<std::vector<BatchOpening>> per_round(rounds.size());
        for (size_t r = 0; r < rounds.size(); ++r) {
            for (const auto& cm : rounds[r].data->matrices) {
                const size_t log_lde = cm->log_height + params_.log_blowup;
                const size_t row_index = index & ((size_t{1} << log_lde) - 1);
                BatchOpening opening;
                opening.row = cm->lde.row_vec(row_index);
                opening.auth_path = cm->tree->authentication_path(row_index);
                per_round[r].push_back(std::move(opening));
            }
        }
        proof.query_openings.push_back(std::move(per_round));
    }

    ZKRV_DEBUG_PRINT("PCS: opened %zu rounds, max LDE height 2^%zu\n", rounds.size(), log_max);
    return {std::move(opened), std::move(proof)};
}

void TwoAdicPcs::verify(const std::vector<VerifierRound>& rounds, const OpenedValues& values,
                        const PcsProof& proof, DuplexChallenger& challenger) const {
    if (values.size() != rounds.size()) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "opened values round count");
    }
    size_t log_max = 0;
    for (size_t r = 0; r < rounds.size(); ++r) {
        const auto& round = rounds[r];
        if (round.commitment.size() != round.matrices.size() || values[r].size() != round.matrices.size()) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape,
                                    "round " + std::to_string(r) + " matrix count");
        }
        for (size_t m = 0; m < round.matrices.size(); ++m) {
            const auto& shape = round.matrices[m];
            if (values[r][m].size() != shape.points.size()) {
                throw VerificationError(VerificationErrorKind::InvalidProofShape, "opened point count");
            }
            for (const auto& pv : values[r][m]) {
                if (pv.size() != shape.width) {
                    throw VerificationError(VerificationErrorKind::InvalidProofShape, "opened width");
                }
            }
            if (shape.log_height < params_.log_final_poly_len) {
                throw VerificationError(VerificationErrorKind::InvalidProofShape, "matrix below FRI final size");
            }
            log_max = std::max(log_max, shape.log_height + params_.log_blowup);
        }
    }
    if (log_max == 0) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "nothing to open");
    }

    for (const auto& round_values : values) {
        for (const auto& matrix_values : round_values) {
            for (const auto& point_values : matrix_values) {
                challenger.observe_ext_slice(point_values);
            }
        }
    }
    const XFieldElement alpha = challenger.sample_ext();

    if (proof.query_openings.size() != params_.num_queries) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "query opening count");
    }

    size_t query_no = 0;
    auto open_input = [&](size_t index) {
        const auto& per_round = proof.query_openings.at(query_no++);
        if (per_round.size() != rounds.size()) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape, "query round count");
        }
        std::map<size_t, XFieldElement> reduced;
        std::map<size_t, XFieldElement> alpha_pows;
        for (size_t r = 0; r < rounds.size(); ++r) {
            const auto& round = rounds[r];
            if (per_round[r].size() != round.matrices.size()) {
                throw VerificationError(VerificationErrorKind::InvalidProofShape, "query matrix count");
            }
            for (size_t m = 0; m < round.matrices.size(); ++m) {
                const auto& shape = round.matrices[m];
                const auto& opening = per_round[r][m];
                const size_t log_lde = shape.log_height + params_.log_blowup;
                const size_t row_index = index & ((size_t{1} << log_lde) - 1);

                if (opening.row.size() != shape.width || opening.auth_path.size() != log_lde) {
                    throw VerificationError(VerificationErrorKind::InvalidProofShape, "batch opening shape");
                }
                if (!MerkleTree::verify(round.commitment[m], row_index,
                                        Poseidon2::hash_varlen(opening.row), opening.auth_path)) {
                    throw VerificationError(VerificationErrorKind::InvalidOpeningArgument,
                                            "input Merkle path rejected (round " + std::to_string(r) +
                                            ", matrix " + std::to_string(m) + ")");
                }

                const BFieldElement x = Fri::shift() *
                    BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log_lde)).pow(row_index);
                auto inserted = alpha_pows.emplace(log_lde, XFieldElement::one());
                XFieldElement& alpha_pow = inserted.first->second;
                XFieldElement& acc = reduced[log_lde];

                for (size_t p = 0; p < shape.points.size(); ++p) {
                    const XFieldElement inv = (XFieldElement(x) - shape.points[p]).inverse();
                    for (size_t c = 0; c < shape.width; ++c) {
                        acc += alpha_pow * (XFieldElement(opening.row[c]) - values[r][m][p][c]) * inv;
                        alpha_pow *= alpha;
                    }
                }
            }
        }
        return reduced;
    };

    fri_.verify(proof.fri_proof, log_max, challenger, open_input);
}

} // namespace zkrv
