#include "stark/verifier.hpp"
#include "air/logup.hpp"
#include "air/symbolic_dag.hpp"
#include "common/debug_control.hpp"
#include "ntt/arithmetic_domain.hpp"
#include "proof_stream/challenger.hpp"
#include "quotient/quotient.hpp"
#include "stark/errors.hpp"
#include <cstdint>
#include <set>

namespace zkrv {

namespace {

constexpr size_t D = XFieldElement::EXTENSION_DEGREE;

using PointValues = std::vector<std::vector<XFieldElement>>;  // [point][column]

/**
 * Opened values of one AIR at zeta (offset 0) and omega * zeta (offset 1)
 */
class OodSource : public VariableSource<XFieldElement> {
public:
    const PointValues* preprocessed = nullptr;
    std::vector<const PointValues*> mains;
    const PointValues* permutation = nullptr;
    const std::vector<BFieldElement>* public_values = nullptr;
    const std::vector<XFieldElement>* challenges = nullptr;
    const std::vector<XFieldElement>* exposed = nullptr;
    XFieldElement first_row;
    XFieldElement last_row;
    XFieldElement transition;

    XFieldElement base(const SymbolicVariable& var) const override {
        switch (var.entry) {
            case Entry::Preprocessed: return (*preprocessed)[var.offset][var.index];
            case Entry::Main: return (*mains[var.part_index])[var.offset][var.index];
            case Entry::Public: return XFieldElement((*public_values)[var.index]);
            default: break;
        }
        throw std::logic_error("extension variable read as base value");
    }

    XFieldElement extension(const SymbolicVariable& var) const override {
        switch (var.entry) {
            case Entry::Permutation:
                return Quotient::recompose_extension(&(*permutation)[var.offset][var.index * D]);
            case Entry::Challenge: return challenges->at(var.index);
            case Entry::Exposed: return exposed->at(var.index);
            default: break;
        }
        throw std::logic_error("base variable read as extension value");
    }

    XFieldElement is_first_row() const override { return first_row; }
    XFieldElement is_last_row() const override { return last_row; }
    XFieldElement is_transition() const override { return transition; }
};

VerificationError shape_error(const std::string& detail) {
    return VerificationError(VerificationErrorKind::InvalidProofShape, detail);
}

} // namespace

void MultiStarkVerifier::check_shape(const Proof& proof) const {
    if (proof.per_air.empty()) {
        throw shape_error("proof covers no AIR");
    }
    std::set<size_t> seen;
    const size_t max_log_height = BFieldElement::TWO_ADICITY - vk_.params.log_blowup;
    for (size_t a = 0; a < proof.per_air.size(); ++a) {
        const AirProofData& data = proof.per_air[a];
        if (data.air_id >= vk_.num_airs()) {
            throw VerificationError(VerificationErrorKind::MissingAir,
                                    "air id " + std::to_string(data.air_id) + " not in the verifying key");
        }
        if (!seen.insert(data.air_id).second) {
            throw shape_error("air id " + std::to_string(data.air_id) + " repeated");
        }
        const StarkVerifyingKey& vk = vk_.per_air[data.air_id];
        if (data.log_height < 1 || data.log_height > max_log_height ||
            data.log_height < vk_.params.log_final_poly_len) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape, "trace height out of range",
                                    vk.air_name);
        }
        if (a > 0) {
            const AirProofData& prev = proof.per_air[a - 1];
            if (prev.log_height < data.log_height ||
                (prev.log_height == data.log_height && prev.air_id > data.air_id)) {
                throw shape_error("AIRs not ordered by descending height");
            }
        }
        if (vk.preprocessed_commit && vk.preprocessed_log_height != data.log_height) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape,
                                    "height differs from the preprocessed trace", vk.air_name);
        }
        if (data.public_values.size() != vk.num_public_values) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape, "public value count", vk.air_name);
        }
        if (data.exposed_values.size() != vk.num_exposed_values()) {
            throw VerificationError(VerificationErrorKind::ChallengePhaseError, "exposed value count",
                                    vk.air_name);
        }
    }
}

void MultiStarkVerifier::verify(const Proof& proof) const {
    check_shape(proof);
    const size_t num = proof.per_air.size();
    auto vk_of = [&](size_t a) -> const StarkVerifyingKey& { return vk_.per_air[proof.per_air[a].air_id]; };

    DuplexChallenger challenger;
    challenger.observe(vk_.pre_hash);
    challenger.observe(BFieldElement(num));
    for (const auto& data : proof.per_air) {
        challenger.observe(BFieldElement(data.air_id));
        challenger.observe(BFieldElement(data.log_height));
        challenger.observe_slice(data.public_values);
    }

    Commitment preprocessed_commit;
    for (size_t a = 0; a < num; ++a) {
        if (vk_of(a).preprocessed_commit) {
            preprocessed_commit.push_back(*vk_of(a).preprocessed_commit);
            challenger.observe(*vk_of(a).preprocessed_commit);
        }
    }

    size_t expected_cached = 0;
    for (size_t a = 0; a < num; ++a) {
        expected_cached += vk_of(a).cached_main_widths.size();
    }
    if (proof.cached_main_commits.size() != expected_cached) {
        throw shape_error("cached main commitment count");
    }
    for (const auto& commit : proof.cached_main_commits) {
        if (commit.size() != 1) {
            throw shape_error("cached main commitment holds " + std::to_string(commit.size()) + " roots");
        }
        challenger.observe(commit[0]);
    }

    size_t expected_common = 0;
    for (size_t a = 0; a < num; ++a) {
        expected_common += vk_of(a).common_main_width > 0 ? 1 : 0;
    }
    if (proof.main_commit.size() != expected_common) {
        throw shape_error("main commitment count");
    }
    for (const Digest& root : proof.main_commit) {
        challenger.observe(root);
    }

    size_t expected_after = 0;
    for (size_t a = 0; a < num; ++a) {
        expected_after += vk_of(a).has_interactions() ? 1 : 0;
    }
    std::vector<XFieldElement> challenges;
    if (expected_after > 0) {
        if (!proof.after_challenge_commit || proof.after_challenge_commit->size() != expected_after) {
            throw VerificationError(VerificationErrorKind::ChallengePhaseError, "after-challenge commitment shape");
        }
        const XFieldElement alpha = challenger.sample_ext();
        const XFieldElement beta = challenger.sample_ext();
        challenges = {alpha, beta};
        for (const auto& data : proof.per_air) {
            challenger.observe_ext_slice(data.exposed_values);
        }
        for (const Digest& root : *proof.after_challenge_commit) {
            challenger.observe(root);
        }
    } else if (proof.after_challenge_commit) {
        throw VerificationError(VerificationErrorKind::ChallengePhaseError, "unexpected after-challenge commitment");
    }

    const XFieldElement alpha_q = challenger.sample_ext();
    if (proof.quotient_commit.size() != num) {
        throw shape_error("quotient commitment count");
    }
    for (const Digest& root : proof.quotient_commit) {
        challenger.observe(root);
    }
    const XFieldElement zeta = challenger.sample_ext();

    auto local_next = [&](size_t a) {
        const BFieldElement omega = BFieldElement::primitive_root_of_unity(
            static_cast<uint32_t>(proof.per_air[a].log_height));
        return std::vector<XFieldElement>{zeta, zeta * omega};
    };

    // Rebuild the opening rounds in commitment order and remember where
    // each AIR's matrices sit: (round, matrix)
    using Slot = std::pair<size_t, size_t>;
    const Slot none{SIZE_MAX, SIZE_MAX};
    std::vector<Slot> preprocessed_slot(num, none), common_slot(num, none), after_slot(num, none),
        quotient_slot(num, none);
    std::vector<std::vector<Slot>> cached_slots(num);
    std::vector<TwoAdicPcs::VerifierRound> rounds;

    if (!preprocessed_commit.empty()) {
        TwoAdicPcs::VerifierRound round{preprocessed_commit, {}};
        for (size_t a = 0; a < num; ++a) {
            if (vk_of(a).preprocessed_commit) {
                preprocessed_slot[a] = {rounds.size(), round.matrices.size()};
                round.matrices.push_back({proof.per_air[a].log_height, vk_of(a).preprocessed_width, local_next(a)});
            }
        }
        rounds.push_back(std::move(round));
    }
    {
        size_t c = 0;
        for (size_t a = 0; a < num; ++a) {
            for (size_t w : vk_of(a).cached_main_widths) {
                cached_slots[a].push_back({rounds.size(), 0});
                rounds.push_back({proof.cached_main_commits[c++], {{proof.per_air[a].log_height, w, local_next(a)}}});
            }
        }
    }
    if (!proof.main_commit.empty()) {
        TwoAdicPcs::VerifierRound round{proof.main_commit, {}};
        for (size_t a = 0; a < num; ++a) {
            if (vk_of(a).common_main_width > 0) {
                common_slot[a] = {rounds.size(), round.matrices.size()};
                round.matrices.push_back({proof.per_air[a].log_height, vk_of(a).common_main_width, local_next(a)});
            }
        }
        rounds.push_back(std::move(round));
    }
    if (expected_after > 0) {
        TwoAdicPcs::VerifierRound round{*proof.after_challenge_commit, {}};
        for (size_t a = 0; a < num; ++a) {
            if (vk_of(a).has_interactions()) {
                after_slot[a] = {rounds.size(), round.matrices.size()};
                round.matrices.push_back(
                    {proof.per_air[a].log_height, vk_of(a).num_permutation_columns * D, local_next(a)});
            }
        }
        rounds.push_back(std::move(round));
    }
    {
        TwoAdicPcs::VerifierRound round{proof.quotient_commit, {}};
        for (size_t a = 0; a < num; ++a) {
            quotient_slot[a] = {rounds.size(), round.matrices.size()};
            round.matrices.push_back({proof.per_air[a].log_height, vk_of(a).quotient_degree * D, {zeta}});
        }
        rounds.push_back(std::move(round));
    }

    pcs_.verify(rounds, proof.opened_values, proof.opening_proof, challenger);

    auto values_at = [&](const Slot& slot) -> const PointValues* {
        return slot == none ? nullptr : &proof.opened_values[slot.first][slot.second];
    };

    static const PointValues empty_partition{{}, {}};
    for (size_t a = 0; a < num; ++a) {
        const StarkVerifyingKey& vk = vk_of(a);
        const AirProofData& data = proof.per_air[a];
        const size_t n = data.height();

        OodSource source;
        source.preprocessed = values_at(preprocessed_slot[a]);
        for (const Slot& slot : cached_slots[a]) {
            source.mains.push_back(values_at(slot));
        }
        source.mains.push_back(common_slot[a] == none ? &empty_partition : values_at(common_slot[a]));
        source.permutation = values_at(after_slot[a]);
        source.public_values = &data.public_values;
        source.challenges = &challenges;
        source.exposed = &data.exposed_values;

        const BFieldElement omega_inv = BFieldElement::primitive_root_of_unity(
            static_cast<uint32_t>(data.log_height)).inverse();
        const XFieldElement zh = zeta.pow(n) - XFieldElement::one();
        source.first_row = zh / (zeta - XFieldElement::one());
        source.last_row = zh / (zeta - XFieldElement(omega_inv));
        source.transition = zeta - XFieldElement(omega_inv);

        DagEvaluator<XFieldElement> evaluator(vk.constraints);
        evaluator.evaluate(source);
        const XFieldElement folded = evaluator.fold_roots(alpha_q);

        const XFieldElement quotient =
            Quotient::recompose(proof.opened_values[quotient_slot[a].first][quotient_slot[a].second][0], zeta,
                                data.log_height);
        if (folded != quotient * zh) {
            throw VerificationError(VerificationErrorKind::OodEvaluationMismatch,
                                    "constraints at zeta do not match the quotient", vk.air_name);
        }
    }

    XFieldElement total = XFieldElement::zero();
    for (const auto& data : proof.per_air) {
        for (const auto& v : data.exposed_values) {
            total += v;
        }
    }
    if (!total.is_zero()) {
        throw VerificationError(VerificationErrorKind::NonZeroCumulativeSum,
                                "bus sums add up to " + total.to_string());
    }
    ZKRV_DEBUG_PRINT("[verify] %zu AIRs accepted\n", num);
}

} // namespace zkrv
