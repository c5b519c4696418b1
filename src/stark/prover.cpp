#include "stark/prover.hpp"
#include "air/logup.hpp"
#include "common/debug_control.hpp"
#include "ntt/arithmetic_domain.hpp"
#include "proof_stream/challenger.hpp"
#include "quotient/quotient.hpp"
#include "stark/errors.hpp"
#include <algorithm>
#include <chrono>
#include <set>

namespace zkrv {

size_t AirProofInput::height() const {
    if (common_main.width() > 0) {
        return common_main.height();
    }
    return cached_mains.empty() ? 0 : cached_mains.front()->trace.height();
}

void MultiStarkProver::validate(const ProofInput& input) const {
    std::set<size_t> seen;
    for (const auto& [air_id, air_input] : input.per_air) {
        if (air_id >= pk_.num_airs()) {
            throw ProverError(ProverErrorKind::InvalidInput, "unknown air id " + std::to_string(air_id));
        }
        if (!seen.insert(air_id).second) {
            throw ProverError(ProverErrorKind::InvalidInput, "air id " + std::to_string(air_id) + " given twice");
        }
        const StarkVerifyingKey& vk = pk_.per_air[air_id].vk;
        const size_t height = air_input.height();
        if (height < 2 || (height & (height - 1)) != 0) {
            throw ProverError(ProverErrorKind::TraceShapeMismatch,
                              vk.air_name + ": height " + std::to_string(height) + " is not a power of two >= 2");
        }
        if (air_input.common_main.width() != vk.common_main_width ||
            (vk.common_main_width > 0 && air_input.common_main.height() != height)) {
            throw ProverError(ProverErrorKind::TraceShapeMismatch, vk.air_name + ": common main shape");
        }
        if (air_input.cached_mains.size() != vk.cached_main_widths.size()) {
            throw ProverError(ProverErrorKind::TraceShapeMismatch, vk.air_name + ": cached partition count");
        }
        for (size_t p = 0; p < air_input.cached_mains.size(); ++p) {
            const auto& cm = air_input.cached_mains[p];
            if (cm->width() != vk.cached_main_widths[p] || cm->trace.height() != height) {
                throw ProverError(ProverErrorKind::TraceShapeMismatch, vk.air_name + ": cached partition shape");
            }
        }
        if (vk.preprocessed_commit && (size_t{1} << vk.preprocessed_log_height) != height) {
            throw ProverError(ProverErrorKind::TraceShapeMismatch,
                              vk.air_name + ": trace height differs from the preprocessed height");
        }
        if (air_input.public_values.size() != vk.num_public_values) {
            throw ProverError(ProverErrorKind::InvalidInput, vk.air_name + ": public value count");
        }
    }
    if (input.per_air.empty()) {
        throw ProverError(ProverErrorKind::InvalidInput, "no AIRs to prove");
    }
}

Proof MultiStarkProver::prove(ProofInput input) const {
    auto t_start = std::chrono::high_resolution_clock::now();
    validate(input);

    std::sort(input.per_air.begin(), input.per_air.end(), [](const auto& a, const auto& b) {
        const size_t ha = a.second.height();
        const size_t hb = b.second.height();
        return ha != hb ? ha > hb : a.first < b.first;
    });
    const size_t num = input.per_air.size();
    const size_t log_blowup = pk_.params.log_blowup;

    Proof proof;
    DuplexChallenger challenger;
    challenger.observe(pk_.pre_hash);
    challenger.observe(BFieldElement(num));
    for (const auto& [air_id, air_input] : input.per_air) {
        AirProofData data;
        data.air_id = air_id;
        data.log_height = log2_strict(air_input.height());
        data.public_values = air_input.public_values;
        challenger.observe(BFieldElement(data.air_id));
        challenger.observe(BFieldElement(data.log_height));
        challenger.observe_slice(data.public_values);
        proof.per_air.push_back(std::move(data));
    }

    // Preprocessed: fixed at keygen, bound by observing the roots
    PcsProverData preprocessed_data;
    for (const auto& [air_id, air_input] : input.per_air) {
        const auto& pk = pk_.per_air[air_id];
        if (pk.preprocessed) {
            preprocessed_data.matrices.push_back(pk.preprocessed);
            challenger.observe(pk.preprocessed->root());
        }
    }

    std::vector<PcsProverData> cached_data;
    for (const auto& [air_id, air_input] : input.per_air) {
        for (const auto& cm : air_input.cached_mains) {
            PcsProverData data;
            data.matrices.push_back(cm);
            proof.cached_main_commits.push_back(data.commitment());
            challenger.observe(cm->root());
            cached_data.push_back(std::move(data));
        }
    }

    // Common main
    PcsProverData main_data;
    std::vector<const CommittedMatrix*> common_of(num, nullptr);
    for (size_t a = 0; a < num; ++a) {
        auto& air_input = input.per_air[a].second;
        if (air_input.common_main.width() > 0) {
            main_data.matrices.push_back(pcs_.commit_matrix(std::move(air_input.common_main)));
            common_of[a] = main_data.matrices.back().get();
        }
    }
    proof.main_commit = main_data.commitment();
    for (const Digest& root : proof.main_commit) {
        challenger.observe(root);
    }
    auto t_main = std::chrono::high_resolution_clock::now();

    auto mains_of = [&](size_t a) {
        std::vector<const CommittedMatrix*> mains;
        for (const auto& cm : input.per_air[a].second.cached_mains) {
            mains.push_back(cm.get());
        }
        mains.push_back(common_of[a]);
        return mains;
    };

    // After-challenge phase: bus argument
    bool any_interactions = false;
    for (const auto& entry : input.per_air) {
        any_interactions = any_interactions || pk_.per_air[entry.first].vk.has_interactions();
    }
    std::vector<XFieldElement> challenges;
    PcsProverData after_data;
    std::vector<const CommittedMatrix*> permutation_of(num, nullptr);
    if (any_interactions) {
        const XFieldElement alpha = challenger.sample_ext();
        const XFieldElement beta = challenger.sample_ext();
        challenges = {alpha, beta};
        for (size_t a = 0; a < num; ++a) {
            const auto& pk = pk_.per_air[input.per_air[a].first];
            if (!pk.vk.has_interactions()) {
                continue;
            }
            // Empty common partitions are read through an all-zero view
            std::vector<const CommittedMatrix*> committed = mains_of(a);
            std::vector<const RowMajorMatrix<BFieldElement>*> mains;
            const RowMajorMatrix<BFieldElement> empty(0, proof.per_air[a].height());
            for (const CommittedMatrix* cm : committed) {
                mains.push_back(cm ? &cm->trace : &empty);
            }
            logup::PermutationTrace perm = logup::generate_trace(
                pk.interactions, pk.chunks, pk.interaction_dag,
                pk.preprocessed ? &pk.preprocessed->trace : nullptr, mains,
                proof.per_air[a].public_values, alpha, beta);
            proof.per_air[a].exposed_values = {perm.cumulative_sum};
            challenger.observe_ext_slice(proof.per_air[a].exposed_values);
            after_data.matrices.push_back(pcs_.commit_matrix(flatten_to_base(perm.trace)));
            permutation_of[a] = after_data.matrices.back().get();
        }
        proof.after_challenge_commit = after_data.commitment();
        for (const Digest& root : *proof.after_challenge_commit) {
            challenger.observe(root);
        }
    }
    auto t_after = std::chrono::high_resolution_clock::now();

    // Quotient
    const XFieldElement alpha_q = challenger.sample_ext();
    std::vector<RowMajorMatrix<BFieldElement>> quotient_chunks(num);
    for (size_t a = 0; a < num; ++a) {
        const auto& pk = pk_.per_air[input.per_air[a].first];
        QuotientInputs qi;
        qi.vk = &pk.vk;
        qi.log_height = proof.per_air[a].log_height;
        qi.preprocessed = pk.preprocessed.get();
        qi.mains = mains_of(a);
        qi.permutation = permutation_of[a];
        qi.public_values = proof.per_air[a].public_values;
        qi.challenges = challenges;
        qi.exposed_values = proof.per_air[a].exposed_values;
        if (qi.mains.back() == nullptr) {
            // Only cached partitions: any committed partition gives the LDE height
            qi.mains.back() = qi.mains.front();
        }
        quotient_chunks[a] = Quotient::compute_quotient_chunks(qi, alpha_q, log_blowup);
    }
    PcsProverData quotient_data = pcs_.commit(std::move(quotient_chunks));
    proof.quotient_commit = quotient_data.commitment();
    for (const Digest& root : proof.quotient_commit) {
        challenger.observe(root);
    }
    auto t_quotient = std::chrono::high_resolution_clock::now();

    // Openings at zeta and omega * zeta
    const XFieldElement zeta = challenger.sample_ext();
    auto local_next = [&](size_t a) {
        const BFieldElement omega = BFieldElement::primitive_root_of_unity(
            static_cast<uint32_t>(proof.per_air[a].log_height));
        return std::vector<XFieldElement>{zeta, zeta * omega};
    };

    std::vector<TwoAdicPcs::ProverRound> rounds;
    if (!preprocessed_data.matrices.empty()) {
        TwoAdicPcs::ProverRound round{&preprocessed_data, {}};
        for (size_t a = 0; a < num; ++a) {
            if (pk_.per_air[input.per_air[a].first].preprocessed) {
                round.points.push_back(local_next(a));
            }
        }
        rounds.push_back(std::move(round));
    }
    {
        size_t c = 0;
        for (size_t a = 0; a < num; ++a) {
            for (size_t p = 0; p < input.per_air[a].second.cached_mains.size(); ++p) {
                rounds.push_back(TwoAdicPcs::ProverRound{&cached_data[c++], {local_next(a)}});
            }
        }
    }
    if (!main_data.matrices.empty()) {
        TwoAdicPcs::ProverRound round{&main_data, {}};
        for (size_t a = 0; a < num; ++a) {
            if (common_of[a]) {
                round.points.push_back(local_next(a));
            }
        }
        rounds.push_back(std::move(round));
    }
    if (any_interactions) {
        TwoAdicPcs::ProverRound round{&after_data, {}};
        for (size_t a = 0; a < num; ++a) {
            if (permutation_of[a]) {
                round.points.push_back(local_next(a));
            }
        }
        rounds.push_back(std::move(round));
    }
    {
        TwoAdicPcs::ProverRound round{&quotient_data, {}};
        for (size_t a = 0; a < num; ++a) {
            round.points.push_back({zeta});
        }
        rounds.push_back(std::move(round));
    }

    auto opened = pcs_.open(rounds, challenger);
    proof.opened_values = std::move(opened.first);
    proof.opening_proof = std::move(opened.second);

    ZKRV_IF_PROFILE {
        auto ms = [](auto a, auto b) { return std::chrono::duration<double, std::milli>(b - a).count(); };
        auto t_end = std::chrono::high_resolution_clock::now();
        printf("[prove] %zu AIRs: main %.2f ms, after-challenge %.2f ms, quotient %.2f ms, open %.2f ms\n",
               num, ms(t_start, t_main), ms(t_main, t_after), ms(t_after, t_quotient), ms(t_quotient, t_end));
    }
    return proof;
}

} // namespace zkrv
