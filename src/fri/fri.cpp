#include "fri/fri.hpp"
#include "ntt/ntt.hpp"
#include "polynomial/polynomial.hpp"
#include "stark/errors.hpp"
#include "common/debug_control.hpp"
#include <omp.h>

namespace zkrv {

FriRound::FriRound(std::vector<XFieldElement> cw) : codeword(std::move(cw)) {
    const size_t half = codeword.size() / 2;
    std::vector<Digest> leaves(half);

    #pragma omp parallel for schedule(static) if (half >= 256)
    for (size_t j = 0; j < half; ++j) {
        leaves[j] = leaf_digest(codeword[j], codeword[j + half]);
    }
    merkle_tree = std::make_unique<MerkleTree>(std::move(leaves));
}

Digest FriRound::leaf_digest(const XFieldElement& lo, const XFieldElement& hi) {
    std::vector<BFieldElement> pair;
    pair.reserve(2 * XFieldElement::EXTENSION_DEGREE);
    for (const auto& c : lo.coefficients()) pair.push_back(c);
    for (const auto& c : hi.coefficients()) pair.push_back(c);
    return Poseidon2::hash_varlen(pair);
}

XFieldElement Fri::fold_pair(const XFieldElement& lo, const XFieldElement& hi,
                             const XFieldElement& beta, BFieldElement x) {
    // f(x) = fe(x^2) + x fo(x^2)  =>  fold = fe + beta * fo
    const BFieldElement half = BFieldElement::one().halve();
    XFieldElement even = (lo + hi) * half;
    XFieldElement odd = (lo - hi) * (half * x.inverse());
    return even + beta * odd;
}

std::vector<XFieldElement> FriRound::split_and_fold(const XFieldElement& beta) const {
    const size_t n = codeword.size();
    const size_t half = n / 2;
    const BFieldElement omega = BFieldElement::primitive_root_of_unity(
        static_cast<uint32_t>(log2_strict(n)));

    std::vector<BFieldElement> xs(half);
    BFieldElement x = Fri::shift();
    for (size_t j = 0; j < half; ++j) {
        xs[j] = x;
        x *= omega;
    }
    std::vector<BFieldElement> x_inv = BFieldElement::batch_inversion(xs);

    const BFieldElement inv_two = BFieldElement::one().halve();
    std::vector<XFieldElement> folded(half);

    #pragma omp parallel for schedule(static) if (half >= 1024)
    for (size_t j = 0; j < half; ++j) {
        const XFieldElement& lo = codeword[j];
        const XFieldElement& hi = codeword[j + half];
        folded[j] = (lo + hi) * inv_two + beta * ((lo - hi) * (inv_two * x_inv[j]));
    }
    return folded;
}

Fri::Fri(const FriParameters& params) : params_(params) {}

FriProof Fri::prove(const Inputs& inputs, DuplexChallenger& challenger,
                    std::vector<size_t>& query_indices_out) const {
    if (inputs.empty()) {
        throw std::invalid_argument("FRI needs at least one input codeword");
    }
    const size_t log_max = inputs.begin()->first;
    if (inputs.rbegin()->first < log_final_height()) {
        throw std::invalid_argument("FRI input shorter than the final codeword");
    }

    FriProof proof;
    std::vector<FriRound> rounds;
    std::vector<XFieldElement> folded = inputs.begin()->second;

    for (size_t log_h = log_max; log_h > log_final_height(); --log_h) {
        FriRound round(std::move(folded));
        proof.commit_roots.push_back(round.merkle_root());
        challenger.observe(round.merkle_root());

        XFieldElement beta = challenger.sample_ext();
        folded = round.split_and_fold(beta);

        auto roll_in = inputs.find(log_h - 1);
        if (roll_in != inputs.end()) {
            XFieldElement beta_sq = beta * beta;
            for (size_t j = 0; j < folded.size(); ++j) {
                folded[j] += beta_sq * roll_in->second[j];
            }
        }
        rounds.push_back(std::move(round));
    }

    // The remaining codeword must be a low-degree polynomial on g * H_final
    std::vector<XFieldElement> coeffs = NTT::coset_interpolate(folded, shift());
    const size_t final_len = params_.final_poly_len();
    for (size_t i = final_len; i < coeffs.size(); ++i) {
        if (!coeffs[i].is_zero()) {
            throw ProverError(ProverErrorKind::InvalidInput,
                              "FRI final polynomial exceeds degree bound; a committed polynomial is too large");
        }
    }
    coeffs.resize(final_len);
    proof.final_poly = coeffs;
    for (const auto& c : proof.final_poly) {
        challenger.observe(c);
    }

    proof.pow_witness = challenger.grind(params_.proof_of_work_bits);

    query_indices_out.clear();
    for (size_t q = 0; q < params_.num_queries; ++q) {
        size_t index = challenger.sample_bits(log_max);
        query_indices_out.push_back(index);

        FriQueryProof query;
        size_t idx = index;
        for (const auto& round : rounds) {
            const size_t half = round.codeword.size() / 2;
            const size_t j = idx % half;
            FriLayerOpening layer;
            layer.sibling_value = idx < half ? round.codeword[j + half] : round.codeword[j];
            layer.auth_path = round.merkle_tree->authentication_path(j);
            query.layers.push_back(std::move(layer));
            idx = j;
        }
        proof.query_proofs.push_back(std::move(query));
    }

    ZKRV_DEBUG_PRINT("FRI: %zu rounds, %zu queries, log_max=%zu\n",
                     rounds.size(), params_.num_queries, log_max);
    return proof;
}

void Fri::verify(const FriProof& proof, size_t log_max_height, DuplexChallenger& challenger,
                 const QueryOpener& open_input) const {
    if (log_max_height < log_final_height()) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "FRI domain below final size");
    }
    const size_t num_rounds = log_max_height - log_final_height();
    if (proof.commit_roots.size() != num_rounds) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "wrong number of FRI commitments");
    }
    if (proof.final_poly.size() != params_.final_poly_len()) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "wrong final polynomial length");
    }
    if (proof.query_proofs.size() != params_.num_queries) {
        throw VerificationError(VerificationErrorKind::InvalidProofShape, "wrong number of FRI queries");
    }

    std::vector<XFieldElement> betas;
    for (const auto& root : proof.commit_roots) {
        challenger.observe(root);
        betas.push_back(challenger.sample_ext());
    }
    for (const auto& c : proof.final_poly) {
        challenger.observe(c);
    }
    if (!challenger.check_witness(params_.proof_of_work_bits, proof.pow_witness)) {
        throw VerificationError(VerificationErrorKind::InvalidProofOfWork, "");
    }

    const XPolynomial final_poly(proof.final_poly);

    for (const auto& query : proof.query_proofs) {
        const size_t index = challenger.sample_bits(log_max_height);
        if (query.layers.size() != num_rounds) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape, "wrong number of FRI layers");
        }

        std::map<size_t, XFieldElement> reduced = open_input(index);
        auto first = reduced.find(log_max_height);
        if (first == reduced.end()) {
            throw VerificationError(VerificationErrorKind::InvalidProofShape, "missing reduced opening at max height");
        }
        XFieldElement folded = first->second;

        size_t idx = index;
        for (size_t r = 0; r < num_rounds; ++r) {
            const size_t log_h = log_max_height - r;
            const size_t half = size_t{1} << (log_h - 1);
            const size_t j = idx % half;
            const FriLayerOpening& layer = query.layers[r];

            const bool is_lo = idx < half;
            const XFieldElement& lo = is_lo ? folded : layer.sibling_value;
            const XFieldElement& hi = is_lo ? layer.sibling_value : folded;
            if (!MerkleTree::verify(proof.commit_roots[r], j, FriRound::leaf_digest(lo, hi), layer.auth_path) ||
                layer.auth_path.size() != log_h - 1) {
                throw VerificationError(VerificationErrorKind::InvalidOpeningArgument,
                                        "FRI layer " + std::to_string(r) + " Merkle path rejected");
            }

            BFieldElement x = shift() * BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log_h)).pow(j);
            folded = fold_pair(lo, hi, betas[r], x);
            idx = j;

            auto roll_in = reduced.find(log_h - 1);
            if (roll_in != reduced.end()) {
                folded += betas[r] * betas[r] * roll_in->second;
            }
        }

        const size_t log_final = log_final_height();
        BFieldElement x = shift() * BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log_final)).pow(idx);
        if (final_poly.evaluate(XFieldElement(x)) != folded) {
            throw VerificationError(VerificationErrorKind::InvalidOpeningArgument,
                                    "FRI final polynomial mismatch");
        }
    }
}

} // namespace zkrv
