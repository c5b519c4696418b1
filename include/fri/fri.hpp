#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include "types/digest.hpp"
#include "merkle/merkle_tree.hpp"
#include "proof_stream/challenger.hpp"
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace zkrv {

/**
 * FriParameters - low-degree test configuration
 *
 * The constraint degree budget follows from the blowup: quotient chunks are
 * read off the LDE, so max_constraint_degree = 2^log_blowup + 1.
 */
struct FriParameters {
    size_t log_blowup = 1;
    size_t num_queries = 100;
    size_t proof_of_work_bits = 16;
    size_t log_final_poly_len = 0;

    static FriParameters standard() { return FriParameters{}; }

    // Small, fast profile for unit tests (not sound)
    static FriParameters testing() { return FriParameters{1, 8, 0, 0}; }

    size_t blowup() const { return size_t{1} << log_blowup; }
    size_t max_constraint_degree() const { return blowup() + 1; }
    size_t final_poly_len() const { return size_t{1} << log_final_poly_len; }

    bool operator==(const FriParameters& o) const {
        return log_blowup == o.log_blowup && num_queries == o.num_queries &&
               proof_of_work_bits == o.proof_of_work_bits && log_final_poly_len == o.log_final_poly_len;
    }
};

struct FriLayerOpening {
    XFieldElement sibling_value;
    std::vector<Digest> auth_path;
};

struct FriQueryProof {
    std::vector<FriLayerOpening> layers;
};

struct FriProof {
    std::vector<Digest> commit_roots;
    std::vector<FriQueryProof> query_proofs;
    std::vector<XFieldElement> final_poly;
    BFieldElement pow_witness;
};

/**
 * FriRound - one committed codeword of the commit phase
 *
 * Leaf j holds the fold pair (v[j], v[j + n/2]).
 */
struct FriRound {
    std::vector<XFieldElement> codeword;
    std::unique_ptr<MerkleTree> merkle_tree;

    explicit FriRound(std::vector<XFieldElement> codeword);

    std::vector<XFieldElement> split_and_fold(const XFieldElement& beta) const;

    Digest merkle_root() const { return merkle_tree->root(); }

    static Digest leaf_digest(const XFieldElement& lo, const XFieldElement& hi);
};

/**
 * Fri - Fast Reed-Solomon IOP of Proximity over the coset g * H
 *
 * Inputs are reduced-opening codewords keyed by log2 of their length.
 * The longest one starts the fold chain; each shorter one is rolled in
 * (scaled by beta^2) once the folded codeword reaches its length.
 */
class Fri {
public:
    using Inputs = std::map<size_t, std::vector<XFieldElement>, std::greater<size_t>>;

    // Reduced openings at one query index, keyed by log length
    using QueryOpener = std::function<std::map<size_t, XFieldElement>(size_t query_index)>;

    explicit Fri(const FriParameters& params);

    /**
     * Commit phase, proof of work and query phase.
     *
     * @param query_indices_out receives the sampled indices into the
     *        longest codeword, so the caller can open its input matrices
     */
    FriProof prove(const Inputs& inputs, DuplexChallenger& challenger,
                   std::vector<size_t>& query_indices_out) const;

    /**
     * Mirror of prove(). open_input must verify the input openings at the
     * given index and return the reduced openings; it may throw
     * VerificationError itself. Throws VerificationError on failure.
     */
    void verify(const FriProof& proof, size_t log_max_height, DuplexChallenger& challenger,
                const QueryOpener& open_input) const;

    static XFieldElement fold_pair(const XFieldElement& lo, const XFieldElement& hi,
                                   const XFieldElement& beta, BFieldElement x);

    // Coset shift shared by all LDE and FRI domains
    static BFieldElement shift() { return BFieldElement::generator(); }

    const FriParameters& params() const { return params_; }

private:
    FriParameters params_;

    size_t log_final_height() const { return params_.log_final_poly_len + params_.log_blowup; }
};

} // namespace zkrv
