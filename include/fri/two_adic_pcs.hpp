#pragma once

#include "fri/fri.hpp"
#include "table/matrix.hpp"
#include "merkle/merkle_tree.hpp"
#include "proof_stream/challenger.hpp"
#include <memory>
#include <vector>

namespace zkrv {

/**
 * CommittedMatrix - a trace on H, its LDE on g * H' and the Merkle tree over LDE rows
 */
struct CommittedMatrix {
    RowMajorMatrix<BFieldElement> trace;
    RowMajorMatrix<BFieldElement> lde;
    std::unique_ptr<MerkleTree> tree;
    size_t log_height = 0;

    Digest root() const { return tree->root(); }
    size_t width() const { return trace.width(); }
};

// One Merkle root per committed matrix
using Commitment = std::vector<Digest>;

/**
 * PcsProverData - all matrices of one commitment round
 */
struct PcsProverData {
    std::vector<std::shared_ptr<const CommittedMatrix>> matrices;

    Commitment commitment() const;
};

struct BatchOpening {
    std::vector<BFieldElement> row;
    std::vector<Digest> auth_path;
};

struct PcsProof {
    // [query][round][matrix]
    std::vector<std::vector<std::vector<BatchOpening>>> query_openings;
    FriProof fri_proof;
};

// [round][matrix][point][column]
using OpenedValues = std::vector<std::vector<std::vector<std::vector<XFieldElement>>>>;

/**
 * TwoAdicPcs - FRI-based polynomial commitment over BabyBear
 *
 * Opening batches every (round, matrix, point, column) into one reduced
 * opening per LDE height using powers of a single challenge alpha, then
 * runs FRI over those codewords.
 */
class TwoAdicPcs {
public:
    explicit TwoAdicPcs(const FriParameters& params);

    std::shared_ptr<const CommittedMatrix> commit_matrix(RowMajorMatrix<BFieldElement> trace) const;

    PcsProverData commit(std::vector<RowMajorMatrix<BFieldElement>> traces) const;

    struct ProverRound {
        const PcsProverData* data;
        // points per matrix
        std::vector<std::vector<XFieldElement>> points;
    };

    /**
     * Evaluate every matrix at its points, observe the values, then prove.
     */
    std::pair<OpenedValues, PcsProof> open(const std::vector<ProverRound>& rounds,
                                           DuplexChallenger& challenger) const;

    struct MatrixShape {
        size_t log_height;
        size_t width;
        std::vector<XFieldElement> points;
    };

    struct VerifierRound {
        Commitment commitment;
        std::vector<MatrixShape> matrices;
    };

    /**
     * Throws VerificationError when the opened values are not consistent
     * with the commitments.
     */
    void verify(const std::vector<VerifierRound>& rounds, const OpenedValues& values,
                const PcsProof& proof, DuplexChallenger& challenger) const;

    const FriParameters& params() const { return params_; }

    // Barycentric evaluation of every column of a trace on H at an out-of-domain point
    static std::vector<XFieldElement> evaluate_columns(const RowMajorMatrix<BFieldElement>& trace,
                                                       const XFieldElement& point);

private:
    FriParameters params_;
    Fri fri_;
};

} // namespace zkrv
