#pragma once

#include "fri/two_adic_pcs.hpp"
#include "stark/keygen.hpp"
#include "stark/proof.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace zkrv {

/**
 * AirProofInput - witness of one AIR
 *
 * Cached partitions are committed ahead of time (e.g. a program trace
 * shared by many segments); the common partition is committed together
 * with every other AIR's common partition.
 */
struct AirProofInput {
    std::vector<std::shared_ptr<const CommittedMatrix>> cached_mains;
    RowMajorMatrix<BFieldElement> common_main;
    std::vector<BFieldElement> public_values;

    size_t height() const;
};

struct ProofInput {
    std::vector<std::pair<size_t, AirProofInput>> per_air;
};

/**
 * MultiStarkProver - proves a set of AIRs under one transcript
 *
 * The prover never checks constraints itself; a violated constraint or an
 * unbalanced bus produces a proof the verifier rejects. Use DebugChecker
 * for diagnosis.
 */
class MultiStarkProver {
public:
    explicit MultiStarkProver(const MultiStarkProvingKey& pk) : pk_(pk), pcs_(pk.params) {}

    Proof prove(ProofInput input) const;

    const TwoAdicPcs& pcs() const { return pcs_; }

private:
    const MultiStarkProvingKey& pk_;
    TwoAdicPcs pcs_;

    void validate(const ProofInput& input) const;
};

} // namespace zkrv
