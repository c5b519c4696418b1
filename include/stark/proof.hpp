#pragma once

#include "fri/two_adic_pcs.hpp"
#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <optional>
#include <vector>

namespace zkrv {

/**
 * AirProofData - per-AIR public part of a multi-AIR proof
 */
struct AirProofData {
    size_t air_id = 0;
    size_t log_height = 0;
    std::vector<BFieldElement> public_values;
    // Final cumulative bus sum, present iff the AIR has interactions
    std::vector<XFieldElement> exposed_values;

    size_t height() const { return size_t{1} << log_height; }
};

/**
 * Proof - a proof for a set of AIRs sharing one transcript
 *
 * per_air is ordered by descending trace height, ties by ascending air id.
 * Opening rounds in opened_values follow the commitment order:
 * preprocessed, one round per cached main partition, common main,
 * after-challenge (if any AIR has interactions), quotient.
 */
struct Proof {
    std::vector<AirProofData> per_air;
    std::vector<Commitment> cached_main_commits;
    Commitment main_commit;
    std::optional<Commitment> after_challenge_commit;
    Commitment quotient_commit;
    OpenedValues opened_values;
    PcsProof opening_proof;

    const AirProofData* find_air(size_t air_id) const {
        for (const auto& data : per_air) {
            if (data.air_id == air_id) {
                return &data;
            }
        }
        return nullptr;
    }
};

} // namespace zkrv
