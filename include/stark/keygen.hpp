#pragma once

#include "air/air.hpp"
#include "air/logup.hpp"
#include "air/symbolic_dag.hpp"
#include "fri/fri.hpp"
#include "fri/two_adic_pcs.hpp"
#include "types/digest.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zkrv {

/**
 * StarkVerifyingKey - everything the verifier needs about one AIR
 */
struct StarkVerifyingKey {
    std::string air_name;
    size_t preprocessed_width = 0;
    std::optional<Digest> preprocessed_commit;
    size_t preprocessed_log_height = 0;
    std::vector<size_t> cached_main_widths;
    size_t common_main_width = 0;
    size_t num_public_values = 0;
    // Constraints including the bus-argument constraints
    SymbolicDag constraints;
    size_t num_interactions = 0;
    // Extension columns of the permutation trace (0 without interactions)
    size_t num_permutation_columns = 0;
    size_t max_constraint_degree = 0;
    size_t quotient_degree = 1;

    bool has_interactions() const { return num_interactions > 0; }
    size_t num_exposed_values() const { return has_interactions() ? 1 : 0; }
    size_t num_main_partitions() const { return cached_main_widths.size() + 1; }
};

struct StarkProvingKey {
    StarkVerifyingKey vk;
    std::shared_ptr<const CommittedMatrix> preprocessed;
    std::vector<SymbolicInteraction> interactions;
    logup::InteractionChunks chunks;
    SymbolicDag interaction_dag;
};

/**
 * MultiStarkVerifyingKey - per-AIR verifying keys plus the PCS parameters
 *
 * pre_hash binds the whole key into the transcript.
 */
struct MultiStarkVerifyingKey {
    FriParameters params;
    std::vector<StarkVerifyingKey> per_air;
    Digest pre_hash;

    size_t num_airs() const { return per_air.size(); }
};

struct MultiStarkProvingKey {
    FriParameters params;
    std::vector<StarkProvingKey> per_air;
    Digest pre_hash;

    size_t num_airs() const { return per_air.size(); }
    MultiStarkVerifyingKey get_vk() const;
};

/**
 * MultiStarkKeygenBuilder - fixes the AIR set and derives the keys
 *
 * AIR ids are assigned in add_air() order.
 */
class MultiStarkKeygenBuilder {
public:
    explicit MultiStarkKeygenBuilder(const FriParameters& params) : params_(params) {}

    size_t add_air(AirRef air);

    MultiStarkProvingKey generate_pk() const;

private:
    FriParameters params_;
    std::vector<AirRef> airs_;

    StarkProvingKey keygen_air(const Air& air, const TwoAdicPcs& pcs) const;
};

// Poseidon2 hash binding parameters, shapes and constraint DAGs
Digest compute_vk_pre_hash(const FriParameters& params, const std::vector<StarkVerifyingKey>& per_air);

} // namespace zkrv
