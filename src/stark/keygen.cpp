#include "stark/keygen.hpp"
#include "common/debug_control.hpp"
#include "hash/poseidon2.hpp"
#include "ntt/arithmetic_domain.hpp"
#include "stark/errors.hpp"
#include <map>
#include <stdexcept>

namespace zkrv {

MultiStarkVerifyingKey MultiStarkProvingKey::get_vk() const {
    MultiStarkVerifyingKey vk;
    vk.params = params;
    vk.pre_hash = pre_hash;
    vk.per_air.reserve(per_air.size());
    for (const auto& pk : per_air) {
        vk.per_air.push_back(pk.vk);
    }
    return vk;
}

size_t MultiStarkKeygenBuilder::add_air(AirRef air) {
    if (!air) {
        throw std::invalid_argument("add_air: null AIR");
    }
    airs_.push_back(std::move(air));
    return airs_.size() - 1;
}

StarkProvingKey MultiStarkKeygenBuilder::keygen_air(const Air& air, const TwoAdicPcs& pcs) const {
    StarkProvingKey pk;
    StarkVerifyingKey& vk = pk.vk;
    vk.air_name = air.name();
    vk.cached_main_widths = air.cached_main_widths();
    vk.common_main_width = air.width();
    vk.num_public_values = air.num_public_values();

    size_t total_main = vk.common_main_width;
    for (size_t w : vk.cached_main_widths) {
        total_main += w;
    }
    if (total_main == 0) {
        throw KeygenError(KeygenErrorKind::EmptyAir, vk.air_name, "AIR has no main columns");
    }

    auto preprocessed = air.preprocessed_trace();
    if (preprocessed) {
        if (preprocessed->height() < 2 || (preprocessed->height() & (preprocessed->height() - 1)) != 0) {
            throw KeygenError(KeygenErrorKind::WidthMismatch, vk.air_name,
                              "preprocessed height must be a power of two >= 2");
        }
        vk.preprocessed_width = preprocessed->width();
        vk.preprocessed_log_height = log2_strict(preprocessed->height());
        pk.preprocessed = pcs.commit_matrix(*preprocessed);
        vk.preprocessed_commit = pk.preprocessed->root();
    }

    std::vector<size_t> widths = vk.cached_main_widths;
    widths.push_back(vk.common_main_width);
    AirBuilder builder(vk.preprocessed_width, widths, vk.num_public_values);
    try {
        air.eval(builder);
    } catch (const std::out_of_range& e) {
        throw KeygenError(KeygenErrorKind::WidthMismatch, vk.air_name, e.what());
    }

    const size_t max_degree = params_.max_constraint_degree();
    pk.interactions = builder.interactions();
    pk.chunks = logup::partition(pk.interactions, max_degree, vk.air_name);
    pk.interaction_dag = SymbolicDag::build(logup::interaction_roots(pk.interactions));
    vk.num_interactions = pk.interactions.size();
    vk.num_permutation_columns = pk.chunks.num_columns();

    std::vector<SymbolicExpression> constraints = builder.constraints();
    logup::append_constraints(pk.interactions, pk.chunks, constraints);
    vk.constraints = SymbolicDag::build(constraints);

    vk.max_constraint_degree = vk.constraints.max_degree();
    if (vk.max_constraint_degree > max_degree) {
        throw KeygenError(KeygenErrorKind::DegreeTooHigh, vk.air_name,
                          "constraint degree " + std::to_string(vk.max_constraint_degree) +
                              " exceeds " + std::to_string(max_degree));
    }
    size_t d = vk.max_constraint_degree > 2 ? vk.max_constraint_degree - 1 : 1;
    vk.quotient_degree = size_t{1} << log2_ceil(d);
    return pk;
}

MultiStarkProvingKey MultiStarkKeygenBuilder::generate_pk() const {
    TwoAdicPcs pcs(params_);
    MultiStarkProvingKey mpk;
    mpk.params = params_;

    std::map<BusIndex, std::pair<size_t, std::string>> bus_arity;
    for (const auto& air : airs_) {
        StarkProvingKey pk = keygen_air(*air, pcs);
        for (const auto& interaction : pk.interactions) {
            auto it = bus_arity.find(interaction.bus);
            if (it == bus_arity.end()) {
                bus_arity.emplace(interaction.bus, std::make_pair(interaction.fields.size(), pk.vk.air_name));
            } else if (it->second.first != interaction.fields.size()) {
                throw KeygenError(KeygenErrorKind::BusArityMismatch, pk.vk.air_name,
                                  "bus " + std::to_string(interaction.bus) + " has " +
                                      std::to_string(interaction.fields.size()) + " fields, " +
                                      it->second.second + " uses " + std::to_string(it->second.first));
            }
        }
        ZKRV_DEBUG_COUT("[keygen] " << pk.vk.air_name << ": " << pk.vk.constraints.roots.size()
                                    << " constraints, degree " << pk.vk.max_constraint_degree << ", "
                                    << pk.interactions.size() << " interactions\n");
        mpk.per_air.push_back(std::move(pk));
    }

    std::vector<StarkVerifyingKey> vks;
    vks.reserve(mpk.per_air.size());
    for (const auto& pk : mpk.per_air) {
        vks.push_back(pk.vk);
    }
    mpk.pre_hash = compute_vk_pre_hash(params_, vks);
    return mpk;
}

Digest compute_vk_pre_hash(const FriParameters& params, const std::vector<StarkVerifyingKey>& per_air) {
    std::vector<BFieldElement> words;
    auto push = [&words](uint64_t v) { words.emplace_back(v); };
    push(params.log_blowup);
    push(params.num_queries);
    push(params.proof_of_work_bits);
    push(params.log_final_poly_len);
    push(per_air.size());
    for (const auto& vk : per_air) {
        push(vk.preprocessed_width);
        if (vk.preprocessed_commit) {
            for (const auto& e : vk.preprocessed_commit->elements()) {
                words.push_back(e);
            }
        }
        push(vk.cached_main_widths.size());
        for (size_t w : vk.cached_main_widths) {
            push(w);
        }
        push(vk.common_main_width);
        push(vk.num_public_values);
        push(vk.num_permutation_columns);
        push(vk.quotient_degree);
        push(vk.constraints.nodes.size());
        for (const auto& node : vk.constraints.nodes) {
            push(static_cast<uint64_t>(node.kind));
            push(static_cast<uint64_t>(node.var.entry));
            push(node.var.part_index);
            push(node.var.offset);
            push(node.var.index);
            words.push_back(node.constant);
            push(node.lhs);
            push(node.rhs);
        }
        for (uint32_t root : vk.constraints.roots) {
            push(root);
        }
    }
    return Poseidon2::hash_varlen(words);
}

} // namespace zkrv
