#pragma once

#include "fri/fri.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace zkrv {

/**
 * MemoryConfig - shape of the address space and of the offline checker
 *
 * Address spaces [as_offset, as_offset + 2^as_height) are memory backed.
 * Pointers are below 2^pointer_max_bits, timestamps below 2^clk_max_bits.
 * decomp is the limb size of the variable range checker.
 */
struct MemoryConfig {
    size_t as_height = 2;
    uint32_t as_offset = 1;
    size_t pointer_max_bits = 29;
    size_t clk_max_bits = 29;
    size_t decomp = 17;

    uint32_t max_address_space() const { return as_offset + (uint32_t{1} << as_height) - 1; }

    // Limbs needed to decompose a timestamp difference
    size_t timestamp_lt_limbs() const { return (clk_max_bits + decomp - 1) / decomp; }

    void validate() const;
};

constexpr size_t DEFAULT_MAX_SEGMENT_LEN = (size_t{1} << 22) - 100;
constexpr size_t DEFAULT_MAX_NUM_PUBLIC_VALUES = 32;

struct SystemConfig {
    FriParameters fri_params = FriParameters::standard();
    bool continuation_enabled = false;
    MemoryConfig memory_config;
    // Number of public value bytes, a multiple of 4
    size_t num_public_values = DEFAULT_MAX_NUM_PUBLIC_VALUES;
    size_t max_segment_len = DEFAULT_MAX_SEGMENT_LEN;
    // Soft cap on any chip's trace height before a segment is cut
    size_t max_trace_height = size_t{1} << 22;

    size_t max_constraint_degree() const { return fri_params.max_constraint_degree(); }

    SystemConfig& with_continuations() { continuation_enabled = true; return *this; }
    SystemConfig& without_continuations() { continuation_enabled = false; return *this; }
    SystemConfig& with_public_values(size_t n) { num_public_values = n; return *this; }
    SystemConfig& with_max_segment_len(size_t n) { max_segment_len = n; return *this; }
    SystemConfig& with_fri_params(const FriParameters& p) { fri_params = p; return *this; }

    void validate() const;
};

/**
 * VmConfig - system configuration plus the enabled instruction extensions
 *
 * Moduli are decimal strings; curves are referred to by name
 * ("secp256k1", "bn254", "bls12_381").
 */
struct VmConfig {
    SystemConfig system;
    bool rv32i = true;
    bool rv32m = true;
    bool io = true;
    bool keccak = false;
    bool native_poseidon2 = false;
    std::vector<std::string> moduli;
    std::vector<std::string> ecc_curves;
    std::vector<std::string> pairing_curves;
    std::array<uint32_t, 2> range_tuple_sizes = {256, 2048};

    static VmConfig rv32im() { return VmConfig{}; }

    // Bare system: connector, program, phantom and terminate only
    static VmConfig system_only();

    void validate() const;
};

VmConfig load_vm_config(const std::string& path);

void to_json(nlohmann::json& j, const FriParameters& p);
void from_json(const nlohmann::json& j, FriParameters& p);
void to_json(nlohmann::json& j, const MemoryConfig& c);
void from_json(const nlohmann::json& j, MemoryConfig& c);
void to_json(nlohmann::json& j, const SystemConfig& c);
void from_json(const nlohmann::json& j, SystemConfig& c);
void to_json(nlohmann::json& j, const VmConfig& c);
void from_json(const nlohmann::json& j, VmConfig& c);

} // namespace zkrv
