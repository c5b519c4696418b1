#include "vm/config.hpp"
#include <fstream>
#include <stdexcept>

namespace zkrv {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

} // namespace

void MemoryConfig::validate() const {
    if (as_offset == 0) {
        throw std::invalid_argument("address space 0 is reserved for immediates");
    }
    if (pointer_max_bits < 3 || pointer_max_bits > 29) {
        throw std::invalid_argument("pointer_max_bits must lie in [3, 29], got " + std::to_string(pointer_max_bits));
    }
    if (clk_max_bits == 0 || clk_max_bits > 29) {
        throw std::invalid_argument("clk_max_bits must lie in [1, 29], got " + std::to_string(clk_max_bits));
    }
    if (decomp < 8 || decomp > 20) {
        throw std::invalid_argument("range checker decomposition must lie in [8, 20], got " + std::to_string(decomp));
    }
}

void SystemConfig::validate() const {
    memory_config.validate();
    if (num_public_values % 4 != 0) {
        throw std::invalid_argument("num_public_values must be a multiple of 4");
    }
    if (max_segment_len == 0) {
        throw std::invalid_argument("max_segment_len must be positive");
    }
}

VmConfig VmConfig::system_only() {
    VmConfig config;
    config.rv32i = false;
    config.rv32m = false;
    config.io = false;
    return config;
}

void VmConfig::validate() const {
    system.validate();
    if (rv32m && !rv32i) {
        throw std::invalid_argument("rv32m requires rv32i");
    }
    if (io && !rv32i) {
        throw std::invalid_argument("io requires rv32i");
    }
    if ((keccak || !moduli.empty() || !ecc_curves.empty() || !pairing_curves.empty()) && !rv32i) {
        throw std::invalid_argument("heap extensions require rv32i");
    }
    if (range_tuple_sizes[0] < 256 || range_tuple_sizes[1] < 1024) {
        throw std::invalid_argument("range tuple sizes must be at least [256, 1024]");
    }
}

VmConfig load_vm_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("cannot open config " + path);
    }
    auto json = nlohmann::json::parse(f);
    VmConfig config = json.get<VmConfig>();
    config.validate();
    return config;
}

void to_json(nlohmann::json& j, const FriParameters& p) {
    j = nlohmann::json{{"log_blowup", p.log_blowup},
                       {"num_queries", p.num_queries},
                       {"proof_of_work_bits", p.proof_of_work_bits},
                       {"log_final_poly_len", p.log_final_poly_len}};
}

void from_json(const nlohmann::json& j, FriParameters& p) {
    read_field(j, "log_blowup", p.log_blowup);
    read_field(j, "num_queries", p.num_queries);
    read_field(j, "proof_of_work_bits", p.proof_of_work_bits);
    read_field(j, "log_final_poly_len", p.log_final_poly_len);
}

void to_json(nlohmann::json& j, const MemoryConfig& c) {
    j = nlohmann::json{{"as_height", c.as_height},
                       {"as_offset", c.as_offset},
                       {"pointer_max_bits", c.pointer_max_bits},
                       {"clk_max_bits", c.clk_max_bits},
                       {"decomp", c.decomp}};
}

void from_json(const nlohmann::json& j, MemoryConfig& c) {
    read_field(j, "as_height", c.as_height);
    read_field(j, "as_offset", c.as_offset);
    read_field(j, "pointer_max_bits", c.pointer_max_bits);
    read_field(j, "clk_max_bits", c.clk_max_bits);
    read_field(j, "decomp", c.decomp);
}

void to_json(nlohmann::json& j, const SystemConfig& c) {
    j = nlohmann::json{{"fri_params", c.fri_params},
                       {"continuation_enabled", c.continuation_enabled},
                       {"memory_config", c.memory_config},
                       {"num_public_values", c.num_public_values},
                       {"max_segment_len", c.max_segment_len},
                       {"max_trace_height", c.max_trace_height}};
}

void from_json(const nlohmann::json& j, SystemConfig& c) {
    read_field(j, "fri_params", c.fri_params);
    read_field(j, "continuation_enabled", c.continuation_enabled);
    read_field(j, "memory_config", c.memory_config);
    read_field(j, "num_public_values", c.num_public_values);
    read_field(j, "max_segment_len", c.max_segment_len);
    read_field(j, "max_trace_height", c.max_trace_height);
}

void to_json(nlohmann::json& j, const VmConfig& c) {
    j = nlohmann::json{{"system", c.system},
                       {"rv32i", c.rv32i},
                       {"rv32m", c.rv32m},
                       {"io", c.io},
                       {"keccak", c.keccak},
                       {"native_poseidon2", c.native_poseidon2},
                       {"moduli", c.moduli},
                       {"ecc_curves", c.ecc_curves},
                       {"pairing_curves", c.pairing_curves},
                       {"range_tuple_sizes", c.range_tuple_sizes}};
}

void from_json(const nlohmann::json& j, VmConfig& c) {
    read_field(j, "system", c.system);
    read_field(j, "rv32i", c.rv32i);
    read_field(j, "rv32m", c.rv32m);
    read_field(j, "io", c.io);
    read_field(j, "keccak", c.keccak);
    read_field(j, "native_poseidon2", c.native_poseidon2);
    read_field(j, "moduli", c.moduli);
    read_field(j, "ecc_curves", c.ecc_curves);
    read_field(j, "pairing_curves", c.pairing_curves);
    read_field(j, "range_tuple_sizes", c.range_tuple_sizes);
}

} // namespace zkrv
