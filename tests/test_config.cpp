#include <gtest/gtest.h>
#include "vm/config.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace zkrv;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("zkrv_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json"))
                    .string();
    }

    void TearDown() override { std::remove(path_.c_str()); }

    void write(const nlohmann::json& j) const {
        std::ofstream f(path_);
        f << j.dump(2);
    }
};

TEST_F(ConfigTest, JsonRoundtrip) {
    VmConfig config = VmConfig::rv32im();
    config.system.with_continuations().with_max_segment_len(1 << 16).with_fri_params(FriParameters::testing());
    config.system.memory_config.pointer_max_bits = 24;
    config.keccak = true;
    config.moduli = {"21888242871839275222246405745257275088696311157297823662689037894645226208583"};
    config.ecc_curves = {"bn254"};

    const nlohmann::json j = config;
    EXPECT_EQ(j["system"]["fri_params"]["num_queries"], 8);
    EXPECT_EQ(j["system"]["memory_config"]["pointer_max_bits"], 24);

    const VmConfig back = j.get<VmConfig>();
    EXPECT_EQ(back.system.fri_params, config.system.fri_params);
    EXPECT_TRUE(back.system.continuation_enabled);
    EXPECT_EQ(back.system.max_segment_len, size_t{1} << 16);
    EXPECT_EQ(back.system.memory_config.pointer_max_bits, 24U);
    EXPECT_TRUE(back.keccak);
    EXPECT_FALSE(back.native_poseidon2);
    EXPECT_EQ(back.moduli, config.moduli);
    EXPECT_EQ(back.ecc_curves, config.ecc_curves);
    EXPECT_EQ(back.range_tuple_sizes, config.range_tuple_sizes);
}

// Missing keys keep their defaults
TEST_F(ConfigTest, PartialJsonUsesDefaults) {
    write({{"keccak", true}, {"system", {{"fri_params", {{"num_queries", 20}}}}}});
    const VmConfig config = load_vm_config(path_);
    EXPECT_TRUE(config.keccak);
    EXPECT_TRUE(config.rv32m);
    EXPECT_EQ(config.system.fri_params.num_queries, 20U);
    EXPECT_EQ(config.system.fri_params.log_blowup, FriParameters::standard().log_blowup);
    EXPECT_EQ(config.system.num_public_values, DEFAULT_MAX_NUM_PUBLIC_VALUES);
    EXPECT_EQ(config.system.memory_config.decomp, 17U);
}

TEST_F(ConfigTest, LoadRejectsInvalidConfig) {
    write({{"rv32i", false}});
    EXPECT_THROW(load_vm_config(path_), std::invalid_argument);

    write({{"system", {{"num_public_values", 30}}}});
    EXPECT_THROW(load_vm_config(path_), std::invalid_argument);

    write({{"system", {{"memory_config", {{"pointer_max_bits", 31}}}}}});
    EXPECT_THROW(load_vm_config(path_), std::invalid_argument);

    write({{"system", {{"memory_config", {{"as_offset", 0}}}}}});
    EXPECT_THROW(load_vm_config(path_), std::invalid_argument);

    write({{"range_tuple_sizes", {128, 2048}}});
    EXPECT_THROW(load_vm_config(path_), std::invalid_argument);
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_THROW(load_vm_config(path_ + ".absent"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedJsonRejected) {
    {
        std::ofstream f(path_);
        f << "{ \"keccak\": ";
    }
    EXPECT_THROW(load_vm_config(path_), nlohmann::json::parse_error);
}

TEST_F(ConfigTest, Validation) {
    VmConfig config = VmConfig::rv32im();
    EXPECT_NO_THROW(config.validate());

    VmConfig m_only = VmConfig::rv32im();
    m_only.rv32i = false;
    m_only.io = false;
    EXPECT_THROW(m_only.validate(), std::invalid_argument);

    VmConfig heap_only = VmConfig::system_only();
    heap_only.keccak = true;
    EXPECT_THROW(heap_only.validate(), std::invalid_argument);
    EXPECT_NO_THROW(VmConfig::system_only().validate());

    VmConfig zero_segment = VmConfig::rv32im();
    zero_segment.system.max_segment_len = 0;
    EXPECT_THROW(zero_segment.validate(), std::invalid_argument);
}

TEST_F(ConfigTest, MemoryConfigDerivedValues) {
    MemoryConfig config;
    EXPECT_EQ(config.max_address_space(), 4U);
    EXPECT_EQ(config.timestamp_lt_limbs(), 2U);
    config.clk_max_bits = 17;
    EXPECT_EQ(config.timestamp_lt_limbs(), 1U);
}
