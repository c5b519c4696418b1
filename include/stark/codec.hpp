#pragma once

#include "stark/keygen.hpp"
#include "stark/proof.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace zkrv {

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error("decode error: " + what) {}
};

/**
 * Encoder - little-endian binary writer
 *
 * Lengths are u64, field elements u32 canonical, extension elements four
 * u32 coefficients, digests eight u32.
 */
class Encoder {
public:
    void write_u8(uint8_t v) { bytes_.push_back(v); }
    void write_u32(uint32_t v);
    void write_u64(uint64_t v);
    void write(BFieldElement v) { write_u32(v.value()); }
    void write(const XFieldElement& v);
    void write(const Digest& d);

    template <typename T>
    void write_vec(const std::vector<T>& items) {
        write_u64(items.size());
        for (const auto& item : items) {
            write(item);
        }
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t> take() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

class Decoder {
public:
    explicit Decoder(const std::vector<uint8_t>& bytes) : bytes_(bytes) {}

    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    BFieldElement read_bfe();
    XFieldElement read_xfe();
    Digest read_digest();
    // Length prefix bounded by the remaining input
    size_t read_len(size_t min_item_size = 1);

    std::vector<BFieldElement> read_bfe_vec();
    std::vector<XFieldElement> read_xfe_vec();
    std::vector<Digest> read_digest_vec();

    bool done() const { return pos_ == bytes_.size(); }
    void expect_done() const;

private:
    const std::vector<uint8_t>& bytes_;
    size_t pos_ = 0;

    void need(size_t n) const;
};

/**
 * ProgramCommitment - public identity of a committed executable
 *
 * What a verifier needs besides the verifying key: the program trace
 * root, the entry pc, the program shape and, for persistent memory, the
 * Merkle root of the initial memory image.
 */
struct ProgramCommitment {
    Digest commit;
    uint32_t pc_start = 0;
    uint32_t pc_base = 0;
    uint64_t num_slots = 0;
    std::optional<Digest> init_memory_root;

    bool operator==(const ProgramCommitment& o) const {
        return commit == o.commit && pc_start == o.pc_start && pc_base == o.pc_base && num_slots == o.num_slots &&
               init_memory_root == o.init_memory_root;
    }
};

namespace codec {

constexpr uint32_t MAGIC = 0x56524b5a;  // "ZKRV"
constexpr uint32_t VERSION = 1;

std::vector<uint8_t> encode_proof(const Proof& proof);
Proof decode_proof(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> encode_vk(const MultiStarkVerifyingKey& vk);
MultiStarkVerifyingKey decode_vk(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> encode_program_commitment(const ProgramCommitment& commitment);
ProgramCommitment decode_program_commitment(const std::vector<uint8_t>& bytes);

void write_file(const std::string& path, const std::vector<uint8_t>& bytes);
std::vector<uint8_t> read_file(const std::string& path);

} // namespace codec

} // namespace zkrv
