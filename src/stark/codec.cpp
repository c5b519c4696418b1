#include "stark/codec.hpp"
#include <fstream>
#include <iterator>

namespace zkrv {

void Encoder::write_u32(uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        bytes_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void Encoder::write_u64(uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        bytes_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void Encoder::write(const XFieldElement& v) {
    for (const auto& c : v.coefficients()) {
        write(c);
    }
}

void Encoder::write(const Digest& d) {
    for (const auto& e : d.elements()) {
        write(e);
    }
}

void Decoder::need(size_t n) const {
    if (bytes_.size() - pos_ < n) {
        throw DecodeError("unexpected end of input at byte " + std::to_string(pos_));
    }
}

uint8_t Decoder::read_u8() {
    need(1);
    return bytes_[pos_++];
}

uint32_t Decoder::read_u32() {
    need(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(bytes_[pos_++]) << (8 * i);
    }
    return v;
}

uint64_t Decoder::read_u64() {
    need(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(bytes_[pos_++]) << (8 * i);
    }
    return v;
}

BFieldElement Decoder::read_bfe() {
    uint32_t v = read_u32();
    if (v >= BFieldElement::MODULUS) {
        throw DecodeError("non-canonical field element " + std::to_string(v));
    }
    return BFieldElement(v);
}

XFieldElement Decoder::read_xfe() {
    BFieldElement c0 = read_bfe();
    BFieldElement c1 = read_bfe();
    BFieldElement c2 = read_bfe();
    BFieldElement c3 = read_bfe();
    return XFieldElement(c0, c1, c2, c3);
}

Digest Decoder::read_digest() {
    std::array<BFieldElement, Digest::LEN> elements;
    for (auto& e : elements) {
        e = read_bfe();
    }
    return Digest(elements);
}

size_t Decoder::read_len(size_t min_item_size) {
    uint64_t len = read_u64();
    if (min_item_size > 0 && len > (bytes_.size() - pos_) / min_item_size) {
        throw DecodeError("length " + std::to_string(len) + " exceeds remaining input");
    }
    return static_cast<size_t>(len);
}

std::vector<BFieldElement> Decoder::read_bfe_vec() {
    std::vector<BFieldElement> out(read_len(4));
    for (auto& v : out) {
        v = read_bfe();
    }
    return out;
}

std::vector<XFieldElement> Decoder::read_xfe_vec() {
    std::vector<XFieldElement> out(read_len(16));
    for (auto& v : out) {
        v = read_xfe();
    }
    return out;
}

std::vector<Digest> Decoder::read_digest_vec() {
    std::vector<Digest> out(read_len(32));
    for (auto& v : out) {
        v = read_digest();
    }
    return out;
}

void Decoder::expect_done() const {
    if (!done()) {
        throw DecodeError(std::to_string(bytes_.size() - pos_) + " trailing bytes");
    }
}

namespace codec {

namespace {

void write_header(Encoder& enc, uint8_t kind) {
    enc.write_u32(MAGIC);
    enc.write_u32(VERSION);
    enc.write_u8(kind);
}

void read_header(Decoder& dec, uint8_t kind) {
    if (dec.read_u32() != MAGIC) {
        throw DecodeError("bad magic");
    }
    uint32_t version = dec.read_u32();
    if (version != VERSION) {
        throw DecodeError("unsupported version " + std::to_string(version));
    }
    if (dec.read_u8() != kind) {
        throw DecodeError("unexpected object kind");
    }
}

constexpr uint8_t KIND_PROOF = 1;
constexpr uint8_t KIND_VK = 2;
constexpr uint8_t KIND_PROGRAM = 3;

void write_fri_params(Encoder& enc, const FriParameters& p) {
    enc.write_u64(p.log_blowup);
    enc.write_u64(p.num_queries);
    enc.write_u64(p.proof_of_work_bits);
    enc.write_u64(p.log_final_poly_len);
}

FriParameters read_fri_params(Decoder& dec) {
    FriParameters p;
    p.log_blowup = dec.read_u64();
    p.num_queries = dec.read_u64();
    p.proof_of_work_bits = dec.read_u64();
    p.log_final_poly_len = dec.read_u64();
    return p;
}

} // namespace

std::vector<uint8_t> encode_proof(const Proof& proof) {
    Encoder enc;
    write_header(enc, KIND_PROOF);

    enc.write_u64(proof.per_air.size());
    for (const auto& data : proof.per_air) {
        enc.write_u64(data.air_id);
        enc.write_u64(data.log_height);
        enc.write_vec(data.public_values);
        enc.write_vec(data.exposed_values);
    }
    enc.write_u64(proof.cached_main_commits.size());
    for (const auto& c : proof.cached_main_commits) {
        enc.write_vec(c);
    }
    enc.write_vec(proof.main_commit);
    enc.write_u8(proof.after_challenge_commit ? 1 : 0);
    if (proof.after_challenge_commit) {
        enc.write_vec(*proof.after_challenge_commit);
    }
    enc.write_vec(proof.quotient_commit);

    enc.write_u64(proof.opened_values.size());
    for (const auto& round : proof.opened_values) {
        enc.write_u64(round.size());
        for (const auto& matrix : round) {
            enc.write_u64(matrix.size());
            for (const auto& point : matrix) {
                enc.write_vec(point);
            }
        }
    }

    const PcsProof& pcs = proof.opening_proof;
    enc.write_u64(pcs.query_openings.size());
    for (const auto& query : pcs.query_openings) {
        enc.write_u64(query.size());
        for (const auto& round : query) {
            enc.write_u64(round.size());
            for (const auto& opening : round) {
                enc.write_vec(opening.row);
                enc.write_vec(opening.auth_path);
            }
        }
    }
    const FriProof& fri = pcs.fri_proof;
    enc.write_vec(fri.commit_roots);
    enc.write_u64(fri.query_proofs.size());
    for (const auto& q : fri.query_proofs) {
        enc.write_u64(q.layers.size());
        for (const auto& layer : q.layers) {
            enc.write(layer.sibling_value);
            enc.write_vec(layer.auth_path);
        }
    }
    enc.write_vec(fri.final_poly);
    enc.write(fri.pow_witness);
    return enc.take();
}

Proof decode_proof(const std::vector<uint8_t>& bytes) {
    Decoder dec(bytes);
    read_header(dec, KIND_PROOF);
    Proof proof;

    proof.per_air.resize(dec.read_len(32));
    for (auto& data : proof.per_air) {
        data.air_id = dec.read_u64();
        data.log_height = dec.read_u64();
        data.public_values = dec.read_bfe_vec();
        data.exposed_values = dec.read_xfe_vec();
    }
    proof.cached_main_commits.resize(dec.read_len(8));
    for (auto& c : proof.cached_main_commits) {
        c = dec.read_digest_vec();
    }
    proof.main_commit = dec.read_digest_vec();
    if (dec.read_u8() != 0) {
        proof.after_challenge_commit = dec.read_digest_vec();
    }
    proof.quotient_commit = dec.read_digest_vec();

    proof.opened_values.resize(dec.read_len(8));
    for (auto& round : proof.opened_values) {
        round.resize(dec.read_len(8));
        for (auto& matrix : round) {
            matrix.resize(dec.read_len(8));
            for (auto& point : matrix) {
                point = dec.read_xfe_vec();
            }
        }
    }

    PcsProof& pcs = proof.opening_proof;
    pcs.query_openings.resize(dec.read_len(8));
    for (auto& query : pcs.query_openings) {
        query.resize(dec.read_len(8));
        for (auto& round : query) {
            round.resize(dec.read_len(16));
            for (auto& opening : round) {
                opening.row = dec.read_bfe_vec();
                opening.auth_path = dec.read_digest_vec();
            }
        }
    }
    FriProof& fri = pcs.fri_proof;
    fri.commit_roots = dec.read_digest_vec();
    fri.query_proofs.resize(dec.read_len(8));
    for (auto& q : fri.query_proofs) {
        q.layers.resize(dec.read_len(24));
        for (auto& layer : q.layers) {
            layer.sibling_value = dec.read_xfe();
            layer.auth_path = dec.read_digest_vec();
        }
    }
    fri.final_poly = dec.read_xfe_vec();
    fri.pow_witness = dec.read_bfe();
    dec.expect_done();
    return proof;
}

std::vector<uint8_t> encode_vk(const MultiStarkVerifyingKey& vk) {
    Encoder enc;
    write_header(enc, KIND_VK);
    write_fri_params(enc, vk.params);
    enc.write(vk.pre_hash);
    enc.write_u64(vk.per_air.size());
    for (const auto& air : vk.per_air) {
        enc.write_u64(air.air_name.size());
        for (char ch : air.air_name) {
            enc.write_u8(static_cast<uint8_t>(ch));
        }
        enc.write_u64(air.preprocessed_width);
        enc.write_u8(air.preprocessed_commit ? 1 : 0);
        if (air.preprocessed_commit) {
            enc.write(*air.preprocessed_commit);
        }
        enc.write_u64(air.preprocessed_log_height);
        enc.write_u64(air.cached_main_widths.size());
        for (size_t w : air.cached_main_widths) {
            enc.write_u64(w);
        }
        enc.write_u64(air.common_main_width);
        enc.write_u64(air.num_public_values);
        enc.write_u64(air.num_interactions);
        enc.write_u64(air.num_permutation_columns);
        enc.write_u64(air.max_constraint_degree);
        enc.write_u64(air.quotient_degree);
        enc.write_u64(air.constraints.nodes.size());
        for (const auto& node : air.constraints.nodes) {
            enc.write_u8(static_cast<uint8_t>(node.kind));
            enc.write_u8(static_cast<uint8_t>(node.var.entry));
            enc.write_u32(node.var.part_index);
            enc.write_u32(node.var.offset);
            enc.write_u32(node.var.index);
            enc.write(node.constant);
            enc.write_u32(node.lhs);
            enc.write_u32(node.rhs);
            enc.write_u8(node.extension ? 1 : 0);
            enc.write_u64(node.degree);
        }
        enc.write_u64(air.constraints.roots.size());
        for (uint32_t root : air.constraints.roots) {
            enc.write_u32(root);
        }
    }
    return enc.take();
}

MultiStarkVerifyingKey decode_vk(const std::vector<uint8_t>& bytes) {
    Decoder dec(bytes);
    read_header(dec, KIND_VK);
    MultiStarkVerifyingKey vk;
    vk.params = read_fri_params(dec);
    vk.pre_hash = dec.read_digest();
    vk.per_air.resize(dec.read_len(64));
    for (auto& air : vk.per_air) {
        size_t name_len = dec.read_len(1);
        for (size_t i = 0; i < name_len; ++i) {
            air.air_name.push_back(static_cast<char>(dec.read_u8()));
        }
        air.preprocessed_width = dec.read_u64();
        if (dec.read_u8() != 0) {
            air.preprocessed_commit = dec.read_digest();
        }
        air.preprocessed_log_height = dec.read_u64();
        air.cached_main_widths.resize(dec.read_len(8));
        for (auto& w : air.cached_main_widths) {
            w = dec.read_u64();
        }
        air.common_main_width = dec.read_u64();
        air.num_public_values = dec.read_u64();
        air.num_interactions = dec.read_u64();
        air.num_permutation_columns = dec.read_u64();
        air.max_constraint_degree = dec.read_u64();
        air.quotient_degree = dec.read_u64();
        air.constraints.nodes.resize(dec.read_len(35));
        for (size_t i = 0; i < air.constraints.nodes.size(); ++i) {
            DagNode& node = air.constraints.nodes[i];
            uint8_t kind = dec.read_u8();
            uint8_t entry = dec.read_u8();
            if (kind > static_cast<uint8_t>(ExprKind::Mul) || entry > static_cast<uint8_t>(Entry::Exposed)) {
                throw DecodeError("invalid constraint node");
            }
            node.kind = static_cast<ExprKind>(kind);
            node.var.entry = static_cast<Entry>(entry);
            node.var.part_index = dec.read_u32();
            node.var.offset = dec.read_u32();
            node.var.index = dec.read_u32();
            node.constant = dec.read_bfe();
            node.lhs = dec.read_u32();
            node.rhs = dec.read_u32();
            node.extension = dec.read_u8() != 0;
            node.degree = dec.read_u64();
            // Operands must precede their users
            const bool unary = node.kind == ExprKind::Neg;
            const bool binary = node.kind == ExprKind::Add || node.kind == ExprKind::Sub ||
                                node.kind == ExprKind::Mul;
            if (((unary || binary) && node.lhs >= i) || (binary && node.rhs >= i)) {
                throw DecodeError("constraint node operand out of order");
            }
        }
        air.constraints.roots.resize(dec.read_len(4));
        for (auto& root : air.constraints.roots) {
            root = dec.read_u32();
            if (root >= air.constraints.nodes.size()) {
                throw DecodeError("constraint root out of range");
            }
        }
    }
    dec.expect_done();
    return vk;
}

std::vector<uint8_t> encode_program_commitment(const ProgramCommitment& commitment) {
    Encoder enc;
    write_header(enc, KIND_PROGRAM);
    enc.write(commitment.commit);
    enc.write_u32(commitment.pc_start);
    enc.write_u32(commitment.pc_base);
    enc.write_u64(commitment.num_slots);
    enc.write_u8(commitment.init_memory_root ? 1 : 0);
    if (commitment.init_memory_root) {
        enc.write(*commitment.init_memory_root);
    }
    return enc.take();
}

ProgramCommitment decode_program_commitment(const std::vector<uint8_t>& bytes) {
    Decoder dec(bytes);
    read_header(dec, KIND_PROGRAM);
    ProgramCommitment out;
    out.commit = dec.read_digest();
    out.pc_start = dec.read_u32();
    out.pc_base = dec.read_u32();
    out.num_slots = dec.read_u64();
    const uint8_t has_root = dec.read_u8();
    if (has_root > 1) {
        throw DecodeError("bad init memory flag " + std::to_string(has_root));
    }
    if (has_root == 1) {
        out.init_memory_root = dec.read_digest();
    }
    dec.expect_done();
    return out;
}

void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace codec

} // namespace zkrv
