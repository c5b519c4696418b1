#include "memory/boundary.hpp"
#include "vm/bus.hpp"
#include <stdexcept>

namespace zkrv {

namespace {

namespace vcol {
constexpr size_t IS_VALID = 0;
constexpr size_t ADDRESS_SPACE = 1;
constexpr size_t POINTER = 2;
constexpr size_t DATA = 3;
constexpr size_t TIMESTAMP = 7;
constexpr size_t COMPARE = 8;
constexpr size_t MARKER = 9;
constexpr size_t DIFF_VAL = 11;
constexpr size_t LT_LIMBS = 12;
} // namespace vcol

namespace pcol {
constexpr size_t IS_INITIAL = 0;
constexpr size_t IS_FINAL = 1;
constexpr size_t ADDRESS_SPACE = 2;
constexpr size_t CHUNK_LABEL = 3;
constexpr size_t VALUES = 4;
constexpr size_t HASH = VALUES + CHUNK;
constexpr size_t TIMESTAMPS = HASH + Digest::LEN;
} // namespace pcol

} // namespace

VolatileBoundaryAir::VolatileBoundaryAir(const MemoryConfig& config)
    : lt_{config.pointer_max_bits, config.decomp} {}

void VolatileBoundaryAir::eval(AirBuilder& builder) const {
    auto main = builder.main();
    const Expr is_valid = main.local(vcol::IS_VALID);
    const Expr next_valid = main.next(vcol::IS_VALID);
    const Expr as = main.local(vcol::ADDRESS_SPACE);
    const Expr ptr = main.local(vcol::POINTER);
    const Expr compare = main.local(vcol::COMPARE);
    const Expr m0 = main.local(vcol::MARKER);
    const Expr m1 = main.local(vcol::MARKER + 1);
    const Expr diff_val = main.local(vcol::DIFF_VAL);

    builder.assert_bool(is_valid);
    // Valid rows form a prefix
    builder.when_transition().assert_zero((Expr(BFieldElement::one()) - is_valid) * next_valid);
    builder.when_transition().assert_eq(compare, is_valid * next_valid);
    builder.when_last_row().assert_zero(compare);

    // (as, ptr) < (next.as, next.ptr) on consecutive valid rows
    builder.assert_bool(m0);
    builder.assert_bool(m1);
    const Expr d_as = main.next(vcol::ADDRESS_SPACE) - as;
    const Expr d_ptr = main.next(vcol::POINTER) - ptr;
    builder.when(compare).assert_one(m0 + m1);
    builder.when(compare).assert_zero(m1 * d_as);
    builder.when(compare).assert_eq(diff_val, m0 * d_as + m1 * d_ptr);
    std::vector<Expr> limbs;
    for (size_t i = 0; i < lt_.num_limbs(); ++i) {
        limbs.push_back(main.local(vcol::LT_LIMBS + i));
    }
    lt_.eval(builder, Expr(), diff_val, limbs, compare);

    std::vector<Expr> initial{as, ptr, Expr(), Expr(), Expr(), Expr(), Expr()};
    builder.push_send(bus::MEMORY, initial, is_valid);
    std::vector<Expr> final_fields{as, ptr};
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        final_fields.push_back(main.local(vcol::DATA + i));
    }
    final_fields.push_back(main.local(vcol::TIMESTAMP));
    builder.push_receive(bus::MEMORY, final_fields, is_valid);
}

VolatileBoundaryChip::VolatileBoundaryChip(const MemoryConfig& config,
                                           std::shared_ptr<VariableRangeCheckerChip> range_checker)
    : air_(std::make_shared<VolatileBoundaryAir>(config)), range_checker_(std::move(range_checker)) {}

void VolatileBoundaryChip::set_final_memory(std::vector<TouchedBlock> blocks) {
    for (size_t i = 1; i < blocks.size(); ++i) {
        if (std::make_pair(blocks[i - 1].address_space, blocks[i - 1].pointer) >=
            std::make_pair(blocks[i].address_space, blocks[i].pointer)) {
            throw std::invalid_argument("touched blocks must be strictly sorted by address");
        }
    }
    blocks_ = std::move(blocks);
}

AirProofInput VolatileBoundaryChip::generate_air_proof_input() {
    const size_t width = air_->width();
    const size_t height = padded_height(blocks_.size());
    RowMajorMatrix<BFieldElement> trace(width, height);
    const auto& lt = air_->lt();

#pragma omp parallel for schedule(static)
    for (size_t r = 0; r < blocks_.size(); ++r) {
        BFieldElement* row = trace.row_mut(r);
        const TouchedBlock& block = blocks_[r];
        row[vcol::IS_VALID] = BFieldElement::one();
        row[vcol::ADDRESS_SPACE] = BFieldElement(block.address_space);
        row[vcol::POINTER] = BFieldElement(block.pointer);
        for (size_t i = 0; i < BLOCK_SIZE; ++i) {
            row[vcol::DATA + i] = block.data[i];
        }
        row[vcol::TIMESTAMP] = BFieldElement(block.timestamp);
        if (r + 1 < blocks_.size()) {
            const TouchedBlock& next = blocks_[r + 1];
            row[vcol::COMPARE] = BFieldElement::one();
            uint32_t diff;
            if (next.address_space != block.address_space) {
                row[vcol::MARKER] = BFieldElement::one();
                diff = next.address_space - block.address_space;
            } else {
                row[vcol::MARKER + 1] = BFieldElement::one();
                diff = next.pointer - block.pointer;
            }
            row[vcol::DIFF_VAL] = BFieldElement(diff);
            lt.generate(*range_checker_, 0, diff, row + vcol::LT_LIMBS);
        }
    }
    blocks_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

void PersistentBoundaryAir::eval(AirBuilder& builder) const {
    auto main = builder.main();
    const Expr is_initial = main.local(pcol::IS_INITIAL);
    const Expr is_final = main.local(pcol::IS_FINAL);
    const Expr as = main.local(pcol::ADDRESS_SPACE);
    const Expr chunk_label = main.local(pcol::CHUNK_LABEL);
    const Expr is_valid = is_initial + is_final;

    builder.assert_bool(is_initial);
    builder.assert_bool(is_final);
    builder.assert_zero(is_initial * is_final);

    for (size_t b = 0; b < BLOCKS_PER_CHUNK; ++b) {
        const Expr ts = main.local(pcol::TIMESTAMPS + b);
        builder.when(is_initial).assert_zero(ts);
        std::vector<Expr> fields{as, chunk_label * static_cast<int64_t>(CHUNK) + static_cast<int64_t>(b * BLOCK_SIZE)};
        for (size_t i = 0; i < BLOCK_SIZE; ++i) {
            fields.push_back(main.local(pcol::VALUES + b * BLOCK_SIZE + i));
        }
        fields.push_back(ts);
        // Sends at the start of the segment, receives at its end
        builder.push_send(bus::MEMORY, std::move(fields), is_initial - is_final);
    }

    std::vector<Expr> compress_fields;
    for (size_t i = 0; i < CHUNK; ++i) {
        compress_fields.push_back(main.local(pcol::VALUES + i));
    }
    for (size_t i = 0; i < Digest::LEN; ++i) {
        compress_fields.push_back(Expr());
    }
    std::vector<Expr> hash;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        hash.push_back(main.local(pcol::HASH + i));
    }
    compress_fields.insert(compress_fields.end(), hash.begin(), hash.end());
    builder.push_send(bus::POSEIDON2_DIRECT, std::move(compress_fields), is_valid);

    const int64_t chunk_span = int64_t{1} << (config_.pointer_max_bits - 3);
    const Expr leaf_label = (as - static_cast<int64_t>(config_.as_offset)) * chunk_span + chunk_label;
    std::vector<Expr> merkle_fields{is_final, Expr(), leaf_label};
    merkle_fields.insert(merkle_fields.end(), hash.begin(), hash.end());
    builder.push_receive(bus::MERKLE, std::move(merkle_fields), is_valid);
}

PersistentBoundaryChip::PersistentBoundaryChip(const MemoryConfig& config,
                                               std::shared_ptr<Poseidon2PeripheryChip> poseidon2)
    : air_(std::make_shared<PersistentBoundaryAir>(config)), poseidon2_(std::move(poseidon2)) {}

void PersistentBoundaryChip::set_touched_chunks(std::vector<TouchedChunk> chunks) {
    chunks_ = std::move(chunks);
}

AirProofInput PersistentBoundaryChip::generate_air_proof_input() {
    const size_t height = padded_height(2 * chunks_.size());
    RowMajorMatrix<BFieldElement> trace(PersistentBoundaryAir::WIDTH, height);
    const Compressor compress = [this](const Digest& l, const Digest& r) { return poseidon2_->compress(l, r); };

#pragma omp parallel for schedule(static)
    for (size_t c = 0; c < chunks_.size(); ++c) {
        const TouchedChunk& chunk = chunks_[c];
        for (size_t phase = 0; phase < 2; ++phase) {
            BFieldElement* row = trace.row_mut(2 * c + phase);
            const ChunkValues& values = phase == 0 ? chunk.initial_values : chunk.final_values;
            row[phase == 0 ? pcol::IS_INITIAL : pcol::IS_FINAL] = BFieldElement::one();
            row[pcol::ADDRESS_SPACE] = BFieldElement(chunk.address_space);
            row[pcol::CHUNK_LABEL] = BFieldElement(chunk.chunk_label);
            for (size_t i = 0; i < CHUNK; ++i) {
                row[pcol::VALUES + i] = values[i];
            }
            const Digest hash = MemoryMerkleTree::leaf_hash(values, compress);
            for (size_t i = 0; i < Digest::LEN; ++i) {
                row[pcol::HASH + i] = hash[i];
            }
            if (phase == 1) {
                for (size_t b = 0; b < BLOCKS_PER_CHUNK; ++b) {
                    row[pcol::TIMESTAMPS + b] = BFieldElement(chunk.final_timestamps[b]);
                }
            }
        }
    }
    chunks_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

} // namespace zkrv
