#include "memory/merkle_chip.hpp"
#include "vm/bus.hpp"
#include <set>
#include <stdexcept>

namespace zkrv {

namespace {

namespace col {
constexpr size_t IS_INITIAL = 0;
constexpr size_t IS_FINAL = 1;
constexpr size_t IS_ROOT = 2;
constexpr size_t HEIGHT = 3;
constexpr size_t LABEL = 4;
constexpr size_t PARENT_HASH = 5;
constexpr size_t LEFT_HASH = PARENT_HASH + Digest::LEN;
constexpr size_t RIGHT_HASH = LEFT_HASH + Digest::LEN;
constexpr size_t LEFT_TOUCHED = RIGHT_HASH + Digest::LEN;
constexpr size_t RIGHT_TOUCHED = LEFT_TOUCHED + 1;
} // namespace col

// Tag of messages about a child whose hash is the same before and after
constexpr int64_t UNTOUCHED_TAG = 2;

} // namespace

void MemoryMerkleAir::eval(AirBuilder& builder) const {
    auto main = builder.main();
    const Expr one(BFieldElement::one());
    const Expr is_initial = main.local(col::IS_INITIAL);
    const Expr is_final = main.local(col::IS_FINAL);
    const Expr is_root = main.local(col::IS_ROOT);
    const Expr height = main.local(col::HEIGHT);
    const Expr label = main.local(col::LABEL);
    const Expr is_valid = is_initial + is_final;

    builder.assert_bool(is_initial);
    builder.assert_bool(is_final);
    builder.assert_bool(is_root);
    builder.assert_zero(is_initial * is_final);
    builder.assert_zero(is_root * (one - is_valid));
    builder.when(is_root).assert_eq(height, Expr::from_u64(tree_height_));
    builder.when(is_root).assert_zero(label);

    builder.when_first_row().assert_one(is_root);
    builder.when_first_row().assert_one(is_initial);
    builder.when_first_row().assert_one(main.next(col::IS_ROOT));
    builder.when_first_row().assert_one(main.next(col::IS_FINAL));

    std::vector<Expr> parent_hash;
    std::vector<Expr> left_hash;
    std::vector<Expr> right_hash;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        parent_hash.push_back(main.local(col::PARENT_HASH + i));
        left_hash.push_back(main.local(col::LEFT_HASH + i));
        right_hash.push_back(main.local(col::RIGHT_HASH + i));
        builder.when(is_root * is_initial).assert_eq(parent_hash[i], builder.public_value(i));
        builder.when(is_root * is_final).assert_eq(parent_hash[i], builder.public_value(Digest::LEN + i));
    }

    std::vector<Expr> self_fields{is_final, height, label};
    self_fields.insert(self_fields.end(), parent_hash.begin(), parent_hash.end());
    builder.push_receive(bus::MERKLE, std::move(self_fields), is_valid - is_root);

    auto send_child = [&](const Expr& touched, const Expr& child_label, const std::vector<Expr>& hash) {
        const Expr untouched = one - touched;
        const Expr tag = touched * is_final + untouched * UNTOUCHED_TAG;
        const Expr count = touched * is_valid + untouched * (is_initial - is_final);
        std::vector<Expr> fields{tag, height - 1, child_label};
        fields.insert(fields.end(), hash.begin(), hash.end());
        builder.push_send(bus::MERKLE, std::move(fields), count);
    };
    const Expr left_touched = main.local(col::LEFT_TOUCHED);
    const Expr right_touched = main.local(col::RIGHT_TOUCHED);
    builder.assert_bool(left_touched);
    builder.assert_bool(right_touched);
    send_child(left_touched, label * 2, left_hash);
    send_child(right_touched, label * 2 + 1, right_hash);

    std::vector<Expr> compress_fields = left_hash;
    compress_fields.insert(compress_fields.end(), right_hash.begin(), right_hash.end());
    compress_fields.insert(compress_fields.end(), parent_hash.begin(), parent_hash.end());
    builder.push_send(bus::POSEIDON2_DIRECT, std::move(compress_fields), is_valid);
}

MemoryMerkleChip::MemoryMerkleChip(const MemoryConfig& config, std::shared_ptr<Poseidon2PeripheryChip> poseidon2)
    : config_(config),
      air_(std::make_shared<MemoryMerkleAir>(config.as_height + config.pointer_max_bits - 3)),
      poseidon2_(std::move(poseidon2)) {}

void MemoryMerkleChip::set_final_memory(const FinalMemory& final_memory) {
    if (final_memory.mode != MemoryMode::Persistent || !final_memory.initial_tree || !final_memory.final_tree) {
        throw std::invalid_argument("Merkle chip needs the trees of a persistent segment");
    }
    const MemoryMerkleTree& initial = *final_memory.initial_tree;
    const MemoryMerkleTree& final_tree = *final_memory.final_tree;
    const size_t tree_height = initial.height();

    // touched[h] = labels at height h on a path to a touched chunk
    std::vector<std::set<uint64_t>> touched(tree_height + 1);
    for (const auto& chunk : final_memory.chunks) {
        touched[0].insert(initial.leaf_label(chunk.address_space, chunk.chunk_label));
    }
    for (size_t h = 1; h <= tree_height; ++h) {
        for (uint64_t label : touched[h - 1]) {
            touched[h].insert(label >> 1);
        }
    }
    touched[tree_height].insert(0);

    rows_.clear();
    initial_root_ = initial.root();
    final_root_ = final_tree.root();
    for (size_t h = tree_height; h >= 1; --h) {
        for (uint64_t label : touched[h]) {
            for (int phase = 0; phase < 2; ++phase) {
                const MemoryMerkleTree& tree = phase == 0 ? initial : final_tree;
                NodeRow row;
                row.is_final = phase == 1;
                row.is_root = h == tree_height;
                row.height = h;
                row.label = label;
                row.left = tree.node(h - 1, 2 * label);
                row.right = tree.node(h - 1, 2 * label + 1);
                row.left_touched = touched[h - 1].count(2 * label) > 0;
                row.right_touched = touched[h - 1].count(2 * label + 1) > 0;
                rows_.push_back(row);
            }
        }
    }
}

AirProofInput MemoryMerkleChip::generate_air_proof_input() {
    const size_t height = padded_height(rows_.size());
    RowMajorMatrix<BFieldElement> trace(MemoryMerkleAir::WIDTH, height);

#pragma omp parallel for schedule(static)
    for (size_t r = 0; r < rows_.size(); ++r) {
        const NodeRow& node = rows_[r];
        BFieldElement* row = trace.row_mut(r);
        row[node.is_final ? col::IS_FINAL : col::IS_INITIAL] = BFieldElement::one();
        row[col::IS_ROOT] = node.is_root ? BFieldElement::one() : BFieldElement::zero();
        row[col::HEIGHT] = BFieldElement(node.height);
        row[col::LABEL] = BFieldElement(node.label);
        const Digest parent = poseidon2_->compress(node.left, node.right);
        for (size_t i = 0; i < Digest::LEN; ++i) {
            row[col::PARENT_HASH + i] = parent[i];
            row[col::LEFT_HASH + i] = node.left[i];
            row[col::RIGHT_HASH + i] = node.right[i];
        }
        row[col::LEFT_TOUCHED] = node.left_touched ? BFieldElement::one() : BFieldElement::zero();
        row[col::RIGHT_TOUCHED] = node.right_touched ? BFieldElement::one() : BFieldElement::zero();
    }
    rows_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    input.public_values = initial_root_.to_b_field_elements();
    const auto final_root = final_root_.to_b_field_elements();
    input.public_values.insert(input.public_values.end(), final_root.begin(), final_root.end());
    return input;
}

} // namespace zkrv
