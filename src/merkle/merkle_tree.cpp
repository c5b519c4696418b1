#include "merkle/merkle_tree.hpp"
#include <algorithm>
#include <omp.h>

namespace zkrv {

MerkleTree::MerkleTree(std::vector<Digest> leaves) {
    if (leaves.empty()) {
        throw std::invalid_argument("Cannot create Merkle tree with no leaves");
    }
    if ((leaves.size() & (leaves.size() - 1)) != 0) {
        throw std::invalid_argument("Number of leaves must be a power of 2");
    }

    num_leaves_ = leaves.size();

    // Index 0 is unused, index 1 is root
    nodes_.resize(2 * num_leaves_);
    std::move(leaves.begin(), leaves.end(), nodes_.begin() + num_leaves_);

    build_tree();
}

MerkleTree MerkleTree::from_matrix_rows(const RowMajorMatrix<BFieldElement>& matrix) {
    std::vector<Digest> leaves(matrix.height());
    const size_t width = matrix.width();

    #pragma omp parallel for schedule(static)
    for (size_t r = 0; r < matrix.height(); ++r) {
        leaves[r] = Poseidon2::hash_varlen(matrix.row(r), width);
    }
    return MerkleTree(std::move(leaves));
}

void MerkleTree::build_tree() {
    // Level by level from the leaves up; nodes of one level are independent
    size_t level_size = num_leaves_ / 2;
    size_t level_start = num_leaves_ / 2;

    while (level_size >= 1) {
        #pragma omp parallel for schedule(static) if (level_size >= 64)
        for (size_t i = 0; i < level_size; ++i) {
            size_t node_idx = level_start + i;
            nodes_[node_idx] = Poseidon2::compress(nodes_[2 * node_idx], nodes_[2 * node_idx + 1]);
        }
        level_start /= 2;
        level_size /= 2;
    }
}

size_t MerkleTree::height() const {
    size_t h = 0;
    while ((size_t{1} << h) < num_leaves_) {
        ++h;
    }
    return h;
}

Digest MerkleTree::leaf(size_t index) const {
    if (index >= num_leaves_) {
        throw std::out_of_range("Leaf index out of range");
    }
    return nodes_[num_leaves_ + index];
}

std::vector<Digest> MerkleTree::authentication_path(size_t leaf_index) const {
    if (leaf_index >= num_leaves_) {
        throw std::out_of_range("Leaf index out of range");
    }

    std::vector<Digest> path;
    path.reserve(height());

    size_t current_index = num_leaves_ + leaf_index;
    while (current_index > 1) {
        path.push_back(nodes_[sibling_index(current_index)]);
        current_index = parent_index(current_index);
    }
    return path;
}

bool MerkleTree::verify(
    const Digest& root,
    size_t leaf_index,
    const Digest& leaf,
    const std::vector<Digest>& auth_path
) {
    if (auth_path.size() >= 64 || (leaf_index >> auth_path.size()) != 0) {
        return false;
    }

    size_t node_index = leaf_index + (size_t{1} << auth_path.size());
    Digest current = leaf;
    for (const auto& sibling : auth_path) {
        if (node_index % 2 == 0) {
            current = Poseidon2::compress(current, sibling);
        } else {
            current = Poseidon2::compress(sibling, current);
        }
        node_index /= 2;
    }
    return current == root;
}

Digest hash_row(const std::vector<BFieldElement>& row) {
    return Poseidon2::hash_varlen(row);
}

} // namespace zkrv
