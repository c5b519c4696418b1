#pragma once

#include "types/digest.hpp"
#include "types/b_field_element.hpp"
#include "hash/poseidon2.hpp"
#include "table/matrix.hpp"
#include <vector>
#include <stdexcept>

namespace zkrv {

/**
 * MerkleTree - Binary tree of digests for commitment
 *
 * Nodes are stored 1-indexed (root = 1, leaves at [n, 2n)). Inner nodes are
 * Poseidon2::compress(left, right).
 */
class MerkleTree {
public:
    /**
     * Build a Merkle tree from the given leaves.
     *
     * @param leaves The leaves of the tree (must be power of 2)
     * @throws std::invalid_argument if leaves is empty or not power of 2
     */
    explicit MerkleTree(std::vector<Digest> leaves);

    // Commit to a matrix: leaf i = hash of row i
    static MerkleTree from_matrix_rows(const RowMajorMatrix<BFieldElement>& matrix);

    Digest root() const { return nodes_[1]; }
    size_t num_leaves() const { return num_leaves_; }
    size_t height() const;
    Digest leaf(size_t index) const;

    // Sibling digests from the leaf level up to (excluding) the root
    std::vector<Digest> authentication_path(size_t leaf_index) const;

    static bool verify(
        const Digest& root,
        size_t leaf_index,
        const Digest& leaf,
        const std::vector<Digest>& auth_path
    );

    static size_t sibling_index(size_t node_index) { return node_index ^ 1; }
    static size_t parent_index(size_t node_index) { return node_index / 2; }

private:
    std::vector<Digest> nodes_;
    size_t num_leaves_;

    void build_tree();
};

/**
 * Hash a row of BFieldElements to a Digest for Merkle tree leaves.
 */
Digest hash_row(const std::vector<BFieldElement>& row);

} // namespace zkrv
