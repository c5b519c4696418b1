#include <gtest/gtest.h>
#include "memory/memory_merkle.hpp"
#include "merkle/merkle_tree.hpp"

using namespace zkrv;

class MerkleTreeTest : public ::testing::Test {
protected:
    static std::vector<Digest> make_leaves(size_t n) {
        std::vector<Digest> leaves;
        for (size_t i = 0; i < n; ++i) {
            std::array<BFieldElement, Digest::LEN> e{};
            for (size_t j = 0; j < Digest::LEN; ++j) {
                e[j] = BFieldElement(i * Digest::LEN + j);
            }
            leaves.emplace_back(e);
        }
        return leaves;
    }
};

// Test construction with power of 2 leaves
TEST_F(MerkleTreeTest, ConstructionPowerOf2) {
    MerkleTree tree(make_leaves(8));
    EXPECT_EQ(tree.num_leaves(), 8U);
    EXPECT_EQ(tree.height(), 3U);
}

TEST_F(MerkleTreeTest, ConstructionNonPowerOf2Throws) {
    std::vector<Digest> leaves(5, Digest::zero());
    EXPECT_THROW(MerkleTree tree(leaves), std::invalid_argument);
}

TEST_F(MerkleTreeTest, ConstructionEmptyThrows) {
    std::vector<Digest> leaves;
    EXPECT_THROW(MerkleTree tree(leaves), std::invalid_argument);
}

TEST_F(MerkleTreeTest, RootOfTwoLeavesIsCompression) {
    auto leaves = make_leaves(2);
    MerkleTree tree(leaves);
    EXPECT_EQ(tree.root(), Poseidon2::compress(leaves[0], leaves[1]));
}

// Every authentication path verifies against the root
TEST_F(MerkleTreeTest, AuthenticationPaths) {
    auto leaves = make_leaves(16);
    MerkleTree tree(leaves);
    for (size_t i = 0; i < leaves.size(); ++i) {
        auto path = tree.authentication_path(i);
        EXPECT_EQ(path.size(), tree.height());
        EXPECT_TRUE(MerkleTree::verify(tree.root(), i, leaves[i], path)) << "leaf " << i;
    }
}

TEST_F(MerkleTreeTest, TamperedLeafFailsVerification) {
    auto leaves = make_leaves(8);
    MerkleTree tree(leaves);
    auto path = tree.authentication_path(3);
    Digest wrong = leaves[3];
    wrong[0] += BFieldElement::one();
    EXPECT_FALSE(MerkleTree::verify(tree.root(), 3, wrong, path));
    EXPECT_FALSE(MerkleTree::verify(tree.root(), 4, leaves[3], path));
}

TEST_F(MerkleTreeTest, MatrixRowsCommitment) {
    RowMajorMatrix<BFieldElement> m(3, 4);
    for (size_t r = 0; r < 4; ++r) {
        for (size_t c = 0; c < 3; ++c) {
            m.set(r, c, BFieldElement(r * 10 + c));
        }
    }
    MerkleTree tree = MerkleTree::from_matrix_rows(m);
    EXPECT_EQ(tree.leaf(2), hash_row(m.row_vec(2)));
}

// ============================================================================
// Sparse memory Merkle tree
// ============================================================================

class MemoryMerkleTreeTest : public ::testing::Test {
protected:
    MemoryConfig small_config() const {
        MemoryConfig config;
        config.as_height = 1;
        config.pointer_max_bits = 8;
        return config;
    }
};

TEST_F(MemoryMerkleTreeTest, EmptyImageIsZeroSubtree) {
    MemoryConfig config = small_config();
    MemoryMerkleTree tree = MemoryMerkleTree::from_image(config, {});
    EXPECT_EQ(tree.height(), config.as_height + config.pointer_max_bits - 3);
    EXPECT_EQ(tree.root(), tree.zero_hash(tree.height()));
}

TEST_F(MemoryMerkleTreeTest, SingleLeafPathMatchesUpdate) {
    MemoryConfig config = small_config();
    MemoryImage image;
    image[{1, 9}] = BFieldElement(77);
    MemoryMerkleTree from_image = MemoryMerkleTree::from_image(config, image);

    MemoryMerkleTree updated(config);
    ChunkValues values{};
    values[1] = BFieldElement(77);
    updated.update_leaves({{updated.leaf_label(1, 1), values}});
    EXPECT_EQ(from_image.root(), updated.root());
    EXPECT_NE(from_image.root(), MemoryMerkleTree(config).root());
}

TEST_F(MemoryMerkleTreeTest, UpdateCountsCompressions) {
    MemoryConfig config = small_config();
    MemoryMerkleTree tree(config);
    size_t calls = 0;
    Compressor counting = [&](const Digest& l, const Digest& r) {
        ++calls;
        return Poseidon2::compress(l, r);
    };
    ChunkValues values{};
    values[0] = BFieldElement(1);
    tree.update_leaves({{tree.leaf_label(2, 0), values}}, counting);
    // One leaf hash plus one compression per level
    EXPECT_EQ(calls, tree.height() + 1);
}
