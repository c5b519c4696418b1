#include <gtest/gtest.h>
#include "memory/memory_controller.hpp"
#include "vm/execution_error.hpp"

using namespace zkrv;

class MemoryControllerTest : public ::testing::Test {
protected:
    MemoryConfig config_;

    static Block block(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
        return Block{BFieldElement(a), BFieldElement(b), BFieldElement(c), BFieldElement(d)};
    }

    MemoryController volatile_memory() const {
        return MemoryController(config_, MemoryMode::Volatile, {}, 1);
    }
};

TEST_F(MemoryControllerTest, UnwrittenCellsReadZeroAtTimestampZero) {
    MemoryController memory = volatile_memory();
    MemoryReadRecord record = memory.read(address_space::HEAP, 64);
    EXPECT_EQ(record.data, Block{});
    EXPECT_EQ(record.prev_timestamp, 0U);
    EXPECT_EQ(record.timestamp, 1U);
    EXPECT_EQ(memory.timestamp(), 1U + ACCESS_TIMESTAMP_DELTA);
}

TEST_F(MemoryControllerTest, WriteThenRead) {
    MemoryController memory = volatile_memory();
    MemoryWriteRecord w = memory.write(address_space::REGISTER, 8, block(1, 2, 3, 4));
    EXPECT_EQ(w.prev_data, Block{});
    EXPECT_EQ(w.timestamp, 1U);

    MemoryReadRecord r = memory.read(address_space::REGISTER, 8);
    EXPECT_EQ(r.data, block(1, 2, 3, 4));
    EXPECT_EQ(r.prev_timestamp, w.timestamp);
    EXPECT_GT(r.timestamp, r.prev_timestamp);

    MemoryWriteRecord w2 = memory.write(address_space::REGISTER, 8, block(5, 6, 7, 8));
    EXPECT_EQ(w2.prev_data, block(1, 2, 3, 4));
    EXPECT_EQ(w2.prev_timestamp, r.timestamp);
    EXPECT_EQ(memory.unsafe_read_cell(address_space::REGISTER, 10), BFieldElement(7));
}

// Timestamps of a block strictly increase across accesses
TEST_F(MemoryControllerTest, TimestampsStrictlyIncrease) {
    MemoryController memory = volatile_memory();
    uint32_t last = 0;
    for (int i = 0; i < 10; ++i) {
        MemoryReadRecord r = memory.read(address_space::HEAP, 0);
        EXPECT_EQ(r.prev_timestamp, last);
        EXPECT_GT(r.timestamp, r.prev_timestamp);
        last = r.timestamp;
    }
}

TEST_F(MemoryControllerTest, ImmediateWriteRejected) {
    MemoryController memory = volatile_memory();
    try {
        memory.write(address_space::IMMEDIATE, 0, block(1, 0, 0, 0));
        FAIL() << "write to address space 0 accepted";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.kind(), ExecutionErrorKind::ImmediateWrite);
    }
}

TEST_F(MemoryControllerTest, InvalidAccessesRejected) {
    MemoryController memory = volatile_memory();
    EXPECT_THROW(memory.read(address_space::HEAP, 6), ExecutionError);
    EXPECT_THROW(memory.read(address_space::PUBLIC_VALUES, 0), ExecutionError);
    EXPECT_THROW(memory.read(config_.max_address_space() + 1, 0), ExecutionError);
    EXPECT_THROW(memory.read(address_space::HEAP, uint32_t{1} << config_.pointer_max_bits), ExecutionError);
}

TEST_F(MemoryControllerTest, VolatileRejectsInitialImage) {
    MemoryImage image;
    image[{address_space::HEAP, 0}] = BFieldElement(1);
    EXPECT_THROW(MemoryController(config_, MemoryMode::Volatile, image, 1), std::invalid_argument);
}

TEST_F(MemoryControllerTest, VolatileFinalizeSortsTouchedBlocks) {
    MemoryController memory = volatile_memory();
    memory.write(address_space::HEAP, 32, block(9, 0, 0, 0));
    memory.read(address_space::REGISTER, 4);
    memory.write(address_space::HEAP, 0, block(1, 1, 1, 1));

    FinalMemory final_memory = memory.finalize();
    EXPECT_EQ(final_memory.mode, MemoryMode::Volatile);
    ASSERT_EQ(final_memory.blocks.size(), 3U);
    EXPECT_EQ(final_memory.blocks[0].address_space, address_space::REGISTER);
    EXPECT_EQ(final_memory.blocks[1].pointer, 0U);
    EXPECT_EQ(final_memory.blocks[2].pointer, 32U);
    EXPECT_EQ(final_memory.blocks[2].data, block(9, 0, 0, 0));
    EXPECT_EQ(memory.num_touched_blocks(), 3U);
}

// Touched chunks carry their initial and final values; the final tree
// equals a tree built from the final image
TEST_F(MemoryControllerTest, PersistentFinalizeUpdatesTree) {
    MemoryImage image;
    image[{address_space::HEAP, 16}] = BFieldElement(5);
    image[{address_space::HEAP, 1000}] = BFieldElement(6);
    MemoryController memory(config_, MemoryMode::Persistent, image, 1);

    MemoryReadRecord r = memory.read(address_space::HEAP, 16);
    EXPECT_EQ(r.data[0], BFieldElement(5));
    memory.write(address_space::HEAP, 20, block(7, 0, 0, 0));

    FinalMemory final_memory = memory.finalize();
    ASSERT_EQ(final_memory.chunks.size(), 1U);
    const TouchedChunk& chunk = final_memory.chunks[0];
    EXPECT_EQ(chunk.chunk_label, 2U);
    EXPECT_EQ(chunk.initial_values[0], BFieldElement(5));
    EXPECT_EQ(chunk.initial_values[4], BFieldElement::zero());
    EXPECT_EQ(chunk.final_values[4], BFieldElement(7));

    ASSERT_TRUE(final_memory.initial_tree && final_memory.final_tree);
    EXPECT_EQ(final_memory.initial_tree->root(), MemoryMerkleTree::from_image(config_, image).root());
    EXPECT_EQ(final_memory.final_tree->root(), MemoryMerkleTree::from_image(config_, final_memory.image).root());
    EXPECT_EQ(final_memory.image.at({address_space::HEAP, 1000}), BFieldElement(6));
}

TEST_F(MemoryControllerTest, ClockOverflowReported) {
    config_.clk_max_bits = 4;
    MemoryController memory = volatile_memory();
    memory.read(address_space::HEAP, 0);
    memory.read(address_space::HEAP, 0);
    memory.read(address_space::HEAP, 0);
    try {
        memory.read(address_space::HEAP, 0);
        FAIL() << "timestamp overflow accepted";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.kind(), ExecutionErrorKind::TraceHeightOverflow);
    }
}
