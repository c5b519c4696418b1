#include "memory/memory_controller.hpp"
#include "vm/execution_error.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace zkrv {

MemoryController::MemoryController(const MemoryConfig& config, MemoryMode mode, const MemoryImage& initial_image,
                                   uint32_t initial_timestamp)
    : config_(config), mode_(mode), timestamp_(initial_timestamp) {
    if (mode_ == MemoryMode::Volatile && !initial_image.empty()) {
        throw std::invalid_argument("volatile memory starts empty; an initial image needs persistent memory");
    }
    load_image(initial_image);
    if (mode_ == MemoryMode::Persistent) {
        initial_tree_ = MemoryMerkleTree::from_image(config_, initial_image);
    }
}

MemoryController::MemoryController(const MemoryConfig& config, const MemoryImage& initial_image,
                                   MemoryMerkleTree initial_tree, uint32_t initial_timestamp)
    : config_(config), mode_(MemoryMode::Persistent), timestamp_(initial_timestamp),
      initial_tree_(std::move(initial_tree)) {
    load_image(initial_image);
}

void MemoryController::load_image(const MemoryImage& image) {
    for (const auto& [address, value] : image) {
        const auto [as, ptr] = address;
        check_address(as, ptr - ptr % BLOCK_SIZE);
        BlockState& state = blocks_[key(as, ptr)];
        state.initial[ptr % BLOCK_SIZE] = value;
        state.data[ptr % BLOCK_SIZE] = value;
    }
}

void MemoryController::check_address(uint32_t address_space, uint32_t pointer) const {
    if (address_space < config_.as_offset || address_space > config_.max_address_space() ||
        address_space == address_space::PUBLIC_VALUES) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "address space " + std::to_string(address_space) + " is not memory backed");
    }
    if (pointer % BLOCK_SIZE != 0) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "pointer " + std::to_string(pointer) + " is not block aligned");
    }
    if ((uint64_t{pointer} + BLOCK_SIZE) > (uint64_t{1} << config_.pointer_max_bits)) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "pointer " + std::to_string(pointer) + " exceeds " +
                                 std::to_string(config_.pointer_max_bits) + " bits");
    }
}

MemoryController::BlockState& MemoryController::touch(uint32_t address_space, uint32_t pointer) {
    check_address(address_space, pointer);
    if ((uint64_t{timestamp_} + ACCESS_TIMESTAMP_DELTA) >= (uint64_t{1} << config_.clk_max_bits)) {
        throw ExecutionError(ExecutionErrorKind::TraceHeightOverflow, 0,
                             "timestamp exceeds " + std::to_string(config_.clk_max_bits) + " bits");
    }
    BlockState& state = blocks_[key(address_space, pointer)];
    state.touched = true;
    return state;
}

MemoryReadRecord MemoryController::read(uint32_t address_space, uint32_t pointer) {
    if (address_space == address_space::IMMEDIATE) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0, "immediates are not read from memory");
    }
    BlockState& state = touch(address_space, pointer);
    MemoryReadRecord record;
    record.address_space = address_space;
    record.pointer = pointer;
    record.prev_timestamp = state.timestamp;
    record.timestamp = timestamp_;
    record.data = state.data;
    state.timestamp = timestamp_;
    timestamp_ += ACCESS_TIMESTAMP_DELTA;
    return record;
}

MemoryWriteRecord MemoryController::write(uint32_t address_space, uint32_t pointer, const Block& data) {
    if (address_space == address_space::IMMEDIATE) {
        throw ExecutionError(ExecutionErrorKind::ImmediateWrite, 0, "write to address space 0");
    }
    BlockState& state = touch(address_space, pointer);
    MemoryWriteRecord record;
    record.address_space = address_space;
    record.pointer = pointer;
    record.prev_timestamp = state.timestamp;
    record.timestamp = timestamp_;
    record.prev_data = state.data;
    record.data = data;
    state.data = data;
    state.timestamp = timestamp_;
    timestamp_ += ACCESS_TIMESTAMP_DELTA;
    return record;
}

Block MemoryController::unsafe_read(uint32_t address_space, uint32_t pointer) const {
    auto it = blocks_.find(key(address_space, pointer));
    return it == blocks_.end() ? Block{} : it->second.data;
}

BFieldElement MemoryController::unsafe_read_cell(uint32_t address_space, uint32_t pointer) const {
    return unsafe_read(address_space, pointer)[pointer % BLOCK_SIZE];
}

size_t MemoryController::num_touched_blocks() const {
    size_t n = 0;
    for (const auto& entry : blocks_) {
        n += entry.second.touched ? 1 : 0;
    }
    return n;
}

MemoryImage MemoryController::image() const {
    MemoryImage image;
    for (const auto& [k, state] : blocks_) {
        const uint32_t as = static_cast<uint32_t>(k >> 32);
        const uint32_t base = static_cast<uint32_t>(k & 0xFFFFFFFFu) * BLOCK_SIZE;
        for (size_t i = 0; i < BLOCK_SIZE; ++i) {
            if (!state.data[i].is_zero()) {
                image[{as, base + static_cast<uint32_t>(i)}] = state.data[i];
            }
        }
    }
    return image;
}

FinalMemory MemoryController::finalize() const {
    FinalMemory out;
    out.mode = mode_;
    if (mode_ == MemoryMode::Volatile) {
        for (const auto& [k, state] : blocks_) {
            if (!state.touched) {
                continue;
            }
            TouchedBlock block;
            block.address_space = static_cast<uint32_t>(k >> 32);
            block.pointer = static_cast<uint32_t>(k & 0xFFFFFFFFu) * BLOCK_SIZE;
            block.data = state.data;
            block.timestamp = state.timestamp;
            out.blocks.push_back(block);
        }
        std::sort(out.blocks.begin(), out.blocks.end(), [](const TouchedBlock& a, const TouchedBlock& b) {
            return std::make_pair(a.address_space, a.pointer) < std::make_pair(b.address_space, b.pointer);
        });
        return out;
    }

    std::set<std::pair<uint32_t, uint32_t>> touched_chunks;
    for (const auto& [k, state] : blocks_) {
        if (state.touched) {
            const uint32_t as = static_cast<uint32_t>(k >> 32);
            const uint32_t block_index = static_cast<uint32_t>(k & 0xFFFFFFFFu);
            touched_chunks.insert({as, block_index / BLOCKS_PER_CHUNK});
        }
    }

    std::map<uint64_t, ChunkValues> leaves;
    for (const auto& [as, chunk_label] : touched_chunks) {
        TouchedChunk chunk;
        chunk.address_space = as;
        chunk.chunk_label = chunk_label;
        for (size_t b = 0; b < BLOCKS_PER_CHUNK; ++b) {
            const uint32_t pointer = static_cast<uint32_t>(chunk_label * CHUNK + b * BLOCK_SIZE);
            auto it = blocks_.find(key(as, pointer));
            if (it == blocks_.end()) {
                continue;
            }
            for (size_t i = 0; i < BLOCK_SIZE; ++i) {
                chunk.initial_values[b * BLOCK_SIZE + i] = it->second.initial[i];
                chunk.final_values[b * BLOCK_SIZE + i] = it->second.data[i];
            }
            chunk.final_timestamps[b] = it->second.timestamp;
        }
        leaves[initial_tree_->leaf_label(as, chunk_label)] = chunk.final_values;
        out.chunks.push_back(chunk);
    }

    out.image = image();
    out.initial_tree = initial_tree_;
    out.final_tree = initial_tree_;
    out.final_tree->update_leaves(leaves);
    return out;
}

} // namespace zkrv
