#pragma once

#include "chacha12_rng.hpp"
#include "types/b_field_element.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <vector>

namespace zkrv {

/**
 * ExecutionState - (pc, timestamp) at an instruction boundary
 */
struct ExecutionState {
    uint32_t pc = 0;
    uint32_t timestamp = 0;

    ExecutionState() = default;
    ExecutionState(uint32_t pc_, uint32_t timestamp_) : pc(pc_), timestamp(timestamp_) {}

    bool operator==(const ExecutionState& o) const { return pc == o.pc && timestamp == o.timestamp; }
    bool operator!=(const ExecutionState& o) const { return !(*this == o); }
};

// First timestamp handed out in a fresh execution; timestamp 0 belongs to the initial memory image
constexpr uint32_t INITIAL_TIMESTAMP = 1;

/**
 * Streams - host-side input consumed by hint instructions
 *
 * input_frames are whole byte vectors, popped one per HintInput phantom;
 * hint_stream holds the field elements HINT_STOREW reads from.
 */
struct Streams {
    std::deque<std::vector<uint8_t>> input_frames;
    std::deque<BFieldElement> hint_stream;
    std::map<std::vector<uint8_t>, std::vector<uint8_t>> kv_store;

    Streams() = default;
    explicit Streams(std::vector<std::vector<uint8_t>> inputs)
        : input_frames(inputs.begin(), inputs.end()) {}
};

} // namespace zkrv
