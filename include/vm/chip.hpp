#pragma once

#include "air/air.hpp"
#include "air/debug_checker.hpp"
#include "stark/prover.hpp"
#include "vm/instruction.hpp"
#include "vm/vm_state.hpp"
#include <memory>
#include <string>

namespace zkrv {

class MemoryController;

/**
 * Chip - an AIR together with the prover-side state that fills its trace
 */
class Chip {
public:
    virtual ~Chip() = default;

    virtual AirRef air() const = 0;

    // Unpadded number of rows the records collected so far will occupy
    virtual size_t current_trace_height() const = 0;

    virtual size_t trace_width() const = 0;

    // Consumes the collected records
    virtual AirProofInput generate_air_proof_input() = 0;

    std::string air_name() const { return air()->name(); }
};

using ChipRef = std::shared_ptr<Chip>;

/**
 * InstructionExecutor - runtime half of an instruction chip
 *
 * execute() performs the instruction against memory, records what the
 * trace needs and returns the state after it. Errors are ExecutionError.
 */
class InstructionExecutor {
public:
    virtual ~InstructionExecutor() = default;

    virtual ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                                   ExecutionState from_state) = 0;

    virtual std::string get_opcode_name(uint32_t opcode) const = 0;
};

// Trace height for n rows: next power of two, at least 2
inline size_t padded_height(size_t rows) {
    size_t h = 2;
    while (h < rows) {
        h <<= 1;
    }
    return h;
}

// Raw traces of a proof input in the shape the debug checker takes
inline DebugAirInput debug_input(const Air* air, const AirProofInput& input) {
    DebugAirInput out;
    out.air = air;
    for (const auto& cached : input.cached_mains) {
        out.mains.push_back(&cached->trace);
    }
    out.mains.push_back(&input.common_main);
    out.public_values = input.public_values;
    return out;
}

} // namespace zkrv
