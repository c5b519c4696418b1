#pragma once

#include "air/air.hpp"

namespace zkrv {

/**
 * Fixed bus indices shared by every chip of the VM.
 *
 * Message layouts:
 *   EXECUTION        (pc, timestamp)
 *   MEMORY           (address_space, pointer, data[4], timestamp)
 *   PROGRAM          (pc, opcode, a, b, c, d, e, f, g)
 *   RANGE_CHECKER    (value, bits)
 *   BITWISE          (x, y, z, op)          op 0 = range pair, 1 = xor
 *   RANGE_TUPLE      (x, y)
 *   POSEIDON2_DIRECT (left[8], right[8], out[8])
 *   POSEIDON2_PERMUTE(in[16], out[16])
 *   MERKLE           (tag, height, label, hash[8])
 *   PUBLIC_VALUES    (slot, byte[4])
 *   TERMINATE        (pc, timestamp, exit_code)
 */
namespace bus {
constexpr BusIndex EXECUTION = 0;
constexpr BusIndex MEMORY = 1;
constexpr BusIndex PROGRAM = 2;
constexpr BusIndex RANGE_CHECKER = 3;
constexpr BusIndex BITWISE = 4;
constexpr BusIndex RANGE_TUPLE = 5;
constexpr BusIndex POSEIDON2_DIRECT = 6;
constexpr BusIndex POSEIDON2_PERMUTE = 7;
constexpr BusIndex MERKLE = 8;
constexpr BusIndex PUBLIC_VALUES = 9;
constexpr BusIndex TERMINATE = 10;
} // namespace bus

/**
 * ExecutionBridge - the (pc, timestamp) hand-off every executor row makes
 *
 * Receives the state the instruction starts from, sends the state it ends in.
 */
struct ExecutionBridge {
    static void execute(AirBuilder& builder, const Expr& count, const Expr& from_pc, const Expr& from_ts,
                        const Expr& to_pc, const Expr& to_ts) {
        builder.push_receive(bus::EXECUTION, {from_pc, from_ts}, count);
        builder.push_send(bus::EXECUTION, {to_pc, to_ts}, count);
    }
};

/**
 * ProgramBus - lookup of the instruction at pc in the committed program
 */
struct ProgramBus {
    static void lookup(AirBuilder& builder, const Expr& count, const Expr& pc, const Expr& opcode,
                       const std::vector<Expr>& operands) {
        std::vector<Expr> fields{pc, opcode};
        for (size_t i = 0; i < 7; ++i) {
            fields.push_back(i < operands.size() ? operands[i] : Expr());
        }
        builder.push_send(bus::PROGRAM, std::move(fields), count);
    }
};

} // namespace zkrv
