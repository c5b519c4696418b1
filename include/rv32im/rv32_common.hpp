#pragma once

#include "air/air.hpp"
#include "types/b_field_element.hpp"
#include "vm/execution_error.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace zkrv {

// Registers and heap words are 4 byte cells, little endian
constexpr size_t RV32_REGISTER_NUM_LIMBS = 4;
constexpr size_t RV32_CELL_BITS = 8;
constexpr uint32_t RV32_CELL_MAX = (1u << RV32_CELL_BITS) - 1;
constexpr size_t RV32_NUM_REGISTERS = 32;
// Program counters stay below 2^PC_BITS
constexpr size_t PC_BITS = 30;
// Address space of an ALU-type immediate operand (24 bits, top byte a sign extension)
constexpr size_t RV32_IMM_AS = 0;

inline uint32_t register_pointer(uint32_t reg) { return reg * static_cast<uint32_t>(RV32_REGISTER_NUM_LIMBS); }

inline std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> u32_to_bytes(uint32_t value) {
    return {value & 0xFF, (value >> 8) & 0xFF, (value >> 16) & 0xFF, value >> 24};
}

inline std::vector<BFieldElement> u32_to_limbs(uint32_t value) {
    std::vector<BFieldElement> limbs;
    limbs.reserve(RV32_REGISTER_NUM_LIMBS);
    for (uint32_t byte : u32_to_bytes(value)) {
        limbs.push_back(BFieldElement(byte));
    }
    return limbs;
}

// Limbs must be canonical bytes
inline uint32_t limbs_to_u32(const std::vector<BFieldElement>& limbs) {
    uint32_t value = 0;
    for (size_t i = 0; i < RV32_REGISTER_NUM_LIMBS; ++i) {
        value |= (limbs[i].value() & 0xFF) << (8 * i);
    }
    return value;
}

// Field element read as a signed offset in (-p/2, p/2]
inline int64_t to_signed(const BFieldElement& x) {
    const uint32_t v = x.value();
    return v > BFieldElement::MODULUS / 2 ? int64_t{v} - int64_t{BFieldElement::MODULUS} : int64_t{v};
}

// from_pc + offset, which must stay in [0, 2^PC_BITS)
inline uint32_t jump_target(uint32_t from_pc, int64_t offset) {
    const int64_t to_pc = int64_t{from_pc} + offset;
    if (to_pc < 0 || to_pc >= (int64_t{1} << PC_BITS)) {
        throw ExecutionError(ExecutionErrorKind::PcOutOfBounds, 0,
                             "jump target " + std::to_string(to_pc) + " out of range");
    }
    return static_cast<uint32_t>(to_pc);
}

inline BFieldElement bool_field(bool b) { return b ? BFieldElement::one() : BFieldElement::zero(); }

// 1 / 2^bits as a field constant
inline BFieldElement inv_pow2(size_t bits) { return BFieldElement(uint64_t{1} << bits).inverse(); }

// Column-range view helpers shared by the cores
inline std::vector<Expr> expr_range(const std::vector<Expr>& cols, size_t offset, size_t len) {
    return std::vector<Expr>(cols.begin() + offset, cols.begin() + offset + len);
}

inline uint32_t bytes_to_u32(const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& bytes) {
    return bytes[0] | (bytes[1] << 8) | (bytes[2] << 16) | (bytes[3] << 24);
}

inline void write_bytes(BFieldElement* row, size_t offset, const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& bytes) {
    for (size_t i = 0; i < RV32_REGISTER_NUM_LIMBS; ++i) {
        row[offset + i] = BFieldElement(bytes[i]);
    }
}

/**
 * One-hot opcode flags: each flag is boolean and their sum, returned as
 * is_valid, is boolean. opcode receives offset + index of the set flag
 * (zero on padding rows).
 */
inline Expr eval_opcode_flags(AirBuilder& builder, const std::vector<Expr>& flags, uint32_t offset, Expr& opcode) {
    Expr is_valid;
    opcode = Expr();
    for (size_t i = 0; i < flags.size(); ++i) {
        builder.assert_bool(flags[i]);
        is_valid += flags[i];
        opcode += flags[i] * static_cast<int64_t>(i);
    }
    builder.assert_bool(is_valid);
    opcode += Expr::from_u64(offset) * is_valid;
    return is_valid;
}

inline void write_limbs(BFieldElement* row, size_t offset, const std::vector<BFieldElement>& limbs) {
    for (size_t i = 0; i < limbs.size(); ++i) {
        row[offset + i] = limbs[i];
    }
}

} // namespace zkrv
