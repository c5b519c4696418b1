#pragma once

#include <cstdint>
#include <string>

namespace zkrv {

/**
 * Opcode classes and their fixed offsets in the global opcode space.
 * A global opcode is class offset + local opcode.
 */
namespace opcode_offset {
constexpr uint32_t SYSTEM = 0x000;
constexpr uint32_t POSEIDON2 = 0x150;
constexpr uint32_t BASE_ALU = 0x200;
constexpr uint32_t SHIFT = 0x205;
constexpr uint32_t LESS_THAN = 0x208;
constexpr uint32_t LOADSTORE = 0x210;
constexpr uint32_t BRANCH_EQUAL = 0x220;
constexpr uint32_t BRANCH_LESS_THAN = 0x225;
constexpr uint32_t JAL_LUI = 0x230;
constexpr uint32_t JALR = 0x235;
constexpr uint32_t AUIPC = 0x240;
constexpr uint32_t MUL = 0x250;
constexpr uint32_t MULH = 0x251;
constexpr uint32_t DIVREM = 0x254;
constexpr uint32_t HINT_STORE = 0x260;
constexpr uint32_t REVEAL = 0x265;
constexpr uint32_t KECCAK = 0x310;
constexpr uint32_t MODULAR = 0x400;
constexpr uint32_t WEIERSTRASS = 0x500;
constexpr uint32_t PAIRING = 0x600;
// Stride between per-modulus / per-curve classes
constexpr uint32_t CLASS_STRIDE = 16;
} // namespace opcode_offset

enum class SystemOpcode : uint32_t { TERMINATE = 0, PHANTOM = 1 };
enum class Poseidon2Opcode : uint32_t { PERM_POS2 = 0, COMP_POS2 = 1 };
enum class BaseAluOpcode : uint32_t { ADD = 0, SUB = 1, XOR = 2, OR = 3, AND = 4 };
enum class ShiftOpcode : uint32_t { SLL = 0, SRL = 1, SRA = 2 };
enum class LessThanOpcode : uint32_t { SLT = 0, SLTU = 1 };
enum class LoadStoreOpcode : uint32_t {
    LOADW = 0,
    LOADBU = 1,
    LOADHU = 2,
    STOREW = 3,
    STOREH = 4,
    STOREB = 5,
    LOADB = 6,
    LOADH = 7,
};
enum class BranchEqualOpcode : uint32_t { BEQ = 0, BNE = 1 };
enum class BranchLessThanOpcode : uint32_t { BLT = 0, BLTU = 1, BGE = 2, BGEU = 3 };
enum class JalLuiOpcode : uint32_t { JAL = 0, LUI = 1 };
enum class JalrOpcode : uint32_t { JALR = 0 };
enum class AuipcOpcode : uint32_t { AUIPC = 0 };
enum class MulOpcode : uint32_t { MUL = 0 };
enum class MulHOpcode : uint32_t { MULH = 0, MULHSU = 1, MULHU = 2 };
enum class DivRemOpcode : uint32_t { DIV = 0, DIVU = 1, REM = 2, REMU = 3 };
enum class HintStoreOpcode : uint32_t { HINT_STOREW = 0 };
enum class RevealOpcode : uint32_t { REVEAL = 0 };
enum class KeccakOpcode : uint32_t { KECCAKF = 0 };
enum class ModularOpcode : uint32_t { ADD = 0, SUB = 1, MUL = 2, DIV = 3 };
enum class WeierstrassOpcode : uint32_t { SW_ADD_NE = 0, SW_DOUBLE = 1 };
enum class PairingOpcode : uint32_t { MUL_013_BY_013 = 0, MUL_BY_02345 = 1 };

template <typename E>
constexpr uint32_t global_opcode(uint32_t offset, E local) {
    return offset + static_cast<uint32_t>(local);
}

constexpr uint32_t opcode(SystemOpcode op) { return global_opcode(opcode_offset::SYSTEM, op); }
constexpr uint32_t opcode(Poseidon2Opcode op) { return global_opcode(opcode_offset::POSEIDON2, op); }
constexpr uint32_t opcode(BaseAluOpcode op) { return global_opcode(opcode_offset::BASE_ALU, op); }
constexpr uint32_t opcode(ShiftOpcode op) { return global_opcode(opcode_offset::SHIFT, op); }
constexpr uint32_t opcode(LessThanOpcode op) { return global_opcode(opcode_offset::LESS_THAN, op); }
constexpr uint32_t opcode(LoadStoreOpcode op) { return global_opcode(opcode_offset::LOADSTORE, op); }
constexpr uint32_t opcode(BranchEqualOpcode op) { return global_opcode(opcode_offset::BRANCH_EQUAL, op); }
constexpr uint32_t opcode(BranchLessThanOpcode op) { return global_opcode(opcode_offset::BRANCH_LESS_THAN, op); }
constexpr uint32_t opcode(JalLuiOpcode op) { return global_opcode(opcode_offset::JAL_LUI, op); }
constexpr uint32_t opcode(JalrOpcode op) { return global_opcode(opcode_offset::JALR, op); }
constexpr uint32_t opcode(AuipcOpcode op) { return global_opcode(opcode_offset::AUIPC, op); }
constexpr uint32_t opcode(MulOpcode op) { return global_opcode(opcode_offset::MUL, op); }
constexpr uint32_t opcode(MulHOpcode op) { return global_opcode(opcode_offset::MULH, op); }
constexpr uint32_t opcode(DivRemOpcode op) { return global_opcode(opcode_offset::DIVREM, op); }
constexpr uint32_t opcode(HintStoreOpcode op) { return global_opcode(opcode_offset::HINT_STORE, op); }
constexpr uint32_t opcode(RevealOpcode op) { return global_opcode(opcode_offset::REVEAL, op); }
constexpr uint32_t opcode(KeccakOpcode op) { return global_opcode(opcode_offset::KECCAK, op); }

// Per-modulus / per-curve classes
constexpr uint32_t modular_opcode(size_t modulus_index, ModularOpcode op) {
    return global_opcode(opcode_offset::MODULAR + opcode_offset::CLASS_STRIDE * static_cast<uint32_t>(modulus_index), op);
}
constexpr uint32_t weierstrass_opcode(size_t curve_index, WeierstrassOpcode op) {
    return global_opcode(opcode_offset::WEIERSTRASS + opcode_offset::CLASS_STRIDE * static_cast<uint32_t>(curve_index), op);
}
constexpr uint32_t pairing_opcode(size_t curve_index, PairingOpcode op) {
    return global_opcode(opcode_offset::PAIRING + opcode_offset::CLASS_STRIDE * static_cast<uint32_t>(curve_index), op);
}

/**
 * Phantom sub-instructions, keyed by the low 16 bits of operand c.
 * They run on the host only and leave no constraint footprint.
 */
enum class PhantomDiscriminant : uint16_t {
    Nop = 0,
    DebugPanic = 1,
    CtStart = 2,
    CtEnd = 3,
    PrintStr = 0x10,
    HintInput = 0x20,
    HintRandom = 0x21,
    HintLoadByKey = 0x22,
};

std::string phantom_name(PhantomDiscriminant discriminant);

} // namespace zkrv
