#pragma once

#include "types/b_field_element.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zkrv {

/**
 * Instruction - (opcode, a, b, c, d, e, f, g) over the base field
 *
 * The opcode is a global index; operands are interpreted by the chip that
 * owns the opcode. For RV32 instructions a, b, c are register pointers
 * (register index * 4) or immediates, d and e are address spaces.
 */
struct Instruction {
    uint32_t opcode = 0;
    BFieldElement a;
    BFieldElement b;
    BFieldElement c;
    BFieldElement d;
    BFieldElement e;
    BFieldElement f;
    BFieldElement g;

    Instruction() = default;

    static Instruction from_usize(uint32_t opcode, std::vector<uint64_t> operands);
    static Instruction from_isize(uint32_t opcode, int64_t a, int64_t b, int64_t c, int64_t d, int64_t e,
                                  int64_t f = 0, int64_t g = 0);

    // Operands a..g in order
    std::vector<BFieldElement> operands() const { return {a, b, c, d, e, f, g}; }

    bool operator==(const Instruction& o) const {
        return opcode == o.opcode && a == o.a && b == o.b && c == o.c && d == o.d && e == o.e &&
               f == o.f && g == o.g;
    }

    std::string to_string() const;
};

constexpr size_t NUM_OPERANDS = 7;

} // namespace zkrv
