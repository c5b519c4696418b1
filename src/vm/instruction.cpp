#include "vm/instruction.hpp"
#include "vm/opcode.hpp"
#include <sstream>

namespace zkrv {

Instruction Instruction::from_usize(uint32_t opcode, std::vector<uint64_t> operands) {
    operands.resize(NUM_OPERANDS, 0);
    Instruction ins;
    ins.opcode = opcode;
    ins.a = BFieldElement(operands[0]);
    ins.b = BFieldElement(operands[1]);
    ins.c = BFieldElement(operands[2]);
    ins.d = BFieldElement(operands[3]);
    ins.e = BFieldElement(operands[4]);
    ins.f = BFieldElement(operands[5]);
    ins.g = BFieldElement(operands[6]);
    return ins;
}

Instruction Instruction::from_isize(uint32_t opcode, int64_t a, int64_t b, int64_t c, int64_t d, int64_t e,
                                    int64_t f, int64_t g) {
    Instruction ins;
    ins.opcode = opcode;
    ins.a = BFieldElement::from_i64(a);
    ins.b = BFieldElement::from_i64(b);
    ins.c = BFieldElement::from_i64(c);
    ins.d = BFieldElement::from_i64(d);
    ins.e = BFieldElement::from_i64(e);
    ins.f = BFieldElement::from_i64(f);
    ins.g = BFieldElement::from_i64(g);
    return ins;
}

std::string Instruction::to_string() const {
    std::ostringstream oss;
    oss << "0x" << std::hex << opcode << std::dec << " [" << a << ", " << b << ", " << c << ", " << d << ", "
        << e << ", " << f << ", " << g << "]";
    return oss.str();
}

std::string phantom_name(PhantomDiscriminant discriminant) {
    switch (discriminant) {
    case PhantomDiscriminant::Nop: return "Nop";
    case PhantomDiscriminant::DebugPanic: return "DebugPanic";
    case PhantomDiscriminant::CtStart: return "CtStart";
    case PhantomDiscriminant::CtEnd: return "CtEnd";
    case PhantomDiscriminant::PrintStr: return "PrintStr";
    case PhantomDiscriminant::HintInput: return "HintInput";
    case PhantomDiscriminant::HintRandom: return "HintRandom";
    case PhantomDiscriminant::HintLoadByKey: return "HintLoadByKey";
    }
    return "Unknown";
}

} // namespace zkrv
