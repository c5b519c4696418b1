#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "vm/execution_error.hpp"
#include <iostream>

using namespace zkrv;
using namespace zkrv::test;

/**
 * Each test runs a short program through one segment, generates every
 * trace and checks all constraints and bus balances on them before
 * looking at the resulting register file.
 */
class Rv32imChipTest : public ::testing::Test {
protected:
    VmConfig config_ = VmConfig::rv32im();

    void SetUp() override { config_.system.fri_params = FriParameters::testing(); }

    SegmentRun run(const ProgramBuilder& program, std::vector<std::vector<uint8_t>> inputs = {}) {
        return run_segment(config_, program.exe(), std::move(inputs));
    }

    ExecutionError run_expecting_error(const ProgramBuilder& program,
                                       std::vector<std::vector<uint8_t>> inputs = {}) {
        try {
            run(program, std::move(inputs));
        } catch (const ExecutionError& e) {
            return e;
        }
        ADD_FAILURE() << "program executed without error";
        return ExecutionError(ExecutionErrorKind::Fail, 0, "no error");
    }
};

TEST_F(Rv32imChipTest, BaseAlu) {
    ProgramBuilder p;
    p.push(li(1, 0x12345678)).push(li(2, 0x0F0F0F0F));
    p.push(add(3, 1, 2));
    p.push(sub(4, 1, 2));
    p.push(rtype(BaseAluOpcode::XOR, 5, 1, 2));
    p.push(rtype(BaseAluOpcode::OR, 6, 1, 2));
    p.push(rtype(BaseAluOpcode::AND, 7, 1, 2));
    p.push(alu_imm(BaseAluOpcode::ADD, 8, 1, -8));
    p.push(alu_imm(BaseAluOpcode::XOR, 9, 2, 0xFF));
    p.push(sub(10, 2, 1));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 3), 0x21436587U);
    EXPECT_EQ(read_register(r.memory, 4), 0x03254769U);
    EXPECT_EQ(read_register(r.memory, 5), 0x1D3B5977U);
    EXPECT_EQ(read_register(r.memory, 6), 0x1F3F5F7FU);
    EXPECT_EQ(read_register(r.memory, 7), 0x02040608U);
    EXPECT_EQ(read_register(r.memory, 8), 0x12345670U);
    EXPECT_EQ(read_register(r.memory, 9), 0x0F0F0FF0U);
    EXPECT_EQ(read_register(r.memory, 10), 0x0F0F0F0FU - 0x12345678U);
    EXPECT_GT(air_rows(r, "Rv32BaseAluAir"), 0U);
    std::cout << "  ✓ ADD/SUB/XOR/OR/AND traces satisfy all constraints" << std::endl;
}

TEST_F(Rv32imChipTest, Shifts) {
    ProgramBuilder p;
    p.push(li(1, 0x12345678)).push(li(2, 4)).push(li(5, 0x80000000)).push(li(8, 36));
    p.push(rtype(ShiftOpcode::SLL, 3, 1, 2));
    p.push(shift_imm(ShiftOpcode::SRL, 4, 1, 4));
    p.push(shift_imm(ShiftOpcode::SRA, 6, 5, 4));
    p.push(shift_imm(ShiftOpcode::SRL, 9, 5, 31));
    // Shift amounts use the low five bits only
    p.push(rtype(ShiftOpcode::SLL, 7, 1, 8));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 3), 0x23456780U);
    EXPECT_EQ(read_register(r.memory, 4), 0x01234567U);
    EXPECT_EQ(read_register(r.memory, 6), 0xF8000000U);
    EXPECT_EQ(read_register(r.memory, 9), 1U);
    EXPECT_EQ(read_register(r.memory, 7), 0x23456780U);
}

TEST_F(Rv32imChipTest, LessThan) {
    ProgramBuilder p;
    p.push(li(1, 0xFFFFFFFF)).push(li(2, 1));
    p.push(rtype(LessThanOpcode::SLT, 3, 1, 2));
    p.push(rtype(LessThanOpcode::SLTU, 4, 1, 2));
    p.push(rtype(LessThanOpcode::SLT, 5, 2, 1));
    p.push(sltu(6, 2, 1));
    p.push(sltu(7, 2, 2));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 3), 1U);
    EXPECT_EQ(read_register(r.memory, 4), 0U);
    EXPECT_EQ(read_register(r.memory, 5), 0U);
    EXPECT_EQ(read_register(r.memory, 6), 1U);
    EXPECT_EQ(read_register(r.memory, 7), 0U);
}

TEST_F(Rv32imChipTest, Multiplication) {
    ProgramBuilder p;
    p.push(li(1, 0x12345678)).push(li(2, 0x0F0F0F0F)).push(li(3, static_cast<uint32_t>(-10))).push(li(4, 7));
    p.push(rtype(MulOpcode::MUL, 5, 1, 2));
    p.push(rtype(MulHOpcode::MULHU, 6, 1, 2));
    p.push(rtype(MulHOpcode::MULH, 7, 3, 4));
    p.push(rtype(MulHOpcode::MULHSU, 8, 3, 4));
    p.push(rtype(MulHOpcode::MULHU, 9, 3, 4));
    p.push(rtype(MulOpcode::MUL, 10, 3, 4));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 5), 0x3B2A1908U);
    EXPECT_EQ(read_register(r.memory, 6), 0x01122334U);
    EXPECT_EQ(read_register(r.memory, 7), 0xFFFFFFFFU);
    EXPECT_EQ(read_register(r.memory, 8), 0xFFFFFFFFU);
    EXPECT_EQ(read_register(r.memory, 9), 6U);
    EXPECT_EQ(read_register(r.memory, 10), static_cast<uint32_t>(-70));
}

// RISC-V division semantics, including division by zero and overflow
TEST_F(Rv32imChipTest, DivRem) {
    ProgramBuilder p;
    p.push(li(1, 100)).push(li(2, 7)).push(li(5, static_cast<uint32_t>(-100))).push(li(8, 0));
    p.push(li(11, 0x80000000)).push(li(12, 0xFFFFFFFF));
    p.push(rtype(DivRemOpcode::DIVU, 3, 1, 2));
    p.push(rtype(DivRemOpcode::REMU, 4, 1, 2));
    p.push(rtype(DivRemOpcode::DIV, 6, 5, 2));
    p.push(rtype(DivRemOpcode::REM, 7, 5, 2));
    p.push(rtype(DivRemOpcode::DIVU, 9, 1, 8));
    p.push(rtype(DivRemOpcode::REMU, 10, 1, 8));
    p.push(rtype(DivRemOpcode::DIV, 13, 11, 12));
    p.push(rtype(DivRemOpcode::REM, 14, 11, 12));
    p.push(rtype(DivRemOpcode::DIV, 15, 5, 8));
    p.push(rtype(DivRemOpcode::REM, 16, 5, 8));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 3), 14U);
    EXPECT_EQ(read_register(r.memory, 4), 2U);
    EXPECT_EQ(read_register(r.memory, 6), static_cast<uint32_t>(-14));
    EXPECT_EQ(read_register(r.memory, 7), static_cast<uint32_t>(-2));
    EXPECT_EQ(read_register(r.memory, 9), 0xFFFFFFFFU);
    EXPECT_EQ(read_register(r.memory, 10), 100U);
    EXPECT_EQ(read_register(r.memory, 13), 0x80000000U);
    EXPECT_EQ(read_register(r.memory, 14), 0U);
    EXPECT_EQ(read_register(r.memory, 15), 0xFFFFFFFFU);
    EXPECT_EQ(read_register(r.memory, 16), static_cast<uint32_t>(-100));
}

TEST_F(Rv32imChipTest, BranchEqual) {
    ProgramBuilder p;
    p.push(li(1, 5)).push(li(2, 5)).push(li(3, 6));
    p.push(branch(BranchEqualOpcode::BEQ, 1, 2, 8));  // taken
    p.push(addi(10, 0, 1));
    p.push(branch(BranchEqualOpcode::BEQ, 1, 3, 8));  // not taken
    p.push(addi(11, 0, 1));
    p.push(branch(BranchEqualOpcode::BNE, 1, 3, 8));  // taken
    p.push(addi(12, 0, 1));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 10), 0U);
    EXPECT_EQ(read_register(r.memory, 11), 1U);
    EXPECT_EQ(read_register(r.memory, 12), 0U);
}

TEST_F(Rv32imChipTest, BranchLessThan) {
    ProgramBuilder p;
    p.push(li(1, static_cast<uint32_t>(-3))).push(li(2, 2));
    p.push(branch(BranchLessThanOpcode::BLT, 1, 2, 8));  // -3 < 2: taken
    p.push(addi(10, 0, 1));
    p.push(branch(BranchLessThanOpcode::BLTU, 1, 2, 8));  // 0xFFFFFFFD < 2: not taken
    p.push(addi(11, 0, 1));
    p.push(branch(BranchLessThanOpcode::BGE, 2, 1, 8));  // taken
    p.push(addi(12, 0, 1));
    p.push(branch(BranchLessThanOpcode::BGEU, 2, 1, 8));  // not taken
    p.push(addi(13, 0, 1));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 10), 0U);
    EXPECT_EQ(read_register(r.memory, 11), 1U);
    EXPECT_EQ(read_register(r.memory, 12), 0U);
    EXPECT_EQ(read_register(r.memory, 13), 1U);
}

// Backward branch: count x1 down from 3 while x2 accumulates
TEST_F(Rv32imChipTest, BackwardBranchLoop) {
    ProgramBuilder p;
    p.push(li(1, 3));
    p.push(addi(2, 2, 10));
    p.push(addi(1, 1, -1));
    p.push(branch(BranchEqualOpcode::BNE, 1, 0, -8));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 1), 0U);
    EXPECT_EQ(read_register(r.memory, 2), 30U);
    EXPECT_EQ(r.segment->num_instructions(), 1U + 3 * 3 + 1);
}

TEST_F(Rv32imChipTest, JumpsAndUpperImmediates) {
    ProgramBuilder p;
    p.push(jal(1, 8));           // 0
    p.push(addi(5, 0, 99));      // 4, skipped
    p.push(auipc(2, 1));         // 8
    p.push(addi(3, 0, 25));      // 12
    p.push(jalr(4, 3, 0));       // 16, jumps to 24: the low bit is cleared
    p.push(addi(5, 0, 77));      // 20, skipped
    p.push(lui(6, 0xABCDE));     // 24
    p.push(terminate());         // 28

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 1), 4U);
    EXPECT_EQ(read_register(r.memory, 2), 8U + 4096U);
    EXPECT_EQ(read_register(r.memory, 4), 20U);
    EXPECT_EQ(read_register(r.memory, 5), 0U);
    EXPECT_EQ(read_register(r.memory, 6), 0xABCDE000U);
    EXPECT_EQ(r.segment->final_state().pc, 32U);
}

TEST_F(Rv32imChipTest, LoadsAndStores) {
    ProgramBuilder p;
    p.push(li(1, 0xDEADBEEF)).push(li(2, 0x100)).push(li(10, 0x7F)).push(li(12, 0x1234)).push(li(14, 0x110));
    p.push(sw(1, 2, 0));
    p.push(lw(5, 2, 0));
    p.push(loadstore(LoadStoreOpcode::LOADBU, 6, 2, 3));
    p.push(loadstore(LoadStoreOpcode::LOADB, 7, 2, 3));
    p.push(loadstore(LoadStoreOpcode::LOADHU, 8, 2, 2));
    p.push(loadstore(LoadStoreOpcode::LOADH, 9, 2, 2));
    p.push(loadstore(LoadStoreOpcode::STOREB, 10, 2, 5));
    p.push(lw(11, 2, 4));
    p.push(loadstore(LoadStoreOpcode::STOREH, 12, 2, 10));
    p.push(lw(13, 2, 8));
    p.push(lw(15, 14, -16));
    p.push(terminate());

    SegmentRun r = run(p);
    EXPECT_EQ(read_register(r.memory, 5), 0xDEADBEEFU);
    EXPECT_EQ(read_register(r.memory, 6), 0xDEU);
    EXPECT_EQ(read_register(r.memory, 7), 0xFFFFFFDEU);
    EXPECT_EQ(read_register(r.memory, 8), 0xDEADU);
    EXPECT_EQ(read_register(r.memory, 9), 0xFFFFDEADU);
    EXPECT_EQ(read_register(r.memory, 11), 0x00007F00U);
    EXPECT_EQ(read_register(r.memory, 13), 0x12340000U);
    EXPECT_EQ(read_register(r.memory, 15), 0xDEADBEEFU);
    EXPECT_EQ(read_bytes(r.memory, address_space::HEAP, 0x100, 4), (std::vector<uint8_t>{0xEF, 0xBE, 0xAD, 0xDE}));
}

// HintInput frames a 5-byte input as its length word followed by the
// bytes padded to whole words
TEST_F(Rv32imChipTest, HintInputAndStore) {
    ProgramBuilder p;
    p.push(phantom(PhantomDiscriminant::HintInput));
    p.push(li(1, 0x200));
    p.push(hint_storew(1));
    p.push(addi(1, 1, 4));
    p.push(hint_storew(1));
    p.push(addi(1, 1, 4));
    p.push(hint_storew(1));
    p.push(terminate());

    SegmentRun r = run(p, {{1, 2, 3, 4, 5}});
    EXPECT_EQ(read_bytes(r.memory, address_space::HEAP, 0x200, 12),
              (std::vector<uint8_t>{5, 0, 0, 0, 1, 2, 3, 4, 5, 0, 0, 0}));
}

TEST_F(Rv32imChipTest, HintStreamExhausted) {
    ProgramBuilder p;
    p.push(phantom(PhantomDiscriminant::HintInput));
    p.push(li(1, 0x200));
    p.push(hint_storew(1));
    p.push(hint_storew(1));
    p.push(terminate());

    ExecutionError e = run_expecting_error(p, {{}});
    EXPECT_EQ(e.kind(), ExecutionErrorKind::InputExhausted);
    EXPECT_EQ(e.pc(), 12U);
}

TEST_F(Rv32imChipTest, MissingInputFrame) {
    ProgramBuilder p;
    p.push(phantom(PhantomDiscriminant::HintInput));
    p.push(terminate());
    EXPECT_EQ(run_expecting_error(p).kind(), ExecutionErrorKind::InputExhausted);
}

TEST_F(Rv32imChipTest, RevealWritesPublicValueBytes) {
    ProgramBuilder p;
    p.push(li(1, 0x04030201));
    p.push(reveal(1, 0));
    p.push(reveal(1, 8));
    p.push(terminate());

    SegmentRun r = run(p);
    const auto& pvs = r.segment->public_values();
    ASSERT_EQ(pvs.size(), config_.system.num_public_values);
    EXPECT_EQ(pvs[0], BFieldElement(1));
    EXPECT_EQ(pvs[3], BFieldElement(4));
    EXPECT_FALSE(pvs[4].has_value());
    EXPECT_EQ(pvs[8], BFieldElement(1));
}

TEST_F(Rv32imChipTest, RevealOutOfRange) {
    ProgramBuilder p;
    p.push(li(1, 7));
    p.push(reveal(1, static_cast<uint32_t>(config_.system.num_public_values)));
    p.push(terminate());
    EXPECT_EQ(run_expecting_error(p).kind(), ExecutionErrorKind::PublicValueIndexOutOfBounds);
}

TEST_F(Rv32imChipTest, RevealTwiceWithDifferentValue) {
    ProgramBuilder p;
    p.push(li(1, 7)).push(li(2, 8));
    p.push(reveal(1, 0));
    p.push(reveal(1, 0));
    p.push(reveal(2, 0));
    p.push(terminate());
    EXPECT_EQ(run_expecting_error(p).kind(), ExecutionErrorKind::PublicValueNotEqual);
}

TEST_F(Rv32imChipTest, DisabledOpcodeNamesPc) {
    ProgramBuilder p;
    p.push(li(1, 0x100));
    p.push(Instruction::from_isize(opcode(KeccakOpcode::KECCAKF), 0, reg(1), 0, address_space::REGISTER,
                                   address_space::HEAP));
    p.push(terminate());

    ExecutionError e = run_expecting_error(p);
    EXPECT_EQ(e.kind(), ExecutionErrorKind::DisabledOperation);
    EXPECT_EQ(e.pc(), 4U);
}

TEST_F(Rv32imChipTest, JumpOutsideProgram) {
    ProgramBuilder p;
    p.push(jal(1, 400));
    p.push(terminate());
    ExecutionError e = run_expecting_error(p);
    EXPECT_EQ(e.kind(), ExecutionErrorKind::PcOutOfBounds);
    EXPECT_EQ(e.pc(), 400U);
}

TEST_F(Rv32imChipTest, DebugPanicFails) {
    ProgramBuilder p;
    p.push(phantom(PhantomDiscriminant::DebugPanic));
    p.push(terminate());
    ExecutionError e = run_expecting_error(p);
    EXPECT_EQ(e.kind(), ExecutionErrorKind::Fail);
    EXPECT_EQ(e.pc(), 0U);
}

TEST_F(Rv32imChipTest, TerminateExitCode) {
    ProgramBuilder p;
    p.push(terminate(3));
    SegmentRun r = run(p);
    ASSERT_TRUE(r.segment->exit_code().has_value());
    EXPECT_EQ(*r.segment->exit_code(), 3U);
    EXPECT_TRUE(r.segment->is_terminated());
}
