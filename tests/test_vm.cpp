#include <gtest/gtest.h>
#include "extensions/weierstrass.hpp"
#include "stark/errors.hpp"
#include "stark/verifier.hpp"
#include "system/connector.hpp"
#include "test_utils.hpp"
#include "vm/vm.hpp"
#include <gmpxx.h>
#include <iostream>

using namespace zkrv;
using namespace zkrv::test;

namespace {

// Cuts a segment after a fixed number of instructions
class InstructionCountStrategy : public SegmentationStrategy {
public:
    explicit InstructionCountStrategy(size_t max_instructions) : max_instructions_(max_instructions) {}

    bool should_segment(const std::vector<std::string>& /*air_names*/, const std::vector<size_t>& /*heights*/,
                        size_t instructions, uint32_t /*timestamp_delta*/) const override {
        return instructions >= max_instructions_;
    }

private:
    size_t max_instructions_;
};

uint32_t public_word(const std::vector<BFieldElement>& values, size_t offset) {
    uint32_t word = 0;
    for (size_t i = 0; i < 4; ++i) {
        word |= values.at(offset + i).value() << (8 * i);
    }
    return word;
}

// (x1, x2) = (F(7), F(8)) = (13, 21), revealed at byte offsets 0 and 4
ProgramBuilder fibonacci_program() {
    ProgramBuilder p;
    p.push(addi(1, 0, 0));
    p.push(addi(2, 0, 1));
    p.push(addi(3, 0, 7));
    p.push(add(4, 1, 2));  // loop: pc 12
    p.push(addi(1, 2, 0));
    p.push(addi(2, 4, 0));
    p.push(addi(3, 3, -1));
    p.push(branch(BranchEqualOpcode::BNE, 3, 0, -16));
    p.push(reveal(1, 0));
    p.push(reveal(2, 4));
    p.push(terminate());
    return p;
}

} // namespace

class VmTest : public ::testing::Test {
protected:
    VmConfig config_ = VmConfig::rv32im();

    void SetUp() override { config_.system.with_fri_params(FriParameters::testing()); }

    /**
     * Keygen, commit, prove and verify the whole chain of segment proofs.
     */
    VerifiedExecution prove_and_verify(const VirtualMachine& vm, const VmExe& exe,
                                       std::vector<std::vector<uint8_t>> inputs = {},
                                       size_t* num_segments = nullptr) {
        const MultiStarkProvingKey pk = vm.keygen();
        const VmCommittedExe committed = vm.commit_program(exe);
        const std::vector<Proof> proofs = vm.prove(pk, committed, std::move(inputs));
        if (num_segments != nullptr) {
            *num_segments = proofs.size();
        }
        return vm.verify_segment_proofs(pk.get_vk(), program_commitment(committed), proofs);
    }

    static VmVerificationErrorKind chain_rejection(const VirtualMachine& vm, const MultiStarkVerifyingKey& vk,
                                                   const ProgramCommitment& commitment,
                                                   const std::vector<Proof>& proofs, size_t* segment = nullptr) {
        try {
            vm.verify_segment_proofs(vk, commitment, proofs);
        } catch (const VmVerificationError& e) {
            if (segment != nullptr) {
                *segment = e.segment();
            }
            return e.kind();
        }
        ADD_FAILURE() << "segment chain accepted";
        return VmVerificationErrorKind::StarkError;
    }
};

// ============================================================================
// End-to-end scenarios
// ============================================================================

TEST_F(VmTest, TerminateOnly) {
    VirtualMachine vm(config_);
    ProgramBuilder p;
    p.push(terminate());
    const VmExe exe = p.exe();

    VmExecutorResult result = vm.execute(exe, {});
    EXPECT_EQ(result.final_state, ExecutionState(4, 1));
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0U);
    EXPECT_EQ(result.num_segments, 1U);
    for (const auto& pv : result.public_values) {
        EXPECT_FALSE(pv.has_value());
    }

    VerifiedExecution verified = prove_and_verify(vm, exe);
    EXPECT_EQ(verified.exit_code, 0U);
    EXPECT_EQ(verified.final_pc, 4U);
    for (const auto& v : verified.public_values) {
        EXPECT_TRUE(v.is_zero());
    }
    EXPECT_FALSE(verified.final_memory_root.has_value());
    std::cout << "  ✓ terminate-only program proven and verified" << std::endl;
}

TEST_F(VmTest, AddTwoRegistersAndReveal) {
    VirtualMachine vm(config_);
    ProgramBuilder p;
    p.push(lui(1, 0)).push(addi(1, 1, 7));
    p.push(lui(2, 0)).push(addi(2, 2, 35));
    p.push(add(3, 1, 2));
    p.push(reveal(3, 0));
    p.push(terminate());
    const VmExe exe = p.exe();

    VmExecutorResult result = vm.execute(exe, {});
    EXPECT_EQ(read_register(result.final_memory, 3), 42U);
    ASSERT_TRUE(result.public_values[0].has_value());
    EXPECT_EQ(*result.public_values[0], BFieldElement(42));

    VerifiedExecution verified = prove_and_verify(vm, exe);
    EXPECT_EQ(public_word(verified.public_values, 0), 42U);
}

TEST_F(VmTest, UnsignedDivisionWithRemainder) {
    VirtualMachine vm(config_);
    ProgramBuilder p;
    p.push(addi(1, 0, 100)).push(addi(2, 0, 7));
    p.push(rtype(DivRemOpcode::DIVU, 3, 1, 2));
    p.push(rtype(DivRemOpcode::REMU, 4, 1, 2));
    p.push(terminate());
    const VmExe exe = p.exe();

    VmExecutorResult result = vm.execute(exe, {});
    EXPECT_EQ(read_register(result.final_memory, 3), 14U);
    EXPECT_EQ(read_register(result.final_memory, 4), 2U);
    EXPECT_NO_THROW(prove_and_verify(vm, exe));
}

TEST_F(VmTest, MemoryRoundTrip) {
    VirtualMachine vm(config_);
    ProgramBuilder p;
    p.push(li(1, 0xDEADBEEF));
    p.push(addi(2, 0, 0x100));
    p.push(sw(1, 2, 0));
    p.push(lw(5, 2, 0));
    p.push(terminate());
    const VmExe exe = p.exe();

    VmExecutorResult result = vm.execute(exe, {});
    EXPECT_EQ(read_register(result.final_memory, 5), 0xDEADBEEFU);
    EXPECT_EQ(read_bytes(result.final_memory, address_space::HEAP, 0x100, 4),
              (std::vector<uint8_t>{0xEF, 0xBE, 0xAD, 0xDE}));
    // The offline memory bus only balances if every read returns the latest write
    EXPECT_NO_THROW(prove_and_verify(vm, exe));
}

TEST_F(VmTest, BranchTakenAndFallthrough) {
    VirtualMachine vm(config_);
    for (const uint32_t x2 : {5U, 6U}) {
        ProgramBuilder p;
        p.push(addi(1, 0, 5));
        p.push(addi(2, 0, static_cast<int32_t>(x2)));
        p.push(branch(BranchEqualOpcode::BEQ, 1, 2, 8));  // pc 8
        p.push(addi(6, 0, 1));                             // pc 12, skipped when taken
        p.push(addi(7, 0, 1));                             // pc 16
        p.push(terminate());
        const VmExe exe = p.exe();

        VmExecutorResult result = vm.execute(exe, {});
        const bool taken = x2 == 5;
        EXPECT_EQ(read_register(result.final_memory, 6), taken ? 0U : 1U);
        EXPECT_EQ(read_register(result.final_memory, 7), 1U);
        EXPECT_EQ(result.num_instructions, taken ? 5U : 6U);
        EXPECT_NO_THROW(prove_and_verify(vm, exe)) << "x2 = " << x2;
    }
}

// Modular addition over the secp256k1 base field; a tampered result limb is rejected
TEST_F(VmTest, ModularAddOverSecp256k1) {
    const mpz_class p = curve_params("secp256k1").modulus;
    config_.system.with_continuations();
    config_.moduli = {p.get_str(10)};
    VirtualMachine vm(config_);

    const mpz_class a = p - 5;
    const mpz_class b("0x1f2e3d4c5b6a798800112233445566778899aabbccddeeff0011223344556677");
    const mpz_class expected = (a + b) % p;

    auto to_bytes = [](mpz_class x) {
        std::vector<uint8_t> out(32);
        for (auto& byte : out) {
            const mpz_class low = x % 256;
            byte = static_cast<uint8_t>(low.get_ui());
            x /= 256;
        }
        return out;
    };

    ProgramBuilder prog;
    prog.push(heap_op(modular_opcode(0, ModularOpcode::ADD), 3, 1, 2));
    prog.push(terminate());
    VmExe exe = prog.exe();
    put_bytes(exe.init_memory, 0x1000, to_bytes(a));
    put_bytes(exe.init_memory, 0x1100, to_bytes(b));
    put_register(exe.init_memory, 1, 0x1000);
    put_register(exe.init_memory, 2, 0x1100);
    put_register(exe.init_memory, 3, 0x1200);

    VmExecutorResult result = vm.execute(exe, {});
    EXPECT_EQ(read_bytes(result.final_memory, address_space::HEAP, 0x1200, 32), to_bytes(expected));

    const MultiStarkProvingKey pk = vm.keygen();
    const MultiStarkVerifyingKey vk = pk.get_vk();
    const VmCommittedExe committed = vm.commit_program(exe);
    const std::vector<Proof> proofs = vm.prove(pk, committed, {});
    ASSERT_EQ(proofs.size(), 1U);
    EXPECT_NO_THROW(vm.verify_segment_proofs(vk, program_commitment(committed), proofs));

    std::vector<SegmentResult> segments = vm.execute_and_generate(committed, {});
    ASSERT_EQ(segments.size(), 1U);
    size_t modular_index = SIZE_MAX;
    for (size_t k = 0; k < segments[0].proof_input.per_air.size(); ++k) {
        if (pk.per_air[segments[0].proof_input.per_air[k].first].vk.air_name == "ModularAddSubAir<0>") {
            modular_index = k;
        }
    }
    ASSERT_NE(modular_index, SIZE_MAX);

    const size_t width = segments[0].proof_input.per_air[modular_index].second.common_main.width();
    MultiStarkProver prover(pk);
    MultiStarkVerifier verifier(vk);
    for (const size_t column : {width - 1, width - 16, width / 2}) {
        ProofInput tampered = segments[0].proof_input;
        auto& trace = tampered.per_air[modular_index].second.common_main;
        trace.set(0, column, trace.get(0, column) + BFieldElement::one());
        const Proof proof = prover.prove(std::move(tampered));
        EXPECT_THROW(verifier.verify(proof), VerificationError) << "column " << column;
    }
}

TEST_F(VmTest, SegmentedFibonacci) {
    config_.system.with_continuations();
    VirtualMachine vm(config_, std::make_shared<InstructionCountStrategy>(16));
    const VmExe exe = fibonacci_program().exe();

    VmExecutorResult result = vm.execute(exe, {});
    EXPECT_GE(result.num_segments, 2U);
    EXPECT_EQ(result.num_instructions, 41U);

    const MultiStarkProvingKey pk = vm.keygen();
    const VmCommittedExe committed = vm.commit_program(exe);
    std::vector<SegmentResult> segments = vm.execute_and_generate(committed, {});
    ASSERT_GE(segments.size(), 2U);
    for (size_t i = 1; i < segments.size(); ++i) {
        EXPECT_EQ(segments[i].initial_state.pc, segments[i - 1].final_state.pc);
        EXPECT_EQ(segments[i].initial_state.timestamp, INITIAL_TIMESTAMP);
        ASSERT_TRUE(segments[i - 1].final_memory.final_tree.has_value());
        EXPECT_EQ(segments[i].final_memory.initial_tree->root(), segments[i - 1].final_memory.final_tree->root());
    }
    EXPECT_EQ(segments.back().status, SegmentStatus::Terminated);

    const std::vector<Proof> proofs = vm.prove(pk, committed, {});
    ASSERT_EQ(proofs.size(), segments.size());
    VerifiedExecution verified = vm.verify_segment_proofs(pk.get_vk(), program_commitment(committed), proofs);
    EXPECT_EQ(public_word(verified.public_values, 0), 13U);
    EXPECT_EQ(public_word(verified.public_values, 4), 21U);
    EXPECT_TRUE(verified.final_memory_root.has_value());
    std::cout << "  ✓ " << proofs.size() << " segment proofs chained" << std::endl;
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(VmTest, ExecutionIsDeterministic) {
    config_.system.with_continuations();
    VirtualMachine vm(config_, std::make_shared<InstructionCountStrategy>(16));
    const VmExe exe = fibonacci_program().exe();

    VmExecutorResult a = vm.execute(exe, {});
    VmExecutorResult b = vm.execute(exe, {});
    EXPECT_EQ(a.final_state, b.final_state);
    EXPECT_EQ(a.final_memory, b.final_memory);
    EXPECT_EQ(a.public_values, b.public_values);

    const VmCommittedExe committed = vm.commit_program(exe);
    std::vector<SegmentResult> first = vm.execute_and_generate(committed, {});
    std::vector<SegmentResult> second = vm.execute_and_generate(committed, {});
    ASSERT_EQ(first.size(), second.size());
    for (size_t s = 0; s < first.size(); ++s) {
        const auto& x = first[s].proof_input.per_air;
        const auto& y = second[s].proof_input.per_air;
        ASSERT_EQ(x.size(), y.size());
        for (size_t k = 0; k < x.size(); ++k) {
            EXPECT_EQ(x[k].first, y[k].first);
            EXPECT_EQ(x[k].second.common_main.values(), y[k].second.common_main.values());
            EXPECT_EQ(x[k].second.public_values, y[k].second.public_values);
        }
    }
}

// A segmented run ends where the single-segment run ends
TEST_F(VmTest, SegmentationPreservesOutcome) {
    config_.system.with_continuations();
    const VmExe exe = fibonacci_program().exe();
    VirtualMachine single(config_);
    VirtualMachine segmented(config_, std::make_shared<InstructionCountStrategy>(10));

    size_t single_count = 0;
    size_t segmented_count = 0;
    VerifiedExecution x = prove_and_verify(single, exe, {}, &single_count);
    VerifiedExecution y = prove_and_verify(segmented, exe, {}, &segmented_count);
    EXPECT_EQ(single_count, 1U);
    EXPECT_GT(segmented_count, 2U);
    EXPECT_EQ(x.final_pc, y.final_pc);
    EXPECT_EQ(x.exit_code, y.exit_code);
    EXPECT_EQ(x.public_values, y.public_values);
    ASSERT_TRUE(x.final_memory_root && y.final_memory_root);
    EXPECT_EQ(*x.final_memory_root, *y.final_memory_root);
}

TEST_F(VmTest, SegmentationWithoutContinuationsFails) {
    VirtualMachine vm(config_, std::make_shared<InstructionCountStrategy>(8));
    try {
        vm.execute(fibonacci_program().exe(), {});
        FAIL() << "segmented a volatile-memory run";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.kind(), ExecutionErrorKind::SegmentationFailure);
    }
}

// ============================================================================
// Segment chain verification
// ============================================================================

class SegmentChainTest : public VmTest {
protected:
    std::unique_ptr<VirtualMachine> vm_;
    std::unique_ptr<MultiStarkProvingKey> pk_;
    MultiStarkVerifyingKey vk_;
    VmExe exe_;
    ProgramCommitment commitment_;
    std::vector<Proof> proofs_;

    void SetUp() override {
        VmTest::SetUp();
        config_.system.with_continuations();
        vm_ = std::make_unique<VirtualMachine>(config_, std::make_shared<InstructionCountStrategy>(16));
        pk_ = std::make_unique<MultiStarkProvingKey>(vm_->keygen());
        vk_ = pk_->get_vk();
        exe_ = fibonacci_program().exe();
        const VmCommittedExe committed = vm_->commit_program(exe_);
        commitment_ = program_commitment(committed);
        proofs_ = vm_->prove(*pk_, committed, {});
        ASSERT_GE(proofs_.size(), 3U);
    }
};

TEST_F(SegmentChainTest, HonestChainVerifies) {
    EXPECT_NO_THROW(vm_->verify_segment_proofs(vk_, commitment_, proofs_));
}

TEST_F(SegmentChainTest, ReorderedSegmentsRejected) {
    std::vector<Proof> reordered = proofs_;
    std::swap(reordered[0], reordered[1]);
    size_t segment = SIZE_MAX;
    EXPECT_EQ(chain_rejection(*vm_, vk_, commitment_, reordered, &segment),
              VmVerificationErrorKind::InitialPcMismatch);
    EXPECT_EQ(segment, 0U);
}

TEST_F(SegmentChainTest, DroppedMiddleSegmentRejected) {
    std::vector<Proof> dropped = proofs_;
    dropped.erase(dropped.begin() + 1);
    size_t segment = SIZE_MAX;
    const VmVerificationErrorKind kind = chain_rejection(*vm_, vk_, commitment_, dropped, &segment);
    EXPECT_TRUE(kind == VmVerificationErrorKind::InitialPcMismatch ||
                kind == VmVerificationErrorKind::InitialMemoryRootMismatch)
        << to_string(kind);
    EXPECT_EQ(segment, 1U);
}

TEST_F(SegmentChainTest, TruncatedChainRejected) {
    std::vector<Proof> truncated(proofs_.begin(), proofs_.end() - 1);
    size_t segment = SIZE_MAX;
    EXPECT_EQ(chain_rejection(*vm_, vk_, commitment_, truncated, &segment),
              VmVerificationErrorKind::IsTerminateMismatch);
    EXPECT_EQ(segment, truncated.size() - 1);
}

TEST_F(SegmentChainTest, WrongProgramCommitRejected) {
    ProgramCommitment other = commitment_;
    other.commit[0] = other.commit[0] + BFieldElement::one();
    EXPECT_EQ(chain_rejection(*vm_, vk_, other, proofs_),
              VmVerificationErrorKind::ProgramCommitMismatch);
}

TEST_F(SegmentChainTest, WrongStartPcRejected) {
    ProgramCommitment other = commitment_;
    other.pc_start += 4;
    EXPECT_EQ(chain_rejection(*vm_, vk_, other, proofs_),
              VmVerificationErrorKind::InitialPcMismatch);
}

TEST_F(SegmentChainTest, TamperedSegmentProofRejected) {
    std::vector<Proof> tampered = proofs_;
    tampered[1].per_air[0].public_values.push_back(BFieldElement::one());
    size_t segment = SIZE_MAX;
    EXPECT_EQ(chain_rejection(*vm_, vk_, commitment_, tampered, &segment),
              VmVerificationErrorKind::StarkError);
    EXPECT_EQ(segment, 1U);
}

// Same program, different initial memory: the image is part of what was committed
TEST_F(SegmentChainTest, ForgedInitialMemoryRejected) {
    auto load_and_reveal = [](uint8_t stored) {
        ProgramBuilder p;
        p.push(addi(2, 0, 0x100));
        p.push(lw(5, 2, 0));
        p.push(reveal(5, 0));
        p.push(terminate());
        VmExe exe = p.exe();
        put_bytes(exe.init_memory, 0x100, {stored, 0, 0, 0});
        return exe;
    };
    const VmCommittedExe honest = vm_->commit_program(load_and_reveal(1));
    const VmCommittedExe forged = vm_->commit_program(load_and_reveal(99));
    ASSERT_EQ(honest.program_commit(), forged.program_commit());
    ASSERT_TRUE(honest.init_memory_root && forged.init_memory_root);
    EXPECT_NE(*honest.init_memory_root, *forged.init_memory_root);

    const std::vector<Proof> forged_proofs = vm_->prove(*pk_, forged, {});
    const VerifiedExecution own = vm_->verify_segment_proofs(vk_, program_commitment(forged), forged_proofs);
    EXPECT_EQ(public_word(own.public_values, 0), 99U);
    ASSERT_TRUE(own.exe_commit.has_value());
    EXPECT_EQ(*own.exe_commit, compute_exe_commit(forged.program_commit(), *forged.init_memory_root, 0));
    EXPECT_NE(*own.exe_commit, compute_exe_commit(honest.program_commit(), *honest.init_memory_root, 0));

    size_t segment = SIZE_MAX;
    EXPECT_EQ(chain_rejection(*vm_, vk_, program_commitment(honest), forged_proofs, &segment),
              VmVerificationErrorKind::InitialMemoryRootMismatch);
    EXPECT_EQ(segment, 0U);

    ProgramCommitment without_root = program_commitment(honest);
    without_root.init_memory_root.reset();
    EXPECT_THROW(vm_->verify_segment_proofs(vk_, without_root, forged_proofs), std::invalid_argument);
}

// A word revealed as zero in one segment cannot change in a later one
TEST_F(SegmentChainTest, RevealedZeroCannotChange) {
    ProgramBuilder p;
    p.push(reveal(0, 8));
    p.push(addi(1, 0, 0));
    p.push(addi(2, 0, 1));
    p.push(addi(3, 0, 7));
    p.push(add(4, 1, 2));
    p.push(addi(1, 2, 0));
    p.push(addi(2, 4, 0));
    p.push(addi(3, 3, -1));
    p.push(branch(BranchEqualOpcode::BNE, 3, 0, -16));
    p.push(terminate());
    const VmCommittedExe committed = vm_->commit_program(p.exe());
    const ProgramCommitment commitment = program_commitment(committed);

    std::vector<SegmentResult> segments = vm_->execute_and_generate(committed, {});
    ASSERT_GE(segments.size(), 2U);
    MultiStarkProver prover(*pk_);
    std::vector<Proof> honest;
    for (const SegmentResult& segment : segments) {
        honest.push_back(prover.prove(segment.proof_input));
    }
    const VerifiedExecution verified = vm_->verify_segment_proofs(vk_, commitment, honest);
    EXPECT_EQ(public_word(verified.public_values, 8), 0U);

    // Rewrite slot 2 of segment 1 consistently so the segment proof itself is valid
    auto rewrite_slot = [&](uint32_t byte, uint32_t flag) {
        ProofInput input = segments[1].proof_input;
        for (auto& [air_id, air_input] : input.per_air) {
            if (air_id != VmChipComplex::PUBLIC_VALUES_AIR_ID) {
                continue;
            }
            const size_t num_bytes = config_.system.num_public_values;
            air_input.public_values[8] = BFieldElement(byte);
            air_input.public_values[num_bytes + 2] = BFieldElement(flag);
            air_input.common_main.set(2, 1, BFieldElement(byte));
        }
        std::vector<Proof> proofs = honest;
        proofs[1] = prover.prove(std::move(input));
        EXPECT_NO_THROW(MultiStarkVerifier(vk_).verify(proofs[1]));
        return proofs;
    };

    size_t segment = SIZE_MAX;
    EXPECT_EQ(chain_rejection(*vm_, vk_, commitment, rewrite_slot(5, 1), &segment),
              VmVerificationErrorKind::PublicValuesMismatch);
    EXPECT_EQ(segment, 1U);
    EXPECT_EQ(chain_rejection(*vm_, vk_, commitment, rewrite_slot(0, 0), &segment),
              VmVerificationErrorKind::PublicValuesMismatch);
    EXPECT_EQ(segment, 1U);
}

TEST_F(VmTest, NonZeroExitCodeRejected) {
    VirtualMachine vm(config_);
    ProgramBuilder p;
    p.push(terminate(3));
    const VmExe exe = p.exe();
    const MultiStarkProvingKey pk = vm.keygen();
    const VmCommittedExe committed = vm.commit_program(exe);
    const std::vector<Proof> proofs = vm.prove(pk, committed, {});
    EXPECT_EQ(chain_rejection(vm, pk.get_vk(), program_commitment(committed), proofs),
              VmVerificationErrorKind::ExitCodeMismatch);
}

TEST_F(VmTest, ProgramCommitmentIdentifiesProgram) {
    VirtualMachine vm(config_);
    ProgramBuilder a;
    a.push(addi(1, 0, 1)).push(terminate());
    ProgramBuilder b;
    b.push(addi(1, 0, 2)).push(terminate());

    const ProgramCommitment ca = program_commitment(vm.commit_program(a.exe()));
    const ProgramCommitment ca_again = program_commitment(vm.commit_program(a.exe()));
    const ProgramCommitment cb = program_commitment(vm.commit_program(b.exe()));
    EXPECT_EQ(ca, ca_again);
    EXPECT_NE(ca.commit, cb.commit);
    EXPECT_EQ(ca.num_slots, 2U);
    EXPECT_EQ(codec::decode_program_commitment(codec::encode_program_commitment(ca)), ca);
}
