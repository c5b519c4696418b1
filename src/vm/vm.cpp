#include "vm/vm.hpp"
#include "common/debug_control.hpp"
#include "hash/poseidon2.hpp"
#include "memory/memory_merkle.hpp"
#include "memory/merkle_chip.hpp"
#include "stark/errors.hpp"
#include "stark/verifier.hpp"
#include "system/connector.hpp"
#include "vm/chip_complex.hpp"
#include <array>
#include <chrono>

namespace zkrv {

const char* to_string(VmVerificationErrorKind kind) {
    switch (kind) {
        case VmVerificationErrorKind::InitialPcMismatch: return "InitialPcMismatch";
        case VmVerificationErrorKind::InitialTimestampMismatch: return "InitialTimestampMismatch";
        case VmVerificationErrorKind::InitialMemoryRootMismatch: return "InitialMemoryRootMismatch";
        case VmVerificationErrorKind::IsTerminateMismatch: return "IsTerminateMismatch";
        case VmVerificationErrorKind::ExitCodeMismatch: return "ExitCodeMismatch";
        case VmVerificationErrorKind::ProgramCommitMismatch: return "ProgramCommitMismatch";
        case VmVerificationErrorKind::PublicValuesMismatch: return "PublicValuesMismatch";
        case VmVerificationErrorKind::UnexpectedPvs: return "UnexpectedPvs";
        case VmVerificationErrorKind::StarkError: return "StarkError";
    }
    return "Unknown";
}

// ============================================================================
// VmExecutor
// ============================================================================

VmExecutor::VmExecutor(VmConfig config, std::shared_ptr<const SegmentationStrategy> strategy)
    : config_(std::move(config)), strategy_(std::move(strategy)) {
    config_.validate();
    if (!strategy_) {
        strategy_ = DefaultSegmentationStrategy::from_config(config_.system);
    }
}

void VmExecutor::execute_segments(const VmExe& exe, std::shared_ptr<const CommittedMatrix> committed,
                                  std::vector<std::vector<uint8_t>> inputs,
                                  const std::function<void(ExecutionSegment&, ExecutionState)>& on_segment) const {
    auto streams = std::make_shared<Streams>(std::move(inputs));
    ExecutionSegment::InitialMemory memory{exe.init_memory, std::nullopt};
    std::vector<std::optional<BFieldElement>> revealed;
    ExecutionState state(exe.pc_start, INITIAL_TIMESTAMP);

    for (size_t index = 0;; ++index) {
        ExecutionSegment segment(config_, exe.program, committed, streams, std::move(memory), revealed);
        segment.execute_from_state(state, *strategy_);
        ZKRV_DEBUG_PRINT("[vm] segment %zu: %zu instructions, pc 0x%08x -> 0x%08x\n", index,
                         segment.num_instructions(), state.pc, segment.final_state().pc);
        on_segment(segment, state);
        if (segment.is_terminated()) {
            return;
        }

        const FinalMemory& final_memory = segment.final_memory();
        memory = ExecutionSegment::InitialMemory{final_memory.image, final_memory.final_tree};
        revealed = segment.public_values();
        state = ExecutionState(segment.final_state().pc, INITIAL_TIMESTAMP);
    }
}

VmExecutorResult VmExecutor::execute(const VmExe& exe, std::vector<std::vector<uint8_t>> inputs) const {
    VmExecutorResult result;
    execute_segments(exe, nullptr, std::move(inputs), [&](ExecutionSegment& segment, ExecutionState) {
        ++result.num_segments;
        result.num_instructions += segment.num_instructions();
        result.final_state = segment.final_state();
        result.exit_code = segment.exit_code();
        result.public_values = segment.public_values();
        if (segment.is_terminated()) {
            result.final_memory = segment.memory().image();
        }
    });
    return result;
}

std::vector<SegmentResult> VmExecutor::execute_and_generate(const VmCommittedExe& exe,
                                                            std::vector<std::vector<uint8_t>> inputs) const {
    if (!exe.committed_program) {
        throw std::invalid_argument("execute_and_generate needs a committed program");
    }
    std::vector<SegmentResult> results;
    execute_segments(exe.exe, exe.committed_program, std::move(inputs),
                     [&](ExecutionSegment& segment, ExecutionState initial_state) {
                         SegmentResult result;
                         result.initial_state = initial_state;
                         result.final_state = segment.final_state();
                         result.status = segment.status();
                         result.exit_code = segment.exit_code();
                         result.num_instructions = segment.num_instructions();
                         result.final_memory = segment.final_memory();
                         result.proof_input = segment.generate_proof_input();
                         results.push_back(std::move(result));
                     });
    return results;
}

// ============================================================================
// VirtualMachine
// ============================================================================

VirtualMachine::VirtualMachine(VmConfig config, std::shared_ptr<const SegmentationStrategy> strategy)
    : config_(config), executor_(std::move(config), std::move(strategy)) {}

MultiStarkProvingKey VirtualMachine::keygen() const {
    VmChipComplex complex(config_, std::make_shared<Streams>());
    MultiStarkKeygenBuilder builder(config_.system.fri_params);
    for (const AirRef& air : complex.airs()) {
        builder.add_air(air);
    }
    return builder.generate_pk();
}

VmCommittedExe VirtualMachine::commit_program(VmExe exe) const {
    TwoAdicPcs pcs(config_.system.fri_params);
    VmCommittedExe committed = VmCommittedExe::commit(std::move(exe), pcs);
    if (config_.system.continuation_enabled) {
        committed.init_memory_root =
            MemoryMerkleTree::from_image(config_.system.memory_config, committed.exe.init_memory).root();
    }
    return committed;
}

Digest compute_exe_commit(const Digest& program_commit, const Digest& init_memory_root, uint32_t pc_start) {
    std::vector<BFieldElement> padded_pc(Digest::LEN, BFieldElement::zero());
    padded_pc[0] = BFieldElement(pc_start);
    const Digest program_hash = Poseidon2::hash_varlen(program_commit.elements().data(), Digest::LEN);
    const Digest memory_hash = Poseidon2::hash_varlen(init_memory_root.elements().data(), Digest::LEN);
    return Poseidon2::compress(Poseidon2::compress(program_hash, memory_hash), Poseidon2::hash_varlen(padded_pc));
}

std::vector<Proof> VirtualMachine::prove(const MultiStarkProvingKey& pk, const VmCommittedExe& exe,
                                         std::vector<std::vector<uint8_t>> inputs) const {
    auto t_start = std::chrono::high_resolution_clock::now();
    std::vector<SegmentResult> segments = execute_and_generate(exe, std::move(inputs));
    auto t_exec = std::chrono::high_resolution_clock::now();

    MultiStarkProver prover(pk);
    std::vector<Proof> proofs;
    proofs.reserve(segments.size());
    for (SegmentResult& segment : segments) {
        proofs.push_back(prover.prove(std::move(segment.proof_input)));
    }

    ZKRV_IF_PROFILE {
        auto ms = [](auto a, auto b) { return std::chrono::duration<double, std::milli>(b - a).count(); };
        auto t_end = std::chrono::high_resolution_clock::now();
        printf("[profile] execute + tracegen: %.1f ms\n", ms(t_start, t_exec));
        printf("[profile] prove %zu segment(s): %.1f ms\n", segments.size(), ms(t_exec, t_end));
    }
    return proofs;
}

VerifiedExecution VirtualMachine::verify_segment_proofs(const MultiStarkVerifyingKey& vk,
                                                        const ProgramCommitment& commitment,
                                                        const std::vector<Proof>& proofs) const {
    if (proofs.empty()) {
        throw std::invalid_argument("no segment proofs to verify");
    }
    const bool persistent = config_.system.continuation_enabled;
    if (persistent && !commitment.init_memory_root) {
        throw std::invalid_argument("persistent memory needs the initial memory root in the program commitment");
    }
    const size_t num_bytes = config_.system.num_public_values;
    const size_t num_slots = num_bytes / PUBLIC_VALUE_SLOT_BYTES;
    MultiStarkVerifier verifier(vk);
    VerifiedExecution out;

    uint32_t prev_final_pc = commitment.pc_start;
    std::optional<Digest> prev_final_root = persistent ? commitment.init_memory_root : std::nullopt;
    std::vector<BFieldElement> prev_public_values;

    for (size_t i = 0; i < proofs.size(); ++i) {
        const Proof& proof = proofs[i];
        const bool last = i + 1 == proofs.size();
        try {
            verifier.verify(proof);
        } catch (const VerificationError& e) {
            throw VmVerificationError(VmVerificationErrorKind::StarkError, i, e.what());
        }

        if (proof.find_air(VmChipComplex::PROGRAM_AIR_ID) == nullptr || proof.cached_main_commits.empty() ||
            proof.cached_main_commits[0] != Commitment{commitment.commit}) {
            throw VmVerificationError(VmVerificationErrorKind::ProgramCommitMismatch, i,
                                      "expected " + commitment.commit.to_hex());
        }

        const AirProofData* connector = proof.find_air(VmChipComplex::CONNECTOR_AIR_ID);
        if (connector == nullptr) {
            throw VmVerificationError(VmVerificationErrorKind::StarkError, i, "connector AIR missing");
        }
        for (const AirProofData& data : proof.per_air) {
            const bool carries_pvs = data.air_id == VmChipComplex::CONNECTOR_AIR_ID ||
                                     data.air_id == VmChipComplex::PUBLIC_VALUES_AIR_ID ||
                                     (persistent && data.air_id == VmChipComplex::MERKLE_AIR_ID);
            if (!carries_pvs && !data.public_values.empty()) {
                throw VmVerificationError(VmVerificationErrorKind::UnexpectedPvs, i,
                                          vk.per_air[data.air_id].air_name + " carries " +
                                              std::to_string(data.public_values.size()) + " public values");
            }
        }

        const VmConnectorPvs pvs = VmConnectorPvs::from_field_elements(connector->public_values);
        if (pvs.initial_pc != prev_final_pc) {
            throw VmVerificationError(VmVerificationErrorKind::InitialPcMismatch, i,
                                      "initial pc " + std::to_string(pvs.initial_pc) + ", expected " +
                                          std::to_string(prev_final_pc));
        }
        if (pvs.initial_timestamp != INITIAL_TIMESTAMP) {
            throw VmVerificationError(VmVerificationErrorKind::InitialTimestampMismatch, i,
                                      "initial timestamp " + std::to_string(pvs.initial_timestamp));
        }
        if (pvs.is_terminate != last) {
            throw VmVerificationError(VmVerificationErrorKind::IsTerminateMismatch, i,
                                      last ? "last segment did not terminate" : "terminated before the last segment");
        }
        const uint32_t expected_exit_code =
            last ? static_cast<uint32_t>(ExitCode::Success) : DEFAULT_SUSPEND_EXIT_CODE;
        if (pvs.exit_code != expected_exit_code) {
            throw VmVerificationError(VmVerificationErrorKind::ExitCodeMismatch, i,
                                      "exit code " + std::to_string(pvs.exit_code) + ", expected " +
                                          std::to_string(expected_exit_code));
        }
        prev_final_pc = pvs.final_pc;

        if (persistent) {
            const AirProofData* merkle = proof.find_air(VmChipComplex::MERKLE_AIR_ID);
            if (merkle == nullptr || merkle->public_values.size() != MemoryMerkleAir::NUM_PUBLIC_VALUES) {
                throw VmVerificationError(VmVerificationErrorKind::StarkError, i, "memory merkle AIR missing");
            }
            std::array<BFieldElement, Digest::LEN> initial{};
            std::array<BFieldElement, Digest::LEN> final_root{};
            for (size_t k = 0; k < Digest::LEN; ++k) {
                initial[k] = merkle->public_values[k];
                final_root[k] = merkle->public_values[Digest::LEN + k];
            }
            // Segment 0 starts from the committed image, later ones from their predecessor
            if (Digest(initial) != *prev_final_root) {
                throw VmVerificationError(VmVerificationErrorKind::InitialMemoryRootMismatch, i,
                                          Digest(initial).to_hex() + " != " + prev_final_root->to_hex());
            }
            if (i == 0) {
                out.exe_commit = compute_exe_commit(commitment.commit, Digest(initial), pvs.initial_pc);
            }
            prev_final_root = Digest(final_root);
        }

        // Value bytes then one revealed flag per slot; a revealed slot keeps its word
        std::vector<BFieldElement> public_values;
        if (const AirProofData* pv = proof.find_air(VmChipComplex::PUBLIC_VALUES_AIR_ID)) {
            public_values = pv->public_values;
        } else {
            public_values.assign(num_bytes + num_slots, BFieldElement::zero());
        }
        if (public_values.size() != num_bytes + num_slots) {
            throw VmVerificationError(VmVerificationErrorKind::PublicValuesMismatch, i,
                                      std::to_string(public_values.size()) + " public values, expected " +
                                          std::to_string(num_bytes + num_slots));
        }
        for (size_t slot = 0; slot < num_slots; ++slot) {
            const BFieldElement flag = public_values[num_bytes + slot];
            if (!flag.is_zero() && flag != BFieldElement::one()) {
                throw VmVerificationError(VmVerificationErrorKind::PublicValuesMismatch, i,
                                          "revealed flag of slot " + std::to_string(slot) + " is " +
                                              std::to_string(flag.value()));
            }
            if (i == 0 || prev_public_values[num_bytes + slot].is_zero()) {
                continue;
            }
            if (flag.is_zero()) {
                throw VmVerificationError(VmVerificationErrorKind::PublicValuesMismatch, i,
                                          "slot " + std::to_string(slot) + " lost its revealed value");
            }
            for (size_t j = 0; j < PUBLIC_VALUE_SLOT_BYTES; ++j) {
                const size_t k = slot * PUBLIC_VALUE_SLOT_BYTES + j;
                if (public_values[k] != prev_public_values[k]) {
                    throw VmVerificationError(VmVerificationErrorKind::PublicValuesMismatch, i,
                                              "public value " + std::to_string(k) + " changed");
                }
            }
        }
        prev_public_values = std::move(public_values);

        if (last) {
            out.exit_code = pvs.exit_code;
        }
    }

    out.final_pc = prev_final_pc;
    out.public_values.assign(prev_public_values.begin(), prev_public_values.begin() + num_bytes);
    out.final_memory_root = prev_final_root;
    return out;
}

} // namespace zkrv
