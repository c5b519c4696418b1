#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "common/debug_control.hpp"
#include "memory/memory_layout.hpp"
#include "parallel/thread_coordination.h"
#include "rv32im/rv32_common.hpp"
#include "stark/codec.hpp"
#include "stark/errors.hpp"
#include "vm/config.hpp"
#include "vm/execution_error.hpp"
#include "vm/opcode.hpp"
#include "vm/vm.hpp"

using namespace zkrv;

namespace {

Instruction addi(uint32_t rd, uint32_t rs1, int32_t imm) {
    return Instruction::from_isize(opcode(BaseAluOpcode::ADD), register_pointer(rd), register_pointer(rs1),
                                   static_cast<uint32_t>(imm) & 0xFFFFFF, address_space::REGISTER,
                                   address_space::IMMEDIATE);
}

/**
 * Guest computing (F(n), F(n+1)) and revealing both words at public value
 * offsets 0 and 4.
 */
VmExe fibonacci_exe(uint32_t n) {
    std::vector<Instruction> code;
    code.push_back(addi(1, 0, 0));
    code.push_back(addi(2, 0, 1));
    code.push_back(addi(3, 0, static_cast<int32_t>(n)));
    code.push_back(Instruction::from_isize(opcode(BranchEqualOpcode::BEQ), register_pointer(3), 0, 24,
                                           address_space::REGISTER, address_space::REGISTER));
    code.push_back(Instruction::from_isize(opcode(BaseAluOpcode::ADD), register_pointer(4), register_pointer(1),
                                           register_pointer(2), address_space::REGISTER, address_space::REGISTER));
    code.push_back(addi(1, 2, 0));
    code.push_back(addi(2, 4, 0));
    code.push_back(addi(3, 3, -1));
    code.push_back(Instruction::from_isize(opcode(JalLuiOpcode::JAL), 0, 0, -20, address_space::REGISTER, 0, 0));
    for (uint32_t r : {1U, 2U}) {
        code.push_back(Instruction::from_isize(opcode(RevealOpcode::REVEAL), register_pointer(r), 0, (r - 1) * 4,
                                               address_space::REGISTER, address_space::PUBLIC_VALUES));
    }
    code.push_back(Instruction::from_isize(opcode(SystemOpcode::TERMINATE), 0, 0, 0, 0, 0));
    return VmExe(Program::from_instructions(code), 0);
}

uint32_t public_word(const std::vector<BFieldElement>& values, size_t offset) {
    uint32_t word = 0;
    for (size_t i = 0; i < 4; ++i) {
        word |= values.at(offset + i).value() << (8 * i);
    }
    return word;
}

} // namespace

int main(int argc, char* argv[]) {
    parallel::initialize_thread_coordination();
#ifdef _OPENMP
    std::cout << "OpenMP Configuration:" << std::endl;
    std::cout << "  Max threads available: " << omp_get_max_threads() << std::endl;
    std::cout << "  Processors detected: " << omp_get_num_procs() << std::endl;
#else
    std::cout << "WARNING: OpenMP is not available - CPU parallelization disabled!" << std::endl;
#endif

    if (argc != 3 && argc != 4) {
        std::cerr << "Usage:\n";
        std::cerr << "  " << argv[0] << " <vm_config.json|-> <output_dir> [n]\n";
        std::cerr << "    Proves the built-in Fibonacci guest for F(n), F(n+1) (default n = 7).\n";
        std::cerr << "    Pass '-' for the default RV32IM configuration with continuations.\n";
        return 1;
    }

    try {
        VmConfig config = VmConfig::rv32im();
        config.system.with_continuations();
        if (std::string(argv[1]) != "-") {
            config = load_vm_config(argv[1]);
        }
        const std::filesystem::path out_dir = argv[2];
        const uint32_t n = argc == 4 ? static_cast<uint32_t>(std::stoul(argv[3])) : 7;
        std::filesystem::create_directories(out_dir);

        auto t_start = std::chrono::high_resolution_clock::now();
        VirtualMachine vm(config);
        const VmExe exe = fibonacci_exe(n);

        std::cout << "Step 1: Keygen..." << std::endl;
        const MultiStarkProvingKey pk = vm.keygen();
        const MultiStarkVerifyingKey vk = pk.get_vk();
        std::cout << "  ✓ " << pk.num_airs() << " AIRs" << std::endl;

        std::cout << "Step 2: Committing program..." << std::endl;
        const VmCommittedExe committed = vm.commit_program(exe);
        std::cout << "  ✓ " << exe.program.num_defined() << " instructions" << std::endl;

        std::cout << "Step 3: Proving..." << std::endl;
        const std::vector<Proof> proofs = vm.prove(pk, committed, {});
        std::cout << "  ✓ " << proofs.size() << " segment proof(s)" << std::endl;

        std::cout << "Step 4: Verifying segment chain..." << std::endl;
        const VerifiedExecution verified =
            vm.verify_segment_proofs(vk, program_commitment(committed), proofs);
        std::cout << "  ✓ exit code " << verified.exit_code << ", F(" << n << ") = "
                  << public_word(verified.public_values, 0) << ", F(" << n + 1
                  << ") = " << public_word(verified.public_values, 4) << std::endl;

        std::cout << "Step 5: Writing artifacts to " << out_dir.string() << std::endl;
        codec::write_file((out_dir / "vk.bin").string(), codec::encode_vk(vk));
        codec::write_file((out_dir / "program_commit.bin").string(),
                          codec::encode_program_commitment(program_commitment(committed)));
        for (size_t i = 0; i < proofs.size(); ++i) {
            codec::write_file((out_dir / ("proof_" + std::to_string(i) + ".bin")).string(),
                              codec::encode_proof(proofs[i]));
        }

        ZKRV_IF_PROFILE {
            auto t_end = std::chrono::high_resolution_clock::now();
            printf("[profile] total: %.1f ms\n", std::chrono::duration<double, std::milli>(t_end - t_start).count());
        }
        return 0;
    } catch (const ExecutionError& e) {
        std::cerr << "Execution failed: " << e.what() << std::endl;
    } catch (const VmVerificationError& e) {
        std::cerr << "Verification failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
