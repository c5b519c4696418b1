#pragma once

#include "memory/boundary.hpp"
#include "memory/memory_controller.hpp"
#include "memory/merkle_chip.hpp"
#include "memory/offline_checker.hpp"
#include "primitives/bitwise_op_lookup.hpp"
#include "primitives/range_tuple.hpp"
#include "primitives/var_range.hpp"
#include "system/connector.hpp"
#include "system/phantom.hpp"
#include "system/poseidon2_periphery.hpp"
#include "system/program_chip.hpp"
#include "system/public_values.hpp"
#include "system/terminate.hpp"
#include "vm/chip.hpp"
#include "vm/config.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkrv {

/**
 * VmChipComplex - every chip of one VM configuration, in AIR order
 *
 * AIR order is fixed by the configuration alone, so a complex built for
 * keygen and one built for a segment assign the same AIR ids:
 *
 *   program, connector, public values, memory boundary, [memory merkle],
 *   instruction executors in registration order,
 *   [poseidon2 periphery], bitwise lookup, [range tuple], range checker.
 *
 * Executors are registered together with the global opcodes they own;
 * the resulting dispatch table maps an opcode to its executor.
 */
class VmChipComplex {
public:
    static constexpr size_t PROGRAM_AIR_ID = 0;
    static constexpr size_t CONNECTOR_AIR_ID = 1;
    static constexpr size_t PUBLIC_VALUES_AIR_ID = 2;
    static constexpr size_t BOUNDARY_AIR_ID = 3;
    // Present only with continuations
    static constexpr size_t MERKLE_AIR_ID = 4;

    VmChipComplex(const VmConfig& config, std::shared_ptr<Streams> streams);

    const VmConfig& config() const { return config_; }
    MemoryMode memory_mode() const {
        return config_.system.continuation_enabled ? MemoryMode::Persistent : MemoryMode::Volatile;
    }

    size_t num_airs() const { return chips_.size(); }
    std::vector<AirRef> airs() const;
    std::vector<std::string> air_names() const;

    // Executor owning the opcode, or nullptr
    InstructionExecutor* executor_for(uint32_t opcode) const;
    std::vector<uint32_t> registered_opcodes() const;

    ProgramChip& program_chip() { return *program_; }
    VmConnectorChip& connector_chip() { return *connector_; }
    PublicValuesChip& public_values_chip() { return *public_values_; }
    TerminateChip& terminate_chip() { return *terminate_; }
    PhantomChip& phantom_chip() { return *phantom_; }
    const std::shared_ptr<Streams>& streams() const { return streams_; }

    std::shared_ptr<VariableRangeCheckerChip> range_checker() const { return range_checker_; }
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_lookup() const { return bitwise_; }
    std::shared_ptr<RangeTupleCheckerChip> range_tuple_checker() const { return range_tuple_; }
    std::shared_ptr<Poseidon2PeripheryChip> poseidon2_periphery() const { return poseidon2_; }
    std::shared_ptr<const MemoryAuxFiller> memory_aux() const { return memory_aux_; }

    // Unpadded heights of the instruction executors
    std::vector<size_t> executor_heights() const;
    const std::vector<size_t>& executor_air_ids() const { return executor_air_ids_; }

    // Hand a finished segment's memory to the boundary (and Merkle) chips
    void set_final_memory(const FinalMemory& final_memory);

    /**
     * Traces of every AIR with something to prove, consuming all records.
     * Executors that ran no instruction are left out.
     * Throws ExecutionError(TraceHeightOverflow) when a trace is taller
     * than the PCS supports.
     */
    ProofInput generate_proof_input();

private:
    VmConfig config_;
    std::shared_ptr<Streams> streams_;

    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::shared_ptr<RangeTupleCheckerChip> range_tuple_;
    std::shared_ptr<Poseidon2PeripheryChip> poseidon2_;
    std::shared_ptr<const MemoryAuxFiller> memory_aux_;

    std::shared_ptr<ProgramChip> program_;
    std::shared_ptr<VmConnectorChip> connector_;
    std::shared_ptr<PublicValuesChip> public_values_;
    std::shared_ptr<VolatileBoundaryChip> volatile_boundary_;
    std::shared_ptr<PersistentBoundaryChip> persistent_boundary_;
    std::shared_ptr<MemoryMerkleChip> merkle_;
    std::shared_ptr<TerminateChip> terminate_;
    std::shared_ptr<PhantomChip> phantom_;

    std::vector<ChipRef> chips_;
    std::vector<size_t> executor_air_ids_;
    std::vector<InstructionExecutor*> executors_;
    std::unordered_map<uint32_t, size_t> dispatch_;

    template <typename ChipT>
    void add_executor(std::shared_ptr<ChipT> chip, const std::vector<uint32_t>& opcodes);

    void add_rv32_executors();
    void add_extension_executors();
};

} // namespace zkrv
