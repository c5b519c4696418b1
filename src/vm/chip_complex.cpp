#include "vm/chip_complex.hpp"
#include "common/debug_control.hpp"
#include "extensions/keccak_chip.hpp"
#include "extensions/modular.hpp"
#include "extensions/native_poseidon2.hpp"
#include "extensions/pairing.hpp"
#include "extensions/weierstrass.hpp"
#include "rv32im/alu_cores.hpp"
#include "rv32im/branch_cores.hpp"
#include "rv32im/io_chips.hpp"
#include "rv32im/jump_cores.hpp"
#include "rv32im/loadstore_cores.hpp"
#include "rv32im/mul_cores.hpp"
#include "vm/execution_error.hpp"
#include "vm/opcode.hpp"
#include <algorithm>
#include <stdexcept>

namespace zkrv {

namespace {

template <typename E>
std::vector<uint32_t> opcode_range(uint32_t offset, std::initializer_list<E> locals) {
    std::vector<uint32_t> out;
    for (E local : locals) {
        out.push_back(global_opcode(offset, local));
    }
    return out;
}

// Largest trace height the two-adic PCS can extend
size_t max_trace_height(const FriParameters& params) {
    return size_t{1} << (BFieldElement::TWO_ADICITY - params.log_blowup);
}

} // namespace

VmChipComplex::VmChipComplex(const VmConfig& config, std::shared_ptr<Streams> streams)
    : config_(config), streams_(std::move(streams)) {
    config_.validate();
    const MemoryConfig& mem = config_.system.memory_config;

    range_checker_ = std::make_shared<VariableRangeCheckerChip>(mem.decomp);
    bitwise_ = std::make_shared<BitwiseOperationLookupChip>();
    if (config_.rv32m) {
        range_tuple_ = std::make_shared<RangeTupleCheckerChip>(config_.range_tuple_sizes);
    }
    if (config_.system.continuation_enabled || config_.native_poseidon2) {
        poseidon2_ = std::make_shared<Poseidon2PeripheryChip>();
    }
    memory_aux_ = std::make_shared<MemoryAuxFiller>(mem, range_checker_);

    program_ = std::make_shared<ProgramChip>();
    connector_ = std::make_shared<VmConnectorChip>(mem, range_checker_);
    public_values_ = std::make_shared<PublicValuesChip>(config_.system.num_public_values);
    chips_.push_back(program_);
    chips_.push_back(connector_);
    chips_.push_back(public_values_);
    if (config_.system.continuation_enabled) {
        persistent_boundary_ = std::make_shared<PersistentBoundaryChip>(mem, poseidon2_);
        merkle_ = std::make_shared<MemoryMerkleChip>(mem, poseidon2_);
        chips_.push_back(persistent_boundary_);
        chips_.push_back(merkle_);
    } else {
        volatile_boundary_ = std::make_shared<VolatileBoundaryChip>(mem, range_checker_);
        chips_.push_back(volatile_boundary_);
    }

    phantom_ = std::make_shared<PhantomChip>(streams_);
    terminate_ = std::make_shared<TerminateChip>(bitwise_);
    add_executor(phantom_, {opcode(SystemOpcode::PHANTOM)});
    add_executor(terminate_, {opcode(SystemOpcode::TERMINATE)});
    add_rv32_executors();
    add_extension_executors();

    if (poseidon2_) {
        chips_.push_back(poseidon2_);
    }
    chips_.push_back(bitwise_);
    if (range_tuple_) {
        chips_.push_back(range_tuple_);
    }
    // Last: every other chip may add range checks while generating its trace
    chips_.push_back(range_checker_);

    ZKRV_DEBUG_PRINT("[chip complex] %zu AIRs, %zu opcodes\n", chips_.size(), dispatch_.size());
}

template <typename ChipT>
void VmChipComplex::add_executor(std::shared_ptr<ChipT> chip, const std::vector<uint32_t>& opcodes) {
    const size_t executor_index = executors_.size();
    for (uint32_t op : opcodes) {
        if (!dispatch_.emplace(op, executor_index).second) {
            throw std::logic_error("opcode " + std::to_string(op) + " registered twice (" + chip->air_name() + ")");
        }
    }
    executors_.push_back(chip.get());
    executor_air_ids_.push_back(chips_.size());
    chips_.push_back(chip);
}

void VmChipComplex::add_rv32_executors() {
    const MemoryConfig& mem = config_.system.memory_config;
    if (config_.rv32i) {
        using namespace opcode_offset;
        add_executor(std::make_shared<Rv32BaseAluChip>(Rv32BaseAluAdapter(mem, bitwise_), BaseAluCoreChip(bitwise_),
                                                       memory_aux_),
                     opcode_range(BASE_ALU, {BaseAluOpcode::ADD, BaseAluOpcode::SUB, BaseAluOpcode::XOR,
                                             BaseAluOpcode::OR, BaseAluOpcode::AND}));
        add_executor(std::make_shared<Rv32LessThanChip>(Rv32BaseAluAdapter(mem, bitwise_),
                                                        LessThanCoreChip(bitwise_), memory_aux_),
                     opcode_range(LESS_THAN, {LessThanOpcode::SLT, LessThanOpcode::SLTU}));
        add_executor(std::make_shared<Rv32ShiftChip>(Rv32BaseAluAdapter(mem, bitwise_),
                                                     ShiftCoreChip(bitwise_, range_checker_), memory_aux_),
                     opcode_range(SHIFT, {ShiftOpcode::SLL, ShiftOpcode::SRL, ShiftOpcode::SRA}));
        add_executor(std::make_shared<Rv32LoadStoreChip>(Rv32LoadStoreAdapter(mem), LoadStoreCoreChip(), memory_aux_),
                     opcode_range(LOADSTORE, {LoadStoreOpcode::LOADW, LoadStoreOpcode::LOADBU, LoadStoreOpcode::LOADHU,
                                              LoadStoreOpcode::STOREW, LoadStoreOpcode::STOREH,
                                              LoadStoreOpcode::STOREB}));
        add_executor(std::make_shared<Rv32LoadSignExtendChip>(Rv32LoadStoreAdapter(mem),
                                                              LoadSignExtendCoreChip(range_checker_), memory_aux_),
                     opcode_range(LOADSTORE, {LoadStoreOpcode::LOADB, LoadStoreOpcode::LOADH}));
        add_executor(std::make_shared<Rv32BranchEqualChip>(Rv32BranchAdapter(mem), BranchEqualCoreChip(), memory_aux_),
                     opcode_range(BRANCH_EQUAL, {BranchEqualOpcode::BEQ, BranchEqualOpcode::BNE}));
        add_executor(std::make_shared<Rv32BranchLessThanChip>(Rv32BranchAdapter(mem), BranchLessThanCoreChip(bitwise_),
                                                              memory_aux_),
                     opcode_range(BRANCH_LESS_THAN, {BranchLessThanOpcode::BLT, BranchLessThanOpcode::BLTU,
                                                     BranchLessThanOpcode::BGE, BranchLessThanOpcode::BGEU}));
        add_executor(std::make_shared<Rv32JalLuiChip>(Rv32CondRdWriteAdapter(mem), JalLuiCoreChip(bitwise_),
                                                      memory_aux_),
                     opcode_range(JAL_LUI, {JalLuiOpcode::JAL, JalLuiOpcode::LUI}));
        add_executor(std::make_shared<Rv32JalrChip>(Rv32JalrAdapter(mem), JalrCoreChip(bitwise_, range_checker_),
                                                    memory_aux_),
                     {opcode(JalrOpcode::JALR)});
        add_executor(std::make_shared<Rv32AuipcChip>(Rv32CondRdWriteAdapter(mem), AuipcCoreChip(bitwise_), memory_aux_),
                     {opcode(AuipcOpcode::AUIPC)});
    }
    if (config_.rv32m) {
        using namespace opcode_offset;
        add_executor(std::make_shared<Rv32MultiplicationChip>(Rv32BaseAluAdapter(mem, bitwise_),
                                                              MultiplicationCoreChip(range_tuple_), memory_aux_),
                     {opcode(MulOpcode::MUL)});
        add_executor(std::make_shared<Rv32MulHChip>(Rv32BaseAluAdapter(mem, bitwise_),
                                                    MulHCoreChip(bitwise_, range_tuple_), memory_aux_),
                     opcode_range(MULH, {MulHOpcode::MULH, MulHOpcode::MULHSU, MulHOpcode::MULHU}));
        add_executor(std::make_shared<Rv32DivRemChip>(Rv32BaseAluAdapter(mem, bitwise_),
                                                      DivRemCoreChip(bitwise_, range_tuple_), memory_aux_),
                     opcode_range(DIVREM, {DivRemOpcode::DIV, DivRemOpcode::DIVU, DivRemOpcode::REM,
                                           DivRemOpcode::REMU}));
    }
    if (config_.io) {
        add_executor(std::make_shared<Rv32HintStoreChip>(mem, memory_aux_, bitwise_, streams_),
                     {opcode(HintStoreOpcode::HINT_STOREW)});
        add_executor(std::make_shared<Rv32RevealChip>(mem, memory_aux_, public_values_), {opcode(RevealOpcode::REVEAL)});
    }
}

void VmChipComplex::add_extension_executors() {
    const MemoryConfig& mem = config_.system.memory_config;
    if (config_.keccak) {
        add_executor(std::make_shared<KeccakfChip>(mem, memory_aux_, bitwise_), {opcode(KeccakOpcode::KECCAKF)});
    }
    if (config_.native_poseidon2) {
        add_executor(std::make_shared<NativePoseidon2Chip>(mem, memory_aux_, poseidon2_),
                     {opcode(Poseidon2Opcode::PERM_POS2), opcode(Poseidon2Opcode::COMP_POS2)});
    }

    const FieldExprChipContext ctx{mem, memory_aux_, range_checker_, bitwise_};
    for (size_t i = 0; i < config_.moduli.size(); ++i) {
        const mpz_class modulus = parse_modulus(config_.moduli[i]);
        auto addsub = make_modular_addsub_chip(ctx, i, modulus);
        add_executor(addsub, addsub->core().global_opcodes());
        auto muldiv = make_modular_muldiv_chip(ctx, i, modulus);
        add_executor(muldiv, muldiv->core().global_opcodes());
    }
    for (size_t i = 0; i < config_.ecc_curves.size(); ++i) {
        const CurveParams& curve = curve_params(config_.ecc_curves[i]);
        auto add_ne = make_ec_add_ne_chip(ctx, i, curve);
        add_executor(add_ne, add_ne->core().global_opcodes());
        auto dbl = make_ec_double_chip(ctx, i, curve);
        add_executor(dbl, dbl->core().global_opcodes());
    }
    for (size_t i = 0; i < config_.pairing_curves.size(); ++i) {
        auto line = make_pairing_line_chip(ctx, i, config_.pairing_curves[i]);
        add_executor(line, line->core().global_opcodes());
    }
}

std::vector<AirRef> VmChipComplex::airs() const {
    std::vector<AirRef> out;
    out.reserve(chips_.size());
    for (const auto& chip : chips_) {
        out.push_back(chip->air());
    }
    return out;
}

std::vector<std::string> VmChipComplex::air_names() const {
    std::vector<std::string> out;
    out.reserve(chips_.size());
    for (const auto& chip : chips_) {
        out.push_back(chip->air_name());
    }
    return out;
}

InstructionExecutor* VmChipComplex::executor_for(uint32_t op) const {
    auto it = dispatch_.find(op);
    return it == dispatch_.end() ? nullptr : executors_[it->second];
}

std::vector<uint32_t> VmChipComplex::registered_opcodes() const {
    std::vector<uint32_t> out;
    out.reserve(dispatch_.size());
    for (const auto& entry : dispatch_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<size_t> VmChipComplex::executor_heights() const {
    std::vector<size_t> out;
    out.reserve(executor_air_ids_.size());
    for (size_t id : executor_air_ids_) {
        out.push_back(chips_[id]->current_trace_height());
    }
    return out;
}

void VmChipComplex::set_final_memory(const FinalMemory& final_memory) {
    if (final_memory.mode != memory_mode()) {
        throw std::logic_error("final memory does not match the configured memory mode");
    }
    if (final_memory.mode == MemoryMode::Volatile) {
        volatile_boundary_->set_final_memory(final_memory.blocks);
    } else {
        persistent_boundary_->set_touched_chunks(final_memory.chunks);
        merkle_->set_final_memory(final_memory);
    }
}

ProofInput VmChipComplex::generate_proof_input() {
    const size_t max_height = max_trace_height(config_.system.fri_params);
    ProofInput input;
    for (size_t air_id = 0; air_id < chips_.size(); ++air_id) {
        const ChipRef& chip = chips_[air_id];
        const bool is_executor =
            std::find(executor_air_ids_.begin(), executor_air_ids_.end(), air_id) != executor_air_ids_.end();
        if (is_executor && chip->current_trace_height() == 0) {
            continue;
        }
        if (padded_height(chip->current_trace_height()) > max_height) {
            throw ExecutionError(ExecutionErrorKind::TraceHeightOverflow, 0,
                                 chip->air_name() + " has " + std::to_string(chip->current_trace_height()) +
                                     " rows, more than " + std::to_string(max_height));
        }
        AirProofInput air_input = chip->generate_air_proof_input();
        ZKRV_DEBUG_PRINT("[chip complex] %-40s height %zu\n", chip->air_name().c_str(), air_input.height());
        input.per_air.emplace_back(air_id, std::move(air_input));
    }
    return input;
}

} // namespace zkrv
