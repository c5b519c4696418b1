#pragma once

#include "primitives/var_range.hpp"
#include "rv32im/adapters.hpp"
#include "vm/opcode.hpp"
#include <array>
#include <memory>

namespace zkrv {

/**
 * LoadStore core: LOADW LOADHU LOADBU STOREW STOREH STOREB
 *
 * Columns: flags[14], read_data[4], prev_data[4]
 *
 * One flag per (opcode, shift) pair that is aligned for its width. The
 * written block is read_data moved into place: zero-filled for loads,
 * merged into prev_data for partial stores.
 */
class LoadStoreCoreAir {
public:
    static constexpr size_t NUM_FLAGS = 14;
    static constexpr size_t WIDTH = NUM_FLAGS + 2 * RV32_REGISTER_NUM_LIMBS;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32LoadStoreAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct LoadStoreCoreRecord {
    size_t flag = 0;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> read_data{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> prev_data{};
};

class LoadStoreCoreChip {
public:
    using AirType = LoadStoreCoreAir;
    using Record = LoadStoreCoreRecord;

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;
};

/**
 * LoadSignExtend core: LOADB LOADH
 *
 * Columns: flags[6], read_data[4], prev_data[4], data_most_sig_bit
 *
 * The most significant bit of the loaded byte or half word is proven by
 * range checking the top byte with that bit removed.
 */
class LoadSignExtendCoreAir {
public:
    static constexpr size_t NUM_FLAGS = 6;
    static constexpr size_t WIDTH = NUM_FLAGS + 2 * RV32_REGISTER_NUM_LIMBS + 1;

    explicit LoadSignExtendCoreAir(size_t range_max_bits) : range_max_bits_(range_max_bits) {}

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32LoadSignExtendAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;

private:
    size_t range_max_bits_;
};

struct LoadSignExtendCoreRecord {
    size_t flag = 0;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> read_data{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> prev_data{};
    bool most_sig_bit = false;
};

class LoadSignExtendCoreChip {
public:
    using AirType = LoadSignExtendCoreAir;
    using Record = LoadSignExtendCoreRecord;

    explicit LoadSignExtendCoreChip(std::shared_ptr<VariableRangeCheckerChip> range_checker)
        : range_checker_(std::move(range_checker)) {}

    AirType air() const { return AirType(range_checker_->range_max_bits()); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
};

// Value a load leaves in rd, or the block a store leaves in memory
std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> run_write_data(LoadStoreOpcode opcode,
                                                             const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& read,
                                                             const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& prev,
                                                             uint32_t shift);

using Rv32LoadStoreChip = VmChipWrapper<Rv32LoadStoreAdapter, LoadStoreCoreChip>;
using Rv32LoadSignExtendChip = VmChipWrapper<Rv32LoadStoreAdapter, LoadSignExtendCoreChip>;

} // namespace zkrv
