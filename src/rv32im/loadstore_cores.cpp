#include "rv32im/loadstore_cores.hpp"
#include "rv32im/alu_cores.hpp"
#include <string>

namespace zkrv {

namespace {

constexpr size_t L = RV32_REGISTER_NUM_LIMBS;

Expr one() { return Expr(BFieldElement::one()); }

struct FlagSpec {
    LoadStoreOpcode opcode;
    uint32_t shift;
};

// Every aligned (opcode, shift) pair of the zero-extending core; loads first
constexpr std::array<FlagSpec, LoadStoreCoreAir::NUM_FLAGS> LOADSTORE_FLAGS = {{
    {LoadStoreOpcode::LOADW, 0},
    {LoadStoreOpcode::LOADHU, 0},
    {LoadStoreOpcode::LOADHU, 2},
    {LoadStoreOpcode::LOADBU, 0},
    {LoadStoreOpcode::LOADBU, 1},
    {LoadStoreOpcode::LOADBU, 2},
    {LoadStoreOpcode::LOADBU, 3},
    {LoadStoreOpcode::STOREW, 0},
    {LoadStoreOpcode::STOREH, 0},
    {LoadStoreOpcode::STOREH, 2},
    {LoadStoreOpcode::STOREB, 0},
    {LoadStoreOpcode::STOREB, 1},
    {LoadStoreOpcode::STOREB, 2},
    {LoadStoreOpcode::STOREB, 3},
}};
constexpr size_t NUM_LOAD_FLAGS = 7;

constexpr std::array<FlagSpec, LoadSignExtendCoreAir::NUM_FLAGS> SIGN_EXTEND_FLAGS = {{
    {LoadStoreOpcode::LOADB, 0},
    {LoadStoreOpcode::LOADB, 1},
    {LoadStoreOpcode::LOADB, 2},
    {LoadStoreOpcode::LOADB, 3},
    {LoadStoreOpcode::LOADH, 0},
    {LoadStoreOpcode::LOADH, 2},
}};

template <size_t N>
size_t find_flag(const std::array<FlagSpec, N>& table, LoadStoreOpcode opcode, uint32_t shift) {
    for (size_t i = 0; i < N; ++i) {
        if (table[i].opcode == opcode && table[i].shift == shift) {
            return i;
        }
    }
    throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                         "misaligned access with shift " + std::to_string(shift));
}

LoadStoreOpcode local_opcode(const Instruction& instruction) {
    return static_cast<LoadStoreOpcode>(instruction.opcode - opcode_offset::LOADSTORE);
}

// Moves read into place; T is a byte value or a symbolic cell
template <typename T>
std::array<T, L> place(LoadStoreOpcode opcode, const std::array<T, L>& read, const std::array<T, L>& prev,
                       uint32_t shift) {
    std::array<T, L> out{};
    switch (opcode) {
    case LoadStoreOpcode::LOADW:
    case LoadStoreOpcode::STOREW:
        out = read;
        break;
    case LoadStoreOpcode::LOADHU:
        out[0] = read[shift];
        out[1] = read[shift + 1];
        break;
    case LoadStoreOpcode::LOADBU:
        out[0] = read[shift];
        break;
    case LoadStoreOpcode::STOREH:
        out = prev;
        out[shift] = read[0];
        out[shift + 1] = read[1];
        break;
    case LoadStoreOpcode::STOREB:
        out = prev;
        out[shift] = read[0];
        break;
    default:
        throw std::invalid_argument("sign-extending loads are not placed by the load/store core");
    }
    return out;
}

std::array<Expr, L> to_array(const std::vector<Expr>& v) {
    std::array<Expr, L> out;
    for (size_t i = 0; i < L; ++i) {
        out[i] = v[i];
    }
    return out;
}

std::string loadstore_name(LoadStoreOpcode opcode) {
    switch (opcode) {
    case LoadStoreOpcode::LOADW: return "LOADW";
    case LoadStoreOpcode::LOADBU: return "LOADBU";
    case LoadStoreOpcode::LOADHU: return "LOADHU";
    case LoadStoreOpcode::STOREW: return "STOREW";
    case LoadStoreOpcode::STOREH: return "STOREH";
    case LoadStoreOpcode::STOREB: return "STOREB";
    case LoadStoreOpcode::LOADB: return "LOADB";
    case LoadStoreOpcode::LOADH: return "LOADH";
    }
    return "UNKNOWN";
}

} // namespace

std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> run_write_data(LoadStoreOpcode opcode,
                                                             const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& read,
                                                             const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& prev,
                                                             uint32_t shift) {
    if (opcode == LoadStoreOpcode::LOADB) {
        const uint32_t byte = read[shift];
        return u32_to_bytes(static_cast<uint32_t>(static_cast<int32_t>(static_cast<int8_t>(byte))));
    }
    if (opcode == LoadStoreOpcode::LOADH) {
        const uint32_t half = read[shift] | (read[shift + 1] << 8);
        return u32_to_bytes(static_cast<uint32_t>(static_cast<int32_t>(static_cast<int16_t>(half))));
    }
    return place(opcode, read, prev, shift);
}

// ============================================================================
// LoadStore
// ============================================================================

namespace loadstore_core_col {
constexpr size_t FLAGS = 0;
constexpr size_t READ_DATA = LoadStoreCoreAir::NUM_FLAGS;
constexpr size_t PREV_DATA = READ_DATA + L;
} // namespace loadstore_core_col

AdapterAirContext LoadStoreCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                         const Expr& /*from_pc*/) const {
    using namespace loadstore_core_col;
    const std::vector<Expr> read_data = expr_range(cols, READ_DATA, L);
    const std::vector<Expr> prev_data = expr_range(cols, PREV_DATA, L);
    const std::array<Expr, L> read = to_array(read_data);
    const std::array<Expr, L> prev = to_array(prev_data);

    Expr is_valid;
    Expr is_load;
    Expr opcode;
    Expr shift;
    std::vector<Expr> write_data(L);
    for (size_t f = 0; f < NUM_FLAGS; ++f) {
        const Expr& flag = cols[FLAGS + f];
        const FlagSpec& spec = LOADSTORE_FLAGS[f];
        builder.assert_bool(flag);
        is_valid += flag;
        if (f < NUM_LOAD_FLAGS) {
            is_load += flag;
        }
        opcode += flag * static_cast<int64_t>(spec.opcode);
        shift += flag * static_cast<int64_t>(spec.shift);
        const std::array<Expr, L> placed = place(spec.opcode, read, prev, spec.shift);
        for (size_t i = 0; i < L; ++i) {
            write_data[i] += flag * placed[i];
        }
    }
    builder.assert_bool(is_valid);

    AdapterAirContext ctx;
    ctx.reads = {read_data, prev_data};
    ctx.writes = {write_data};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode + Expr::from_u64(opcode_offset::LOADSTORE) * is_valid;
    ctx.immediates = {is_load, shift};
    return ctx;
}

std::string LoadStoreCoreChip::get_opcode_name(uint32_t opcode) const {
    return loadstore_name(static_cast<LoadStoreOpcode>(opcode - opcode_offset::LOADSTORE));
}

std::pair<AdapterRuntimeContext, LoadStoreCoreRecord> LoadStoreCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    LoadStoreCoreRecord record;
    const LoadStoreOpcode opcode = local_opcode(instruction);
    const uint32_t shift = reads.at(2).at(0).value();
    record.flag = find_flag(LOADSTORE_FLAGS, opcode, shift);
    record.read_data = limbs_to_bytes(reads.at(0));
    record.prev_data = limbs_to_bytes(reads.at(1));
    const auto data = place(opcode, record.read_data, record.prev_data, shift);
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(bytes_to_u32(data))}), record};
}

void LoadStoreCoreChip::generate_trace_row(BFieldElement* row, const LoadStoreCoreRecord& record) const {
    using namespace loadstore_core_col;
    row[FLAGS + record.flag] = BFieldElement::one();
    write_bytes(row, READ_DATA, record.read_data);
    write_bytes(row, PREV_DATA, record.prev_data);
}

// ============================================================================
// LoadSignExtend
// ============================================================================

namespace sign_extend_col {
constexpr size_t FLAGS = 0;
constexpr size_t READ_DATA = LoadSignExtendCoreAir::NUM_FLAGS;
constexpr size_t PREV_DATA = READ_DATA + L;
constexpr size_t MOST_SIG_BIT = PREV_DATA + L;
} // namespace sign_extend_col

AdapterAirContext LoadSignExtendCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                              const Expr& /*from_pc*/) const {
    using namespace sign_extend_col;
    const std::vector<Expr> read = expr_range(cols, READ_DATA, L);
    const std::vector<Expr> prev = expr_range(cols, PREV_DATA, L);
    const Expr& msb = cols[MOST_SIG_BIT];

    Expr is_valid;
    Expr is_byte;
    Expr opcode;
    Expr shift;
    Expr low_byte;
    Expr second_byte;
    Expr most_sig_byte;
    for (size_t f = 0; f < NUM_FLAGS; ++f) {
        const Expr& flag = cols[FLAGS + f];
        const FlagSpec& spec = SIGN_EXTEND_FLAGS[f];
        builder.assert_bool(flag);
        is_valid += flag;
        opcode += flag * static_cast<int64_t>(spec.opcode);
        shift += flag * static_cast<int64_t>(spec.shift);
        if (spec.opcode == LoadStoreOpcode::LOADB) {
            is_byte += flag;
            low_byte += flag * read[spec.shift];
            most_sig_byte += flag * read[spec.shift];
        } else {
            low_byte += flag * read[spec.shift];
            second_byte += flag * read[spec.shift + 1];
            most_sig_byte += flag * read[spec.shift + 1];
        }
    }
    builder.assert_bool(is_valid);
    builder.assert_bool(msb);
    builder.assert_zero(msb * (one() - is_valid));

    const VariableRangeCheckerBus range_bus{range_max_bits_};
    range_bus.range_check(builder, most_sig_byte - msb * 128, RV32_CELL_BITS - 1, is_valid);

    const Expr ext = msb * RV32_CELL_MAX;
    AdapterAirContext ctx;
    ctx.reads = {read, prev};
    ctx.writes = {{low_byte, second_byte + is_byte * ext, ext, ext}};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode + Expr::from_u64(opcode_offset::LOADSTORE) * is_valid;
    ctx.immediates = {is_valid, shift};
    return ctx;
}

std::string LoadSignExtendCoreChip::get_opcode_name(uint32_t opcode) const {
    return loadstore_name(static_cast<LoadStoreOpcode>(opcode - opcode_offset::LOADSTORE));
}

std::pair<AdapterRuntimeContext, LoadSignExtendCoreRecord> LoadSignExtendCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    LoadSignExtendCoreRecord record;
    const LoadStoreOpcode opcode = local_opcode(instruction);
    const uint32_t shift = reads.at(2).at(0).value();
    record.flag = find_flag(SIGN_EXTEND_FLAGS, opcode, shift);
    record.read_data = limbs_to_bytes(reads.at(0));
    record.prev_data = limbs_to_bytes(reads.at(1));

    const uint32_t top = opcode == LoadStoreOpcode::LOADB ? record.read_data[shift] : record.read_data[shift + 1];
    record.most_sig_bit = (top >> (RV32_CELL_BITS - 1)) != 0;
    range_checker_->add_count(top - (record.most_sig_bit ? 128u : 0u), RV32_CELL_BITS - 1);

    const auto data = run_write_data(opcode, record.read_data, record.prev_data, shift);
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(bytes_to_u32(data))}), record};
}

void LoadSignExtendCoreChip::generate_trace_row(BFieldElement* row, const LoadSignExtendCoreRecord& record) const {
    using namespace sign_extend_col;
    row[FLAGS + record.flag] = BFieldElement::one();
    write_bytes(row, READ_DATA, record.read_data);
    write_bytes(row, PREV_DATA, record.prev_data);
    row[MOST_SIG_BIT] = bool_field(record.most_sig_bit);
}

} // namespace zkrv
