#include "system/connector.hpp"
#include <stdexcept>
#include <string>

namespace zkrv {

namespace {

namespace col {
constexpr size_t PC = 0;
constexpr size_t TIMESTAMP = 1;
constexpr size_t IS_TERMINATE = 2;
constexpr size_t EXIT_CODE = 3;
constexpr size_t DELTA_LIMBS = 4;
} // namespace col

} // namespace

std::vector<BFieldElement> VmConnectorPvs::to_field_elements() const {
    return {BFieldElement(initial_pc), BFieldElement(initial_timestamp), BFieldElement(final_pc),
            BFieldElement(final_timestamp), BFieldElement(exit_code), is_terminate ? BFieldElement::one() : BFieldElement::zero()};
}

VmConnectorPvs VmConnectorPvs::from_field_elements(const std::vector<BFieldElement>& pvs) {
    if (pvs.size() != LEN) {
        throw std::invalid_argument("connector expects " + std::to_string(LEN) + " public values, got " +
                                    std::to_string(pvs.size()));
    }
    VmConnectorPvs out;
    out.initial_pc = static_cast<uint32_t>(pvs[0].value());
    out.initial_timestamp = static_cast<uint32_t>(pvs[1].value());
    out.final_pc = static_cast<uint32_t>(pvs[2].value());
    out.final_timestamp = static_cast<uint32_t>(pvs[3].value());
    out.exit_code = static_cast<uint32_t>(pvs[4].value());
    out.is_terminate = !pvs[5].is_zero();
    return out;
}

std::optional<RowMajorMatrix<BFieldElement>> VmConnectorAir::preprocessed_trace() const {
    RowMajorMatrix<BFieldElement> trace(1, 2);
    trace.set(0, 0, BFieldElement::one());
    return trace;
}

void VmConnectorAir::eval(AirBuilder& builder) const {
    auto prep = builder.preprocessed();
    auto main = builder.main();
    const Expr is_begin = prep.local(0);
    const Expr is_end = Expr(BFieldElement::one()) - is_begin;
    const Expr pc = main.local(col::PC);
    const Expr ts = main.local(col::TIMESTAMP);
    const Expr is_terminate = main.local(col::IS_TERMINATE);
    const Expr exit_code = main.local(col::EXIT_CODE);

    builder.assert_bool(is_terminate);
    builder.when(is_begin).assert_zero(is_terminate);
    builder.when(is_begin).assert_eq(pc, builder.public_value(0));
    builder.when(is_begin).assert_eq(ts, builder.public_value(1));
    builder.when(is_end).assert_eq(pc, builder.public_value(2));
    builder.when(is_end).assert_eq(ts, builder.public_value(3));
    builder.when(is_end).assert_eq(exit_code, builder.public_value(4));
    builder.when(is_end).assert_eq(is_terminate, builder.public_value(5));

    // final_ts - initial_ts fits in clk_max_bits
    std::vector<Expr> limbs;
    for (size_t i = 0; i < num_delta_limbs(); ++i) {
        limbs.push_back(main.local(col::DELTA_LIMBS + i));
    }
    builder.when(is_begin).assert_eq(main.next(col::TIMESTAMP) - ts, compose_limbs(limbs, decomp_));
    VariableRangeCheckerBus{decomp_}.range_check_limbs(builder, limbs, clk_max_bits_, is_begin);

    builder.push_send(bus::EXECUTION, {pc, ts}, is_begin);
    builder.push_receive(bus::EXECUTION, {pc, ts}, is_end);
    builder.push_receive(bus::TERMINATE, {pc, ts, exit_code}, is_terminate);
}

VmConnectorChip::VmConnectorChip(const MemoryConfig& config, std::shared_ptr<VariableRangeCheckerChip> range_checker)
    : air_(std::make_shared<VmConnectorAir>(config)), range_checker_(std::move(range_checker)) {}

void VmConnectorChip::begin(ExecutionState state) {
    initial_ = state;
    final_.reset();
    exit_code_.reset();
}

void VmConnectorChip::end(ExecutionState state, std::optional<uint32_t> exit_code) {
    if (!initial_) {
        throw std::logic_error("connector: segment ended before it began");
    }
    if (state.timestamp < initial_->timestamp) {
        throw std::logic_error("connector: final timestamp precedes the initial timestamp");
    }
    final_ = state;
    exit_code_ = exit_code;
}

VmConnectorPvs VmConnectorChip::public_values() const {
    if (!initial_ || !final_) {
        throw std::logic_error("connector: segment boundaries not recorded");
    }
    VmConnectorPvs pvs;
    pvs.initial_pc = initial_->pc;
    pvs.initial_timestamp = initial_->timestamp;
    pvs.final_pc = final_->pc;
    pvs.final_timestamp = final_->timestamp;
    pvs.exit_code = exit_code_.value_or(DEFAULT_SUSPEND_EXIT_CODE);
    pvs.is_terminate = exit_code_.has_value();
    return pvs;
}

AirProofInput VmConnectorChip::generate_air_proof_input() {
    const VmConnectorPvs pvs = public_values();
    RowMajorMatrix<BFieldElement> trace(air_->width(), 2);
    BFieldElement* begin_row = trace.row_mut(0);
    begin_row[col::PC] = BFieldElement(pvs.initial_pc);
    begin_row[col::TIMESTAMP] = BFieldElement(pvs.initial_timestamp);
    range_checker_->decompose(pvs.final_timestamp - pvs.initial_timestamp, air_->clk_max_bits(),
                              begin_row + col::DELTA_LIMBS, air_->num_delta_limbs());

    BFieldElement* end_row = trace.row_mut(1);
    end_row[col::PC] = BFieldElement(pvs.final_pc);
    end_row[col::TIMESTAMP] = BFieldElement(pvs.final_timestamp);
    end_row[col::IS_TERMINATE] = pvs.is_terminate ? BFieldElement::one() : BFieldElement::zero();
    end_row[col::EXIT_CODE] = BFieldElement(pvs.exit_code);

    AirProofInput input;
    input.common_main = std::move(trace);
    input.public_values = pvs.to_field_elements();
    return input;
}

} // namespace zkrv
