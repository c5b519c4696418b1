#include "air/debug_checker.hpp"
#include "air/logup.hpp"
#include "air/symbolic_dag.hpp"
#include "common/debug_control.hpp"
#include <map>
#include <sstream>
#include <stdexcept>

namespace zkrv {

namespace {

AirBuilder build_air(const Air& air, const std::optional<RowMajorMatrix<BFieldElement>>& preprocessed) {
    std::vector<size_t> widths = air.cached_main_widths();
    widths.push_back(air.width());
    AirBuilder builder(preprocessed ? preprocessed->width() : 0, widths, air.num_public_values());
    air.eval(builder);
    return builder;
}

void check_shapes(const DebugAirInput& input, size_t expected_parts) {
    if (input.mains.size() != expected_parts) {
        throw std::invalid_argument(input.air->name() + ": expected " + std::to_string(expected_parts) +
                               " main partitions, got " + std::to_string(input.mains.size()));
    }
}

} // namespace

void DebugChecker::check_constraints(const DebugAirInput& input) {
    const Air& air = *input.air;
    auto preprocessed = air.preprocessed_trace();
    AirBuilder builder = build_air(air, preprocessed);
    check_shapes(input, air.cached_main_widths().size() + 1);

    const size_t height = input.mains.back()->height();
    SymbolicDag dag = SymbolicDag::build(builder.constraints());
    DagEvaluator<BFieldElement> evaluator(dag);
    const std::vector<XFieldElement> none;
    logup::TraceRowSource source(preprocessed ? &*preprocessed : nullptr, input.mains, nullptr,
                                 input.public_values, none, none, height);
    for (size_t row = 0; row < height; ++row) {
        source.set_row(row);
        evaluator.evaluate(source);
        for (size_t c = 0; c < dag.roots.size(); ++c) {
            BFieldElement value = evaluator.base_value(dag.roots[c]);
            if (!value.is_zero()) {
                throw ConstraintViolation(air.name(), row, c,
                                          builder.constraints()[c].to_string() + " = " + value.to_string());
            }
        }
    }
    ZKRV_DEBUG_COUT("[debug] " << air.name() << ": " << dag.roots.size() << " constraints hold on "
                               << height << " rows\n");
}

void DebugChecker::check_bus_balance(const std::vector<DebugAirInput>& inputs) {
    // (bus, fields) -> (net count, first contributing AIR)
    std::map<std::pair<BusIndex, std::vector<uint32_t>>, std::pair<BFieldElement, std::string>> balance;
    for (const auto& input : inputs) {
        const Air& air = *input.air;
        auto preprocessed = air.preprocessed_trace();
        AirBuilder builder = build_air(air, preprocessed);
        const auto& interactions = builder.interactions();
        if (interactions.empty()) {
            continue;
        }
        const size_t height = input.mains.back()->height();
        SymbolicDag dag = SymbolicDag::build(logup::interaction_roots(interactions));
        DagEvaluator<BFieldElement> evaluator(dag);
        const std::vector<XFieldElement> none;
        logup::TraceRowSource source(preprocessed ? &*preprocessed : nullptr, input.mains, nullptr,
                                     input.public_values, none, none, height);
        for (size_t row = 0; row < height; ++row) {
            source.set_row(row);
            evaluator.evaluate(source);
            size_t root = 0;
            for (const auto& interaction : interactions) {
                std::vector<uint32_t> fields;
                fields.reserve(interaction.fields.size());
                for (size_t j = 0; j < interaction.fields.size(); ++j) {
                    fields.push_back(evaluator.base_value(dag.roots[root++]).value());
                }
                BFieldElement count = evaluator.base_value(dag.roots[root++]);
                if (count.is_zero()) {
                    continue;
                }
                auto& entry = balance[{interaction.bus, fields}];
                entry.first += interaction.type == InteractionType::Send ? count : -count;
                if (entry.second.empty()) {
                    entry.second = air.name();
                }
            }
        }
    }
    for (const auto& kv : balance) {
        if (!kv.second.first.is_zero()) {
            std::ostringstream oss;
            oss << "bus " << kv.first.first << " message [";
            for (size_t j = 0; j < kv.first.second.size(); ++j) {
                oss << (j ? ", " : "") << kv.first.second[j];
            }
            oss << "] has net count " << kv.second.first << " (first seen in " << kv.second.second << ")";
            throw BusImbalance(oss.str());
        }
    }
}

void DebugChecker::check_all(const std::vector<DebugAirInput>& inputs) {
    for (const auto& input : inputs) {
        check_constraints(input);
    }
    check_bus_balance(inputs);
}

} // namespace zkrv
