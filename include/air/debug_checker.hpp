#pragma once

#include "air/air.hpp"
#include "table/matrix.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace zkrv {

/**
 * Raised by the debug checker for the first violated constraint or the
 * first unbalanced bus message.
 */
class ConstraintViolation : public std::runtime_error {
public:
    ConstraintViolation(std::string air_name, size_t row, size_t constraint, const std::string& detail)
        : std::runtime_error("constraint violation [" + air_name + "] row " + std::to_string(row) +
                             " constraint " + std::to_string(constraint) + ": " + detail),
          air_name_(std::move(air_name)), row_(row), constraint_(constraint) {}

    const std::string& air_name() const { return air_name_; }
    size_t row() const { return row_; }
    size_t constraint() const { return constraint_; }

private:
    std::string air_name_;
    size_t row_;
    size_t constraint_;
};

class BusImbalance : public std::runtime_error {
public:
    explicit BusImbalance(const std::string& detail) : std::runtime_error("bus imbalance: " + detail) {}
};

/**
 * DebugAirInput - traces of one AIR in the shape the prover receives them
 */
struct DebugAirInput {
    const Air* air = nullptr;
    std::vector<const RowMajorMatrix<BFieldElement>*> mains;  // cached first, common last
    std::vector<BFieldElement> public_values;
};

/**
 * Direct constraint and bus-balance checking on raw traces.
 *
 * Meant for developing chips: errors point to the exact row and constraint
 * instead of a failed opening check.
 */
class DebugChecker {
public:
    // Every base constraint of the AIR on every row
    static void check_constraints(const DebugAirInput& input);

    // Sum of signed counts per (bus, fields) message must vanish over all AIRs
    static void check_bus_balance(const std::vector<DebugAirInput>& inputs);

    static void check_all(const std::vector<DebugAirInput>& inputs);
};

} // namespace zkrv
