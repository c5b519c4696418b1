#include <gtest/gtest.h>
#include "air/debug_checker.hpp"

using namespace zkrv;

namespace {

constexpr BusIndex TEST_BUS = 7;

// Column 1 is boolean and column 2 = column 0 + 1
class IncrementAir : public Air {
public:
    std::string name() const override { return "IncrementAir"; }
    size_t width() const override { return 3; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.assert_bool(main.local(1));
        builder.assert_eq(main.local(2), main.local(0) + 1);
    }
};

// Sends (value) with multiplicity count
class SenderAir : public Air {
public:
    std::string name() const override { return "SenderAir"; }
    size_t width() const override { return 2; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.push_send(TEST_BUS, {main.local(0)}, main.local(1));
    }
};

class ReceiverAir : public Air {
public:
    std::string name() const override { return "ReceiverAir"; }
    size_t width() const override { return 2; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.push_receive(TEST_BUS, {main.local(0)}, main.local(1));
    }
};

RowMajorMatrix<BFieldElement> two_column(const std::vector<std::pair<uint32_t, uint32_t>>& rows) {
    RowMajorMatrix<BFieldElement> m(2, rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        m.set(r, 0, BFieldElement(rows[r].first));
        m.set(r, 1, BFieldElement(rows[r].second));
    }
    return m;
}

} // namespace

class DebugCheckerTest : public ::testing::Test {
protected:
    IncrementAir increment_;
    SenderAir sender_;
    ReceiverAir receiver_;
};

TEST_F(DebugCheckerTest, SatisfiedTracePasses) {
    RowMajorMatrix<BFieldElement> trace(3, 4);
    for (size_t r = 0; r < 4; ++r) {
        trace.set(r, 0, BFieldElement(r * 10));
        trace.set(r, 1, BFieldElement(r % 2));
        trace.set(r, 2, BFieldElement(r * 10 + 1));
    }
    DebugAirInput input{&increment_, {&trace}, {}};
    EXPECT_NO_THROW(DebugChecker::check_constraints(input));
}

TEST_F(DebugCheckerTest, ViolationReportsRowAndConstraint) {
    RowMajorMatrix<BFieldElement> trace(3, 4);
    for (size_t r = 0; r < 4; ++r) {
        trace.set(r, 0, BFieldElement(r));
        trace.set(r, 2, BFieldElement(r + 1));
    }
    trace.set(2, 1, BFieldElement(2));
    try {
        DebugChecker::check_constraints(DebugAirInput{&increment_, {&trace}, {}});
        FAIL() << "non-boolean column accepted";
    } catch (const ConstraintViolation& e) {
        EXPECT_EQ(e.air_name(), "IncrementAir");
        EXPECT_EQ(e.row(), 2U);
        EXPECT_EQ(e.constraint(), 0U);
    }
}

TEST_F(DebugCheckerTest, BalancedBusPasses) {
    // Multiplicities may be split across rows
    auto sends = two_column({{5, 2}, {9, 1}, {0, 0}, {0, 0}});
    auto receives = two_column({{9, 1}, {5, 1}, {5, 1}, {3, 0}});
    EXPECT_NO_THROW(DebugChecker::check_all({DebugAirInput{&sender_, {&sends}, {}},
                                             DebugAirInput{&receiver_, {&receives}, {}}}));
}

TEST_F(DebugCheckerTest, UnbalancedBusRejected) {
    auto sends = two_column({{5, 1}, {9, 1}});
    auto receives = two_column({{5, 1}, {8, 1}});
    EXPECT_THROW(DebugChecker::check_bus_balance({DebugAirInput{&sender_, {&sends}, {}},
                                                  DebugAirInput{&receiver_, {&receives}, {}}}),
                 BusImbalance);
}

TEST_F(DebugCheckerTest, NegativeMultiplicityDetected) {
    auto sends = two_column({{5, 1}, {0, 0}});
    auto receives = two_column({{5, 2}, {0, 0}});
    EXPECT_THROW(DebugChecker::check_bus_balance({DebugAirInput{&sender_, {&sends}, {}},
                                                  DebugAirInput{&receiver_, {&receives}, {}}}),
                 BusImbalance);
}
