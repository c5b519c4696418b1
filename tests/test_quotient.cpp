#include <gtest/gtest.h>
#include "air/air.hpp"
#include "air/symbolic_dag.hpp"
#include "fri/two_adic_pcs.hpp"
#include "ntt/arithmetic_domain.hpp"
#include "quotient/quotient.hpp"
#include "stark/errors.hpp"
#include "stark/keygen.hpp"
#include <iostream>

using namespace zkrv;

namespace {

// x' = y, y' = x + y with x_0, y_0 and y_last as public values
class FibonacciAir : public Air {
public:
    std::string name() const override { return "Fibonacci"; }
    size_t width() const override { return 2; }
    size_t num_public_values() const override { return 3; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.when_first_row().assert_eq(main.local(0), builder.public_value(0));
        builder.when_first_row().assert_eq(main.local(1), builder.public_value(1));
        builder.when_transition().assert_eq(main.next(0), main.local(1));
        builder.when_transition().assert_eq(main.next(1), main.local(0) + main.local(1));
        builder.when_last_row().assert_eq(main.local(1), builder.public_value(2));
    }
};

// y = x^3 on every row
class CubeAir : public Air {
public:
    std::string name() const override { return "Cube"; }
    size_t width() const override { return 2; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.assert_eq(main.local(1), main.local(0) * main.local(0) * main.local(0));
    }
};

// x^4 exceeds blowup + 1 for log_blowup = 1
class QuarticAir : public Air {
public:
    std::string name() const override { return "Quartic"; }
    size_t width() const override { return 1; }

    void eval(AirBuilder& builder) const override {
        SymbolicExpression x = builder.main().local(0);
        builder.assert_zero(x * x * x * x - 1);
    }
};

/**
 * Main-trace-only out-of-domain source: local and next rows evaluated at
 * zeta and zeta * omega.
 */
class OodMainSource : public VariableSource<XFieldElement> {
public:
    std::vector<XFieldElement> local;
    std::vector<XFieldElement> next;
    std::vector<BFieldElement> public_values;
    XFieldElement first_row;
    XFieldElement last_row;
    XFieldElement transition;

    XFieldElement base(const SymbolicVariable& var) const override {
        if (var.entry == Entry::Public) {
            return XFieldElement(public_values.at(var.index));
        }
        return var.offset == 0 ? local.at(var.index) : next.at(var.index);
    }
    XFieldElement extension(const SymbolicVariable&) const override {
        throw std::logic_error("no extension variables");
    }
    XFieldElement is_first_row() const override { return first_row; }
    XFieldElement is_last_row() const override { return last_row; }
    XFieldElement is_transition() const override { return transition; }
};

} // namespace

class QuotientTest : public ::testing::Test {
protected:
    FriParameters params_ = FriParameters::testing();
    TwoAdicPcs pcs_{params_};

    StarkVerifyingKey keygen(AirRef air) const {
        MultiStarkKeygenBuilder builder(params_);
        builder.add_air(std::move(air));
        return builder.generate_pk().per_air.at(0).vk;
    }

    static RowMajorMatrix<BFieldElement> fibonacci_trace(size_t log_height, std::vector<BFieldElement>& pvs) {
        const size_t n = size_t{1} << log_height;
        RowMajorMatrix<BFieldElement> trace(2, n);
        BFieldElement x(1), y(1);
        for (size_t r = 0; r < n; ++r) {
            trace.set(r, 0, x);
            trace.set(r, 1, y);
            BFieldElement t = x + y;
            x = y;
            y = t;
        }
        pvs = {BFieldElement(1), BFieldElement(1), trace.get(n - 1, 1)};
        return trace;
    }

    /**
     * Evaluates the constraint fold at zeta from the trace and compares it
     * with Z_H(zeta) times the recomposed quotient chunks.
     */
    bool quotient_identity_holds(const StarkVerifyingKey& vk, const RowMajorMatrix<BFieldElement>& trace,
                                 const std::vector<BFieldElement>& pvs, const XFieldElement& alpha,
                                 const XFieldElement& zeta) const {
        const size_t log_height = log2_strict(trace.height());
        auto committed = pcs_.commit_matrix(trace);

        QuotientInputs inputs;
        inputs.vk = &vk;
        inputs.log_height = log_height;
        inputs.mains = {committed.get()};
        inputs.public_values = pvs;
        RowMajorMatrix<BFieldElement> chunks = Quotient::compute_quotient_chunks(inputs, alpha, params_.log_blowup);
        EXPECT_EQ(chunks.height(), trace.height());
        EXPECT_EQ(chunks.width(), XFieldElement::EXTENSION_DEGREE * vk.quotient_degree);

        const BFieldElement omega = BFieldElement::primitive_root_of_unity(static_cast<uint32_t>(log_height));
        OodMainSource source;
        source.local = TwoAdicPcs::evaluate_columns(trace, zeta);
        source.next = TwoAdicPcs::evaluate_columns(trace, zeta * omega);
        source.public_values = pvs;
        const XFieldElement zh = zeta.pow(trace.height()) - XFieldElement::one();
        source.first_row = zh / (zeta - XFieldElement::one());
        source.last_row = zh / (zeta - XFieldElement(omega.inverse()));
        source.transition = zeta - XFieldElement(omega.inverse());

        DagEvaluator<XFieldElement> evaluator(vk.constraints);
        evaluator.evaluate(source);
        const XFieldElement folded = evaluator.fold_roots(alpha);

        const XFieldElement q = Quotient::recompose(TwoAdicPcs::evaluate_columns(chunks, zeta), zeta, log_height);
        return folded == q * zh;
    }

    static XFieldElement point(uint32_t seed) {
        return XFieldElement(BFieldElement(seed), BFieldElement(seed * 3 + 1), BFieldElement(7), BFieldElement(seed + 11));
    }
};

TEST_F(QuotientTest, QuotientDegreeFromConstraintDegree) {
    StarkVerifyingKey fib = keygen(std::make_shared<FibonacciAir>());
    EXPECT_EQ(fib.max_constraint_degree, 2U);
    EXPECT_EQ(fib.quotient_degree, 1U);

    StarkVerifyingKey cube = keygen(std::make_shared<CubeAir>());
    EXPECT_EQ(cube.max_constraint_degree, 3U);
    EXPECT_EQ(cube.quotient_degree, 2U);
}

TEST_F(QuotientTest, DegreeAboveBlowupRejectedAtKeygen) {
    try {
        keygen(std::make_shared<QuarticAir>());
        FAIL() << "degree 4 AIR accepted with blowup 2";
    } catch (const KeygenError& e) {
        EXPECT_EQ(e.kind(), KeygenErrorKind::DegreeTooHigh);
    }
}

TEST_F(QuotientTest, SatisfiedTraceGivesLowDegreeQuotient) {
    StarkVerifyingKey vk = keygen(std::make_shared<FibonacciAir>());
    std::vector<BFieldElement> pvs;
    RowMajorMatrix<BFieldElement> trace = fibonacci_trace(4, pvs);
    EXPECT_TRUE(quotient_identity_holds(vk, trace, pvs, point(3), point(1000)));
    EXPECT_TRUE(quotient_identity_holds(vk, trace, pvs, point(77), point(123456)));
    std::cout << "  ✓ C(zeta) = Q(zeta) Z_H(zeta) for a 16-row Fibonacci trace" << std::endl;
}

// Two chunks, recombined with zeta^n
TEST_F(QuotientTest, SplitQuotientRecomposes) {
    StarkVerifyingKey vk = keygen(std::make_shared<CubeAir>());
    RowMajorMatrix<BFieldElement> trace(2, 8);
    for (size_t r = 0; r < trace.height(); ++r) {
        BFieldElement x(r * 5 + 2);
        trace.set(r, 0, x);
        trace.set(r, 1, x * x * x);
    }
    EXPECT_TRUE(quotient_identity_holds(vk, trace, {}, point(9), point(4242)));
}

// A violated constraint leaves a remainder that the chunks cannot express
TEST_F(QuotientTest, ViolatedTraceBreaksIdentity) {
    StarkVerifyingKey vk = keygen(std::make_shared<FibonacciAir>());
    std::vector<BFieldElement> pvs;
    RowMajorMatrix<BFieldElement> trace = fibonacci_trace(4, pvs);
    trace.set(5, 1, trace.get(5, 1) + BFieldElement::one());
    EXPECT_FALSE(quotient_identity_holds(vk, trace, pvs, point(3), point(1000)));
}

TEST_F(QuotientTest, WrongPublicValueBreaksIdentity) {
    StarkVerifyingKey vk = keygen(std::make_shared<FibonacciAir>());
    std::vector<BFieldElement> pvs;
    RowMajorMatrix<BFieldElement> trace = fibonacci_trace(3, pvs);
    pvs[2] += BFieldElement::one();
    EXPECT_FALSE(quotient_identity_holds(vk, trace, pvs, point(5), point(31337)));
}

TEST_F(QuotientTest, RecomposeExtension) {
    std::vector<XFieldElement> columns = {XFieldElement(BFieldElement(1)), XFieldElement(BFieldElement(2)),
                                          XFieldElement(BFieldElement(3)), XFieldElement(BFieldElement(4))};
    EXPECT_EQ(Quotient::recompose_extension(columns.data()),
              XFieldElement(BFieldElement(1), BFieldElement(2), BFieldElement(3), BFieldElement(4)));

    columns.pop_back();
    EXPECT_THROW(Quotient::recompose(columns, point(1), 3), std::invalid_argument);
}
