#include <gtest/gtest.h>
#include <iostream>
#include "ntt/arithmetic_domain.hpp"
#include "ntt/ntt.hpp"
#include "types/b_field_element.hpp"

using namespace zkrv;

class NTTTest : public ::testing::Test {
protected:
    static BFieldElement evaluate(const std::vector<BFieldElement>& coeffs, BFieldElement x) {
        BFieldElement acc = BFieldElement::zero();
        for (size_t i = coeffs.size(); i-- > 0;) {
            acc = acc * x + coeffs[i];
        }
        return acc;
    }

    static std::vector<BFieldElement> sequence(size_t n, uint64_t a, uint64_t b) {
        std::vector<BFieldElement> out(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = BFieldElement(i * a + b);
        }
        return out;
    }
};

// Test basic NTT forward/inverse roundtrip
TEST_F(NTTTest, ForwardInverseRoundtrip) {
    std::vector<BFieldElement> original = sequence(8, 1, 1);
    std::vector<BFieldElement> data = original;
    NTT::forward(data);
    NTT::inverse(data);
    EXPECT_EQ(data, original);
}

// Forward NTT evaluates at consecutive powers of the root
TEST_F(NTTTest, ForwardMatchesNaiveEvaluation) {
    const size_t log_n = 4;
    std::vector<BFieldElement> coeffs = sequence(1 << log_n, 7, 3);
    std::vector<BFieldElement> evals = coeffs;
    NTT::forward(evals);

    const BFieldElement w = BFieldElement::primitive_root_of_unity(log_n);
    BFieldElement x = BFieldElement::one();
    for (size_t i = 0; i < evals.size(); ++i) {
        EXPECT_EQ(evals[i], evaluate(coeffs, x)) << "evaluation mismatch at index " << i;
        x *= w;
    }
}

TEST_F(NTTTest, LargerSize) {
    std::vector<BFieldElement> original = sequence(512, 7, 3);
    std::vector<BFieldElement> data = original;
    NTT::forward(data);
    NTT::inverse(data);
    EXPECT_EQ(data, original);
    std::cout << "  ✓ NTT 512-element roundtrip verified" << std::endl;
}

TEST_F(NTTTest, ExtensionFieldRoundtrip) {
    std::vector<XFieldElement> original(16);
    for (size_t i = 0; i < original.size(); ++i) {
        original[i] = XFieldElement(BFieldElement(i), BFieldElement(2 * i + 1), BFieldElement(3), BFieldElement(i * i));
    }
    std::vector<XFieldElement> data = original;
    NTT::forward(data);
    NTT::inverse(data);
    EXPECT_EQ(data, original);
}

// Low-degree extension on a coset agrees with direct evaluation
TEST_F(NTTTest, CosetEvaluation) {
    std::vector<BFieldElement> coeffs = sequence(8, 5, 11);
    const BFieldElement offset = BFieldElement::generator();
    const size_t domain_length = 32;
    auto evals = NTT::evaluate_on_coset(coeffs, domain_length, offset);
    ASSERT_EQ(evals.size(), domain_length);

    const BFieldElement w = BFieldElement::primitive_root_of_unity(5);
    BFieldElement x = offset;
    for (size_t i = 0; i < domain_length; ++i) {
        EXPECT_EQ(evals[i], evaluate(coeffs, x));
        x *= w;
    }

    auto back = NTT::coset_interpolate(evals, offset);
    for (size_t i = 0; i < back.size(); ++i) {
        EXPECT_EQ(back[i], i < coeffs.size() ? coeffs[i] : BFieldElement::zero());
    }
}

TEST_F(NTTTest, DomainVanishing) {
    auto domain = ArithmeticDomain::of_length(16).with_offset(BFieldElement::generator());
    EXPECT_EQ(domain.log_length(), 4U);
    for (const BFieldElement& x : domain.values()) {
        EXPECT_TRUE(domain.vanishing(x).is_zero());
    }
    EXPECT_FALSE(domain.vanishing(BFieldElement(3)).is_zero());
}
