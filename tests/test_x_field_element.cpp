#include <gtest/gtest.h>
#include "table/matrix.hpp"
#include "types/x_field_element.hpp"

using namespace zkrv;

class XFieldElementTest : public ::testing::Test {
protected:
    XFieldElement sample(uint32_t seed) const {
        return XFieldElement(BFieldElement(seed), BFieldElement(seed * 7 + 1), BFieldElement(seed * 13 + 2),
                             BFieldElement(seed * 31 + 3));
    }
};

// Basic construction tests
TEST_F(XFieldElementTest, DefaultConstruction) {
    XFieldElement zero;
    EXPECT_TRUE(zero.is_zero());
}

TEST_F(XFieldElementTest, CoefficientConstruction) {
    XFieldElement elem(BFieldElement(1), BFieldElement(2), BFieldElement(3), BFieldElement(4));
    EXPECT_EQ(elem.coeff(0).value(), 1U);
    EXPECT_EQ(elem.coeff(1).value(), 2U);
    EXPECT_EQ(elem.coeff(2).value(), 3U);
    EXPECT_EQ(elem.coeff(3).value(), 4U);
}

TEST_F(XFieldElementTest, FromBFieldElement) {
    XFieldElement elem(BFieldElement(42));
    EXPECT_EQ(elem.coeff(0).value(), 42U);
    EXPECT_TRUE(elem.is_base());
    EXPECT_FALSE(XFieldElement::x().is_base());
}

// Arithmetic tests
TEST_F(XFieldElementTest, Addition) {
    XFieldElement a(BFieldElement(1), BFieldElement(2), BFieldElement(3), BFieldElement(4));
    XFieldElement b(BFieldElement(5), BFieldElement(6), BFieldElement(7), BFieldElement(8));
    auto result = a + b;
    EXPECT_EQ(result.coeff(0).value(), 6U);
    EXPECT_EQ(result.coeff(1).value(), 8U);
    EXPECT_EQ(result.coeff(2).value(), 10U);
    EXPECT_EQ(result.coeff(3).value(), 12U);
}

TEST_F(XFieldElementTest, SubtractionIsInverseOfAddition) {
    auto a = sample(3);
    auto b = sample(11);
    EXPECT_EQ((a + b) - b, a);
    EXPECT_TRUE((a - a).is_zero());
}

// X^4 = W
TEST_F(XFieldElementTest, ReductionPolynomial) {
    auto x = XFieldElement::x();
    auto x4 = x * x * x * x;
    EXPECT_EQ(x4, XFieldElement(BFieldElement(XFieldElement::W)));
}

TEST_F(XFieldElementTest, MultiplicationCommutesAndDistributes) {
    auto a = sample(5);
    auto b = sample(9);
    auto c = sample(17);
    EXPECT_EQ(a * b, b * a);
    EXPECT_EQ(a * (b + c), a * b + a * c);
}

TEST_F(XFieldElementTest, MixedBaseArithmetic) {
    auto a = sample(4);
    BFieldElement s(1000);
    EXPECT_EQ(a * s, a * XFieldElement(s));
    EXPECT_EQ(s * a, a * s);
    EXPECT_EQ(a + s, a + XFieldElement(s));
}

// Inverse tests
TEST_F(XFieldElementTest, InverseProperty) {
    auto a = sample(123);
    EXPECT_TRUE((a * a.inverse()).is_one());
    EXPECT_EQ((a / sample(7)) * sample(7), a);
}

TEST_F(XFieldElementTest, InverseOfZeroThrows) {
    EXPECT_THROW(XFieldElement::zero().inverse(), std::domain_error);
}

TEST_F(XFieldElementTest, BatchInversion) {
    std::vector<XFieldElement> xs = {sample(1), sample(2), sample(3), XFieldElement::one()};
    auto inv = XFieldElement::batch_inversion(xs);
    for (size_t i = 0; i < xs.size(); ++i) {
        EXPECT_TRUE((xs[i] * inv[i]).is_one());
    }
}

TEST_F(XFieldElementTest, Power) {
    auto a = sample(6);
    EXPECT_TRUE(a.pow(0).is_one());
    EXPECT_EQ(a.pow(3), a * a * a);
}

// Each extension column becomes four consecutive base columns
TEST_F(XFieldElementTest, FlattenToBaseKeepsCoefficients) {
    RowMajorMatrix<XFieldElement> m(2, 3);
    for (size_t r = 0; r < 3; ++r) {
        for (size_t c = 0; c < 2; ++c) {
            m.set(r, c, sample(static_cast<uint32_t>(10 * r + c + 1)));
        }
    }
    const RowMajorMatrix<BFieldElement> flat = flatten_to_base(m);
    ASSERT_EQ(flat.width(), 8U);
    ASSERT_EQ(flat.height(), 3U);
    for (size_t r = 0; r < 3; ++r) {
        for (size_t c = 0; c < 2; ++c) {
            const XFieldElement expected = sample(static_cast<uint32_t>(10 * r + c + 1));
            for (size_t k = 0; k < XFieldElement::EXTENSION_DEGREE; ++k) {
                EXPECT_EQ(flat.get(r, 4 * c + k), expected.coeff(k)) << "row " << r << " col " << c << " k " << k;
            }
        }
    }
}
