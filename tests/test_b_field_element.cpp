#include <gtest/gtest.h>
#include "types/b_field_element.hpp"

using namespace zkrv;

class BFieldElementTest : public ::testing::Test {};

// Basic construction tests
TEST_F(BFieldElementTest, DefaultConstruction) {
    BFieldElement zero;
    EXPECT_EQ(zero.value(), 0U);
}

TEST_F(BFieldElementTest, ValueConstruction) {
    BFieldElement elem(42);
    EXPECT_EQ(elem.value(), 42U);
}

TEST_F(BFieldElementTest, ModularReduction) {
    BFieldElement elem(uint64_t{BFieldElement::MODULUS} + 5);
    EXPECT_EQ(elem.value(), 5U);
}

TEST_F(BFieldElementTest, SignedEmbedding) {
    EXPECT_EQ(BFieldElement::from_i64(-1).value(), BFieldElement::MODULUS - 1);
    EXPECT_EQ(BFieldElement::from_i64(-8).value(), BFieldElement::MODULUS - 8);
    EXPECT_EQ(BFieldElement::from_i64(17).value(), 17U);
}

// Factory methods
TEST_F(BFieldElementTest, ZeroAndOne) {
    EXPECT_TRUE(BFieldElement::zero().is_zero());
    EXPECT_TRUE(BFieldElement::one().is_one());
    EXPECT_EQ(BFieldElement::generator().value(), BFieldElement::GENERATOR);
}

// Arithmetic tests
TEST_F(BFieldElementTest, AdditionWithOverflow) {
    BFieldElement a(BFieldElement::MODULUS - 5);
    BFieldElement b(10);
    EXPECT_EQ((a + b).value(), 5U);
}

TEST_F(BFieldElementTest, SubtractionWithUnderflow) {
    BFieldElement a(5);
    BFieldElement b(10);
    EXPECT_EQ((a - b).value(), BFieldElement::MODULUS - 5);
}

TEST_F(BFieldElementTest, MultiplicationWithReduction) {
    // 2^32 = 2 * 2^31 and 2^31 = 2^27 - 1 mod p
    BFieldElement a(1ULL << 16);
    EXPECT_EQ((a * a).value(), 2U * ((1U << 27) - 1));
}

TEST_F(BFieldElementTest, Negation) {
    BFieldElement a(100);
    EXPECT_TRUE((a + -a).is_zero());
    EXPECT_TRUE((-BFieldElement::zero()).is_zero());
}

TEST_F(BFieldElementTest, Halve) {
    BFieldElement a(7);
    EXPECT_EQ(a.halve() + a.halve(), a);
    EXPECT_EQ(BFieldElement(10).halve().value(), 5U);
}

// Power tests
TEST_F(BFieldElementTest, Powers) {
    BFieldElement a(5);
    EXPECT_EQ(a.pow(0).value(), 1U);
    EXPECT_EQ(a.pow(1).value(), 5U);
    EXPECT_EQ(a.pow(2).value(), 25U);
    EXPECT_EQ(BFieldElement(2).pow(10).value(), 1024U);
}

TEST_F(BFieldElementTest, FermatLittleTheorem) {
    BFieldElement a(987654321);
    EXPECT_TRUE(a.pow(BFieldElement::MODULUS - 1).is_one());
}

// Inverse tests
TEST_F(BFieldElementTest, InverseProperty) {
    BFieldElement a(12345);
    EXPECT_TRUE((a * a.inverse()).is_one());
    EXPECT_TRUE((BFieldElement::generator() * BFieldElement::generator().inverse()).is_one());
}

TEST_F(BFieldElementTest, InverseOfZeroThrows) {
    EXPECT_THROW(BFieldElement::zero().inverse(), std::domain_error);
}

TEST_F(BFieldElementTest, BatchInversion) {
    std::vector<BFieldElement> xs = {BFieldElement(3), BFieldElement(1000), BFieldElement(BFieldElement::MODULUS - 2)};
    auto inv = BFieldElement::batch_inversion(xs);
    ASSERT_EQ(inv.size(), xs.size());
    for (size_t i = 0; i < xs.size(); ++i) {
        EXPECT_EQ(inv[i], xs[i].inverse());
    }
}

TEST_F(BFieldElementTest, DivisionProperty) {
    BFieldElement a(12345);
    BFieldElement b(67890);
    EXPECT_EQ((a / b) * b, a);
}

// Primitive root of unity tests
TEST_F(BFieldElementTest, PrimitiveRootOfUnityOrder1) {
    auto root = BFieldElement::primitive_root_of_unity(1);
    EXPECT_EQ(root.value(), BFieldElement::MODULUS - 1);
}

TEST_F(BFieldElementTest, PrimitiveRootOfUnityMaxOrder) {
    auto root = BFieldElement::primitive_root_of_unity(BFieldElement::TWO_ADICITY);
    EXPECT_TRUE(root.pow(1ULL << BFieldElement::TWO_ADICITY).is_one());
    EXPECT_FALSE(root.pow(1ULL << (BFieldElement::TWO_ADICITY - 1)).is_one());
}

TEST_F(BFieldElementTest, PrimitiveRootBeyondTwoAdicityThrows) {
    EXPECT_THROW(BFieldElement::primitive_root_of_unity(BFieldElement::TWO_ADICITY + 1), std::invalid_argument);
}

TEST_F(BFieldElementTest, ModulusValue) {
    // BabyBear: 15 * 2^27 + 1
    EXPECT_EQ(BFieldElement::MODULUS, 15U * (1U << 27) + 1U);
}
