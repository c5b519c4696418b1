#include <gtest/gtest.h>
#include "proof_stream/challenger.hpp"
#include "types/x_field_element.hpp"
#include <set>

using namespace zkrv;

class ChallengerTest : public ::testing::Test {
protected:
    static Digest digest(uint32_t seed) {
        std::array<BFieldElement, Digest::LEN> e{};
        for (size_t i = 0; i < Digest::LEN; ++i) {
            e[i] = BFieldElement(seed * 100 + i);
        }
        return Digest(e);
    }
};

// Same transcript, same challenges
TEST_F(ChallengerTest, Deterministic) {
    DuplexChallenger a;
    DuplexChallenger b;
    a.observe(digest(1));
    b.observe(digest(1));
    a.observe(BFieldElement(17));
    b.observe(BFieldElement(17));
    EXPECT_EQ(a.sample(), b.sample());
    EXPECT_EQ(a.sample_ext(), b.sample_ext());
    EXPECT_EQ(a.sample_bits(10), b.sample_bits(10));
}

TEST_F(ChallengerTest, ObservationChangesChallenges) {
    DuplexChallenger a;
    DuplexChallenger b;
    a.observe(digest(1));
    b.observe(digest(2));
    EXPECT_NE(a.sample_ext(), b.sample_ext());

    DuplexChallenger c;
    DuplexChallenger d;
    c.observe(BFieldElement(5));
    d.observe(BFieldElement(5));
    EXPECT_EQ(c.sample(), d.sample());
    // Observing after a sample reseeds the output
    c.observe(BFieldElement(6));
    EXPECT_NE(c.sample(), d.sample());
}

TEST_F(ChallengerTest, ExtensionObservationMatchesCoefficients) {
    XFieldElement v(BFieldElement(1), BFieldElement(2), BFieldElement(3), BFieldElement(4));
    DuplexChallenger a;
    DuplexChallenger b;
    a.observe(v);
    b.observe_slice({BFieldElement(1), BFieldElement(2), BFieldElement(3), BFieldElement(4)});
    EXPECT_EQ(a.sample(), b.sample());
}

// Consecutive samples differ and keep coming after the squeezed rate runs out
TEST_F(ChallengerTest, SamplesAreDistinct) {
    DuplexChallenger c;
    c.observe(digest(9));
    std::set<uint32_t> seen;
    for (int i = 0; i < 64; ++i) {
        seen.insert(c.sample().value());
    }
    EXPECT_GT(seen.size(), 60U);
}

TEST_F(ChallengerTest, SampleBitsInRange) {
    DuplexChallenger c;
    c.observe(digest(3));
    for (int i = 0; i < 100; ++i) {
        EXPECT_LT(c.sample_bits(5), 32U);
    }
    EXPECT_EQ(c.sample_bits(0), 0U);
}

TEST_F(ChallengerTest, GrindWitnessChecks) {
    DuplexChallenger prover;
    prover.observe(digest(4));
    DuplexChallenger verifier = prover;

    BFieldElement witness = prover.grind(4);
    EXPECT_TRUE(verifier.check_witness(4, witness));
    // Both transcripts continue in lockstep
    EXPECT_EQ(prover.sample(), verifier.sample());
}

TEST_F(ChallengerTest, ZeroBitGrindAcceptsAnything) {
    DuplexChallenger c;
    EXPECT_TRUE(c.check_witness(0, BFieldElement(12345)));
}
