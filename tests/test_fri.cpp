#include <gtest/gtest.h>
#include "fri/fri.hpp"
#include "ntt/ntt.hpp"
#include "stark/errors.hpp"
#include <iostream>

using namespace zkrv;

class FriTest : public ::testing::Test {
protected:
    FriParameters params_ = FriParameters::testing();

    // Evaluations of a polynomial of the given degree bound on g * H of size 2^log_len
    std::vector<XFieldElement> low_degree_codeword(size_t degree_bound, size_t log_len, uint32_t seed) const {
        std::vector<XFieldElement> coeffs(degree_bound);
        for (size_t i = 0; i < degree_bound; ++i) {
            coeffs[i] = XFieldElement(BFieldElement(seed + i), BFieldElement(3 * i + 1), BFieldElement(seed * i),
                                      BFieldElement(i * i + 7));
        }
        return NTT::evaluate_on_coset(coeffs, size_t{1} << log_len, Fri::shift());
    }

    static std::vector<XFieldElement> noise(size_t len) {
        std::vector<XFieldElement> out(len);
        uint64_t s = 0x9e3779b9;
        for (auto& v : out) {
            s = s * 6364136223846793005ULL + 1442695040888963407ULL;
            v = XFieldElement(BFieldElement(s >> 33), BFieldElement(s >> 7), BFieldElement(s), BFieldElement(s >> 20));
        }
        return out;
    }

    void prove_and_verify(const Fri::Inputs& inputs) const {
        Fri fri(params_);
        DuplexChallenger prover_challenger;
        std::vector<size_t> indices;
        FriProof proof = fri.prove(inputs, prover_challenger, indices);
        EXPECT_EQ(indices.size(), params_.num_queries);

        const size_t log_max = inputs.begin()->first;
        DuplexChallenger verifier_challenger;
        fri.verify(proof, log_max, verifier_challenger, [&](size_t index) {
            std::map<size_t, XFieldElement> out;
            for (const auto& [log_len, codeword] : inputs) {
                out[log_len] = codeword[index % codeword.size()];
            }
            return out;
        });
    }
};

TEST_F(FriTest, LowDegreeCodewordVerifies) {
    Fri::Inputs inputs;
    inputs[6] = low_degree_codeword(32, 6, 5);
    EXPECT_NO_THROW(prove_and_verify(inputs));
    std::cout << "  ✓ FRI accepted a rate-1/2 codeword of length 64" << std::endl;
}

// Shorter codewords are rolled in when the fold reaches their length
TEST_F(FriTest, MixedHeightsVerify) {
    Fri::Inputs inputs;
    inputs[7] = low_degree_codeword(64, 7, 1);
    inputs[5] = low_degree_codeword(16, 5, 2);
    inputs[3] = low_degree_codeword(4, 3, 3);
    EXPECT_NO_THROW(prove_and_verify(inputs));
}

// The prover refuses to fold a codeword whose interpolant is too large
TEST_F(FriTest, HighDegreeCodewordRejected) {
    Fri::Inputs inputs;
    inputs[6] = noise(64);
    Fri fri(params_);
    DuplexChallenger challenger;
    std::vector<size_t> indices;
    try {
        fri.prove(inputs, challenger, indices);
        FAIL() << "a random codeword was folded to a low-degree final polynomial";
    } catch (const ProverError& e) {
        EXPECT_EQ(e.kind(), ProverErrorKind::InvalidInput);
    }
}

TEST_F(FriTest, TamperedFinalPolynomialRejected) {
    Fri::Inputs inputs;
    inputs[6] = low_degree_codeword(32, 6, 11);
    Fri fri(params_);
    DuplexChallenger prover_challenger;
    std::vector<size_t> indices;
    FriProof proof = fri.prove(inputs, prover_challenger, indices);
    proof.final_poly[0] = proof.final_poly[0] + XFieldElement::one();

    DuplexChallenger verifier_challenger;
    EXPECT_THROW(fri.verify(proof, 6, verifier_challenger,
                            [&](size_t index) {
                                std::map<size_t, XFieldElement> out;
                                out[6] = inputs.at(6)[index];
                                return out;
                            }),
                 VerificationError);
}

TEST_F(FriTest, WrongInputOpeningRejected) {
    Fri::Inputs inputs;
    inputs[5] = low_degree_codeword(16, 5, 9);
    Fri fri(params_);
    DuplexChallenger prover_challenger;
    std::vector<size_t> indices;
    FriProof proof = fri.prove(inputs, prover_challenger, indices);

    DuplexChallenger verifier_challenger;
    EXPECT_THROW(fri.verify(proof, 5, verifier_challenger,
                            [&](size_t index) {
                                std::map<size_t, XFieldElement> out;
                                out[5] = inputs.at(5)[index] + XFieldElement::one();
                                return out;
                            }),
                 VerificationError);
}

TEST_F(FriTest, ProofShapeChecked) {
    Fri::Inputs inputs;
    inputs[5] = low_degree_codeword(16, 5, 4);
    Fri fri(params_);
    DuplexChallenger prover_challenger;
    std::vector<size_t> indices;
    FriProof proof = fri.prove(inputs, prover_challenger, indices);
    proof.query_proofs.pop_back();

    DuplexChallenger verifier_challenger;
    try {
        fri.verify(proof, 5, verifier_challenger, [&](size_t index) {
            return std::map<size_t, XFieldElement>{{5, inputs.at(5)[index]}};
        });
        FAIL() << "truncated proof accepted";
    } catch (const VerificationError& e) {
        EXPECT_EQ(e.kind(), VerificationErrorKind::InvalidProofShape);
    }
}

TEST_F(FriTest, FoldPairHalvesDegree) {
    // f(x) = a + b x folds to a + beta b
    XFieldElement a(BFieldElement(5));
    XFieldElement b(BFieldElement(9));
    XFieldElement beta = XFieldElement::x();
    BFieldElement x(1234);
    XFieldElement lo = a + b * x;
    XFieldElement hi = a - b * x;
    EXPECT_EQ(Fri::fold_pair(lo, hi, beta, x), a + beta * b);
}
