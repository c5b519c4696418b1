#include <gtest/gtest.h>
#include "air/air.hpp"
#include "stark/codec.hpp"
#include "stark/errors.hpp"
#include "stark/keygen.hpp"
#include "stark/prover.hpp"
#include "stark/verifier.hpp"
#include <algorithm>
#include <iostream>

using namespace zkrv;

namespace {

constexpr BusIndex VALUE_BUS = 3;

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

// Sends (value, value^2) with multiplicity count
class SquareSenderAir : public Air {
public:
    std::string name() const override { return "SquareSender"; }
    size_t width() const override { return 2; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.push_send(VALUE_BUS, {main.local(0), main.local(0) * main.local(0)}, main.local(1));
    }
};

class SquareReceiverAir : public Air {
public:
    std::string name() const override { return "SquareReceiver"; }
    size_t width() const override { return 3; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.push_receive(VALUE_BUS, {main.local(0), main.local(1)}, main.local(2));
    }
};

// Same bus with a single field
class NarrowReceiverAir : public Air {
public:
    std::string name() const override { return "NarrowReceiver"; }
    size_t width() const override { return 2; }

    void eval(AirBuilder& builder) const override {
        SymbolicWindow main = builder.main();
        builder.push_receive(VALUE_BUS, {main.local(0)}, main.local(1));
    }
};

// Common column equals the cached column plus one
class CachedIncrementAir : public Air {
public:
    std::string name() const override { return "CachedIncrement"; }
    size_t width() const override { return 1; }
    std::vector<size_t> cached_main_widths() const override { return {1}; }

    void eval(AirBuilder& builder) const override {
        builder.assert_eq(builder.main().local(0), builder.partitioned_main(0).local(0) + 1);
    }
};

// Main column doubles a fixed preprocessed column
class DoublingTableAir : public Air {
public:
    std::string name() const override { return "DoublingTable"; }
    size_t width() const override { return 1; }

    std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const override {
        RowMajorMatrix<BFieldElement> table(1, 8);
        for (size_t r = 0; r < 8; ++r) {
            table.set(r, 0, BFieldElement(r * r + 3));
        }
        return table;
    }

    void eval(AirBuilder& builder) const override {
        builder.assert_eq(builder.main().local(0), builder.preprocessed().local(0) * 2);
    }
};

class EmptyAir : public Air {
public:
    std::string name() const override { return "Empty"; }
    size_t width() const override { return 0; }
    void eval(AirBuilder&) const override {}
};

// Reads column 5 of a 2-column trace
class OutOfRangeAir : public Air {
public:
    std::string name() const override { return "OutOfRange"; }
    size_t width() const override { return 2; }
    void eval(AirBuilder& builder) const override { builder.assert_zero(builder.main().local(5)); }
};

RowMajorMatrix<BFieldElement> fibonacci_trace(size_t n, uint32_t a, uint32_t b) {
    RowMajorMatrix<BFieldElement> trace(2, n);
    BFieldElement x(a);
    BFieldElement y(b);
    for (size_t r = 0; r < n; ++r) {
        trace.set(r, 0, x);
        trace.set(r, 1, y);
        const BFieldElement next = x + y;
        x = y;
        y = next;
    }
    return trace;
}

RowMajorMatrix<BFieldElement> rows(size_t width, const std::vector<std::vector<uint32_t>>& values) {
    RowMajorMatrix<BFieldElement> m(width, values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        for (size_t c = 0; c < width; ++c) {
            m.set(r, c, BFieldElement(values[r][c]));
        }
    }
    return m;
}

AirProofInput common_only(RowMajorMatrix<BFieldElement> trace, std::vector<BFieldElement> public_values = {}) {
    AirProofInput input;
    input.common_main = std::move(trace);
    input.public_values = std::move(public_values);
    return input;
}

} // namespace

class StarkTest : public ::testing::Test {
protected:
    FriParameters params_ = FriParameters::testing();

    MultiStarkProvingKey keygen(const std::vector<AirRef>& airs) const {
        MultiStarkKeygenBuilder builder(params_);
        for (const auto& air : airs) {
            builder.add_air(air);
        }
        return builder.generate_pk();
    }

    static Proof prove(const MultiStarkProvingKey& pk, ProofInput input) {
        return MultiStarkProver(pk).prove(std::move(input));
    }

    static void verify(const MultiStarkProvingKey& pk, const Proof& proof) {
        const MultiStarkVerifyingKey vk = pk.get_vk();
        MultiStarkVerifier(vk).verify(proof);
    }

    static VerificationErrorKind rejection(const MultiStarkProvingKey& pk, const Proof& proof) {
        try {
            verify(pk, proof);
        } catch (const VerificationError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "proof accepted";
        return VerificationErrorKind::InvalidProofShape;
    }

    // Fibonacci(8) from (1, 1) ends with y = 34
    ProofInput fibonacci_input(uint32_t last = 34) const {
        ProofInput input;
        input.per_air.emplace_back(
            0, common_only(fibonacci_trace(8, 1, 1), {BFieldElement(1), BFieldElement(1), BFieldElement(last)}));
        return input;
    }

    ProofInput square_bus_input(size_t padded_height) const {
        auto sends = rows(2, {{3, 2}, {5, 1}});
        auto receives = rows(3, {{5, 25, 1}, {3, 9, 1}, {3, 9, 1}});
        RowMajorMatrix<BFieldElement> send_trace(2, padded_height);
        RowMajorMatrix<BFieldElement> receive_trace(3, padded_height);
        for (size_t r = 0; r < sends.height(); ++r) {
            for (size_t c = 0; c < 2; ++c) send_trace.set(r, c, sends.get(r, c));
        }
        for (size_t r = 0; r < receives.height(); ++r) {
            for (size_t c = 0; c < 3; ++c) receive_trace.set(r, c, receives.get(r, c));
        }
        // Padding rows carry count 0 but otherwise arbitrary values
        for (size_t r = receives.height(); r < padded_height; ++r) {
            receive_trace.set(r, 0, BFieldElement(r + 100));
            send_trace.set(r, 0, BFieldElement(r + 7));
        }
        ProofInput input;
        input.per_air.emplace_back(0, common_only(std::move(send_trace)));
        input.per_air.emplace_back(1, common_only(std::move(receive_trace)));
        return input;
    }
};

// ============================================================================
// Keygen
// ============================================================================

TEST_F(StarkTest, KeygenAssignsIdsInOrder) {
    auto pk = keygen({std::make_shared<FibonacciAir>(), std::make_shared<SquareSenderAir>(),
                      std::make_shared<SquareReceiverAir>()});
    ASSERT_EQ(pk.num_airs(), 3U);
    EXPECT_EQ(pk.per_air[0].vk.air_name, "Fibonacci");
    EXPECT_EQ(pk.per_air[1].vk.air_name, "SquareSender");
    EXPECT_FALSE(pk.per_air[0].vk.has_interactions());
    EXPECT_TRUE(pk.per_air[1].vk.has_interactions());
    EXPECT_GT(pk.per_air[1].vk.num_permutation_columns, 0U);
    EXPECT_EQ(pk.get_vk().pre_hash, pk.pre_hash);
}

TEST_F(StarkTest, KeygenPreHashDependsOnAirSet) {
    auto a = keygen({std::make_shared<FibonacciAir>()});
    auto b = keygen({std::make_shared<FibonacciAir>()});
    auto c = keygen({std::make_shared<FibonacciAir>(), std::make_shared<SquareSenderAir>()});
    EXPECT_EQ(a.pre_hash, b.pre_hash);
    EXPECT_NE(a.pre_hash, c.pre_hash);

    params_.num_queries = 9;
    auto d = keygen({std::make_shared<FibonacciAir>()});
    EXPECT_NE(a.pre_hash, d.pre_hash);
}

TEST_F(StarkTest, KeygenErrors) {
    auto kind_of = [&](std::vector<AirRef> airs) {
        try {
            keygen(airs);
        } catch (const KeygenError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "keygen accepted inconsistent AIRs";
        return KeygenErrorKind::EmptyAir;
    };
    EXPECT_EQ(kind_of({std::make_shared<EmptyAir>()}), KeygenErrorKind::EmptyAir);
    EXPECT_EQ(kind_of({std::make_shared<OutOfRangeAir>()}), KeygenErrorKind::WidthMismatch);
    EXPECT_EQ(kind_of({std::make_shared<SquareReceiverAir>(), std::make_shared<NarrowReceiverAir>()}),
              KeygenErrorKind::BusArityMismatch);
}

// ============================================================================
// Prove / verify
// ============================================================================

TEST_F(StarkTest, FibonacciProofVerifies) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    Proof proof = prove(pk, fibonacci_input());
    ASSERT_EQ(proof.per_air.size(), 1U);
    EXPECT_EQ(proof.per_air[0].log_height, 3U);
    EXPECT_NO_THROW(verify(pk, proof));
    std::cout << "  ✓ Fibonacci(8) proof accepted" << std::endl;
}

TEST_F(StarkTest, WrongClaimedOutputRejected) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    // The trace still ends in 34; the public value claims 35
    Proof proof = prove(pk, fibonacci_input(35));
    const VerificationErrorKind kind = rejection(pk, proof);
    EXPECT_TRUE(kind == VerificationErrorKind::OodEvaluationMismatch ||
                kind == VerificationErrorKind::InvalidOpeningArgument)
        << to_string(kind);
}

TEST_F(StarkTest, TamperedPublicValueRejected) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    Proof proof = prove(pk, fibonacci_input());
    proof.per_air[0].public_values[2] = BFieldElement(35);
    EXPECT_THROW(verify(pk, proof), VerificationError);
}

TEST_F(StarkTest, TamperedOpeningRejected) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    Proof proof = prove(pk, fibonacci_input());
    ASSERT_FALSE(proof.opened_values.empty());
    auto& value = proof.opened_values[0][0][0][0];
    value = value + XFieldElement::one();
    EXPECT_THROW(verify(pk, proof), VerificationError);
}

TEST_F(StarkTest, BalancedBusVerifies) {
    auto pk = keygen({std::make_shared<SquareSenderAir>(), std::make_shared<SquareReceiverAir>()});
    Proof proof = prove(pk, square_bus_input(4));
    ASSERT_TRUE(proof.after_challenge_commit.has_value());
    for (const auto& data : proof.per_air) {
        EXPECT_EQ(data.exposed_values.size(), 1U);
    }
    EXPECT_NO_THROW(verify(pk, proof));
}

// Count-zero padding rows do not change the bus balance
TEST_F(StarkTest, PaddingRowsAreNeutral) {
    auto pk = keygen({std::make_shared<SquareSenderAir>(), std::make_shared<SquareReceiverAir>()});
    Proof small = prove(pk, square_bus_input(4));
    Proof large = prove(pk, square_bus_input(16));
    EXPECT_EQ(large.per_air[0].log_height, 4U);
    EXPECT_NO_THROW(verify(pk, small));
    EXPECT_NO_THROW(verify(pk, large));
}

TEST_F(StarkTest, UnbalancedBusRejected) {
    auto pk = keygen({std::make_shared<SquareSenderAir>(), std::make_shared<SquareReceiverAir>()});
    ProofInput input;
    input.per_air.emplace_back(0, common_only(rows(2, {{3, 1}, {5, 1}})));
    // (5, 24) is never sent
    input.per_air.emplace_back(1, common_only(rows(3, {{3, 9, 1}, {5, 24, 1}})));
    Proof proof = prove(pk, std::move(input));
    EXPECT_EQ(rejection(pk, proof), VerificationErrorKind::NonZeroCumulativeSum);
}

// Only the sending side is proven
TEST_F(StarkTest, MissingReceiverRejected) {
    auto pk = keygen({std::make_shared<SquareSenderAir>(), std::make_shared<SquareReceiverAir>()});
    ProofInput input;
    input.per_air.emplace_back(0, common_only(rows(2, {{3, 1}, {5, 1}})));
    Proof proof = prove(pk, std::move(input));
    EXPECT_EQ(rejection(pk, proof), VerificationErrorKind::NonZeroCumulativeSum);
}

TEST_F(StarkTest, AirsOrderedByDescendingHeight) {
    auto pk = keygen({std::make_shared<FibonacciAir>(), std::make_shared<SquareSenderAir>(),
                      std::make_shared<SquareReceiverAir>()});
    ProofInput input = square_bus_input(4);
    input.per_air.emplace_back(
        0, common_only(fibonacci_trace(16, 0, 1), {BFieldElement(0), BFieldElement(1), BFieldElement(987)}));
    // Sender and receiver were given ids 0 and 1 of a two-AIR key; shift them
    input.per_air[0].first = 1;
    input.per_air[1].first = 2;
    Proof proof = prove(pk, std::move(input));
    ASSERT_EQ(proof.per_air.size(), 3U);
    EXPECT_EQ(proof.per_air[0].air_id, 0U);
    EXPECT_EQ(proof.per_air[1].air_id, 1U);
    EXPECT_EQ(proof.per_air[2].air_id, 2U);
    EXPECT_NO_THROW(verify(pk, proof));

    std::swap(proof.per_air[0], proof.per_air[1]);
    EXPECT_EQ(rejection(pk, proof), VerificationErrorKind::InvalidProofShape);
}

TEST_F(StarkTest, UnknownAirIdRejected) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    Proof proof = prove(pk, fibonacci_input());
    proof.per_air[0].air_id = 4;
    EXPECT_EQ(rejection(pk, proof), VerificationErrorKind::MissingAir);
}

TEST_F(StarkTest, CachedPartitionVerifies) {
    auto pk = keygen({std::make_shared<CachedIncrementAir>()});
    TwoAdicPcs pcs(params_);
    auto cached = pcs.commit_matrix(rows(1, {{10}, {20}, {30}, {40}}));

    AirProofInput air_input = common_only(rows(1, {{11}, {21}, {31}, {41}}));
    air_input.cached_mains.push_back(cached);
    ProofInput input;
    input.per_air.emplace_back(0, air_input);
    Proof proof = prove(pk, input);
    ASSERT_EQ(proof.cached_main_commits.size(), 1U);
    EXPECT_EQ(proof.cached_main_commits[0][0], cached->root());
    EXPECT_NO_THROW(verify(pk, proof));

    input.per_air[0].second.common_main.set(2, 0, BFieldElement(32));
    Proof bad = prove(pk, input);
    EXPECT_THROW(verify(pk, bad), VerificationError);
}

TEST_F(StarkTest, PreprocessedTraceVerifies) {
    auto pk = keygen({std::make_shared<DoublingTableAir>()});
    ASSERT_TRUE(pk.per_air[0].vk.preprocessed_commit.has_value());
    EXPECT_EQ(pk.per_air[0].vk.preprocessed_log_height, 3U);

    RowMajorMatrix<BFieldElement> trace(1, 8);
    for (size_t r = 0; r < 8; ++r) {
        trace.set(r, 0, BFieldElement(2 * (r * r + 3)));
    }
    ProofInput input;
    input.per_air.emplace_back(0, common_only(trace));
    EXPECT_NO_THROW(verify(pk, prove(pk, input)));

    // Height must match the preprocessed table
    ProofInput short_input;
    short_input.per_air.emplace_back(0, common_only(rows(1, {{6}, {8}})));
    EXPECT_THROW(prove(pk, std::move(short_input)), ProverError);
}

TEST_F(StarkTest, ProverRejectsMalformedInput) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    auto error_kind = [&](ProofInput input) {
        try {
            prove(pk, std::move(input));
        } catch (const ProverError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "prover accepted malformed input";
        return ProverErrorKind::InvalidInput;
    };

    ProofInput odd_height;
    odd_height.per_air.emplace_back(0, common_only(fibonacci_trace(6, 1, 1),
                                                   {BFieldElement(1), BFieldElement(1), BFieldElement(13)}));
    EXPECT_EQ(error_kind(std::move(odd_height)), ProverErrorKind::TraceShapeMismatch);

    ProofInput wrong_width;
    wrong_width.per_air.emplace_back(0, common_only(RowMajorMatrix<BFieldElement>(3, 4),
                                                    {BFieldElement(0), BFieldElement(0), BFieldElement(0)}));
    EXPECT_EQ(error_kind(std::move(wrong_width)), ProverErrorKind::TraceShapeMismatch);

    ProofInput missing_public_values;
    missing_public_values.per_air.emplace_back(0, common_only(fibonacci_trace(8, 1, 1)));
    EXPECT_EQ(error_kind(std::move(missing_public_values)), ProverErrorKind::InvalidInput);

    ProofInput unknown_air;
    unknown_air.per_air.emplace_back(3, common_only(fibonacci_trace(8, 1, 1)));
    EXPECT_EQ(error_kind(std::move(unknown_air)), ProverErrorKind::InvalidInput);
}

// ============================================================================
// Codec
// ============================================================================

TEST_F(StarkTest, ProofCodecRoundtrip) {
    auto pk = keygen({std::make_shared<SquareSenderAir>(), std::make_shared<SquareReceiverAir>()});
    Proof proof = prove(pk, square_bus_input(8));
    const std::vector<uint8_t> bytes = codec::encode_proof(proof);
    Proof decoded = codec::decode_proof(bytes);
    EXPECT_EQ(codec::encode_proof(decoded), bytes);
    EXPECT_NO_THROW(verify(pk, decoded));
    std::cout << "  ✓ proof encodes to " << bytes.size() << " bytes" << std::endl;
}

TEST_F(StarkTest, VerifyingKeyCodecRoundtrip) {
    auto pk = keygen({std::make_shared<FibonacciAir>(), std::make_shared<DoublingTableAir>()});
    const MultiStarkVerifyingKey vk = pk.get_vk();
    const MultiStarkVerifyingKey decoded = codec::decode_vk(codec::encode_vk(vk));
    EXPECT_EQ(decoded.params, vk.params);
    EXPECT_EQ(decoded.pre_hash, vk.pre_hash);
    ASSERT_EQ(decoded.num_airs(), 2U);
    EXPECT_EQ(decoded.per_air[1].air_name, "DoublingTable");
    EXPECT_EQ(decoded.per_air[1].preprocessed_commit, vk.per_air[1].preprocessed_commit);
    EXPECT_EQ(compute_vk_pre_hash(decoded.params, decoded.per_air), vk.pre_hash);

    // A decoded key verifies proofs made with the original
    Proof proof = prove(pk, fibonacci_input());
    EXPECT_NO_THROW(MultiStarkVerifier(decoded).verify(proof));
}

TEST_F(StarkTest, ProgramCommitmentCodecRoundtrip) {
    ProgramCommitment commitment;
    std::array<BFieldElement, Digest::LEN> e{};
    for (size_t i = 0; i < Digest::LEN; ++i) {
        e[i] = BFieldElement(i + 40);
    }
    commitment.commit = Digest(e);
    commitment.pc_start = 8;
    commitment.pc_base = 4;
    commitment.num_slots = 77;
    std::vector<uint8_t> bytes = codec::encode_program_commitment(commitment);
    EXPECT_EQ(codec::decode_program_commitment(bytes), commitment);

    bytes.back() = 2;
    EXPECT_THROW(codec::decode_program_commitment(bytes), DecodeError);

    std::reverse(e.begin(), e.end());
    commitment.init_memory_root = Digest(e);
    const ProgramCommitment decoded =
        codec::decode_program_commitment(codec::encode_program_commitment(commitment));
    EXPECT_EQ(decoded, commitment);
    ASSERT_TRUE(decoded.init_memory_root.has_value());
    EXPECT_EQ(*decoded.init_memory_root, Digest(e));
}

TEST_F(StarkTest, MalformedBytesRejected) {
    auto pk = keygen({std::make_shared<FibonacciAir>()});
    std::vector<uint8_t> bytes = codec::encode_proof(prove(pk, fibonacci_input()));

    std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() / 2));
    EXPECT_THROW(codec::decode_proof(truncated), DecodeError);

    std::vector<uint8_t> trailing = bytes;
    trailing.push_back(0);
    EXPECT_THROW(codec::decode_proof(trailing), DecodeError);

    std::vector<uint8_t> bad_magic = bytes;
    bad_magic[0] ^= 0xFF;
    EXPECT_THROW(codec::decode_proof(bad_magic), DecodeError);

    EXPECT_THROW(codec::decode_vk({}), DecodeError);
    EXPECT_THROW(codec::decode_proof(codec::encode_vk(pk.get_vk())), DecodeError);
}

TEST_F(StarkTest, NonCanonicalFieldElementRejected) {
    Encoder encoder;
    encoder.write_u32(BFieldElement::MODULUS);
    std::vector<uint8_t> bytes = encoder.take();
    Decoder decoder(bytes);
    EXPECT_THROW(decoder.read_bfe(), DecodeError);

    Encoder huge_len;
    huge_len.write_u64(uint64_t{1} << 40);
    std::vector<uint8_t> len_bytes = huge_len.take();
    Decoder len_decoder(len_bytes);
    EXPECT_THROW(len_decoder.read_bfe_vec(), DecodeError);
}
