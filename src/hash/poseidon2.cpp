#include "hash/poseidon2.hpp"
#include "chacha12_rng.hpp"
#include <algorithm>

namespace zkrv {

namespace {

Poseidon2::RoundConstants generate_round_constants() {
    ChaCha12Rng rng = ChaCha12Rng::seed_from_u64(Poseidon2::ROUND_CONSTANT_SEED);
    Poseidon2::RoundConstants rc;
    for (auto& round : rc.beginning_full) {
        for (auto& c : round) {
            c = rng.next_field_element();
        }
    }
    for (auto& c : rc.partial) {
        c = rng.next_field_element();
    }
    for (auto& round : rc.ending_full) {
        for (auto& c : round) {
            c = rng.next_field_element();
        }
    }
    return rc;
}

Poseidon2::State make_internal_diagonal() {
    const BFieldElement one = BFieldElement::one();
    const BFieldElement two = BFieldElement::two();
    const BFieldElement half = one.halve();
    auto inv_pow2 = [](uint32_t k) { return BFieldElement::two().pow(k).inverse(); };
    return Poseidon2::State{
        -two, one, two, half,
        BFieldElement(3), BFieldElement(4), -half, -BFieldElement(3),
        -BFieldElement(4), inv_pow2(8), inv_pow2(2), inv_pow2(3),
        inv_pow2(27), -inv_pow2(8), -inv_pow2(4), -inv_pow2(27)};
}

// M4 = [[2,3,1,1],[1,2,3,1],[1,1,2,3],[3,1,1,2]]
void apply_m4(BFieldElement* x) {
    BFieldElement t01 = x[0] + x[1];
    BFieldElement t23 = x[2] + x[3];
    BFieldElement t0123 = t01 + t23;
    BFieldElement t01123 = t0123 + x[1];
    BFieldElement t01233 = t0123 + x[3];
    BFieldElement y3 = t01233 + x[0] + x[0];
    BFieldElement y1 = t01123 + x[2] + x[2];
    BFieldElement y0 = t01123 + t01;
    BFieldElement y2 = t01233 + t23;
    x[0] = y0;
    x[1] = y1;
    x[2] = y2;
    x[3] = y3;
}

} // namespace

const Poseidon2::RoundConstants& Poseidon2::round_constants() {
    static const RoundConstants constants = generate_round_constants();
    return constants;
}

const Poseidon2::State& Poseidon2::internal_diagonal() {
    static const State diagonal = make_internal_diagonal();
    return diagonal;
}

BFieldElement Poseidon2::sbox(BFieldElement x) {
    BFieldElement x2 = x * x;
    BFieldElement x3 = x2 * x;
    return x3 * x3 * x;
}

void Poseidon2::external_linear_layer(State& state) {
    for (size_t i = 0; i < WIDTH; i += 4) {
        apply_m4(&state[i]);
    }
    std::array<BFieldElement, 4> sums{};
    for (size_t i = 0; i < WIDTH; ++i) {
        sums[i % 4] += state[i];
    }
    for (size_t i = 0; i < WIDTH; ++i) {
        state[i] += sums[i % 4];
    }
}

void Poseidon2::internal_linear_layer(State& state) {
    const State& diag = internal_diagonal();
    BFieldElement sum = BFieldElement::zero();
    for (const auto& s : state) {
        sum += s;
    }
    for (size_t i = 0; i < WIDTH; ++i) {
        state[i] = state[i] * diag[i] + sum;
    }
}

void Poseidon2::permute(State& state) {
    const RoundConstants& rc = round_constants();

    external_linear_layer(state);

    for (const auto& round : rc.beginning_full) {
        for (size_t i = 0; i < WIDTH; ++i) {
            state[i] = sbox(state[i] + round[i]);
        }
        external_linear_layer(state);
    }

    for (const auto& c : rc.partial) {
        state[0] = sbox(state[0] + c);
        internal_linear_layer(state);
    }

    for (const auto& round : rc.ending_full) {
        for (size_t i = 0; i < WIDTH; ++i) {
            state[i] = sbox(state[i] + round[i]);
        }
        external_linear_layer(state);
    }
}

Digest Poseidon2::compress(const Digest& left, const Digest& right) {
    State state;
    for (size_t i = 0; i < DIGEST_LEN; ++i) {
        state[i] = left[i];
        state[DIGEST_LEN + i] = right[i];
    }
    permute(state);
    std::array<BFieldElement, DIGEST_LEN> out;
    std::copy(state.begin(), state.begin() + DIGEST_LEN, out.begin());
    return Digest(out);
}

Digest Poseidon2::hash_varlen(const BFieldElement* input, size_t len) {
    State state{};
    for (size_t offset = 0; offset < len; offset += RATE) {
        size_t chunk = std::min(RATE, len - offset);
        for (size_t i = 0; i < chunk; ++i) {
            state[i] = input[offset + i];
        }
        permute(state);
    }
    std::array<BFieldElement, DIGEST_LEN> out;
    std::copy(state.begin(), state.begin() + DIGEST_LEN, out.begin());
    return Digest(out);
}

Digest Poseidon2::hash_varlen(const std::vector<BFieldElement>& input) {
    return hash_varlen(input.data(), input.size());
}

} // namespace zkrv
