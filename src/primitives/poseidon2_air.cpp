#include "primitives/poseidon2_air.hpp"
#include <array>

namespace zkrv {

namespace {

template <typename T>
void m4(T* x) {
    T t01 = x[0] + x[1];
    T t23 = x[2] + x[3];
    T t0123 = t01 + t23;
    T t01123 = t0123 + x[1];
    T t01233 = t0123 + x[3];
    T y3 = t01233 + x[0] + x[0];
    T y1 = t01123 + x[2] + x[2];
    T y0 = t01123 + t01;
    T y2 = t01233 + t23;
    x[0] = y0;
    x[1] = y1;
    x[2] = y2;
    x[3] = y3;
}

template <typename T>
void external_layer(std::vector<T>& state) {
    for (size_t i = 0; i < Poseidon2::WIDTH; i += 4) {
        m4(&state[i]);
    }
    std::array<T, 4> sums{state[0], state[1], state[2], state[3]};
    for (size_t i = 4; i < Poseidon2::WIDTH; ++i) {
        sums[i % 4] = sums[i % 4] + state[i];
    }
    for (size_t i = 0; i < Poseidon2::WIDTH; ++i) {
        state[i] = state[i] + sums[i % 4];
    }
}

template <typename T>
void internal_layer(std::vector<T>& state) {
    const auto& diag = Poseidon2::internal_diagonal();
    T sum = state[0];
    for (size_t i = 1; i < Poseidon2::WIDTH; ++i) {
        sum = sum + state[i];
    }
    for (size_t i = 0; i < Poseidon2::WIDTH; ++i) {
        state[i] = state[i] * diag[i] + sum;
    }
}

} // namespace

std::vector<Expr> Poseidon2SubAir::eval(AirBuilder& builder, const std::vector<Expr>& cols) {
    const auto& rc = Poseidon2::round_constants();
    std::vector<Expr> state(cols.begin(), cols.begin() + STATE_WIDTH);
    size_t offset = STATE_WIDTH;

    external_layer(state);

    auto full_round = [&](const Poseidon2::State& constants) {
        std::vector<Expr> sboxed(STATE_WIDTH);
        for (size_t i = 0; i < STATE_WIDTH; ++i) {
            Expr x = state[i] + Expr(constants[i]);
            const Expr& x3 = cols[offset + i];
            builder.assert_eq(x3, x * x * x);
            sboxed[i] = x3 * x3 * x;
        }
        external_layer(sboxed);
        for (size_t i = 0; i < STATE_WIDTH; ++i) {
            const Expr& post = cols[offset + STATE_WIDTH + i];
            builder.assert_eq(post, sboxed[i]);
            state[i] = post;
        }
        offset += FULL_ROUND_WIDTH;
    };

    for (const auto& round : rc.beginning_full) {
        full_round(round);
    }
    for (const auto& c : rc.partial) {
        Expr x = state[0] + Expr(c);
        const Expr& x3 = cols[offset];
        const Expr& post = cols[offset + 1];
        builder.assert_eq(x3, x * x * x);
        builder.assert_eq(post, x3 * x3 * x);
        state[0] = post;
        internal_layer(state);
        offset += PARTIAL_ROUND_WIDTH;
    }
    for (const auto& round : rc.ending_full) {
        full_round(round);
    }
    return state;
}

void Poseidon2SubAir::generate_row(const Poseidon2::State& input, BFieldElement* row) {
    const auto& rc = Poseidon2::round_constants();
    std::vector<BFieldElement> state(input.begin(), input.end());
    for (size_t i = 0; i < STATE_WIDTH; ++i) {
        row[i] = input[i];
    }
    size_t offset = STATE_WIDTH;

    external_layer(state);

    auto full_round = [&](const Poseidon2::State& constants) {
        for (size_t i = 0; i < STATE_WIDTH; ++i) {
            BFieldElement x = state[i] + constants[i];
            BFieldElement x3 = x * x * x;
            row[offset + i] = x3;
            state[i] = x3 * x3 * x;
        }
        external_layer(state);
        for (size_t i = 0; i < STATE_WIDTH; ++i) {
            row[offset + STATE_WIDTH + i] = state[i];
        }
        offset += FULL_ROUND_WIDTH;
    };

    for (const auto& round : rc.beginning_full) {
        full_round(round);
    }
    for (const auto& c : rc.partial) {
        BFieldElement x = state[0] + c;
        BFieldElement x3 = x * x * x;
        row[offset] = x3;
        state[0] = x3 * x3 * x;
        row[offset + 1] = state[0];
        internal_layer(state);
        offset += PARTIAL_ROUND_WIDTH;
    }
    for (const auto& round : rc.ending_full) {
        full_round(round);
    }
}

} // namespace zkrv
