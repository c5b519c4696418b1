#include "system/poseidon2_periphery.hpp"
#include <algorithm>

namespace zkrv {

void Poseidon2PeripheryAir::eval(AirBuilder& builder) const {
    auto main = builder.main();
    std::vector<Expr> cols = main.local_row();
    std::vector<Expr> output = Poseidon2SubAir::eval(builder, cols);

    std::vector<Expr> input(cols.begin(), cols.begin() + Poseidon2::WIDTH);

    std::vector<Expr> compress_fields = input;
    compress_fields.insert(compress_fields.end(), output.begin(), output.begin() + Digest::LEN);
    builder.push_receive(bus::POSEIDON2_DIRECT, std::move(compress_fields), main.local(MULT_COMPRESS));

    std::vector<Expr> permute_fields = input;
    permute_fields.insert(permute_fields.end(), output.begin(), output.end());
    builder.push_receive(bus::POSEIDON2_PERMUTE, std::move(permute_fields), main.local(MULT_PERMUTE));
}

Poseidon2PeripheryChip::Poseidon2PeripheryChip() : air_(std::make_shared<Poseidon2PeripheryAir>()) {}

Digest Poseidon2PeripheryChip::compress(const Digest& left, const Digest& right) {
    Poseidon2::State state;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        state[i] = left[i];
        state[Digest::LEN + i] = right[i];
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[state].compress += 1;
    }
    Poseidon2::permute(state);
    std::array<BFieldElement, Digest::LEN> out;
    std::copy(state.begin(), state.begin() + Digest::LEN, out.begin());
    return Digest(out);
}

Poseidon2::State Poseidon2PeripheryChip::permute(const Poseidon2::State& input) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[input].permute += 1;
    }
    Poseidon2::State state = input;
    Poseidon2::permute(state);
    return state;
}

size_t Poseidon2PeripheryChip::current_trace_height() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

AirProofInput Poseidon2PeripheryChip::generate_air_proof_input() {
    std::vector<std::pair<Poseidon2::State, Counts>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.assign(records_.begin(), records_.end());
        records_.clear();
    }
    const size_t height = padded_height(records.size());
    RowMajorMatrix<BFieldElement> trace(Poseidon2PeripheryAir::WIDTH, height);

#pragma omp parallel for schedule(static)
    for (size_t r = 0; r < height; ++r) {
        BFieldElement* row = trace.row_mut(r);
        if (r < records.size()) {
            Poseidon2SubAir::generate_row(records[r].first, row);
            row[Poseidon2PeripheryAir::MULT_COMPRESS] = BFieldElement(records[r].second.compress);
            row[Poseidon2PeripheryAir::MULT_PERMUTE] = BFieldElement(records[r].second.permute);
        } else {
            // Padding rows permute the zero state with zero multiplicity
            Poseidon2SubAir::generate_row(Poseidon2::State{}, row);
        }
    }

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

} // namespace zkrv
