#pragma once

#include "air/air.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include <optional>
#include <vector>

namespace zkrv {

// Bytes per public value slot; REVEAL publishes one slot
constexpr size_t PUBLIC_VALUE_SLOT_BYTES = 4;

/**
 * PublicValuesAir - binds revealed words to the proof's public values
 *
 * Row i stands for slot i (bytes 4i .. 4i + 3). A preprocessed one-hot
 * selector picks the slot's public values, which the row's bytes must
 * equal; the row receives (slot, bytes) on the public values bus once
 * per REVEAL of that slot. Padding rows select nothing and hold zeros.
 *
 * After the value bytes come one revealed flag per slot. A slot revealed
 * in this segment must carry flag 1, and a slot with flag 0 holds zeros.
 *
 * Preprocessed: slot, selector[num_slots]
 * Main: multiplicity, bytes[4]
 */
class PublicValuesAir : public Air {
public:
    explicit PublicValuesAir(size_t num_public_values);

    std::string name() const override { return "PublicValuesAir"; }
    size_t width() const override { return 1 + PUBLIC_VALUE_SLOT_BYTES; }
    size_t num_public_values() const override { return num_value_bytes_ + num_slots(); }
    std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const override;
    void eval(AirBuilder& builder) const override;

    size_t num_value_bytes() const { return num_value_bytes_; }
    size_t num_slots() const { return num_value_bytes_ / PUBLIC_VALUE_SLOT_BYTES; }
    size_t revealed_flag_index(size_t slot) const { return num_value_bytes_ + slot; }

private:
    size_t num_value_bytes_;
};

/**
 * PublicValuesChip - the values REVEAL has published so far
 *
 * A slot may be revealed any number of times but always with the same
 * word. Unrevealed positions read as zero in the proof.
 */
class PublicValuesChip : public Chip {
public:
    explicit PublicValuesChip(size_t num_public_values);

    /**
     * Record a reveal of word bytes at the given byte offset.
     * Throws ExecutionError(PublicValueIndexOutOfBounds) for an offset
     * past the declared values or not slot aligned, and
     * ExecutionError(PublicValueNotEqual) when a slot is revealed twice
     * with different bytes.
     */
    void reveal(uint32_t byte_offset, const std::vector<BFieldElement>& bytes);

    // One entry per public value byte; nullopt where never revealed
    const std::vector<std::optional<BFieldElement>>& values() const { return values_; }
    // Value bytes followed by the per-slot revealed flags
    std::vector<BFieldElement> public_values() const;

    // Start a segment with the values earlier segments revealed
    void seed(const std::vector<std::optional<BFieldElement>>& values);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return air_->num_slots(); }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    std::shared_ptr<PublicValuesAir> air_;
    std::vector<std::optional<BFieldElement>> values_;
    std::vector<uint32_t> multiplicities_;
};

} // namespace zkrv
