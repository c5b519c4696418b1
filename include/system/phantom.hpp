#pragma once

#include "chacha12_rng.hpp"
#include "memory/memory_controller.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include "vm/opcode.hpp"
#include "vm/vm_state.hpp"
#include <map>
#include <memory>
#include <vector>

namespace zkrv {

/**
 * PhantomSubExecutor - host-side action of one phantom discriminant
 *
 * Runs against the memory without recording accesses; it may only read
 * memory and change the streams.
 */
class PhantomSubExecutor {
public:
    virtual ~PhantomSubExecutor() = default;

    /**
     * a, b are instruction operands, c_upper the high 16 bits of c.
     * Errors are ExecutionError.
     */
    virtual void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                                 uint32_t a, uint32_t b, uint32_t c_upper) = 0;
};

/**
 * PhantomAir - rows of executed PHANTOM instructions
 *
 * Columns: is_valid, pc, timestamp, a, b, c
 *
 * Only the program lookup and the pc step are constrained; the host
 * action leaves no trace.
 */
class PhantomAir : public Air {
public:
    static constexpr size_t WIDTH = 6;

    std::string name() const override { return "PhantomAir"; }
    size_t width() const override { return WIDTH; }
    void eval(AirBuilder& builder) const override;
};

/**
 * PhantomChip - dispatches PHANTOM by the low 16 bits of operand c
 */
class PhantomChip : public Chip, public InstructionExecutor {
public:
    explicit PhantomChip(std::shared_ptr<Streams> streams);

    // Replaces any sub-executor registered for the discriminant
    void add_sub_executor(PhantomDiscriminant discriminant, std::shared_ptr<PhantomSubExecutor> executor);

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override;
    std::string get_opcode_name(uint32_t /*opcode*/) const override { return "PHANTOM"; }

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size(); }
    size_t trace_width() const override { return PhantomAir::WIDTH; }
    AirProofInput generate_air_proof_input() override;

private:
    struct Record {
        ExecutionState from_state;
        BFieldElement a;
        BFieldElement b;
        BFieldElement c;
    };

    std::shared_ptr<PhantomAir> air_;
    std::shared_ptr<Streams> streams_;
    std::map<uint16_t, std::shared_ptr<PhantomSubExecutor>> sub_executors_;
    std::vector<Record> records_;
};

// Sub-executors of the system discriminants
class NopPhantomExecutor : public PhantomSubExecutor {
public:
    void phantom_execute(const MemoryController&, Streams&, PhantomDiscriminant, uint32_t, uint32_t,
                         uint32_t) override {}
};

class DebugPanicPhantomExecutor : public PhantomSubExecutor {
public:
    void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                         uint32_t a, uint32_t b, uint32_t c_upper) override;
};

/**
 * Cycle tracker: CtStart pushes the current timestamp, CtEnd pops it
 * and reports the elapsed timestamp under the profile channel.
 */
class CycleTrackerPhantomExecutor : public PhantomSubExecutor {
public:
    void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                         uint32_t a, uint32_t b, uint32_t c_upper) override;

private:
    std::vector<uint32_t> starts_;
};

// a: register holding the heap address, b: register holding the length
class PrintStrPhantomExecutor : public PhantomSubExecutor {
public:
    void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                         uint32_t a, uint32_t b, uint32_t c_upper) override;
};

// Replaces the hint stream with the next input frame
class HintInputPhantomExecutor : public PhantomSubExecutor {
public:
    void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                         uint32_t a, uint32_t b, uint32_t c_upper) override;
};

// a: register holding the number of words; fills the hint stream with random bytes
class HintRandomPhantomExecutor : public PhantomSubExecutor {
public:
    explicit HintRandomPhantomExecutor(uint64_t seed = 0) : rng_(ChaCha12Rng::seed_from_u64(seed)) {}

    void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                         uint32_t a, uint32_t b, uint32_t c_upper) override;

private:
    ChaCha12Rng rng_;
};

// a: register holding the key address, b: register holding the key length
class HintLoadByKeyPhantomExecutor : public PhantomSubExecutor {
public:
    void phantom_execute(const MemoryController& memory, Streams& streams, PhantomDiscriminant discriminant,
                         uint32_t a, uint32_t b, uint32_t c_upper) override;
};

/**
 * Frame a byte string for HINT_STOREW: 4-byte little-endian length,
 * then the bytes, zero padded to a multiple of 4.
 */
std::vector<BFieldElement> hint_frame(const std::vector<uint8_t>& bytes);

} // namespace zkrv
