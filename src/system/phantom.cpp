#include "system/phantom.hpp"
#include "common/debug_control.hpp"
#include "vm/execution_error.hpp"
#include "vm/program.hpp"
#include <string>

namespace zkrv {

namespace {

uint32_t read_register(const MemoryController& memory, uint32_t pointer) {
    const Block data = memory.unsafe_read(address_space::REGISTER, pointer);
    uint32_t value = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        value |= static_cast<uint32_t>(data[i].value() & 0xFF) << (8 * i);
    }
    return value;
}

std::vector<uint8_t> read_heap_bytes(const MemoryController& memory, uint32_t pointer, uint32_t len) {
    const uint64_t limit = uint64_t{1} << memory.config().pointer_max_bits;
    if (uint64_t{pointer} + len > limit) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "heap range [" + std::to_string(pointer) + ", +" + std::to_string(len) +
                                 ") out of bounds");
    }
    std::vector<uint8_t> bytes(len);
    for (uint32_t i = 0; i < len; ++i) {
        bytes[i] = static_cast<uint8_t>(memory.unsafe_read_cell(address_space::HEAP, pointer + i).value());
    }
    return bytes;
}

} // namespace

std::vector<BFieldElement> hint_frame(const std::vector<uint8_t>& bytes) {
    std::vector<BFieldElement> out;
    const uint32_t len = static_cast<uint32_t>(bytes.size());
    for (size_t i = 0; i < 4; ++i) {
        out.emplace_back(uint64_t{(len >> (8 * i)) & 0xFF});
    }
    for (uint8_t byte : bytes) {
        out.emplace_back(uint64_t{byte});
    }
    while (out.size() % 4 != 0) {
        out.push_back(BFieldElement::zero());
    }
    return out;
}

// ============================================================================
// PhantomAir / PhantomChip
// ============================================================================

void PhantomAir::eval(AirBuilder& builder) const {
    auto main = builder.main();
    const Expr is_valid = main.local(0);
    const Expr pc = main.local(1);
    const Expr ts = main.local(2);

    builder.assert_bool(is_valid);
    ProgramBus::lookup(builder, is_valid, pc, Expr::from_u64(opcode(SystemOpcode::PHANTOM)),
                       {main.local(3), main.local(4), main.local(5)});
    ExecutionBridge::execute(builder, is_valid, pc, ts, pc + static_cast<int64_t>(DEFAULT_PC_STEP), ts);
}

PhantomChip::PhantomChip(std::shared_ptr<Streams> streams)
    : air_(std::make_shared<PhantomAir>()), streams_(std::move(streams)) {
    auto cycle_tracker = std::make_shared<CycleTrackerPhantomExecutor>();
    add_sub_executor(PhantomDiscriminant::Nop, std::make_shared<NopPhantomExecutor>());
    add_sub_executor(PhantomDiscriminant::DebugPanic, std::make_shared<DebugPanicPhantomExecutor>());
    add_sub_executor(PhantomDiscriminant::CtStart, cycle_tracker);
    add_sub_executor(PhantomDiscriminant::CtEnd, cycle_tracker);
    add_sub_executor(PhantomDiscriminant::PrintStr, std::make_shared<PrintStrPhantomExecutor>());
    add_sub_executor(PhantomDiscriminant::HintInput, std::make_shared<HintInputPhantomExecutor>());
    add_sub_executor(PhantomDiscriminant::HintRandom, std::make_shared<HintRandomPhantomExecutor>());
    add_sub_executor(PhantomDiscriminant::HintLoadByKey, std::make_shared<HintLoadByKeyPhantomExecutor>());
}

void PhantomChip::add_sub_executor(PhantomDiscriminant discriminant, std::shared_ptr<PhantomSubExecutor> executor) {
    sub_executors_[static_cast<uint16_t>(discriminant)] = std::move(executor);
}

ExecutionState PhantomChip::execute(MemoryController& memory, const Instruction& instruction,
                                    ExecutionState from_state) {
    const uint32_t c = static_cast<uint32_t>(instruction.c.value());
    const uint16_t discriminant = static_cast<uint16_t>(c & 0xFFFF);
    auto it = sub_executors_.find(discriminant);
    if (it == sub_executors_.end()) {
        throw ExecutionError(ExecutionErrorKind::InvalidPhantomInstruction, 0,
                             "no phantom sub-executor for discriminant " + std::to_string(discriminant));
    }
    ZKRV_DEBUG_PRINT("[phantom] %s at pc 0x%x\n",
                     phantom_name(static_cast<PhantomDiscriminant>(discriminant)).c_str(), from_state.pc);
    it->second->phantom_execute(memory, *streams_, static_cast<PhantomDiscriminant>(discriminant),
                                static_cast<uint32_t>(instruction.a.value()),
                                static_cast<uint32_t>(instruction.b.value()), c >> 16);
    records_.push_back(Record{from_state, instruction.a, instruction.b, instruction.c});
    return ExecutionState(from_state.pc + DEFAULT_PC_STEP, from_state.timestamp);
}

AirProofInput PhantomChip::generate_air_proof_input() {
    RowMajorMatrix<BFieldElement> trace(PhantomAir::WIDTH, padded_height(records_.size()));
    for (size_t i = 0; i < records_.size(); ++i) {
        BFieldElement* row = trace.row_mut(i);
        row[0] = BFieldElement::one();
        row[1] = BFieldElement(records_[i].from_state.pc);
        row[2] = BFieldElement(records_[i].from_state.timestamp);
        row[3] = records_[i].a;
        row[4] = records_[i].b;
        row[5] = records_[i].c;
    }
    records_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

// ============================================================================
// Sub-executors
// ============================================================================

void DebugPanicPhantomExecutor::phantom_execute(const MemoryController&, Streams&, PhantomDiscriminant, uint32_t,
                                                uint32_t, uint32_t) {
    throw ExecutionError(ExecutionErrorKind::Fail, 0, "DebugPanic");
}

void CycleTrackerPhantomExecutor::phantom_execute(const MemoryController& memory, Streams&,
                                                  PhantomDiscriminant discriminant, uint32_t, uint32_t,
                                                  uint32_t c_upper) {
    if (discriminant == PhantomDiscriminant::CtStart) {
        starts_.push_back(memory.timestamp());
        return;
    }
    if (starts_.empty()) {
        throw ExecutionError(ExecutionErrorKind::InvalidPhantomInstruction, 0, "CtEnd without CtStart");
    }
    const uint32_t start = starts_.back();
    starts_.pop_back();
    ZKRV_PROFILE_PRINT("[cycle tracker] span %u: %u timestamp units\n", c_upper, memory.timestamp() - start);
}

void PrintStrPhantomExecutor::phantom_execute(const MemoryController& memory, Streams&, PhantomDiscriminant,
                                              uint32_t a, uint32_t b, uint32_t) {
    const uint32_t pointer = read_register(memory, a);
    const uint32_t len = read_register(memory, b);
    const std::vector<uint8_t> bytes = read_heap_bytes(memory, pointer, len);
    const std::string text(bytes.begin(), bytes.end());
    ZKRV_DEBUG_PRINT("%s", text.c_str());
}

void HintInputPhantomExecutor::phantom_execute(const MemoryController&, Streams& streams, PhantomDiscriminant,
                                               uint32_t, uint32_t, uint32_t) {
    if (streams.input_frames.empty()) {
        throw ExecutionError(ExecutionErrorKind::InputExhausted, 0, "no input frame left");
    }
    const std::vector<BFieldElement> frame = hint_frame(streams.input_frames.front());
    streams.input_frames.pop_front();
    streams.hint_stream.assign(frame.begin(), frame.end());
}

void HintRandomPhantomExecutor::phantom_execute(const MemoryController& memory, Streams& streams,
                                                PhantomDiscriminant, uint32_t a, uint32_t, uint32_t) {
    const uint32_t num_words = read_register(memory, a);
    if (num_words > (uint32_t{1} << 20)) {
        throw ExecutionError(ExecutionErrorKind::HintOutOfBounds, 0,
                             "HintRandom of " + std::to_string(num_words) + " words");
    }
    std::vector<uint8_t> bytes(size_t{num_words} * 4);
    rng_.fill_bytes(bytes.data(), bytes.size());
    streams.hint_stream.clear();
    for (uint8_t byte : bytes) {
        streams.hint_stream.emplace_back(uint64_t{byte});
    }
}

void HintLoadByKeyPhantomExecutor::phantom_execute(const MemoryController& memory, Streams& streams,
                                                   PhantomDiscriminant, uint32_t a, uint32_t b, uint32_t) {
    const uint32_t pointer = read_register(memory, a);
    const uint32_t len = read_register(memory, b);
    const std::vector<uint8_t> key = read_heap_bytes(memory, pointer, len);
    auto it = streams.kv_store.find(key);
    if (it == streams.kv_store.end()) {
        throw ExecutionError(ExecutionErrorKind::HintOutOfBounds, 0,
                             "no hint stored under a key of " + std::to_string(len) + " bytes");
    }
    const std::vector<BFieldElement> frame = hint_frame(it->second);
    streams.hint_stream.assign(frame.begin(), frame.end());
}

} // namespace zkrv
