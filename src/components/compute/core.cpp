#include <tgpu/components/core.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tgpu {

Core::Core(size_t core_id, Size threads_per_block, unsigned data_bits,
           unsigned program_address_bits, double clock_freq_ghz)
    : core_id_(core_id)
    , threads_per_block_(threads_per_block)
    , program_address_bits_(program_address_bits)
    , state_(State::IDLE)
    , pc_(0)
    , instruction_word_(0)
    , instruction_(isa::Instruction::decode(0))
    , memory_issued_(false)
    , block_id_(0)
    , thread_count_(0)
    , lane_active_(threads_per_block, false)
    , alu_(data_bits)
    , registers_(threads_per_block, RegisterFile(data_bits))
    , lsus_(threads_per_block)
    , tracing_enabled_(false)
    , trace_logger_(&trace::TraceLogger::instance())
    , clock_freq_ghz_(clock_freq_ghz)
    , instruction_start_cycle_(0) {
    if (threads_per_block == 0) {
        throw std::invalid_argument("Core: threads_per_block must be at least 1");
    }
}

void Core::start_block(uint32_t block_id, uint32_t thread_count) {
    if (state_ != State::IDLE) {
        throw std::logic_error("Core " + std::to_string(core_id_) + ": start_block while busy");
    }
    if (thread_count == 0 || thread_count > threads_per_block_) {
        throw std::invalid_argument("Core " + std::to_string(core_id_) + ": invalid block thread count " +
                                    std::to_string(thread_count));
    }

    block_id_ = block_id;
    thread_count_ = thread_count;
    for (Size lane = 0; lane < threads_per_block_; ++lane) {
        lane_active_[lane] = lane < thread_count;
        registers_[lane].assign(block_id, static_cast<uint32_t>(threads_per_block_),
                                static_cast<uint32_t>(lane));
        lsus_[lane].reset();
    }
    fetcher_.reset();
    pc_ = 0;
    memory_issued_ = false;
    state_ = State::FETCHING;
}

void Core::update(Cycle current_cycle, MemoryChannel& program_port, std::vector<MemoryChannel>& data_ports) {
    switch (state_) {
        case State::IDLE:
        case State::DONE:
            return;

        case State::FETCHING:
            if (fetcher_.get_state() == Fetcher::State::IDLE) {
                instruction_start_cycle_ = current_cycle;
                fetcher_.request(pc_, program_port);
                ++stats_.fetches;
            }
            if (fetcher_.update(program_port)) {
                trace_fetch(current_cycle);
                instruction_word_ = fetcher_.take();
                state_ = State::DECODING;
            } else {
                ++stats_.fetch_stall_cycles;
            }
            return;

        case State::DECODING:
            instruction_ = isa::Instruction::decode(instruction_word_);
            memory_issued_ = false;
            state_ = State::EXECUTING;
            return;

        case State::EXECUTING:
            execute(current_cycle, data_ports);
            return;
    }
}

void Core::execute(Cycle current_cycle, std::vector<MemoryChannel>& data_ports) {
    const isa::Instruction& in = instruction_;
    const Address next_pc = pc_ + 1;

    if (in.is_reserved()) {
        ++stats_.reserved_opcodes;
        complete_instruction(current_cycle, next_pc, "reserved opcode executed as NOP");
        return;
    }

    switch (in.opcode) {
        case isa::Opcode::NOP:
            complete_instruction(current_cycle, next_pc);
            break;

        case isa::Opcode::BRNZP:
            execute_branch(current_cycle);
            break;

        case isa::Opcode::CMP:
            for (Size lane = 0; lane < threads_per_block_; ++lane) {
                if (!lane_active_[lane]) continue;
                RegisterFile& regs = registers_[lane];
                regs.set_nzp(ALU::compare(regs.read(in.rs), regs.read(in.rt)));
            }
            complete_instruction(current_cycle, next_pc);
            break;

        case isa::Opcode::ADD:
        case isa::Opcode::SUB:
        case isa::Opcode::MUL:
        case isa::Opcode::DIV:
            for (Size lane = 0; lane < threads_per_block_; ++lane) {
                if (!lane_active_[lane]) continue;
                RegisterFile& regs = registers_[lane];
                regs.write(in.rd, alu_.execute(in.opcode, regs.read(in.rs), regs.read(in.rt)));
            }
            complete_instruction(current_cycle, next_pc);
            break;

        case isa::Opcode::CONST:
            for (Size lane = 0; lane < threads_per_block_; ++lane) {
                if (!lane_active_[lane]) continue;
                registers_[lane].write(in.rd, alu_.constant(in.immediate));
            }
            complete_instruction(current_cycle, next_pc);
            break;

        case isa::Opcode::LDR:
        case isa::Opcode::STR:
            if (!execute_memory(data_ports)) {
                ++stats_.memory_stall_cycles;
                return;
            }
            complete_instruction(current_cycle, next_pc);
            break;

        case isa::Opcode::RET:
            complete_instruction(current_cycle, pc_, "block " + std::to_string(block_id_) + " retired");
            for (Size lane = 0; lane < threads_per_block_; ++lane) {
                lane_active_[lane] = false;
            }
            ++stats_.blocks_completed;
            state_ = State::DONE;
            break;
    }
}

bool Core::execute_memory(std::vector<MemoryChannel>& data_ports) {
    const isa::Instruction& in = instruction_;
    const bool is_load = in.opcode == isa::Opcode::LDR;

    if (!memory_issued_) {
        for (Size lane = 0; lane < threads_per_block_; ++lane) {
            if (!lane_active_[lane]) continue;
            MemoryChannel& port = data_ports.at(lane_port(lane));
            const RegisterFile& regs = registers_[lane];
            if (is_load) {
                lsus_[lane].issue_load(regs.read(in.rs), port);
                ++stats_.loads;
            } else {
                lsus_[lane].issue_store(regs.read(in.rs), regs.read(in.rt), port);
                ++stats_.stores;
            }
        }
        memory_issued_ = true;
    }

    bool all_done = true;
    for (Size lane = 0; lane < threads_per_block_; ++lane) {
        if (!lane_active_[lane]) continue;
        lsus_[lane].update(data_ports.at(lane_port(lane)));
        if (!lsus_[lane].is_done()) all_done = false;
    }
    if (!all_done) return false;

    for (Size lane = 0; lane < threads_per_block_; ++lane) {
        if (!lane_active_[lane]) continue;
        if (is_load) {
            registers_[lane].write(in.rd, lsus_[lane].get_loaded_value());
        }
        lsus_[lane].acknowledge();
    }
    memory_issued_ = false;
    return true;
}

void Core::execute_branch(Cycle current_cycle) {
    const isa::Instruction& in = instruction_;

    bool leader_found = false;
    bool leader_taken = false;
    bool divergent = false;
    for (Size lane = 0; lane < threads_per_block_; ++lane) {
        if (!lane_active_[lane]) continue;
        bool taken = (registers_[lane].get_nzp() & in.nzp) != 0;
        if (!leader_found) {
            leader_found = true;
            leader_taken = taken;
        } else if (taken != leader_taken) {
            divergent = true;
        }
    }

    const Address next_pc = leader_taken ? Address{in.immediate} : pc_ + 1;
    if (divergent) {
        ++stats_.divergent_branches;
        complete_instruction(current_cycle, next_pc, "divergent branch, following the lowest active lane");
    } else {
        complete_instruction(current_cycle, next_pc);
    }
}

void Core::trace_fetch(Cycle current_cycle) {
    if (!tracing_enabled_ || !trace_logger_ || !fetcher_.has_instruction()) return;

    trace::TraceEntry entry(
        instruction_start_cycle_,
        trace::ComponentType::FETCHER,
        static_cast<uint32_t>(core_id_),
        trace::TransactionType::FETCH,
        trace_logger_->next_transaction_id()
    );
    entry.clock_freq_ghz = clock_freq_ghz_;
    entry.complete(current_cycle, trace::TransactionStatus::COMPLETED);

    trace::InstructionPayload payload;
    payload.pc = fetcher_.get_pc();
    payload.word = fetcher_.get_instruction();
    payload.mnemonic = isa::disassemble(payload.word);
    payload.active_lanes = static_cast<uint32_t>(get_active_lane_count());
    entry.payload = payload;
    entry.description = "Block " + std::to_string(block_id_) + " fetched pc " + std::to_string(payload.pc);

    trace_logger_->log(std::move(entry));
}

void Core::complete_instruction(Cycle current_cycle, Address next_pc, const std::string& note) {
    const Size active = get_active_lane_count();
    ++stats_.instructions_issued;
    stats_.lane_instructions += active;

    if (tracing_enabled_ && trace_logger_) {
        trace::TraceEntry entry(
            instruction_start_cycle_,
            trace::ComponentType::CORE,
            static_cast<uint32_t>(core_id_),
            trace::TransactionType::EXECUTE,
            trace_logger_->next_transaction_id()
        );
        entry.clock_freq_ghz = clock_freq_ghz_;
        entry.complete(current_cycle, trace::TransactionStatus::COMPLETED);

        trace::InstructionPayload payload;
        payload.pc = pc_;
        payload.word = instruction_word_;
        payload.mnemonic = isa::disassemble(instruction_word_);
        payload.active_lanes = static_cast<uint32_t>(active);
        entry.payload = payload;

        entry.description = "Block " + std::to_string(block_id_) + " pc " + std::to_string(pc_) +
                            ": " + payload.mnemonic;
        if (!note.empty()) entry.description += " (" + note + ")";

        trace_logger_->log(std::move(entry));
    }

    pc_ = next_pc & width_mask(program_address_bits_);
    state_ = State::FETCHING;
}

void Core::release() {
    if (state_ != State::DONE) {
        throw std::logic_error("Core " + std::to_string(core_id_) + ": release before the block finished");
    }
    state_ = State::IDLE;
}

Size Core::get_active_lane_count() const {
    Size count = 0;
    for (bool active : lane_active_) {
        if (active) ++count;
    }
    return count;
}

void Core::reset() {
    state_ = State::IDLE;
    pc_ = 0;
    instruction_word_ = 0;
    instruction_ = isa::Instruction::decode(0);
    memory_issued_ = false;
    block_id_ = 0;
    thread_count_ = 0;
    std::fill(lane_active_.begin(), lane_active_.end(), false);
    for (auto& regs : registers_) regs.reset();
    for (auto& lsu : lsus_) lsu.reset();
    fetcher_.reset();
    stats_ = Statistics{};
}

const char* to_string(Core::State state) {
    switch (state) {
        case Core::State::IDLE: return "IDLE";
        case Core::State::FETCHING: return "FETCHING";
        case Core::State::DECODING: return "DECODING";
        case Core::State::EXECUTING: return "EXECUTING";
        case Core::State::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

} // namespace tgpu
