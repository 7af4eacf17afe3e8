#include <tgpu/gpu_simulator.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tgpu {

std::vector<std::string> GPUSimulator::Config::validation_errors() const {
    std::vector<std::string> errors;

    if (core_count == 0) errors.push_back("core_count must be at least 1");
    if (threads_per_block == 0 || threads_per_block > MAX_THREADS_PER_BLOCK)
        errors.push_back("threads_per_block must be in 1.." + std::to_string(MAX_THREADS_PER_BLOCK));

    if (data_memory_address_bits == 0 || data_memory_address_bits > 16)
        errors.push_back("data_memory.address_bits must be in 1..16");
    if (data_memory_data_bits == 0 || data_memory_data_bits > 16)
        errors.push_back("data_memory.data_bits must be in 1..16");
    if (data_memory_channels == 0) errors.push_back("data_memory.channels must be at least 1");
    if (data_memory_latency_cycles == 0) errors.push_back("data_memory.latency_cycles must be at least 1");

    if (program_memory_address_bits == 0 || program_memory_address_bits > 16)
        errors.push_back("program_memory.address_bits must be in 1..16");
    if (program_memory_data_bits != isa::INSTRUCTION_BITS)
        errors.push_back("program_memory.data_bits must be " + std::to_string(isa::INSTRUCTION_BITS));
    if (program_memory_channels == 0) errors.push_back("program_memory.channels must be at least 1");
    if (program_memory_latency_cycles == 0) errors.push_back("program_memory.latency_cycles must be at least 1");

    if (!(clock_freq_ghz > 0.0)) errors.push_back("clock.frequency_ghz must be positive");

    return errors;
}

const GPUSimulator::Config& GPUSimulator::validated(const Config& config) {
    auto errors = config.validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Invalid GPU configuration:";
        for (const auto& e : errors) oss << "\n  " << e;
        throw std::invalid_argument(oss.str());
    }
    return config;
}

GPUSimulator::GPUSimulator(const Config& config)
    : config_(validated(config))
    , program_memory_(config_.program_memory_address_bits, config_.program_memory_data_bits,
                      config_.program_memory_channels, config_.program_memory_latency_cycles, false)
    , data_memory_(config_.data_memory_address_bits, config_.data_memory_data_bits,
                   config_.data_memory_channels, config_.data_memory_latency_cycles, true)
    , program_controller_(trace::ComponentType::PROGRAM_MEMORY_CONTROLLER, config_.core_count,
                          config_.program_memory_channels, false, 0, config_.clock_freq_ghz)
    , data_controller_(trace::ComponentType::DATA_MEMORY_CONTROLLER,
                       config_.core_count * config_.threads_per_block,
                       config_.data_memory_channels, true, 0, config_.clock_freq_ghz)
    , dispatcher_(config_.core_count, config_.threads_per_block, config_.clock_freq_ghz)
    , current_cycle_(0)
    , launch_start_cycle_(0)
    , launch_cycles_(0)
    , sim_start_time_(std::chrono::high_resolution_clock::now())
    , tracing_enabled_(false)
    , trace_logger_(&trace::TraceLogger::instance()) {
    cores_.reserve(config_.core_count);
    for (size_t i = 0; i < config_.core_count; ++i) {
        cores_.emplace_back(i, config_.threads_per_block, config_.data_memory_data_bits,
                            config_.program_memory_address_bits, config_.clock_freq_ghz);
    }
}

void GPUSimulator::reset() {
    dispatcher_.set_current_cycle(current_cycle_);
    dispatcher_.reset();
    for (auto& core : cores_) core.reset();
    program_controller_.reset();
    data_controller_.reset();
    program_memory_.reset();
    data_memory_.reset();
    launch_start_cycle_ = current_cycle_;
    launch_cycles_ = 0;

    if (tracing_enabled_ && trace_logger_) {
        trace::TraceEntry entry(current_cycle_, trace::ComponentType::DEVICE_CONTROL, 0,
                                trace::TransactionType::RESET, trace_logger_->next_transaction_id());
        entry.clock_freq_ghz = config_.clock_freq_ghz;
        entry.complete(current_cycle_, trace::TransactionStatus::COMPLETED);
        entry.description = "Device reset";
        trace_logger_->log(std::move(entry));
    }
}

bool GPUSimulator::write_device_control_register(uint8_t thread_count) {
    dispatcher_.set_current_cycle(current_cycle_);
    return dispatcher_.configure(thread_count);
}

bool GPUSimulator::start() {
    dispatcher_.set_current_cycle(current_cycle_);
    if (!dispatcher_.launch()) return false;
    launch_start_cycle_ = current_cycle_;
    launch_cycles_ = 0;
    return true;
}

void GPUSimulator::step() {
    ++current_cycle_;

    const bool was_active = dispatcher_.is_active();
    dispatcher_.poll(current_cycle_, cores_);

    for (size_t i = 0; i < cores_.size(); ++i) {
        cores_[i].update(current_cycle_, program_controller_.consumer_port(i),
                         data_controller_.consumer_ports());
    }

    program_controller_.update(current_cycle_, program_memory_.channels());
    data_controller_.update(current_cycle_, data_memory_.channels());

    program_memory_.update(current_cycle_);
    data_memory_.update(current_cycle_);

    if (was_active && dispatcher_.is_done()) {
        launch_cycles_ = current_cycle_ - launch_start_cycle_;
    }
}

bool GPUSimulator::run_until_done(Cycle max_cycles) {
    if (!dispatcher_.is_active()) {
        return dispatcher_.is_done();
    }
    for (Cycle elapsed = 0; elapsed < max_cycles; ++elapsed) {
        step();
        if (dispatcher_.is_done()) return true;
    }
    return false;
}

bool GPUSimulator::launch(uint8_t thread_count, Cycle max_cycles) {
    if (!write_device_control_register(thread_count)) return false;
    if (!start()) return false;
    return run_until_done(max_cycles);
}

void GPUSimulator::load_program(const std::vector<Word>& words) {
    if (dispatcher_.is_active()) {
        throw std::logic_error("GPUSimulator: cannot load a program while a launch is active");
    }
    if (words.size() > program_memory_.get_capacity()) {
        throw std::out_of_range("GPUSimulator: program of " + std::to_string(words.size()) +
                                " words exceeds program memory capacity " +
                                std::to_string(program_memory_.get_capacity()));
    }
    program_memory_.load(0, words);
}

void GPUSimulator::load_program(const isa::Program& program) {
    load_program(program.words);
}

GPUSimulator::Statistics GPUSimulator::get_stats() const {
    Statistics stats;
    stats.total_cycles = current_cycle_;
    stats.launch_cycles = dispatcher_.is_active() ? current_cycle_ - launch_start_cycle_ : launch_cycles_;

    for (const auto& core : cores_) {
        const auto& cs = core.get_stats();
        stats.instructions_issued += cs.instructions_issued;
        stats.lane_instructions += cs.lane_instructions;
        stats.fetches += cs.fetches;
        stats.loads += cs.loads;
        stats.stores += cs.stores;
        stats.divergent_branches += cs.divergent_branches;
        stats.reserved_opcodes += cs.reserved_opcodes;
        stats.core_fetch_stall_cycles.push_back(cs.fetch_stall_cycles);
        stats.core_memory_stall_cycles.push_back(cs.memory_stall_cycles);
    }

    stats.blocks_retired = dispatcher_.get_stats().blocks_retired;
    stats.rejected_control_operations = dispatcher_.get_stats().rejected_operations;
    stats.data_reads = data_controller_.get_stats().reads_completed;
    stats.data_writes = data_controller_.get_stats().writes_completed;
    stats.program_reads = program_controller_.get_stats().reads_completed;
    return stats;
}

double GPUSimulator::get_elapsed_time_ms() const {
    auto now = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - sim_start_time_);
    return duration.count() / 1000.0;
}

void GPUSimulator::print_stats() const {
    const Statistics stats = get_stats();

    std::cout << "=== TGPU Simulator Statistics ===" << std::endl;
    std::cout << "Simulation cycles: " << stats.total_cycles << std::endl;
    std::cout << "Last launch cycles: " << stats.launch_cycles << std::endl;
    std::cout << "Wall-clock time: " << get_elapsed_time_ms() << " ms" << std::endl;
    std::cout << "Cores: " << cores_.size() << " x " << config_.threads_per_block << " lanes" << std::endl;
    std::cout << "Blocks retired: " << stats.blocks_retired << std::endl;
    std::cout << "Instructions issued: " << stats.instructions_issued
              << " (" << stats.lane_instructions << " lane-instructions)" << std::endl;
    if (stats.launch_cycles > 0) {
        std::cout << "IPC (lane-instructions/cycle): " << std::fixed << std::setprecision(3)
                  << static_cast<double>(stats.lane_instructions) / static_cast<double>(stats.launch_cycles)
                  << std::defaultfloat << std::endl;
    }
    std::cout << "Program fetches: " << stats.fetches << std::endl;
    std::cout << "Loads: " << stats.loads << ", Stores: " << stats.stores << std::endl;
    std::cout << "Divergent branches: " << stats.divergent_branches << std::endl;
    std::cout << "Reserved opcodes: " << stats.reserved_opcodes << std::endl;
    std::cout << "Rejected control operations: " << stats.rejected_control_operations << std::endl;
    for (size_t i = 0; i < cores_.size(); ++i) {
        std::cout << "  Core[" << i << "] stalls: fetch " << stats.core_fetch_stall_cycles[i]
                  << ", memory " << stats.core_memory_stall_cycles[i] << std::endl;
    }
}

void GPUSimulator::print_component_status() const {
    std::cout << "=== Component Status ===" << std::endl;

    std::cout << "Dispatcher: " << (dispatcher_.is_active() ? "Active" : "Inactive")
              << ", Done: " << (dispatcher_.is_done() ? "Yes" : "No")
              << ", Blocks: " << dispatcher_.get_blocks_retired() << "/" << dispatcher_.get_block_count()
              << " retired" << std::endl;

    std::cout << "Cores:" << std::endl;
    for (size_t i = 0; i < cores_.size(); ++i) {
        const auto& core = cores_[i];
        std::cout << "  Core[" << i << "]: " << to_string(core.get_state());
        if (!core.is_idle()) {
            std::cout << ", Block " << core.get_block_id() << ", PC " << core.get_pc()
                      << ", Active lanes " << core.get_active_lane_count();
        }
        std::cout << std::endl;
    }

    auto print_controller = [](const char* name, const MemoryController& mc) {
        std::cout << name << ": " << mc.get_channel_count() << " channels, "
                  << mc.get_pending_requests() << " pending" << std::endl;
        for (size_t ch = 0; ch < mc.get_channel_count(); ++ch) {
            std::cout << "  Channel[" << ch << "]: " << to_string(mc.get_channel_state(ch));
            if (auto owner = mc.get_channel_owner(ch)) {
                std::cout << " (consumer " << *owner << ")";
            }
            std::cout << std::endl;
        }
    };
    print_controller("Program Memory Controller", program_controller_);
    print_controller("Data Memory Controller", data_controller_);

    std::cout << "Program Memory: " << program_memory_.get_capacity() << " words, Ready: "
              << (program_memory_.is_ready() ? "Yes" : "No") << std::endl;
    std::cout << "Data Memory: " << data_memory_.get_capacity() << " words, Ready: "
              << (data_memory_.is_ready() ? "Yes" : "No") << std::endl;
}

void GPUSimulator::enable_tracing(bool enabled, trace::TraceLogger* logger) {
    tracing_enabled_ = enabled;
    if (logger) trace_logger_ = logger;
    dispatcher_.enable_tracing(enabled, logger);
    for (auto& core : cores_) core.enable_tracing(enabled, logger);
    program_controller_.enable_tracing(enabled, logger);
    data_controller_.enable_tracing(enabled, logger);
}

} // namespace tgpu
