#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Windows/MSVC compatibility
#ifdef _MSC_VER
    #pragma warning(push)
    #pragma warning(disable: 4251) // DLL interface warnings
    #ifdef BUILDING_TGPU_SIMULATOR
        #define TGPU_API __declspec(dllexport)
    #else
        #define TGPU_API __declspec(dllimport)
    #endif
#else
    #define TGPU_API
#endif

#include <tgpu/concepts.hpp>
#include <tgpu/isa/assembler.hpp>
#include <tgpu/memory/external_memory.hpp>
#include <tgpu/components/core.hpp>
#include <tgpu/components/dispatcher.hpp>
#include <tgpu/components/memory_controller.hpp>
#include <tgpu/trace/trace_logger.hpp>

namespace tgpu {

// Top-level device: dispatcher, cores, one memory controller per memory type
// and the two external memories, advanced together by a single clock.
class TGPU_API GPUSimulator {
public:
    // Upper bound on lanes per core
    static constexpr Size MAX_THREADS_PER_BLOCK = 256;

    struct Config {
        // Compute
        Size core_count;
        Size threads_per_block;

        // Data memory (external, read/write)
        unsigned data_memory_address_bits;
        unsigned data_memory_data_bits;
        Size data_memory_channels;
        Cycle data_memory_latency_cycles;

        // Program memory (external, read-only from the device)
        unsigned program_memory_address_bits;
        unsigned program_memory_data_bits;
        Size program_memory_channels;
        Cycle program_memory_latency_cycles;

        double clock_freq_ghz;

        Config()
            : core_count(2), threads_per_block(4),
              data_memory_address_bits(8), data_memory_data_bits(8),
              data_memory_channels(4), data_memory_latency_cycles(1),
              program_memory_address_bits(8), program_memory_data_bits(isa::INSTRUCTION_BITS),
              program_memory_channels(1), program_memory_latency_cycles(1),
              clock_freq_ghz(1.0) {}

        Config(const Config&) = default;
        Config& operator=(const Config&) = default;
        Config(Config&&) = default;
        Config& operator=(Config&&) = default;
        ~Config() = default;

        // Hard constraint violations; empty when the configuration is usable
        std::vector<std::string> validation_errors() const;
    };

    struct Statistics {
        Cycle total_cycles = 0;             // since construction
        Cycle launch_cycles = 0;            // start to done of the last launch
        uint64_t instructions_issued = 0;
        uint64_t lane_instructions = 0;
        uint64_t fetches = 0;
        uint64_t loads = 0;
        uint64_t stores = 0;
        uint64_t divergent_branches = 0;
        uint64_t reserved_opcodes = 0;
        uint64_t blocks_retired = 0;
        uint64_t rejected_control_operations = 0;
        std::vector<uint64_t> core_fetch_stall_cycles;
        std::vector<uint64_t> core_memory_stall_cycles;
        uint64_t data_reads = 0;
        uint64_t data_writes = 0;
        uint64_t program_reads = 0;
    };

private:
    Config config_;

    ExternalMemory program_memory_;
    ExternalMemory data_memory_;
    MemoryController program_controller_;
    MemoryController data_controller_;
    std::vector<Core> cores_;
    Dispatcher dispatcher_;

    // Simulation state
    Cycle current_cycle_;
    Cycle launch_start_cycle_;
    Cycle launch_cycles_;
    std::chrono::high_resolution_clock::time_point sim_start_time_;

    // Tracing support
    bool tracing_enabled_;
    trace::TraceLogger* trace_logger_;

    static const Config& validated(const Config& config);

public:
    explicit GPUSimulator(const Config& config = {});
    ~GPUSimulator() = default;

    // Disable copying
    GPUSimulator(const GPUSimulator&) = delete;
    GPUSimulator& operator=(const GPUSimulator&) = delete;

    // ===========================================
    // Device control signals
    // ===========================================

    // Return every component to its initial state, aborting any launch.
    // Memory contents are external to the device and survive.
    void reset();

    // Device control register write; false while a launch is active or for 0
    bool write_device_control_register(uint8_t thread_count);

    // Start pulse; false if a launch is active or no thread count was written
    bool start();

    bool is_done() const { return dispatcher_.is_done(); }
    bool is_running() const { return dispatcher_.is_active(); }

    // ===========================================
    // Simulation control
    // ===========================================

    void step(); // One clock edge for every component

    /**
     * @brief Step until the launch completes
     * @return true once the launch is done; false if max_cycles elapsed first
     *         or nothing was ever launched
     */
    bool run_until_done(Cycle max_cycles = 100000);

    // Convenience: write the thread count, start and run to completion
    bool launch(uint8_t thread_count, Cycle max_cycles = 100000);

    // ===========================================
    // Host memory access (backdoor, between launches)
    // ===========================================

    /**
     * @brief Copy a kernel into program memory starting at address 0
     * @throws std::out_of_range if the program does not fit
     * @throws std::logic_error while a launch is active
     */
    void load_program(const std::vector<Word>& words);
    void load_program(const isa::Program& program);

    Word read_program_memory(Address addr) const { return program_memory_.read(addr); }
    Word read_data_memory(Address addr) const { return data_memory_.read(addr); }
    void write_data_memory(Address addr, Word value) { data_memory_.write(addr, value); }
    void load_data(Address base, const std::vector<Word>& values) { data_memory_.load(base, values); }
    std::vector<Word> dump_data_memory(Address base, Size count) const { return data_memory_.dump(base, count); }

    // ===========================================
    // Component access
    // ===========================================

    const Config& get_config() const { return config_; }
    const Dispatcher& get_dispatcher() const { return dispatcher_; }
    const Core& get_core(size_t core_id) const { return cores_.at(core_id); }
    size_t get_core_count() const { return cores_.size(); }
    const MemoryController& get_program_memory_controller() const { return program_controller_; }
    const MemoryController& get_data_memory_controller() const { return data_controller_; }
    const ExternalMemory& get_program_memory() const { return program_memory_; }
    const ExternalMemory& get_data_memory() const { return data_memory_; }

    // ===========================================
    // Statistics and monitoring
    // ===========================================

    Cycle get_current_cycle() const { return current_cycle_; }
    Statistics get_stats() const;
    double get_elapsed_time_ms() const;
    void print_stats() const;
    void print_component_status() const;

    // Tracing control (all components)
    void enable_tracing(bool enabled = true, trace::TraceLogger* logger = nullptr);
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
