#pragma once

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
#include <tgpu/isa/instruction.hpp>
#include <tgpu/memory/memory_channel.hpp>
#include <tgpu/components/alu.hpp>
#include <tgpu/components/register_file.hpp>
#include <tgpu/components/fetcher.hpp>
#include <tgpu/components/load_store_unit.hpp>
#include <tgpu/trace/trace_logger.hpp>

namespace tgpu {

// Lock-step SIMD core
//
// A core executes one block at a time. All lanes share a single program
// counter and run the same instruction each cycle; lanes beyond the block's
// thread count stay inactive and never touch memory. The pipeline is a
// simple state machine:
//
//   IDLE -> FETCHING -> DECODING -> EXECUTING -> FETCHING ... -> DONE
//
// FETCHING waits on the program memory controller, EXECUTING of LDR/STR
// waits until every active lane's load/store unit has completed. RET moves
// the core to DONE; the dispatcher observes it and returns the core to IDLE.
//
// Branches are evaluated per lane against each lane's NZP bits. The core
// follows the lowest-indexed active lane and counts the branch as divergent
// when the lanes disagree.
class TGPU_API Core {
public:
    enum class State {
        IDLE,
        FETCHING,
        DECODING,
        EXECUTING,
        DONE
    };

    struct Statistics {
        uint64_t instructions_issued = 0;
        uint64_t lane_instructions = 0;     // instructions x active lanes
        uint64_t fetches = 0;
        uint64_t loads = 0;                 // per lane
        uint64_t stores = 0;                // per lane
        uint64_t fetch_stall_cycles = 0;
        uint64_t memory_stall_cycles = 0;
        uint64_t divergent_branches = 0;
        uint64_t reserved_opcodes = 0;
        uint64_t blocks_completed = 0;
    };

private:
    size_t core_id_;
    Size threads_per_block_;
    unsigned program_address_bits_;

    State state_;
    Address pc_;
    Word instruction_word_;
    isa::Instruction instruction_;
    bool memory_issued_;

    uint32_t block_id_;
    uint32_t thread_count_;
    std::vector<bool> lane_active_;

    ALU alu_;
    std::vector<RegisterFile> registers_;
    std::vector<LoadStoreUnit> lsus_;
    Fetcher fetcher_;

    Statistics stats_;

    // Tracing support
    bool tracing_enabled_;
    trace::TraceLogger* trace_logger_;
    double clock_freq_ghz_;
    trace::CycleCount instruction_start_cycle_;

    void execute(Cycle current_cycle, std::vector<MemoryChannel>& data_ports);
    bool execute_memory(std::vector<MemoryChannel>& data_ports);
    void execute_branch(Cycle current_cycle);
    void trace_fetch(Cycle current_cycle);
    void complete_instruction(Cycle current_cycle, Address next_pc, const std::string& note = "");
    Size lane_port(Size lane) const { return core_id_ * threads_per_block_ + lane; }

public:
    Core(size_t core_id, Size threads_per_block, unsigned data_bits = 8,
         unsigned program_address_bits = 8, double clock_freq_ghz = 1.0);
    ~Core() = default;

    // Enable/disable tracing
    void enable_tracing(bool enabled = true, trace::TraceLogger* logger = nullptr) {
        tracing_enabled_ = enabled;
        if (logger) trace_logger_ = logger;
    }

    /**
     * @brief Begin executing a block
     *
     * Loads the identity registers of every lane, enables the first
     * `thread_count` lanes and starts fetching at address 0.
     *
     * @throws std::logic_error if the core is not idle
     * @throws std::invalid_argument if thread_count is 0 or exceeds the lane count
     */
    void start_block(uint32_t block_id, uint32_t thread_count);

    // One clock edge. `data_ports` are all consumer ports of the data memory
    // controller; this core drives the range belonging to its lanes.
    void update(Cycle current_cycle, MemoryChannel& program_port, std::vector<MemoryChannel>& data_ports);

    // DONE -> IDLE, called by the dispatcher after recording retirement
    void release();

    // Status
    State get_state() const { return state_; }
    bool is_idle() const { return state_ == State::IDLE; }
    bool is_done() const { return state_ == State::DONE; }
    size_t get_core_id() const { return core_id_; }
    Address get_pc() const { return pc_; }
    uint32_t get_block_id() const { return block_id_; }
    uint32_t get_thread_count() const { return thread_count_; }
    Size get_lane_count() const { return threads_per_block_; }
    bool is_lane_active(Size lane) const { return lane_active_.at(lane); }
    Size get_active_lane_count() const;
    const RegisterFile& get_registers(Size lane) const { return registers_.at(lane); }
    const isa::Instruction& get_current_instruction() const { return instruction_; }
    const Statistics& get_stats() const { return stats_; }

    void reset();
};

TGPU_API const char* to_string(Core::State state);

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
