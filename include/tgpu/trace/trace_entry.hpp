#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <optional>

// Windows/MSVC compatibility
#ifdef _MSC_VER
    #pragma warning(push)
    #pragma warning(disable: 4251)
    #ifdef BUILDING_TGPU_SIMULATOR
        #define TGPU_API __declspec(dllexport)
    #else
        #define TGPU_API __declspec(dllimport)
    #endif
#else
    #define TGPU_API
#endif

namespace tgpu::trace {

// Fundamental time unit for the simulator
using CycleCount = uint64_t;

// Component types in the GPU architecture
enum class ComponentType : uint8_t {
    DEVICE_CONTROL = 0,             // Device control signals (reset, thread count)
    DISPATCHER = 1,                 // Block partitioning and core assignment

    // Execution
    CORE = 2,                       // Lock-step SIMD core
    FETCHER = 3,                    // Per-core instruction fetcher

    // Memory system
    PROGRAM_MEMORY_CONTROLLER = 4,  // Instruction-side channel arbiter
    DATA_MEMORY_CONTROLLER = 5,     // Data-side channel arbiter

    UNKNOWN = 255
};

// Transaction types across different components
enum class TransactionType : uint8_t {
    // Memory transactions
    READ = 0,
    WRITE = 1,
    FETCH = 2,

    // Execution
    EXECUTE = 10,

    // Control transactions
    CONFIGURE = 20,
    LAUNCH = 21,
    DISPATCH = 22,
    RETIRE = 23,
    RESET = 24,

    UNKNOWN = 255
};

// Transaction status
enum class TransactionStatus : uint8_t {
    ISSUED = 0,      // Transaction has been issued
    IN_PROGRESS = 1, // Transaction is being processed
    COMPLETED = 2,   // Transaction completed successfully
    FAILED = 3,      // Transaction was rejected
    CANCELLED = 4    // Block aborted by a device reset
};

// Memory access payload - one word through one physical channel
struct MemoryPayload {
    uint32_t address;         // Word address
    uint32_t data;            // Data read or written
    uint32_t channel;         // Physical channel that carried the request
    uint32_t requester_id;    // Consumer port (core or lane) that issued it
    uint32_t latency_cycles;  // Cycles from binding to acceptance

    MemoryPayload() : address(0), data(0), channel(0), requester_id(0), latency_cycles(0) {}
};

// Block dispatch payload
struct DispatchPayload {
    uint32_t block_id;
    uint32_t core_id;
    uint32_t thread_count;    // Lanes enabled for this block

    DispatchPayload() : block_id(0), core_id(0), thread_count(0) {}
};

// Instruction execution payload
struct InstructionPayload {
    uint32_t pc;
    uint16_t word;
    std::string mnemonic;
    uint32_t active_lanes;

    InstructionPayload() : pc(0), word(0), active_lanes(0) {}
};

// Control/synchronization payload
struct ControlPayload {
    std::string command;      // Control command string
    uint64_t parameter;       // Generic parameter

    ControlPayload() : parameter(0) {}
};

// Variant to hold different payload types
using PayloadData = std::variant<
    std::monostate,          // No payload
    MemoryPayload,
    DispatchPayload,
    InstructionPayload,
    ControlPayload
>;

// Main trace entry structure - cycle-based timestamping
struct TGPU_API TraceEntry {
    // Cycle-based timing (deterministic)
    CycleCount cycle_issue;      // Cycle when transaction was issued
    CycleCount cycle_complete;   // Cycle when transaction completed (0 if not completed)

    // Component identification
    ComponentType component_type;
    uint32_t component_id;

    // Transaction details
    TransactionType transaction_type;
    TransactionStatus status;
    uint64_t transaction_id;        // Unique transaction ID

    // Optional payload
    PayloadData payload;

    // Human-readable description
    std::string description;

    // Clock frequency for this component (GHz) - optional, for time conversion
    std::optional<double> clock_freq_ghz;

    TraceEntry(CycleCount cycle, ComponentType comp_type, uint32_t comp_id,
               TransactionType trans_type, uint64_t trans_id)
        : cycle_issue(cycle)
        , cycle_complete(0)
        , component_type(comp_type)
        , component_id(comp_id)
        , transaction_type(trans_type)
        , status(TransactionStatus::ISSUED)
        , transaction_id(trans_id)
        , payload()
        , description()
        , clock_freq_ghz()
    {}

    // Mark transaction as completed
    void complete(CycleCount completion_cycle, TransactionStatus final_status = TransactionStatus::COMPLETED) {
        cycle_complete = completion_cycle;
        status = final_status;
    }

    // Duration in cycles (0 if not completed)
    CycleCount get_duration_cycles() const {
        if (status == TransactionStatus::ISSUED || status == TransactionStatus::IN_PROGRESS) {
            return 0;
        }
        return cycle_complete - cycle_issue;
    }

    double get_issue_time_ns() const {
        if (!clock_freq_ghz.has_value()) return -1.0;
        return static_cast<double>(cycle_issue) / clock_freq_ghz.value();
    }

    double get_complete_time_ns() const {
        if (!clock_freq_ghz.has_value() || cycle_complete == 0) return -1.0;
        return static_cast<double>(cycle_complete) / clock_freq_ghz.value();
    }

    double get_duration_ns() const {
        if (!clock_freq_ghz.has_value() || cycle_complete == 0) return -1.0;
        return static_cast<double>(get_duration_cycles()) / clock_freq_ghz.value();
    }

    // Check if transaction overlaps with a given cycle range
    bool overlaps_with(CycleCount start_cycle, CycleCount end_cycle) const {
        if (cycle_complete == 0) {
            return cycle_issue >= start_cycle && cycle_issue <= end_cycle;
        }
        return !(cycle_complete < start_cycle || cycle_issue > end_cycle);
    }
};

// Helper functions to convert enums to strings for export/debugging
TGPU_API const char* to_string(ComponentType type);
TGPU_API const char* to_string(TransactionType type);
TGPU_API const char* to_string(TransactionStatus status);

} // namespace tgpu::trace

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
