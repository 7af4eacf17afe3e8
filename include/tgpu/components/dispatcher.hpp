#pragma once

#include <cstdint>
#include <optional>
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
#include <tgpu/components/core.hpp>
#include <tgpu/trace/trace_logger.hpp>

namespace tgpu {

// Block dispatcher
//
// Holds the device control register (total thread count), partitions a
// launch into ceil(T / threads_per_block) blocks and hands them to idle
// cores in increasing block order. The last block is clipped to the
// remaining threads.
class TGPU_API Dispatcher {
public:
    struct BlockRecord {
        uint32_t block_id;
        uint32_t thread_count;
        size_t core_id;
        Cycle dispatch_cycle;
        std::optional<Cycle> retire_cycle;
    };

    struct Statistics {
        uint64_t launches = 0;
        uint64_t blocks_dispatched = 0;
        uint64_t blocks_retired = 0;
        uint64_t rejected_operations = 0;
    };

private:
    Size core_count_;
    Size threads_per_block_;

    std::optional<uint32_t> thread_count_;      // control register, empty until configured
    bool active_;
    bool done_;
    Size block_count_;
    Size next_block_;
    Size retired_in_launch_;
    std::vector<std::optional<Size>> core_block_;  // record index each core is running
    std::vector<BlockRecord> records_;
    Statistics stats_;

    // Tracing support
    bool tracing_enabled_;
    trace::TraceLogger* trace_logger_;
    double clock_freq_ghz_;
    Cycle current_cycle_;

    void log_control(trace::TransactionType type, trace::TransactionStatus status,
                     const std::string& command, uint64_t parameter, const std::string& description);
    void log_retire(const BlockRecord& record, Cycle cycle, trace::TransactionStatus status,
                    const std::string& description);
    bool reject(trace::TransactionType type, const std::string& command, uint64_t parameter,
                const std::string& reason);

public:
    Dispatcher(Size core_count, Size threads_per_block, double clock_freq_ghz = 1.0);
    ~Dispatcher() = default;

    // Enable/disable tracing
    void enable_tracing(bool enabled = true, trace::TraceLogger* logger = nullptr) {
        tracing_enabled_ = enabled;
        if (logger) trace_logger_ = logger;
    }

    // Cycle stamp for control operations arriving between clock edges
    void set_current_cycle(Cycle cycle) { current_cycle_ = cycle; }

    /**
     * @brief Write the total thread count
     * @return false (no state change) if a launch is active or the count is 0
     */
    bool configure(uint32_t total_thread_count);

    /**
     * @brief Begin a launch with the configured thread count
     * @return false (no state change) if already active or never configured
     */
    bool launch();

    /**
     * @brief One clock edge: retire finished cores, then fill idle cores
     */
    void poll(Cycle current_cycle, std::vector<Core>& cores);

    // Level-held completion flag of the last launch
    bool is_done() const { return done_; }
    bool is_active() const { return active_; }
    bool is_configured() const { return thread_count_.has_value(); }

    std::optional<uint32_t> get_thread_count() const { return thread_count_; }
    Size get_block_count() const { return block_count_; }
    Size get_blocks_dispatched() const { return next_block_; }
    Size get_blocks_retired() const { return retired_in_launch_; }
    Size get_threads_per_block() const { return threads_per_block_; }
    const std::vector<BlockRecord>& get_block_records() const { return records_; }
    const Statistics& get_stats() const { return stats_; }

    void reset();
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
