#pragma once

#include <cstdint>
#include <optional>
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
#include <tgpu/memory/memory_channel.hpp>
#include <tgpu/trace/trace_logger.hpp>

namespace tgpu {

// Arbiter between many consumer ports and a few memory channels.
//
// Every channel runs a small state machine. An idle channel binds the
// lowest-numbered consumer that has a pending request and is not already
// bound to another channel, forwards the request to its physical channel,
// waits for the memory's ready, relays ready and data back to the consumer,
// and returns to idle once the consumer drops valid. A consumer is served by
// at most one channel at a time and every response goes back to the
// consumer that issued the request.
//
// The program-side controller is built read-only; write requests on its
// consumer ports are never bound.
class TGPU_API MemoryController {
public:
    enum class ChannelState {
        IDLE,
        READ_WAITING,       // request forwarded, waiting for memory ready
        READ_RELAYING,      // response handed to consumer, waiting for it to drop valid
        WRITE_WAITING,
        WRITE_RELAYING
    };

    struct Statistics {
        uint64_t reads_completed = 0;
        uint64_t writes_completed = 0;
        uint64_t contention_cycles = 0;     // cycles a request waited with every channel busy
        std::vector<uint64_t> channel_busy_cycles;
    };

private:
    struct ChannelBinding {
        ChannelState state = ChannelState::IDLE;
        std::optional<Size> consumer;
        Cycle bind_cycle = 0;
        uint64_t transaction_id = 0;
    };

    std::vector<MemoryChannel> consumer_ports_;
    std::vector<ChannelBinding> bindings_;          // one entry per physical channel
    std::vector<bool> consumer_bound_;
    bool writable_;
    size_t controller_id_;
    trace::ComponentType component_type_;
    Statistics stats_;

    // Tracing support
    bool tracing_enabled_;
    trace::TraceLogger* trace_logger_;
    double clock_freq_ghz_;

    void bind_next_consumer(Size channel, MemoryChannel& memory_channel, Cycle current_cycle);
    void log_completion(Size channel, const MemoryChannel& port, Cycle current_cycle, bool is_write);

public:
    MemoryController(trace::ComponentType component_type, Size consumer_count, Size channel_count,
                     bool writable, size_t controller_id = 0, double clock_freq_ghz = 1.0);
    ~MemoryController() = default;

    // Enable/disable tracing
    void enable_tracing(bool enabled = true, trace::TraceLogger* logger = nullptr) {
        tracing_enabled_ = enabled;
        if (logger) trace_logger_ = logger;
    }

    // One clock edge. `memory_channels` are the physical channels of the
    // external memory this controller fronts.
    void update(Cycle current_cycle, std::vector<MemoryChannel>& memory_channels);

    // Consumer side
    MemoryChannel& consumer_port(Size consumer) { return consumer_ports_.at(consumer); }
    const MemoryChannel& consumer_port(Size consumer) const { return consumer_ports_.at(consumer); }
    std::vector<MemoryChannel>& consumer_ports() { return consumer_ports_; }

    // Status
    Size get_consumer_count() const { return consumer_ports_.size(); }
    Size get_channel_count() const { return bindings_.size(); }
    ChannelState get_channel_state(Size channel) const { return bindings_.at(channel).state; }
    std::optional<Size> get_channel_owner(Size channel) const { return bindings_.at(channel).consumer; }
    Size get_pending_requests() const;      // requests not yet bound to a channel
    bool is_busy() const;
    bool is_writable() const { return writable_; }
    const Statistics& get_stats() const { return stats_; }

    void reset();
};

TGPU_API const char* to_string(MemoryController::ChannelState state);

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
