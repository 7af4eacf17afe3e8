#pragma once

#include <tgpu/trace/trace_entry.hpp>

#include <atomic>
#include <mutex>
#include <vector>

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

// Process-wide collector of trace entries.
//
// Components hold a pointer to a logger (the singleton by default) and only
// log while their own tracing flag is set. The logger itself can also be
// disabled globally, in which case log() drops entries.
class TGPU_API TraceLogger {
public:
    static TraceLogger& instance();

    TraceLogger();
    TraceLogger(const TraceLogger&) = delete;
    TraceLogger& operator=(const TraceLogger&) = delete;

    // Recording
    void log(TraceEntry entry);
    uint64_t next_transaction_id() { return next_transaction_id_.fetch_add(1); }

    // Control
    void set_enabled(bool enabled) { enabled_.store(enabled); }
    bool is_enabled() const { return enabled_.load(); }
    void clear();

    // Queries (return copies so callers never observe concurrent mutation)
    size_t get_trace_count() const;
    std::vector<TraceEntry> get_all_traces() const;
    std::vector<TraceEntry> get_component_traces(ComponentType type, uint32_t id) const;
    std::vector<TraceEntry> get_component_traces(ComponentType type) const;
    std::vector<TraceEntry> get_transaction_traces(TransactionType type) const;
    std::vector<TraceEntry> get_traces_in_range(CycleCount start_cycle, CycleCount end_cycle) const;

private:
    mutable std::mutex mutex_;
    std::vector<TraceEntry> traces_;
    std::atomic<bool> enabled_;
    std::atomic<uint64_t> next_transaction_id_;
};

} // namespace tgpu::trace

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
