#include <tgpu/trace/trace_logger.hpp>

#include <utility>

namespace tgpu::trace {

TraceLogger& TraceLogger::instance() {
    static TraceLogger logger;
    return logger;
}

TraceLogger::TraceLogger()
    : enabled_(true)
    , next_transaction_id_(1)
{
}

void TraceLogger::log(TraceEntry entry) {
    if (!enabled_.load()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(entry));
}

void TraceLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

size_t TraceLogger::get_trace_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_.size();
}

std::vector<TraceEntry> TraceLogger::get_all_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<TraceEntry> TraceLogger::get_component_traces(ComponentType type, uint32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceEntry> result;
    for (const auto& entry : traces_) {
        if (entry.component_type == type && entry.component_id == id) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<TraceEntry> TraceLogger::get_component_traces(ComponentType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceEntry> result;
    for (const auto& entry : traces_) {
        if (entry.component_type == type) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<TraceEntry> TraceLogger::get_transaction_traces(TransactionType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceEntry> result;
    for (const auto& entry : traces_) {
        if (entry.transaction_type == type) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<TraceEntry> TraceLogger::get_traces_in_range(CycleCount start_cycle, CycleCount end_cycle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceEntry> result;
    for (const auto& entry : traces_) {
        if (entry.overlaps_with(start_cycle, end_cycle)) {
            result.push_back(entry);
        }
    }
    return result;
}

} // namespace tgpu::trace
