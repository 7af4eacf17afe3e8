#include <tgpu/components/dispatcher.hpp>

#include <algorithm>
#include <stdexcept>

namespace tgpu {

Dispatcher::Dispatcher(Size core_count, Size threads_per_block, double clock_freq_ghz)
    : core_count_(core_count)
    , threads_per_block_(threads_per_block)
    , thread_count_()
    , active_(false)
    , done_(false)
    , block_count_(0)
    , next_block_(0)
    , retired_in_launch_(0)
    , core_block_(core_count)
    , tracing_enabled_(false)
    , trace_logger_(&trace::TraceLogger::instance())
    , clock_freq_ghz_(clock_freq_ghz)
    , current_cycle_(0) {
    if (core_count == 0) {
        throw std::invalid_argument("Dispatcher: core_count must be at least 1");
    }
    if (threads_per_block == 0) {
        throw std::invalid_argument("Dispatcher: threads_per_block must be at least 1");
    }
}

bool Dispatcher::configure(uint32_t total_thread_count) {
    if (active_) {
        return reject(trace::TransactionType::CONFIGURE, "configure", total_thread_count,
                      "thread count write ignored while a launch is active");
    }
    if (total_thread_count == 0) {
        return reject(trace::TransactionType::CONFIGURE, "configure", total_thread_count,
                      "thread count must be at least 1");
    }

    thread_count_ = total_thread_count;
    log_control(trace::TransactionType::CONFIGURE, trace::TransactionStatus::COMPLETED,
                "configure", total_thread_count,
                "Thread count set to " + std::to_string(total_thread_count));
    return true;
}

bool Dispatcher::launch() {
    if (active_) {
        return reject(trace::TransactionType::LAUNCH, "launch", 0, "launch already active");
    }
    if (!thread_count_) {
        return reject(trace::TransactionType::LAUNCH, "launch", 0, "thread count not configured");
    }

    const Size threads = *thread_count_;
    block_count_ = (threads + threads_per_block_ - 1) / threads_per_block_;
    next_block_ = 0;
    retired_in_launch_ = 0;
    records_.clear();
    records_.reserve(block_count_);
    std::fill(core_block_.begin(), core_block_.end(), std::nullopt);
    active_ = true;
    done_ = false;
    ++stats_.launches;

    log_control(trace::TransactionType::LAUNCH, trace::TransactionStatus::COMPLETED, "launch", threads,
                "Launch of " + std::to_string(threads) + " threads in " +
                std::to_string(block_count_) + " blocks");
    return true;
}

void Dispatcher::poll(Cycle current_cycle, std::vector<Core>& cores) {
    current_cycle_ = current_cycle;
    if (!active_) return;

    if (cores.size() != core_count_) {
        throw std::invalid_argument("Dispatcher: expected " + std::to_string(core_count_) +
                                    " cores, got " + std::to_string(cores.size()));
    }

    // Retire finished blocks first so their cores can take new work this cycle
    for (Size c = 0; c < cores.size(); ++c) {
        if (!core_block_[c] || !cores[c].is_done()) continue;

        BlockRecord& record = records_[*core_block_[c]];
        record.retire_cycle = current_cycle;
        cores[c].release();
        core_block_[c].reset();
        ++retired_in_launch_;
        ++stats_.blocks_retired;

        log_retire(record, current_cycle, trace::TransactionStatus::COMPLETED,
                   "Block " + std::to_string(record.block_id) + " retired from core " + std::to_string(c));
    }

    // Greedy assignment, lowest pending block to lowest idle core
    for (Size c = 0; c < cores.size() && next_block_ < block_count_; ++c) {
        if (core_block_[c] || !cores[c].is_idle()) continue;

        const Size first_thread = next_block_ * threads_per_block_;
        const auto block_threads = static_cast<uint32_t>(
            std::min(threads_per_block_, static_cast<Size>(*thread_count_) - first_thread));
        const auto block_id = static_cast<uint32_t>(next_block_);

        cores[c].start_block(block_id, block_threads);
        records_.push_back(BlockRecord{block_id, block_threads, c, current_cycle, std::nullopt});
        core_block_[c] = records_.size() - 1;
        ++next_block_;
        ++stats_.blocks_dispatched;

        if (tracing_enabled_ && trace_logger_) {
            trace::TraceEntry entry(current_cycle, trace::ComponentType::DISPATCHER, 0,
                                    trace::TransactionType::DISPATCH, trace_logger_->next_transaction_id());
            entry.clock_freq_ghz = clock_freq_ghz_;
            entry.complete(current_cycle, trace::TransactionStatus::COMPLETED);
            trace::DispatchPayload payload;
            payload.block_id = block_id;
            payload.core_id = static_cast<uint32_t>(c);
            payload.thread_count = block_threads;
            entry.payload = payload;
            entry.description = "Block " + std::to_string(block_id) + " (" + std::to_string(block_threads) +
                                " threads) dispatched to core " + std::to_string(c);
            trace_logger_->log(std::move(entry));
        }
    }

    if (retired_in_launch_ == block_count_) {
        active_ = false;
        done_ = true;
        log_control(trace::TransactionType::LAUNCH, trace::TransactionStatus::COMPLETED, "done",
                    block_count_, "All " + std::to_string(block_count_) + " blocks retired");
    }
}

void Dispatcher::log_control(trace::TransactionType type, trace::TransactionStatus status,
                             const std::string& command, uint64_t parameter, const std::string& description) {
    if (!tracing_enabled_ || !trace_logger_) return;

    trace::TraceEntry entry(current_cycle_, trace::ComponentType::DISPATCHER, 0, type,
                            trace_logger_->next_transaction_id());
    entry.clock_freq_ghz = clock_freq_ghz_;
    entry.complete(current_cycle_, status);
    trace::ControlPayload payload;
    payload.command = command;
    payload.parameter = parameter;
    entry.payload = payload;
    entry.description = description;
    trace_logger_->log(std::move(entry));
}

void Dispatcher::log_retire(const BlockRecord& record, Cycle cycle, trace::TransactionStatus status,
                            const std::string& description) {
    if (!tracing_enabled_ || !trace_logger_) return;

    trace::TraceEntry entry(record.dispatch_cycle, trace::ComponentType::DISPATCHER, 0,
                            trace::TransactionType::RETIRE, trace_logger_->next_transaction_id());
    entry.clock_freq_ghz = clock_freq_ghz_;
    entry.complete(cycle, status);
    trace::DispatchPayload payload;
    payload.block_id = record.block_id;
    payload.core_id = static_cast<uint32_t>(record.core_id);
    payload.thread_count = record.thread_count;
    entry.payload = payload;
    entry.description = description;
    trace_logger_->log(std::move(entry));
}

bool Dispatcher::reject(trace::TransactionType type, const std::string& command, uint64_t parameter,
                        const std::string& reason) {
    ++stats_.rejected_operations;
    log_control(type, trace::TransactionStatus::FAILED, command, parameter, "Rejected: " + reason);
    return false;
}

void Dispatcher::reset() {
    // Blocks still resident on a core are abandoned
    for (const auto& slot : core_block_) {
        if (!slot) continue;
        const BlockRecord& record = records_[*slot];
        log_retire(record, current_cycle_, trace::TransactionStatus::CANCELLED,
                   "Block " + std::to_string(record.block_id) + " cancelled on core " +
                   std::to_string(record.core_id) + " by reset");
    }

    thread_count_.reset();
    active_ = false;
    done_ = false;
    block_count_ = 0;
    next_block_ = 0;
    retired_in_launch_ = 0;
    std::fill(core_block_.begin(), core_block_.end(), std::nullopt);
    records_.clear();
    stats_ = Statistics{};
    current_cycle_ = 0;
}

} // namespace tgpu
