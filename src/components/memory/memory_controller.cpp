#include <tgpu/components/memory_controller.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tgpu {

MemoryController::MemoryController(trace::ComponentType component_type, Size consumer_count,
                                   Size channel_count, bool writable, size_t controller_id,
                                   double clock_freq_ghz)
    : consumer_ports_(consumer_count)
    , bindings_(channel_count)
    , consumer_bound_(consumer_count, false)
    , writable_(writable)
    , controller_id_(controller_id)
    , component_type_(component_type)
    , tracing_enabled_(false)
    , trace_logger_(&trace::TraceLogger::instance())
    , clock_freq_ghz_(clock_freq_ghz) {
    if (consumer_count == 0) {
        throw std::invalid_argument("MemoryController: at least one consumer is required");
    }
    if (channel_count == 0) {
        throw std::invalid_argument("MemoryController: at least one channel is required");
    }
    stats_.channel_busy_cycles.assign(channel_count, 0);
}

void MemoryController::update(Cycle current_cycle, std::vector<MemoryChannel>& memory_channels) {
    if (memory_channels.size() != bindings_.size()) {
        throw std::invalid_argument("MemoryController: expected " + std::to_string(bindings_.size()) +
                                    " memory channels, got " + std::to_string(memory_channels.size()));
    }

    for (Size ch = 0; ch < bindings_.size(); ++ch) {
        ChannelBinding& binding = bindings_[ch];
        MemoryChannel& mem = memory_channels[ch];

        switch (binding.state) {
            case ChannelState::IDLE:
                bind_next_consumer(ch, mem, current_cycle);
                break;

            case ChannelState::READ_WAITING: {
                MemoryChannel& port = consumer_ports_[*binding.consumer];
                if (mem.read_ready) {
                    mem.read_valid = false;
                    port.read_data = mem.read_data;
                    port.read_ready = true;
                    binding.state = ChannelState::READ_RELAYING;
                    ++stats_.reads_completed;
                    log_completion(ch, port, current_cycle, false);
                }
                break;
            }

            case ChannelState::READ_RELAYING: {
                MemoryChannel& port = consumer_ports_[*binding.consumer];
                if (!port.read_valid) {
                    port.read_ready = false;
                    consumer_bound_[*binding.consumer] = false;
                    binding = ChannelBinding{};
                }
                break;
            }

            case ChannelState::WRITE_WAITING: {
                MemoryChannel& port = consumer_ports_[*binding.consumer];
                if (mem.write_ready) {
                    mem.write_valid = false;
                    port.write_ready = true;
                    binding.state = ChannelState::WRITE_RELAYING;
                    ++stats_.writes_completed;
                    log_completion(ch, port, current_cycle, true);
                }
                break;
            }

            case ChannelState::WRITE_RELAYING: {
                MemoryChannel& port = consumer_ports_[*binding.consumer];
                if (!port.write_valid) {
                    port.write_ready = false;
                    consumer_bound_[*binding.consumer] = false;
                    binding = ChannelBinding{};
                }
                break;
            }
        }

        if (binding.state != ChannelState::IDLE) {
            ++stats_.channel_busy_cycles[ch];
        }
    }

    if (get_pending_requests() > 0) {
        bool all_busy = true;
        for (const auto& binding : bindings_) {
            if (binding.state == ChannelState::IDLE) {
                all_busy = false;
                break;
            }
        }
        if (all_busy) ++stats_.contention_cycles;
    }
}

void MemoryController::bind_next_consumer(Size channel, MemoryChannel& memory_channel, Cycle current_cycle) {
    for (Size c = 0; c < consumer_ports_.size(); ++c) {
        if (consumer_bound_[c]) continue;
        MemoryChannel& port = consumer_ports_[c];

        ChannelBinding& binding = bindings_[channel];
        if (port.read_valid) {
            memory_channel.read_valid = true;
            memory_channel.read_address = port.read_address;
            binding.state = ChannelState::READ_WAITING;
        } else if (writable_ && port.write_valid) {
            memory_channel.write_valid = true;
            memory_channel.write_address = port.write_address;
            memory_channel.write_data = port.write_data;
            binding.state = ChannelState::WRITE_WAITING;
        } else {
            continue;
        }

        binding.consumer = c;
        binding.bind_cycle = current_cycle;
        binding.transaction_id = trace_logger_ ? trace_logger_->next_transaction_id() : 0;
        consumer_bound_[c] = true;
        return;
    }
}

void MemoryController::log_completion(Size channel, const MemoryChannel& port, Cycle current_cycle,
                                      bool is_write) {
    if (!tracing_enabled_ || !trace_logger_) return;

    const ChannelBinding& binding = bindings_[channel];
    trace::TraceEntry entry(
        binding.bind_cycle,
        component_type_,
        static_cast<uint32_t>(controller_id_),
        is_write ? trace::TransactionType::WRITE : trace::TransactionType::READ,
        binding.transaction_id
    );
    entry.clock_freq_ghz = clock_freq_ghz_;
    entry.complete(current_cycle, trace::TransactionStatus::COMPLETED);

    trace::MemoryPayload payload;
    payload.address = is_write ? port.write_address : port.read_address;
    payload.data = is_write ? port.write_data : port.read_data;
    payload.channel = static_cast<uint32_t>(channel);
    payload.requester_id = static_cast<uint32_t>(*binding.consumer);
    payload.latency_cycles = static_cast<uint32_t>(current_cycle - binding.bind_cycle);
    entry.payload = payload;

    entry.description = std::string(is_write ? "Write " : "Read ") + "consumer " +
                        std::to_string(*binding.consumer) + " on channel " + std::to_string(channel);

    trace_logger_->log(std::move(entry));
}

Size MemoryController::get_pending_requests() const {
    Size pending = 0;
    for (Size c = 0; c < consumer_ports_.size(); ++c) {
        if (consumer_bound_[c]) continue;
        const MemoryChannel& port = consumer_ports_[c];
        if (port.read_valid || (writable_ && port.write_valid)) ++pending;
    }
    return pending;
}

bool MemoryController::is_busy() const {
    for (const auto& binding : bindings_) {
        if (binding.state != ChannelState::IDLE) return true;
    }
    return get_pending_requests() > 0;
}

void MemoryController::reset() {
    for (auto& port : consumer_ports_) port.reset();
    for (auto& binding : bindings_) binding = ChannelBinding{};
    std::fill(consumer_bound_.begin(), consumer_bound_.end(), false);
    stats_.reads_completed = 0;
    stats_.writes_completed = 0;
    stats_.contention_cycles = 0;
    std::fill(stats_.channel_busy_cycles.begin(), stats_.channel_busy_cycles.end(), 0);
}

const char* to_string(MemoryController::ChannelState state) {
    switch (state) {
        case MemoryController::ChannelState::IDLE: return "IDLE";
        case MemoryController::ChannelState::READ_WAITING: return "READ_WAITING";
        case MemoryController::ChannelState::READ_RELAYING: return "READ_RELAYING";
        case MemoryController::ChannelState::WRITE_WAITING: return "WRITE_WAITING";
        case MemoryController::ChannelState::WRITE_RELAYING: return "WRITE_RELAYING";
        default: return "UNKNOWN";
    }
}

} // namespace tgpu
