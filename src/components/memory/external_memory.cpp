#include <tgpu/memory/external_memory.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tgpu {

ExternalMemory::ExternalMemory(unsigned address_bits, unsigned data_bits, Size channel_count,
                               Cycle latency_cycles, bool writable)
    : channels_(channel_count)
    , read_wait_(channel_count, 0)
    , write_wait_(channel_count, 0)
    , address_bits_(address_bits)
    , data_bits_(data_bits)
    , latency_cycles_(latency_cycles)
    , writable_(writable)
    , last_access_cycle_(0)
    , reads_served_(0)
    , writes_served_(0) {
    if (address_bits == 0 || address_bits > 16) {
        throw std::invalid_argument("ExternalMemory: address_bits must be in 1..16");
    }
    if (data_bits == 0 || data_bits > 16) {
        throw std::invalid_argument("ExternalMemory: data_bits must be in 1..16");
    }
    if (channel_count == 0) {
        throw std::invalid_argument("ExternalMemory: at least one channel is required");
    }
    if (latency_cycles == 0) {
        throw std::invalid_argument("ExternalMemory: latency must be at least one cycle");
    }
    memory_model_.assign(Size{1} << address_bits, 0);
}

void ExternalMemory::update(Cycle current_cycle) {
    const Address address_mask = width_mask(address_bits_);
    const Word data_mask = static_cast<Word>(width_mask(data_bits_));

    for (Size i = 0; i < channels_.size(); ++i) {
        MemoryChannel& ch = channels_[i];

        if (ch.read_valid && !ch.read_ready) {
            if (++read_wait_[i] >= latency_cycles_) {
                ch.read_data = memory_model_[ch.read_address & address_mask];
                ch.read_ready = true;
                read_wait_[i] = 0;
                ++reads_served_;
                last_access_cycle_ = current_cycle;
            }
        } else if (!ch.read_valid) {
            ch.read_ready = false;
            read_wait_[i] = 0;
        }

        if (!writable_) continue;

        if (ch.write_valid && !ch.write_ready) {
            if (++write_wait_[i] >= latency_cycles_) {
                memory_model_[ch.write_address & address_mask] = ch.write_data & data_mask;
                ch.write_ready = true;
                write_wait_[i] = 0;
                ++writes_served_;
                last_access_cycle_ = current_cycle;
            }
        } else if (!ch.write_valid) {
            ch.write_ready = false;
            write_wait_[i] = 0;
        }
    }
}

Word ExternalMemory::read(Address addr) const {
    if (addr >= memory_model_.size()) {
        throw std::out_of_range("ExternalMemory: read address " + std::to_string(addr) +
                                " beyond capacity " + std::to_string(memory_model_.size()));
    }
    return memory_model_[addr];
}

void ExternalMemory::write(Address addr, Word value) {
    if (addr >= memory_model_.size()) {
        throw std::out_of_range("ExternalMemory: write address " + std::to_string(addr) +
                                " beyond capacity " + std::to_string(memory_model_.size()));
    }
    memory_model_[addr] = value & static_cast<Word>(width_mask(data_bits_));
}

void ExternalMemory::load(Address base, const std::vector<Word>& data) {
    if (static_cast<Size>(base) + data.size() > memory_model_.size()) {
        throw std::out_of_range("ExternalMemory: load of " + std::to_string(data.size()) +
                                " words at " + std::to_string(base) + " exceeds capacity");
    }
    for (Size i = 0; i < data.size(); ++i) {
        write(static_cast<Address>(base + i), data[i]);
    }
}

std::vector<Word> ExternalMemory::dump(Address base, Size count) const {
    if (static_cast<Size>(base) + count > memory_model_.size()) {
        throw std::out_of_range("ExternalMemory: dump range exceeds capacity");
    }
    return std::vector<Word>(memory_model_.begin() + base, memory_model_.begin() + base + count);
}

bool ExternalMemory::is_ready() const {
    for (Size i = 0; i < channels_.size(); ++i) {
        if (read_wait_[i] != 0 || write_wait_[i] != 0) return false;
    }
    return true;
}

void ExternalMemory::reset() {
    for (auto& ch : channels_) ch.reset();
    std::fill(read_wait_.begin(), read_wait_.end(), 0);
    std::fill(write_wait_.begin(), write_wait_.end(), 0);
    last_access_cycle_ = 0;
    reads_served_ = 0;
    writes_served_ = 0;
}

void ExternalMemory::clear() {
    std::fill(memory_model_.begin(), memory_model_.end(), 0);
}

} // namespace tgpu
