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
#include <tgpu/memory/memory_channel.hpp>

namespace tgpu {

// Word-addressed memory array behind a fixed number of valid/ready channels.
//
// Each channel serves one request at a time: once valid has been held for
// `latency_cycles` clock edges the memory performs the access and raises
// ready (with read data for reads). Ready drops on the first edge after the
// requester deasserts valid. Addresses wrap to the configured width.
//
// Contents live outside the device: reset() clears handshake state only,
// clear() zeroes the array.
class TGPU_API ExternalMemory {
public:
    ExternalMemory(unsigned address_bits, unsigned data_bits, Size channel_count,
                   Cycle latency_cycles = 1, bool writable = true);
    ~ExternalMemory() = default;

    // One clock edge on every channel
    void update(Cycle current_cycle);

    // Channel side
    std::vector<MemoryChannel>& channels() { return channels_; }
    const std::vector<MemoryChannel>& channels() const { return channels_; }
    Size get_channel_count() const { return channels_.size(); }

    // Host backdoor (bounds-checked, no handshake)
    Word read(Address addr) const;
    void write(Address addr, Word value);
    void load(Address base, const std::vector<Word>& data);
    std::vector<Word> dump(Address base, Size count) const;

    // Configuration and status
    Size get_capacity() const { return memory_model_.size(); }
    unsigned get_address_bits() const { return address_bits_; }
    unsigned get_data_bits() const { return data_bits_; }
    Cycle get_latency() const { return latency_cycles_; }
    bool is_writable() const { return writable_; }
    bool is_ready() const;                      // no channel mid-access
    Cycle get_last_access_cycle() const { return last_access_cycle_; }
    uint64_t get_reads_served() const { return reads_served_; }
    uint64_t get_writes_served() const { return writes_served_; }

    void reset();
    void clear();

private:
    std::vector<Word> memory_model_;
    std::vector<MemoryChannel> channels_;
    std::vector<Cycle> read_wait_;      // edges the current read has been held
    std::vector<Cycle> write_wait_;
    unsigned address_bits_;
    unsigned data_bits_;
    Cycle latency_cycles_;
    bool writable_;

    Cycle last_access_cycle_;
    uint64_t reads_served_;
    uint64_t writes_served_;
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
