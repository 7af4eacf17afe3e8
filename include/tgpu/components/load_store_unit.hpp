#pragma once

#include <tgpu/concepts.hpp>
#include <tgpu/memory/memory_channel.hpp>

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

namespace tgpu {

// Per-lane load/store unit. Drives one data-memory consumer port for the
// duration of an LDR or STR and latches the loaded value.
class TGPU_API LoadStoreUnit {
public:
    enum class State { IDLE, WAITING, DONE };

    LoadStoreUnit() : state_(State::IDLE), is_store_(false), address_(0), data_(0) {}

    void issue_load(Address addr, MemoryChannel& port);
    void issue_store(Address addr, Word value, MemoryChannel& port);

    // Sample the port; returns true on the edge the access completes
    bool update(MemoryChannel& port);

    bool is_idle() const { return state_ == State::IDLE; }
    bool is_done() const { return state_ == State::DONE; }
    State get_state() const { return state_; }
    Word get_loaded_value() const { return data_; }
    Address get_address() const { return address_; }

    // Result consumed by the core
    void acknowledge() { state_ = State::IDLE; }

    void reset() {
        state_ = State::IDLE;
        is_store_ = false;
        address_ = 0;
        data_ = 0;
    }

private:
    State state_;
    bool is_store_;
    Address address_;
    Word data_;
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
