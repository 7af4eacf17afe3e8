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

// Instruction fetcher of one core. Holds a program read on its consumer port
// until the program memory controller answers.
class TGPU_API Fetcher {
public:
    enum class State { IDLE, FETCHING, FETCHED };

    Fetcher() : state_(State::IDLE), pc_(0), instruction_(0) {}

    // Start a fetch; the fetcher must be idle
    void request(Address pc, MemoryChannel& port);

    // Sample the port; returns true on the edge the instruction arrives
    bool update(MemoryChannel& port);

    bool has_instruction() const { return state_ == State::FETCHED; }
    Word get_instruction() const { return instruction_; }
    Address get_pc() const { return pc_; }
    State get_state() const { return state_; }

    // Hand the instruction to decode and return to idle
    Word take();

    void reset() {
        state_ = State::IDLE;
        pc_ = 0;
        instruction_ = 0;
    }

private:
    State state_;
    Address pc_;
    Word instruction_;
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
