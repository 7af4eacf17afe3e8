#pragma once

#include <tgpu/concepts.hpp>
#include <tgpu/isa/instruction.hpp>

#include <array>
#include <cstdint>

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

// Sixteen registers and the NZP condition bits of one lane.
// R13..R15 hold the lane identity and ignore writes.
class TGPU_API RegisterFile {
public:
    explicit RegisterFile(unsigned data_bits = 8);

    // Load identity registers for a new block; clears R0..R12 and NZP
    void assign(uint32_t block_idx, uint32_t block_dim, uint32_t thread_idx);

    Word read(uint8_t reg) const;
    void write(uint8_t reg, Word value);

    uint8_t get_nzp() const { return nzp_; }
    void set_nzp(uint8_t nzp) { nzp_ = nzp & 0x7; }

    Word block_idx() const { return registers_[isa::BLOCK_IDX_REGISTER]; }
    Word block_dim() const { return registers_[isa::BLOCK_DIM_REGISTER]; }
    Word thread_idx() const { return registers_[isa::THREAD_IDX_REGISTER]; }

    void reset();

private:
    std::array<Word, isa::REGISTER_COUNT> registers_;
    uint8_t nzp_;
    Word mask_;
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
