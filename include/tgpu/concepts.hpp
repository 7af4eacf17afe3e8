#pragma once

#include <cstddef>
#include <cstdint>

namespace tgpu {

// Fundamental simulator types
using Address = std::uint32_t;   // word address in program or data memory
using Word    = std::uint16_t;   // memory word / register value (masked to the configured width)
using Size    = std::size_t;
using Cycle   = std::uint64_t;

// Mask covering the low `bits` bits of a word
constexpr std::uint32_t width_mask(unsigned bits) {
    return bits >= 32 ? 0xFFFF'FFFFu : ((1u << bits) - 1u);
}

} // namespace tgpu
