#pragma once
// Arithmetic unit of one SIMD lane
// Purely combinational: results depend only on the operands and the data width

#include <tgpu/concepts.hpp>
#include <tgpu/isa/instruction.hpp>
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

/**
 * @brief Lane ALU
 *
 * ADD, SUB and MUL wrap modulo 2^data_bits. Division is unsigned and a
 * zero divisor yields 0. Comparison is unsigned and produces the NZP
 * condition bits used by BRnzp.
 */
class TGPU_API ALU {
public:
    explicit ALU(unsigned data_bits = 8);

    /**
     * @brief Evaluate an arithmetic opcode
     * @throws std::invalid_argument for opcodes the ALU does not implement
     */
    Word execute(isa::Opcode op, Word rs, Word rt) const;

    /// NZP bits for rs compared against rt (exactly one bit set)
    static uint8_t compare(Word rs, Word rt);

    /// Immediate zero-extended to the data width
    Word constant(uint8_t immediate) const { return static_cast<Word>(immediate & mask_); }

    unsigned get_data_bits() const { return data_bits_; }

private:
    unsigned data_bits_;
    Word mask_;
};

} // namespace tgpu

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
