/**
 * @file instruction.hpp
 * @brief Instruction set of the TGPU compute cores
 *
 * Every instruction is one 16-bit word:
 *
 * ```
 *   15    12 11     8 7      4 3      0
 *  +--------+--------+--------+--------+
 *  | opcode |   Rd   |   Rs   |   Rt   |   register form
 *  | opcode |   Rd   |   immediate     |   CONST
 *  | opcode | nzp  0 |   target        |   BRnzp
 *  +--------+--------+--------+--------+
 * ```
 *
 * Registers R0..R12 are general purpose. R13..R15 are the read-only
 * per-lane identity registers %blockIdx, %blockDim and %threadIdx.
 */

#pragma once

#include <tgpu/concepts.hpp>

#include <cstdint>
#include <string>

namespace tgpu::isa {

enum class Opcode : uint8_t {
    NOP   = 0x0,    // No operation
    BRNZP = 0x1,    // Branch to immediate target if condition mask matches NZP
    CMP   = 0x2,    // NZP <- compare(Rs, Rt)
    ADD   = 0x3,    // Rd <- Rs + Rt
    SUB   = 0x4,    // Rd <- Rs - Rt
    MUL   = 0x5,    // Rd <- Rs * Rt
    DIV   = 0x6,    // Rd <- Rs / Rt
    LDR   = 0x7,    // Rd <- data_mem[Rs]
    STR   = 0x8,    // data_mem[Rs] <- Rt
    CONST = 0x9,    // Rd <- immediate
    RET   = 0xF     // Lane retires
};

// Register file layout
constexpr unsigned REGISTER_COUNT = 16;
constexpr unsigned GENERAL_PURPOSE_REGISTERS = 13;
constexpr unsigned BLOCK_IDX_REGISTER = 13;
constexpr unsigned BLOCK_DIM_REGISTER = 14;
constexpr unsigned THREAD_IDX_REGISTER = 15;

constexpr unsigned INSTRUCTION_BITS = 16;

// NZP condition bits (as stored in the per-lane condition register and the BRnzp mask)
constexpr uint8_t NZP_NEGATIVE = 0b100;
constexpr uint8_t NZP_ZERO     = 0b010;
constexpr uint8_t NZP_POSITIVE = 0b001;

// True for the opcodes the cores implement; every other 4-bit value is reserved
bool is_defined_opcode(uint8_t raw_opcode);

const char* mnemonic(Opcode op);

// Decoded view of one instruction word. All fields are extracted regardless
// of opcode, the way a hardware decoder wires them out.
struct Instruction {
    uint8_t raw_opcode;
    Opcode opcode;
    uint8_t rd;
    uint8_t rs;
    uint8_t rt;
    uint8_t immediate;
    uint8_t nzp;

    static Instruction decode(Word word);

    bool is_reserved() const { return !is_defined_opcode(raw_opcode); }
    bool is_memory_access() const { return opcode == Opcode::LDR || opcode == Opcode::STR; }
    bool writes_register() const;
};

// Encoders
Word encode(Opcode op, uint8_t rd, uint8_t rs, uint8_t rt);
Word encode_immediate(Opcode op, uint8_t rd, uint8_t immediate);
Word encode_branch(uint8_t nzp, uint8_t target);

// Human-readable form of one word, e.g. "ADD R0, R0, %threadIdx"
std::string disassemble(Word word);
std::string register_name(uint8_t reg);

} // namespace tgpu::isa
