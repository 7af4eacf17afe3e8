#include <tgpu/isa/instruction.hpp>

#include <iomanip>
#include <sstream>

namespace tgpu::isa {

bool is_defined_opcode(uint8_t raw_opcode) {
    return raw_opcode <= static_cast<uint8_t>(Opcode::CONST) ||
           raw_opcode == static_cast<uint8_t>(Opcode::RET);
}

const char* mnemonic(Opcode op) {
    switch (op) {
        case Opcode::NOP: return "NOP";
        case Opcode::BRNZP: return "BRnzp";
        case Opcode::CMP: return "CMP";
        case Opcode::ADD: return "ADD";
        case Opcode::SUB: return "SUB";
        case Opcode::MUL: return "MUL";
        case Opcode::DIV: return "DIV";
        case Opcode::LDR: return "LDR";
        case Opcode::STR: return "STR";
        case Opcode::CONST: return "CONST";
        case Opcode::RET: return "RET";
        default: return "RESERVED";
    }
}

Instruction Instruction::decode(Word word) {
    Instruction instr;
    instr.raw_opcode = static_cast<uint8_t>((word >> 12) & 0xF);
    instr.opcode = static_cast<Opcode>(instr.raw_opcode);
    instr.rd = static_cast<uint8_t>((word >> 8) & 0xF);
    instr.rs = static_cast<uint8_t>((word >> 4) & 0xF);
    instr.rt = static_cast<uint8_t>(word & 0xF);
    instr.immediate = static_cast<uint8_t>(word & 0xFF);
    instr.nzp = static_cast<uint8_t>((word >> 9) & 0x7);
    return instr;
}

bool Instruction::writes_register() const {
    switch (opcode) {
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::MUL:
        case Opcode::DIV:
        case Opcode::LDR:
        case Opcode::CONST:
            return true;
        default:
            return false;
    }
}

Word encode(Opcode op, uint8_t rd, uint8_t rs, uint8_t rt) {
    return static_cast<Word>((static_cast<unsigned>(op) << 12) |
                             ((rd & 0xFu) << 8) | ((rs & 0xFu) << 4) | (rt & 0xFu));
}

Word encode_immediate(Opcode op, uint8_t rd, uint8_t immediate) {
    return static_cast<Word>((static_cast<unsigned>(op) << 12) | ((rd & 0xFu) << 8) | immediate);
}

Word encode_branch(uint8_t nzp, uint8_t target) {
    return static_cast<Word>((static_cast<unsigned>(Opcode::BRNZP) << 12) |
                             ((nzp & 0x7u) << 9) | target);
}

std::string register_name(uint8_t reg) {
    switch (reg) {
        case BLOCK_IDX_REGISTER: return "%blockIdx";
        case BLOCK_DIM_REGISTER: return "%blockDim";
        case THREAD_IDX_REGISTER: return "%threadIdx";
        default: return "R" + std::to_string(reg);
    }
}

std::string disassemble(Word word) {
    Instruction instr = Instruction::decode(word);
    std::ostringstream oss;

    if (instr.is_reserved()) {
        oss << ".word 0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << word;
        return oss.str();
    }

    switch (instr.opcode) {
        case Opcode::NOP:
        case Opcode::RET:
            oss << mnemonic(instr.opcode);
            break;
        case Opcode::BRNZP: {
            oss << "BR";
            if (instr.nzp & NZP_NEGATIVE) oss << 'n';
            if (instr.nzp & NZP_ZERO) oss << 'z';
            if (instr.nzp & NZP_POSITIVE) oss << 'p';
            oss << " #" << static_cast<unsigned>(instr.immediate);
            break;
        }
        case Opcode::CMP:
            oss << "CMP " << register_name(instr.rs) << ", " << register_name(instr.rt);
            break;
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::MUL:
        case Opcode::DIV:
            oss << mnemonic(instr.opcode) << ' ' << register_name(instr.rd) << ", "
                << register_name(instr.rs) << ", " << register_name(instr.rt);
            break;
        case Opcode::LDR:
            oss << "LDR " << register_name(instr.rd) << ", " << register_name(instr.rs);
            break;
        case Opcode::STR:
            oss << "STR " << register_name(instr.rs) << ", " << register_name(instr.rt);
            break;
        case Opcode::CONST:
            oss << "CONST " << register_name(instr.rd) << ", #" << static_cast<unsigned>(instr.immediate);
            break;
    }
    return oss.str();
}

} // namespace tgpu::isa
