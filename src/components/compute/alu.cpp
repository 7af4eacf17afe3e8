#include <tgpu/components/alu.hpp>
#include <stdexcept>
#include <string>

namespace tgpu {

ALU::ALU(unsigned data_bits)
    : data_bits_(data_bits)
    , mask_(static_cast<Word>(width_mask(data_bits))) {
    if (data_bits == 0 || data_bits > 16) {
        throw std::invalid_argument("ALU: data_bits must be in 1..16");
    }
}

Word ALU::execute(isa::Opcode op, Word rs, Word rt) const {
    const uint32_t a = rs & mask_;
    const uint32_t b = rt & mask_;

    switch (op) {
        case isa::Opcode::ADD: return static_cast<Word>((a + b) & mask_);
        case isa::Opcode::SUB: return static_cast<Word>((a - b) & mask_);
        case isa::Opcode::MUL: return static_cast<Word>((a * b) & mask_);
        case isa::Opcode::DIV: return b == 0 ? Word{0} : static_cast<Word>((a / b) & mask_);
        default:
            throw std::invalid_argument(std::string("ALU: unsupported opcode ") + isa::mnemonic(op));
    }
}

uint8_t ALU::compare(Word rs, Word rt) {
    if (rs < rt) return isa::NZP_NEGATIVE;
    if (rs == rt) return isa::NZP_ZERO;
    return isa::NZP_POSITIVE;
}

} // namespace tgpu
