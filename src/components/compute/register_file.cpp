#include <tgpu/components/register_file.hpp>
#include <stdexcept>
#include <string>

namespace tgpu {

RegisterFile::RegisterFile(unsigned data_bits)
    : registers_{}
    , nzp_(0)
    , mask_(static_cast<Word>(width_mask(data_bits))) {
    if (data_bits == 0 || data_bits > 16) {
        throw std::invalid_argument("RegisterFile: data_bits must be in 1..16");
    }
}

void RegisterFile::assign(uint32_t block_idx, uint32_t block_dim, uint32_t thread_idx) {
    registers_.fill(0);
    nzp_ = 0;
    registers_[isa::BLOCK_IDX_REGISTER] = static_cast<Word>(block_idx & mask_);
    registers_[isa::BLOCK_DIM_REGISTER] = static_cast<Word>(block_dim & mask_);
    registers_[isa::THREAD_IDX_REGISTER] = static_cast<Word>(thread_idx & mask_);
}

Word RegisterFile::read(uint8_t reg) const {
    if (reg >= isa::REGISTER_COUNT) {
        throw std::out_of_range("RegisterFile: register index " + std::to_string(reg) + " out of range");
    }
    return registers_[reg];
}

void RegisterFile::write(uint8_t reg, Word value) {
    if (reg >= isa::REGISTER_COUNT) {
        throw std::out_of_range("RegisterFile: register index " + std::to_string(reg) + " out of range");
    }
    // Identity registers are read-only
    if (reg >= isa::GENERAL_PURPOSE_REGISTERS) return;
    registers_[reg] = static_cast<Word>(value & mask_);
}

void RegisterFile::reset() {
    registers_.fill(0);
    nzp_ = 0;
}

} // namespace tgpu
