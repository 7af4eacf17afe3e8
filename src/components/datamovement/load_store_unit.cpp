#include <tgpu/components/load_store_unit.hpp>
#include <stdexcept>

namespace tgpu {

void LoadStoreUnit::issue_load(Address addr, MemoryChannel& port) {
    if (state_ != State::IDLE) {
        throw std::logic_error("LoadStoreUnit: load issued while busy");
    }
    is_store_ = false;
    address_ = addr;
    port.read_address = addr;
    port.read_valid = true;
    state_ = State::WAITING;
}

void LoadStoreUnit::issue_store(Address addr, Word value, MemoryChannel& port) {
    if (state_ != State::IDLE) {
        throw std::logic_error("LoadStoreUnit: store issued while busy");
    }
    is_store_ = true;
    address_ = addr;
    data_ = value;
    port.write_address = addr;
    port.write_data = value;
    port.write_valid = true;
    state_ = State::WAITING;
}

bool LoadStoreUnit::update(MemoryChannel& port) {
    if (state_ != State::WAITING) return false;

    if (is_store_) {
        if (!port.write_ready) return false;
        port.write_valid = false;
    } else {
        if (!port.read_ready) return false;
        data_ = port.read_data;
        port.read_valid = false;
    }
    state_ = State::DONE;
    return true;
}

} // namespace tgpu
