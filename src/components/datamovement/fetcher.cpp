#include <tgpu/components/fetcher.hpp>
#include <stdexcept>

namespace tgpu {

void Fetcher::request(Address pc, MemoryChannel& port) {
    if (state_ != State::IDLE) {
        throw std::logic_error("Fetcher: request issued while a fetch is outstanding");
    }
    pc_ = pc;
    port.read_address = pc;
    port.read_valid = true;
    state_ = State::FETCHING;
}

bool Fetcher::update(MemoryChannel& port) {
    if (state_ != State::FETCHING || !port.read_ready) return false;
    instruction_ = port.read_data;
    port.read_valid = false;
    state_ = State::FETCHED;
    return true;
}

Word Fetcher::take() {
    if (state_ != State::FETCHED) {
        throw std::logic_error("Fetcher: no instruction available");
    }
    state_ = State::IDLE;
    return instruction_;
}

} // namespace tgpu
