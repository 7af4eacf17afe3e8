#pragma once

#include <tgpu/concepts.hpp>

namespace tgpu {

// Signal bundle of one valid/ready memory port.
//
// The same bundle is used on both sides of a MemoryController: as a consumer
// port between a requester (fetcher or load/store unit) and the controller,
// and as a physical channel between the controller and an ExternalMemory.
// A request transfers on the cycle where valid and ready both hold; the
// requester keeps valid, address and data stable until it observes ready.
struct MemoryChannel {
    // requester -> memory
    bool read_valid = false;
    Address read_address = 0;
    bool write_valid = false;
    Address write_address = 0;
    Word write_data = 0;

    // memory -> requester
    bool read_ready = false;
    Word read_data = 0;
    bool write_ready = false;

    bool has_request() const { return read_valid || write_valid; }

    void reset() { *this = MemoryChannel{}; }
};

} // namespace tgpu
