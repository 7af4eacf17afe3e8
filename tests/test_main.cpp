#include <iostream>
#include <iomanip>
#include <tgpu/gpu_simulator.hpp>
#include <tgpu/gpu_config_loader.hpp>
#include <tgpu/isa/assembler.hpp>

#include "test_utilities.hpp"

namespace {

bool run_matadd(const tgpu::GPUSimulator::Config& config) {
    tgpu::GPUSimulator simulator(config);
    simulator.load_program(tgpu::isa::Assembler::assemble(tgpu::test::matadd_kernel()));
    tgpu::test::load_matadd_operands(simulator);

    if (!simulator.launch(8)) {
        std::cout << "ERROR: launch did not complete" << std::endl;
        simulator.print_component_status();
        return false;
    }

    auto result = simulator.dump_data_memory(16, 8);
    bool passed = true;
    for (size_t i = 0; i < result.size(); ++i) {
        if (result[i] != 2 * i) {
            std::cout << "ERROR: Position " << i << " expected " << 2 * i << " but got " << result[i] << std::endl;
            passed = false;
        }
    }
    simulator.print_stats();
    return passed;
}

} // namespace

int main() {
    std::cout << "=== TGPU Simulator Test ===" << std::endl;

    try {
        bool all_passed = true;

        // Test 1: Default configuration
        std::cout << "\n=== Test 1: Default Configuration ===" << std::endl;
        {
            bool success = run_matadd(tgpu::GPUConfigLoader::create_default());
            std::cout << "Default matadd test: " << (success ? "PASSED" : "FAILED") << std::endl;
            all_passed &= success;
        }

        // Test 2: Single core, single lane
        std::cout << "\n=== Test 2: Minimal Configuration ===" << std::endl;
        {
            bool success = run_matadd(tgpu::GPUConfigLoader::create_minimal());
            std::cout << "Minimal matadd test: " << (success ? "PASSED" : "FAILED") << std::endl;
            all_passed &= success;
        }

        // Test 3: Slow memory
        std::cout << "\n=== Test 3: Slow Memory ===" << std::endl;
        {
            auto config = tgpu::GPUConfigLoader::create_default();
            config.data_memory_latency_cycles = 6;
            config.data_memory_channels = 1;
            bool success = run_matadd(config);
            std::cout << "Slow memory matadd test: " << (success ? "PASSED" : "FAILED") << std::endl;
            all_passed &= success;
        }

        // Test 4: Component status and monitoring
        std::cout << "\n=== Test 4: Status Monitoring ===" << std::endl;
        {
            tgpu::GPUSimulator simulator(tgpu::GPUConfigLoader::create_wide());
            std::cout << "Created simulator with:" << std::endl;
            std::cout << "  " << simulator.get_core_count() << " cores" << std::endl;
            std::cout << "  " << simulator.get_data_memory().get_capacity() << " data words" << std::endl;
            std::cout << "  " << simulator.get_data_memory().get_channel_count() << " data channels" << std::endl;
            simulator.print_component_status();
            std::cout << "Status monitoring test: PASSED" << std::endl;
        }

        if (!all_passed) {
            std::cout << "\n=== Some Tests FAILED ===" << std::endl;
            return 1;
        }
        std::cout << "\n=== All Tests Completed Successfully! ===" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
