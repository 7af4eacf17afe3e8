#include <catch2/catch_test_macros.hpp>

#include <tgpu/gpu_simulator.hpp>
#include <tgpu/gpu_config_loader.hpp>
#include "../test_utilities.hpp"

using namespace tgpu;

namespace {

std::vector<Word> run_matadd(const GPUSimulator::Config& config, GPUSimulator::Statistics* stats = nullptr) {
    GPUSimulator sim(config);
    sim.load_program(isa::Assembler::assemble(test::matadd_kernel()));
    test::load_matadd_operands(sim);
    REQUIRE(sim.launch(8));
    if (stats) *stats = sim.get_stats();
    return sim.dump_data_memory(16, 8);
}

std::vector<Word> run_matmul(const GPUSimulator::Config& config, GPUSimulator::Statistics* stats = nullptr) {
    GPUSimulator sim(config);
    sim.load_program(isa::Assembler::assemble(test::matmul_kernel()));
    sim.load_data(0, {1, 2, 3, 4});
    sim.load_data(4, {1, 2, 3, 4});
    REQUIRE(sim.launch(4));
    if (stats) *stats = sim.get_stats();
    return sim.dump_data_memory(8, 4);
}

const std::vector<Word> kMataddExpected{0, 2, 4, 6, 8, 10, 12, 14};
const std::vector<Word> kMatmulExpected{7, 10, 15, 22};

} // namespace

TEST_CASE("Kernels: matrix addition on the default device", "[system][kernel]") {
    GPUSimulator::Statistics stats;
    REQUIRE(run_matadd(GPUConfigLoader::create_default(), &stats) == kMataddExpected);

    REQUIRE(stats.blocks_retired == 2);
    REQUIRE(stats.instructions_issued == 2 * 13);
    REQUIRE(stats.lane_instructions == 8 * 13);
    REQUIRE(stats.loads == 16);
    REQUIRE(stats.stores == 8);
    REQUIRE(stats.data_reads == 16);
    REQUIRE(stats.data_writes == 8);
    REQUIRE(stats.program_reads == 2 * 13);
    REQUIRE(stats.divergent_branches == 0);
    REQUIRE(stats.launch_cycles > 0);
    REQUIRE(stats.launch_cycles <= stats.total_cycles);
}

TEST_CASE("Kernels: matrix multiplication on the default device", "[system][kernel]") {
    GPUSimulator::Statistics stats;
    REQUIRE(run_matmul(GPUConfigLoader::create_default(), &stats) == kMatmulExpected);
    REQUIRE(stats.blocks_retired == 1);
    REQUIRE(stats.loads == 4 * 2 * 2);
    REQUIRE(stats.divergent_branches == 0);
}

TEST_CASE("Kernels: results do not depend on memory timing", "[system][kernel][latency]") {
    Cycle previous = 0;
    for (Cycle latency : {1, 2, 4, 8}) {
        auto config = GPUConfigLoader::create_default();
        config.data_memory_latency_cycles = latency;
        config.program_memory_latency_cycles = latency;

        GPUSimulator::Statistics stats;
        REQUIRE(run_matmul(config, &stats) == kMatmulExpected);
        REQUIRE(stats.launch_cycles > previous);
        previous = stats.launch_cycles;
    }
}

TEST_CASE("Kernels: results do not depend on the device shape", "[system][kernel]") {
    SECTION("Single lane, single channel") {
        GPUSimulator::Statistics stats;
        REQUIRE(run_matadd(GPUConfigLoader::create_minimal(), &stats) == kMataddExpected);
        REQUIRE(stats.blocks_retired == 8);
    }
    SECTION("Wide device") {
        GPUSimulator::Statistics stats;
        REQUIRE(run_matadd(GPUConfigLoader::create_wide(), &stats) == kMataddExpected);
        REQUIRE(stats.blocks_retired == 1);
    }
    SECTION("One data channel shared by every lane") {
        auto config = GPUConfigLoader::create_default();
        config.data_memory_channels = 1;
        REQUIRE(run_matadd(config) == kMataddExpected);
    }
    SECTION("More blocks than cores") {
        auto config = GPUConfigLoader::create_default();
        config.threads_per_block = 2;
        GPUSimulator::Statistics stats;
        REQUIRE(run_matadd(config, &stats) == kMataddExpected);
        REQUIRE(stats.blocks_retired == 4);
    }
}

TEST_CASE("Kernels: partial last block leaves other lanes alone", "[system][kernel]") {
    GPUSimulator sim;
    sim.load_program(isa::Assembler::assemble(test::matadd_kernel()));
    test::load_matadd_operands(sim);
    sim.write_data_memory(21, 0xEE);

    REQUIRE(sim.launch(5));
    REQUIRE(sim.dump_data_memory(16, 5) == std::vector<Word>{0, 2, 4, 6, 8});
    REQUIRE(sim.read_data_memory(21) == 0xEE);
    REQUIRE(sim.get_dispatcher().get_block_records().back().thread_count == 1);
}

TEST_CASE("Kernels: divergent branches and reserved opcodes are counted", "[system][kernel]") {
    GPUSimulator sim;
    sim.load_program(isa::Assembler::assemble(R"(
CONST R0, #2
CMP %threadIdx, R0
BRn DONE
.word 0xB000
DONE:
STR %threadIdx, %threadIdx
RET
)"));
    REQUIRE(sim.launch(4));

    auto stats = sim.get_stats();
    REQUIRE(stats.divergent_branches == 1);
    REQUIRE(stats.reserved_opcodes == 0);   // lane 0 branches, so the core skips it
    REQUIRE(sim.dump_data_memory(0, 4) == std::vector<Word>{0, 1, 2, 3});
}

TEST_CASE("Kernels: run_until_done times out on a kernel that never returns", "[system][kernel]") {
    GPUSimulator sim;
    sim.load_program(isa::Assembler::assemble(R"(
CONST R0, #0
CMP R0, R0
LOOP:
BRz LOOP
RET
)"));

    REQUIRE(sim.write_device_control_register(4));
    REQUIRE(sim.start());
    REQUIRE_FALSE(sim.run_until_done(500));
    REQUIRE(sim.is_running());
    REQUIRE_FALSE(sim.is_done());
    REQUIRE(sim.get_current_cycle() == 500);
}

TEST_CASE("Kernels: programs must fit program memory", "[system]") {
    auto config = GPUConfigLoader::create_default();
    config.program_memory_address_bits = 4;
    GPUSimulator sim(config);

    REQUIRE_THROWS_AS(sim.load_program(std::vector<Word>(17, 0xF000)), std::out_of_range);
    REQUIRE_NOTHROW(sim.load_program(std::vector<Word>(16, 0xF000)));
    REQUIRE(sim.read_program_memory(15) == 0xF000);
}

TEST_CASE("Kernels: invalid device configuration is rejected", "[system][config]") {
    GPUSimulator::Config config;
    config.core_count = 0;
    config.program_memory_data_bits = 8;
    REQUIRE(config.validation_errors().size() == 2);
    REQUIRE_THROWS_AS(GPUSimulator(config), std::invalid_argument);

    GPUSimulator::Config wide_block;
    wide_block.threads_per_block = GPUSimulator::MAX_THREADS_PER_BLOCK + 1;
    REQUIRE(wide_block.validation_errors().size() == 1);
    REQUIRE_THROWS_AS(GPUSimulator(wide_block), std::invalid_argument);

    wide_block.threads_per_block = GPUSimulator::MAX_THREADS_PER_BLOCK;
    REQUIRE(wide_block.validation_errors().empty());
}
