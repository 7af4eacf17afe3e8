#include <catch2/catch_test_macros.hpp>

#include <tgpu/gpu_simulator.hpp>
#include "../test_utilities.hpp"

using namespace tgpu;

class ResetFixture {
public:
    GPUSimulator sim;

    ResetFixture() {
        sim.load_program(isa::Assembler::assemble(test::matadd_kernel()));
        test::load_matadd_operands(sim);
    }
};

TEST_CASE_METHOD(ResetFixture, "Reset: control writes are ignored while running", "[system][control]") {
    REQUIRE_FALSE(sim.start());                     // nothing configured
    REQUIRE(sim.write_device_control_register(8));
    REQUIRE(sim.start());
    sim.step();

    REQUIRE_FALSE(sim.write_device_control_register(2));
    REQUIRE_FALSE(sim.start());
    REQUIRE_THROWS_AS(sim.load_program(std::vector<Word>{0xF000}), std::logic_error);

    REQUIRE(sim.run_until_done());
    REQUIRE(sim.get_dispatcher().get_thread_count() == 8u);
    REQUIRE(sim.get_stats().rejected_control_operations == 3);
    REQUIRE(sim.dump_data_memory(16, 8) == std::vector<Word>{0, 2, 4, 6, 8, 10, 12, 14});
}

TEST_CASE_METHOD(ResetFixture, "Reset: run_until_done without a launch", "[system][control]") {
    REQUIRE_FALSE(sim.run_until_done(10));
    REQUIRE(sim.get_current_cycle() == 0);

    REQUIRE(sim.launch(8));
    const Cycle after = sim.get_current_cycle();
    REQUIRE(sim.run_until_done(10));                // done stays asserted
    REQUIRE(sim.get_current_cycle() == after);
}

TEST_CASE_METHOD(ResetFixture, "Reset: aborting a launch and relaunching", "[system][reset]") {
    REQUIRE(sim.write_device_control_register(8));
    REQUIRE(sim.start());
    for (int i = 0; i < 12; ++i) sim.step();
    REQUIRE(sim.is_running());

    const Cycle before = sim.get_current_cycle();
    sim.reset();

    REQUIRE_FALSE(sim.is_running());
    REQUIRE_FALSE(sim.is_done());
    REQUIRE(sim.get_current_cycle() == before);
    for (size_t c = 0; c < sim.get_core_count(); ++c) {
        REQUIRE(sim.get_core(c).is_idle());
    }
    REQUIRE_FALSE(sim.get_data_memory_controller().is_busy());
    REQUIRE_FALSE(sim.get_program_memory_controller().is_busy());

    // Memory survives, the thread count does not
    REQUIRE(sim.read_data_memory(7) == 7);
    REQUIRE(sim.read_program_memory(12) == 0xF000);
    REQUIRE_FALSE(sim.start());

    REQUIRE(sim.launch(8));
    REQUIRE(sim.dump_data_memory(16, 8) == std::vector<Word>{0, 2, 4, 6, 8, 10, 12, 14});
}

TEST_CASE_METHOD(ResetFixture, "Reset: back-to-back launches", "[system][reset]") {
    REQUIRE(sim.launch(8));
    const Cycle first = sim.get_stats().launch_cycles;

    sim.load_data(0, {1, 1, 1, 1, 1, 1, 1, 1});
    REQUIRE(sim.start());                           // thread count persists
    REQUIRE(sim.run_until_done());

    REQUIRE(sim.get_stats().launch_cycles == first);
    REQUIRE(sim.dump_data_memory(16, 8) == std::vector<Word>{1, 2, 3, 4, 5, 6, 7, 8});
    REQUIRE(sim.get_dispatcher().get_stats().launches == 2);
}
