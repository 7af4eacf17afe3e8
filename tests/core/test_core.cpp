#include <catch2/catch_test_macros.hpp>

#include <tgpu/components/core.hpp>
#include <tgpu/components/memory_controller.hpp>
#include <tgpu/memory/external_memory.hpp>
#include <tgpu/isa/assembler.hpp>

#include <stdexcept>

using namespace tgpu;

// One core wired to its own program and data memories
class CoreFixture {
public:
    static constexpr Size kLanes = 4;

    ExternalMemory program_memory;
    ExternalMemory data_memory;
    MemoryController program_controller;
    MemoryController data_controller;
    Core core;
    Cycle cycle = 0;

    explicit CoreFixture(Cycle data_latency = 1, Size data_channels = 4)
        : program_memory(8, 16, 1, 1, false)
        , data_memory(8, 8, data_channels, data_latency)
        , program_controller(trace::ComponentType::PROGRAM_MEMORY_CONTROLLER, 1, 1, false)
        , data_controller(trace::ComponentType::DATA_MEMORY_CONTROLLER, kLanes, data_channels, true)
        , core(0, kLanes) {}

    void load(const std::string& source) {
        auto program = isa::Assembler::assemble(source);
        program_memory.load(0, program.words);
    }

    void tick() {
        ++cycle;
        core.update(cycle, program_controller.consumer_port(0), data_controller.consumer_ports());
        program_controller.update(cycle, program_memory.channels());
        data_controller.update(cycle, data_memory.channels());
        program_memory.update(cycle);
        data_memory.update(cycle);
    }

    bool run(uint32_t threads, Cycle limit = 2000) {
        core.start_block(0, threads);
        Cycle start = cycle;
        while (!core.is_done() && cycle - start < limit) tick();
        return core.is_done();
    }
};

TEST_CASE("Core: start_block loads identity registers", "[core]") {
    Core core(1, 4);
    REQUIRE(core.is_idle());

    core.start_block(3, 2);
    REQUIRE(core.get_state() == Core::State::FETCHING);
    REQUIRE(core.get_pc() == 0);
    REQUIRE(core.get_active_lane_count() == 2);
    REQUIRE(core.is_lane_active(1));
    REQUIRE_FALSE(core.is_lane_active(2));

    for (Size lane = 0; lane < 4; ++lane) {
        const auto& regs = core.get_registers(lane);
        REQUIRE(regs.block_idx() == 3);
        REQUIRE(regs.block_dim() == 4);
        REQUIRE(regs.thread_idx() == lane);
    }

    REQUIRE_THROWS_AS(core.start_block(4, 1), std::logic_error);
}

TEST_CASE("Core: start_block rejects bad thread counts", "[core]") {
    Core core(0, 4);
    REQUIRE_THROWS_AS(core.start_block(0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(core.start_block(0, 5), std::invalid_argument);
    REQUIRE(core.is_idle());
    REQUIRE_THROWS_AS(core.release(), std::logic_error);
}

TEST_CASE("Fetcher: one outstanding instruction at a time", "[core][fetcher]") {
    Fetcher fetcher;
    MemoryChannel port;

    REQUIRE_FALSE(fetcher.has_instruction());
    REQUIRE_THROWS_AS(fetcher.take(), std::logic_error);

    fetcher.request(6, port);
    REQUIRE(port.read_valid);
    REQUIRE(port.read_address == 6);
    REQUIRE(fetcher.get_pc() == 6);
    REQUIRE_THROWS_AS(fetcher.request(7, port), std::logic_error);

    // Nothing arrives until the port reports ready
    REQUIRE_FALSE(fetcher.update(port));
    REQUIRE_FALSE(fetcher.has_instruction());

    port.read_data = 0x9310;
    port.read_ready = true;
    REQUIRE(fetcher.update(port));
    REQUIRE_FALSE(port.read_valid);
    REQUIRE(fetcher.has_instruction());
    REQUIRE(fetcher.get_instruction() == 0x9310);
    REQUIRE(fetcher.get_pc() == 6);

    REQUIRE(fetcher.take() == 0x9310);
    REQUIRE_FALSE(fetcher.has_instruction());
    REQUIRE(fetcher.get_state() == Fetcher::State::IDLE);
}

TEST_CASE_METHOD(CoreFixture, "Core: arithmetic runs in lock step", "[core][execute]") {
    load(R"(
CONST R0, #10
ADD R1, R0, %threadIdx
MUL R2, R1, %blockDim
SUB R3, R2, R0
RET
)");
    REQUIRE(run(4));

    for (Size lane = 0; lane < kLanes; ++lane) {
        const auto& regs = core.get_registers(lane);
        REQUIRE(regs.read(1) == 10 + lane);
        REQUIRE(regs.read(2) == (10 + lane) * 4);
        REQUIRE(regs.read(3) == (10 + lane) * 4 - 10);
    }

    const auto& stats = core.get_stats();
    REQUIRE(stats.instructions_issued == 5);
    REQUIRE(stats.lane_instructions == 20);
    REQUIRE(stats.fetches == 5);
    REQUIRE(stats.blocks_completed == 1);
    REQUIRE(core.get_active_lane_count() == 0);

    core.release();
    REQUIRE(core.is_idle());
}

TEST_CASE_METHOD(CoreFixture, "Core: inactive lanes are untouched", "[core][execute]") {
    load(R"(
CONST R0, #7
ADD R1, R0, %threadIdx
STR R1, R0
RET
)");
    REQUIRE(run(2));

    REQUIRE(core.get_registers(0).read(0) == 7);
    REQUIRE(core.get_registers(1).read(0) == 7);
    REQUIRE(core.get_registers(2).read(0) == 0);
    REQUIRE(core.get_registers(3).read(0) == 0);

    // Only two lanes stored
    REQUIRE(data_memory.read(7) == 7);
    REQUIRE(data_memory.read(8) == 7);
    REQUIRE(data_memory.read(9) == 0);
    REQUIRE(core.get_stats().stores == 2);
}

TEST_CASE_METHOD(CoreFixture, "Core: loads and stores through the data controller", "[core][memory]") {
    data_memory.load(0, {5, 6, 7, 8});
    load(R"(
LDR R0, %threadIdx
ADD R0, R0, R0
CONST R1, #32
ADD R1, R1, %threadIdx
STR R1, R0
RET
)");
    REQUIRE(run(4));

    REQUIRE(data_memory.dump(32, 4) == std::vector<Word>{10, 12, 14, 16});
    REQUIRE(core.get_stats().loads == 4);
    REQUIRE(core.get_stats().stores == 4);
    REQUIRE(core.get_stats().memory_stall_cycles > 0);
    REQUIRE(data_controller.get_stats().reads_completed == 4);
    REQUIRE(data_controller.get_stats().writes_completed == 4);
}

TEST_CASE("Core: fewer channels than lanes only costs cycles", "[core][memory]") {
    CoreFixture wide(1, 4);
    CoreFixture narrow(3, 1);
    const char* source = R"(
LDR R0, %threadIdx
STR %threadIdx, R0
RET
)";
    for (CoreFixture* f : {&wide, &narrow}) {
        f->data_memory.load(0, {1, 2, 3, 4});
        f->load(source);
        REQUIRE(f->run(4));
    }

    // Each lane loads address lane and stores the same value back
    REQUIRE(narrow.data_memory.dump(0, 4) == wide.data_memory.dump(0, 4));
    REQUIRE(narrow.data_memory.dump(0, 4) == std::vector<Word>{1, 2, 3, 4});
    REQUIRE(narrow.cycle > wide.cycle);
    REQUIRE(narrow.core.get_stats().memory_stall_cycles > wide.core.get_stats().memory_stall_cycles);
}

TEST_CASE_METHOD(CoreFixture, "Core: uniform loop with CMP and BRn", "[core][branch]") {
    load(R"(
CONST R0, #0
CONST R1, #1
CONST R2, #5
LOOP:
ADD R0, R0, R1
CMP R0, R2
BRn LOOP
RET
)");
    REQUIRE(run(4));

    for (Size lane = 0; lane < kLanes; ++lane) {
        REQUIRE(core.get_registers(lane).read(0) == 5);
        REQUIRE(core.get_registers(lane).get_nzp() == isa::NZP_ZERO);
    }
    REQUIRE(core.get_stats().divergent_branches == 0);
    REQUIRE(core.get_stats().instructions_issued == 3 + 5 * 3 + 1);
}

TEST_CASE_METHOD(CoreFixture, "Core: divergent branch follows the lowest active lane", "[core][branch]") {
    // Lane 0 compares 0 < 2 (negative, taken), lanes 2 and 3 are positive
    load(R"(
CONST R0, #2
CONST R1, #0
CMP %threadIdx, R0
BRn SKIP
CONST R1, #9
SKIP:
RET
)");
    REQUIRE(run(4));

    REQUIRE(core.get_stats().divergent_branches == 1);
    for (Size lane = 0; lane < kLanes; ++lane) {
        REQUIRE(core.get_registers(lane).read(1) == 0);
    }
}

TEST_CASE_METHOD(CoreFixture, "Core: reserved opcodes execute as NOP", "[core][execute]") {
    load(R"(
CONST R0, #3
.word 0xA123
.word 0xE000
ADD R0, R0, R0
RET
)");
    REQUIRE(run(1));

    REQUIRE(core.get_registers(0).read(0) == 6);
    REQUIRE(core.get_stats().reserved_opcodes == 2);
    REQUIRE(core.get_stats().instructions_issued == 5);
}

TEST_CASE_METHOD(CoreFixture, "Core: writes to identity registers are ignored", "[core][execute]") {
    load(R"(
CONST %blockIdx, #99
CONST %threadIdx, #99
RET
)");
    REQUIRE(run(4));

    REQUIRE(core.get_registers(2).block_idx() == 0);
    REQUIRE(core.get_registers(2).thread_idx() == 2);
}

TEST_CASE_METHOD(CoreFixture, "Core: reset returns to idle", "[core][reset]") {
    load(R"(
CONST R0, #1
RET
)");
    core.start_block(0, 4);
    tick();
    tick();
    REQUIRE_FALSE(core.is_idle());

    core.reset();
    REQUIRE(core.is_idle());
    REQUIRE(core.get_pc() == 0);
    REQUIRE(core.get_stats().fetches == 0);
    REQUIRE(core.get_active_lane_count() == 0);
}

TEST_CASE("Core: state names", "[core]") {
    REQUIRE(std::string(to_string(Core::State::IDLE)) == "IDLE");
    REQUIRE(std::string(to_string(Core::State::EXECUTING)) == "EXECUTING");
    REQUIRE(std::string(to_string(Core::State::DONE)) == "DONE");
}
