#include <catch2/catch_test_macros.hpp>

#include <tgpu/components/register_file.hpp>

using namespace tgpu;

TEST_CASE("RegisterFile: identity registers", "[compute][registers]") {
    RegisterFile regs(8);
    regs.assign(3, 4, 2);

    REQUIRE(regs.read(isa::BLOCK_IDX_REGISTER) == 3);
    REQUIRE(regs.read(isa::BLOCK_DIM_REGISTER) == 4);
    REQUIRE(regs.read(isa::THREAD_IDX_REGISTER) == 2);
    REQUIRE(regs.block_idx() == 3);
    REQUIRE(regs.block_dim() == 4);
    REQUIRE(regs.thread_idx() == 2);

    SECTION("Writes to identity registers are ignored") {
        regs.write(isa::BLOCK_IDX_REGISTER, 99);
        regs.write(isa::BLOCK_DIM_REGISTER, 99);
        regs.write(isa::THREAD_IDX_REGISTER, 99);
        REQUIRE(regs.block_idx() == 3);
        REQUIRE(regs.block_dim() == 4);
        REQUIRE(regs.thread_idx() == 2);
    }
}

TEST_CASE("RegisterFile: general purpose registers", "[compute][registers]") {
    RegisterFile regs(8);
    regs.assign(0, 4, 0);

    for (uint8_t r = 0; r < isa::GENERAL_PURPOSE_REGISTERS; ++r) {
        REQUIRE(regs.read(r) == 0);
        regs.write(r, static_cast<Word>(r * 10));
    }
    for (uint8_t r = 0; r < isa::GENERAL_PURPOSE_REGISTERS; ++r) {
        REQUIRE(regs.read(r) == r * 10);
    }

    regs.write(0, 0x1FF);
    REQUIRE(regs.read(0) == 0xFF);      // masked to 8 bits

    REQUIRE_THROWS_AS(regs.read(16), std::out_of_range);
    REQUIRE_THROWS_AS(regs.write(16, 1), std::out_of_range);
}

TEST_CASE("RegisterFile: assign clears prior block state", "[compute][registers]") {
    RegisterFile regs(8);
    regs.assign(0, 4, 1);
    regs.write(5, 77);
    regs.set_nzp(isa::NZP_POSITIVE);

    regs.assign(1, 4, 1);
    REQUIRE(regs.read(5) == 0);
    REQUIRE(regs.get_nzp() == 0);
    REQUIRE(regs.block_idx() == 1);

    regs.reset();
    REQUIRE(regs.block_idx() == 0);
    REQUIRE(regs.thread_idx() == 0);
}
