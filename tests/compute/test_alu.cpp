#include <catch2/catch_test_macros.hpp>

#include <tgpu/components/alu.hpp>

using namespace tgpu;
using isa::Opcode;

TEST_CASE("ALU: arithmetic wraps at the data width", "[compute][alu]") {
    ALU alu(8);

    REQUIRE(alu.execute(Opcode::ADD, 3, 4) == 7);
    REQUIRE(alu.execute(Opcode::ADD, 200, 100) == 44);     // 300 mod 256
    REQUIRE(alu.execute(Opcode::SUB, 10, 3) == 7);
    REQUIRE(alu.execute(Opcode::SUB, 3, 10) == 249);       // -7 mod 256
    REQUIRE(alu.execute(Opcode::MUL, 16, 17) == 16);       // 272 mod 256
    REQUIRE(alu.execute(Opcode::DIV, 7, 2) == 3);
}

TEST_CASE("ALU: division by zero yields zero", "[compute][alu]") {
    ALU alu(8);
    REQUIRE(alu.execute(Opcode::DIV, 42, 0) == 0);
    REQUIRE(alu.execute(Opcode::DIV, 0, 0) == 0);
}

TEST_CASE("ALU: wider data paths", "[compute][alu]") {
    ALU alu(16);
    REQUIRE(alu.execute(Opcode::ADD, 300, 400) == 700);
    REQUIRE(alu.execute(Opcode::MUL, 256, 256) == 0);      // 65536 mod 65536
    REQUIRE(alu.constant(0xFF) == 0xFF);

    ALU narrow(4);
    REQUIRE(narrow.execute(Opcode::ADD, 9, 9) == 2);
    REQUIRE(narrow.constant(0x1F) == 0xF);
}

TEST_CASE("ALU: unsigned comparison sets exactly one NZP bit", "[compute][alu][cmp]") {
    REQUIRE(ALU::compare(1, 2) == isa::NZP_NEGATIVE);
    REQUIRE(ALU::compare(2, 2) == isa::NZP_ZERO);
    REQUIRE(ALU::compare(3, 2) == isa::NZP_POSITIVE);
    REQUIRE(ALU::compare(255, 0) == isa::NZP_POSITIVE);    // no sign interpretation
}

TEST_CASE("ALU: invalid use", "[compute][alu]") {
    REQUIRE_THROWS_AS(ALU(0), std::invalid_argument);
    REQUIRE_THROWS_AS(ALU(17), std::invalid_argument);
    ALU alu(8);
    REQUIRE_THROWS_AS(alu.execute(Opcode::LDR, 1, 2), std::invalid_argument);
}
