#include <catch2/catch_test_macros.hpp>

#include <tgpu/isa/assembler.hpp>

#include <fstream>

#include "../test_utilities.hpp"

using namespace tgpu;
using namespace tgpu::isa;

TEST_CASE("Assembler: matrix addition kernel", "[isa][assembler]") {
    Program program = Assembler::assemble(test::matadd_kernel());

    REQUIRE(program.size() == 13);
    REQUIRE(program.thread_count.has_value());
    REQUIRE(*program.thread_count == 8);

    REQUIRE(program.words[0] == 0x50DE);    // MUL R0, %blockIdx, %blockDim
    REQUIRE(program.words[1] == 0x300F);    // ADD R0, R0, %threadIdx
    REQUIRE(program.words[4] == 0x9310);    // CONST R3, #16
    REQUIRE(program.words[6] == 0x7440);    // LDR R4, R4
    REQUIRE(program.words[11] == 0x8076);   // STR R7, R6
    REQUIRE(program.words[12] == 0xF000);   // RET
}

TEST_CASE("Assembler: labels resolve to instruction addresses", "[isa][assembler][labels]") {
    Program program = Assembler::assemble(test::matmul_kernel());

    REQUIRE(program.size() == 28);
    REQUIRE(program.labels.at("LOOP") == 12);
    REQUIRE(program.words[23] == 0x2092);   // CMP R9, R2
    REQUIRE(program.words[24] == 0x180C);   // BRn LOOP
}

TEST_CASE("Assembler: syntax variants", "[isa][assembler]") {
    SECTION("Case-insensitive mnemonics and registers") {
        Program program = Assembler::assemble("add r1, r2, %THREADIDX\n");
        REQUIRE(program.words[0] == encode(Opcode::ADD, 1, 2, THREAD_IDX_REGISTER));
    }

    SECTION("Hex immediates and raw words") {
        Program program = Assembler::assemble("CONST R2, #0x1F\n.word 0xA000\n");
        REQUIRE(program.words[0] == 0x921F);
        REQUIRE(program.words[1] == 0xA000);
    }

    SECTION("Leading zeros stay decimal") {
        Program program = Assembler::assemble("CONST R1, #010\nCONST R2, #09\n.word 0X0010\n");
        REQUIRE(program.words[0] == encode_immediate(Opcode::CONST, 1, 10));
        REQUIRE(program.words[1] == encode_immediate(Opcode::CONST, 2, 9));
        REQUIRE(program.words[2] == 0x0010);
        REQUIRE(disassemble(program.words[0]) == "CONST R1, #10");
    }

    SECTION("Label on the same line as an instruction") {
        Program program = Assembler::assemble("NOP\nTOP: CMP R0, R1\nBRnzp TOP\n");
        REQUIRE(program.labels.at("TOP") == 1);
        REQUIRE(program.words[2] == encode_branch(0b111, 1));
    }

    SECTION("Numeric branch targets and condition subsets") {
        Program program = Assembler::assemble("BRz #5\nBRzp 7\nBRpn 2\n");
        REQUIRE(program.words[0] == encode_branch(NZP_ZERO, 5));
        REQUIRE(program.words[1] == encode_branch(NZP_ZERO | NZP_POSITIVE, 7));
        REQUIRE(program.words[2] == encode_branch(NZP_NEGATIVE | NZP_POSITIVE, 2));
    }

    SECTION("Comments and blank lines are ignored") {
        Program program = Assembler::assemble("; header\n\n   ; indented comment\nRET ; done\n");
        REQUIRE(program.size() == 1);
        REQUIRE_FALSE(program.thread_count.has_value());
    }
}

TEST_CASE("Assembler: errors carry the source line", "[isa][assembler][errors]") {
    auto error_line = [](const std::string& source) -> size_t {
        try {
            Assembler::assemble(source);
        } catch (const AssemblerError& e) {
            return e.line();
        }
        return 0;
    };

    REQUIRE(error_line("NOP\nFOO R1\n") == 2);                  // unknown mnemonic
    REQUIRE(error_line("ADD R1, R2\n") == 1);                   // operand count
    REQUIRE(error_line("NOP\nNOP\nCONST R1, #256\n") == 3);     // immediate range
    REQUIRE(error_line("BRn NOWHERE\n") == 1);                  // undefined label
    REQUIRE(error_line("A: NOP\nA: NOP\n") == 2);               // duplicate label
    REQUIRE(error_line("ADD R16, R0, R0\n") == 1);              // bad register
    REQUIRE(error_line("BR #3\n") == 1);                        // missing condition
    REQUIRE(error_line(".threads 0\n") == 1);

    REQUIRE_THROWS_AS(Assembler::assemble("LDR R1, #4\n"), AssemblerError);
    REQUIRE_THROWS_AS(Assembler::assemble("CONST R1, #12abc\n"), std::runtime_error);
}

TEST_CASE("Assembler: files and listings", "[isa][assembler][file]") {
    auto path = test::get_test_output_path("matadd_test.asm");
    {
        std::ofstream out(path);
        out << test::matadd_kernel();
    }

    Program program = Assembler::assemble_file(path);
    REQUIRE(program.size() == 13);

    std::string listing = Assembler::listing(program);
    REQUIRE(listing.find(".threads 8") != std::string::npos);
    REQUIRE(listing.find("MUL R0, %blockIdx, %blockDim") != std::string::npos);

    REQUIRE_THROWS_AS(Assembler::assemble_file(test::get_test_output_path("does_not_exist.asm")),
                      std::runtime_error);
}
