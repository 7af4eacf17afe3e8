/**
 * @file tgpu_disasm.cpp
 * @brief TGPU Kernel Disassembler
 *
 * Reads a kernel as assembly source (.asm) or as a list of hex instruction
 * words (.hex, one or more words per line, '#' or ';' starts a comment) and
 * prints an address-annotated listing.
 *
 * Usage:
 *   tgpu-disasm kernel.asm [options]
 *   tgpu-disasm kernel.hex [options]
 *   tgpu-disasm -w 0x50DE 0x30C0 ...
 *
 * Options:
 *   -h, --help          Show help
 *   -s, --summary       Show opcode histogram only
 *   -j, --json          Output as JSON
 *   -w, --words         Remaining arguments are instruction words
 */

#include <tgpu/isa/assembler.hpp>
#include <tgpu/isa/instruction.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <map>

using namespace tgpu;
using namespace tgpu::isa;

// ============================================================================
// Input
// ============================================================================

std::vector<Word> parse_words(std::istream& in) {
    std::vector<Word> words;
    std::string line;
    while (std::getline(in, line)) {
        size_t comment = line.find_first_of("#;");
        if (comment != std::string::npos) line.erase(comment);

        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            size_t consumed = 0;
            unsigned long value = std::stoul(token, &consumed, 16);
            if (consumed != token.size() || value > 0xFFFF) {
                throw std::runtime_error("Invalid instruction word: " + token);
            }
            words.push_back(static_cast<Word>(value));
        }
    }
    return words;
}

Program load_program(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext == ".asm" || ext == ".s") {
        return Assembler::assemble_file(path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    Program program;
    program.words = parse_words(file);
    return program;
}

// ============================================================================
// Output
// ============================================================================

void print_usage(const char* program_name) {
    std::cout << "TGPU Kernel Disassembler\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <kernel.asm|kernel.hex> [options]\n";
    std::cout << "  " << program_name << " -w <word> [<word> ...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -s, --summary       Show opcode histogram only\n";
    std::cout << "  -j, --json          Output as JSON\n";
    std::cout << "  -w, --words         Remaining arguments are hex instruction words\n";
}

void print_summary(const Program& program) {
    std::map<std::string, Size> histogram;
    for (Word w : program.words) {
        histogram[mnemonic(Instruction::decode(w).opcode)]++;
    }

    std::cout << "Instructions: " << program.size() << "\n";
    if (program.thread_count) {
        std::cout << "Threads:      " << *program.thread_count << "\n";
    }
    for (const auto& [name, count] : histogram) {
        std::cout << "  " << std::left << std::setw(10) << name << std::right << count << "\n";
    }
}

void print_json(const Program& program) {
    nlohmann::json j;
    if (program.thread_count) j["threads"] = *program.thread_count;

    j["instructions"] = nlohmann::json::array();
    for (Size pc = 0; pc < program.words.size(); ++pc) {
        Instruction in = Instruction::decode(program.words[pc]);
        std::ostringstream hex;
        hex << "0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << program.words[pc];
        j["instructions"].push_back({
            {"pc", pc},
            {"word", hex.str()},
            {"opcode", mnemonic(in.opcode)},
            {"text", disassemble(program.words[pc])}
        });
    }
    for (const auto& [name, addr] : program.labels) {
        j["labels"][name] = addr;
    }
    std::cout << j.dump(2) << "\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string filename;
    std::vector<std::string> word_args;
    bool summary_only = false;
    bool output_json = false;
    bool words_mode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (words_mode) {
            word_args.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--summary") {
            summary_only = true;
        } else if (arg == "-j" || arg == "--json") {
            output_json = true;
        } else if (arg == "-w" || arg == "--words") {
            words_mode = true;
        } else if (arg[0] != '-') {
            filename = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    try {
        Program program;
        if (words_mode) {
            std::string joined;
            for (const auto& w : word_args) joined += w + " ";
            std::istringstream in(joined);
            program.words = parse_words(in);
        } else if (!filename.empty()) {
            program = load_program(filename);
        } else {
            std::cerr << "Error: No input file specified\n";
            print_usage(argv[0]);
            return 1;
        }

        if (output_json) {
            print_json(program);
        } else if (summary_only) {
            print_summary(program);
        } else {
            std::cout << Assembler::listing(program);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
