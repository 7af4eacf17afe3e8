#pragma once
// Two-pass assembler for TGPU kernels
//
// Source format, one statement per line:
//
//   ; comment
//   .threads 8                  ; thread count to write into the control register
//   LOOP:                       ; label (may share a line with an instruction)
//   MUL R0, %blockIdx, %blockDim
//   CONST R1, #8
//   BRn LOOP                    ; BR followed by any non-empty subset of n, z, p
//   .word 0xA000                ; raw instruction word

#include <tgpu/concepts.hpp>
#include <tgpu/isa/instruction.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tgpu::isa {

/**
 * @brief Error thrown when kernel source cannot be assembled
 */
class AssemblerError : public std::runtime_error {
public:
    AssemblerError(size_t line, const std::string& msg)
        : std::runtime_error("Assembler error (line " + std::to_string(line) + "): " + msg)
        , line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

/**
 * @brief An assembled kernel
 */
struct Program {
    std::vector<Word> words;
    std::optional<uint32_t> thread_count;       // from the .threads directive
    std::map<std::string, Address> labels;

    Size size() const { return words.size(); }
    bool empty() const { return words.empty(); }
};

class Assembler {
public:
    /**
     * @brief Assemble kernel source text
     * @throws AssemblerError on the first malformed statement
     */
    static Program assemble(const std::string& source);

    /**
     * @brief Assemble a kernel source file
     * @throws std::runtime_error if the file cannot be read
     * @throws AssemblerError on malformed source
     */
    static Program assemble_file(const std::filesystem::path& path);

    /**
     * @brief Produce an address-annotated listing of a program
     */
    static std::string listing(const Program& program);
};

} // namespace tgpu::isa
