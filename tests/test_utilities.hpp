#pragma once

#include <string>
#include <filesystem>
#include <vector>

#include <tgpu/gpu_simulator.hpp>
#include <tgpu/isa/assembler.hpp>

namespace tgpu::test {

/**
 * @brief Get the directory for test output files
 *
 * Creates and returns a "tgpu_sim_test_output" directory under the system
 * temp directory.
 */
inline std::filesystem::path get_test_output_dir() {
    auto temp_dir = std::filesystem::temp_directory_path() / "tgpu_sim_test_output";

    if (!std::filesystem::exists(temp_dir)) {
        std::filesystem::create_directories(temp_dir);
    }

    return temp_dir;
}

inline std::string get_test_output_path(const std::string& filename) {
    return (get_test_output_dir() / filename).string();
}

// C[i] = A[i] + B[i] with A at 0, B at 8, C at 16
inline const char* matadd_kernel() {
    return R"(
.threads 8
MUL R0, %blockIdx, %blockDim
ADD R0, R0, %threadIdx
CONST R1, #0
CONST R2, #8
CONST R3, #16
ADD R4, R1, R0
LDR R4, R4
ADD R5, R2, R0
LDR R5, R5
ADD R6, R4, R5
ADD R7, R3, R0
STR R7, R6
RET
)";
}

// 2x2 C = A * B with A at 0, B at 4, C at 8
inline const char* matmul_kernel() {
    return R"(
.threads 4
MUL R0, %blockIdx, %blockDim
ADD R0, R0, %threadIdx
CONST R1, #1
CONST R2, #2
CONST R3, #0
CONST R4, #4
CONST R5, #8
DIV R6, R0, R2
MUL R7, R6, R2
SUB R7, R0, R7
CONST R8, #0
CONST R9, #0
LOOP:
MUL R10, R6, R2
ADD R10, R10, R9
ADD R10, R10, R3
LDR R10, R10
MUL R11, R9, R2
ADD R11, R11, R7
ADD R11, R11, R4
LDR R11, R11
MUL R12, R10, R11
ADD R8, R8, R12
ADD R9, R9, R1
CMP R9, R2
BRn LOOP
ADD R9, R5, R0
STR R9, R8
RET
)";
}

// Load the matrix-add operands A = B = 0..7
inline void load_matadd_operands(GPUSimulator& sim) {
    std::vector<Word> values{0, 1, 2, 3, 4, 5, 6, 7};
    sim.load_data(0, values);
    sim.load_data(8, values);
}

} // namespace tgpu::test
