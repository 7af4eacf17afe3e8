/**
 * @file matrix_multiply.cpp
 * @brief 2x2 matrix multiplication on the TGPU with a CMP/BRn loop
 *
 * Runs the kernel once per data memory latency to show how memory stalls
 * dominate the cycle count of a lock-step core.
 */

#include <tgpu/gpu_simulator.hpp>
#include <tgpu/isa/assembler.hpp>
#include <iostream>
#include <iomanip>
#include <vector>

namespace {

const char* kMatMulKernel = R"(
.threads 4
MUL R0, %blockIdx, %blockDim
ADD R0, R0, %threadIdx          ; i
CONST R1, #1                    ; increment
CONST R2, #2                    ; N
CONST R3, #0                    ; baseA
CONST R4, #4                    ; baseB
CONST R5, #8                    ; baseC
DIV R6, R0, R2                  ; row
MUL R7, R6, R2
SUB R7, R0, R7                  ; col
CONST R8, #0                    ; acc
CONST R9, #0                    ; k
LOOP:
    MUL R10, R6, R2
    ADD R10, R10, R9
    ADD R10, R10, R3
    LDR R10, R10                ; A[row * N + k]
    MUL R11, R9, R2
    ADD R11, R11, R7
    ADD R11, R11, R4
    LDR R11, R11                ; B[k * N + col]
    MUL R12, R10, R11
    ADD R8, R8, R12
    ADD R9, R9, R1
    CMP R9, R2
    BRn LOOP
ADD R9, R5, R0
STR R9, R8                      ; C[i]
RET
)";

void print_matrix(const char* name, const std::vector<tgpu::Word>& m) {
    std::cout << name << " = [" << std::setw(3) << m[0] << " " << std::setw(3) << m[1] << "]\n";
    std::cout << "    [" << std::setw(3) << m[2] << " " << std::setw(3) << m[3] << "]\n";
}

} // namespace

int main() {
    std::cout << "===========================================\n";
    std::cout << " TGPU 2x2 Matrix Multiplication\n";
    std::cout << "===========================================\n\n";

    auto program = tgpu::isa::Assembler::assemble(kMatMulKernel);
    const std::vector<tgpu::Word> a{1, 2, 3, 4};
    const std::vector<tgpu::Word> b{1, 2, 3, 4};

    print_matrix("A", a);
    print_matrix("B", b);
    std::cout << "\n";

    for (tgpu::Cycle latency : {1, 2, 4, 8}) {
        tgpu::GPUSimulator::Config config;
        config.core_count = 1;
        config.threads_per_block = 4;
        config.data_memory_channels = 4;
        config.data_memory_latency_cycles = latency;

        tgpu::GPUSimulator gpu(config);
        gpu.load_program(program);
        gpu.load_data(0, a);
        gpu.load_data(4, b);

        if (!gpu.launch(static_cast<uint8_t>(*program.thread_count))) {
            std::cerr << "Kernel did not complete (latency " << latency << ")\n";
            return 1;
        }

        auto stats = gpu.get_stats();
        std::cout << "Memory latency " << latency << ": " << stats.launch_cycles << " cycles, "
                  << stats.core_memory_stall_cycles[0] << " memory stall cycles\n";

        if (latency == 1) {
            print_matrix("C", gpu.dump_data_memory(8, 4));
            std::cout << "\n";
        }
    }

    return 0;
}
