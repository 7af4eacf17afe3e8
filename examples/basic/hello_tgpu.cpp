/**
 * @file hello_tgpu.cpp
 * @brief Simple first TGPU program - element-wise matrix addition
 */

#include <tgpu/gpu_simulator.hpp>
#include <tgpu/isa/assembler.hpp>
#include <iostream>
#include <vector>

namespace {

const char* kMatAddKernel = R"(
.threads 8
MUL R0, %blockIdx, %blockDim
ADD R0, R0, %threadIdx          ; i = blockIdx * blockDim + threadIdx
CONST R1, #0                    ; baseA
CONST R2, #8                    ; baseB
CONST R3, #16                   ; baseC
ADD R4, R1, R0
LDR R4, R4                      ; A[i]
ADD R5, R2, R0
LDR R5, R5                      ; B[i]
ADD R6, R4, R5
ADD R7, R3, R0
STR R7, R6                      ; C[i] = A[i] + B[i]
RET
)";

} // namespace

int main() {
    std::cout << "===========================================\n";
    std::cout << " Hello TGPU - First TGPU Program\n";
    std::cout << "===========================================\n\n";

    tgpu::GPUSimulator::Config config;
    config.core_count = 2;
    config.threads_per_block = 4;
    config.data_memory_channels = 4;

    std::cout << "Creating TGPU with configuration:\n";
    std::cout << "  Cores: " << config.core_count << "\n";
    std::cout << "  Threads per block: " << config.threads_per_block << "\n";
    std::cout << "  Data memory channels: " << config.data_memory_channels << "\n\n";

    tgpu::GPUSimulator gpu(config);

    auto program = tgpu::isa::Assembler::assemble(kMatAddKernel);
    std::cout << "Kernel:\n" << tgpu::isa::Assembler::listing(program) << "\n";
    gpu.load_program(program);

    // A = 0..7, B = 0..7
    std::vector<tgpu::Word> a{0, 1, 2, 3, 4, 5, 6, 7};
    gpu.load_data(0, a);
    gpu.load_data(8, a);

    if (!gpu.launch(static_cast<uint8_t>(*program.thread_count))) {
        std::cerr << "Kernel did not complete\n";
        gpu.print_component_status();
        return 1;
    }

    std::cout << "C = A + B:";
    for (tgpu::Word c : gpu.dump_data_memory(16, 8)) {
        std::cout << " " << c;
    }
    std::cout << "\n\n";

    gpu.print_stats();

    std::cout << "\n===========================================\n";
    std::cout << " Kernel finished in " << gpu.get_stats().launch_cycles << " cycles\n";
    std::cout << "===========================================\n";

    return 0;
}
