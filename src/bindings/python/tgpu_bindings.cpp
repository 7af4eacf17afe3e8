#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

// Core simulator
#include "tgpu/gpu_simulator.hpp"
#include "tgpu/gpu_config_loader.hpp"

// ISA
#include "tgpu/isa/assembler.hpp"
#include "tgpu/isa/instruction.hpp"

// Tracing
#include "tgpu/trace/trace_exporter.hpp"

namespace py = pybind11;

PYBIND11_MODULE(tgpu, m) {
    m.doc() = "TGPU Simulator - cycle-level model of a minimal SIMT GPU with Python bindings";

    // Version information
    m.attr("__version__") = PYBIND11_STRINGIFY(VERSION_INFO);

    py::class_<tgpu::GPUSimulator::Config>(m, "SimulatorConfig")
        .def(py::init<>())
        .def_readwrite("core_count", &tgpu::GPUSimulator::Config::core_count)
        .def_readwrite("threads_per_block", &tgpu::GPUSimulator::Config::threads_per_block)
        .def_readwrite("data_memory_address_bits", &tgpu::GPUSimulator::Config::data_memory_address_bits)
        .def_readwrite("data_memory_data_bits", &tgpu::GPUSimulator::Config::data_memory_data_bits)
        .def_readwrite("data_memory_channels", &tgpu::GPUSimulator::Config::data_memory_channels)
        .def_readwrite("data_memory_latency_cycles", &tgpu::GPUSimulator::Config::data_memory_latency_cycles)
        .def_readwrite("program_memory_address_bits", &tgpu::GPUSimulator::Config::program_memory_address_bits)
        .def_readwrite("program_memory_data_bits", &tgpu::GPUSimulator::Config::program_memory_data_bits)
        .def_readwrite("program_memory_channels", &tgpu::GPUSimulator::Config::program_memory_channels)
        .def_readwrite("program_memory_latency_cycles", &tgpu::GPUSimulator::Config::program_memory_latency_cycles)
        .def_readwrite("clock_freq_ghz", &tgpu::GPUSimulator::Config::clock_freq_ghz)
        .def("validation_errors", &tgpu::GPUSimulator::Config::validation_errors);

    py::class_<tgpu::GPUSimulator::Statistics>(m, "Statistics")
        .def_readonly("total_cycles", &tgpu::GPUSimulator::Statistics::total_cycles)
        .def_readonly("launch_cycles", &tgpu::GPUSimulator::Statistics::launch_cycles)
        .def_readonly("instructions_issued", &tgpu::GPUSimulator::Statistics::instructions_issued)
        .def_readonly("lane_instructions", &tgpu::GPUSimulator::Statistics::lane_instructions)
        .def_readonly("fetches", &tgpu::GPUSimulator::Statistics::fetches)
        .def_readonly("loads", &tgpu::GPUSimulator::Statistics::loads)
        .def_readonly("stores", &tgpu::GPUSimulator::Statistics::stores)
        .def_readonly("divergent_branches", &tgpu::GPUSimulator::Statistics::divergent_branches)
        .def_readonly("reserved_opcodes", &tgpu::GPUSimulator::Statistics::reserved_opcodes)
        .def_readonly("blocks_retired", &tgpu::GPUSimulator::Statistics::blocks_retired)
        .def_readonly("rejected_control_operations", &tgpu::GPUSimulator::Statistics::rejected_control_operations)
        .def_readonly("core_fetch_stall_cycles", &tgpu::GPUSimulator::Statistics::core_fetch_stall_cycles)
        .def_readonly("core_memory_stall_cycles", &tgpu::GPUSimulator::Statistics::core_memory_stall_cycles);

    // ISA
    py::class_<tgpu::isa::Program>(m, "Program")
        .def(py::init<>())
        .def_readwrite("words", &tgpu::isa::Program::words)
        .def_readwrite("thread_count", &tgpu::isa::Program::thread_count)
        .def_readwrite("labels", &tgpu::isa::Program::labels)
        .def("__len__", &tgpu::isa::Program::size);

    py::register_exception<tgpu::isa::AssemblerError>(m, "AssemblerError", PyExc_ValueError);

    m.def("assemble", &tgpu::isa::Assembler::assemble, "Assemble kernel source text",
          py::arg("source"));
    m.def("assemble_file", [](const std::string& path) {
              return tgpu::isa::Assembler::assemble_file(path);
          }, "Assemble a kernel source file", py::arg("path"));
    m.def("listing", &tgpu::isa::Assembler::listing, "Address-annotated listing of a program",
          py::arg("program"));
    m.def("disassemble", &tgpu::isa::disassemble, "Disassemble one instruction word",
          py::arg("word"));

    // Configuration
    m.def("load_config", [](const std::string& path) {
              return tgpu::GPUConfigLoader::load(path);
          }, "Load a configuration file (.json, .yaml)", py::arg("path"));
    m.def("config_to_json", &tgpu::GPUConfigLoader::to_json_string,
          py::arg("config"), py::arg("pretty") = true);
    m.def("create_minimal_config", &tgpu::GPUConfigLoader::create_minimal);
    m.def("create_default_config", &tgpu::GPUConfigLoader::create_default);
    m.def("create_wide_config", &tgpu::GPUConfigLoader::create_wide);

    // Simulator
    py::class_<tgpu::GPUSimulator>(m, "Simulator")
        .def(py::init<const tgpu::GPUSimulator::Config&>(), py::arg("config") = tgpu::GPUSimulator::Config{})
        .def("reset", &tgpu::GPUSimulator::reset)
        .def("write_device_control_register", &tgpu::GPUSimulator::write_device_control_register,
             py::arg("thread_count"))
        .def("start", &tgpu::GPUSimulator::start)
        .def("is_done", &tgpu::GPUSimulator::is_done)
        .def("is_running", &tgpu::GPUSimulator::is_running)
        .def("step", &tgpu::GPUSimulator::step)
        .def("run_until_done", &tgpu::GPUSimulator::run_until_done, py::arg("max_cycles") = 100000)
        .def("launch", &tgpu::GPUSimulator::launch, py::arg("thread_count"), py::arg("max_cycles") = 100000)
        .def("load_program", py::overload_cast<const tgpu::isa::Program&>(&tgpu::GPUSimulator::load_program))
        .def("load_words", py::overload_cast<const std::vector<tgpu::Word>&>(&tgpu::GPUSimulator::load_program))
        .def("read_program_memory", &tgpu::GPUSimulator::read_program_memory)
        .def("read_data_memory", &tgpu::GPUSimulator::read_data_memory)
        .def("write_data_memory", &tgpu::GPUSimulator::write_data_memory)
        .def("load_data", &tgpu::GPUSimulator::load_data)
        .def("dump_data_memory", &tgpu::GPUSimulator::dump_data_memory)
        .def("get_current_cycle", &tgpu::GPUSimulator::get_current_cycle)
        .def("get_core_count", &tgpu::GPUSimulator::get_core_count)
        .def("get_stats", &tgpu::GPUSimulator::get_stats)
        .def("print_stats", &tgpu::GPUSimulator::print_stats)
        .def("print_component_status", &tgpu::GPUSimulator::print_component_status)
        .def("enable_tracing", [](tgpu::GPUSimulator& sim, bool enabled) {
                 sim.enable_tracing(enabled);
             }, py::arg("enabled") = true);

    // Tracing
    m.def("export_traces", [](const std::string& filename, const std::string& format) {
              return tgpu::trace::export_logger_traces(filename, format);
          }, py::arg("filename"), py::arg("format") = "chrome");
    m.def("clear_traces", []() { tgpu::trace::TraceLogger::instance().clear(); });
}
