/**
 * @file tgpu_runner.cpp
 * @brief TGPU Kernel Runner - Command-line tool for running TGPU kernels
 *
 * Usage:
 *   tgpu-runner [options] <kernel.asm>
 *
 * Options:
 *   -h, --help                  Show help message
 *   -v, --verbose               Verbose output
 *   -c, --config <file>         Configuration file (.json, .yaml)
 *   --factory <name>            Use factory config: minimal, default, wide
 *   -n, --threads <N>           Thread count (overrides the kernel's .threads)
 *   -d, --data <ADDR=v,v,...>   Initialize data memory (repeatable)
 *   --dump <ADDR:COUNT>         Print a data memory range after the run (repeatable)
 *   --max-cycles <N>            Cycle limit before declaring a hang
 *   --stats                     Print simulator statistics
 *   --trace <file>              Export a trace of the run
 *   --trace-format <fmt>        csv, json or chrome (default: chrome)
 *   --validate                  Validate config and exit
 *   --show-config               Show parsed configuration
 */

#include <tgpu/gpu_simulator.hpp>
#include <tgpu/gpu_config_loader.hpp>
#include <tgpu/isa/assembler.hpp>
#include <tgpu/trace/trace_exporter.hpp>

#include <cctype>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>
#include <optional>
#include <utility>

using namespace tgpu;

// =========================================
// Command Line Parsing
// =========================================

struct DataInit {
    Address base = 0;
    std::vector<Word> values;
};

struct DumpRange {
    Address base = 0;
    Size count = 0;
};

struct Options {
    std::string kernel_file;
    std::string config_file;
    std::string factory_config;     // minimal, default, wide
    std::optional<unsigned long> threads;
    std::vector<DataInit> data;
    std::vector<DumpRange> dumps;
    Cycle max_cycles = 100000;
    std::string trace_file;
    std::string trace_format = "chrome";
    bool verbose = false;
    bool stats = false;
    bool validate_only = false;
    bool show_config = false;
    bool help = false;
};

void print_help(const char* program_name) {
    std::cout << "TGPU Kernel Runner - Command-line tool for TGPU simulations\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options] <kernel.asm>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                  Show this help message\n";
    std::cout << "  -v, --verbose               Verbose output\n";
    std::cout << "  -c, --config <file>         Configuration file (.json, .yaml, .yml)\n";
    std::cout << "  --factory <name>            Use factory config: minimal, default, wide\n";
    std::cout << "  -n, --threads <N>           Thread count (overrides the kernel's .threads)\n";
    std::cout << "  -d, --data <ADDR=v,v,...>   Initialize data memory (repeatable)\n";
    std::cout << "  --dump <ADDR:COUNT>         Print a data memory range after the run (repeatable)\n";
    std::cout << "  --max-cycles <N>            Cycle limit (default: 100000)\n";
    std::cout << "  --stats                     Print simulator statistics\n";
    std::cout << "  --trace <file>              Export a trace of the run\n";
    std::cout << "  --trace-format <fmt>        csv, json or chrome (default: chrome)\n";
    std::cout << "  --validate                  Validate config and exit\n";
    std::cout << "  --show-config               Show parsed configuration\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -d 0=0,1,2,3,4,5,6,7 -d 8=0,1,2,3,4,5,6,7 --dump 16:8 matadd.asm\n";
    std::cout << "  " << program_name << " --factory wide --stats --trace run.json matmul.asm\n";
}

// Decimal, or hex with a 0x prefix; the whole token must be consumed
unsigned long long parse_unsigned(const std::string& text) {
    const bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("invalid number '" + text + "'");
    }
    size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed, hex ? 16 : 10);
    if (consumed != text.size()) {
        throw std::invalid_argument("invalid number '" + text + "'");
    }
    return value;
}

bool parse_data_init(const std::string& text, DataInit& init) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) return false;

    try {
        init.base = static_cast<Address>(parse_unsigned(text.substr(0, eq)));
        std::string values = text.substr(eq + 1);
        size_t pos = 0;
        while (pos <= values.size()) {
            size_t comma = values.find(',', pos);
            std::string token = values.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
            if (token.empty()) return false;
            init.values.push_back(static_cast<Word>(parse_unsigned(token)));
            if (comma == std::string::npos) break;
            pos = comma + 1;
        }
    } catch (const std::exception&) {
        return false;
    }
    return !init.values.empty();
}

bool parse_dump_range(const std::string& text, DumpRange& range) {
    size_t colon = text.find(':');
    if (colon == std::string::npos) return false;
    try {
        range.base = static_cast<Address>(parse_unsigned(text.substr(0, colon)));
        range.count = parse_unsigned(text.substr(colon + 1));
    } catch (const std::exception&) {
        return false;
    }
    return range.count > 0;
}

bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--validate") {
            opts.validate_only = true;
        } else if (arg == "--show-config") {
            opts.show_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--factory" && i + 1 < argc) {
            opts.factory_config = argv[++i];
        } else if ((arg == "-n" || arg == "--threads") && i + 1 < argc) {
            try {
                opts.threads = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid thread count: " << argv[i] << "\n";
                return false;
            }
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            DataInit init;
            if (!parse_data_init(argv[++i], init)) {
                std::cerr << "Invalid data initializer: " << argv[i] << "\n";
                return false;
            }
            opts.data.push_back(std::move(init));
        } else if (arg == "--dump" && i + 1 < argc) {
            DumpRange range;
            if (!parse_dump_range(argv[++i], range)) {
                std::cerr << "Invalid dump range: " << argv[i] << "\n";
                return false;
            }
            opts.dumps.push_back(range);
        } else if (arg == "--max-cycles" && i + 1 < argc) {
            try {
                opts.max_cycles = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid cycle limit: " << argv[i] << "\n";
                return false;
            }
        } else if (arg == "--trace" && i + 1 < argc) {
            opts.trace_file = argv[++i];
        } else if (arg == "--trace-format" && i + 1 < argc) {
            opts.trace_format = argv[++i];
            if (opts.trace_format != "csv" && opts.trace_format != "json" && opts.trace_format != "chrome") {
                std::cerr << "Unknown trace format: " << opts.trace_format << "\n";
                return false;
            }
        } else if (arg[0] != '-') {
            opts.kernel_file = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    return true;
}

// =========================================
// Configuration Display
// =========================================

void print_config(const GPUSimulator::Config& config) {
    std::cout << "\n=== TGPU Configuration ===\n\n";

    std::cout << "Compute:\n";
    std::cout << "  Cores:             " << config.core_count << "\n";
    std::cout << "  Threads/block:     " << config.threads_per_block << "\n\n";

    std::cout << "Data Memory:\n";
    std::cout << "  Address bits:      " << config.data_memory_address_bits << "\n";
    std::cout << "  Data bits:         " << config.data_memory_data_bits << "\n";
    std::cout << "  Channels:          " << config.data_memory_channels << "\n";
    std::cout << "  Latency:           " << config.data_memory_latency_cycles << " cycles\n\n";

    std::cout << "Program Memory:\n";
    std::cout << "  Address bits:      " << config.program_memory_address_bits << "\n";
    std::cout << "  Data bits:         " << config.program_memory_data_bits << "\n";
    std::cout << "  Channels:          " << config.program_memory_channels << "\n";
    std::cout << "  Latency:           " << config.program_memory_latency_cycles << " cycles\n\n";

    std::cout << "Clock:               " << config.clock_freq_ghz << " GHz\n\n";
}

void print_dump(const GPUSimulator& sim, const DumpRange& range) {
    std::cout << "data[" << range.base << ".." << (range.base + range.count - 1) << "]:";
    for (Word w : sim.dump_data_memory(range.base, range.count)) {
        std::cout << " " << w;
    }
    std::cout << "\n";
}

// =========================================
// Main
// =========================================

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_options(argc, argv, opts)) {
        print_help(argv[0]);
        return 1;
    }

    if (opts.help) {
        print_help(argv[0]);
        return 0;
    }

    // Load or create configuration
    GPUSimulator::Config config;

    try {
        if (!opts.factory_config.empty()) {
            if (opts.factory_config == "minimal") {
                config = GPUConfigLoader::create_minimal();
            } else if (opts.factory_config == "default") {
                config = GPUConfigLoader::create_default();
            } else if (opts.factory_config == "wide") {
                config = GPUConfigLoader::create_wide();
            } else {
                std::cerr << "Unknown factory config: " << opts.factory_config << "\n";
                return 1;
            }
            if (opts.verbose) std::cout << "Using factory config: " << opts.factory_config << "\n";
        } else if (!opts.config_file.empty()) {
            if (opts.verbose) {
                std::cout << "Loading configuration from: " << opts.config_file << "\n";
            }
            config = GPUConfigLoader::load(opts.config_file);
        } else if (opts.verbose) {
            std::cout << "No configuration specified, using default factory config\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }

    // Validate if requested
    if (opts.validate_only) {
        auto result = GPUConfigLoader::validate(config);
        if (result.valid) {
            std::cout << "Configuration is valid.\n";
            for (const auto& warning : result.warnings) {
                std::cout << "Warning: " << warning << "\n";
            }
            return 0;
        } else {
            std::cerr << "Configuration is invalid:\n";
            for (const auto& error : result.errors) {
                std::cerr << "  Error: " << error << "\n";
            }
            return 1;
        }
    }

    if (opts.show_config) {
        print_config(config);
        if (opts.kernel_file.empty()) return 0;
    }

    if (opts.kernel_file.empty()) {
        std::cerr << "No kernel file given\n";
        print_help(argv[0]);
        return 1;
    }

    try {
        isa::Program program = isa::Assembler::assemble_file(opts.kernel_file);

        unsigned long threads = 0;
        if (opts.threads) {
            threads = *opts.threads;
        } else if (program.thread_count) {
            threads = *program.thread_count;
        } else {
            std::cerr << "Thread count unknown: add a .threads directive or pass --threads\n";
            return 1;
        }
        if (threads == 0 || threads > 255) {
            std::cerr << "Thread count must be in 1..255, got " << threads << "\n";
            return 1;
        }

        GPUSimulator sim(config);
        if (!opts.trace_file.empty()) {
            trace::TraceLogger::instance().clear();
            sim.enable_tracing(true);
        }

        sim.load_program(program);
        for (const auto& init : opts.data) {
            sim.load_data(init.base, init.values);
        }

        if (opts.verbose) {
            std::cout << "Kernel: " << opts.kernel_file << " (" << program.size() << " instructions)\n";
            std::cout << isa::Assembler::listing(program);
            std::cout << "Launching " << threads << " threads on " << sim.get_core_count() << " cores\n";
        }

        bool launched = sim.write_device_control_register(static_cast<uint8_t>(threads)) && sim.start();
        bool finished = launched && sim.run_until_done(opts.max_cycles);

        std::cout << "\n=== Results ===\n";
        if (!launched) {
            std::cout << "Status:      FAILED (launch rejected)\n";
        } else if (!finished) {
            std::cout << "Status:      TIMEOUT after " << opts.max_cycles << " cycles\n";
            sim.print_component_status();
        } else {
            std::cout << "Status:      SUCCESS\n";
            std::cout << "Cycles:      " << sim.get_stats().launch_cycles << "\n";
        }

        for (const auto& range : opts.dumps) {
            print_dump(sim, range);
        }

        if (opts.stats) {
            std::cout << "\n";
            sim.print_stats();
        }

        if (!opts.trace_file.empty()) {
            if (trace::export_logger_traces(opts.trace_file, opts.trace_format)) {
                if (opts.verbose) {
                    std::cout << "Trace written to: " << opts.trace_file << " ("
                              << trace::TraceLogger::instance().get_trace_count() << " entries)\n";
                }
            } else {
                std::cerr << "Failed to write trace file: " << opts.trace_file << "\n";
            }
        }

        return finished ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
