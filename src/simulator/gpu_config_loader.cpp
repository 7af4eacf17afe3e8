/**
 * @file gpu_config_loader.cpp
 * @brief Implementation of TGPU configuration file loader
 */

#include <tgpu/gpu_config_loader.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace tgpu {

// =========================================
// File Loading
// =========================================

GPUSimulator::Config GPUConfigLoader::load(const std::filesystem::path& file_path) {
    if (is_yaml_file(file_path)) {
        return load_yaml(file_path);
    } else if (is_json_file(file_path)) {
        return load_json(file_path);
    } else {
        throw std::runtime_error("Unsupported file format: " + file_path.string() +
                                 " (expected .yaml, .yml, or .json)");
    }
}

GPUSimulator::Config GPUConfigLoader::load_json(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("JSON parse error in " + file_path.string() + ": " + e.what());
    }
}

GPUSimulator::Config GPUConfigLoader::load_yaml(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_yaml_string(buffer.str());
}

GPUSimulator::Config GPUConfigLoader::from_json_string(const std::string& json_string) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_string);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("JSON parse error: ") + e.what());
    }
}

GPUSimulator::Config GPUConfigLoader::from_yaml_string(const std::string& yaml_string) {
    nlohmann::json j = yaml_to_json(yaml_string);
    try {
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("YAML value error: ") + e.what());
    }
}

// =========================================
// File Saving
// =========================================

void GPUConfigLoader::save_json(const GPUSimulator::Config& config,
                                const std::filesystem::path& file_path,
                                bool pretty) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + file_path.string());
    }

    nlohmann::json j = to_json(config);
    file << (pretty ? j.dump(2) : j.dump());
}

void GPUConfigLoader::save_yaml(const GPUSimulator::Config& config,
                                const std::filesystem::path& file_path) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + file_path.string());
    }

    file << to_yaml_string(config);
}

std::string GPUConfigLoader::to_json_string(const GPUSimulator::Config& config, bool pretty) {
    nlohmann::json j = to_json(config);
    return pretty ? j.dump(2) : j.dump();
}

std::string GPUConfigLoader::to_yaml_string(const GPUSimulator::Config& config) {
    nlohmann::json j = to_json(config);
    return json_to_yaml(j);
}

// =========================================
// JSON Parsing
// =========================================

GPUSimulator::Config GPUConfigLoader::parse_json(const nlohmann::json& j) {
    GPUSimulator::Config config;

    // Compute
    config.core_count = get_nested_or_default<Size>(j, "compute", "core_count", config.core_count);
    config.threads_per_block = get_nested_or_default<Size>(j, "compute", "threads_per_block",
                                                           config.threads_per_block);

    // Data memory
    config.data_memory_address_bits = get_nested_or_default<unsigned>(
        j, "data_memory", "address_bits", config.data_memory_address_bits);
    config.data_memory_data_bits = get_nested_or_default<unsigned>(
        j, "data_memory", "data_bits", config.data_memory_data_bits);
    config.data_memory_channels = get_nested_or_default<Size>(
        j, "data_memory", "channels", config.data_memory_channels);
    config.data_memory_latency_cycles = get_nested_or_default<Cycle>(
        j, "data_memory", "latency_cycles", config.data_memory_latency_cycles);

    // Program memory
    config.program_memory_address_bits = get_nested_or_default<unsigned>(
        j, "program_memory", "address_bits", config.program_memory_address_bits);
    config.program_memory_data_bits = get_nested_or_default<unsigned>(
        j, "program_memory", "data_bits", config.program_memory_data_bits);
    config.program_memory_channels = get_nested_or_default<Size>(
        j, "program_memory", "channels", config.program_memory_channels);
    config.program_memory_latency_cycles = get_nested_or_default<Cycle>(
        j, "program_memory", "latency_cycles", config.program_memory_latency_cycles);

    // Clock
    config.clock_freq_ghz = get_nested_or_default<double>(j, "clock", "frequency_ghz", config.clock_freq_ghz);

    return config;
}

nlohmann::json GPUConfigLoader::to_json(const GPUSimulator::Config& config) {
    nlohmann::json j;

    j["compute"]["core_count"] = config.core_count;
    j["compute"]["threads_per_block"] = config.threads_per_block;

    j["data_memory"]["address_bits"] = config.data_memory_address_bits;
    j["data_memory"]["data_bits"] = config.data_memory_data_bits;
    j["data_memory"]["channels"] = config.data_memory_channels;
    j["data_memory"]["latency_cycles"] = config.data_memory_latency_cycles;

    j["program_memory"]["address_bits"] = config.program_memory_address_bits;
    j["program_memory"]["data_bits"] = config.program_memory_data_bits;
    j["program_memory"]["channels"] = config.program_memory_channels;
    j["program_memory"]["latency_cycles"] = config.program_memory_latency_cycles;

    j["clock"]["frequency_ghz"] = config.clock_freq_ghz;

    return j;
}

// =========================================
// Simple YAML Parser (subset for config files)
// =========================================

// Handles nested mappings of scalars, which is all a config file uses
nlohmann::json GPUConfigLoader::yaml_to_json(const std::string& yaml_string) {
    nlohmann::json result = nlohmann::json::object();
    std::vector<std::pair<int, nlohmann::json*>> stack;
    stack.push_back({-1, &result});

    std::istringstream stream(yaml_string);
    std::string line;

    while (std::getline(stream, line)) {
        // Skip empty lines and comments
        size_t first_non_space = line.find_first_not_of(" \t");
        if (first_non_space == std::string::npos) continue;
        if (line[first_non_space] == '#') continue;

        int indent = static_cast<int>(first_non_space);

        std::string trimmed = line.substr(first_non_space);
        size_t last_non_space = trimmed.find_last_not_of(" \t\r\n");
        if (last_non_space != std::string::npos) {
            trimmed = trimmed.substr(0, last_non_space + 1);
        }
        if (trimmed.empty()) continue;

        // Pop stack until we find the right parent
        while (stack.size() > 1 && stack.back().first >= indent) {
            stack.pop_back();
        }

        size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            throw std::runtime_error("YAML parse error: expected 'key: value' in line '" + trimmed + "'");
        }

        std::string key = trimmed.substr(0, colon_pos);
        std::string value = (colon_pos + 1 < trimmed.size()) ?
                            trimmed.substr(colon_pos + 1) : "";

        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));

        // Strip trailing comment
        size_t hash = value.find(" #");
        if (hash != std::string::npos) {
            value.erase(hash);
            value.erase(value.find_last_not_of(" \t") + 1);
        }

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        nlohmann::json* parent = stack.back().second;

        if (value.empty()) {
            (*parent)[key] = nlohmann::json::object();
            stack.push_back({indent, &(*parent)[key]});
        } else if (value == "true") {
            (*parent)[key] = true;
        } else if (value == "false") {
            (*parent)[key] = false;
        } else {
            // Numbers first, anything that does not parse completely stays a string
            size_t consumed = 0;
            try {
                if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
                    auto n = std::stoull(value, &consumed, 16);
                    if (consumed == value.size()) { (*parent)[key] = n; continue; }
                } else if (value.find_first_of(".eE") != std::string::npos) {
                    auto d = std::stod(value, &consumed);
                    if (consumed == value.size()) { (*parent)[key] = d; continue; }
                } else {
                    auto n = std::stoll(value, &consumed);
                    if (consumed == value.size()) { (*parent)[key] = n; continue; }
                }
            } catch (const std::invalid_argument&) {
                // not numeric
            } catch (const std::out_of_range&) {
                throw std::runtime_error("YAML parse error: value out of range for '" + key + "'");
            }
            (*parent)[key] = value;
        }
    }

    return result;
}

std::string GPUConfigLoader::json_to_yaml(const nlohmann::json& j, int indent) {
    std::ostringstream ss;
    std::string indent_str(indent * 2, ' ');

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            ss << indent_str << it.key() << ":";
            if (it.value().is_object()) {
                ss << "\n" << json_to_yaml(it.value(), indent + 1);
            } else if (it.value().is_boolean()) {
                ss << " " << (it.value().get<bool>() ? "true" : "false") << "\n";
            } else if (it.value().is_number_integer()) {
                ss << " " << it.value().get<int64_t>() << "\n";
            } else if (it.value().is_number_float()) {
                double d = it.value().get<double>();
                std::ostringstream num;
                num << d;
                std::string text = num.str();
                // Keep floats recognizable as floats on the way back in
                if (text.find_first_of(".eE") == std::string::npos) text += ".0";
                ss << " " << text << "\n";
            } else if (it.value().is_string()) {
                ss << " \"" << it.value().get<std::string>() << "\"\n";
            } else {
                ss << " " << it.value().dump() << "\n";
            }
        }
    }

    return ss.str();
}

// =========================================
// Validation
// =========================================

ConfigValidationResult GPUConfigLoader::validate(const std::filesystem::path& file_path) {
    ConfigValidationResult result;

    try {
        GPUSimulator::Config config = load(file_path);
        validate_config(config, result);
    } catch (const std::exception& e) {
        result.valid = false;
        result.errors.push_back(e.what());
    }

    return result;
}

ConfigValidationResult GPUConfigLoader::validate(const GPUSimulator::Config& config) {
    ConfigValidationResult result;
    validate_config(config, result);
    return result;
}

void GPUConfigLoader::validate_config(const GPUSimulator::Config& config,
                                      ConfigValidationResult& result) {
    result.errors = config.validation_errors();
    result.valid = result.errors.empty();
    if (!result.valid) return;

    const Size lanes = config.core_count * config.threads_per_block;
    if (config.data_memory_channels > lanes) {
        result.warnings.push_back("data_memory.channels (" + std::to_string(config.data_memory_channels) +
                                  ") exceeds the number of lanes (" + std::to_string(lanes) +
                                  "); extra channels stay idle");
    }
    if (config.program_memory_channels > config.core_count) {
        result.warnings.push_back("program_memory.channels exceeds core_count; extra channels stay idle");
    }
    if (lanes > 255) {
        result.warnings.push_back("Thread count register is 8 bits wide; only 255 of " +
                                  std::to_string(lanes) + " lanes can be launched at once");
    }
    const Size max_data_value = width_mask(config.data_memory_data_bits);
    if (config.threads_per_block > max_data_value) {
        result.warnings.push_back("threads_per_block does not fit in data_memory.data_bits; "
                                  "%blockDim and %threadIdx will wrap");
    }
}

// =========================================
// File Format Detection
// =========================================

bool GPUConfigLoader::is_yaml_file(const std::filesystem::path& file_path) {
    std::string ext = file_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".yaml" || ext == ".yml";
}

bool GPUConfigLoader::is_json_file(const std::filesystem::path& file_path) {
    std::string ext = file_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".json";
}

// =========================================
// Factory Methods
// =========================================

GPUSimulator::Config GPUConfigLoader::create_minimal() {
    GPUSimulator::Config config;
    config.core_count = 1;
    config.threads_per_block = 1;
    config.data_memory_channels = 1;
    config.program_memory_channels = 1;
    return config;
}

GPUSimulator::Config GPUConfigLoader::create_default() {
    return GPUSimulator::Config{};
}

GPUSimulator::Config GPUConfigLoader::create_wide() {
    GPUSimulator::Config config;
    config.core_count = 4;
    config.threads_per_block = 8;
    config.data_memory_channels = 8;
    config.program_memory_channels = 2;
    return config;
}

} // namespace tgpu
