#pragma once

/**
 * @file gpu_config_loader.hpp
 * @brief Loader for TGPU simulator configuration files (YAML and JSON)
 *
 * Supports loading GPUSimulator::Config from:
 * - YAML files (.yaml, .yml)
 * - JSON files (.json)
 *
 * Fields missing from a file keep their GPUSimulator::Config defaults.
 */

#include <tgpu/gpu_simulator.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <type_traits>
#include <vector>

namespace tgpu {

/**
 * @brief Validation result for configuration files
 */
struct ConfigValidationResult {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    explicit operator bool() const { return valid; }
};

/**
 * @brief Loader for TGPU simulator configuration files
 */
class GPUConfigLoader {
public:
    /**
     * @brief Load configuration from file (auto-detect format)
     * @param file_path Path to configuration file (.yaml, .yml, .json)
     * @throws std::runtime_error on file read or parse errors
     */
    static GPUSimulator::Config load(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error on file read or parse errors
     */
    static GPUSimulator::Config load_json(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from YAML file
     * @throws std::runtime_error on file read or parse errors
     */
    static GPUSimulator::Config load_yaml(const std::filesystem::path& file_path);

    static GPUSimulator::Config from_json_string(const std::string& json_string);
    static GPUSimulator::Config from_yaml_string(const std::string& yaml_string);

    /**
     * @brief Save configuration to JSON file
     * @param pretty Pretty-print with indentation
     */
    static void save_json(const GPUSimulator::Config& config,
                          const std::filesystem::path& file_path,
                          bool pretty = true);

    static void save_yaml(const GPUSimulator::Config& config,
                          const std::filesystem::path& file_path);

    static std::string to_json_string(const GPUSimulator::Config& config, bool pretty = true);
    static std::string to_yaml_string(const GPUSimulator::Config& config);

    /**
     * @brief Validate configuration file without constructing a simulator
     * @return Validation result with errors and warnings
     */
    static ConfigValidationResult validate(const std::filesystem::path& file_path);
    static ConfigValidationResult validate(const GPUSimulator::Config& config);

    // =========================================
    // Factory Methods for Common Configurations
    // =========================================

    // One core with one lane, single channels
    static GPUSimulator::Config create_minimal();

    // Two cores of four lanes, four data channels
    static GPUSimulator::Config create_default();

    // Four cores of eight lanes, eight data channels
    static GPUSimulator::Config create_wide();

private:
    // JSON parsing
    static GPUSimulator::Config parse_json(const nlohmann::json& j);
    static nlohmann::json to_json(const GPUSimulator::Config& config);

    // YAML to JSON conversion (YAML is parsed via JSON intermediate)
    static nlohmann::json yaml_to_json(const std::string& yaml_string);
    static std::string json_to_yaml(const nlohmann::json& j, int indent = 0);

    // File format detection
    static bool is_yaml_file(const std::filesystem::path& file_path);
    static bool is_json_file(const std::filesystem::path& file_path);

    static void validate_config(const GPUSimulator::Config& config,
                                ConfigValidationResult& result);

    template<typename T>
    static T get_nested_or_default(const nlohmann::json& j,
                                   const std::string& key1,
                                   const std::string& key2,
                                   const T& default_value) {
        if (!j.contains(key1) || !j[key1].contains(key2)) {
            return default_value;
        }
        const nlohmann::json& value = j[key1][key2];
        if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            // Negative or fractional values must not wrap into huge sizes
            const bool non_negative = value.is_number_unsigned() ||
                                      (value.is_number_integer() && value.get<int64_t>() >= 0);
            if (!non_negative ||
                value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw std::runtime_error("Invalid value for " + key1 + "." + key2 + ": " + value.dump() +
                                         " (expected a non-negative integer)");
            }
        }
        return value.get<T>();
    }
};

} // namespace tgpu
