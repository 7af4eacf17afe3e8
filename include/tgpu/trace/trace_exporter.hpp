#pragma once

#include <tgpu/trace/trace_logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Windows/MSVC compatibility
#ifdef _MSC_VER
    #pragma warning(push)
    #pragma warning(disable: 4251)
    #ifdef BUILDING_TGPU_SIMULATOR
        #define TGPU_API __declspec(dllexport)
    #else
        #define TGPU_API __declspec(dllimport)
    #endif
#else
    #define TGPU_API
#endif

namespace tgpu::trace {

// Helper to convert payload to string for export
inline std::string payload_to_string(const PayloadData& payload) {
    std::ostringstream oss;

    if (std::holds_alternative<MemoryPayload>(payload)) {
        const auto& mem = std::get<MemoryPayload>(payload);
        oss << "Memory[@0x" << std::hex << mem.address << std::dec
            << " data:" << mem.data
            << " ch:" << mem.channel
            << " req:" << mem.requester_id
            << " lat:" << mem.latency_cycles << "]";
    }
    else if (std::holds_alternative<DispatchPayload>(payload)) {
        const auto& dispatch = std::get<DispatchPayload>(payload);
        oss << "Block[" << dispatch.block_id << " -> core " << dispatch.core_id
            << " threads:" << dispatch.thread_count << "]";
    }
    else if (std::holds_alternative<InstructionPayload>(payload)) {
        const auto& instr = std::get<InstructionPayload>(payload);
        oss << "Instr[pc:" << instr.pc << " 0x" << std::hex << std::setw(4) << std::setfill('0')
            << instr.word << std::dec << std::setfill(' ')
            << " " << instr.mnemonic << " lanes:" << instr.active_lanes << "]";
    }
    else if (std::holds_alternative<ControlPayload>(payload)) {
        const auto& ctrl = std::get<ControlPayload>(payload);
        oss << "Control[" << ctrl.command << " param:" << ctrl.parameter << "]";
    }
    else {
        oss << "NoPayload";
    }

    return oss.str();
}

// Quote a CSV field, doubling embedded quotes
inline std::string csv_quote(const std::string& field) {
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// One trace entry as a JSON object; times only when the entry carries a clock
inline nlohmann::json entry_to_json(const TraceEntry& entry) {
    nlohmann::json j = {
        {"transaction_id", entry.transaction_id},
        {"component_type", to_string(entry.component_type)},
        {"component_id", entry.component_id},
        {"transaction_type", to_string(entry.transaction_type)},
        {"status", to_string(entry.status)},
        {"cycle_issue", entry.cycle_issue},
        {"cycle_complete", entry.cycle_complete},
        {"duration_cycles", entry.get_duration_cycles()},
        {"payload", payload_to_string(entry.payload)},
        {"description", entry.description}
    };
    if (entry.clock_freq_ghz.has_value()) {
        j["clock_freq_ghz"] = entry.clock_freq_ghz.value();
        j["time_issue_ns"] = entry.get_issue_time_ns();
        j["time_complete_ns"] = entry.get_complete_time_ns();
        j["duration_ns"] = entry.get_duration_ns();
    }
    return j;
}

// CSV Export
class TGPU_API CSVExporter {
public:
    static bool export_traces(const std::string& filename, const std::vector<TraceEntry>& traces) {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        file << "TransactionID,ComponentType,ComponentID,TransactionType,Status,"
             << "CycleIssue,CycleComplete,DurationCycles,DurationNs,Payload,Description\n";

        file << std::fixed << std::setprecision(3);
        for (const auto& entry : traces) {
            file << entry.transaction_id << ','
                 << to_string(entry.component_type) << ','
                 << entry.component_id << ','
                 << to_string(entry.transaction_type) << ','
                 << to_string(entry.status) << ','
                 << entry.cycle_issue << ','
                 << entry.cycle_complete << ','
                 << entry.get_duration_cycles() << ','
                 << entry.get_duration_ns() << ','
                 << csv_quote(payload_to_string(entry.payload)) << ','
                 << csv_quote(entry.description) << '\n';
        }

        return file.good();
    }
};

// JSON Export: {"trace_count": N, "traces": [...]}
class TGPU_API JSONExporter {
public:
    static bool export_traces(const std::string& filename, const std::vector<TraceEntry>& traces) {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        nlohmann::json doc;
        doc["trace_count"] = traces.size();
        doc["traces"] = nlohmann::json::array();
        for (const auto& entry : traces) {
            doc["traces"].push_back(entry_to_json(entry));
        }

        file << doc.dump(2) << '\n';
        return file.good();
    }
};

// Chrome Trace Event Format Export (for chrome://tracing visualization)
class TGPU_API ChromeTraceExporter {
private:
    // Display order follows the request path from the control signals to memory
    static uint32_t get_display_pid(ComponentType type) {
        switch (type) {
            case ComponentType::DEVICE_CONTROL:             return 1;
            case ComponentType::DISPATCHER:                 return 2;
            case ComponentType::CORE:                       return 3;
            case ComponentType::FETCHER:                    return 4;
            case ComponentType::PROGRAM_MEMORY_CONTROLLER:  return 5;
            case ComponentType::DATA_MEMORY_CONTROLLER:     return 6;
            default: return 99;
        }
    }

public:
    static bool export_traces(const std::string& filename, const std::vector<TraceEntry>& traces,
                             double default_freq_ghz = 1.0) {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        std::map<uint32_t, std::string> process_names;
        std::map<std::pair<uint32_t, uint32_t>, std::string> thread_names;
        for (const auto& entry : traces) {
            const uint32_t pid = get_display_pid(entry.component_type);
            const std::string name = to_string(entry.component_type);
            // Prefix with display order so the viewer sorts processes along the request path
            process_names[pid] = (pid < 10 ? "0" : "") + std::to_string(pid) + "-" + name;
            thread_names[{pid, entry.component_id}] = name + " #" + std::to_string(entry.component_id);
        }

        nlohmann::json events = nlohmann::json::array();
        for (const auto& [pid, name] : process_names) {
            events.push_back({{"name", "process_name"}, {"ph", "M"}, {"pid", pid},
                              {"args", {{"name", name}}}});
        }
        for (const auto& [pid_tid, name] : thread_names) {
            events.push_back({{"name", "thread_name"}, {"ph", "M"}, {"pid", pid_tid.first},
                              {"tid", pid_tid.second}, {"args", {{"name", name}}}});
        }

        for (const auto& entry : traces) {
            const double freq = entry.clock_freq_ghz.value_or(default_freq_ghz);

            // chrome trace expects microseconds
            nlohmann::json event = {
                {"name", to_string(entry.transaction_type)},
                {"cat", to_string(entry.component_type)},
                {"ts", static_cast<double>(entry.cycle_issue) / freq / 1000.0},
                {"pid", get_display_pid(entry.component_type)},
                {"tid", entry.component_id}
            };
            nlohmann::json args = {
                {"txn_id", entry.transaction_id},
                {"status", to_string(entry.status)},
                {"cycle_issue", entry.cycle_issue},
                {"payload", payload_to_string(entry.payload)}
            };
            if (!entry.description.empty()) args["desc"] = entry.description;

            if (entry.cycle_complete > 0) {
                event["ph"] = "X";
                event["dur"] = static_cast<double>(entry.get_duration_cycles()) / freq / 1000.0;
                args["cycle_complete"] = entry.cycle_complete;
            } else {
                event["ph"] = "i";
                event["s"] = "t";
            }
            event["args"] = std::move(args);
            events.push_back(std::move(event));
        }

        file << events.dump(1) << '\n';
        return file.good();
    }
};

// Convenience function to export from logger
inline bool export_logger_traces(const std::string& filename,
                                 const std::string& format = "csv",
                                 TraceLogger& logger = TraceLogger::instance()) {
    auto traces = logger.get_all_traces();

    if (format == "csv") {
        return CSVExporter::export_traces(filename, traces);
    }
    else if (format == "json") {
        return JSONExporter::export_traces(filename, traces);
    }
    else if (format == "chrome" || format == "trace") {
        return ChromeTraceExporter::export_traces(filename, traces);
    }

    return false;
}

} // namespace tgpu::trace

#ifdef _MSC_VER
    #pragma warning(pop)
#endif
