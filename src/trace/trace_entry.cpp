#include <tgpu/trace/trace_entry.hpp>

namespace tgpu::trace {

const char* to_string(ComponentType type) {
    switch (type) {
        case ComponentType::DEVICE_CONTROL: return "DEVICE_CONTROL";
        case ComponentType::DISPATCHER: return "DISPATCHER";
        case ComponentType::CORE: return "CORE";
        case ComponentType::FETCHER: return "FETCHER";
        case ComponentType::PROGRAM_MEMORY_CONTROLLER: return "PROGRAM_MEMORY_CONTROLLER";
        case ComponentType::DATA_MEMORY_CONTROLLER: return "DATA_MEMORY_CONTROLLER";
        case ComponentType::UNKNOWN: return "UNKNOWN";
        default: return "INVALID";
    }
}

const char* to_string(TransactionType type) {
    switch (type) {
        case TransactionType::READ: return "READ";
        case TransactionType::WRITE: return "WRITE";
        case TransactionType::FETCH: return "FETCH";
        case TransactionType::EXECUTE: return "EXECUTE";
        case TransactionType::CONFIGURE: return "CONFIGURE";
        case TransactionType::LAUNCH: return "LAUNCH";
        case TransactionType::DISPATCH: return "DISPATCH";
        case TransactionType::RETIRE: return "RETIRE";
        case TransactionType::RESET: return "RESET";
        case TransactionType::UNKNOWN: return "UNKNOWN";
        default: return "INVALID";
    }
}

const char* to_string(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::ISSUED: return "ISSUED";
        case TransactionStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TransactionStatus::COMPLETED: return "COMPLETED";
        case TransactionStatus::FAILED: return "FAILED";
        case TransactionStatus::CANCELLED: return "CANCELLED";
        default: return "INVALID";
    }
}

} // namespace tgpu::trace
