// TileWorld Engine Core
// status.cpp - Result status implementation

#include <tileworld/core/status.hpp>

#include <spdlog/fmt/fmt.h>

namespace tileworld::core {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::ConfigurationInvalid:
            return "configuration_invalid";
        case ErrorCode::OutOfBounds:
            return "out_of_bounds";
        case ErrorCode::ModuleGenerationFailure:
            return "module_generation_failure";
        case ErrorCode::UnknownModule:
            return "unknown_module";
        case ErrorCode::UnknownPreset:
            return "unknown_preset";
        default:
            return "unknown";
    }
}

Status Status::error(ErrorCode code, std::string message, std::string module) {
    Status status;
    status.code_ = code;
    status.message_ = std::move(message);
    status.module_ = std::move(module);
    return status;
}

std::string Status::to_string() const {
    if (is_ok()) {
        return "ok";
    }
    if (module_.empty()) {
        return fmt::format("{}: {}", error_code_to_string(code_), message_);
    }
    return fmt::format("{} [{}]: {}", error_code_to_string(code_), module_, message_);
}

}  // namespace tileworld::core
