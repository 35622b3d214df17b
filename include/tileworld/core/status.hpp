// TileWorld Engine Core
// status.hpp - Error kinds and result status for subsystem boundaries

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tileworld::core {

enum class ErrorCode : uint8_t {
    Ok = 0,
    ConfigurationInvalid,     // Missing section, dependency cycle, contradictory ranges
    OutOfBounds,              // Position outside the world rectangle
    ModuleGenerationFailure,  // A terrain module failed to build its fields
    UnknownModule,            // No module registered or loaded under a name
    UnknownPreset,            // Preset name not present in configuration
    Count
};

[[nodiscard]] const char* error_code_to_string(ErrorCode code);

// Outcome of an operation that can fail at a subsystem boundary.
// Default-constructed status is success.
class Status {
public:
    Status() = default;

    [[nodiscard]] static Status ok() { return {}; }
    [[nodiscard]] static Status error(ErrorCode code, std::string message, std::string module = {});

    [[nodiscard]] bool is_ok() const { return code_ == ErrorCode::Ok; }
    explicit operator bool() const { return is_ok(); }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    // Name of the terrain module the error originated from, if any
    [[nodiscard]] const std::string& module() const { return module_; }

    [[nodiscard]] std::string to_string() const;

private:
    ErrorCode code_ = ErrorCode::Ok;
    std::string message_;
    std::string module_;
};

}  // namespace tileworld::core
