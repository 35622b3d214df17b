// TileWorld Engine Core
// logger.hpp - Logging facade with category prefixes and optional file output

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace tileworld::core {

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

[[nodiscard]] LogLevel log_level_from_string(std::string_view name);

// Logger configuration
struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;         // Empty = console only
    std::string log_filename = "tileworld.log";
    size_t max_file_size = 5 * 1024 * 1024;      // 5 MB
    size_t max_files = 3;                         // Rotating backup count
};

// Static logging interface
class Logger {
public:
    // Initialize/shutdown (call once at startup/exit)
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();

    // Console threshold; the category only prefixes the message
    static void set_global_level(LogLevel level);

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;  // Static-only class

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category,
                         fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

// Pre-defined log categories for consistency
namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* SCHEDULER = "scheduler";
    inline constexpr const char* TERRAIN = "terrain";
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* ENTITY = "entity";
    inline constexpr const char* WILDLIFE = "wildlife";
    inline constexpr const char* COMPANION = "companion";
}  // namespace log_category

}  // namespace tileworld::core

// Convenience logging macros - performance-friendly (check level before formatting)
#define TILEWORLD_LOG_TRACE(category, ...) \
    ::tileworld::core::Logger::trace(category, __VA_ARGS__)

#define TILEWORLD_LOG_DEBUG(category, ...) \
    ::tileworld::core::Logger::debug(category, __VA_ARGS__)

#define TILEWORLD_LOG_INFO(category, ...) \
    ::tileworld::core::Logger::info(category, __VA_ARGS__)

#define TILEWORLD_LOG_WARN(category, ...) \
    ::tileworld::core::Logger::warn(category, __VA_ARGS__)

#define TILEWORLD_LOG_ERROR(category, ...) \
    ::tileworld::core::Logger::error(category, __VA_ARGS__)

#define TILEWORLD_LOG_CRITICAL(category, ...) \
    ::tileworld::core::Logger::critical(category, __VA_ARGS__)
