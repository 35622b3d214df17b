// TileWorld Engine Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <tileworld/core/logger.hpp>

namespace tileworld::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::shared_ptr<spdlog::logger> console_logger;
    std::shared_ptr<spdlog::logger> file_logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

}  // namespace

LogLevel log_level_from_string(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(config.console_level));

            console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");

            state.console_logger = std::make_shared<spdlog::logger>("console", console_sink);
            state.console_logger->set_level(spdlog::level::trace);  // Let sink filter
            state.console_logger->flush_on(spdlog::level::warn);

            // The simulation core never touches the filesystem unless asked to
            if (!config.log_directory.empty()) {
                std::filesystem::create_directories(config.log_directory);

                log_path = config.log_directory / config.log_filename;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog_level(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

                state.file_logger = std::make_shared<spdlog::logger>("file", file_sink);
                state.file_logger->set_level(spdlog::level::trace);
                state.file_logger->flush_on(spdlog::level::info);
            }

            state.global_level = config.console_level;
            state.initialized = true;

        } catch (const spdlog::spdlog_ex& ex) {
            // Fallback to console only if file creation fails
            spdlog::error("Logger initialization failed: {}", ex.what());

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            state.console_logger = std::make_shared<spdlog::logger>("console", console_sink);
            state.file_logger.reset();
            log_path.clear();
            state.global_level = config.console_level;
            state.initialized = true;
        } catch (const std::filesystem::filesystem_error& ex) {
            spdlog::error("Cannot create log directory: {}", ex.what());
            state.file_logger.reset();
            log_path.clear();
            state.global_level = config.console_level;
            state.initialized = true;
        }
    }  // Lock released before logging below

    debug(log_category::ENGINE, "Logger initialized");
    if (!log_path.empty()) {
        info(log_category::ENGINE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }

    state.console_logger.reset();
    state.file_logger.reset();
    state.initialized = false;
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;

    if (state.console_logger) {
        for (auto& sink : state.console_logger->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

bool Logger::should_log(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return true;
    }
    return static_cast<int>(level) >= static_cast<int>(state.global_level);
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();

    if (!state.initialized) {
        spdlog::log(to_spdlog_level(level), "[{}] {}", category, message);
        return;
    }

    auto spdlog_level = to_spdlog_level(level);
    std::string formatted_message = fmt::format("[{}] {}", category, message);

    std::lock_guard lock(state.mutex);

    if (state.console_logger) {
        state.console_logger->log(spdlog_level, "{}", formatted_message);
    }
    if (state.file_logger) {
        state.file_logger->log(spdlog_level, "{}", formatted_message);
    }
}

}  // namespace tileworld::core
