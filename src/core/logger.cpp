// ShaderGen Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>

namespace shadergen::core {

namespace {

struct Sink {
    std::shared_ptr<spdlog::logger> logger;
    LogLevel level = LogLevel::Off;
};

struct LoggerState {
    std::mutex mutex;
    bool initialized = false;
    Sink console;
    Sink file;
    std::map<std::string, LogLevel, std::less<>> category_levels;

    // Category override, else the sink's own level
    [[nodiscard]] LogLevel threshold(const Sink& sink, std::string_view category) const {
        auto it = category_levels.find(category);
        return it != category_levels.end() ? it->second : sink.level;
    }
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

bool passes(LogLevel level, LogLevel threshold) {
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

// Sinks accept everything; filtering happens per category in log_message
std::shared_ptr<spdlog::logger> make_logger(const char* name, spdlog::sink_ptr sink, LogLevel flush_level) {
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(spdlog::level::trace);
    logger->flush_on(to_spdlog_level(flush_level));
    return logger;
}

}  // namespace

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;
    std::string file_sink_error;

    {
        std::lock_guard lock(state.mutex);
        if (state.initialized) {
            return;
        }

        // Diagnostics go to stderr; stdout stays free for tool output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%^%l%$] %v");
        state.console = Sink{make_logger("console", console_sink, LogLevel::Warn), config.console_level};

        if (!config.log_directory.empty()) {
            log_path = config.log_directory / config.log_filename;
            try {
                platform::FileSystem::create_directories(config.log_directory);
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                state.file = Sink{make_logger("file", file_sink, LogLevel::Info), config.file_level};
            } catch (const spdlog::spdlog_ex& ex) {
                // Console-only logging when the file cannot be opened
                file_sink_error = ex.what();
                state.file = Sink{};
                log_path.clear();
            }
        }

        state.category_levels = config.category_levels;
        state.initialized = true;
    }  // Lock released here; logging re-enters it

    if (!file_sink_error.empty()) {
        warn(log_category::GENERATOR, "Log file disabled: {}", file_sink_error);
    }
    debug(log_category::GENERATOR, "Logger initialized");
    if (!log_path.empty()) {
        debug(log_category::GENERATOR, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    for (Sink* sink : {&state.console, &state.file}) {
        if (sink->logger) {
            sink->logger->flush();
        }
        *sink = Sink{};
    }
    state.category_levels.clear();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        // Before initialization, spdlog's default logger decides
        return true;
    }

    if (passes(level, state.threshold(state.console, category))) {
        return true;
    }
    return state.file.logger && passes(level, state.threshold(state.file, category));
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    auto spdlog_level = to_spdlog_level(level);

    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        // spdlog::shutdown() drops the default logger
        if (auto* fallback = spdlog::default_logger_raw()) {
            fallback->log(spdlog_level, "[{}] {}", category, message);
        }
        return;
    }

    for (const Sink* sink : {&state.console, &state.file}) {
        if (sink->logger && passes(level, state.threshold(*sink, category))) {
            sink->logger->log(spdlog_level, "[{}] {}", category, message);
        }
    }
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "trace")
        return LogLevel::Trace;
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn" || name == "warning")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    if (name == "critical")
        return LogLevel::Critical;
    if (name == "off")
        return LogLevel::Off;
    return std::nullopt;
}

}  // namespace shadergen::core
