// ShaderGen Core
// logger.hpp - Categorized logging over a console and an optional file sink

#pragma once

#include <array>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace shadergen::core {

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

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;  // Empty = console only
    std::string log_filename = "shadergen.log";
    size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    size_t max_files = 3;                    // Rotating backup count

    // A category listed here uses this level for both sinks
    std::map<std::string, LogLevel, std::less<>> category_levels;
};

// Static logging interface
class Logger {
public:
    // Initialize/shutdown (call once at startup/exit)
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

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
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    // Cheap pre-check so filtered messages are never formatted
    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

namespace log_category {
    inline constexpr const char* GENERATOR = "generator";
    inline constexpr const char* PIPELINE = "pipeline";
    inline constexpr const char* COMPILER = "compiler";
    inline constexpr const char* REFLECTION = "reflection";
    inline constexpr const char* EMIT = "emit";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* PLATFORM = "platform";

    inline constexpr std::array<std::string_view, 7> ALL = {GENERATOR, PIPELINE, COMPILER, REFLECTION,
                                                            EMIT,      CONFIG,   PLATFORM};
}  // namespace log_category

}  // namespace shadergen::core

#define SHADERGEN_LOG_TRACE(category, ...) \
    ::shadergen::core::Logger::trace(category, __VA_ARGS__)

#define SHADERGEN_LOG_DEBUG(category, ...) \
    ::shadergen::core::Logger::debug(category, __VA_ARGS__)

#define SHADERGEN_LOG_INFO(category, ...) \
    ::shadergen::core::Logger::info(category, __VA_ARGS__)

#define SHADERGEN_LOG_WARN(category, ...) \
    ::shadergen::core::Logger::warn(category, __VA_ARGS__)

#define SHADERGEN_LOG_ERROR(category, ...) \
    ::shadergen::core::Logger::error(category, __VA_ARGS__)

#define SHADERGEN_LOG_CRITICAL(category, ...) \
    ::shadergen::core::Logger::critical(category, __VA_ARGS__)
