// ShaderGen Core
// config.hpp - JSON-based generator configuration

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <shadergen/core/logger.hpp>

namespace shadergen::core {

// Configuration with JSON file persistence.
// Missing sections and keys fall back to the built-in defaults.
class Config {
public:
    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Load merges the file over the defaults. Throws Error(ConfigError) if
    // the file cannot be read or is not a JSON object of sections.
    void load(const std::filesystem::path& path);

    // Typed getters; a missing or differently typed value yields the default
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key,
                                bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    // An object of string values, e.g. per-category log levels. Missing
    // yields an empty map; any other shape throws Error(ConfigError).
    [[nodiscard]] std::map<std::string, std::string> get_string_map(std::string_view section,
                                                                    std::string_view key) const;

    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

private:
    void set_defaults();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Logger settings from the logging section: console level, file level and
// directory, and per-category overrides. Throws Error(ConfigError) for an
// unknown level or category name.
[[nodiscard]] LoggerConfig make_logger_config(const Config& config);

namespace config_section {
    inline constexpr const char* GENERATOR = "generator";
    inline constexpr const char* TOOLS = "tools";
    inline constexpr const char* LOGGING = "logging";
}  // namespace config_section

namespace config_key {
    // Generator section
    inline constexpr const char* NAMESPACE = "namespace";
    inline constexpr const char* SHADERS_DIR = "shaders_dir";
    inline constexpr const char* OUTPUT = "output";

    // Tools section
    inline constexpr const char* CROSS_COMPILER = "cross_compiler";
    inline constexpr const char* BYTECODE_COMPILER = "bytecode_compiler";
    inline constexpr const char* FLATTEN_UBOS = "flatten_ubos";

    // Logging section
    inline constexpr const char* LEVEL = "level";
    inline constexpr const char* FILE_LEVEL = "file_level";
    inline constexpr const char* DIRECTORY = "directory";
    inline constexpr const char* CATEGORIES = "categories";
}  // namespace config_key

}  // namespace shadergen::core
