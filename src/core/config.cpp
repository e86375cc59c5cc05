// ShaderGen Core
// config.cpp - JSON-based generator configuration implementation

#include <nlohmann/json.hpp>

#include <algorithm>

#include <shadergen/core/config.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>

namespace shadergen::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;

    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

void Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        throw Error(ErrorCode::ConfigError, "failed to read config file: " + path.string());
    }

    json parsed;
    try {
        parsed = json::parse(*content);
    } catch (const json::parse_error& e) {
        throw Error(ErrorCode::ConfigError, "failed to parse config file " + path.string() + ": " + e.what());
    }

    if (!parsed.is_object()) {
        throw Error(ErrorCode::ConfigError, "config file must contain a JSON object: " + path.string());
    }

    for (const auto& [section, values] : parsed.items()) {
        if (!values.is_object()) {
            throw Error(ErrorCode::ConfigError, "config section '" + section + "' must be an object");
        }
        for (const auto& [key, value] : values.items()) {
            impl_->data[section][key] = value;
        }
    }

    SHADERGEN_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_boolean()) {
        return value->get<bool>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

std::map<std::string, std::string> Config::get_string_map(std::string_view section, std::string_view key) const {
    std::map<std::string, std::string> result;
    const json* value = impl_->find(section, key);
    if (value == nullptr) {
        return result;
    }
    if (!value->is_object()) {
        throw Error(ErrorCode::ConfigError, fmt::format("{}.{} must be an object", section, key));
    }
    for (const auto& [name, entry] : value->items()) {
        if (!entry.is_string()) {
            throw Error(ErrorCode::ConfigError, fmt::format("{}.{}.{} must be a string", section, key, name));
        }
        result.emplace(name, entry.get<std::string>());
    }
    return result;
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
}

void Config::set_defaults() {
    impl_->data = json{{config_section::GENERATOR,
                        {{config_key::NAMESPACE, ""}, {config_key::SHADERS_DIR, "shaders"}, {config_key::OUTPUT, "shaders.hpp"}}},
                       {config_section::TOOLS,
                        {{config_key::CROSS_COMPILER, "glslcc"},
                         {config_key::BYTECODE_COMPILER, "fxc"},
                         {config_key::FLATTEN_UBOS, false}}},
                       {config_section::LOGGING,
                        {{config_key::LEVEL, "info"},
                         {config_key::FILE_LEVEL, "debug"},
                         {config_key::DIRECTORY, ""},
                         {config_key::CATEGORIES, json::object()}}}};
}

namespace {

LogLevel level_setting(std::string_view key, const std::string& name) {
    auto level = parse_log_level(name);
    if (!level) {
        throw Error(ErrorCode::ConfigError, fmt::format("logging.{}: unknown log level \"{}\"", key, name));
    }
    return *level;
}

}  // namespace

LoggerConfig make_logger_config(const Config& config) {
    using config_section::LOGGING;

    LoggerConfig logger_config;
    logger_config.console_level =
        level_setting(config_key::LEVEL, config.get_string(LOGGING, config_key::LEVEL, "info"));
    logger_config.file_level =
        level_setting(config_key::FILE_LEVEL, config.get_string(LOGGING, config_key::FILE_LEVEL, "debug"));
    logger_config.log_directory = config.get_string(LOGGING, config_key::DIRECTORY);

    for (const auto& [category, level_name] : config.get_string_map(LOGGING, config_key::CATEGORIES)) {
        if (std::find(log_category::ALL.begin(), log_category::ALL.end(), category) == log_category::ALL.end()) {
            throw Error(ErrorCode::ConfigError, fmt::format("logging.categories: unknown category \"{}\"", category));
        }
        logger_config.category_levels[category] = level_setting(config_key::CATEGORIES, level_name);
    }
    return logger_config;
}

}  // namespace shadergen::core
