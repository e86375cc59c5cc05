// ShaderGen Core
// error.cpp - Error type implementation

#include <shadergen/core/error.hpp>

#include <spdlog/fmt/fmt.h>

namespace shadergen::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::DiscoveryError:
            return "DiscoveryError";
        case ErrorCode::UnrecognizedShaderStage:
            return "UnrecognizedShaderStage";
        case ErrorCode::TemplateError:
            return "TemplateError";
        case ErrorCode::ConversionError:
            return "ConversionError";
        case ErrorCode::ReflectionParseError:
            return "ReflectionParseError";
        case ErrorCode::UnsupportedType:
            return "UnsupportedType";
        case ErrorCode::BytecodeCompileError:
            return "BytecodeCompileError";
        case ErrorCode::ToolNotFound:
            return "ToolNotFound";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::Interrupted:
            return "Interrupted";
        default:
            return "Unknown";
    }
}

Error::Error(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {}

Error Error::with_context(std::string_view context) const {
    return Error(code_, fmt::format("{}: {}", context, what()));
}

}  // namespace shadergen::core
