// ShaderGen Core
// error.hpp - Run-aborting error type shared by every pipeline stage

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shadergen::core {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint8_t {
    DiscoveryError,           // Shader directory unreadable
    UnrecognizedShaderStage,  // Extension is neither .vert nor .frag
    TemplateError,            // Bad substitution template
    ConversionError,          // Cross-compiler subprocess failure
    ReflectionParseError,     // Malformed reflection JSON
    UnsupportedType,          // Unknown scalar/vector type token
    BytecodeCompileError,     // Bytecode compiler subprocess failure
    ToolNotFound,             // Required external tool missing
    ConfigError,              // Bad configuration or command line
    IoError,                  // Output artifact could not be written
    Interrupted,              // SIGINT or SIGTERM received
};

[[nodiscard]] const char* error_code_name(ErrorCode code);

// ============================================================================
// Error
// ============================================================================

// Every failure aborts the whole run; there is no partial build.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    // Same code, message prefixed with "context: "
    [[nodiscard]] Error with_context(std::string_view context) const;

private:
    ErrorCode code_;
};

}  // namespace shadergen::core
