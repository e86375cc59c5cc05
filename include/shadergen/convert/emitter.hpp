// ShaderGen Conversion Pipeline
// emitter.hpp - Generated C++ header output

#pragma once

#include "types.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace shadergen::convert {

struct EmitOptions {
    std::string namespace_name;        // e.g. "gpu::shaders"
    bool include_hlsl_source = true;   // HLSL text as comments above each record
};

// True for an identifier or a "::"-separated sequence of identifiers, as
// accepted by a nested namespace definition
[[nodiscard]] bool is_valid_namespace(std::string_view name);

// Quote text as a C++ string literal, one adjacent literal per source line
[[nodiscard]] std::string cpp_string_literal(std::string_view text, std::string_view continuation_indent = "");

// Serialize every entry, in the given order, as one header. Lists are
// written exactly as ordered upstream. Throws Error(ConfigError) for an
// invalid namespace.
[[nodiscard]] std::string emit_module(std::span<const ShaderEntry> entries, const EmitOptions& options);

// Write through a sibling temporary file so a failed write never leaves a
// truncated header behind. Throws Error(IoError).
void write_module(const std::filesystem::path& path, std::string_view content);

}  // namespace shadergen::convert
