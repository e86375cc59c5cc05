// ShaderGen Conversion Pipeline
// types.hpp - Shader stages, backend targets and discovered shader files

#pragma once

#include <shadergen/backend/shader_sources.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shadergen::convert {

// ============================================================================
// Shader Stages
// ============================================================================

enum class ShaderStage : uint8_t {
    Vertex,
    Fragment,
};

// ".vert" -> Vertex, ".frag" -> Fragment
[[nodiscard]] std::optional<ShaderStage> shader_stage_from_extension(std::string_view extension);

// Throws Error(UnrecognizedShaderStage) for any other extension
[[nodiscard]] ShaderStage shader_stage_from_path(const std::filesystem::path& path);

// Cross-compiler stage flag ("--vert" / "--frag")
[[nodiscard]] const char* shader_stage_flag(ShaderStage stage);

// Suffix of the cross-compiler output files ("vs" / "fs")
[[nodiscard]] const char* shader_stage_suffix(ShaderStage stage);

// Direct3D shader model 4 profile ("vs_4_0" / "ps_4_0")
[[nodiscard]] const char* hlsl_profile(ShaderStage stage);

// ============================================================================
// Backend Targets
// ============================================================================

enum class BackendLanguage : uint8_t {
    GlslEs,
    Hlsl,
};

// Cross-compiler language token ("gles" / "hlsl")
[[nodiscard]] const char* backend_language_token(BackendLanguage language);

struct BackendTarget {
    BackendLanguage language = BackendLanguage::GlslEs;
    std::string_view profile;

    bool operator==(const BackendTarget&) const = default;
};

inline constexpr BackendTarget GLSL_ES_100{BackendLanguage::GlslEs, "100"};
inline constexpr BackendTarget GLSL_ES_300{BackendLanguage::GlslEs, "300"};
inline constexpr BackendTarget HLSL_40{BackendLanguage::Hlsl, "40"};

// Reflection is parsed from the first target only
inline constexpr std::array<BackendTarget, 3> BACKEND_TARGETS{GLSL_ES_100, GLSL_ES_300, HLSL_40};

// "gles 100", "hlsl 40", ...
[[nodiscard]] std::string backend_target_name(const BackendTarget& target);

// ============================================================================
// Shader Files
// ============================================================================

struct ShaderFile {
    std::filesystem::path path;
    ShaderStage stage = ShaderStage::Vertex;
};

// ============================================================================
// Pipeline Outputs
// ============================================================================

// One variant of one shader file
struct VariantOutput {
    std::string variant;  // Variant name
    backend::ShaderSources sources;
    std::string hlsl_source;  // Debug only, emitted as a comment
};

// The emitted unit per shader file. A single output means every variant
// produced identical GLSL ES 100 text.
struct ShaderEntry {
    ShaderFile file;
    std::string identifier;  // "shader_<file name with '.' -> '_'>"
    std::vector<VariantOutput> variants;

    [[nodiscard]] bool is_multi_variant() const { return variants.size() > 1; }
};

// "blit.frag" -> "shader_blit_frag"
[[nodiscard]] std::string shader_identifier(const std::filesystem::path& path);

}  // namespace shadergen::convert
