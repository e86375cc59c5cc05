// ShaderGen Conversion Pipeline
// types.cpp - Stage and target helpers

#include <shadergen/convert/types.hpp>
#include <shadergen/core/error.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>

namespace shadergen::convert {

std::optional<ShaderStage> shader_stage_from_extension(std::string_view extension) {
    if (extension == ".vert")
        return ShaderStage::Vertex;
    if (extension == ".frag")
        return ShaderStage::Fragment;
    return std::nullopt;
}

ShaderStage shader_stage_from_path(const std::filesystem::path& path) {
    auto stage = shader_stage_from_extension(path.extension().string());
    if (!stage) {
        throw core::Error(core::ErrorCode::UnrecognizedShaderStage,
                          fmt::format("unrecognized shader type: {}", path.string()));
    }
    return *stage;
}

const char* shader_stage_flag(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return "--vert";
        case ShaderStage::Fragment:
            return "--frag";
        default:
            return "";
    }
}

const char* shader_stage_suffix(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return "vs";
        case ShaderStage::Fragment:
            return "fs";
        default:
            return "";
    }
}

const char* hlsl_profile(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return "vs_4_0";
        case ShaderStage::Fragment:
            return "ps_4_0";
        default:
            return "";
    }
}

const char* backend_language_token(BackendLanguage language) {
    switch (language) {
        case BackendLanguage::GlslEs:
            return "gles";
        case BackendLanguage::Hlsl:
            return "hlsl";
        default:
            return "";
    }
}

std::string backend_target_name(const BackendTarget& target) {
    return fmt::format("{} {}", backend_language_token(target.language), target.profile);
}

std::string shader_identifier(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    for (char& c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            c = '_';
        }
    }
    return "shader_" + name;
}

}  // namespace shadergen::convert
