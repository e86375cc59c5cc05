// ShaderGen Backend Interface
// shader_sources.hpp - Backend-agnostic shader record consumed by renderers
//
// Generated shader headers are built from these types with designated
// initializers, so member order is part of the generated-code contract.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shadergen::backend {

// ============================================================================
// Reflection Types
// ============================================================================

enum class DataType : uint8_t {
    Float,
    Int,
};

// Vertex attribute; renderers bind attributes by position, not name
struct InputLocation {
    std::string name;
    int location = 0;
    std::string semantic;  // HLSL semantic, e.g. "TEXCOORD"
    int semantic_index = 0;

    DataType type = DataType::Float;
    int size = 0;  // Component count

    bool operator==(const InputLocation&) const = default;
};

struct UniformBlock {
    std::string name;
    int binding = 0;

    bool operator==(const UniformBlock&) const = default;
};

// Offset is into the single flattened buffer spanning all blocks
struct UniformLocation {
    std::string name;  // "_<block id>.<member>"
    DataType type = DataType::Float;
    int size = 0;  // Component count
    int offset = 0;

    bool operator==(const UniformLocation&) const = default;
};

struct UniformsReflection {
    std::vector<UniformBlock> blocks;
    std::vector<UniformLocation> locations;
    int size = 0;  // Total bytes across all blocks

    bool operator==(const UniformsReflection&) const = default;
};

struct TextureBinding {
    std::string name;
    int binding = 0;

    bool operator==(const TextureBinding&) const = default;
};

// ============================================================================
// Shader Sources
// ============================================================================

struct ShaderSources {
    std::vector<InputLocation> inputs;
    UniformsReflection uniforms;
    std::vector<TextureBinding> textures;

    std::string glsl100es;
    std::string glsl300es;
    std::optional<std::vector<uint8_t>> hlsl;  // Direct3D bytecode; absent without fxc

    bool operator==(const ShaderSources&) const = default;
};

[[nodiscard]] inline const char* data_type_name(DataType type) {
    switch (type) {
        case DataType::Float:
            return "Float";
        case DataType::Int:
            return "Int";
        default:
            return "Unknown";
    }
}

}  // namespace shadergen::backend
