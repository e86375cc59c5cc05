// ShaderGen Conversion Pipeline
// reflection.hpp - Cross-compiler reflection documents and their canonical form

#pragma once

#include <shadergen/backend/shader_sources.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace shadergen::convert {

// ============================================================================
// Raw Reflection Records
// ============================================================================
// Typed mirror of the JSON sidecar written by the cross-compiler.

struct InputReflection {
    int id = 0;
    std::string name;
    int location = 0;
    std::string semantic;
    int semantic_index = 0;
    std::string type;
};

struct UniformMemberReflection {
    std::string name;
    std::string type;
    int offset = 0;
    int size = 0;
};

struct UniformBufferReflection {
    int id = 0;
    std::string name;
    int set = 0;
    int binding = 0;
    int block_size = 0;
    std::vector<UniformMemberReflection> members;
};

struct TextureReflection {
    int id = 0;
    std::string name;
    int set = 0;
    int binding = 0;
    std::string dimension;
    std::string format;
};

struct StageReflection {
    std::vector<InputReflection> inputs;
    std::vector<UniformBufferReflection> uniform_buffers;
    std::vector<TextureReflection> textures;
};

struct ReflectionDocument {
    StageReflection vs;
    StageReflection fs;
};

// ============================================================================
// Parsing
// ============================================================================

// Decode the JSON sidecar. Both stages and every list are optional; present
// fields must have the right shape. Throws Error(ReflectionParseError).
[[nodiscard]] ReflectionDocument decode_reflection(std::string_view json_text);

// Canonicalize a decoded document into sources.inputs, sources.uniforms and
// sources.textures, replacing whatever they held:
//  - inputs come from the vertex stage only, sorted by location
//  - uniform blocks and textures come from the vertex stage, or from the
//    fragment stage when the vertex stage declares none
//  - uniform offsets are flattened across blocks in declaration order
// Throws Error(UnsupportedType) for an unmappable type token.
void apply_reflection(const ReflectionDocument& document, backend::ShaderSources& sources);

// decode_reflection + apply_reflection
void parse_reflection(std::string_view json_text, backend::ShaderSources& sources);

}  // namespace shadergen::convert
