// ShaderGen Conversion Pipeline
// reflection.cpp - Reflection decoding and canonicalization

#include <nlohmann/json.hpp>

#include <shadergen/convert/data_type.hpp>
#include <shadergen/convert/reflection.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace shadergen::convert {

using json = nlohmann::json;

namespace {

template<typename T>
void read_optional(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end()) {
        it->get_to(out);
    }
}

// Locations, bindings, sizes and offsets
int read_count(const json& j, const char* key) {
    int value = j.at(key).get<int>();
    if (value < 0) {
        throw core::Error(core::ErrorCode::ReflectionParseError, fmt::format("parse reflection: negative {}", key));
    }
    return value;
}

int read_optional_count(const json& j, const char* key) {
    return j.contains(key) ? read_count(j, key) : 0;
}

int checked_offset(int64_t offset) {
    if (offset > std::numeric_limits<int>::max()) {
        throw core::Error(core::ErrorCode::ReflectionParseError,
                          fmt::format("uniform offset {} out of range", offset));
    }
    return static_cast<int>(offset);
}

}  // namespace

// nlohmann_json looks these up by ADL
void from_json(const json& j, InputReflection& input) {
    input.id = j.value("id", 0);
    j.at("name").get_to(input.name);
    input.location = read_count(j, "location");
    input.semantic = j.value("semantic", std::string());
    input.semantic_index = read_optional_count(j, "semantic_index");
    j.at("type").get_to(input.type);
}

void from_json(const json& j, UniformMemberReflection& member) {
    j.at("name").get_to(member.name);
    j.at("type").get_to(member.type);
    member.offset = read_count(j, "offset");
    member.size = read_optional_count(j, "size");
}

void from_json(const json& j, UniformBufferReflection& buffer) {
    j.at("id").get_to(buffer.id);
    j.at("name").get_to(buffer.name);
    buffer.set = read_optional_count(j, "set");
    buffer.binding = read_count(j, "binding");
    buffer.block_size = read_count(j, "block_size");
    read_optional(j, "members", buffer.members);
}

void from_json(const json& j, TextureReflection& texture) {
    texture.id = j.value("id", 0);
    j.at("name").get_to(texture.name);
    texture.set = read_optional_count(j, "set");
    texture.binding = read_count(j, "binding");
    texture.dimension = j.value("dimension", std::string());
    texture.format = j.value("format", std::string());
}

void from_json(const json& j, StageReflection& stage) {
    if (!j.is_object()) {
        throw core::Error(core::ErrorCode::ReflectionParseError, "parse reflection: stage is not an object");
    }
    read_optional(j, "inputs", stage.inputs);
    read_optional(j, "uniform_buffers", stage.uniform_buffers);
    read_optional(j, "textures", stage.textures);
}

ReflectionDocument decode_reflection(std::string_view json_text) {
    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            throw core::Error(core::ErrorCode::ReflectionParseError, "parse reflection: document is not an object");
        }

        ReflectionDocument document;
        read_optional(root, "vs", document.vs);
        read_optional(root, "fs", document.fs);
        return document;
    } catch (const json::exception& e) {
        throw core::Error(core::ErrorCode::ReflectionParseError, fmt::format("parse reflection: {}", e.what()));
    }
}

void apply_reflection(const ReflectionDocument& document, backend::ShaderSources& sources) {
    sources.inputs.clear();
    sources.uniforms = {};
    sources.textures.clear();

    // Fragment inputs are varyings, not externally bindable
    for (const auto& input : document.vs.inputs) {
        DataTypeInfo info = parse_data_type(input.type);
        sources.inputs.push_back(backend::InputLocation{
            .name = input.name,
            .location = input.location,
            .semantic = input.semantic,
            .semantic_index = input.semantic_index,
            .type = info.type,
            .size = info.components,
        });
    }
    std::stable_sort(sources.inputs.begin(), sources.inputs.end(),
                     [](const auto& a, const auto& b) { return a.location < b.location; });

    // A stage may declare its uniforms only where it uses them
    const auto& blocks =
        document.vs.uniform_buffers.empty() ? document.fs.uniform_buffers : document.vs.uniform_buffers;

    int64_t block_offset = 0;
    for (const auto& block : blocks) {
        sources.uniforms.blocks.push_back(backend::UniformBlock{
            .name = block.name,
            .binding = block.binding,
        });
        for (const auto& member : block.members) {
            DataTypeInfo info = parse_data_type(member.type);
            sources.uniforms.locations.push_back(backend::UniformLocation{
                // Synthetic name matching the cross-compiler's renaming
                .name = fmt::format("_{}.{}", block.id, member.name),
                .type = info.type,
                .size = info.components,
                .offset = checked_offset(block_offset + member.offset),
            });
        }
        block_offset += block.block_size;
    }
    sources.uniforms.size = checked_offset(block_offset);

    const auto& textures = document.vs.textures.empty() ? document.fs.textures : document.vs.textures;
    for (const auto& texture : textures) {
        sources.textures.push_back(backend::TextureBinding{
            .name = texture.name,
            .binding = texture.binding,
        });
    }

    SHADERGEN_LOG_TRACE(core::log_category::REFLECTION, "reflection: {} inputs, {} blocks ({} bytes), {} textures",
                        sources.inputs.size(), sources.uniforms.blocks.size(), sources.uniforms.size,
                        sources.textures.size());
}

void parse_reflection(std::string_view json_text, backend::ShaderSources& sources) {
    ReflectionDocument document = decode_reflection(json_text);
    try {
        apply_reflection(document, sources);
    } catch (const core::Error& e) {
        throw e.with_context("parse reflection");
    }
}

}  // namespace shadergen::convert
