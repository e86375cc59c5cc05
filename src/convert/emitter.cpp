// ShaderGen Conversion Pipeline
// emitter.cpp - Generated C++ header serialization

#include <shadergen/convert/emitter.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>

#include <cctype>
#include <map>

namespace shadergen::convert {

namespace {

constexpr const char* SOURCES_TYPE = "::shadergen::backend::ShaderSources";
constexpr const char* DATA_TYPE = "::shadergen::backend::DataType";
constexpr size_t BYTES_PER_LINE = 16;

bool is_identifier(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

std::string data_type_literal(backend::DataType type) {
    return fmt::format("{}::{}", DATA_TYPE, backend::data_type_name(type));
}

void emit_inputs(std::string& out, const std::vector<backend::InputLocation>& inputs) {
    out += "    .inputs = {\n";
    for (const auto& input : inputs) {
        out += fmt::format(
            "        {{.name = {}, .location = {}, .semantic = {}, .semantic_index = {}, .type = {}, .size = {}}},\n",
            cpp_string_literal(input.name), input.location, cpp_string_literal(input.semantic), input.semantic_index,
            data_type_literal(input.type), input.size);
    }
    out += "    },\n";
}

void emit_uniforms(std::string& out, const backend::UniformsReflection& uniforms) {
    out += "    .uniforms = {\n";
    out += "        .blocks = {\n";
    for (const auto& block : uniforms.blocks) {
        out += fmt::format("            {{.name = {}, .binding = {}}},\n", cpp_string_literal(block.name),
                           block.binding);
    }
    out += "        },\n";
    out += "        .locations = {\n";
    for (const auto& location : uniforms.locations) {
        out += fmt::format("            {{.name = {}, .type = {}, .size = {}, .offset = {}}},\n",
                           cpp_string_literal(location.name), data_type_literal(location.type), location.size,
                           location.offset);
    }
    out += "        },\n";
    out += fmt::format("        .size = {},\n", uniforms.size);
    out += "    },\n";
}

void emit_textures(std::string& out, const std::vector<backend::TextureBinding>& textures) {
    out += "    .textures = {\n";
    for (const auto& texture : textures) {
        out += fmt::format("        {{.name = {}, .binding = {}}},\n", cpp_string_literal(texture.name),
                           texture.binding);
    }
    out += "    },\n";
}

void emit_bytecode(std::string& out, const std::vector<uint8_t>& bytecode) {
    out += "    .hlsl = std::vector<uint8_t>{";
    for (size_t i = 0; i < bytecode.size(); ++i) {
        if (i % BYTES_PER_LINE == 0) {
            out += "\n       ";
        }
        out += fmt::format(" 0x{:02x},", bytecode[i]);
    }
    out += "\n    },\n";
}

void emit_hlsl_comment(std::string& out, const VariantOutput& variant) {
    out += fmt::format("// HLSL ({}):\n", variant.variant);
    std::string_view text = variant.hlsl_source;
    while (!text.empty()) {
        size_t newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        // A trailing backslash would splice the next line into the comment
        while (!line.empty() && (line.back() == '\r' || line.back() == '\\')) {
            line.remove_suffix(1);
        }
        out += line.empty() ? std::string("//\n") : fmt::format("// {}\n", line);
        if (newline == std::string_view::npos) {
            break;
        }
        text.remove_prefix(newline + 1);
    }
}

// Empty lists and absent bytecode are left to the member defaults
void emit_sources(std::string& out, const backend::ShaderSources& sources) {
    out += fmt::format("{}{{\n", SOURCES_TYPE);
    if (!sources.inputs.empty()) {
        emit_inputs(out, sources.inputs);
    }
    if (!sources.uniforms.blocks.empty()) {
        emit_uniforms(out, sources.uniforms);
    }
    if (!sources.textures.empty()) {
        emit_textures(out, sources.textures);
    }
    out += fmt::format("    .glsl100es =\n        {},\n", cpp_string_literal(sources.glsl100es, "        "));
    out += fmt::format("    .glsl300es =\n        {},\n", cpp_string_literal(sources.glsl300es, "        "));
    if (sources.hlsl) {
        emit_bytecode(out, *sources.hlsl);
    }
    out += "}";
}

}  // namespace

bool is_valid_namespace(std::string_view name) {
    for (;;) {
        size_t separator = name.find("::");
        if (!is_identifier(name.substr(0, separator))) {
            return false;
        }
        if (separator == std::string_view::npos) {
            return true;
        }
        name.remove_prefix(separator + 2);
    }
}

std::string cpp_string_literal(std::string_view text, std::string_view continuation_indent) {
    if (text.empty()) {
        return "\"\"";
    }

    std::string out = "\"";
    for (size_t i = 0; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        switch (c) {
            case '\n':
                out += "\\n\"";
                if (i + 1 < text.size()) {
                    out += "\n";
                    out += continuation_indent;
                    out += "\"";
                } else {
                    return out;
                }
                continue;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    // Octal escapes stop after three digits, hex escapes do not
                    out += fmt::format("\\{:03o}", c);
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
    out += "\"";
    return out;
}

std::string emit_module(std::span<const ShaderEntry> entries, const EmitOptions& options) {
    if (!is_valid_namespace(options.namespace_name)) {
        throw core::Error(core::ErrorCode::ConfigError,
                          fmt::format("invalid namespace name \"{}\"", options.namespace_name));
    }

    // Distinct file names can sanitize to the same identifier
    std::map<std::string_view, const ShaderEntry*> seen;
    for (const auto& entry : entries) {
        auto [it, inserted] = seen.emplace(entry.identifier, &entry);
        if (!inserted) {
            throw core::Error(core::ErrorCode::ConfigError,
                              fmt::format("duplicate identifier {} for {} and {}", entry.identifier,
                                          it->second->file.path.string(), entry.file.path.string()));
        }
    }

    std::string out;
    out += "// Code generated by shadergen. DO NOT EDIT.\n\n";
    out += "#pragma once\n\n";
    out += "#include <array>\n";
    out += "#include <cstdint>\n";
    out += "#include <vector>\n\n";
    out += "#include <shadergen/backend/shader_sources.hpp>\n\n";
    out += fmt::format("namespace {} {{\n", options.namespace_name);

    for (const auto& entry : entries) {
        out += "\n";
        if (options.include_hlsl_source) {
            for (const auto& variant : entry.variants) {
                emit_hlsl_comment(out, variant);
            }
        }

        if (!entry.is_multi_variant()) {
            out += fmt::format("inline const {} {} = ", SOURCES_TYPE, entry.identifier);
            emit_sources(out, entry.variants.front().sources);
            out += ";\n";
            continue;
        }

        out += fmt::format("inline const std::array<{}, {}> {} = {{\n", SOURCES_TYPE, entry.variants.size(),
                           entry.identifier);
        for (size_t i = 0; i < entry.variants.size(); ++i) {
            out += fmt::format("// [{}] {}\n", i, entry.variants[i].variant);
            emit_sources(out, entry.variants[i].sources);
            out += ",\n";
        }
        out += "};\n";
    }

    out += fmt::format("\n}}  // namespace {}\n", options.namespace_name);

    SHADERGEN_LOG_DEBUG(core::log_category::EMIT, "Emitted {} shader(s), {} bytes", entries.size(), out.size());
    return out;
}

void write_module(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::path staging = path;
    staging += ".tmp";

    if (!platform::FileSystem::write_text(staging, content)) {
        platform::FileSystem::remove(staging);
        throw core::Error(core::ErrorCode::IoError, fmt::format("failed to write {}", staging.string()));
    }

    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        platform::FileSystem::remove(staging);
        throw core::Error(core::ErrorCode::IoError,
                          fmt::format("failed to move {} to {}: {}", staging.string(), path.string(), ec.message()));
    }

    SHADERGEN_LOG_INFO(core::log_category::EMIT, "Wrote {}", path.string());
}

}  // namespace shadergen::convert
