// ShaderGen Conversion Pipeline
// variant.cpp - Template rendering for shader variants

#include <shadergen/convert/variant.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>

#include <cctype>

namespace shadergen::convert {

namespace {

constexpr std::string_view ACTION_OPEN = "{{";
constexpr std::string_view ACTION_CLOSE = "}}";

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

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

size_t line_of(std::string_view text, size_t offset) {
    size_t line = 1;
    for (size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
        }
    }
    return line;
}

[[noreturn]] void template_error(std::string_view text, size_t offset, std::string_view message) {
    throw core::Error(core::ErrorCode::TemplateError, fmt::format("line {}: {}", line_of(text, offset), message));
}

}  // namespace

std::vector<Variant> default_variants() {
    return {
        Variant{
            .name = "uniform_color",
            .values = {{template_key::FETCH_COLOR_EXPR, "_color"},
                       {template_key::HEADER, "layout(binding=0) uniform Color { vec4 _color; };"}},
        },
        Variant{
            .name = "sampled_texture",
            .values = {{template_key::FETCH_COLOR_EXPR, "texture(tex, vUV)"},
                       {template_key::HEADER, "layout(binding=0) uniform sampler2D tex;"}},
        },
    };
}

std::string render_template(std::string_view text, const Substitutions& values) {
    std::string output;
    output.reserve(text.size());

    size_t cursor = 0;
    while (cursor < text.size()) {
        size_t open = text.find(ACTION_OPEN, cursor);
        if (open == std::string_view::npos) {
            output.append(text.substr(cursor));
            break;
        }
        output.append(text.substr(cursor, open - cursor));

        size_t body_start = open + ACTION_OPEN.size();
        size_t close = text.find(ACTION_CLOSE, body_start);
        if (close == std::string_view::npos) {
            template_error(text, open, "unclosed action");
        }

        std::string_view action = trim(text.substr(body_start, close - body_start));
        if (action.starts_with("/*")) {
            if (!action.ends_with("*/") || action.size() < 4) {
                template_error(text, open, "unclosed comment");
            }
        } else if (action.starts_with('.') && is_identifier(action.substr(1))) {
            auto it = values.find(action.substr(1));
            if (it == values.end()) {
                template_error(text, open, fmt::format("undefined substitution key \"{}\"", action.substr(1)));
            }
            output.append(it->second);
        } else {
            template_error(text, open, fmt::format("unsupported action \"{}\"", action));
        }

        cursor = close + ACTION_CLOSE.size();
    }
    return output;
}

std::filesystem::path expand_variant(const std::filesystem::path& template_path, const Variant& variant,
                                     const std::filesystem::path& scratch_dir) {
    auto text = platform::FileSystem::read_text(template_path);
    if (!text) {
        throw core::Error(core::ErrorCode::TemplateError, fmt::format("failed to read template {}", template_path.string()));
    }

    std::string rendered;
    try {
        rendered = render_template(*text, variant.values);
    } catch (const core::Error& e) {
        throw e.with_context(template_path.string());
    }

    std::filesystem::path scratch_path = scratch_dir / template_path.filename();
    if (!platform::FileSystem::write_text(scratch_path, rendered)) {
        throw core::Error(core::ErrorCode::IoError, fmt::format("failed to write {}", scratch_path.string()));
    }

    SHADERGEN_LOG_TRACE(core::log_category::PIPELINE, "expanded {} ({}) -> {}", template_path.string(), variant.name,
                        scratch_path.string());
    return scratch_path;
}

}  // namespace shadergen::convert
