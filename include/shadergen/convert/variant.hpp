// ShaderGen Conversion Pipeline
// variant.hpp - Shader template variants and textual expansion

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace shadergen::convert {

using Substitutions = std::map<std::string, std::string, std::less<>>;

// A named set of template values, e.g. how a fragment shader fetches its color
struct Variant {
    std::string name;
    Substitutions values;
};

// Keys referenced by the shipped shader templates
namespace template_key {
    inline constexpr const char* FETCH_COLOR_EXPR = "FetchColorExpr";
    inline constexpr const char* HEADER = "Header";
}  // namespace template_key

// "uniform_color" then "sampled_texture"; order is the emitted variant index
[[nodiscard]] std::vector<Variant> default_variants();

// Replace every {{.Key}} action (whitespace inside the braces allowed) with
// its value and drop {{/* comments */}}. Throws Error(TemplateError) for an
// undefined key, an unterminated action, or any other kind of action.
[[nodiscard]] std::string render_template(std::string_view text, const Substitutions& values);

// Render the template file for one variant into scratch_dir, keeping the
// file name so the stage extension survives. Returns the written path.
// Throws Error(TemplateError) if the template cannot be read or rendered.
[[nodiscard]] std::filesystem::path expand_variant(const std::filesystem::path& template_path, const Variant& variant,
                                                   const std::filesystem::path& scratch_dir);

}  // namespace shadergen::convert
