// ShaderGen Conversion Pipeline
// pipeline.cpp - Per-shader orchestration implementation

#include <shadergen/convert/pipeline.hpp>
#include <shadergen/convert/reflection.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>
#include <shadergen/platform/signals.hpp>

#include <algorithm>

namespace shadergen::convert {

namespace {

constexpr const char* ENTRY_POINT = "main";

// Desktop GL 3 accepts GL ES 2 sources only with an explicit version
constexpr std::string_view GLSL100_VERSION_DIRECTIVE = "#version 100\n";

}  // namespace

std::vector<ShaderFile> discover_shaders(const std::filesystem::path& shaders_dir) {
    auto paths = platform::FileSystem::list_files(shaders_dir);
    if (!paths) {
        throw core::Error(core::ErrorCode::DiscoveryError,
                          fmt::format("cannot read shader directory {}", shaders_dir.string()));
    }

    std::vector<ShaderFile> files;
    files.reserve(paths->size());
    for (auto& path : *paths) {
        ShaderStage stage = shader_stage_from_path(path);
        files.push_back(ShaderFile{.path = std::move(path), .stage = stage});
    }

    SHADERGEN_LOG_INFO(core::log_category::PIPELINE, "Discovered {} shader(s) in {}", files.size(),
                       shaders_dir.string());
    return files;
}

Pipeline::Pipeline(BuildContext context) : context_(std::move(context)) {
    if (context_.compiler == nullptr) {
        throw core::Error(core::ErrorCode::ConfigError, "pipeline requires a cross-compiler");
    }
    if (context_.variants.empty()) {
        throw core::Error(core::ErrorCode::ConfigError, "pipeline requires at least one variant");
    }
}

VariantOutput Pipeline::process_variant(const ShaderFile& file, const Variant& variant) {
    VariantOutput output;
    output.variant = variant.name;

    std::filesystem::path expanded = expand_variant(file.path, variant, context_.scratch_dir);
    platform::ScopedFile expanded_file(expanded);

    for (const auto& target : BACKEND_TARGETS) {
        platform::throw_if_interrupted();

        ConversionResult result;
        try {
            result = context_.compiler->convert(expanded_file.path(), file.stage, target);
            if (target == GLSL_ES_100) {
                parse_reflection(result.reflection, output.sources);
            }
        } catch (const core::Error& e) {
            throw e.with_context(backend_target_name(target));
        }

        if (target == GLSL_ES_100) {
            output.sources.glsl100es = std::string(GLSL100_VERSION_DIRECTIVE) + result.source;
        } else if (target == GLSL_ES_300) {
            output.sources.glsl300es = std::move(result.source);
        } else if (target == HLSL_40) {
            output.hlsl_source = std::move(result.source);
        }
    }

    if (context_.bytecode_compiler != nullptr) {
        try {
            output.sources.hlsl =
                context_.bytecode_compiler->compile(output.hlsl_source, ENTRY_POINT, hlsl_profile(file.stage));
        } catch (const core::Error& e) {
            throw e.with_context(fmt::format("hlsl bytecode {}", hlsl_profile(file.stage)));
        }
    }

    return output;
}

ShaderEntry Pipeline::process(const ShaderFile& file) {
    ShaderEntry entry;
    entry.file = file;
    entry.identifier = shader_identifier(file.path);

    for (const auto& variant : context_.variants) {
        try {
            entry.variants.push_back(process_variant(file, variant));
        } catch (const core::Error& e) {
            throw e.with_context(fmt::format("{}: variant {}", file.path.string(), variant.name));
        }
    }

    // Coarse textual comparison; a variant whose values the template never
    // references yields identical output
    const auto& first = entry.variants.front().sources.glsl100es;
    bool identical = std::all_of(entry.variants.begin(), entry.variants.end(),
                                 [&](const VariantOutput& v) { return v.sources.glsl100es == first; });
    if (identical) {
        entry.variants.resize(1);
    }

    SHADERGEN_LOG_INFO(core::log_category::PIPELINE, "{}: {} variant(s)", file.path.filename().string(),
                       entry.variants.size());
    return entry;
}

std::vector<ShaderEntry> Pipeline::run(const std::vector<ShaderFile>& files) {
    std::vector<ShaderEntry> entries;
    entries.reserve(files.size());
    for (const auto& file : files) {
        platform::throw_if_interrupted();
        entries.push_back(process(file));
    }
    return entries;
}

}  // namespace shadergen::convert
