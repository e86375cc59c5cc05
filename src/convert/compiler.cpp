// ShaderGen Conversion Pipeline
// compiler.cpp - glslcc subprocess wrapper

#include <shadergen/convert/compiler.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>
#include <shadergen/platform/process.hpp>

namespace shadergen::convert {

namespace {

constexpr const char* OUTPUT_BASENAME = "shader";

}  // namespace

GlslccCompiler::GlslccCompiler(GlslccOptions options) : options_(std::move(options)) {}

std::vector<std::string> GlslccCompiler::build_arguments(const std::filesystem::path& source_path, ShaderStage stage,
                                                         const BackendTarget& target) const {
    std::vector<std::string> args = {
        "--silent",
        "--optimize",
        "--reflect",
        "--output",
        (options_.scratch_dir / OUTPUT_BASENAME).string(),
        "--lang",
        backend_language_token(target.language),
        "--profile",
        std::string(target.profile),
        shader_stage_flag(stage),
        source_path.string(),
    };
    if (options_.flatten_ubos) {
        args.emplace_back("--flatten-ubos");
    }
    return args;
}

ConversionResult GlslccCompiler::convert(const std::filesystem::path& source_path, ShaderStage stage,
                                         const BackendTarget& target) {
    auto args = build_arguments(source_path, stage, target);

    SHADERGEN_LOG_DEBUG(core::log_category::COMPILER, "glslcc {} -> {}", source_path.filename().string(),
                        backend_target_name(target));

    // glslcc names its outputs <output>_<vs|fs> and <output>_<vs|fs>.json
    std::string output_name = fmt::format("{}_{}", OUTPUT_BASENAME, shader_stage_suffix(stage));
    platform::ScopedFile source_file(options_.scratch_dir / output_name);
    platform::ScopedFile reflection_file(options_.scratch_dir / (output_name + ".json"));

    platform::ProcessResult process = platform::run_process(options_.executable, args);
    if (!process.succeeded()) {
        std::string reason = process.launched ? fmt::format("glslcc exited with status {}", process.exit_code)
                                              : std::string("glslcc could not be started");
        throw core::Error(core::ErrorCode::ConversionError,
                          fmt::format("{}: {}\n{}", source_path.string(), reason, process.output));
    }
    if (!process.output.empty()) {
        SHADERGEN_LOG_DEBUG(core::log_category::COMPILER, "glslcc output:\n{}", process.output);
    }

    ConversionResult result;

    auto source = platform::FileSystem::read_text(source_file.path());
    if (!source) {
        throw core::Error(core::ErrorCode::ConversionError,
                          fmt::format("{}: glslcc produced no output {}\n{}", source_path.string(),
                                      source_file.path().string(), process.output));
    }
    result.source = std::move(*source);

    auto reflection = platform::FileSystem::read_text(reflection_file.path());
    if (!reflection) {
        throw core::Error(core::ErrorCode::ConversionError,
                          fmt::format("{}: glslcc produced no reflection {}\n{}", source_path.string(),
                                      reflection_file.path().string(), process.output));
    }
    result.reflection = std::move(*reflection);

    return result;
}

}  // namespace shadergen::convert
