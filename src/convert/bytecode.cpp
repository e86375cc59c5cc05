// ShaderGen Conversion Pipeline
// bytecode.cpp - fxc subprocess wrapper

#include <shadergen/convert/bytecode.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>
#include <shadergen/platform/process.hpp>

namespace shadergen::convert {

FxcCompiler::FxcCompiler(FxcOptions options) : options_(std::move(options)) {}

std::vector<uint8_t> FxcCompiler::compile(std::string_view hlsl, std::string_view entry_point,
                                          std::string_view profile) {
    platform::ScopedFile input(options_.scratch_dir / "shader.hlsl");
    platform::ScopedFile output(options_.scratch_dir / "shader.bin");

    if (!platform::FileSystem::write_text(input.path(), hlsl)) {
        throw core::Error(core::ErrorCode::BytecodeCompileError,
                          fmt::format("failed to write {}", input.path().string()));
    }

    std::vector<std::string> args = {
        "/T", std::string(profile), "/E", std::string(entry_point), "/nologo", "/Fo", output.path().string(),
        input.path().string(),
    };

    SHADERGEN_LOG_DEBUG(core::log_category::COMPILER, "fxc {} ({})", profile, entry_point);

    platform::ProcessResult process = platform::run_process(options_.executable, args);
    if (!process.succeeded()) {
        std::string reason = process.launched ? fmt::format("fxc exited with status {}", process.exit_code)
                                              : std::string("fxc could not be started");
        throw core::Error(core::ErrorCode::BytecodeCompileError, fmt::format("{}\n{}", reason, process.output));
    }

    auto bytecode = platform::FileSystem::read_binary(output.path());
    if (!bytecode) {
        throw core::Error(core::ErrorCode::BytecodeCompileError,
                          fmt::format("fxc produced no output {}\n{}", output.path().string(), process.output));
    }
    return std::move(*bytecode);
}

}  // namespace shadergen::convert
