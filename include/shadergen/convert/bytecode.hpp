// ShaderGen Conversion Pipeline
// bytecode.hpp - HLSL to Direct3D bytecode compilation

#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace shadergen::convert {

class BytecodeCompiler {
public:
    virtual ~BytecodeCompiler() = default;

    // Throws Error(BytecodeCompileError) carrying the tool's diagnostics
    [[nodiscard]] virtual std::vector<uint8_t> compile(std::string_view hlsl, std::string_view entry_point,
                                                       std::string_view profile) = 0;
};

struct FxcOptions {
    std::filesystem::path executable;
    std::filesystem::path scratch_dir;
};

class FxcCompiler final : public BytecodeCompiler {
public:
    explicit FxcCompiler(FxcOptions options);

    [[nodiscard]] std::vector<uint8_t> compile(std::string_view hlsl, std::string_view entry_point,
                                               std::string_view profile) override;

private:
    FxcOptions options_;
};

}  // namespace shadergen::convert
