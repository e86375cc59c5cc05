// ShaderGen Conversion Pipeline
// compiler.hpp - Cross-compilation of shader sources to backend languages

#pragma once

#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace shadergen::convert {

// ============================================================================
// Compiler Interface
// ============================================================================

struct ConversionResult {
    std::string source;      // Backend shader text
    std::string reflection;  // Raw JSON reflection document
};

// Converts one expanded shader file to one backend target
class Compiler {
public:
    virtual ~Compiler() = default;

    // Throws Error(ConversionError) carrying the tool's diagnostics
    [[nodiscard]] virtual ConversionResult convert(const std::filesystem::path& source_path, ShaderStage stage,
                                                   const BackendTarget& target) = 0;
};

// ============================================================================
// glslcc
// ============================================================================

struct GlslccOptions {
    std::filesystem::path executable;
    std::filesystem::path scratch_dir;  // Output files are written and removed here
    bool flatten_ubos = false;
};

class GlslccCompiler final : public Compiler {
public:
    explicit GlslccCompiler(GlslccOptions options);

    [[nodiscard]] ConversionResult convert(const std::filesystem::path& source_path, ShaderStage stage,
                                           const BackendTarget& target) override;

    // Command line without the executable itself
    [[nodiscard]] std::vector<std::string> build_arguments(const std::filesystem::path& source_path, ShaderStage stage,
                                                           const BackendTarget& target) const;

private:
    GlslccOptions options_;
};

}  // namespace shadergen::convert
