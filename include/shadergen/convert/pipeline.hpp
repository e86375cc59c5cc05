// ShaderGen Conversion Pipeline
// pipeline.hpp - Per-shader orchestration of variants and backends

#pragma once

#include "bytecode.hpp"
#include "compiler.hpp"
#include "types.hpp"
#include "variant.hpp"

#include <filesystem>
#include <vector>

namespace shadergen::convert {

// Everything one run shares. The owner of the scratch directory outlives
// the pipeline; no state is carried from one shader file to the next.
struct BuildContext {
    std::filesystem::path scratch_dir;
    Compiler* compiler = nullptr;
    BytecodeCompiler* bytecode_compiler = nullptr;  // Null when fxc is unavailable
    std::vector<Variant> variants = default_variants();
};

// Regular files in shaders_dir sorted by path, each with its stage.
// Throws Error(DiscoveryError) if the directory cannot be read and
// Error(UnrecognizedShaderStage) for a file that is neither .vert nor .frag.
[[nodiscard]] std::vector<ShaderFile> discover_shaders(const std::filesystem::path& shaders_dir);

class Pipeline {
public:
    // Throws Error(ConfigError) without a compiler or without variants
    explicit Pipeline(BuildContext context);

    // Expand one variant and run it through every backend target.
    // Reflection is taken from the GLSL ES 100 conversion only.
    [[nodiscard]] VariantOutput process_variant(const ShaderFile& file, const Variant& variant);

    // All variants of one file, collapsed to a single output when every
    // variant produced the same GLSL ES 100 text
    [[nodiscard]] ShaderEntry process(const ShaderFile& file);

    // Every file in discovery order. A recorded SIGINT/SIGTERM aborts with
    // Error(Interrupted) before the next file or backend call.
    [[nodiscard]] std::vector<ShaderEntry> run(const std::vector<ShaderFile>& files);

private:
    BuildContext context_;
};

}  // namespace shadergen::convert
