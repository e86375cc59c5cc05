// ShaderGen Conversion Pipeline
// generator.hpp - One full generator run from shader directory to header

#pragma once

#include "emitter.hpp"
#include "pipeline.hpp"

#include <cstddef>
#include <filesystem>

namespace shadergen::convert {

struct GeneratorOptions {
    std::filesystem::path shaders_dir = "shaders";
    std::filesystem::path output_path = "shaders.hpp";
    EmitOptions emit;
};

struct GeneratorSummary {
    size_t shader_count = 0;
    size_t record_count = 0;  // Emitted ShaderSources across all shaders
    bool has_bytecode = false;
};

// Discover, convert and emit. The output file is written only after every
// shader succeeded; any Error propagates and leaves no output behind.
GeneratorSummary generate(const GeneratorOptions& options, BuildContext context);

}  // namespace shadergen::convert
