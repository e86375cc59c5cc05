// ShaderGen Conversion Pipeline
// generator.cpp - Full generator run

#include <shadergen/convert/generator.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>

namespace shadergen::convert {

GeneratorSummary generate(const GeneratorOptions& options, BuildContext context) {
    // Checked up front so a bad namespace does not cost a full conversion run
    if (!is_valid_namespace(options.emit.namespace_name)) {
        throw core::Error(core::ErrorCode::ConfigError,
                          fmt::format("invalid namespace name \"{}\"", options.emit.namespace_name));
    }

    GeneratorSummary summary;
    summary.has_bytecode = context.bytecode_compiler != nullptr;
    if (!summary.has_bytecode) {
        SHADERGEN_LOG_WARN(core::log_category::GENERATOR, "No bytecode compiler; HLSL bytecode will be omitted");
    }

    std::vector<ShaderFile> files = discover_shaders(options.shaders_dir);

    Pipeline pipeline(std::move(context));
    std::vector<ShaderEntry> entries = pipeline.run(files);

    std::string module = emit_module(entries, options.emit);
    write_module(options.output_path, module);

    summary.shader_count = entries.size();
    for (const auto& entry : entries) {
        summary.record_count += entry.variants.size();
    }

    SHADERGEN_LOG_INFO(core::log_category::GENERATOR, "Generated {} shader(s), {} record(s) into {}",
                       summary.shader_count, summary.record_count, options.output_path.string());
    return summary;
}

}  // namespace shadergen::convert
