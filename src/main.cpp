// ShaderGen - Shader variant and reflection generator
// main.cpp - Entry point

#include <argparse/argparse.hpp>

#include <shadergen/convert/bytecode.hpp>
#include <shadergen/convert/compiler.hpp>
#include <shadergen/convert/generator.hpp>
#include <shadergen/core/config.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/core/logger.hpp>
#include <shadergen/platform/file_io.hpp>
#include <shadergen/platform/process.hpp>
#include <shadergen/platform/signals.hpp>

#include <iostream>
#include <memory>
#include <optional>

namespace {

constexpr const char* VERSION = "0.1.0";

void add_arguments(argparse::ArgumentParser& parser) {
    parser.add_description("Convert shader templates into GLSL ES, HLSL and reflection data as a C++ header");

    parser.add_argument("-n", "--namespace").help("C++ namespace of the generated header (e.g. gpu::shaders)");
    parser.add_argument("-s", "--shaders").help("Directory holding the .vert and .frag templates");
    parser.add_argument("-o", "--output").help("Generated header path");
    parser.add_argument("-c", "--config").help("JSON configuration file");
    parser.add_argument("--glslcc").help("Cross-compiler executable name or path");
    parser.add_argument("--fxc").help("Bytecode compiler executable name or path");
    parser.add_argument("--flatten-ubos")
        .help("Ask the cross-compiler to flatten uniform blocks")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("-v", "--verbose").help("Enable debug output").default_value(false).implicit_value(true);
}

// Command line values take precedence over the config file
void apply_overrides(const argparse::ArgumentParser& parser, shadergen::core::Config& config) {
    using namespace shadergen::core;

    if (auto value = parser.present("--namespace")) {
        config.set_string(config_section::GENERATOR, config_key::NAMESPACE, *value);
    }
    if (auto value = parser.present("--shaders")) {
        config.set_string(config_section::GENERATOR, config_key::SHADERS_DIR, *value);
    }
    if (auto value = parser.present("--output")) {
        config.set_string(config_section::GENERATOR, config_key::OUTPUT, *value);
    }
    if (auto value = parser.present("--glslcc")) {
        config.set_string(config_section::TOOLS, config_key::CROSS_COMPILER, *value);
    }
    if (auto value = parser.present("--fxc")) {
        config.set_string(config_section::TOOLS, config_key::BYTECODE_COMPILER, *value);
    }
    if (parser.get<bool>("--flatten-ubos")) {
        config.set_bool(config_section::TOOLS, config_key::FLATTEN_UBOS, true);
    }
    if (parser.get<bool>("--verbose")) {
        config.set_string(config_section::LOGGING, config_key::LEVEL, "debug");
    }
}

int run(const argparse::ArgumentParser& parser) {
    using namespace shadergen;
    using core::config_key::BYTECODE_COMPILER;
    using core::config_key::CROSS_COMPILER;
    using core::config_section::GENERATOR;
    using core::config_section::TOOLS;

    core::Config config;
    if (auto path = parser.present("--config")) {
        config.load(*path);
    }
    apply_overrides(parser, config);
    core::Logger::initialize(core::make_logger_config(config));

    convert::GeneratorOptions options;
    options.emit.namespace_name = config.get_string(GENERATOR, core::config_key::NAMESPACE);
    options.shaders_dir = config.get_string(GENERATOR, core::config_key::SHADERS_DIR, "shaders");
    options.output_path = config.get_string(GENERATOR, core::config_key::OUTPUT, "shaders.hpp");

    if (options.emit.namespace_name.empty()) {
        throw core::Error(core::ErrorCode::ConfigError, "no namespace given; use --namespace or generator.namespace");
    }

    std::string glslcc_name = config.get_string(TOOLS, CROSS_COMPILER, "glslcc");
    auto glslcc = platform::find_executable(glslcc_name);
    if (!glslcc) {
        throw core::Error(core::ErrorCode::ToolNotFound, fmt::format("cross-compiler \"{}\" not found", glslcc_name));
    }
    SHADERGEN_LOG_DEBUG(core::log_category::GENERATOR, "Using cross-compiler {}", glslcc->string());

    std::string fxc_name = config.get_string(TOOLS, BYTECODE_COMPILER, "fxc");
    auto fxc = platform::find_executable(fxc_name);
    if (fxc) {
        SHADERGEN_LOG_DEBUG(core::log_category::GENERATOR, "Using bytecode compiler {}", fxc->string());
    }

    // Removed on every exit path, including errors and SIGINT/SIGTERM
    platform::ScopedTempDirectory scratch("shadergen");

    convert::GlslccCompiler compiler(convert::GlslccOptions{
        .executable = *glslcc,
        .scratch_dir = scratch.path(),
        .flatten_ubos = config.get_bool(TOOLS, core::config_key::FLATTEN_UBOS, false),
    });

    std::unique_ptr<convert::FxcCompiler> bytecode_compiler;
    if (fxc) {
        bytecode_compiler = std::make_unique<convert::FxcCompiler>(convert::FxcOptions{
            .executable = *fxc,
            .scratch_dir = scratch.path(),
        });
    }

    convert::BuildContext context;
    context.scratch_dir = scratch.path();
    context.compiler = &compiler;
    context.bytecode_compiler = bytecode_compiler.get();

    convert::generate(options, std::move(context));
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    shadergen::platform::install_interrupt_handlers();

    argparse::ArgumentParser parser("shadergen", VERSION);
    add_arguments(parser);

    try {
        parser.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    int status = 1;
    try {
        status = run(parser);
    } catch (const shadergen::core::Error& error) {
        // Config errors can happen before the logger is set up
        if (!shadergen::core::Logger::is_initialized()) {
            shadergen::core::Logger::initialize();
        }
        SHADERGEN_LOG_CRITICAL(shadergen::core::log_category::GENERATOR, "{}: {}",
                               shadergen::core::error_code_name(error.code()), error.what());
    } catch (const std::exception& error) {
        if (!shadergen::core::Logger::is_initialized()) {
            shadergen::core::Logger::initialize();
        }
        SHADERGEN_LOG_CRITICAL(shadergen::core::log_category::GENERATOR, "{}", error.what());
    }

    shadergen::core::Logger::shutdown();
    return status;
}
