// ShaderGen Unit Tests
// generator_test.cpp - End-to-end generator runs with in-process compilers

#include <gtest/gtest.h>

#include "../child_process.hpp"
#include "fake_compilers.hpp"

#include <shadergen/convert/generator.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/platform/file_io.hpp>
#include <shadergen/platform/signals.hpp>

#include <csignal>
#include <memory>

namespace shadergen::convert {
namespace {

using fakes::FakeBytecodeCompiler;
using fakes::FakeCompiler;
using platform::FileSystem;

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<platform::ScopedTempDirectory>("shadergen-generator-test");
        scratch_ = dir_->path() / "scratch";
        FileSystem::create_directories(scratch_);

        options_.shaders_dir = dir_->path() / "shaders";
        options_.output_path = dir_->path() / "out" / "shaders.hpp";
        options_.emit.namespace_name = "gpu::shaders";

        FileSystem::write_text(options_.shaders_dir / "blit.vert", "void main() { gl_Position = vec4(0); }\n");
        FileSystem::write_text(options_.shaders_dir / "blit.frag",
                               "{{.Header}}\nvoid main() { fragColor = {{.FetchColorExpr}}; }\n");
    }

    void TearDown() override { dir_.reset(); }

    BuildContext make_context(bool with_bytecode = true) {
        BuildContext context;
        context.scratch_dir = scratch_;
        context.compiler = &compiler_;
        context.bytecode_compiler = with_bytecode ? &bytecode_ : nullptr;
        return context;
    }

    core::ErrorCode run_expecting_error(BuildContext context) {
        try {
            (void)generate(options_, std::move(context));
        } catch (const core::Error& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected the run to fail";
        return core::ErrorCode::IoError;
    }

    std::unique_ptr<platform::ScopedTempDirectory> dir_;
    std::filesystem::path scratch_;
    GeneratorOptions options_;
    FakeCompiler compiler_;
    FakeBytecodeCompiler bytecode_;
};

TEST_F(GeneratorTest, GeneratesHeader) {
    GeneratorSummary summary = generate(options_, make_context());

    EXPECT_EQ(summary.shader_count, 2u);
    EXPECT_EQ(summary.record_count, 3u);
    EXPECT_TRUE(summary.has_bytecode);

    auto header = FileSystem::read_text(options_.output_path);
    ASSERT_TRUE(header.has_value());
    EXPECT_NE(header->find("namespace gpu::shaders {"), std::string::npos);
    EXPECT_NE(header->find("std::array<::shadergen::backend::ShaderSources, 2> shader_blit_frag"), std::string::npos);
    EXPECT_NE(header->find("::shadergen::backend::ShaderSources shader_blit_vert"), std::string::npos);
    EXPECT_LT(header->find("shader_blit_frag"), header->find("shader_blit_vert"));
    EXPECT_NE(header->find(".hlsl = std::vector<uint8_t>{"), std::string::npos);

    // Scratch files never outlive their shader
    auto leftovers = FileSystem::list_files(scratch_);
    ASSERT_TRUE(leftovers.has_value());
    EXPECT_TRUE(leftovers->empty());
}

TEST_F(GeneratorTest, WithoutBytecodeCompiler) {
    GeneratorSummary summary = generate(options_, make_context(false));
    EXPECT_FALSE(summary.has_bytecode);

    auto header = FileSystem::read_text(options_.output_path);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->find(".hlsl ="), std::string::npos);
}

TEST_F(GeneratorTest, DeterministicOutput) {
    (void)generate(options_, make_context());
    auto first = FileSystem::read_text(options_.output_path);
    (void)generate(options_, make_context());
    auto second = FileSystem::read_text(options_.output_path);
    EXPECT_EQ(first, second);
}

TEST_F(GeneratorTest, InvalidNamespaceFailsBeforeConverting) {
    options_.emit.namespace_name = "gpu-shaders";
    EXPECT_EQ(run_expecting_error(make_context()), core::ErrorCode::ConfigError);
    EXPECT_TRUE(compiler_.calls.empty());
    EXPECT_FALSE(FileSystem::exists(options_.output_path));
}

TEST_F(GeneratorTest, MissingShaderDirectory) {
    options_.shaders_dir = dir_->path() / "nowhere";
    EXPECT_EQ(run_expecting_error(make_context()), core::ErrorCode::DiscoveryError);
}

TEST_F(GeneratorTest, UnrecognizedFile) {
    FileSystem::write_text(options_.shaders_dir / "blit.comp", "void main() {}\n");
    EXPECT_EQ(run_expecting_error(make_context()), core::ErrorCode::UnrecognizedShaderStage);
    EXPECT_FALSE(FileSystem::exists(options_.output_path));
}

TEST_F(GeneratorTest, FailureWritesNothing) {
    compiler_.reflection = R"({"vs": {"inputs": [
        {"id": 1, "name": "pos", "location": 0, "semantic": "TEXCOORD", "semantic_index": 0, "type": "double"}
    ]}})";
    EXPECT_EQ(run_expecting_error(make_context()), core::ErrorCode::UnsupportedType);
    EXPECT_FALSE(FileSystem::exists(options_.output_path));
}

TEST_F(GeneratorTest, FailureKeepsPreviousOutput) {
    FileSystem::write_text(options_.output_path, "// previous\n");
    bytecode_.fail = true;
    EXPECT_EQ(run_expecting_error(make_context()), core::ErrorCode::BytecodeCompileError);
    EXPECT_EQ(FileSystem::read_text(options_.output_path).value_or(""), "// previous\n");
}

TEST_F(GeneratorTest, InterruptAbortsAndRemovesScratch) {
    auto outcome = testing_support::run_in_child([this](int fd) {
        platform::install_interrupt_handlers();

        FakeCompiler compiler;
        compiler.raise_on_first_call = SIGINT;
        try {
            platform::ScopedTempDirectory scratch("shadergen-generator-signal");
            testing_support::report(fd, scratch.path().string());

            BuildContext context;
            context.scratch_dir = scratch.path();
            context.compiler = &compiler;
            (void)generate(options_, std::move(context));
            return 2;
        } catch (const core::Error& e) {
            if (e.code() != core::ErrorCode::Interrupted) {
                return 3;
            }
        }
        if (FileSystem::exists(options_.output_path)) {
            return 4;
        }
        // Stopped before the second backend of the first file
        return compiler.calls.size() == 1 ? 0 : 5;
    });

    ASSERT_FALSE(outcome.report.empty());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(FileSystem::exists(outcome.report)) << outcome.report;
    EXPECT_FALSE(FileSystem::exists(options_.output_path));
}

}  // namespace
}  // namespace shadergen::convert
