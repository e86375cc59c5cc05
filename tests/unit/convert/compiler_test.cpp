// ShaderGen Unit Tests
// compiler_test.cpp - Tests for the glslcc and fxc subprocess wrappers

#include <gtest/gtest.h>

#include <shadergen/convert/bytecode.hpp>
#include <shadergen/convert/compiler.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/platform/file_io.hpp>

#include <memory>

namespace shadergen::convert {
namespace {

using platform::FileSystem;

// Mimics glslcc's output naming: <output>_<vs|fs> and <output>_<vs|fs>.json
constexpr const char* FAKE_GLSLCC = R"(#!/bin/sh
out=""; stage=""; lang=""; profile=""; src=""
while [ $# -gt 0 ]; do
    case "$1" in
        --output) out="$2"; shift ;;
        --lang) lang="$2"; shift ;;
        --profile) profile="$2"; shift ;;
        --vert) stage=vs ;;
        --frag) stage=fs ;;
        --*) ;;
        *) src="$1" ;;
    esac
    shift
done
printf '// %s %s\n' "$lang" "$profile" > "${out}_${stage}"
cat "$src" >> "${out}_${stage}"
printf '{"%s": {}}\n' "$stage" > "${out}_${stage}.json"
)";

constexpr const char* FAILING_TOOL = R"(#!/bin/sh
echo "ERROR: 0:7: 'vUV' : undeclared identifier"
exit 2
)";

constexpr const char* SILENT_TOOL = R"(#!/bin/sh
exit 0
)";

// Writes "DXBC" followed by the profile to the /Fo path
constexpr const char* FAKE_FXC = R"(#!/bin/sh
out=""; profile=""
while [ $# -gt 0 ]; do
    case "$1" in
        /Fo) out="$2"; shift ;;
        /T) profile="$2"; shift ;;
        /E) shift ;;
    esac
    shift
done
printf 'DXBC%s' "$profile" > "$out"
)";

class CompilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<platform::ScopedTempDirectory>("shadergen-compiler-test");
        scratch_ = dir_->path() / "scratch";
        FileSystem::create_directories(scratch_);
        source_ = dir_->path() / "blit.frag";
        FileSystem::write_text(source_, "void main() {}\n");
    }

    void TearDown() override { dir_.reset(); }

    std::filesystem::path write_tool(const std::string& name, const char* script) {
        auto path = dir_->path() / name;
        FileSystem::write_text(path, script);
        std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
        return path;
    }

    GlslccCompiler make_glslcc(const std::filesystem::path& tool, bool flatten_ubos = false) {
        return GlslccCompiler(GlslccOptions{.executable = tool, .scratch_dir = scratch_, .flatten_ubos = flatten_ubos});
    }

    std::unique_ptr<platform::ScopedTempDirectory> dir_;
    std::filesystem::path scratch_;
    std::filesystem::path source_;
};

// ============================================================================
// glslcc
// ============================================================================

TEST_F(CompilerTest, GlslccArguments) {
    auto compiler = make_glslcc("glslcc");
    auto args = compiler.build_arguments("in/blit.frag", ShaderStage::Fragment, GLSL_ES_300);

    std::vector<std::string> expected = {
        "--silent", "--optimize", "--reflect", "--output", (scratch_ / "shader").string(),
        "--lang",   "gles",       "--profile", "300",      "--frag",
        "in/blit.frag",
    };
    EXPECT_EQ(args, expected);
}

TEST_F(CompilerTest, GlslccArgumentsHlslVertex) {
    auto compiler = make_glslcc("glslcc", true);
    auto args = compiler.build_arguments("copy.vert", ShaderStage::Vertex, HLSL_40);

    ASSERT_EQ(args.size(), 12u);
    EXPECT_EQ(args[6], "hlsl");
    EXPECT_EQ(args[8], "40");
    EXPECT_EQ(args[9], "--vert");
    EXPECT_EQ(args[11], "--flatten-ubos");
}

TEST_F(CompilerTest, GlslccConvert) {
    auto compiler = make_glslcc(write_tool("glslcc", FAKE_GLSLCC));
    ConversionResult result = compiler.convert(source_, ShaderStage::Fragment, GLSL_ES_100);

    EXPECT_EQ(result.source, "// gles 100\nvoid main() {}\n");
    EXPECT_EQ(result.reflection, "{\"fs\": {}}\n");

    // Output files are scratch only
    EXPECT_FALSE(FileSystem::exists(scratch_ / "shader_fs"));
    EXPECT_FALSE(FileSystem::exists(scratch_ / "shader_fs.json"));
}

TEST_F(CompilerTest, GlslccFailureCarriesDiagnostics) {
    auto compiler = make_glslcc(write_tool("glslcc", FAILING_TOOL));
    try {
        (void)compiler.convert(source_, ShaderStage::Fragment, GLSL_ES_100);
        FAIL() << "expected ConversionError";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ConversionError);
        std::string message = e.what();
        EXPECT_NE(message.find("status 2"), std::string::npos);
        EXPECT_NE(message.find("undeclared identifier"), std::string::npos);
        EXPECT_NE(message.find("blit.frag"), std::string::npos);
    }
}

TEST_F(CompilerTest, GlslccMissingOutput) {
    auto compiler = make_glslcc(write_tool("glslcc", SILENT_TOOL));
    try {
        (void)compiler.convert(source_, ShaderStage::Vertex, GLSL_ES_300);
        FAIL() << "expected ConversionError";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ConversionError);
    }
}

TEST_F(CompilerTest, GlslccNotLaunchable) {
    auto compiler = make_glslcc(dir_->path() / "no-such-glslcc");
    try {
        (void)compiler.convert(source_, ShaderStage::Vertex, GLSL_ES_100);
        FAIL() << "expected ConversionError";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ConversionError);
    }
}

// ============================================================================
// fxc
// ============================================================================

TEST_F(CompilerTest, FxcCompile) {
    FxcCompiler compiler(FxcOptions{.executable = write_tool("fxc", FAKE_FXC), .scratch_dir = scratch_});
    std::vector<uint8_t> bytecode = compiler.compile("float4 main() : SV_Target { return 0; }", "main", "ps_4_0");

    std::string text(bytecode.begin(), bytecode.end());
    EXPECT_EQ(text, "DXBCps_4_0");
    EXPECT_FALSE(FileSystem::exists(scratch_ / "shader.hlsl"));
    EXPECT_FALSE(FileSystem::exists(scratch_ / "shader.bin"));
}

TEST_F(CompilerTest, FxcFailure) {
    FxcCompiler compiler(FxcOptions{.executable = write_tool("fxc", FAILING_TOOL), .scratch_dir = scratch_});
    try {
        (void)compiler.compile("broken", "main", "vs_4_0");
        FAIL() << "expected BytecodeCompileError";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::BytecodeCompileError);
        EXPECT_NE(std::string(e.what()).find("undeclared identifier"), std::string::npos);
    }
}

TEST_F(CompilerTest, FxcMissingOutput) {
    FxcCompiler compiler(FxcOptions{.executable = write_tool("fxc", SILENT_TOOL), .scratch_dir = scratch_});
    try {
        (void)compiler.compile("float4 main() : SV_Position { return 0; }", "main", "vs_4_0");
        FAIL() << "expected BytecodeCompileError";
    } catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::BytecodeCompileError);
    }
}

}  // namespace
}  // namespace shadergen::convert
