// ShaderGen Unit Tests
// fake_compilers.hpp - In-process stand-ins for glslcc and fxc

#pragma once

#include <shadergen/convert/bytecode.hpp>
#include <shadergen/convert/compiler.hpp>
#include <shadergen/core/error.hpp>
#include <shadergen/platform/file_io.hpp>

#include <csignal>
#include <optional>
#include <string>
#include <vector>

namespace shadergen::convert::fakes {

inline constexpr const char* SIMPLE_REFLECTION = R"({
    "vs": {
        "inputs": [
            {"id": 2, "name": "uv", "location": 1, "semantic": "TEXCOORD", "semantic_index": 1, "type": "float2"},
            {"id": 1, "name": "pos", "location": 0, "semantic": "TEXCOORD", "semantic_index": 0, "type": "float2"}
        ],
        "uniform_buffers": [
            {"id": 12, "name": "Block", "set": 0, "binding": 0, "block_size": 16,
             "members": [{"name": "transform", "type": "float4", "offset": 0, "size": 16}]}
        ]
    }
})";

struct ConvertCall {
    std::filesystem::path path;
    ShaderStage stage;
    BackendTarget target;
    std::string content;  // Expanded shader text seen by the compiler
};

// Echoes the expanded shader back, tagged with the target
class FakeCompiler final : public Compiler {
public:
    std::string reflection = SIMPLE_REFLECTION;
    std::optional<std::string> later_reflection;  // Returned for every target after GLSL ES 100
    std::optional<BackendTarget> fail_on;
    int raise_on_first_call = 0;  // Signal delivered to this process on the first conversion
    std::vector<ConvertCall> calls;

    ConversionResult convert(const std::filesystem::path& source_path, ShaderStage stage,
                             const BackendTarget& target) override {
        auto content = platform::FileSystem::read_text(source_path);
        calls.push_back(ConvertCall{source_path, stage, target, content.value_or("")});
        if (raise_on_first_call != 0 && calls.size() == 1) {
            std::raise(raise_on_first_call);
        }

        if (fail_on && *fail_on == target) {
            throw core::Error(core::ErrorCode::ConversionError,
                              source_path.string() + ": ERROR: 0:3: 'foo' : undeclared identifier");
        }

        ConversionResult result;
        result.source = "// " + backend_target_name(target) + "\n" + content.value_or("");
        result.reflection = (later_reflection && target != GLSL_ES_100) ? *later_reflection : reflection;
        return result;
    }
};

struct CompileCall {
    std::string hlsl;
    std::string entry_point;
    std::string profile;
};

class FakeBytecodeCompiler final : public BytecodeCompiler {
public:
    bool fail = false;
    std::vector<CompileCall> calls;

    std::vector<uint8_t> compile(std::string_view hlsl, std::string_view entry_point,
                                 std::string_view profile) override {
        calls.push_back(CompileCall{std::string(hlsl), std::string(entry_point), std::string(profile)});
        if (fail) {
            throw core::Error(core::ErrorCode::BytecodeCompileError, "error X3000: syntax error");
        }
        return {0x44, 0x58, 0x42, 0x43, static_cast<uint8_t>(hlsl.size() & 0xff)};
    }
};

}  // namespace shadergen::convert::fakes
