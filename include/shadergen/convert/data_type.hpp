// ShaderGen Conversion Pipeline
// data_type.hpp - Reflection type tokens to backend data types

#pragma once

#include <shadergen/backend/shader_sources.hpp>

#include <string_view>

namespace shadergen::convert {

struct DataTypeInfo {
    backend::DataType type = backend::DataType::Float;
    int components = 0;

    bool operator==(const DataTypeInfo&) const = default;
};

// Maps "float", "float2".."float4", "int", "int2".."int4".
// Throws Error(UnsupportedType) for anything else.
[[nodiscard]] DataTypeInfo parse_data_type(std::string_view token);

}  // namespace shadergen::convert
