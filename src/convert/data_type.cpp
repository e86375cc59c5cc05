// ShaderGen Conversion Pipeline
// data_type.cpp - Reflection type mapping

#include <shadergen/convert/data_type.hpp>
#include <shadergen/core/error.hpp>

#include <spdlog/fmt/fmt.h>

namespace shadergen::convert {

DataTypeInfo parse_data_type(std::string_view token) {
    using backend::DataType;

    if (token == "float")
        return {DataType::Float, 1};
    if (token == "float2")
        return {DataType::Float, 2};
    if (token == "float3")
        return {DataType::Float, 3};
    if (token == "float4")
        return {DataType::Float, 4};
    if (token == "int")
        return {DataType::Int, 1};
    if (token == "int2")
        return {DataType::Int, 2};
    if (token == "int3")
        return {DataType::Int, 3};
    if (token == "int4")
        return {DataType::Int, 4};

    throw core::Error(core::ErrorCode::UnsupportedType, fmt::format("unsupported input data type: {}", token));
}

}  // namespace shadergen::convert
