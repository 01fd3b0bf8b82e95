// tf_runner/ops/array.hpp
// Array operation helpers: constants, placeholders, reshaping

#pragma once

#include "tf_runner/ops/common.hpp"

namespace tf_runner {
namespace ops {

/// Constant tensor (TensorFlow copies the value into the graph)
[[nodiscard]] inline OpResult Const(
    Graph& graph,
    std::string_view name,
    const Tensor& value) {
    return OpResult(
        graph.NewOperation("Const", std::string(name))
        .SetAttrTensor("value", value.handle())
        .SetAttrType("dtype", value.dtype())
        .Finish());
}

/// 1-D int32 constant, used for shapes, axes and permutations
[[nodiscard]] inline OpResult IntVector(
    Graph& graph,
    std::string_view name,
    const std::vector<std::int32_t>& values) {
    auto t = Tensor::FromVector<std::int32_t>(
        {static_cast<std::int64_t>(values.size())}, values);
    return Const(graph, name, t);
}

/// Placeholder for feeding data; -1 dims are unknown. Empty shape leaves
/// the rank unconstrained.
[[nodiscard]] inline OpResult Placeholder(
    Graph& graph,
    std::string_view name,
    TF_DataType dtype,
    std::span<const std::int64_t> shape = {}) {
    auto builder = graph.NewOperation("Placeholder", std::string(name));
    builder.SetAttrType("dtype", dtype);
    if (!shape.empty()) {
        builder.SetAttrShape("shape", shape);
    }
    return OpResult(builder.Finish());
}

[[nodiscard]] inline OpResult Identity(
    Graph& graph,
    std::string_view name,
    TF_Output input,
    TF_DataType T) {
    return OpResult(
        graph.NewOperation("Identity", std::string(name))
        .AddInput(input)
        .SetAttrType("T", T)
        .Finish());
}

[[nodiscard]] inline OpResult Reshape(
    Graph& graph,
    std::string_view name,
    TF_Output tensor,
    TF_Output shape,
    TF_DataType T) {
    return OpResult(
        graph.NewOperation("Reshape", std::string(name))
        .AddInput(tensor)
        .AddInput(shape)
        .SetAttrType("T", T)
        .SetAttrType("Tshape", TF_OperationOutputType(shape))
        .Finish());
}

/// Permute dimensions; `perm` must be an int32 or int64 vector
[[nodiscard]] inline OpResult Transpose(
    Graph& graph,
    std::string_view name,
    TF_Output x,
    TF_Output perm,
    TF_DataType T) {
    return OpResult(
        graph.NewOperation("Transpose", std::string(name))
        .AddInput(x)
        .AddInput(perm)
        .SetAttrType("T", T)
        .SetAttrType("Tperm", TF_OperationOutputType(perm))
        .Finish());
}

} // namespace ops
} // namespace tf_runner
