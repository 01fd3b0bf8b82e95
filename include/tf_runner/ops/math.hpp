// tf_runner/ops/math.hpp
// Arithmetic, matrix and reduction helpers

#pragma once

#include "tf_runner/ops/common.hpp"

namespace tf_runner {
namespace ops {

/// Returns x + y element-wise (with broadcasting)
[[nodiscard]] inline OpResult Add(
    Graph& graph,
    std::string_view name,
    TF_Output x,
    TF_Output y,
    TF_DataType T) {
    return OpResult(
        graph.NewOperation("AddV2", std::string(name))
        .AddInput(x)
        .AddInput(y)
        .SetAttrType("T", T)
        .Finish());
}

/// Matrix product a * b
[[nodiscard]] inline OpResult MatMul(
    Graph& graph,
    std::string_view name,
    TF_Output a,
    TF_Output b,
    TF_DataType T,
    bool transpose_a = false,
    bool transpose_b = false) {
    return OpResult(
        graph.NewOperation("MatMul", std::string(name))
        .AddInput(a)
        .AddInput(b)
        .SetAttrType("T", T)
        .SetAttrBool("transpose_a", transpose_a)
        .SetAttrBool("transpose_b", transpose_b)
        .Finish());
}

/// Mean along `axis` (int32 or int64 vector)
[[nodiscard]] inline OpResult Mean(
    Graph& graph,
    std::string_view name,
    TF_Output input,
    TF_Output axis,
    TF_DataType T,
    bool keep_dims = false) {
    return OpResult(
        graph.NewOperation("Mean", std::string(name))
        .AddInput(input)
        .AddInput(axis)
        .SetAttrType("T", T)
        .SetAttrType("Tidx", TF_OperationOutputType(axis))
        .SetAttrBool("keep_dims", keep_dims)
        .Finish());
}

} // namespace ops
} // namespace tf_runner
