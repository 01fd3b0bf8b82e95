// tf_runner/ops/nn.hpp
// Neural-network activation helpers

#pragma once

#include "tf_runner/ops/common.hpp"

namespace tf_runner {
namespace ops {

/// Softmax over the last axis
[[nodiscard]] inline OpResult Softmax(
    Graph& graph,
    std::string_view name,
    TF_Output logits,
    TF_DataType T) {
    return OpResult(
        graph.NewOperation("Softmax", std::string(name))
        .AddInput(logits)
        .SetAttrType("T", T)
        .Finish());
}

} // namespace ops
} // namespace tf_runner
