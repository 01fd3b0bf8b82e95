// tf_runner/ops.hpp
// Graph-building op helpers
//
// Used to append output heads (softmax, transpose) to imported graphs and to
// build small models in-process.
//
// Usage:
//   using namespace tf_runner::ops;
//
//   Graph graph;
//   auto x = Placeholder(graph, "x", TF_FLOAT, dims);
//   auto w = Const(graph, "w", Tensor::FromVector<float>({2, 2}, weights));
//   auto y = Softmax(graph, "probs", MatMul(graph, "logits", x, w, TF_FLOAT), TF_FLOAT);

#pragma once

#include "tf_runner/ops/common.hpp"
#include "tf_runner/ops/array.hpp"
#include "tf_runner/ops/math.hpp"
#include "tf_runner/ops/nn.hpp"
