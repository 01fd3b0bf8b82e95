// tf_runner/graph_augmentation.hpp
// Classifier output head: softmax (if missing) and texture transpose
//
// Applied to one declared output of a RuntimeGraph:
//
//   <output> --Softmax--> <softmax_layer> --Transpose--> <softmax_layer>_transpose
//
// The softmax is skipped when the output node already is a Softmax.
// Softmax normalizes the last axis, so a rank 4 ChannelsFirst output
// [N, C, H, W] is first moved to [N, H, W, C] through
// <softmax_layer>/channels_last (perm {0, 2, 3, 1}).
//
// The transpose moves the class axis to texture rows and is only appended
// when requested:
//   rank 2  [N, C]       perm {1, 0}       -> [C, N]
//   rank 4  [N, H, W, C] perm {0, 3, 1, 2} -> [N, C, H, W]
// A rank 4 output that already is class-major (a ChannelsFirst model's own
// Softmax) needs no transpose. Other or unknown ranks skip the transpose
// with a warning.
//
// Idempotent: nodes are detected by name, so applying it again to the same
// graph appends nothing and yields the same output name.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/backend.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/logging.hpp"
#include "tf_runner/ops.hpp"
#include "tf_runner/runtime_graph.hpp"

namespace tf_runner {

inline constexpr const char* kDefaultSoftmaxLayer = "softmaxLayer";

struct AugmentationOptions {
    std::string softmax_layer{kDefaultSoftmaxLayer};
    bool texture_transpose{false};
    std::size_t output_layer_index{0};
    ChannelOrder channel_order{ChannelOrder::ChannelsFirst};
};

struct AugmentationResult {
    std::string output_name;
    bool softmax_added{false};
    bool transpose_added{false};
    std::size_t nodes_added{0};
};

[[nodiscard]] inline std::string transpose_layer_name(std::string_view softmax_layer) {
    return std::string(softmax_layer) + "_transpose";
}

[[nodiscard]] inline std::string channels_last_layer_name(std::string_view softmax_layer) {
    return std::string(softmax_layer) + "/channels_last";
}

namespace detail {

[[nodiscard]] inline std::vector<std::int32_t> texture_permutation(int rank) {
    switch (rank) {
        case 2: return {1, 0};
        case 4: return {0, 3, 1, 2};
        default: return {};
    }
}

[[nodiscard]] inline bool fed_by(TF_Output output, const std::string& producer) {
    if (TF_OperationNumInputs(output.oper) < 1) return false;
    const TF_Output input = TF_OperationInput(TF_Input{output.oper, 0});
    return input.oper && producer == TF_OperationName(input.oper);
}

} // namespace detail

inline AugmentationResult augment_classifier_output(RuntimeGraph& rg,
                                                    const AugmentationOptions& options) {
    if (options.softmax_layer.empty()) {
        throw Error::Configuration(TF_INVALID_ARGUMENT, "augment_classifier_output",
            "softmax layer name is empty");
    }

    Graph& graph = rg.graph();
    const std::size_t index = options.output_layer_index;
    const std::string transpose_name = transpose_layer_name(options.softmax_layer);
    const std::string channels_last_name = channels_last_layer_name(options.softmax_layer);
    const bool channels_first = options.channel_order == ChannelOrder::ChannelsFirst;

    AugmentationResult result;
    const std::size_t before = graph.num_operations();

    // Already fully shaped by an earlier pass.
    if (rg.output(index) == transpose_name) {
        result.output_name = transpose_name;
        return result;
    }

    // ─────────────────────────────────────────────────────────────────
    // Softmax
    // ─────────────────────────────────────────────────────────────────

    TF_Output current = rg.resolve(rg.output(index));
    const std::string_view current_type = TF_OperationOpType(current.oper);

    if (current_type != "Softmax") {
        if (auto existing = graph.FindOutput(options.softmax_layer)) {
            if (std::string_view(TF_OperationOpType(existing->oper)) != "Softmax") {
                throw Error::Configuration(TF_ALREADY_EXISTS, "augment_classifier_output",
                    "softmax layer name is taken by a non-Softmax node", options.softmax_layer);
            }
            current = *existing;
        } else {
            const TF_DataType dtype = TF_OperationOutputType(current);
            TF_Output logits = current;
            if (channels_first && graph.output_num_dims(current) == 4) {
                auto perm = ops::IntVector(graph, channels_last_name + "/perm",
                    std::vector<std::int32_t>{0, 2, 3, 1});
                logits = ops::Transpose(graph, channels_last_name, current, perm, dtype).output();
            }
            current = ops::Softmax(graph, options.softmax_layer, logits, dtype).output();
            result.softmax_added = true;
        }
        rg.redirect_output(index, options.softmax_layer);
    }

    // ─────────────────────────────────────────────────────────────────
    // Texture transpose
    // ─────────────────────────────────────────────────────────────────

    if (options.texture_transpose) {
        if (graph.HasOperation(transpose_name)) {
            rg.redirect_output(index, transpose_name);
        } else {
            const int rank = graph.output_num_dims(current);
            const bool class_major = rank == 4 && channels_first &&
                !detail::fed_by(current, channels_last_name);
            const auto perm = detail::texture_permutation(rank);
            if (class_major) {
                logger()->debug("output '{}' is already class-major; no texture transpose",
                    rg.output(index));
            } else if (perm.empty()) {
                logger()->warn("output '{}' has rank {}; texture transpose skipped",
                    rg.output(index), rank);
            } else {
                auto perm_op = ops::IntVector(graph, transpose_name + "/perm", perm);
                (void)ops::Transpose(graph, transpose_name, current, perm_op,
                    TF_OperationOutputType(current));
                rg.redirect_output(index, transpose_name);
                result.transpose_added = true;
            }
        }
    }

    result.output_name = rg.output(index);
    result.nodes_added = graph.num_operations() - before;
    if (result.nodes_added > 0) {
        logger()->info("augmented output {} -> '{}' (softmax={}, transpose={}, +{} nodes)",
            index, result.output_name, result.softmax_added, result.transpose_added,
            result.nodes_added);
    }
    return result;
}

} // namespace tf_runner
