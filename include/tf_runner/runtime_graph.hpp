// tf_runner/runtime_graph.hpp
// Mutable in-memory model graph with its declared inputs and outputs
//
// Built from a ModelAsset by importing the GraphDef onto the resolved
// backend's default device. Declared endpoints come from the asset when it
// lists them, otherwise:
//   inputs  - every Placeholder, in graph order
//   outputs - every op (other than Const/Placeholder/NoOp) whose outputs
//             feed nothing, in graph order
// Output heads appended later redirect a declared output to the new node.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/graph.hpp"
#include "tf_runner/model_asset.hpp"

namespace tf_runner {

class RuntimeGraph {
public:
    RuntimeGraph(const RuntimeGraph&) = delete;
    RuntimeGraph& operator=(const RuntimeGraph&) = delete;
    RuntimeGraph(RuntimeGraph&&) noexcept = default;
    RuntimeGraph& operator=(RuntimeGraph&&) noexcept = default;

    /// Import `asset` placing nodes on `device` (empty = engine default).
    /// Malformed assets and undeclarable endpoints raise AssetLoad.
    [[nodiscard]] static RuntimeGraph Import(const ModelAsset& asset,
                                             const std::string& device = "") {
        if (asset.empty()) {
            throw Error::AssetLoad("RuntimeGraph::Import",
                detail::format("model asset '{}' is empty", asset.name()));
        }

        RuntimeGraph rg;
        rg.device_ = device;
        rg.graph_.ImportGraphDef(asset.bytes(), "", device);

        if (!asset.inputs().empty()) {
            for (const auto& name : asset.inputs()) {
                rg.require_endpoint_(name, "declared input");
            }
            rg.inputs_ = asset.inputs();
        } else {
            for (const auto& info : rg.graph_.GetPlaceholders()) {
                rg.inputs_.push_back(info.op_name);
            }
        }

        if (!asset.outputs().empty()) {
            for (const auto& name : asset.outputs()) {
                rg.require_endpoint_(name, "declared output");
            }
            rg.outputs_ = asset.outputs();
        } else {
            rg.outputs_ = rg.infer_outputs_();
        }

        if (rg.inputs_.empty()) {
            throw Error::AssetLoad("RuntimeGraph::Import",
                detail::format("model '{}' has no inputs (no Placeholder ops)", asset.name()));
        }
        if (rg.outputs_.empty()) {
            throw Error::AssetLoad("RuntimeGraph::Import",
                detail::format("model '{}' has no outputs", asset.name()));
        }
        return rg;
    }

    // ─────────────────────────────────────────────────────────────────
    // Graph access
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] Graph& graph() noexcept { return graph_; }
    [[nodiscard]] const Graph& graph() const noexcept { return graph_; }
    [[nodiscard]] const std::string& device() const noexcept { return device_; }
    [[nodiscard]] bool frozen() const noexcept { return graph_.is_frozen(); }

    /// Resolve "op" or "op:index" within this graph.
    [[nodiscard]] TF_Output resolve(std::string_view name) const {
        auto out = graph_.FindOutput(name);
        if (!out) {
            throw Error::Execution(TF_NOT_FOUND, "RuntimeGraph::resolve",
                "no such output in graph", name);
        }
        return *out;
    }

    // ─────────────────────────────────────────────────────────────────
    // Declared endpoints
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<std::string>& inputs() const noexcept { return inputs_; }
    [[nodiscard]] const std::vector<std::string>& outputs() const noexcept { return outputs_; }

    [[nodiscard]] const std::string& output(std::size_t index) const {
        if (index >= outputs_.size()) {
            throw Error::Configuration(TF_OUT_OF_RANGE, "RuntimeGraph::output",
                detail::format("output layer index {} outside [0, {})", index, outputs_.size()),
                {}, static_cast<int>(index));
        }
        return outputs_[index];
    }

    /// Static dims of a declared input (-1 = unknown, empty = unknown rank).
    [[nodiscard]] std::vector<std::int64_t> input_dims(std::size_t index) const {
        if (index >= inputs_.size()) {
            throw Error::IndexOutOfRange("RuntimeGraph::input_dims",
                static_cast<int>(index), inputs_.size());
        }
        return graph_.output_dims(resolve(inputs_[index]));
    }

    /// Point declared output `index` at `name` (an existing node).
    void redirect_output(std::size_t index, const std::string& name) {
        if (frozen()) {
            throw Error::Execution(TF_FAILED_PRECONDITION, "RuntimeGraph::redirect_output",
                "graph is frozen", name);
        }
        (void)output(index);
        (void)resolve(name);
        outputs_[index] = name;
    }

private:
    Graph graph_;
    std::string device_;
    std::vector<std::string> inputs_;
    std::vector<std::string> outputs_;

    RuntimeGraph() = default;

    void require_endpoint_(const std::string& name, const char* what) const {
        if (!graph_.FindOutput(name)) {
            throw Error::AssetLoad("RuntimeGraph::Import",
                detail::format("{} '{}' does not exist in the graph", what, name), name);
        }
    }

    [[nodiscard]] std::vector<std::string> infer_outputs_() const {
        std::vector<std::string> sinks;
        for (TF_Operation* op : graph_.GetAllOperations()) {
            const std::string_view type = TF_OperationOpType(op);
            if (type == "Const" || type == "Placeholder" || type == "NoOp") continue;
            if (TF_OperationNumOutputs(op) == 0) continue;
            if (graph_.consumer_count(op) != 0) continue;
            sinks.emplace_back(TF_OperationName(op));
        }
        return sinks;
    }
};

} // namespace tf_runner
