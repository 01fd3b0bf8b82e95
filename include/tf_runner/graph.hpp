// tf_runner/graph.hpp
// RAII wrapper for TF_Graph
//
// A Graph is imported from a frozen GraphDef, may be extended with new
// operations (softmax/transpose heads), and is frozen once a Session is
// created from it. Mutation after freeze throws.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/logging.hpp"
#include "tf_runner/scope_guard.hpp"
#include "tf_runner/status.hpp"
#include "tf_runner/tensor.hpp"

namespace tf_runner {

namespace detail {

struct GraphState {
    TF_Graph* graph{nullptr};
    bool frozen{false};

    GraphState() : graph(TF_NewGraph()) {
        if (!graph) {
            throw Error::Execution(TF_INTERNAL, "GraphState", "TF_NewGraph failed");
        }
    }

    ~GraphState() {
        if (graph) {
            TF_DeleteGraph(graph);
        }
    }

    GraphState(const GraphState&) = delete;
    GraphState& operator=(const GraphState&) = delete;
};

struct OutputName {
    std::string op;
    int index{0};
};

/// Split "op_name:index" into its parts. A name without a numeric suffix
/// refers to output 0.
[[nodiscard]] inline OutputName parse_output_name(std::string_view name) {
    auto colon_pos = name.rfind(':');
    if (colon_pos != std::string_view::npos && colon_pos + 1 < name.size()) {
        auto suffix = name.substr(colon_pos + 1);
        const bool all_digits = suffix.size() <= 9 &&
            std::all_of(suffix.begin(), suffix.end(),
                [](unsigned char c) { return std::isdigit(c); });
        if (all_digits) {
            int index = 0;
            for (char c : suffix) {
                index = index * 10 + (c - '0');
            }
            return {std::string(name.substr(0, colon_pos)), index};
        }
    }
    return {std::string(name), 0};
}

} // namespace detail

// ============================================================================
// OperationInfo - Information about an operation (for introspection)
// ============================================================================

struct OperationInfo {
    std::string op_name;
    std::string op_type;
    int num_inputs;
    int num_outputs;
};

// ============================================================================
// OperationBuilder - Fluent wrapper over TF_OperationDescription
// ============================================================================
// Obtained from Graph::NewOperation. Finish() must be called exactly once;
// a builder destroyed unfinished finishes the description (TensorFlow has no
// way to abandon one) and logs a warning.

class OperationBuilder {
public:
    OperationBuilder(std::shared_ptr<detail::GraphState> state,
                     std::string op_type,
                     std::string name)
        : state_(std::move(state))
        , op_type_(std::move(op_type))
        , name_(std::move(name))
    {
        desc_ = TF_NewOperation(state_->graph, op_type_.c_str(), name_.c_str());
        if (!desc_) {
            throw Error::Execution(TF_INTERNAL, "OperationBuilder",
                detail::format("TF_NewOperation failed for type '{}'", op_type_), name_);
        }
    }

    ~OperationBuilder() {
        if (!desc_) return;
        Status st;
        (void)TF_FinishOperation(desc_, st.get());
        logger()->warn("operation '{}' ({}) was never finished; finished on destruction ({})",
            name_, op_type_, st.ok() ? "ok" : st.message());
    }

    OperationBuilder(const OperationBuilder&) = delete;
    OperationBuilder& operator=(const OperationBuilder&) = delete;

    OperationBuilder(OperationBuilder&& other) noexcept
        : state_(std::move(other.state_))
        , desc_(other.desc_)
        , op_type_(std::move(other.op_type_))
        , name_(std::move(other.name_))
    {
        other.desc_ = nullptr;
    }

    OperationBuilder& operator=(OperationBuilder&&) = delete;

    // ─────────────────────────────────────────────────────────────────
    // Inputs and placement
    // ─────────────────────────────────────────────────────────────────

    OperationBuilder& AddInput(TF_Output input) {
        ensure_pending_("AddInput");
        if (!input.oper) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "OperationBuilder::AddInput",
                "null input operation", name_);
        }
        TF_AddInput(desc_, input);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────
    // Attributes
    // ─────────────────────────────────────────────────────────────────

    OperationBuilder& SetAttrType(const char* attr, TF_DataType dtype) {
        ensure_pending_("SetAttrType");
        TF_SetAttrType(desc_, attr, dtype);
        return *this;
    }

    OperationBuilder& SetAttrBool(const char* attr, bool value) {
        ensure_pending_("SetAttrBool");
        TF_SetAttrBool(desc_, attr, value ? 1 : 0);
        return *this;
    }

    /// Shape attribute; dims of -1 are unknown.
    OperationBuilder& SetAttrShape(const char* attr, std::span<const std::int64_t> dims) {
        ensure_pending_("SetAttrShape");
        TF_SetAttrShape(desc_, attr, dims.data(),
            detail::checked_int(dims.size(), "OperationBuilder::SetAttrShape"));
        return *this;
    }

    /// Tensor attribute (TensorFlow copies the value).
    OperationBuilder& SetAttrTensor(const char* attr, TF_Tensor* value) {
        ensure_pending_("SetAttrTensor");
        if (!value) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "OperationBuilder::SetAttrTensor",
                detail::format("null tensor for attr '{}'", attr), name_);
        }
        Status st;
        TF_SetAttrTensor(desc_, attr, value, st.get());
        st.throw_if_error(ErrorKind::Execution, detail::format("TF_SetAttrTensor('{}')", name_));
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────
    // Finish
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] TF_Operation* Finish() {
        ensure_pending_("Finish");
        TF_OperationDescription* desc = desc_;
        desc_ = nullptr;

        Status st;
        TF_Operation* op = TF_FinishOperation(desc, st.get());
        st.throw_if_error(ErrorKind::Execution,
            detail::format("TF_FinishOperation('{}' {})", name_, op_type_));
        if (!op) {
            throw Error::Execution(TF_INTERNAL, "OperationBuilder::Finish",
                "TF_FinishOperation returned null", name_);
        }
        return op;
    }

private:
    std::shared_ptr<detail::GraphState> state_;
    TF_OperationDescription* desc_{nullptr};
    std::string op_type_;
    std::string name_;

    void ensure_pending_(const char* fn) const {
        if (!desc_) {
            throw Error::Execution(TF_FAILED_PRECONDITION,
                detail::format("OperationBuilder::{}", fn),
                "operation already finished or moved-from", name_);
        }
    }
};

// ============================================================================
// Graph - RAII wrapper for TF_Graph
// ============================================================================

class Graph {
public:
    Graph() : state_(std::make_shared<detail::GraphState>()) {}

    ~Graph() = default;

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    Graph(Graph&& other) noexcept
        : state_(std::move(other.state_)) {}

    Graph& operator=(Graph&& other) noexcept {
        if (this != &other) {
            state_ = std::move(other.state_);
        }
        return *this;
    }

    [[nodiscard]] bool valid() const noexcept {
        return state_ && state_->graph != nullptr;
    }

    // ─────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────

    /// Import a serialized GraphDef. Every imported node without an explicit
    /// device is placed on `default_device` (empty = engine default).
    /// Malformed bytes raise ErrorKind::AssetLoad.
    void ImportGraphDef(std::span<const std::uint8_t> graph_def,
                        const std::string& prefix = "",
                        const std::string& default_device = "") {
        ensure_mutable_("ImportGraphDef");
        if (graph_def.empty()) {
            throw Error::AssetLoad("Graph::ImportGraphDef", "GraphDef is empty");
        }

        TF_Buffer* buf = TF_NewBufferFromString(graph_def.data(), graph_def.size());
        if (!buf) {
            throw Error::Execution(TF_INTERNAL, "Graph::ImportGraphDef",
                "TF_NewBufferFromString failed");
        }
        TFRUN_SCOPE_EXIT { TF_DeleteBuffer(buf); };

        TF_ImportGraphDefOptions* opts = TF_NewImportGraphDefOptions();
        if (!opts) {
            throw Error::Execution(TF_INTERNAL, "Graph::ImportGraphDef",
                "TF_NewImportGraphDefOptions failed");
        }
        TFRUN_SCOPE_EXIT { TF_DeleteImportGraphDefOptions(opts); };

        if (!prefix.empty()) {
            TF_ImportGraphDefOptionsSetPrefix(opts, prefix.c_str());
        }
        if (!default_device.empty()) {
            TF_ImportGraphDefOptionsSetDefaultDevice(opts, default_device.c_str());
        }

        Status st;
        TF_GraphImportGraphDef(state_->graph, buf, opts, st.get());
        st.throw_if_error(ErrorKind::AssetLoad, "TF_GraphImportGraphDef");
    }

    /// Start building a new operation. Throws once the graph is frozen.
    [[nodiscard]] OperationBuilder NewOperation(const std::string& op_type,
                                                const std::string& name) {
        ensure_mutable_("NewOperation");
        if (HasOperation(name)) {
            throw Error::Execution(TF_ALREADY_EXISTS, "Graph::NewOperation",
                "an operation with this name already exists", name);
        }
        return OperationBuilder(state_, op_type, name);
    }

    // ─────────────────────────────────────────────────────────────────
    // Operation lookup
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<TF_Operation*> GetOperation(const std::string& name) const {
        ensure_valid_("GetOperation");
        TF_Operation* op = TF_GraphOperationByName(state_->graph, name.c_str());
        return op ? std::optional{op} : std::nullopt;
    }

    [[nodiscard]] TF_Operation* GetOperationOrThrow(const std::string& name) const {
        auto opt = GetOperation(name);
        if (!opt) {
            throw Error::Execution(TF_NOT_FOUND, "Graph::GetOperationOrThrow",
                "operation not found in graph", name);
        }
        return *opt;
    }

    [[nodiscard]] bool HasOperation(const std::string& name) const {
        return GetOperation(name).has_value();
    }

    /// Look up "op" or "op:index"; nullopt if the op or output doesn't exist.
    [[nodiscard]] std::optional<TF_Output> FindOutput(std::string_view name) const {
        const auto parsed = detail::parse_output_name(name);
        auto op = GetOperation(parsed.op);
        if (!op || parsed.index >= TF_OperationNumOutputs(*op)) {
            return std::nullopt;
        }
        return TF_Output{*op, parsed.index};
    }

    // ─────────────────────────────────────────────────────────────────
    // Graph introspection
    // ─────────────────────────────────────────────────────────────────

    /// All operations in graph (insertion) order.
    [[nodiscard]] std::vector<TF_Operation*> GetAllOperations() const {
        ensure_valid_("GetAllOperations");

        std::vector<TF_Operation*> ops;
        std::size_t pos = 0;
        TF_Operation* op;
        while ((op = TF_GraphNextOperation(state_->graph, &pos)) != nullptr) {
            ops.push_back(op);
        }
        return ops;
    }

    [[nodiscard]] std::size_t num_operations() const {
        ensure_valid_("num_operations");

        std::size_t count = 0;
        std::size_t pos = 0;
        while (TF_GraphNextOperation(state_->graph, &pos) != nullptr) {
            ++count;
        }
        return count;
    }

    [[nodiscard]] std::vector<TF_Operation*> GetOperationsByType(std::string_view op_type) const {
        std::vector<TF_Operation*> ops;
        for (TF_Operation* op : GetAllOperations()) {
            if (std::string_view(TF_OperationOpType(op)) == op_type) {
                ops.push_back(op);
            }
        }
        return ops;
    }

    [[nodiscard]] std::vector<OperationInfo> GetPlaceholders() const {
        std::vector<OperationInfo> result;
        for (TF_Operation* op : GetOperationsByType("Placeholder")) {
            result.push_back({
                TF_OperationName(op),
                TF_OperationOpType(op),
                TF_OperationNumInputs(op),
                TF_OperationNumOutputs(op)
            });
        }
        return result;
    }

    /// Number of operations consuming any output of `op`.
    [[nodiscard]] int consumer_count(TF_Operation* op) const noexcept {
        int total = 0;
        const int outputs = TF_OperationNumOutputs(op);
        for (int i = 0; i < outputs; ++i) {
            total += TF_OperationOutputNumConsumers(TF_Output{op, i});
        }
        return total;
    }

    /// Rank of an output as inferred by the graph (-1 if unknown).
    [[nodiscard]] int output_num_dims(TF_Output output) const {
        ensure_valid_("output_num_dims");
        Status st;
        const int ndims = TF_GraphGetTensorNumDims(state_->graph, output, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_GraphGetTensorNumDims");
        return ndims;
    }

    /// Static dims of an output (-1 entries are unknown). Empty if rank unknown.
    [[nodiscard]] std::vector<std::int64_t> output_dims(TF_Output output) const {
        const int ndims = output_num_dims(output);
        if (ndims <= 0) return {};

        std::vector<std::int64_t> dims(static_cast<std::size_t>(ndims));
        Status st;
        TF_GraphGetTensorShape(state_->graph, output, dims.data(), ndims, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_GraphGetTensorShape");
        return dims;
    }

    // ─────────────────────────────────────────────────────────────────
    // Serialization
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::uint8_t> ToGraphDef() const {
        ensure_valid_("ToGraphDef");

        TF_Buffer* buf = TF_NewBuffer();
        if (!buf) {
            throw Error::Execution(TF_INTERNAL, "Graph::ToGraphDef", "TF_NewBuffer failed");
        }
        TFRUN_SCOPE_EXIT { TF_DeleteBuffer(buf); };

        Status st;
        TF_GraphToGraphDef(state_->graph, buf, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_GraphToGraphDef");

        if (buf->length == 0) {
            return {};
        }
        if (!buf->data) {
            throw Error::Execution(TF_INTERNAL, "Graph::ToGraphDef",
                "TF_GraphToGraphDef returned null data");
        }

        const auto* p = static_cast<const std::uint8_t*>(buf->data);
        return std::vector<std::uint8_t>(p, p + buf->length);
    }

    [[nodiscard]] std::string DebugString() const {
        std::string result = detail::format("Graph with {} operations:\n", num_operations());
        for (TF_Operation* op : GetAllOperations()) {
            const char* device = TF_OperationDevice(op);
            result += detail::format("  {} ({}) inputs={} outputs={}{}{}\n",
                TF_OperationName(op), TF_OperationOpType(op),
                TF_OperationNumInputs(op), TF_OperationNumOutputs(op),
                (device && *device) ? " device=" : "",
                device ? device : "");
        }
        return result;
    }

    // ─────────────────────────────────────────────────────────────────
    // Handle access and freeze state
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] TF_Graph* handle() const noexcept {
        return state_ ? state_->graph : nullptr;
    }

    void freeze() noexcept {
        if (state_) state_->frozen = true;
    }

    [[nodiscard]] bool is_frozen() const noexcept {
        return state_ && state_->frozen;
    }

    [[nodiscard]] std::shared_ptr<detail::GraphState> share_state() const noexcept {
        return state_;
    }

private:
    std::shared_ptr<detail::GraphState> state_{};

    void ensure_valid_(const char* fn) const {
        if (!state_ || !state_->graph) {
            throw Error::Execution(TF_FAILED_PRECONDITION,
                detail::format("Graph::{}", fn), "graph is in moved-from state");
        }
    }

    void ensure_mutable_(const char* fn) const {
        ensure_valid_(fn);
        if (state_->frozen) {
            throw Error::Execution(TF_FAILED_PRECONDITION,
                detail::format("Graph::{}", fn),
                "graph is frozen (a session was created from it)");
        }
    }
};

} // namespace tf_runner
