// tf_runner/model_runner.hpp
// Owns one model's engine lifetime: asset -> graph -> session -> execute
//
// State machine (strictly forward, Released is terminal):
//
//   Unconfigured -> Configured -> GraphPrepared -> ExecutionReady -> Released
//
// - configure()             asset + backend selection, validated by trial import
// - prepare()               resolve backend, take channel-order lease, import,
//                           validate layout, run the augmentation hook
// - initialize_execution()  create the Session (freezes the graph) exactly once
// - execute()               run one cycle; outputs live until the next cycle
// - release()               destroy the Session once; later calls are no-ops
//
// Derived behaviour is injected through RunnerHooks rather than subclassing.
// A runner is single-threaded and not reentrant.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/backend.hpp"
#include "tf_runner/channel_order.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/logging.hpp"
#include "tf_runner/model_asset.hpp"
#include "tf_runner/runtime_graph.hpp"
#include "tf_runner/scope_guard.hpp"
#include "tf_runner/session.hpp"
#include "tf_runner/tensor.hpp"

namespace tf_runner {

enum class RunnerState {
    Unconfigured,
    Configured,
    GraphPrepared,
    ExecutionReady,
    Released,
};

[[nodiscard]] constexpr const char* to_string(RunnerState state) noexcept {
    switch (state) {
        case RunnerState::Unconfigured:   return "Unconfigured";
        case RunnerState::Configured:     return "Configured";
        case RunnerState::GraphPrepared:  return "GraphPrepared";
        case RunnerState::ExecutionReady: return "ExecutionReady";
        case RunnerState::Released:       return "Released";
    }
    return "Unknown";
}

/// Extension points invoked by prepare(), in this order:
///   backend_validation(resolved, caps) -> backend actually used
///   graph_augmentation(graph)          -> may append nodes / redirect outputs
struct RunnerHooks {
    std::function<Backend(Backend, const PlatformCapabilities&)> backend_validation;
    std::function<void(RuntimeGraph&)> graph_augmentation;
};

namespace detail {

/// Outputs of the latest execute cycle, shared with OutputTensor handles.
struct CycleState {
    std::uint64_t id{0};
    bool released{false};
    std::vector<std::string> names;
    std::vector<Tensor> outputs;
};

} // namespace detail

// ============================================================================
// OutputTensor - Scoped handle over one output of the current cycle
// ============================================================================
// Valid only until the runner starts another cycle or is released. Every
// accessor re-checks validity, so a handle held too long fails loudly
// instead of reading a recycled buffer.

class OutputTensor {
public:
    OutputTensor(const OutputTensor&) = delete;
    OutputTensor& operator=(const OutputTensor&) = delete;

    OutputTensor(OutputTensor&& other) noexcept
        : cycle_(std::move(other.cycle_)), id_(other.id_), index_(other.index_) {}

    OutputTensor& operator=(OutputTensor&& other) noexcept {
        if (this != &other) {
            cycle_ = std::move(other.cycle_);
            id_ = other.id_;
            index_ = other.index_;
        }
        return *this;
    }

    ~OutputTensor() = default;

    [[nodiscard]] bool valid() const noexcept {
        return cycle_ && !cycle_->released && cycle_->id == id_ && index_ < cycle_->outputs.size();
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

    [[nodiscard]] const std::string& name() const {
        checked_("name");
        return cycle_->names[index_];
    }
    [[nodiscard]] std::uint64_t cycle() const noexcept { return id_; }

    [[nodiscard]] const Tensor& tensor() const {
        checked_("tensor");
        return cycle_->outputs[index_];
    }

    [[nodiscard]] const std::vector<std::int64_t>& shape() const { return tensor().shape(); }
    [[nodiscard]] std::size_t num_elements() const { return tensor().num_elements(); }

    /// Copy the scores out; the result does not alias engine memory.
    [[nodiscard]] std::vector<float> download() const {
        return tensor().ToVector<float>();
    }

    /// Drop the handle early. Further access throws.
    void release() noexcept { cycle_.reset(); }

private:
    friend class ModelRunner;

    OutputTensor(std::shared_ptr<detail::CycleState> cycle, std::size_t index)
        : cycle_(std::move(cycle)), id_(cycle_->id), index_(index) {}

    std::shared_ptr<detail::CycleState> cycle_;
    std::uint64_t id_{0};
    std::size_t index_{0};

    void checked_(const char* fn) const {
        if (!valid()) {
            throw Error::Execution(TF_FAILED_PRECONDITION,
                detail::format("OutputTensor::{}", fn),
                "output handle outlived its execute cycle (or the runner was released)");
        }
    }
};

// ============================================================================
// ModelRunner
// ============================================================================

class ModelRunner {
public:
    explicit ModelRunner(PlatformCapabilities caps = PlatformCapabilities::CpuOnly(),
                         RunnerHooks hooks = {},
                         ChannelOrderRegistry& registry = ChannelOrderRegistry::instance())
        : caps_(caps)
        , hooks_(std::move(hooks))
        , registry_(&registry)
        , cycle_(std::make_shared<detail::CycleState>())
    {
        // release() only logs through an already registered logger.
        (void)logger();
    }

    ~ModelRunner() { (void)release(); }

    ModelRunner(const ModelRunner&) = delete;
    ModelRunner& operator=(const ModelRunner&) = delete;
    ModelRunner(ModelRunner&&) = delete;
    ModelRunner& operator=(ModelRunner&&) = delete;

    // ─────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────

    /// Record the asset and backend selection. The asset is trial-imported
    /// so malformed graphs fail here (AssetLoad); an invalid selection is a
    /// Configuration error. Nothing is executed.
    void configure(ModelAsset asset, BackendSelection selection) {
        require_state_("configure", {RunnerState::Unconfigured, RunnerState::Configured});

        if (!is_valid(selection.backend)) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ModelRunner::configure",
                detail::format("backend value {} is not a known backend",
                    static_cast<int>(selection.backend)));
        }
        if (!is_valid(selection.channel_order)) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ModelRunner::configure",
                detail::format("channel order value {} is not valid",
                    static_cast<int>(selection.channel_order)));
        }

        (void)RuntimeGraph::Import(asset);

        asset_ = std::move(asset);
        selection_ = selection;
        state_ = RunnerState::Configured;
        logger()->info("configured model '{}' ({} bytes) backend={} channel_order={}",
            asset_.name(), asset_.size(), to_string(selection_.backend),
            to_string(selection_.channel_order));
    }

    /// Build the runtime graph. Safe to repeat before initialize_execution():
    /// validation and the augmentation hook run again on the same graph.
    void prepare() {
        require_state_("prepare", {RunnerState::Configured, RunnerState::GraphPrepared});

        Backend resolved = resolve_backend(selection_.backend, caps_);
        if (hooks_.backend_validation) {
            resolved = hooks_.backend_validation(resolved, caps_);
            if (resolved == Backend::Auto || !is_valid(resolved) || !caps_.supports(resolved)) {
                throw Error::Configuration(TF_INVALID_ARGUMENT, "ModelRunner::prepare",
                    detail::format("backend validation produced unusable backend {}",
                        to_string(resolved)));
            }
        }
        if (graph_ && resolved != backend_) {
            throw Error::Configuration(TF_FAILED_PRECONDITION, "ModelRunner::prepare",
                detail::format("backend changed from {} to {} between prepare calls; "
                    "release and configure a new runner instead",
                    to_string(backend_), to_string(resolved)));
        }

        const bool first = !graph_.has_value();
        TFRUN_SCOPE_FAIL {
            if (first) {
                graph_.reset();
                lease_.reset();
            }
        };

        if (!lease_) {
            lease_ = registry_->acquire(selection_.channel_order);
        }
        if (first) {
            graph_.emplace(RuntimeGraph::Import(asset_, device_for(resolved)));
        }
        backend_ = resolved;

        for (std::size_t i = 0; i < graph_->inputs().size(); ++i) {
            validate_input_layout(graph_->input_dims(i), selection_.channel_order,
                graph_->inputs()[i]);
        }

        if (hooks_.graph_augmentation) {
            hooks_.graph_augmentation(*graph_);
        }

        state_ = RunnerState::GraphPrepared;
        logger()->info("prepared graph: {} ops, backend={} device={}",
            graph_->graph().num_operations(), to_string(backend_), graph_->device());
    }

    /// Create the execution handle. Exactly once per runner.
    void initialize_execution() {
        require_state_("initialize_execution", {RunnerState::GraphPrepared});

        SessionOptions opts;
        opts.AllowSoftPlacement();
        Session session(graph_->graph(), opts);

        std::vector<TF_Output> feeds;
        for (const auto& name : graph_->inputs()) {
            feeds.push_back(session.resolve(name));
        }
        std::vector<TF_Output> fetches;
        for (const auto& name : graph_->outputs()) {
            fetches.push_back(session.resolve(name));
        }

        session_.emplace(std::move(session));
        feed_ops_ = std::move(feeds);
        fetch_ops_ = std::move(fetches);
        cycle_->names = graph_->outputs();
        state_ = RunnerState::ExecutionReady;
        logger()->info("execution ready: {}", summary());
    }

    /// prepare() followed by initialize_execution().
    void start() {
        prepare();
        initialize_execution();
    }

    /// Destroy the execution handle and drop the channel-order lease.
    /// Returns true if a handle was destroyed; repeated calls are no-ops.
    bool release() noexcept {
        if (state_ == RunnerState::Released) return false;

        bool destroyed = false;
        if (session_) {
            destroyed = session_->Close();
            session_.reset();
        }
        cycle_->released = true;
        cycle_->outputs.clear();
        feed_ops_.clear();
        fetch_ops_.clear();
        graph_.reset();
        lease_.reset();
        state_ = RunnerState::Released;

        if (destroyed) {
            if (auto log = existing_logger()) {
                log->info("released execution handle");
            }
        }
        return destroyed;
    }

    // ─────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────

    /// Run one cycle with the single declared input.
    void execute(const Tensor& input) {
        require_state_("execute", {RunnerState::ExecutionReady});
        if (feed_ops_.size() != 1) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "ModelRunner::execute",
                detail::format("model declares {} inputs; use the named-input overload",
                    feed_ops_.size()));
        }
        std::vector<Feed> feeds;
        feeds.emplace_back(feed_ops_[0], input);
        run_(feeds);
    }

    /// Run one cycle feeding every declared input by name.
    void execute(const std::map<std::string, Tensor>& inputs) {
        require_state_("execute", {RunnerState::ExecutionReady});
        if (inputs.size() != feed_ops_.size()) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "ModelRunner::execute",
                detail::format("got {} inputs, model declares {}", inputs.size(), feed_ops_.size()));
        }

        std::vector<Feed> feeds;
        feeds.reserve(inputs.size());
        const auto& names = graph_->inputs();
        for (std::size_t i = 0; i < names.size(); ++i) {
            auto it = inputs.find(names[i]);
            if (it == inputs.end()) {
                throw Error::Execution(TF_INVALID_ARGUMENT, "ModelRunner::execute",
                    "missing input", names[i]);
            }
            feeds.emplace_back(feed_ops_[i], it->second);
        }
        run_(feeds);
    }

    /// Scoped access to a declared output of the current cycle.
    [[nodiscard]] OutputTensor peek_output(std::string_view name) const {
        require_cycle_("peek_output");
        for (std::size_t i = 0; i < cycle_->names.size(); ++i) {
            if (cycle_->names[i] == name) {
                return OutputTensor(cycle_, i);
            }
        }
        throw Error::Execution(TF_NOT_FOUND, "ModelRunner::peek_output",
            "not a declared output", name);
    }

    [[nodiscard]] OutputTensor peek_output(std::size_t index) const {
        require_cycle_("peek_output");
        if (index >= cycle_->outputs.size()) {
            throw Error::IndexOutOfRange("ModelRunner::peek_output",
                static_cast<int>(index), cycle_->outputs.size());
        }
        return OutputTensor(cycle_, index);
    }

    // ─────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] RunnerState state() const noexcept { return state_; }
    [[nodiscard]] bool ready() const noexcept { return state_ == RunnerState::ExecutionReady; }
    [[nodiscard]] Backend backend() const noexcept { return backend_; }
    [[nodiscard]] const BackendSelection& selection() const noexcept { return selection_; }
    [[nodiscard]] const PlatformCapabilities& capabilities() const noexcept { return caps_; }
    [[nodiscard]] std::uint64_t cycles() const noexcept { return cycle_->id; }

    [[nodiscard]] const RuntimeGraph& runtime_graph() const {
        if (!graph_) {
            throw Error::Execution(TF_FAILED_PRECONDITION, "ModelRunner::runtime_graph",
                detail::format("no graph in state {}", to_string(state_)));
        }
        return *graph_;
    }

    [[nodiscard]] const std::vector<std::string>& input_names() const {
        return runtime_graph().inputs();
    }

    [[nodiscard]] const std::vector<std::string>& output_names() const {
        return runtime_graph().outputs();
    }

    /// Human-readable description of the engine, for diagnostics.
    [[nodiscard]] std::string summary() const {
        std::string result = detail::format("ModelRunner[{}] model='{}' backend={} channel_order={}",
            to_string(state_), asset_.name(), to_string(backend_),
            to_string(selection_.channel_order));
        if (graph_) {
            result += detail::format(" device={} inputs=[{}] outputs=[{}]",
                graph_->device(), join_(graph_->inputs()), join_(graph_->outputs()));
        }
        return result;
    }

private:
    PlatformCapabilities caps_;
    RunnerHooks hooks_;
    ChannelOrderRegistry* registry_;

    RunnerState state_{RunnerState::Unconfigured};
    ModelAsset asset_;
    BackendSelection selection_{};
    Backend backend_{Backend::Auto};

    ChannelOrderRegistry::Lease lease_;
    std::optional<RuntimeGraph> graph_;
    std::optional<Session> session_;
    std::vector<TF_Output> feed_ops_;
    std::vector<TF_Output> fetch_ops_;
    std::shared_ptr<detail::CycleState> cycle_;

    void run_(const std::vector<Feed>& feeds) {
        // A new cycle invalidates every handle from the previous one, even if
        // this run fails.
        ++cycle_->id;
        cycle_->outputs.clear();

        std::vector<Fetch> fetches(fetch_ops_.begin(), fetch_ops_.end());
        cycle_->outputs = session_->Run(feeds, fetches);
    }

    void require_state_(const char* fn, std::initializer_list<RunnerState> allowed) const {
        for (RunnerState s : allowed) {
            if (state_ == s) return;
        }
        throw Error::Execution(TF_FAILED_PRECONDITION,
            detail::format("ModelRunner::{}", fn),
            detail::format("not allowed in state {}", to_string(state_)));
    }

    void require_cycle_(const char* fn) const {
        require_state_(fn, {RunnerState::ExecutionReady});
        if (cycle_->outputs.empty()) {
            throw Error::Execution(TF_FAILED_PRECONDITION,
                detail::format("ModelRunner::{}", fn),
                "no completed execute cycle");
        }
    }

    static std::string join_(const std::vector<std::string>& names) {
        std::string out;
        for (const auto& n : names) {
            if (!out.empty()) out += ", ";
            out += n;
        }
        return out;
    }
};

} // namespace tf_runner
