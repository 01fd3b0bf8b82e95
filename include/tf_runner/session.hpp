// tf_runner/session.hpp
// RAII wrapper for TF_Session
//
// - Creating a Session freezes its Graph
// - Run() frees partially produced outputs on failure
// - A session is not reentrant: callers serialize Run() per instance

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <source_location>
#include <stdexcept>
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
#include "tf_runner/scope_guard.hpp"
#include "tf_runner/status.hpp"
#include "tf_runner/tensor.hpp"

namespace tf_runner {
namespace detail {

/// Call TF_SessionRun and throw on error, releasing any outputs TensorFlow
/// allocated before failing. Also rejects null fetch results.
inline void session_run_checked(
    TF_Session* session,
    const TF_Output* input_ops,
    TF_Tensor* const* input_vals,
    int num_inputs,
    const TF_Output* output_ops,
    TF_Tensor** output_vals,
    int num_outputs,
    std::string_view context,
    std::source_location loc)
{
    auto free_outputs = [&]() noexcept {
        for (int i = 0; i < num_outputs; ++i) {
            if (output_vals[i]) {
                TF_DeleteTensor(output_vals[i]);
                output_vals[i] = nullptr;
            }
        }
    };

    Status st;
    TF_SessionRun(
        session,
        nullptr,
        input_ops, input_vals, num_inputs,
        output_ops, output_vals, num_outputs,
        nullptr, 0,
        nullptr,
        st.get());

    if (!st.ok()) {
        free_outputs();
        st.throw_if_error(ErrorKind::Execution, context, loc);
    }

    for (int i = 0; i < num_outputs; ++i) {
        if (output_vals[i] != nullptr) continue;

        free_outputs();
        const TF_Output out = output_ops[i];
        const char* op_name = out.oper ? TF_OperationName(out.oper) : "";
        throw Error::Execution(TF_INTERNAL, context, "fetch returned null tensor",
            op_name ? op_name : "", out.index, loc);
    }
}

/// Serialized ConfigProto { allow_soft_placement: true } (field 7, varint).
inline constexpr std::uint8_t kSoftPlacementConfig[] = {0x38, 0x01};

} // namespace detail

// ============================================================================
// SessionOptions - RAII wrapper for TF_SessionOptions
// ============================================================================

class SessionOptions {
public:
    SessionOptions() : opts_(TF_NewSessionOptions()) {
        if (!opts_) {
            throw Error::Execution(TF_INTERNAL, "SessionOptions", "TF_NewSessionOptions failed");
        }
    }

    ~SessionOptions() { if (opts_) TF_DeleteSessionOptions(opts_); }

    SessionOptions(const SessionOptions&) = delete;
    SessionOptions& operator=(const SessionOptions&) = delete;

    SessionOptions(SessionOptions&& other) noexcept : opts_(other.opts_) {
        other.opts_ = nullptr;
    }

    SessionOptions& operator=(SessionOptions&& other) noexcept {
        if (this != &other) {
            if (opts_) TF_DeleteSessionOptions(opts_);
            opts_ = other.opts_;
            other.opts_ = nullptr;
        }
        return *this;
    }

    /// Set a serialized ConfigProto.
    SessionOptions& SetConfig(const void* proto, std::size_t len) {
        Status st;
        TF_SetConfig(opts_, proto, len, st.get());
        st.throw_if_error(ErrorKind::Configuration, "TF_SetConfig");
        return *this;
    }

    /// Let ops without a kernel on the requested device run elsewhere, so a
    /// GPU default device degrades to CPU per-op instead of failing.
    SessionOptions& AllowSoftPlacement() {
        return SetConfig(detail::kSoftPlacementConfig, sizeof(detail::kSoftPlacementConfig));
    }

    [[nodiscard]] TF_SessionOptions* handle() const noexcept { return opts_; }

private:
    TF_SessionOptions* opts_;
};

// ============================================================================
// Feed/Fetch - Handle-based run arguments
// ============================================================================

/// Input feed for Session::Run. Holds a keepalive on the tensor.
struct Feed {
    TF_Output output;
    TF_Tensor* tensor{nullptr};
    std::shared_ptr<const void> keepalive{};

    Feed(TF_Output out, const Tensor& t)
        : output(out), tensor(t.handle()), keepalive(t.keepalive()) {}

    Feed(TF_Operation* op, const Tensor& t)
        : Feed(TF_Output{op, 0}, t) {}
};

struct Fetch {
    TF_Output output;

    Fetch(TF_Output out) : output(out) {}
    Fetch(TF_Operation* op, int idx = 0) : output{op, idx} {}
};

// ============================================================================
// Device - Information about a compute device
// ============================================================================

struct Device {
    std::string name;
    std::string type;
    std::int64_t memory_bytes{0};

    [[nodiscard]] bool is_gpu() const noexcept { return type == "GPU"; }
    [[nodiscard]] bool is_cpu() const noexcept { return type == "CPU"; }
};

// ============================================================================
// DeviceList - RAII wrapper for TF_DeviceList
// ============================================================================

class DeviceList {
public:
    DeviceList() = default;
    explicit DeviceList(TF_DeviceList* list) : list_(list) {}

    ~DeviceList() { if (list_) TF_DeleteDeviceList(list_); }

    DeviceList(const DeviceList&) = delete;
    DeviceList& operator=(const DeviceList&) = delete;

    DeviceList(DeviceList&& other) noexcept : list_(other.list_) { other.list_ = nullptr; }

    DeviceList& operator=(DeviceList&& other) noexcept {
        if (this != &other) {
            if (list_) TF_DeleteDeviceList(list_);
            list_ = other.list_;
            other.list_ = nullptr;
        }
        return *this;
    }

    [[nodiscard]] int count() const noexcept { return list_ ? TF_DeviceListCount(list_) : 0; }

    [[nodiscard]] Device at(int index) const {
        if (!list_ || index < 0 || index >= count()) {
            throw Error::IndexOutOfRange("DeviceList::at", index,
                static_cast<std::size_t>(count()));
        }

        Device dev;
        Status st;

        const char* name = TF_DeviceListName(list_, index, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_DeviceListName");
        dev.name = name ? name : "";

        const char* type = TF_DeviceListType(list_, index, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_DeviceListType");
        dev.type = type ? type : "";

        dev.memory_bytes = TF_DeviceListMemoryBytes(list_, index, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_DeviceListMemoryBytes");

        return dev;
    }

    [[nodiscard]] std::vector<Device> all() const {
        std::vector<Device> devices;
        const int n = count();
        devices.reserve(static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) {
            devices.push_back(at(i));
        }
        return devices;
    }

private:
    TF_DeviceList* list_{nullptr};
};

// ============================================================================
// Session - RAII wrapper for TF_Session
// ============================================================================

class Session {
public:
    explicit Session(Graph& graph, const SessionOptions& opts = SessionOptions())
        : graph_state_(graph.share_state())
    {
        if (!graph_state_ || !graph_state_->graph) {
            throw Error::Execution(TF_FAILED_PRECONDITION, "Session",
                "cannot create session from moved-from graph");
        }

        Status st;
        session_ = TF_NewSession(graph_state_->graph, opts.handle(), st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_NewSession");

        graph_state_->frozen = true;
    }

    ~Session() noexcept { Cleanup(); }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Session(Session&& other) noexcept
        : session_(other.session_)
        , graph_state_(std::move(other.graph_state_))
    {
        other.session_ = nullptr;
    }

    Session& operator=(Session&& other) noexcept {
        if (this != &other) {
            Cleanup();
            session_ = other.session_;
            graph_state_ = std::move(other.graph_state_);
            other.session_ = nullptr;
        }
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────
    // Resolve - Convert name to TF_Output (call once, cache the result)
    // ─────────────────────────────────────────────────────────────────

    /// Resolve "op_name" or "op_name:index" to a TF_Output.
    [[nodiscard]] TF_Output resolve(
        std::string_view name,
        std::source_location loc = std::source_location::current()) const
    {
        if (!graph_state_ || !graph_state_->graph) {
            throw Error::Execution(TF_FAILED_PRECONDITION, "Session::resolve",
                "session has no graph", name, -1, loc);
        }

        const auto parsed = detail::parse_output_name(name);
        const std::string& op_name = parsed.op;
        const int index = parsed.index;

        TF_Operation* op = TF_GraphOperationByName(graph_state_->graph, op_name.c_str());
        if (!op) {
            throw Error::Execution(TF_NOT_FOUND, "Session::resolve",
                "operation not found in graph", op_name, index, loc);
        }

        const int num_outputs = TF_OperationNumOutputs(op);
        if (index >= num_outputs) {
            throw Error::Execution(TF_OUT_OF_RANGE, "Session::resolve",
                detail::format("output index {} out of range (operation has {} outputs)",
                    index, num_outputs),
                op_name, index, loc);
        }

        return TF_Output{op, index};
    }

    // ─────────────────────────────────────────────────────────────────
    // Run - Execute the graph
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<Tensor> Run(
        std::span<const Feed> feeds,
        std::span<const Fetch> fetches,
        std::source_location loc = std::source_location::current()) const
    {
        if (!session_) {
            throw Error::Execution(TF_FAILED_PRECONDITION, "Session::Run",
                "session is closed", {}, -1, loc);
        }

        std::vector<TF_Output> input_ops;
        std::vector<TF_Tensor*> input_vals;
        std::vector<TF_Output> output_ops;
        input_ops.reserve(feeds.size());
        input_vals.reserve(feeds.size());
        output_ops.reserve(fetches.size());

        for (const auto& f : feeds) {
            if (!f.tensor) {
                const char* op_name = f.output.oper ? TF_OperationName(f.output.oper) : "";
                throw Error::Execution(TF_INVALID_ARGUMENT, "Session::Run",
                    "feed tensor is null", op_name ? op_name : "", f.output.index, loc);
            }
            input_ops.push_back(f.output);
            input_vals.push_back(f.tensor);
        }
        for (const auto& f : fetches) {
            output_ops.push_back(f.output);
        }

        std::vector<TF_Tensor*> output_vals(fetches.size(), nullptr);

        detail::session_run_checked(
            session_,
            input_ops.data(),
            input_vals.data(),
            detail::checked_int(feeds.size(), "Session::Run feeds"),
            output_ops.data(),
            output_vals.data(),
            detail::checked_int(fetches.size(), "Session::Run fetches"),
            "Session::Run",
            loc);

        // Take ownership immediately for exception safety
        std::vector<detail::RawTensorPtr> owned;
        owned.reserve(output_vals.size());
        for (auto* t : output_vals) {
            owned.emplace_back(t);
        }

        std::vector<Tensor> results;
        results.reserve(owned.size());
        for (auto& p : owned) {
            results.push_back(Tensor::FromRaw(p.release()));
        }
        return results;
    }

    [[nodiscard]] std::vector<Tensor> Run(
        const std::vector<Feed>& feeds,
        const std::vector<Fetch>& fetches,
        std::source_location loc = std::source_location::current()) const
    {
        return Run(std::span<const Feed>(feeds), std::span<const Fetch>(fetches), loc);
    }

    // ─────────────────────────────────────────────────────────────────
    // Device enumeration
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] DeviceList ListDevices() const {
        if (!session_) {
            throw Error::Execution(TF_FAILED_PRECONDITION, "Session::ListDevices",
                "session is closed");
        }

        Status st;
        TF_DeviceList* list = TF_SessionListDevices(session_, st.get());
        st.throw_if_error(ErrorKind::Execution, "TF_SessionListDevices");

        return DeviceList(list);
    }

    [[nodiscard]] bool HasGPU() const {
        auto devices = ListDevices();
        for (int i = 0; i < devices.count(); ++i) {
            if (devices.at(i).is_gpu()) return true;
        }
        return false;
    }

    // ─────────────────────────────────────────────────────────────────
    // Handle access and teardown
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] TF_Session* handle() const noexcept { return session_; }
    [[nodiscard]] bool valid() const noexcept { return session_ != nullptr; }

    /// Close and delete the session. Returns false if already closed.
    bool Close() noexcept {
        const bool had_session = session_ != nullptr;
        Cleanup();
        return had_session;
    }

private:
    TF_Session* session_{nullptr};
    std::shared_ptr<detail::GraphState> graph_state_{};

    void Cleanup() noexcept {
        if (!session_) return;

        TF_Status* st = TF_NewStatus();
        if (st) {
            TFRUN_SCOPE_EXIT { TF_DeleteStatus(st); };
            TF_CloseSession(session_, st);
            TF_DeleteSession(session_, st);
        }

        session_ = nullptr;
        graph_state_.reset();
    }
};

} // namespace tf_runner
