// tf_runner/readback.hpp
// Asynchronous device-to-host texture readback
//
// A transport copies a RenderTexture to host memory and reports the outcome
// later through a callback. The transport, not the caller, classifies the
// outcome:
//   Ok             data holds the transferred bytes
//   TransferError  the transfer failed; message says why
//   SizeMismatch   bytes arrived but not the expected amount (recoverable)
//
// There is no cancellation. When several requests are in flight their
// completions apply in delivery order, so the last one delivered wins.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/frame_scheduler.hpp"
#include "tf_runner/texture.hpp"

namespace tf_runner {

enum class ReadbackStatus {
    Ok,
    TransferError,
    SizeMismatch,
};

[[nodiscard]] constexpr const char* to_string(ReadbackStatus status) noexcept {
    switch (status) {
        case ReadbackStatus::Ok:            return "Ok";
        case ReadbackStatus::TransferError: return "TransferError";
        case ReadbackStatus::SizeMismatch:  return "SizeMismatch";
    }
    return "Unknown";
}

struct ReadbackResult {
    ReadbackStatus status{ReadbackStatus::Ok};
    std::vector<std::uint8_t> data;
    std::size_t expected_bytes{0};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == ReadbackStatus::Ok; }
};

using ReadbackCallback = std::function<void(const ReadbackResult&)>;

class ReadbackTransport {
public:
    virtual ~ReadbackTransport() = default;

    /// Whether this platform can read textures back asynchronously.
    [[nodiscard]] virtual bool supported() const noexcept = 0;

    /// Start copying `source`; `callback` runs exactly once, later.
    virtual void request(const RenderTexture& source,
                         std::size_t expected_bytes,
                         ReadbackCallback callback) = 0;
};

// ============================================================================
// DeferredReadbackTransport - completes on a FrameScheduler tick
// ============================================================================
// Snapshots the source when the request is made, then delivers the snapshot
// `latency_frames` ticks later.

class DeferredReadbackTransport : public ReadbackTransport {
public:
    explicit DeferredReadbackTransport(FrameScheduler& scheduler, std::uint64_t latency_frames = 1)
        : scheduler_(&scheduler), latency_frames_(latency_frames) {}

    [[nodiscard]] bool supported() const noexcept override { return true; }

    void request(const RenderTexture& source,
                 std::size_t expected_bytes,
                 ReadbackCallback callback) override {
        if (!callback) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "DeferredReadbackTransport::request",
                "callback is empty");
        }

        auto bytes = source.raw_bytes();
        std::vector<std::uint8_t> snapshot(bytes.begin(), bytes.end());
        ++*in_flight_;

        scheduler_->post_after(latency_frames_,
            [in_flight = in_flight_, snapshot = std::move(snapshot), expected_bytes,
             cb = std::move(callback)]() mutable {
                --*in_flight;
                ReadbackResult result;
                result.expected_bytes = expected_bytes;
                if (snapshot.size() != expected_bytes) {
                    result.status = ReadbackStatus::SizeMismatch;
                    result.message = detail::format("transferred {} bytes, expected {}",
                        snapshot.size(), expected_bytes);
                }
                result.data = std::move(snapshot);
                cb(result);
            });
    }

    [[nodiscard]] std::size_t in_flight() const noexcept { return *in_flight_; }

private:
    FrameScheduler* scheduler_;
    std::uint64_t latency_frames_;
    std::shared_ptr<std::size_t> in_flight_ = std::make_shared<std::size_t>(0);
};

} // namespace tf_runner
