// tf_runner/frame_scheduler.hpp
// Single-threaded frame-tick scheduler for deferred completions
//
// Callbacks posted for frame N run when tick() advances the frame counter to
// N, in posting order. Callbacks posted while a tick is running land on a
// later tick. Nothing runs outside tick().

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "tf_runner/logging.hpp"

namespace tf_runner {

class FrameScheduler {
public:
    using Task = std::function<void()>;

    FrameScheduler() = default;

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    /// Run on the next tick.
    void post(Task task) { post_after(1, std::move(task)); }

    /// Run after `frames` ticks (0 is treated as 1).
    void post_after(std::uint64_t frames, Task task) {
        if (!task) return;
        pending_.push_back({frame_ + std::max<std::uint64_t>(frames, 1), next_seq_++, std::move(task)});
    }

    /// Advance one frame and run everything due. Returns the number run.
    /// A callback that throws is logged and does not stop the others.
    std::size_t tick() {
        ++frame_;

        std::vector<Entry> due;
        auto split = std::stable_partition(pending_.begin(), pending_.end(),
            [this](const Entry& e) { return e.due_frame > frame_; });
        due.assign(std::make_move_iterator(split), std::make_move_iterator(pending_.end()));
        pending_.erase(split, pending_.end());

        std::sort(due.begin(), due.end(),
            [](const Entry& a, const Entry& b) { return a.seq < b.seq; });

        for (auto& entry : due) {
            try {
                entry.task();
            } catch (const std::exception& e) {
                logger()->error("frame {} callback failed: {}", frame_, e.what());
            }
        }
        return due.size();
    }

    /// Tick until nothing is pending or `max_frames` ticks have run.
    std::size_t drain(std::uint64_t max_frames = 1000) {
        std::size_t total = 0;
        for (std::uint64_t i = 0; i < max_frames && !pending_.empty(); ++i) {
            total += tick();
        }
        return total;
    }

    [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] std::uint64_t frame() const noexcept { return frame_; }

private:
    struct Entry {
        std::uint64_t due_frame;
        std::uint64_t seq;
        Task task;
    };

    std::uint64_t frame_{0};
    std::uint64_t next_seq_{0};
    std::vector<Entry> pending_;
};

} // namespace tf_runner
