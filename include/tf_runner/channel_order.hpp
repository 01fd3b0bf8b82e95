// tf_runner/channel_order.hpp
// Process-wide channel-order ownership
//
// The compute backend assumes one tensor layout for the whole process. The
// registry hands out leases: any number of runners may share the active
// order, a runner asking for the other order is rejected with a
// Configuration error, and the order is cleared when the last lease drops.

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>

#include "tf_runner/backend.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"

namespace tf_runner {

class ChannelOrderRegistry {
public:
    class Lease {
    public:
        Lease() = default;

        ~Lease() { reset(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept
            : registry_(other.registry_), order_(other.order_) {
            other.registry_ = nullptr;
        }

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                reset();
                registry_ = other.registry_;
                order_ = other.order_;
                other.registry_ = nullptr;
            }
            return *this;
        }

        [[nodiscard]] bool held() const noexcept { return registry_ != nullptr; }
        [[nodiscard]] explicit operator bool() const noexcept { return held(); }
        [[nodiscard]] ChannelOrder order() const noexcept { return order_; }

        void reset() noexcept {
            if (registry_) {
                registry_->release_(order_);
                registry_ = nullptr;
            }
        }

    private:
        friend class ChannelOrderRegistry;

        Lease(ChannelOrderRegistry* registry, ChannelOrder order) noexcept
            : registry_(registry), order_(order) {}

        ChannelOrderRegistry* registry_{nullptr};
        ChannelOrder order_{ChannelOrder::ChannelsFirst};
    };

    ChannelOrderRegistry() = default;

    ChannelOrderRegistry(const ChannelOrderRegistry&) = delete;
    ChannelOrderRegistry& operator=(const ChannelOrderRegistry&) = delete;

    /// The registry shared by every runner in the process.
    [[nodiscard]] static ChannelOrderRegistry& instance() {
        static ChannelOrderRegistry registry;
        return registry;
    }

    [[nodiscard]] Lease acquire(ChannelOrder order) {
        if (!is_valid(order)) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ChannelOrderRegistry::acquire",
                detail::format("channel order value {} is not valid", static_cast<int>(order)));
        }

        std::lock_guard<std::mutex> lock(mu_);
        if (holders_ > 0 && active_ != order) {
            throw Error::Configuration(TF_FAILED_PRECONDITION, "ChannelOrderRegistry::acquire",
                detail::format("channel order {} requested while {} is active for {} runner(s); "
                    "only one channel order may be active per process",
                    to_string(order), to_string(active_), holders_));
        }
        active_ = order;
        ++holders_;
        return Lease(this, order);
    }

    [[nodiscard]] std::optional<ChannelOrder> active() const {
        std::lock_guard<std::mutex> lock(mu_);
        if (holders_ == 0) return std::nullopt;
        return active_;
    }

    [[nodiscard]] std::size_t holders() const {
        std::lock_guard<std::mutex> lock(mu_);
        return holders_;
    }

private:
    mutable std::mutex mu_;
    ChannelOrder active_{ChannelOrder::ChannelsFirst};
    std::size_t holders_{0};

    void release_(ChannelOrder order) noexcept {
        std::lock_guard<std::mutex> lock(mu_);
        if (holders_ > 0 && active_ == order) {
            --holders_;
        }
    }
};

/// Reject a 4-D image input whose statically known channel axis contradicts
/// `order`. Unknown (-1) dims and non-4-D inputs are accepted.
inline void validate_input_layout(
    std::span<const std::int64_t> dims,
    ChannelOrder order,
    std::string_view input_name)
{
    if (dims.size() != 4) return;

    const std::size_t channel_axis = (order == ChannelOrder::ChannelsFirst) ? 1 : 3;
    const std::size_t other_axis = (order == ChannelOrder::ChannelsFirst) ? 3 : 1;

    const std::int64_t channels = dims[channel_axis];
    if (channels < 0 || channels == 3) return;

    if (dims[other_axis] == 3) {
        throw Error::Configuration(TF_INVALID_ARGUMENT, "validate_input_layout",
            detail::format("input shape [{}, {}, {}, {}] is laid out as {} but {} was requested",
                dims[0], dims[1], dims[2], dims[3],
                to_string(order == ChannelOrder::ChannelsFirst
                    ? ChannelOrder::ChannelsLast : ChannelOrder::ChannelsFirst),
                to_string(order)),
            input_name);
    }
}

} // namespace tf_runner
