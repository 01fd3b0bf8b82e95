// tf_runner/image.hpp
// 3-channel float image and its conversion to a model input tensor

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/backend.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/tensor.hpp"

namespace tf_runner {

inline constexpr int kImageChannels = 3;

/// Interleaved RGB pixels in [0, 1], row-major, `width * height * 3` floats.
class Image {
public:
    Image() = default;

    [[nodiscard]] static Image Zeros(int width, int height) {
        return Filled(width, height, 0.0f, 0.0f, 0.0f);
    }

    [[nodiscard]] static Image Filled(int width, int height, float r, float g, float b) {
        Image img(width, height);
        for (std::size_t i = 0; i < img.pixels_.size(); i += static_cast<std::size_t>(kImageChannels)) {
            img.pixels_[i + 0] = r;
            img.pixels_[i + 1] = g;
            img.pixels_[i + 2] = b;
        }
        return img;
    }

    /// 8-bit RGB, scaled by 1/255.
    [[nodiscard]] static Image FromRgb8(int width, int height, std::span<const std::uint8_t> rgb) {
        Image img(width, height);
        require_size_("Image::FromRgb8", img.pixels_.size(), rgb.size());
        for (std::size_t i = 0; i < rgb.size(); ++i) {
            img.pixels_[i] = static_cast<float>(rgb[i]) / 255.0f;
        }
        return img;
    }

    [[nodiscard]] static Image FromFloat(int width, int height, std::vector<float> rgb) {
        Image img(width, height);
        require_size_("Image::FromFloat", img.pixels_.size(), rgb.size());
        img.pixels_ = std::move(rgb);
        return img;
    }

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::span<const float> pixels() const noexcept { return pixels_; }

    [[nodiscard]] float at(int x, int y, int channel) const noexcept {
        return pixels_[index_(x, y, channel)];
    }

private:
    int width_{0};
    int height_{0};
    std::vector<float> pixels_;

    Image(int width, int height) : width_(width), height_(height) {
        if (width <= 0 || height <= 0) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "Image",
                detail::format("invalid image size {}x{}", width, height));
        }
        const std::int64_t dims[] = {height, width, kImageChannels};
        pixels_.resize(detail::checked_product(dims, "Image"));
    }

    [[nodiscard]] std::size_t index_(int x, int y, int channel) const noexcept {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_)
            + static_cast<std::size_t>(x)) * kImageChannels + static_cast<std::size_t>(channel);
    }

    static void require_size_(const char* fn, std::size_t expected, std::size_t actual) {
        if (expected != actual) {
            throw Error::Execution(TF_INVALID_ARGUMENT, fn,
                detail::format("expected {} values, got {}", expected, actual));
        }
    }
};

/// Build a float input tensor: [1, h, w, 3] for ChannelsLast,
/// [1, 3, h, w] for ChannelsFirst.
[[nodiscard]] inline Tensor to_input_tensor(const Image& image, ChannelOrder order) {
    if (image.empty()) {
        throw Error::Execution(TF_INVALID_ARGUMENT, "to_input_tensor", "image is empty");
    }

    const std::int64_t h = image.height();
    const std::int64_t w = image.width();

    if (order == ChannelOrder::ChannelsLast) {
        const std::int64_t dims[] = {1, h, w, kImageChannels};
        return Tensor::FromVector<float>(dims, image.pixels());
    }

    const std::int64_t dims[] = {1, kImageChannels, h, w};
    Tensor t = Tensor::Allocate<float>(dims);
    auto out = t.write<float>();
    const auto plane = static_cast<std::size_t>(h * w);
    const auto src = image.pixels();
    constexpr auto channels = static_cast<std::size_t>(kImageChannels);
    for (std::size_t p = 0; p < plane; ++p) {
        for (std::size_t c = 0; c < channels; ++c) {
            out[c * plane + p] = src[p * channels + c];
        }
    }
    return t;
}

} // namespace tf_runner
