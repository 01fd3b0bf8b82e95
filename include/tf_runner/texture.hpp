// tf_runner/texture.hpp
// Single-channel float textures used by the output readback path
//
// RenderTexture is the device-side target the shaped output is copied into;
// Texture2D is the host-side copy whose raw bytes are overwritten when a
// readback completes. Both are `width x height` floats, row-major.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/tensor.hpp"

namespace tf_runner {

class FloatTexture {
public:
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::size_t texel_count() const noexcept { return texels_.size(); }
    [[nodiscard]] std::size_t byte_size() const noexcept { return texels_.size() * sizeof(float); }

    [[nodiscard]] std::span<const float> texels() const noexcept { return texels_; }

    /// Copy of the texels (caller-owned).
    [[nodiscard]] std::vector<float> pixels() const { return texels_; }

    [[nodiscard]] std::span<const std::uint8_t> raw_bytes() const noexcept {
        const void* data = texels_.data();
        return {static_cast<const std::uint8_t*>(data), byte_size()};
    }

protected:
    FloatTexture(int width, int height, const char* what) : width_(width), height_(height) {
        if (width < 0 || height < 0) {
            throw Error::Execution(TF_INVALID_ARGUMENT, what,
                detail::format("invalid texture size {}x{}", width, height));
        }
        texels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), 0.0f);
    }

    ~FloatTexture() = default;
    FloatTexture(const FloatTexture&) = default;
    FloatTexture& operator=(const FloatTexture&) = default;
    FloatTexture(FloatTexture&&) noexcept = default;
    FloatTexture& operator=(FloatTexture&&) noexcept = default;

    std::vector<float> texels_;

private:
    int width_;
    int height_;
};

// ============================================================================
// RenderTexture - device-side readback source
// ============================================================================

class RenderTexture : public FloatTexture {
public:
    RenderTexture() : RenderTexture(0, 0) {}
    RenderTexture(int width, int height) : FloatTexture(width, height, "RenderTexture") {}

    /// Copy a float tensor with exactly texel_count() elements.
    void copy_from(const Tensor& tensor) {
        auto data = tensor.read<float>();
        if (data.size() != texel_count()) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "RenderTexture::copy_from",
                detail::format("tensor has {} elements, texture holds {}",
                    data.size(), texel_count()));
        }
        std::copy(data.begin(), data.end(), texels_.begin());
    }
};

// ============================================================================
// Texture2D - host-side readback destination
// ============================================================================

class Texture2D : public FloatTexture {
public:
    Texture2D(int width, int height) : FloatTexture(width, height, "Texture2D") {}

    /// Overwrite the backing store. `bytes` must be exactly byte_size().
    void load_raw_data(std::span<const std::uint8_t> bytes) {
        if (bytes.size() != byte_size()) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "Texture2D::load_raw_data",
                detail::format("got {} bytes, texture holds {}", bytes.size(), byte_size()));
        }
        if (!bytes.empty()) {
            std::memcpy(texels_.data(), bytes.data(), bytes.size());
        }
        ++generation_;
    }

    /// Number of completed loads.
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

private:
    std::uint64_t generation_{0};
};

} // namespace tf_runner
