// tf_runner/backend.hpp
// Backend selection, platform capabilities and deterministic resolution
//
// Auto resolves once, at prepare time:
//   GpuCompute (if supported) -> GpuPixelShader (if supported) -> Cpu
// An explicit GPU request the platform cannot honor degrades to Cpu with a
// warning. The resolved backend becomes the default device of the imported
// graph; sessions allow soft placement so unsupported ops still run.

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/graph.hpp"
#include "tf_runner/logging.hpp"
#include "tf_runner/session.hpp"

namespace tf_runner {

enum class Backend {
    Auto,
    Cpu,
    GpuCompute,
    GpuPixelShader,
};

enum class ChannelOrder {
    ChannelsFirst,  // NCHW
    ChannelsLast,   // NHWC
};

struct BackendSelection {
    Backend backend{Backend::Auto};
    ChannelOrder channel_order{ChannelOrder::ChannelsFirst};
};

[[nodiscard]] constexpr const char* to_string(Backend backend) noexcept {
    switch (backend) {
        case Backend::Auto:           return "Auto";
        case Backend::Cpu:            return "Cpu";
        case Backend::GpuCompute:     return "GpuCompute";
        case Backend::GpuPixelShader: return "GpuPixelShader";
    }
    return "Invalid";
}

[[nodiscard]] constexpr const char* to_string(ChannelOrder order) noexcept {
    switch (order) {
        case ChannelOrder::ChannelsFirst: return "ChannelsFirst";
        case ChannelOrder::ChannelsLast:  return "ChannelsLast";
    }
    return "Invalid";
}

[[nodiscard]] constexpr bool is_valid(Backend backend) noexcept {
    switch (backend) {
        case Backend::Auto:
        case Backend::Cpu:
        case Backend::GpuCompute:
        case Backend::GpuPixelShader:
            return true;
    }
    return false;
}

[[nodiscard]] constexpr bool is_valid(ChannelOrder order) noexcept {
    return order == ChannelOrder::ChannelsFirst || order == ChannelOrder::ChannelsLast;
}

/// Parse "auto", "cpu", "gpu_compute" or "gpu_pixel_shader" (case-insensitive).
[[nodiscard]] inline Backend parse_backend(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto")             return Backend::Auto;
    if (lower == "cpu")              return Backend::Cpu;
    if (lower == "gpu_compute")      return Backend::GpuCompute;
    if (lower == "gpu_pixel_shader") return Backend::GpuPixelShader;

    throw Error::Configuration(TF_INVALID_ARGUMENT, "parse_backend",
        detail::format("unknown backend '{}' (expected auto, cpu, gpu_compute or gpu_pixel_shader)",
            text));
}

/// Default device for graph placement. Auto has no device.
[[nodiscard]] inline std::string device_for(Backend backend) {
    switch (backend) {
        case Backend::Cpu:
            return "/device:CPU:0";
        case Backend::GpuCompute:
        case Backend::GpuPixelShader:
            return "/device:GPU:0";
        case Backend::Auto:
            break;
    }
    throw Error::Configuration(TF_INVALID_ARGUMENT, "device_for",
        detail::format("backend {} has no device; resolve it first", to_string(backend)));
}

// ============================================================================
// PlatformCapabilities
// ============================================================================

struct PlatformCapabilities {
    bool gpu_compute{false};
    bool gpu_pixel_shader{false};
    bool async_readback{false};

    [[nodiscard]] static PlatformCapabilities CpuOnly() noexcept { return {}; }

    /// Ask TensorFlow which devices exist. TensorFlow has no pixel-shader
    /// path, so gpu_pixel_shader is always false.
    [[nodiscard]] static PlatformCapabilities Probe() {
        Graph graph;
        Session session(graph);
        const bool gpu = session.HasGPU();

        PlatformCapabilities caps;
        caps.gpu_compute = gpu;
        caps.async_readback = gpu;
        logger()->info("platform probe: gpu_compute={} async_readback={}",
            caps.gpu_compute, caps.async_readback);
        return caps;
    }

    [[nodiscard]] bool supports(Backend backend) const noexcept {
        switch (backend) {
            case Backend::Cpu:            return true;
            case Backend::GpuCompute:     return gpu_compute;
            case Backend::GpuPixelShader: return gpu_pixel_shader;
            case Backend::Auto:           return true;
        }
        return false;
    }
};

/// Resolve a requested backend to a concrete one the platform supports.
[[nodiscard]] inline Backend resolve_backend(Backend requested, const PlatformCapabilities& caps) {
    if (!is_valid(requested)) {
        throw Error::Configuration(TF_INVALID_ARGUMENT, "resolve_backend",
            detail::format("backend value {} is not a known backend",
                static_cast<int>(requested)));
    }

    if (requested == Backend::Auto) {
        if (caps.gpu_compute) return Backend::GpuCompute;
        if (caps.gpu_pixel_shader) return Backend::GpuPixelShader;
        return Backend::Cpu;
    }

    if (!caps.supports(requested)) {
        logger()->warn("backend {} is not supported on this platform; falling back to Cpu",
            to_string(requested));
        return Backend::Cpu;
    }
    return requested;
}

} // namespace tf_runner
