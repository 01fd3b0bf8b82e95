// tf_runner/image_classifier.hpp
// Multi-class image classifier on top of ModelRunner
//
// start() wires the runner hooks (backend validation, output head
// augmentation), loads labels and sets up readback textures. classify()
// executes one image and returns classCount scores in label order through
// one of two paths:
//
//   download_sync()          copy the output to the caller now
//   request_async_readback() copy the output to a RenderTexture, ask the
//                            transport for a host copy, and return what the
//                            host texture held BEFORE this request
//
// The async path is one cycle stale by construction: its return value is
// whatever the most recently delivered completion wrote. It is only active
// when the config asks for it, the transport and platform support async
// readback, and the resolved backend is GpuCompute; otherwise
// request_async_readback() behaves exactly like download_sync().
//
// Error policy: asset problems at start() are logged and start() returns
// false; configuration errors propagate; engine failures while classifying
// are logged and yield an empty result; usage errors propagate.

#pragma once

#include <cstddef>
#include <cstdint>
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
#include "tf_runner/config.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/graph_augmentation.hpp"
#include "tf_runner/image.hpp"
#include "tf_runner/labels.hpp"
#include "tf_runner/logging.hpp"
#include "tf_runner/model_asset.hpp"
#include "tf_runner/model_runner.hpp"
#include "tf_runner/readback.hpp"
#include "tf_runner/texture.hpp"

namespace tf_runner {

class ImageClassifier {
public:
    explicit ImageClassifier(ClassifierConfig config,
                             PlatformCapabilities caps = PlatformCapabilities::CpuOnly(),
                             std::shared_ptr<ReadbackTransport> transport = nullptr,
                             ChannelOrderRegistry& registry = ChannelOrderRegistry::instance())
        : config_(std::move(config))
        , caps_(caps)
        , transport_(std::move(transport))
        , runner_(caps_, make_hooks_(), registry)
    {}

    ~ImageClassifier() { stop(); }

    ImageClassifier(const ImageClassifier&) = delete;
    ImageClassifier& operator=(const ImageClassifier&) = delete;
    ImageClassifier(ImageClassifier&&) = delete;
    ImageClassifier& operator=(ImageClassifier&&) = delete;

    // ─────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────

    /// Configure, prepare and initialize the runner, then load labels and
    /// create readback textures. Returns false (degraded, not ready) when the
    /// model asset cannot be loaded. A missing or malformed label payload
    /// only leaves the label table empty.
    bool start(const ModelAsset& asset, std::optional<std::string_view> labels_json) {
        if (config_.output_layer_index < 0) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ImageClassifier::start",
                "output layer index must be >= 0", {}, config_.output_layer_index);
        }

        try {
            runner_.configure(asset, config_.selection);
            runner_.start();
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::AssetLoad) throw;
            logger()->error("classifier could not load model '{}': {}", asset.name(), e.what());
            (void)runner_.release();
            return false;
        }

        (void)labels_.load(labels_json);
        if (labels_.empty()) {
            logger()->warn("label table is empty; classification results will be empty");
        }

        const int classes = static_cast<int>(labels_.size());
        if (async_active_) {
            render_texture_ = RenderTexture(1, classes);
            cpu_texture_ = std::make_shared<Texture2D>(1, classes);
        }

        logger()->info("classifier started: {} classes, output '{}', async readback {}; {}",
            classes, output_name_, async_active_ ? "on" : "off", runner_.summary());
        return true;
    }

    /// Release the engine. Pending readback completions are dropped.
    void stop() noexcept {
        (void)runner_.release();
        cpu_texture_.reset();
    }

    [[nodiscard]] bool ready() const noexcept { return runner_.ready(); }

    // ─────────────────────────────────────────────────────────────────
    // Classification
    // ─────────────────────────────────────────────────────────────────

    /// Execute one image and return class scores (see header for paths).
    [[nodiscard]] std::vector<float> classify(const Image& image) {
        require_ready_("classify");
        Tensor input = to_input_tensor(image, config_.selection.channel_order);

        try {
            runner_.execute(input);
        } catch (const Error& e) {
            if (e.source() != ErrorSource::TensorFlow) throw;
            logger()->error("inference failed: {}", e.what());
            return {};
        }
        return async_active_ ? request_async_readback() : download_sync();
    }

    /// Copy the current cycle's scores to the caller. Returns an empty
    /// vector (logged) if the output size does not match the label count.
    [[nodiscard]] std::vector<float> download_sync() const {
        require_ready_("download_sync");
        OutputTensor out = runner_.peek_output(output_name_);
        if (!matches_class_count_(out)) {
            return {};
        }
        return out.download();
    }

    /// Start an async readback of the current cycle and return the previous
    /// host-side contents. Falls back to download_sync() when the async
    /// path is inactive.
    [[nodiscard]] std::vector<float> request_async_readback() {
        require_ready_("request_async_readback");
        if (!async_active_) {
            logger()->debug("async readback inactive; using synchronous download");
            return download_sync();
        }

        {
            OutputTensor out = runner_.peek_output(output_name_);
            if (!matches_class_count_(out)) {
                return {};
            }
            render_texture_.copy_from(out.tensor());
        }

        std::weak_ptr<Texture2D> target = cpu_texture_;
        transport_->request(render_texture_, cpu_texture_->byte_size(),
            [target](const ReadbackResult& result) { apply_readback_(target, result); });

        return cpu_texture_->pixels();
    }

    // ─────────────────────────────────────────────────────────────────
    // Labels and introspection
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& class_name(int index) const {
        return labels_.class_name(index);
    }

    [[nodiscard]] std::size_t class_count() const noexcept { return labels_.size(); }
    [[nodiscard]] const LabelTable& labels() const noexcept { return labels_; }
    [[nodiscard]] bool async_readback_active() const noexcept { return async_active_; }
    [[nodiscard]] const std::string& output_name() const noexcept { return output_name_; }
    [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ModelRunner& runner() const noexcept { return runner_; }

    /// Host-side readback texture (null unless the async path is active).
    [[nodiscard]] std::shared_ptr<const Texture2D> cpu_texture() const noexcept {
        return cpu_texture_;
    }

private:
    ClassifierConfig config_;
    PlatformCapabilities caps_;
    std::shared_ptr<ReadbackTransport> transport_;

    LabelTable labels_;
    bool async_active_{false};
    std::string output_name_;
    RenderTexture render_texture_;
    std::shared_ptr<Texture2D> cpu_texture_;

    ModelRunner runner_;

    RunnerHooks make_hooks_() {
        RunnerHooks hooks;
        hooks.backend_validation = [this](Backend resolved, const PlatformCapabilities& caps) {
            async_active_ = decide_async_(resolved, caps);
            return resolved;
        };
        hooks.graph_augmentation = [this](RuntimeGraph& graph) {
            AugmentationOptions options;
            options.softmax_layer = config_.softmax_layer;
            options.texture_transpose = async_active_;
            options.output_layer_index = static_cast<std::size_t>(config_.output_layer_index);
            options.channel_order = config_.selection.channel_order;
            output_name_ = augment_classifier_output(graph, options).output_name;
        };
        return hooks;
    }

    bool decide_async_(Backend resolved, const PlatformCapabilities& caps) const {
        if (!config_.async_readback) return false;

        if (!transport_ || !transport_->supported() || !caps.async_readback) {
            logger()->warn("async readback is not supported on this platform; "
                "using synchronous download");
            return false;
        }
        if (resolved != Backend::GpuCompute) {
            logger()->warn("async readback requires the GpuCompute backend (resolved {}); "
                "using synchronous download", to_string(resolved));
            return false;
        }
        return true;
    }

    bool matches_class_count_(const OutputTensor& out) const {
        const std::size_t elements = out.num_elements();
        if (elements != labels_.size()) {
            logger()->error("output '{}' has {} elements but {} class labels are loaded",
                out.name(), elements, labels_.size());
            return false;
        }
        return true;
    }

    void require_ready_(const char* fn) const {
        if (!runner_.ready()) {
            throw Error::Execution(TF_FAILED_PRECONDITION,
                detail::format("ImageClassifier::{}", fn),
                detail::format("classifier is not ready (runner state {})",
                    to_string(runner_.state())));
        }
    }

    static void apply_readback_(const std::weak_ptr<Texture2D>& target,
                                const ReadbackResult& result) {
        auto texture = target.lock();
        if (!texture) {
            logger()->debug("readback completed after the classifier stopped; dropped");
            return;
        }

        switch (result.status) {
            case ReadbackStatus::Ok:
                if (result.data.size() != texture->byte_size()) {
                    logger()->warn("readback size mismatch: got {} bytes, texture holds {}; "
                        "update skipped", result.data.size(), texture->byte_size());
                    return;
                }
                texture->load_raw_data(result.data);
                return;
            case ReadbackStatus::SizeMismatch:
                logger()->warn("readback size mismatch ({}); update skipped, previous "
                    "scores retained", result.message);
                return;
            case ReadbackStatus::TransferError:
                logger()->error("GPU readback error: {}; previous scores retained",
                    result.message);
                return;
        }
    }
};

} // namespace tf_runner
