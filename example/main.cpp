// example/main.cpp
// Command-line image classifier
//
//   tf_runner_classify <model.pb> <labels.json> [config.json]
//
// Loads a frozen GraphDef and its label table, classifies a blank image sized
// to the model input and prints the top scores. With async readback active
// the first classify() returns the previous (zero) scores, so the example
// drains the frame scheduler and reads the delivered scores back from the
// host texture.

#include "tf_runner/core.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

namespace {

constexpr int kDefaultInputSize = 224;
constexpr std::size_t kTopK = 5;

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <model.pb> <labels.json> [config.json]\n";
}

// Spatial size of the model input, or the default where it is not static.
void input_size(const tf_runner::ImageClassifier& classifier, int& width, int& height) {
    width = kDefaultInputSize;
    height = kDefaultInputSize;

    const auto dims = classifier.runner().runtime_graph().input_dims(0);
    if (dims.size() != 4) return;

    const bool channels_first =
        classifier.config().selection.channel_order == tf_runner::ChannelOrder::ChannelsFirst;
    const std::int64_t h = channels_first ? dims[2] : dims[1];
    const std::int64_t w = channels_first ? dims[3] : dims[2];
    if (h > 0) height = static_cast<int>(h);
    if (w > 0) width = static_cast<int>(w);
}

void print_top(const tf_runner::ImageClassifier& classifier, const std::vector<float>& scores) {
    std::vector<std::size_t> order(scores.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    const std::size_t k = std::min(kTopK, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
        [&](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });

    for (std::size_t i = 0; i < k; ++i) {
        const std::size_t idx = order[i];
        std::cout << "  " << classifier.class_name(static_cast<int>(idx))
                  << ": " << scores[idx] << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        tf_runner::ClassifierConfig config;
        if (argc == 4) {
            config = tf_runner::ClassifierConfig::Load(argv[3]);
        }
        config.model_path = argv[1];
        config.labels_path = argv[2];

        const auto caps = tf_runner::PlatformCapabilities::Probe();
        tf_runner::FrameScheduler scheduler;
        auto transport = std::make_shared<tf_runner::DeferredReadbackTransport>(scheduler);

        const auto asset = tf_runner::ModelAsset::Load(config.model_path);
        const auto labels = tf_runner::detail::read_file_text(config.labels_path, "labels");

        tf_runner::ImageClassifier classifier(config, caps, transport);
        if (!classifier.start(asset, labels)) {
            tf_runner::logger()->error("classifier did not start");
            return 1;
        }

        int width = 0;
        int height = 0;
        input_size(classifier, width, height);
        tf_runner::logger()->info("classifying blank {}x{} image", width, height);

        auto scores = classifier.classify(tf_runner::Image::Zeros(width, height));
        if (classifier.async_readback_active()) {
            scheduler.drain();
            if (auto texture = classifier.cpu_texture()) {
                scores = texture->pixels();
            }
        }

        if (scores.empty()) {
            tf_runner::logger()->error("classification produced no scores");
            return 1;
        }

        std::cout << "backend: " << tf_runner::to_string(classifier.runner().backend()) << "\n";
        print_top(classifier, scores);
        classifier.stop();
        return 0;
    } catch (const tf_runner::Error& e) {
        tf_runner::logger()->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        tf_runner::logger()->error("unexpected failure: {}", e.what());
        return 1;
    }
}
