// tf_runner/config.hpp
// Classifier configuration and its JSON form
//
//   {
//     "backend": "auto" | "cpu" | "gpu_compute" | "gpu_pixel_shader",
//     "channels_first": true,
//     "async_readback": true,
//     "output_layer_index": 0,
//     "softmax_layer": "softmaxLayer",
//     "model": "model.pb",
//     "labels": "labels.json"
//   }
//
// Every key is optional. Bad JSON or bad values raise Configuration errors;
// unknown keys are logged and ignored.

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "tf_runner/backend.hpp"
#include "tf_runner/detail/file_io.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/graph_augmentation.hpp"
#include "tf_runner/logging.hpp"

namespace tf_runner {

struct ClassifierConfig {
    BackendSelection selection{};
    bool async_readback{true};
    int output_layer_index{0};
    std::string softmax_layer{kDefaultSoftmaxLayer};
    std::string model_path;
    std::string labels_path;

    [[nodiscard]] static ClassifierConfig FromJson(std::string_view text) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(text.begin(), text.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ClassifierConfig::FromJson",
                detail::format("malformed JSON: {}", e.what()));
        }
        if (!doc.is_object()) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ClassifierConfig::FromJson",
                detail::format("expected a JSON object, got {}", doc.type_name()));
        }

        static constexpr std::array<std::string_view, 7> kKnownKeys = {
            "backend", "channels_first", "async_readback", "output_layer_index",
            "softmax_layer", "model", "labels",
        };
        for (const auto& item : doc.items()) {
            bool known = false;
            for (auto k : kKnownKeys) {
                if (item.key() == k) known = true;
            }
            if (!known) {
                logger()->warn("ignoring unknown config key '{}'", item.key());
            }
        }

        ClassifierConfig cfg;
        if (doc.contains("backend")) {
            cfg.selection.backend = parse_backend(get_<std::string>(doc, "backend"));
        }
        if (doc.contains("channels_first")) {
            cfg.selection.channel_order = get_<bool>(doc, "channels_first")
                ? ChannelOrder::ChannelsFirst : ChannelOrder::ChannelsLast;
        }
        if (doc.contains("async_readback")) {
            cfg.async_readback = get_<bool>(doc, "async_readback");
        }
        if (doc.contains("output_layer_index")) {
            cfg.output_layer_index = get_<int>(doc, "output_layer_index");
            if (cfg.output_layer_index < 0) {
                throw Error::Configuration(TF_INVALID_ARGUMENT, "ClassifierConfig::FromJson",
                    "output_layer_index must be >= 0", {}, cfg.output_layer_index);
            }
        }
        if (doc.contains("softmax_layer")) {
            cfg.softmax_layer = get_<std::string>(doc, "softmax_layer");
            if (cfg.softmax_layer.empty()) {
                throw Error::Configuration(TF_INVALID_ARGUMENT, "ClassifierConfig::FromJson",
                    "softmax_layer must not be empty");
            }
        }
        if (doc.contains("model")) {
            cfg.model_path = get_<std::string>(doc, "model");
        }
        if (doc.contains("labels")) {
            cfg.labels_path = get_<std::string>(doc, "labels");
        }
        return cfg;
    }

    /// Read and parse a config file. An unreadable file is a Configuration error.
    [[nodiscard]] static ClassifierConfig Load(const std::filesystem::path& path) {
        std::string text;
        try {
            text = detail::read_file_text(path, "ClassifierConfig::Load");
        } catch (const Error& e) {
            throw Error::Configuration(TF_NOT_FOUND, "ClassifierConfig::Load",
                std::string(e.message()));
        }
        return FromJson(text);
    }

private:
    template<class T>
    static T get_(const nlohmann::json& doc, const char* key) {
        const auto& value = doc.at(key);
        bool matches = false;
        if constexpr (std::is_same_v<T, bool>) {
            matches = value.is_boolean();
        } else if constexpr (std::is_same_v<T, int>) {
            matches = value.is_number_integer();
        } else {
            matches = value.is_string();
        }
        if (!matches) {
            throw Error::Configuration(TF_INVALID_ARGUMENT, "ClassifierConfig::FromJson",
                detail::format("key '{}' has the wrong type ({})", key, value.type_name()));
        }
        if constexpr (std::is_same_v<T, int>) {
            const bool fits = value.is_number_unsigned()
                ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  value.get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!fits) {
                throw Error::Configuration(TF_OUT_OF_RANGE, "ClassifierConfig::FromJson",
                    detail::format("key '{}' is out of range ({})", key, value.dump()));
            }
        }
        return value.get<T>();
    }
};

} // namespace tf_runner
