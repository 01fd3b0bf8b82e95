// tf_runner/model_asset.hpp
// Immutable serialized model (frozen GraphDef) plus declared endpoints
//
// Copies share one byte buffer. Declared inputs/outputs are optional; when
// absent they are inferred from the imported graph (see runtime_graph.hpp).
// Names are "op" or "op:index".

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "tf_runner/detail/file_io.hpp"
#include "tf_runner/error.hpp"

namespace tf_runner {

class ModelAsset {
public:
    ModelAsset() = default;

    [[nodiscard]] static ModelAsset FromBytes(
        std::vector<std::uint8_t> graph_def,
        std::vector<std::string> inputs = {},
        std::vector<std::string> outputs = {},
        std::string name = "model")
    {
        ModelAsset asset;
        asset.bytes_ = std::make_shared<const std::vector<std::uint8_t>>(std::move(graph_def));
        asset.inputs_ = std::move(inputs);
        asset.outputs_ = std::move(outputs);
        asset.name_ = std::move(name);
        return asset;
    }

    /// Read a frozen GraphDef (.pb). Unreadable or empty files raise AssetLoad.
    [[nodiscard]] static ModelAsset Load(
        const std::filesystem::path& path,
        std::vector<std::string> inputs = {},
        std::vector<std::string> outputs = {})
    {
        auto bytes = detail::read_file_bytes(path, "ModelAsset::Load");
        if (bytes.empty()) {
            throw Error::AssetLoad("ModelAsset::Load",
                detail::format("'{}' is empty", path.string()));
        }
        return FromBytes(std::move(bytes), std::move(inputs), std::move(outputs),
            path.filename().string());
    }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept {
        if (!bytes_) return {};
        return {bytes_->data(), bytes_->size()};
    }

    [[nodiscard]] bool empty() const noexcept { return !bytes_ || bytes_->empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return bytes_ ? bytes_->size() : 0; }

    [[nodiscard]] const std::vector<std::string>& inputs() const noexcept { return inputs_; }
    [[nodiscard]] const std::vector<std::string>& outputs() const noexcept { return outputs_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::shared_ptr<const std::vector<std::uint8_t>> bytes_{};
    std::vector<std::string> inputs_;
    std::vector<std::string> outputs_;
    std::string name_;
};

} // namespace tf_runner
