// tf_runner/detail/file_io.hpp
// Whole-file reads for model, label and config assets

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"

namespace tf_runner {
namespace detail {

/// Read a file into memory. Missing or unreadable files raise AssetLoad.
[[nodiscard]] inline std::vector<std::uint8_t> read_file_bytes(
    const std::filesystem::path& path,
    std::string_view context)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error::AssetLoad(context,
            detail::format("cannot open '{}'", path.string()));
    }

    std::vector<std::uint8_t> bytes(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw Error::AssetLoad(context,
            detail::format("read error on '{}'", path.string()));
    }
    return bytes;
}

[[nodiscard]] inline std::string read_file_text(
    const std::filesystem::path& path,
    std::string_view context)
{
    auto bytes = read_file_bytes(path, context);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace detail
} // namespace tf_runner
