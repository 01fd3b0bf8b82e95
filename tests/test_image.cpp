// tests/test_image.cpp
// Tests for tf_runner::Image, input tensor conversion and float textures
//
// Framework: doctest
//
// These tests cover:
// - Image factories and validation
// - to_input_tensor for both channel orders
// - RenderTexture::copy_from and Texture2D::load_raw_data

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tf_runner/image.hpp"
#include "tf_runner/texture.hpp"

#include <cstdint>
#include <cstring>
#include <vector>

using namespace tf_runner;

// ============================================================================
// Image
// ============================================================================

TEST_CASE("Image::Zeros") {
    auto img = Image::Zeros(4, 2);
    CHECK(img.width() == 4);
    CHECK(img.height() == 2);
    CHECK(img.pixels().size() == 4 * 2 * 3);
    for (float v : img.pixels()) {
        CHECK(v == 0.0f);
    }
}

TEST_CASE("Image::Filled and at()") {
    auto img = Image::Filled(2, 2, 0.25f, 0.5f, 0.75f);
    CHECK(img.at(1, 1, 0) == 0.25f);
    CHECK(img.at(1, 1, 1) == 0.5f);
    CHECK(img.at(0, 1, 2) == 0.75f);
}

TEST_CASE("Image::FromRgb8 scales to [0, 1]") {
    const std::vector<std::uint8_t> rgb{0, 255, 51};
    auto img = Image::FromRgb8(1, 1, rgb);
    CHECK(img.at(0, 0, 0) == 0.0f);
    CHECK(img.at(0, 0, 1) == 1.0f);
    CHECK(img.at(0, 0, 2) == doctest::Approx(0.2f));
}

TEST_CASE("Image - invalid sizes") {
    CHECK_THROWS_AS((void)Image::Zeros(0, 10), Error);
    CHECK_THROWS_AS((void)Image::Zeros(10, -1), Error);

    const std::vector<std::uint8_t> short_rgb{1, 2};
    CHECK_THROWS_AS((void)Image::FromRgb8(1, 1, short_rgb), Error);
    CHECK_THROWS_AS((void)Image::FromFloat(2, 1, std::vector<float>(5)), Error);
}

TEST_CASE("Image - default is empty") {
    Image img;
    CHECK(img.empty());
    CHECK_THROWS_AS((void)to_input_tensor(img, ChannelOrder::ChannelsLast), Error);
}

// ============================================================================
// to_input_tensor
// ============================================================================

TEST_CASE("to_input_tensor - ChannelsLast keeps interleaved layout") {
    // 2x1 image: pixel0 = (1,2,3), pixel1 = (4,5,6)
    auto img = Image::FromFloat(2, 1, {1, 2, 3, 4, 5, 6});
    auto t = to_input_tensor(img, ChannelOrder::ChannelsLast);

    CHECK(t.shape() == std::vector<std::int64_t>{1, 1, 2, 3});
    CHECK(t.ToVector<float>() == std::vector<float>{1, 2, 3, 4, 5, 6});
}

TEST_CASE("to_input_tensor - ChannelsFirst splits planes") {
    auto img = Image::FromFloat(2, 1, {1, 2, 3, 4, 5, 6});
    auto t = to_input_tensor(img, ChannelOrder::ChannelsFirst);

    CHECK(t.shape() == std::vector<std::int64_t>{1, 3, 1, 2});
    CHECK(t.ToVector<float>() == std::vector<float>{1, 4, 2, 5, 3, 6});
}

// ============================================================================
// Textures
// ============================================================================

TEST_CASE("RenderTexture - copy_from") {
    RenderTexture rt(1, 4);
    CHECK(rt.texel_count() == 4);
    CHECK(rt.byte_size() == 4 * sizeof(float));

    rt.copy_from(Tensor::FromVector<float>({4, 1}, {0.1f, 0.2f, 0.3f, 0.4f}));
    CHECK(rt.pixels() == std::vector<float>{0.1f, 0.2f, 0.3f, 0.4f});
}

TEST_CASE("RenderTexture - copy_from size mismatch") {
    RenderTexture rt(1, 4);
    CHECK_THROWS_AS(rt.copy_from(Tensor::FromVector<float>({3}, {1, 2, 3})), Error);
    CHECK_THROWS_AS(rt.copy_from(Tensor::FromVector<std::int32_t>({4}, {1, 2, 3, 4})), Error);
}

TEST_CASE("RenderTexture - raw_bytes views the texels") {
    RenderTexture rt(2, 2);
    rt.copy_from(Tensor::FromVector<float>({2, 2}, {0.5f, -1.0f, 3.25f, 1e-3f}));

    auto bytes = rt.raw_bytes();
    CHECK(bytes.size() == rt.byte_size());
    REQUIRE(bytes.size() == 4 * sizeof(float));

    std::vector<float> decoded(4);
    std::memcpy(decoded.data(), bytes.data(), bytes.size());
    CHECK(decoded == rt.pixels());

    RenderTexture empty;
    CHECK(empty.raw_bytes().empty());
}

TEST_CASE("Texture2D - load_raw_data replaces contents") {
    RenderTexture source(1, 3);
    source.copy_from(Tensor::FromVector<float>({3}, {7, 8, 9}));

    Texture2D host(1, 3);
    CHECK(host.generation() == 0);
    CHECK(host.pixels() == std::vector<float>{0, 0, 0});

    host.load_raw_data(source.raw_bytes());
    CHECK(host.generation() == 1);
    CHECK(host.pixels() == std::vector<float>{7, 8, 9});
}

TEST_CASE("Texture2D - wrong byte count leaves contents untouched") {
    Texture2D host(1, 2);
    const std::vector<std::uint8_t> bytes(5, 0xFF);
    CHECK_THROWS_AS(host.load_raw_data(bytes), Error);
    CHECK(host.pixels() == std::vector<float>{0, 0});
    CHECK(host.generation() == 0);
}

TEST_CASE("Texture - negative size") {
    CHECK_THROWS_AS((void)Texture2D(-1, 2), Error);
    RenderTexture empty;
    CHECK(empty.texel_count() == 0);
}
