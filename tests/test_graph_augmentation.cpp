// tests/test_graph_augmentation.cpp
// Tests for augment_classifier_output
//
// Framework: doctest
//
// These tests cover:
// - Softmax insertion, reuse and idempotence
// - Texture transpose for rank 2 and rank 4 outputs
// - Class axis placement for channels-first rank 4 outputs
// - Name collisions and invalid options

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tf_runner/graph_augmentation.hpp"
#include "tf_runner/session.hpp"

#include "test_models.hpp"

#include <cstdint>
#include <numeric>
#include <string>
#include <vector>

using namespace tf_runner;
using tf_runner::testing::LinearClassifierSpec;
using tf_runner::testing::linear_classifier_asset;

namespace {

std::vector<float> run_output(RuntimeGraph& rg, const Tensor& input,
                              std::vector<std::int64_t>* shape = nullptr) {
    Session session(rg.graph());
    std::vector<Feed> feeds{Feed(session.resolve(rg.inputs()[0]), input)};
    std::vector<Fetch> fetches{Fetch(session.resolve(rg.output(0)))};
    auto results = session.Run(feeds, fetches);
    if (shape) *shape = results[0].shape();
    return results[0].ToVector<float>();
}

Tensor zero_image() {
    return Tensor::Zeros<float>({1, 3, 4, 4});
}

// Placeholder -> Identity "out", with the given placeholder shape.
ModelAsset passthrough_asset(const std::vector<std::int64_t>& shape) {
    Graph graph;
    auto x = ops::Placeholder(graph, "x", TF_FLOAT, shape);
    (void)ops::Identity(graph, "out", x, TF_FLOAT);
    return ModelAsset::FromBytes(graph.ToGraphDef(), {"x"}, {"out"});
}

} // namespace

// ============================================================================
// Softmax
// ============================================================================

TEST_CASE("augment_classifier_output - appends a softmax") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());
    const std::size_t before = rg.graph().num_operations();

    auto result = augment_classifier_output(rg, {});
    CHECK(result.output_name == "softmaxLayer");
    CHECK(result.softmax_added);
    CHECK_FALSE(result.transpose_added);
    CHECK(result.nodes_added == 1);
    CHECK(rg.output(0) == "softmaxLayer");
    CHECK(rg.graph().num_operations() == before + 1);

    auto probs = run_output(rg, zero_image());
    auto expected = testing::softmax(LinearClassifierSpec{}.bias);
    REQUIRE(probs.size() == expected.size());
    for (std::size_t i = 0; i < probs.size(); ++i) {
        CHECK(probs[i] == doctest::Approx(expected[i]));
    }
    CHECK(std::accumulate(probs.begin(), probs.end(), 0.0f) == doctest::Approx(1.0f));
}

TEST_CASE("augment_classifier_output - second pass adds nothing") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());
    AugmentationOptions options;
    options.texture_transpose = true;

    auto first = augment_classifier_output(rg, options);
    const std::size_t after_first = rg.graph().num_operations();
    auto second = augment_classifier_output(rg, options);

    CHECK(second.output_name == first.output_name);
    CHECK(second.nodes_added == 0);
    CHECK_FALSE(second.softmax_added);
    CHECK_FALSE(second.transpose_added);
    CHECK(rg.graph().num_operations() == after_first);
}

TEST_CASE("augment_classifier_output - existing softmax output is kept") {
    LinearClassifierSpec spec;
    spec.with_softmax = true;
    auto graph = testing::build_linear_classifier(spec);
    auto rg = RuntimeGraph::Import(
        ModelAsset::FromBytes(graph.ToGraphDef(), {"input"}, {"probabilities"}));

    auto result = augment_classifier_output(rg, {});
    CHECK_FALSE(result.softmax_added);
    CHECK(result.nodes_added == 0);
    CHECK(result.output_name == "probabilities");
}

TEST_CASE("augment_classifier_output - reuses a softmax node of the same name") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());
    AugmentationOptions options;
    options.softmax_layer = "probs";
    (void)augment_classifier_output(rg, options);

    // Point the output back at the logits; the named softmax is still there.
    rg.redirect_output(0, "logits");
    auto result = augment_classifier_output(rg, options);
    CHECK_FALSE(result.softmax_added);
    CHECK(result.nodes_added == 0);
    CHECK(rg.output(0) == "probs");
}

TEST_CASE("augment_classifier_output - name taken by another node") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());
    AugmentationOptions options;
    options.softmax_layer = "pool";

    try {
        (void)augment_classifier_output(rg, options);
        FAIL("expected throw");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Configuration);
        CHECK(e.code() == TF_ALREADY_EXISTS);
    }
    CHECK(rg.output(0) == "logits");
}

TEST_CASE("augment_classifier_output - invalid options") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());

    AugmentationOptions empty_name;
    empty_name.softmax_layer.clear();
    CHECK_THROWS_AS((void)augment_classifier_output(rg, empty_name), Error);

    AugmentationOptions bad_index;
    bad_index.output_layer_index = 3;
    try {
        (void)augment_classifier_output(rg, bad_index);
        FAIL("expected throw");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Configuration);
        CHECK(e.index() == 3);
    }
}

TEST_CASE("augment_classifier_output - second declared output") {
    auto graph = testing::build_linear_classifier({});
    auto rg = RuntimeGraph::Import(
        ModelAsset::FromBytes(graph.ToGraphDef(), {"input"}, {"pool", "logits"}));

    AugmentationOptions options;
    options.output_layer_index = 1;
    auto result = augment_classifier_output(rg, options);
    CHECK(result.softmax_added);
    CHECK(rg.output(0) == "pool");
    CHECK(rg.output(1) == "softmaxLayer");
}

// ============================================================================
// Channels-first rank 4 outputs
// ============================================================================

TEST_CASE("augment_classifier_output - channels-first scores normalize over classes") {
    auto rg = RuntimeGraph::Import(passthrough_asset({1, 10, 1, 1}));
    AugmentationOptions options;
    options.channel_order = ChannelOrder::ChannelsFirst;

    auto result = augment_classifier_output(rg, options);
    CHECK(result.softmax_added);
    CHECK(result.nodes_added == 3);
    CHECK(rg.graph().HasOperation(channels_last_layer_name("softmaxLayer")));
    CHECK(rg.graph().HasOperation("softmaxLayer/channels_last"));

    const std::vector<float> bias = LinearClassifierSpec{}.bias;
    std::vector<std::int64_t> shape;
    auto probs = run_output(rg, Tensor::FromVector<float>({1, 10, 1, 1}, bias), &shape);
    CHECK(shape == std::vector<std::int64_t>{1, 1, 1, 10});

    auto expected = testing::softmax(bias);
    REQUIRE(probs.size() == expected.size());
    for (std::size_t i = 0; i < probs.size(); ++i) {
        CHECK(probs[i] == doctest::Approx(expected[i]));
    }
    CHECK(std::accumulate(probs.begin(), probs.end(), 0.0f) == doctest::Approx(1.0f));
}

TEST_CASE("augment_classifier_output - channels-first texture output is class-major") {
    auto rg = RuntimeGraph::Import(passthrough_asset({1, 10, 1, 1}));
    AugmentationOptions options;
    options.channel_order = ChannelOrder::ChannelsFirst;
    options.texture_transpose = true;

    auto result = augment_classifier_output(rg, options);
    CHECK(result.softmax_added);
    CHECK(result.transpose_added);
    CHECK(result.nodes_added == 5);

    std::vector<std::int64_t> shape;
    auto probs = run_output(rg, Tensor::Zeros<float>({1, 10, 1, 1}), &shape);
    CHECK(shape == std::vector<std::int64_t>{1, 10, 1, 1});
    for (float p : probs) {
        CHECK(p == doctest::Approx(0.1f));
    }

    auto again = augment_classifier_output(rg, options);
    CHECK(again.nodes_added == 0);
    CHECK(again.output_name == result.output_name);
}

TEST_CASE("augment_classifier_output - channels-first softmax in the model is kept as is") {
    testing::LogCapture logs;
    Graph graph;
    std::vector<std::int64_t> dims{1, 4, 1, 1};
    auto x = ops::Placeholder(graph, "x", TF_FLOAT, dims);
    (void)ops::Softmax(graph, "probs", x, TF_FLOAT);
    auto rg = RuntimeGraph::Import(
        ModelAsset::FromBytes(graph.ToGraphDef(), {"x"}, {"probs"}));

    AugmentationOptions options;
    options.channel_order = ChannelOrder::ChannelsFirst;
    options.texture_transpose = true;
    auto result = augment_classifier_output(rg, options);
    CHECK_FALSE(result.softmax_added);
    CHECK_FALSE(result.transpose_added);
    CHECK(result.nodes_added == 0);
    CHECK(result.output_name == "probs");
    CHECK(logs.contains("already class-major"));
}

// ============================================================================
// Texture transpose
// ============================================================================

TEST_CASE("augment_classifier_output - rank 2 output becomes a column") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());
    AugmentationOptions options;
    options.texture_transpose = true;

    auto result = augment_classifier_output(rg, options);
    CHECK(result.softmax_added);
    CHECK(result.transpose_added);
    CHECK(result.nodes_added == 3);
    CHECK(result.output_name == transpose_layer_name("softmaxLayer"));
    CHECK(result.output_name == "softmaxLayer_transpose");
    CHECK(rg.graph().HasOperation("softmaxLayer_transpose/perm"));

    std::vector<std::int64_t> shape;
    auto probs = run_output(rg, zero_image(), &shape);
    CHECK(shape == std::vector<std::int64_t>{10, 1});
    CHECK(probs[9] > probs[0]);
}

TEST_CASE("augment_classifier_output - rank 4 output moves channels forward") {
    auto rg = RuntimeGraph::Import(passthrough_asset({1, 2, 2, 3}));
    AugmentationOptions options;
    options.channel_order = ChannelOrder::ChannelsLast;
    options.texture_transpose = true;

    auto result = augment_classifier_output(rg, options);
    CHECK(result.transpose_added);

    std::vector<std::int64_t> shape;
    (void)run_output(rg, Tensor::Zeros<float>({1, 2, 2, 3}), &shape);
    CHECK(shape == std::vector<std::int64_t>{1, 3, 2, 2});
}

TEST_CASE("augment_classifier_output - other ranks skip the transpose") {
    testing::LogCapture logs;
    auto rg = RuntimeGraph::Import(passthrough_asset({1, 2, 5}));
    AugmentationOptions options;
    options.texture_transpose = true;

    auto result = augment_classifier_output(rg, options);
    CHECK(result.softmax_added);
    CHECK_FALSE(result.transpose_added);
    CHECK(result.output_name == "softmaxLayer");
    CHECK(logs.contains("texture transpose skipped"));
}

TEST_CASE("augment_classifier_output - unknown rank skips the transpose") {
    testing::LogCapture logs;
    auto rg = RuntimeGraph::Import(passthrough_asset({}));
    AugmentationOptions options;
    options.texture_transpose = true;

    auto result = augment_classifier_output(rg, options);
    CHECK_FALSE(result.transpose_added);
    CHECK(logs.contains("rank -1"));
}

TEST_CASE("augment_classifier_output - frozen graph") {
    auto rg = RuntimeGraph::Import(linear_classifier_asset());
    Session session(rg.graph());
    CHECK_THROWS_AS((void)augment_classifier_output(rg, {}), Error);
}
