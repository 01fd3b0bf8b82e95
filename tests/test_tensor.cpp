// tests/test_tensor.cpp
// Tests for tf_runner::Tensor
//
// Framework: doctest
//
// These tests cover:
// - Factory methods: FromScalar, FromVector, Zeros, Allocate, FromRaw
// - Data access: read/write views, ToScalar, ToVector
// - Type safety: dtype checking, moved-from state
// - Overflow-checked shape arithmetic

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tf_runner/tensor.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace tf_runner;

// ============================================================================
// Factories
// ============================================================================

TEST_CASE("Tensor::FromScalar - float") {
    auto t = Tensor::FromScalar<float>(3.14f);

    CHECK(t.valid());
    CHECK(t.dtype() == TF_FLOAT);
    CHECK(t.num_elements() == 1);
    CHECK(t.rank() == 0);
    CHECK(t.shape().empty());
    CHECK(t.ToScalar<float>() == doctest::Approx(3.14f));
}

TEST_CASE("Tensor::FromScalar - int64 and bool") {
    auto i = Tensor::FromScalar<std::int64_t>(std::numeric_limits<std::int64_t>::max());
    CHECK(i.dtype() == TF_INT64);
    CHECK(i.ToScalar<std::int64_t>() == std::numeric_limits<std::int64_t>::max());

    auto b = Tensor::FromScalar<bool>(true);
    CHECK(b.dtype() == TF_BOOL);
    CHECK(b.ToScalar<bool>());
}

TEST_CASE("Tensor::FromVector - shape and values") {
    auto t = Tensor::FromVector<float>({2, 3}, {1, 2, 3, 4, 5, 6});

    CHECK(t.shape() == std::vector<std::int64_t>{2, 3});
    CHECK(t.rank() == 2);
    CHECK(t.num_elements() == 6);
    CHECK(t.byte_size() == 6 * sizeof(float));
    CHECK(t.ToVector<float>() == std::vector<float>{1, 2, 3, 4, 5, 6});
}

TEST_CASE("Tensor::FromVector - count mismatch is an Execution error") {
    try {
        (void)Tensor::FromVector<float>({2, 2}, {1, 2, 3});
        FAIL("expected throw");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::Execution);
        CHECK(e.code() == TF_INVALID_ARGUMENT);
    }
}

TEST_CASE("Tensor::FromVector - vector dims overload") {
    std::vector<std::int64_t> dims{4};
    auto t = Tensor::FromVector<std::int32_t>(dims, std::vector<std::int32_t>{1, 2, 3, 4});
    CHECK(t.dtype() == TF_INT32);
    CHECK(t.ToVector<std::int32_t>() == std::vector<std::int32_t>{1, 2, 3, 4});
}

TEST_CASE("Tensor::Zeros") {
    auto t = Tensor::Zeros<float>({1, 3, 4, 4});
    CHECK(t.num_elements() == 48);
    for (float v : t.read<float>()) {
        CHECK(v == 0.0f);
    }
}

TEST_CASE("Tensor::Zeros - zero-sized dimension") {
    auto t = Tensor::Zeros<float>({0, 10});
    CHECK(t.valid());
    CHECK(t.num_elements() == 0);
    CHECK(t.ToVector<float>().empty());
}

TEST_CASE("Tensor::Allocate - negative dimension is rejected") {
    const std::int64_t dims[] = {2, -1};
    CHECK_THROWS_AS((void)Tensor::Allocate<float>(dims), std::invalid_argument);
}

TEST_CASE("Tensor::Allocate - overflowing shape is rejected") {
    const std::int64_t dims[] = {
        std::numeric_limits<std::int64_t>::max(),
        std::numeric_limits<std::int64_t>::max()};
    CHECK_THROWS_AS((void)Tensor::Allocate<float>(dims), std::overflow_error);
}

TEST_CASE("Tensor::FromRaw - null is rejected") {
    CHECK_THROWS_AS((void)Tensor::FromRaw(nullptr), Error);
}

// ============================================================================
// Access
// ============================================================================

TEST_CASE("Tensor - write view updates data") {
    auto t = Tensor::Zeros<float>({3});
    auto view = t.write<float>();
    view[1] = 7.0f;
    CHECK(t.ToVector<float>() == std::vector<float>{0.0f, 7.0f, 0.0f});
}

TEST_CASE("Tensor - dtype mismatch on read") {
    auto t = Tensor::FromScalar<float>(1.0f);
    try {
        (void)t.read<std::int32_t>();
        FAIL("expected throw");
    } catch (const Error& e) {
        CHECK(e.code() == TF_INVALID_ARGUMENT);
        CHECK(std::string(e.what()).find("float32") != std::string::npos);
    }
}

TEST_CASE("Tensor - ToScalar on a vector") {
    auto t = Tensor::FromVector<float>({2}, {1.0f, 2.0f});
    CHECK_THROWS_AS((void)t.ToScalar<float>(), Error);
}

TEST_CASE("Tensor - moved-from state") {
    auto t1 = Tensor::FromScalar<float>(1.0f);
    auto t2 = std::move(t1);

    CHECK(t2.valid());
    CHECK_FALSE(t1.valid());
    CHECK(t1.num_elements() == 0);
    CHECK(t1.handle() == nullptr);

    try {
        (void)t1.read<float>();
        FAIL("expected throw");
    } catch (const Error& e) {
        CHECK(e.code() == TF_FAILED_PRECONDITION);
    }
}

TEST_CASE("Tensor - keepalive outlives the wrapper") {
    std::shared_ptr<const void> token;
    TF_Tensor* raw = nullptr;
    {
        auto t = Tensor::FromVector<float>({2}, {5.0f, 6.0f});
        token = t.keepalive();
        raw = t.handle();
    }
    REQUIRE(token);
    CHECK(static_cast<const float*>(TF_TensorData(raw))[1] == 6.0f);
}

TEST_CASE("dtype_name") {
    CHECK(std::string(dtype_name(TF_FLOAT)) == "float32");
    CHECK(std::string(dtype_name(TF_INT32)) == "int32");
}
