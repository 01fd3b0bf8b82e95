// tf_runner/tensor.hpp
// RAII wrapper for TF_Tensor
//
// - Shared internal state so the TF_Tensor outlives every Feed that borrows it
// - Checked size arithmetic on every factory
// - Typed access validates dtype before handing out a span
//
// Tensors are single-threaded values: one execute cycle produces them, one
// retrieval consumes them.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"

namespace tf_runner {

// ============================================================================
// Helpers
// ============================================================================

namespace detail {
    template<class>
    inline constexpr bool always_false_v = false;

    /// Checked multiplication for size calculations - throws on overflow
    [[nodiscard]] inline std::size_t checked_mul(std::size_t a, std::size_t b,
                                                  const char* context = "size calculation") {
        if (a == 0 || b == 0) return 0;
        if (b > std::numeric_limits<std::size_t>::max() / a) {
            throw std::overflow_error(detail::format(
                "Integer overflow in {}: {} * {} exceeds size_t max", context, a, b));
        }
        return a * b;
    }

    /// Product of dimensions with overflow and sign checking
    [[nodiscard]] inline std::size_t checked_product(std::span<const std::int64_t> dims,
                                                      const char* context = "shape calculation") {
        std::size_t result = 1;
        for (auto d : dims) {
            if (d < 0) {
                throw std::invalid_argument(detail::format(
                    "Negative dimension {} in {}", d, context));
            }
            result = checked_mul(result, static_cast<std::size_t>(d), context);
        }
        return result;
    }

    /// Narrow a size to int for the C API, throwing instead of truncating.
    [[nodiscard]] inline int checked_int(std::size_t n, const char* context) {
        if (n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw std::overflow_error(detail::format("{}: count {} exceeds int max", context, n));
        }
        return static_cast<int>(n);
    }

    struct TensorDeleter {
        void operator()(TF_Tensor* t) const noexcept {
            if (t) TF_DeleteTensor(t);
        }
    };

    using RawTensorPtr = std::unique_ptr<TF_Tensor, TensorDeleter>;
} // namespace detail

// ============================================================================
// TensorScalar Concept - Supported element types
// ============================================================================

template<class T>
concept TensorScalar =
    std::same_as<T, float>         ||
    std::same_as<T, double>        ||
    std::same_as<T, std::int8_t>   ||
    std::same_as<T, std::int32_t>  ||
    std::same_as<T, std::int64_t>  ||
    std::same_as<T, std::uint8_t>  ||
    std::same_as<T, bool>;

template<TensorScalar T>
[[nodiscard]] constexpr TF_DataType tf_dtype_of() noexcept {
    if constexpr (std::same_as<T, float>)              return TF_FLOAT;
    else if constexpr (std::same_as<T, double>)        return TF_DOUBLE;
    else if constexpr (std::same_as<T, std::int8_t>)   return TF_INT8;
    else if constexpr (std::same_as<T, std::int32_t>)  return TF_INT32;
    else if constexpr (std::same_as<T, std::int64_t>)  return TF_INT64;
    else if constexpr (std::same_as<T, std::uint8_t>)  return TF_UINT8;
    else if constexpr (std::same_as<T, bool>)          return TF_BOOL;
    else static_assert(detail::always_false_v<T>, "Unsupported scalar type");
}

template<TensorScalar T>
inline constexpr TF_DataType tf_dtype_v = tf_dtype_of<T>();

[[nodiscard]] constexpr const char* dtype_name(TF_DataType dtype) noexcept {
    switch (dtype) {
        case TF_FLOAT:      return "float32";
        case TF_DOUBLE:     return "float64";
        case TF_INT8:       return "int8";
        case TF_INT16:      return "int16";
        case TF_INT32:      return "int32";
        case TF_INT64:      return "int64";
        case TF_UINT8:      return "uint8";
        case TF_UINT16:     return "uint16";
        case TF_BOOL:       return "bool";
        case TF_STRING:     return "string";
        case TF_HALF:       return "float16";
        default:            return "unknown";
    }
}

// ============================================================================
// TensorState - Shared internal state
// ============================================================================

namespace detail {

struct TensorState {
    TF_Tensor* tensor{nullptr};
    std::vector<std::int64_t> shape;

    TensorState(TF_Tensor* t, std::vector<std::int64_t> s)
        : tensor(t), shape(std::move(s)) {}

    ~TensorState() {
        if (tensor) TF_DeleteTensor(tensor);
    }

    TensorState(const TensorState&) = delete;
    TensorState& operator=(const TensorState&) = delete;
};

} // namespace detail

// ============================================================================
// Tensor - RAII wrapper for TF_Tensor
// ============================================================================

class Tensor {
public:
    Tensor() = default;
    ~Tensor() = default;

    Tensor(const Tensor&) = delete;
    Tensor& operator=(const Tensor&) = delete;

    Tensor(Tensor&&) noexcept = default;
    Tensor& operator=(Tensor&&) noexcept = default;

    // ─────────────────────────────────────────────────────────────────
    // Metadata
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept {
        static const std::vector<std::int64_t> empty_shape;
        return state_ ? state_->shape : empty_shape;
    }

    [[nodiscard]] int rank() const noexcept {
        return static_cast<int>(shape().size());
    }

    [[nodiscard]] TF_DataType dtype() const noexcept {
        return state_ && state_->tensor ? TF_TensorType(state_->tensor) : TF_FLOAT;
    }

    [[nodiscard]] const char* dtype_name() const noexcept {
        return tf_runner::dtype_name(dtype());
    }

    [[nodiscard]] std::size_t byte_size() const noexcept {
        return state_ && state_->tensor ? TF_TensorByteSize(state_->tensor) : 0;
    }

    [[nodiscard]] std::size_t num_elements() const {
        if (!state_ || !state_->tensor) return 0;
        return static_cast<std::size_t>(TF_TensorElementCount(state_->tensor));
    }

    [[nodiscard]] bool valid() const noexcept {
        return state_ && state_->tensor != nullptr;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

    [[nodiscard]] TF_Tensor* handle() const noexcept {
        return state_ ? state_->tensor : nullptr;
    }

    /// Shared ownership token; keeps the TF_Tensor alive while held.
    [[nodiscard]] std::shared_ptr<const void> keepalive() const noexcept {
        return state_;
    }

    // ─────────────────────────────────────────────────────────────────
    // Typed access
    // ─────────────────────────────────────────────────────────────────

    template<TensorScalar T>
    [[nodiscard]] std::span<const T> read() const {
        ensure_dtype_<T>("Tensor::read");
        return {static_cast<const T*>(TF_TensorData(state_->tensor)), num_elements()};
    }

    template<TensorScalar T>
    [[nodiscard]] std::span<T> write() {
        ensure_dtype_<T>("Tensor::write");
        return {static_cast<T*>(TF_TensorData(state_->tensor)), num_elements()};
    }

    /// Copy tensor data out (no aliasing with the TF buffer afterwards).
    template<TensorScalar T>
    [[nodiscard]] std::vector<T> ToVector() const {
        auto data = read<T>();
        return std::vector<T>(data.begin(), data.end());
    }

    template<TensorScalar T>
    [[nodiscard]] T ToScalar() const {
        auto data = read<T>();
        if (data.size() != 1) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "Tensor::ToScalar",
                detail::format("expected 1 element, tensor has {}", data.size()));
        }
        return data[0];
    }

    // ─────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────

    template<TensorScalar T>
    [[nodiscard]] static Tensor FromVector(
        std::span<const std::int64_t> dims,
        std::span<const T> values)
    {
        const std::size_t expected = detail::checked_product(dims, "Tensor::FromVector");
        if (expected != values.size()) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "Tensor::FromVector",
                detail::format("shape holds {} elements but {} values were given",
                    expected, values.size()));
        }

        Tensor t = Allocate<T>(dims);
        if (!values.empty()) {
            std::memcpy(TF_TensorData(t.handle()), values.data(), values.size_bytes());
        }
        return t;
    }

    template<TensorScalar T>
    [[nodiscard]] static Tensor FromVector(
        std::initializer_list<std::int64_t> dims,
        const std::vector<T>& values)
    {
        return FromVector<T>(
            std::span<const std::int64_t>(dims.begin(), dims.size()),
            std::span<const T>(values.data(), values.size()));
    }

    template<TensorScalar T>
    [[nodiscard]] static Tensor FromVector(
        const std::vector<std::int64_t>& dims,
        const std::vector<T>& values)
    {
        return FromVector<T>(
            std::span<const std::int64_t>(dims),
            std::span<const T>(values.data(), values.size()));
    }

    template<TensorScalar T>
    [[nodiscard]] static Tensor FromScalar(T value) {
        return FromVector<T>(std::span<const std::int64_t>{}, std::span<const T>(&value, 1));
    }

    /// Allocate uninitialized storage of the given shape.
    template<TensorScalar T>
    [[nodiscard]] static Tensor Allocate(std::span<const std::int64_t> dims) {
        const std::size_t count = detail::checked_product(dims, "Tensor::Allocate");
        const std::size_t bytes = detail::checked_mul(count, sizeof(T), "Tensor::Allocate");

        TF_Tensor* raw = TF_AllocateTensor(tf_dtype_v<T>, dims.data(),
            detail::checked_int(dims.size(), "Tensor::Allocate dims"), bytes);
        if (!raw) {
            throw Error::Execution(TF_RESOURCE_EXHAUSTED, "Tensor::Allocate",
                detail::format("TF_AllocateTensor failed for {} bytes", bytes));
        }
        return FromRaw(raw);
    }

    template<TensorScalar T>
    [[nodiscard]] static Tensor Zeros(std::span<const std::int64_t> dims) {
        Tensor t = Allocate<T>(dims);
        if (t.byte_size() > 0) {
            std::memset(TF_TensorData(t.handle()), 0, t.byte_size());
        }
        return t;
    }

    template<TensorScalar T>
    [[nodiscard]] static Tensor Zeros(std::initializer_list<std::int64_t> dims) {
        return Zeros<T>(std::span<const std::int64_t>(dims.begin(), dims.size()));
    }

    /// Adopt ownership of a raw TF_Tensor (e.g. a TF_SessionRun output).
    [[nodiscard]] static Tensor FromRaw(TF_Tensor* raw) {
        if (!raw) {
            throw Error::Execution(TF_INVALID_ARGUMENT, "Tensor::FromRaw", "null TF_Tensor*");
        }
        detail::RawTensorPtr owned(raw);

        const int ndims = TF_NumDims(raw);
        std::vector<std::int64_t> shape;
        shape.reserve(static_cast<std::size_t>(ndims));
        for (int i = 0; i < ndims; ++i) {
            shape.push_back(TF_Dim(raw, i));
        }

        Tensor t;
        t.state_ = std::make_shared<detail::TensorState>(owned.release(), std::move(shape));
        return t;
    }

private:
    std::shared_ptr<detail::TensorState> state_{};

    template<TensorScalar T>
    void ensure_dtype_(const char* fn) const {
        if (!valid()) {
            throw Error::Execution(TF_FAILED_PRECONDITION, fn, "tensor is empty or moved-from");
        }
        if (dtype() != tf_dtype_v<T>) {
            throw Error::Execution(TF_INVALID_ARGUMENT, fn,
                detail::format("dtype mismatch: tensor is {}, requested {}",
                    tf_runner::dtype_name(dtype()), tf_runner::dtype_name(tf_dtype_v<T>)));
        }
    }
};

} // namespace tf_runner
