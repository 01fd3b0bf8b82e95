// tf_runner/ops/common.hpp
// Common types for graph-building op helpers

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/graph.hpp"
#include "tf_runner/tensor.hpp"

namespace tf_runner {
namespace ops {

// ============================================================================
// OpResult - Wrapper for operation outputs
// ============================================================================

/// Result of an operation - holds the TF_Operation* and provides output access
class OpResult {
public:
    explicit OpResult(TF_Operation* op) : op_(op) {
        if (!op_) {
            throw Error::Execution(TF_INTERNAL, "OpResult", "null operation");
        }
    }

    [[nodiscard]] TF_Operation* op() const noexcept { return op_; }

    /// Output at index (default 0). Throws IndexOutOfRange for a bad index.
    [[nodiscard]] TF_Output output(int index = 0) const {
        const int n = num_outputs();
        if (index < 0 || index >= n) {
            throw Error::IndexOutOfRange(
                tf_runner::detail::format("OpResult::output('{}')", name()),
                index, static_cast<std::size_t>(n));
        }
        return TF_Output{op_, index};
    }

    /// Implicit conversion to TF_Output (for output 0)
    operator TF_Output() const { return output(0); }

    [[nodiscard]] int num_outputs() const noexcept {
        return TF_OperationNumOutputs(op_);
    }

    [[nodiscard]] std::string name() const {
        return TF_OperationName(op_);
    }

private:
    TF_Operation* op_;
};

} // namespace ops
} // namespace tf_runner
