// tf_runner/error.hpp
// Structured exception type for tf_runner
//
// One exception type carries the whole error taxonomy:
// - ErrorKind says what failed (asset, configuration, execution, labels, index)
// - ErrorSource says who detected it (TensorFlow status vs. runner validation)
// - TF_Code, context, optional op name/index and source location for diagnostics
//
// Readback failures are not exceptions; see ReadbackStatus in readback.hpp.

#pragma once

#include <cstddef>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/format.hpp"

namespace tf_runner {

enum class ErrorSource {
    TensorFlow,
    Runner,
};

enum class ErrorKind {
    AssetLoad,          // malformed or missing model/label asset
    Configuration,      // invalid backend, layer index, channel order, config file
    Execution,          // engine used out of order, bad inputs, engine failure
    InvalidLabelData,   // label payload could not be parsed
    IndexOutOfRange,    // class index outside [0, classCount)
};

/// Convert a TensorFlow TF_Code to a stable string name.
[[nodiscard]] constexpr const char* code_to_string(TF_Code code) noexcept {
    switch (code) {
        case TF_OK:                  return "OK";
        case TF_CANCELLED:           return "CANCELLED";
        case TF_UNKNOWN:             return "UNKNOWN";
        case TF_INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case TF_DEADLINE_EXCEEDED:   return "DEADLINE_EXCEEDED";
        case TF_NOT_FOUND:           return "NOT_FOUND";
        case TF_ALREADY_EXISTS:      return "ALREADY_EXISTS";
        case TF_PERMISSION_DENIED:   return "PERMISSION_DENIED";
        case TF_UNAUTHENTICATED:     return "UNAUTHENTICATED";
        case TF_RESOURCE_EXHAUSTED:  return "RESOURCE_EXHAUSTED";
        case TF_FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case TF_ABORTED:             return "ABORTED";
        case TF_OUT_OF_RANGE:        return "OUT_OF_RANGE";
        case TF_UNIMPLEMENTED:       return "UNIMPLEMENTED";
        case TF_INTERNAL:            return "INTERNAL";
        case TF_UNAVAILABLE:         return "UNAVAILABLE";
        case TF_DATA_LOSS:           return "DATA_LOSS";
        default:                     return "UNKNOWN_CODE";
    }
}

[[nodiscard]] constexpr const char* kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::AssetLoad:        return "AssetLoad";
        case ErrorKind::Configuration:    return "Configuration";
        case ErrorKind::Execution:        return "Execution";
        case ErrorKind::InvalidLabelData: return "InvalidLabelData";
        case ErrorKind::IndexOutOfRange:  return "IndexOutOfRange";
    }
    return "Unknown";
}

/// Structured error for both TensorFlow status failures and runner-level
/// validation errors.
///
/// Derives from std::runtime_error so callers may catch it generically.
class Error : public std::runtime_error {
public:
    Error(
        ErrorSource source,
        ErrorKind kind,
        TF_Code code,
        std::string_view context,
        std::string_view message,
        std::string_view op_name = {},
        int index = -1,
        std::source_location loc = std::source_location::current())
        : std::runtime_error(build_what_(source, kind, code, context, message, op_name, index, loc))
        , source_(source)
        , kind_(kind)
        , code_(code)
        , context_(context)
        , message_(message)
        , op_name_(op_name)
        , index_(index)
        , loc_(loc)
    {}

    [[nodiscard]] ErrorSource source() const noexcept { return source_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const char* kind_name() const noexcept { return kind_to_string(kind_); }
    [[nodiscard]] TF_Code code() const noexcept { return code_; }
    [[nodiscard]] const char* code_name() const noexcept { return code_to_string(code_); }

    [[nodiscard]] std::string_view context() const noexcept { return context_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view op_name() const noexcept { return op_name_; }
    [[nodiscard]] int index() const noexcept { return index_; }
    [[nodiscard]] std::source_location location() const noexcept { return loc_; }

    // Convenience factories

    /// A non-OK TF_Status surfaced while doing `kind` of work.
    [[nodiscard]] static Error TensorFlow(
        ErrorKind kind,
        TF_Code code,
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::TensorFlow, kind, code, context, message, {}, -1, loc);
    }

    [[nodiscard]] static Error AssetLoad(
        std::string_view context,
        std::string_view message,
        std::string_view op_name = {},
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Runner, ErrorKind::AssetLoad, TF_INVALID_ARGUMENT,
            context, message, op_name, -1, loc);
    }

    [[nodiscard]] static Error Configuration(
        TF_Code code,
        std::string_view context,
        std::string_view message,
        std::string_view op_name = {},
        int index = -1,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Runner, ErrorKind::Configuration, code,
            context, message, op_name, index, loc);
    }

    [[nodiscard]] static Error Execution(
        TF_Code code,
        std::string_view context,
        std::string_view message,
        std::string_view op_name = {},
        int index = -1,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Runner, ErrorKind::Execution, code,
            context, message, op_name, index, loc);
    }

    [[nodiscard]] static Error InvalidLabelData(
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Runner, ErrorKind::InvalidLabelData, TF_INVALID_ARGUMENT,
            context, message, {}, -1, loc);
    }

    [[nodiscard]] static Error IndexOutOfRange(
        std::string_view context,
        int index,
        std::size_t size,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Runner, ErrorKind::IndexOutOfRange, TF_OUT_OF_RANGE,
            context, detail::format("index {} outside [0, {})", index, size), {}, index, loc);
    }

private:
    ErrorSource source_{ErrorSource::Runner};
    ErrorKind kind_{ErrorKind::Execution};
    TF_Code code_{TF_UNKNOWN};
    std::string context_;
    std::string message_;
    std::string op_name_;
    int index_{-1};
    std::source_location loc_{};

    static std::string build_what_(
        ErrorSource source,
        ErrorKind kind,
        TF_Code code,
        std::string_view context,
        std::string_view message,
        std::string_view op_name,
        int index,
        const std::source_location& loc)
    {
        const char* prefix = (source == ErrorSource::TensorFlow) ? "TF_" : "";

        std::string op_part;
        if (!op_name.empty()) {
            if (index >= 0) {
                op_part = detail::format(" op '{}:{}'", op_name, index);
            } else {
                op_part = detail::format(" op '{}'", op_name);
            }
        }

        if (context.empty()) {
            return detail::format(
                "[{}/{}{}]{} at {}:{} in {}: {}",
                kind_to_string(kind), prefix, code_to_string(code), op_part,
                loc.file_name(), loc.line(), loc.function_name(), message);
        }

        return detail::format(
            "[{}/{}{}] {}{} at {}:{} in {}: {}",
            kind_to_string(kind), prefix, code_to_string(code), context, op_part,
            loc.file_name(), loc.line(), loc.function_name(), message);
    }
};

} // namespace tf_runner
