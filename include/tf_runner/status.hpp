// tf_runner/status.hpp
// RAII wrapper for TF_Status with exception-based error handling
//
// Every TF_Status is deleted on both the success and error paths. A failed
// status is converted to tf_runner::Error tagged with the ErrorKind of the
// work that was being done when TensorFlow reported it.

#pragma once

#include <new>
#include <source_location>
#include <string>
#include <string_view>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "tf_runner/error.hpp"

namespace tf_runner {

// ============================================================================
// Status - RAII wrapper for TF_Status*
// ============================================================================

class Status {
public:
    /// Create a new status (initially OK)
    Status() : st_(TF_NewStatus()) {
        if (!st_) throw std::bad_alloc();
    }

    ~Status() {
        if (st_) TF_DeleteStatus(st_);
    }

    Status(const Status&) = delete;
    Status& operator=(const Status&) = delete;

    Status(Status&& other) noexcept : st_(other.st_) {
        other.st_ = nullptr;
    }

    Status& operator=(Status&& other) noexcept {
        if (this != &other) {
            if (st_) TF_DeleteStatus(st_);
            st_ = other.st_;
            other.st_ = nullptr;
        }
        return *this;
    }

    [[nodiscard]] TF_Status* get() noexcept { return st_; }
    [[nodiscard]] const TF_Status* get() const noexcept { return st_; }
    [[nodiscard]] TF_Code code() const noexcept { return TF_GetCode(st_); }
    [[nodiscard]] const char* code_name() const noexcept { return code_to_string(code()); }
    [[nodiscard]] const char* message() const noexcept { return TF_Message(st_); }
    [[nodiscard]] bool ok() const noexcept { return code() == TF_OK; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void reset() noexcept {
        TF_SetStatus(st_, TF_OK, "");
    }

    void set(TF_Code code, const std::string& msg) noexcept {
        TF_SetStatus(st_, code, msg.c_str());
    }

    /// Throw tf_runner::Error{source=TensorFlow, kind} when not OK.
    void throw_if_error(
        ErrorKind kind,
        std::string_view context = "",
        std::source_location loc = std::source_location::current()) const
    {
        if (ok()) return;

        const char* msg = message();
        throw Error::TensorFlow(kind, code(), context, msg ? msg : "", loc);
    }

private:
    TF_Status* st_{nullptr};
};

} // namespace tf_runner
