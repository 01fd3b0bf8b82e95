// tf_runner/logging.hpp
// Library-wide spdlog logger
//
// All diagnostics go through one named logger ("tf_runner"). It is created
// lazily as a colored stdout logger; hosts and tests may install their own
// logger (same name) to redirect or capture output.

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tf_runner {

inline constexpr const char* kLoggerName = "tf_runner";

namespace detail {
inline std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}
} // namespace detail

/// Get (creating on first use) the library logger.
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(detail::logger_mutex());
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    return spdlog::stdout_color_mt(kLoggerName);
}

/// The registered library logger, or null. Never creates one, so it is safe
/// on teardown paths.
[[nodiscard]] inline std::shared_ptr<spdlog::logger> existing_logger() {
    return spdlog::get(kLoggerName);
}

/// Replace the library logger. The logger is re-registered under kLoggerName.
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard<std::mutex> lock(detail::logger_mutex());
    spdlog::drop(kLoggerName);
    if (!replacement) return;

    if (replacement->name() != kLoggerName) {
        replacement = replacement->clone(kLoggerName);
    }
    spdlog::register_logger(std::move(replacement));
}

} // namespace tf_runner
