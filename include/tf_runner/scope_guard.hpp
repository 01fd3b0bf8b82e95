/**
 * @file scope_guard.hpp
 * @brief RAII scope-exit cleanup for raw TensorFlow C handles.
 *
 * @details Two flavours are provided:
 *
 * - ScopeGuard: always executes cleanup (like Go's defer)
 * - ScopeGuardOnFail: executes only while an exception unwinds the scope
 *
 * Cleanup actions must be noexcept; the guard is move-only and can be
 * dismissed when ownership is transferred elsewhere.
 *
 * IMPORTANT - LAMBDA CONTROL FLOW WARNING:
 * The macros (TFRUN_SCOPE_EXIT, TFRUN_SCOPE_FAIL) create lambdas.
 * 'return' inside the block returns from the LAMBDA, not the enclosing function.
 *
 * @code
 * TF_ImportGraphDefOptions* opts = TF_NewImportGraphDefOptions();
 * TFRUN_SCOPE_EXIT { TF_DeleteImportGraphDefOptions(opts); };
 * @endcode
 */

#pragma once

#include <exception>    // std::uncaught_exceptions
#include <type_traits>  // std::decay_t, std::is_nothrow_invocable_v
#include <utility>      // std::forward, std::move

namespace tf_runner {

// =============================================================================
// ScopeGuard - Always Executes
// =============================================================================

template <typename F>
class [[nodiscard]] ScopeGuard {
    static_assert(std::is_nothrow_invocable_v<F&>,
                  "ScopeGuard cleanup action must be noexcept");

public:
    explicit ScopeGuard(F&& action) noexcept(std::is_nothrow_move_constructible_v<F>)
        : m_action(std::forward<F>(action))
    {}

    ScopeGuard(ScopeGuard&& other) noexcept(std::is_nothrow_move_constructible_v<F>)
        : m_action(std::move(other.m_action))
        , m_active(other.m_active)
    {
        other.m_active = false;
    }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ScopeGuard& operator=(ScopeGuard&&) = delete;

    ~ScopeGuard() noexcept {
        if (m_active) m_action();
    }

    /// Disable the cleanup (the resource was handed off).
    void dismiss() noexcept { m_active = false; }

    [[nodiscard]] bool is_active() const noexcept { return m_active; }

private:
    F m_action;
    bool m_active{true};
};

// =============================================================================
// ScopeGuardOnFail - Executes Only on Exception
// =============================================================================

/**
 * @brief Runs the action only if the scope is left by stack unwinding.
 *
 * Used for rollback: undo a partially applied state transition when a later
 * step throws.
 */
template <typename F>
class [[nodiscard]] ScopeGuardOnFail {
    static_assert(std::is_nothrow_invocable_v<F&>,
                  "ScopeGuardOnFail rollback action must be noexcept");

public:
    explicit ScopeGuardOnFail(F&& action) noexcept(std::is_nothrow_move_constructible_v<F>)
        : m_action(std::forward<F>(action))
        , m_uncaught_count(std::uncaught_exceptions())
    {}

    ScopeGuardOnFail(ScopeGuardOnFail&& other) noexcept(std::is_nothrow_move_constructible_v<F>)
        : m_action(std::move(other.m_action))
        , m_uncaught_count(other.m_uncaught_count)
        , m_active(other.m_active)
    {
        other.m_active = false;
    }

    ScopeGuardOnFail(const ScopeGuardOnFail&) = delete;
    ScopeGuardOnFail& operator=(const ScopeGuardOnFail&) = delete;
    ScopeGuardOnFail& operator=(ScopeGuardOnFail&&) = delete;

    ~ScopeGuardOnFail() noexcept {
        if (m_active && std::uncaught_exceptions() > m_uncaught_count) {
            m_action();
        }
    }

    void dismiss() noexcept { m_active = false; }

private:
    F m_action;
    int m_uncaught_count;
    bool m_active{true};
};

template <typename F>
[[nodiscard]] auto makeScopeGuard(F&& fn)
    noexcept(std::is_nothrow_constructible_v<ScopeGuard<std::decay_t<F>>, F&&>)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}

template <typename F>
[[nodiscard]] auto makeScopeGuardOnFail(F&& fn)
    noexcept(std::is_nothrow_constructible_v<ScopeGuardOnFail<std::decay_t<F>>, F&&>)
{
    return ScopeGuardOnFail<std::decay_t<F>>(std::forward<F>(fn));
}

// =============================================================================
// Macro Support Infrastructure
// =============================================================================

namespace detail {

struct ScopeGuardMaker {};
struct ScopeGuardOnFailMaker {};

template <typename Fn>
[[nodiscard]] ScopeGuard<std::decay_t<Fn>> operator+(ScopeGuardMaker, Fn&& fn) {
    return ScopeGuard<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

template <typename Fn>
[[nodiscard]] ScopeGuardOnFail<std::decay_t<Fn>> operator+(ScopeGuardOnFailMaker, Fn&& fn) {
    return ScopeGuardOnFail<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

} // namespace detail

#define TFRUN_SCOPE_GUARD_CONCAT_IMPL(a, b) TFRUN_SCOPE_GUARD_CONCAT_IMPL2(a, b)
#define TFRUN_SCOPE_GUARD_CONCAT_IMPL2(a, b) a##b
#if defined(__COUNTER__)
#define TFRUN_SCOPE_GUARD_UNIQUE(prefix) TFRUN_SCOPE_GUARD_CONCAT_IMPL(prefix, __COUNTER__)
#else
#define TFRUN_SCOPE_GUARD_UNIQUE(prefix) TFRUN_SCOPE_GUARD_CONCAT_IMPL(prefix, __LINE__)
#endif

/**
 * @brief Scope guard that always executes.
 *
 * Usage: TFRUN_SCOPE_EXIT { cleanup_code; };
 */
#define TFRUN_SCOPE_EXIT \
    auto TFRUN_SCOPE_GUARD_UNIQUE(tfrun_scope_exit_) = ::tf_runner::detail::ScopeGuardMaker{} + [&]() noexcept

/**
 * @brief Scope guard that executes only on exception.
 *
 * Usage: TFRUN_SCOPE_FAIL { rollback_code; };
 */
#define TFRUN_SCOPE_FAIL \
    auto TFRUN_SCOPE_GUARD_UNIQUE(tfrun_scope_fail_) = ::tf_runner::detail::ScopeGuardOnFailMaker{} + [&]() noexcept

} // namespace tf_runner
