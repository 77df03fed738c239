#pragma once

/**
@file
@brief Defines `util::ScopeGuard`, which runs a function when the enclosing scope exits.
*/

#include <utility>

namespace util {

/// @brief Runs a function on scope exit unless cancelled.
///
/// Typically used to undo partial work on early returns, then cancelled once the operation succeeds:
///
/// ```cpp
/// util::ScopeGuard sgRemoveTemp{[&] { std::filesystem::remove(tempPath, err); }};
/// if (!WriteContents(tempPath)) {
///     return false; // temporary file removed here
/// }
/// sgRemoveTemp.Cancel();
/// ```
///
/// @tparam Fn the type of the function to run
template <typename Fn>
class ScopeGuard {
public:
    /// @brief Creates a scope guard that runs `fn` on destruction.
    /// @param[in] fn the function to run
    ScopeGuard(Fn &&fn) noexcept
        : m_fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    ~ScopeGuard() noexcept(noexcept(m_fn())) {
        if (!m_cancelled) {
            m_fn();
        }
    }

    /// @brief Prevents the function from running on scope exit.
    void Cancel() noexcept {
        m_cancelled = true;
    }

private:
    Fn m_fn;
    bool m_cancelled = false;
};

} // namespace util
