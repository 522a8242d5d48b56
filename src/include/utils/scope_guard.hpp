#pragma once
#include <concepts>
#include <type_traits>
#include <utility>

namespace scenefix::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * Used for cleanup of resources without their own RAII wrapper: raw file
 * descriptors and temporary files created during an atomic replace.
 *
 * @code
 *  int fd = ::open(tmp.c_str(), O_WRONLY);
 *  auto guard = scenefix::basics::make_scope_guard([&]() { ::close(fd); ::unlink(tmp.c_str()); });
 *  ... write, fsync, rename ...
 *  guard.dismiss(); // the temp file became the target
 * @endcode
 *
 * The destructor is `noexcept`; exceptions thrown by the callable are swallowed, so
 * cleanup callables must report their own failures (e.g. by logging).
 * Moving a guard transfers the cleanup; the moved-from guard is inactive.
 * Not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                m_func();
            }
            catch (...) // NOLINT(bugprone-empty-catch) -- destructor must not throw
            {
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /** @brief Cancels the cleanup action. */
    void dismiss() noexcept { m_active = false; }

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

  private:
    Callable m_func;
    bool m_active = true;
};

/** @brief Factory that deduces the decayed callable type. */
template <typename F>
[[nodiscard]] auto make_scope_guard(F &&fn) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<F>, F>)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}

} // namespace scenefix::basics
