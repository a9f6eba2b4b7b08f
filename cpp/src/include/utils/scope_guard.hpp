#pragma once

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace treespec::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII guard that executes a callable when the enclosing scope exits.
 *
 * The engine wraps every test invocation in a guard so that recorded messages
 * are flushed and the informer slot is restored no matter how the test body
 * ends. It is movable but not copyable.
 *
 * @tparam Callable A decayed, non-reference callable invocable with no arguments.
 *
 * ### Usage
 *
 * @code
 *  void run_one(Slot &slot, Sink next)
 *  {
 *      auto previous = slot.exchange(next);
 *      auto guard = treespec::basics::make_scope_guard([&] { slot.exchange(previous); });
 *
 *      invoke_body();              // may throw; the guard still restores the slot
 *
 *      guard.invoke_and_rethrow(); // normal path: let restore failures propagate
 *  }
 * @endcode
 *
 * ### Exceptions
 *
 * The destructor is `noexcept`. If the callable throws from the destructor the
 * exception cannot propagate; its message is written to `stderr` and dropped.
 * Callers that must see cleanup failures call `invoke_and_rethrow()` on the
 * normal path and let the destructor handle only the unwinding path.
 *
 * This class is not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    /**
     * @brief Checks if the guard is active and will execute on scope exit.
     */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /**
     * @brief Move constructor. The source guard is dismissed.
     */
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
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                std::fprintf(stderr, "[ScopeGuard] cleanup failed during scope exit: %s\n", e.what());
            }
            catch (...)
            {
                std::fputs("[ScopeGuard] cleanup failed during scope exit: unknown exception\n",
                           stderr);
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable immediately if active, then dismisses the guard.
     *
     * Exceptions from the callable propagate. The guard is dismissed before
     * execution so the callable never runs twice.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard, decaying the callable type.
 *
 * The callable is stored by value. References it captures must stay valid
 * until the guard executes.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace treespec::basics
