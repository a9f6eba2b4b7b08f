#pragma once

/*******************************************************************************
 * @file recursion_guard.hpp
 * @brief A thread-local, RAII-based guard to detect re-entrant calls.
 *
 * Uses a fixed-capacity, thread-local buffer. No heap allocation. If the
 * nesting depth exceeds the limit, the constructor panics (TSP_PANIC).
 ******************************************************************************/
#include "utils/debug_info.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace treespec::basics
{

#ifndef TREESPEC_RECURSION_GUARD_MAX_DEPTH
#define TREESPEC_RECURSION_GUARD_MAX_DEPTH 64
#endif

/** Maximum guarded depth per thread. */
constexpr size_t kMaxRecursionDepth = TREESPEC_RECURSION_GUARD_MAX_DEPTH;

struct RecursionStack
{
    std::array<const void *, kMaxRecursionDepth> keys{};
    size_t size = 0;
};

inline RecursionStack &get_recursion_stack() noexcept
{
    static thread_local RecursionStack g_recursion_stack;
    return g_recursion_stack;
}

[[noreturn]] inline void recursion_guard_panic() noexcept
{
    TSP_PANIC("RecursionGuard: max recursion depth ({}) exceeded.", kMaxRecursionDepth);
}

/**
 * @class RecursionGuard
 * @brief Marks a key (usually an object address) as "active" on the calling
 *        thread for the lifetime of the guard.
 *
 * The logger holds a guard keyed by its implementation while it runs the
 * write-error callback; `is_recursing(this)` then tells it that the callback
 * itself hit a failing write.
 *
 * @warning The key must stay valid for the lifetime of the guard.
 */
class RecursionGuard
{
  public:
    /**
     * @brief Pushes @p key onto the thread-local stack. A null key makes the guard inert.
     */
    explicit RecursionGuard(const void *key) noexcept : key_(key)
    {
        if (key_)
        {
            auto &st = get_recursion_stack();
            if (st.size >= kMaxRecursionDepth)
                recursion_guard_panic();
            st.keys[st.size++] = key_;
        }
    }

    /**
     * @brief Removes the key. Handles non-LIFO destruction by removing the
     *        most recent occurrence.
     */
    ~RecursionGuard() noexcept
    {
        if (key_ == nullptr)
        {
            return;
        }

        auto &st = get_recursion_stack();
        if (st.size > 0 && st.keys[st.size - 1] == key_)
        {
            --st.size;
        }
        else if (st.size > 0)
        {
            auto *beg = st.keys.data();
            auto *end = beg + st.size;
            auto rit = std::find(std::make_reverse_iterator(end), std::make_reverse_iterator(beg), key_);
            if (rit != std::make_reverse_iterator(beg))
            {
                auto *it = std::prev(rit.base());
                std::move(it + 1, end, it);
                --st.size;
            }
        }
    }

    RecursionGuard(const RecursionGuard &) = delete;
    RecursionGuard &operator=(const RecursionGuard &) = delete;
    RecursionGuard &operator=(RecursionGuard &&) = delete;

    RecursionGuard(RecursionGuard &&other) noexcept : key_(other.key_) { other.key_ = nullptr; }

    /**
     * @brief Checks if @p key is currently guarded on this thread.
     */
    [[nodiscard]] static bool is_recursing(const void *key) noexcept
    {
        if (key == nullptr)
            return false;
        const auto &st = get_recursion_stack();
        const auto *beg = st.keys.data();
        return std::find(beg, beg + st.size, key) != beg + st.size;
    }

    /**
     * @brief Number of guards currently alive on this thread.
     */
    [[nodiscard]] static size_t depth() noexcept { return get_recursion_stack().size; }

  private:
    const void *key_;
};

} // namespace treespec::basics
