// atomic_slot.hpp
#pragma once
// Header only: a shared_ptr cell with exchange and compare-exchange.

#include <memory>
#include <mutex>
#include <utility>

namespace treespec::utils
{

/**
 * @class AtomicSlot
 * @brief A cell holding a `std::shared_ptr<T>` that is only ever replaced wholesale.
 *
 * Readers take a snapshot with `load()`. Writers either `exchange()` and get the
 * previous occupant back, or `compare_exchange()` against the snapshot they
 * started from. Both let the caller detect an intervening writer by pointer
 * identity; what to do about it (the engine throws) is the caller's decision.
 *
 * The critical section is a pointer copy, so a plain mutex is used in place of
 * `std::atomic<std::shared_ptr<T>>`, which not every supported standard
 * library implements.
 *
 * @tparam T The pointee type. The slot never dereferences it.
 */
template <typename T> class AtomicSlot
{
  public:
    explicit AtomicSlot(std::shared_ptr<T> initial = nullptr) : value_(std::move(initial)) {}

    AtomicSlot(const AtomicSlot &) = delete;
    AtomicSlot &operator=(const AtomicSlot &) = delete;

    /** @brief Returns the current occupant. */
    [[nodiscard]] std::shared_ptr<T> load() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    /**
     * @brief Stores @p next and returns what the slot held before.
     */
    std::shared_ptr<T> exchange(std::shared_ptr<T> next)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::exchange(value_, std::move(next));
    }

    /**
     * @brief Stores @p next only if the slot still holds @p expected.
     * @return `true` on success; `false` leaves the slot untouched.
     */
    [[nodiscard]] bool compare_exchange(const std::shared_ptr<T> &expected, std::shared_ptr<T> next)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value_ != expected)
        {
            return false;
        }
        value_ = std::move(next);
        return true;
    }

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<T> value_;
};

} // namespace treespec::utils
