#pragma once

#include <thread>

namespace treespec::engine
{

/**
 * @brief Remembers the thread that constructed the object.
 *
 * Message sinks use it to tell messages from the thread running the test
 * (safe to buffer) from messages sent by worker threads (forwarded at once).
 */
class ThreadAwareness
{
  public:
    ThreadAwareness() noexcept : constructing_thread_(std::this_thread::get_id()) {}

    bool is_constructing_thread() const noexcept
    {
        return std::this_thread::get_id() == constructing_thread_;
    }

  private:
    std::thread::id constructing_thread_;
};

} // namespace treespec::engine
