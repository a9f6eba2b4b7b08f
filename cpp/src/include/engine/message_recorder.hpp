#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "engine/line_in_file.hpp"
#include "engine/thread_awareness.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

enum class MessageKind
{
    Info,
    Markup,
};

/**
 * @brief An info or markup message captured while a test was running.
 */
struct RecordedMessage
{
    MessageKind kind{MessageKind::Info};
    std::string message;
    std::optional<LineInFile> location;
    bool from_constructing_thread{true};
};

/**
 * @class MessageRecorder
 * @brief Holds back the info and markup a test sends until the test's
 *        outcome is known, then fires them in order.
 *
 * States: recording, then flushed. While recording, messages from the
 * constructing thread are buffered; messages from other threads are fired
 * immediately as "not pending, not canceled" since no single owner could
 * flush them later. `fire_recorded_messages` flushes once, tagging every
 * message with the final disposition. After that, messages from the
 * constructing thread fire immediately with the same disposition.
 *
 * The buffer is touched by the constructing thread only and is not locked.
 */
class TREESPEC_EXPORT MessageRecorder : public ThreadAwareness
{
  public:
    /// Delivers one message: (message, is_constructing_thread, was_pending, was_canceled).
    using FireFn = std::function<void(const RecordedMessage &, bool, bool, bool)>;

    explicit MessageRecorder(FireFn fire);

    /**
     * @brief Appends to the buffer.
     * @throws std::logic_error when called from another thread or after flushing.
     */
    void record(RecordedMessage message);

    /**
     * @brief Records on the constructing thread, fires immediately otherwise.
     */
    void apply(RecordedMessage message);

    /**
     * @brief Fires every buffered message in order with the given disposition.
     * @throws std::logic_error if called a second time.
     */
    void fire_recorded_messages(bool was_pending, bool was_canceled);

    bool flushed() const noexcept { return flushed_; }
    size_t recorded_count() const noexcept { return recorded_.size(); }

  private:
    FireFn fire_;
    std::vector<RecordedMessage> recorded_;
    bool flushed_{false};
    bool was_pending_{false};
    bool was_canceled_{false};
};

} // namespace treespec::engine
