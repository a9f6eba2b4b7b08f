#include "engine/message_recorder.hpp"

#include <stdexcept>

namespace treespec::engine
{

MessageRecorder::MessageRecorder(FireFn fire) : fire_(std::move(fire)) {}

void MessageRecorder::record(RecordedMessage message)
{
    if (!is_constructing_thread())
        throw std::logic_error("MessageRecorder::record called from a thread other than its owner");
    if (flushed_)
        throw std::logic_error("MessageRecorder::record called after the messages were fired");
    message.from_constructing_thread = true;
    recorded_.push_back(std::move(message));
}

void MessageRecorder::apply(RecordedMessage message)
{
    if (!is_constructing_thread())
    {
        message.from_constructing_thread = false;
        fire_(message, false, false, false);
        return;
    }
    if (flushed_)
    {
        message.from_constructing_thread = true;
        fire_(message, true, was_pending_, was_canceled_);
        return;
    }
    record(std::move(message));
}

void MessageRecorder::fire_recorded_messages(bool was_pending, bool was_canceled)
{
    if (flushed_)
        throw std::logic_error("MessageRecorder::fire_recorded_messages called twice");
    flushed_ = true;
    was_pending_ = was_pending;
    was_canceled_ = was_canceled;
    auto messages = std::move(recorded_);
    recorded_.clear();
    for (const auto &message : messages)
    {
        fire_(message, true, was_pending, was_canceled);
    }
}

} // namespace treespec::engine
