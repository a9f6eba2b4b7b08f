#include "engine/informers.hpp"

#include "engine/errors.hpp"

#include <utility>

namespace treespec::engine
{

void FunctionSink::apply(const std::string &message, const std::optional<LineInFile> &location)
{
    fn_(message, location);
}

void ConcurrentSink::apply(const std::string &message, const std::optional<LineInFile> &location)
{
    fn_(message, location, is_constructing_thread());
}

void RecordingSink::apply(const std::string &message, const std::optional<LineInFile> &location)
{
    recorder_->apply(RecordedMessage{kind_, message, location, true});
}

void ZombieSink::apply(const std::string &, const std::optional<LineInFile> &)
{
    throw InformerClosedError(complaint_);
}

void PathMessageBuffer::record(MessageKind kind, const std::string &message,
                               const std::optional<LineInFile> &location)
{
    const bool constructing = is_constructing_thread();
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(RecordedMessage{kind, message, location, constructing});
}

std::vector<RecordedMessage> PathMessageBuffer::take()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(messages_, {});
}

void PathRecordingSink::apply(const std::string &message, const std::optional<LineInFile> &location)
{
    buffer_->record(kind_, message, location);
}

} // namespace treespec::engine
