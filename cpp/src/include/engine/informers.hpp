#pragma once
/**
 * @file informers.hpp
 * @brief The sinks that info and markup messages go through.
 *
 * An engine keeps one informer slot and one documenter slot. Over the life
 * of a suite each slot holds, in turn:
 *  - a FunctionSink that registers InfoLeaf / MarkupLeaf nodes (construction),
 *  - a ConcurrentSink that reports straight to the run's reporter (during run),
 *  - a RecordingSink backed by a MessageRecorder (while a test runs),
 *  - a ZombieSink that throws InformerClosedError (after run).
 * The path engine adds PathRecordingSink for tests run during construction.
 */
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine/line_in_file.hpp"
#include "engine/message_recorder.hpp"
#include "engine/thread_awareness.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

class TREESPEC_EXPORT MessageSink
{
  public:
    virtual ~MessageSink() = default;
    virtual void apply(const std::string &message, const std::optional<LineInFile> &location) = 0;
};

using Informer = MessageSink;
using Documenter = MessageSink;

/**
 * @brief Forwards to a callable. Used for the registration-phase sinks.
 */
class TREESPEC_EXPORT FunctionSink : public MessageSink
{
  public:
    using Fn = std::function<void(const std::string &, const std::optional<LineInFile> &)>;

    explicit FunctionSink(Fn fn) : fn_(std::move(fn)) {}
    void apply(const std::string &message, const std::optional<LineInFile> &location) override;

  private:
    Fn fn_;
};

/**
 * @brief Suite-level sink installed for the duration of `run`; reports
 *        immediately and tells whether the caller is the constructing thread.
 */
class TREESPEC_EXPORT ConcurrentSink : public MessageSink, public ThreadAwareness
{
  public:
    using Fn = std::function<void(const std::string &, const std::optional<LineInFile> &, bool)>;

    explicit ConcurrentSink(Fn fn) : fn_(std::move(fn)) {}
    void apply(const std::string &message, const std::optional<LineInFile> &location) override;

  private:
    Fn fn_;
};

/**
 * @brief Per-test sink feeding a MessageRecorder shared by the informer and
 *        documenter of that test, so info and markup keep their relative order.
 */
class TREESPEC_EXPORT RecordingSink : public MessageSink
{
  public:
    RecordingSink(MessageKind kind, std::shared_ptr<MessageRecorder> recorder)
        : kind_(kind), recorder_(std::move(recorder))
    {
    }
    void apply(const std::string &message, const std::optional<LineInFile> &location) override;

  private:
    MessageKind kind_;
    std::shared_ptr<MessageRecorder> recorder_;
};

/**
 * @brief Terminal sink: every call throws InformerClosedError.
 */
class TREESPEC_EXPORT ZombieSink : public MessageSink
{
  public:
    explicit ZombieSink(std::string complaint) : complaint_(std::move(complaint)) {}
    [[noreturn]] void apply(const std::string &message, const std::optional<LineInFile> &location) override;

  private:
    std::string complaint_;
};

/**
 * @brief Thread-safe buffer of the messages a path test sent while it ran at
 *        construction time, from any thread. Replayed when the registered
 *        leaf is run.
 */
class TREESPEC_EXPORT PathMessageBuffer : public ThreadAwareness
{
  public:
    void record(MessageKind kind, const std::string &message, const std::optional<LineInFile> &location);

    /// Moves the recorded messages out, leaving the buffer empty.
    std::vector<RecordedMessage> take();

  private:
    std::mutex mutex_;
    std::vector<RecordedMessage> messages_;
};

class TREESPEC_EXPORT PathRecordingSink : public MessageSink
{
  public:
    PathRecordingSink(MessageKind kind, std::shared_ptr<PathMessageBuffer> buffer)
        : kind_(kind), buffer_(std::move(buffer))
    {
    }
    void apply(const std::string &message, const std::optional<LineInFile> &location) override;

  private:
    MessageKind kind_;
    std::shared_ptr<PathMessageBuffer> buffer_;
};

} // namespace treespec::engine
