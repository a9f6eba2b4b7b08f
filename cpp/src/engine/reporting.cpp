#include "engine/reporting.hpp"

#include "engine/errors.hpp"

namespace treespec::engine::reporting
{

namespace
{
Event make_event(const RunArgs &args, EventType type, const std::string &suite_name)
{
    Event event;
    event.type = type;
    event.ordinal = args.tracker->next_ordinal();
    event.suite_name = suite_name;
    return event;
}

Event make_test_event(const RunArgs &args, EventType type, const std::string &suite_name,
                      const std::string &test_name, const std::string &test_text,
                      const std::optional<LineInFile> &location)
{
    Event event = make_event(args, type, suite_name);
    event.test_name = test_name;
    event.text = test_text;
    event.location = location;
    return event;
}
} // namespace

void report_suite_starting(const RunArgs &args, const std::string &suite_name)
{
    Event event = make_event(args, EventType::SuiteStarting, suite_name);
    event.text = suite_name;
    args.reporter->apply(event);
}

void report_suite_completed(const RunArgs &args, const std::string &suite_name, Millis duration)
{
    Event event = make_event(args, EventType::SuiteCompleted, suite_name);
    event.text = suite_name;
    event.duration = duration;
    args.reporter->apply(event);
}

void report_suite_aborted(const RunArgs &args, const std::string &suite_name, std::exception_ptr error,
                          Millis duration)
{
    Event event = make_event(args, EventType::SuiteAborted, suite_name);
    event.text = suite_name;
    event.duration = duration;
    event.error_message = describe_exception(error);
    event.error = std::move(error);
    args.reporter->apply(event);
}

void report_scope_opened(const RunArgs &args, const std::string &suite_name, const std::string &text,
                         int level, const std::optional<LineInFile> &location)
{
    Event event = make_event(args, EventType::ScopeOpened, suite_name);
    event.text = text;
    event.formatter = indented_text_for_scope(text, level);
    event.location = location;
    args.reporter->apply(event);
}

void report_scope_closed(const RunArgs &args, const std::string &suite_name, const std::string &text,
                         int level, const std::optional<LineInFile> &location)
{
    Event event = make_event(args, EventType::ScopeClosed, suite_name);
    event.text = text;
    event.formatter = indented_text_for_scope(text, level);
    event.location = location;
    args.reporter->apply(event);
}

void report_test_starting(const RunArgs &args, const std::string &suite_name, const std::string &test_name,
                          const std::string &test_text, const std::optional<LineInFile> &location)
{
    args.reporter->apply(
        make_test_event(args, EventType::TestStarting, suite_name, test_name, test_text, location));
}

void report_test_succeeded(const RunArgs &args, const std::string &suite_name, const std::string &test_name,
                           const std::string &test_text, Millis duration, const IndentedText &formatter,
                           const std::optional<LineInFile> &location)
{
    Event event = make_test_event(args, EventType::TestSucceeded, suite_name, test_name, test_text, location);
    event.duration = duration;
    event.formatter = formatter;
    args.reporter->apply(event);
}

void report_test_failed(const RunArgs &args, const std::string &suite_name, std::exception_ptr error,
                        const std::string &test_name, const std::string &test_text, Millis duration,
                        const IndentedText &formatter, const std::optional<LineInFile> &location)
{
    Event event = make_test_event(args, EventType::TestFailed, suite_name, test_name, test_text, location);
    event.duration = duration;
    event.formatter = formatter;
    event.error_message = describe_exception(error);
    event.error = std::move(error);
    args.reporter->apply(event);
}

void report_test_pending(const RunArgs &args, const std::string &suite_name, const std::string &test_name,
                         const std::string &test_text, Millis duration, const IndentedText &formatter,
                         const std::optional<LineInFile> &location)
{
    Event event = make_test_event(args, EventType::TestPending, suite_name, test_name, test_text, location);
    event.duration = duration;
    event.formatter = formatter;
    args.reporter->apply(event);
}

void report_test_canceled(const RunArgs &args, const std::string &suite_name, std::exception_ptr error,
                          const std::string &test_name, const std::string &test_text, Millis duration,
                          const IndentedText &formatter, const std::optional<LineInFile> &location)
{
    Event event = make_test_event(args, EventType::TestCanceled, suite_name, test_name, test_text, location);
    event.duration = duration;
    event.formatter = formatter;
    event.error_message = describe_exception(error);
    event.error = std::move(error);
    args.reporter->apply(event);
}

void report_test_ignored(const RunArgs &args, const std::string &suite_name, const std::string &test_name,
                         const std::string &test_text, int level, const std::optional<LineInFile> &location)
{
    Event event = make_test_event(args, EventType::TestIgnored, suite_name, test_name, test_text, location);
    event.formatter = indented_text_for_test(test_text, level);
    args.reporter->apply(event);
}

void report_message_provided(const RunArgs &args, const std::string &suite_name, MessageKind kind,
                             const std::optional<std::string> &test_name, const std::string &message,
                             int level, const std::optional<LineInFile> &location,
                             bool from_constructing_thread, std::optional<bool> about_pending,
                             std::optional<bool> about_canceled)
{
    const auto type = kind == MessageKind::Info ? EventType::InfoProvided : EventType::MarkupProvided;
    Event event = make_event(args, type, suite_name);
    event.test_name = test_name;
    event.text = message;
    if (kind == MessageKind::Info)
    {
        event.formatter = indented_text_for_info(message, level);
    }
    event.location = location;
    event.from_constructing_thread = from_constructing_thread;
    event.about_pending = about_pending;
    event.about_canceled = about_canceled;
    args.reporter->apply(event);
}

} // namespace treespec::engine::reporting
