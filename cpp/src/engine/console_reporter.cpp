#include "engine/console_reporter.hpp"

#include <fmt/format.h>

namespace treespec::engine
{

namespace
{
std::string formatted_or_text(const Event &event)
{
    return event.formatter ? event.formatter->formatted_text : event.text;
}

std::string indentation_of(const Event &event)
{
    return std::string(event.formatter ? static_cast<size_t>(event.formatter->indentation_level) * 2 : 0, ' ');
}
} // namespace

void ConsoleReporter::print_line(const std::string &line)
{
    fmt::print(out_, "{}\n", line);
}

void ConsoleReporter::apply(const Event &event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    switch (event.type)
    {
    case EventType::SuiteStarting:
        print_line(fmt::format("{}:", event.suite_name));
        break;
    case EventType::SuiteCompleted:
        print_line(fmt::format("{} completed in {} ms", event.suite_name,
                               event.duration ? event.duration->count() : 0));
        break;
    case EventType::SuiteAborted:
        ++counts_.suites_aborted;
        print_line(fmt::format("*** {} ABORTED ***: {}", event.suite_name, event.error_message));
        break;
    case EventType::ScopeOpened:
        print_line(formatted_or_text(event));
        break;
    case EventType::ScopeClosed:
    case EventType::TestStarting:
        break;
    case EventType::TestSucceeded:
        ++counts_.succeeded;
        print_line(formatted_or_text(event));
        break;
    case EventType::TestFailed:
        ++counts_.failed;
        print_line(fmt::format("{} *** FAILED ***", formatted_or_text(event)));
        print_line(fmt::format("{}  {}{}", indentation_of(event), event.error_message,
                               event.location ? fmt::format(" ({})", event.location->to_string()) : ""));
        break;
    case EventType::TestPending:
        ++counts_.pending;
        print_line(fmt::format("{} (pending)", formatted_or_text(event)));
        break;
    case EventType::TestCanceled:
        ++counts_.canceled;
        print_line(fmt::format("{} !!! CANCELED !!!", formatted_or_text(event)));
        print_line(fmt::format("{}  {}", indentation_of(event), event.error_message));
        break;
    case EventType::TestIgnored:
        ++counts_.ignored;
        print_line(fmt::format("{} !!! IGNORED !!!", formatted_or_text(event)));
        break;
    case EventType::InfoProvided:
    case EventType::MarkupProvided:
        print_line(formatted_or_text(event));
        break;
    }
    std::fflush(out_);
}

ConsoleReporter::Counts ConsoleReporter::counts() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

std::string ConsoleReporter::summary() const
{
    const Counts c = counts();
    return fmt::format("Tests: succeeded {}, failed {}, canceled {}, ignored {}, pending {}", c.succeeded,
                       c.failed, c.canceled, c.ignored, c.pending);
}

} // namespace treespec::engine
