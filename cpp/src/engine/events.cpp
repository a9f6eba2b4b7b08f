#include "engine/events.hpp"

#include <fmt/format.h>

namespace treespec::engine
{

const char *to_string(EventType type) noexcept
{
    switch (type)
    {
    case EventType::SuiteStarting:
        return "SuiteStarting";
    case EventType::SuiteCompleted:
        return "SuiteCompleted";
    case EventType::SuiteAborted:
        return "SuiteAborted";
    case EventType::ScopeOpened:
        return "ScopeOpened";
    case EventType::ScopeClosed:
        return "ScopeClosed";
    case EventType::TestStarting:
        return "TestStarting";
    case EventType::TestSucceeded:
        return "TestSucceeded";
    case EventType::TestFailed:
        return "TestFailed";
    case EventType::TestPending:
        return "TestPending";
    case EventType::TestCanceled:
        return "TestCanceled";
    case EventType::TestIgnored:
        return "TestIgnored";
    case EventType::InfoProvided:
        return "InfoProvided";
    case EventType::MarkupProvided:
        return "MarkupProvided";
    default:
        return "Unknown";
    }
}

namespace
{
std::string indentation(int level)
{
    return std::string(static_cast<size_t>(level > 0 ? level : 0) * 2, ' ');
}
} // namespace

IndentedText indented_text_for_test(const std::string &text, int level)
{
    return IndentedText{fmt::format("{}- {}", indentation(level), text), text, level};
}

IndentedText indented_text_for_scope(const std::string &text, int level)
{
    return IndentedText{indentation(level) + text, text, level};
}

IndentedText indented_text_for_info(const std::string &text, int level)
{
    return IndentedText{fmt::format("{}+ {}", indentation(level), text), text, level};
}

} // namespace treespec::engine
