#pragma once
/**
 * @file events.hpp
 * @brief The ordered events the engine hands to a Reporter.
 */
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

#include "engine/line_in_file.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

/**
 * @brief Position of an event in a run: a run stamp plus a sequence number
 *        that increases by one per event handed out by a Tracker.
 */
struct Ordinal
{
    int64_t run_stamp{0};
    int64_t sequence{0};

    auto operator<=>(const Ordinal &) const = default;
};

enum class EventType : int
{
    SuiteStarting,
    SuiteCompleted,
    SuiteAborted,
    ScopeOpened,
    ScopeClosed,
    TestStarting,
    TestSucceeded,
    TestFailed,
    TestPending,
    TestCanceled,
    TestIgnored,
    InfoProvided,
    MarkupProvided,
};

TREESPEC_EXPORT const char *to_string(EventType type) noexcept;

/**
 * @brief Rendering hint: text already indented for a tree-shaped report.
 */
struct IndentedText
{
    std::string formatted_text;
    std::string raw_text;
    int indentation_level{0};
};

/// Tests are rendered as "- text", scopes as plain text, info as "+ text".
TREESPEC_EXPORT IndentedText indented_text_for_test(const std::string &text, int level);
TREESPEC_EXPORT IndentedText indented_text_for_scope(const std::string &text, int level);
TREESPEC_EXPORT IndentedText indented_text_for_info(const std::string &text, int level);

struct Event
{
    EventType type{EventType::InfoProvided};
    Ordinal ordinal;
    std::string suite_name;
    std::optional<std::string> test_name;
    /// Test text as displayed (child prefix applied), scope description, or info/markup message.
    std::string text;
    std::optional<IndentedText> formatter;
    std::optional<LineInFile> location;
    std::optional<std::chrono::milliseconds> duration;
    /// Set on TestFailed, TestCanceled and SuiteAborted.
    std::exception_ptr error;
    std::string error_message;
    /// Disposition of the test an info/markup event belongs to, when it belongs to one.
    std::optional<bool> about_pending;
    std::optional<bool> about_canceled;
    bool from_constructing_thread{true};
};

} // namespace treespec::engine
