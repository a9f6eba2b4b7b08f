#pragma once
/**
 * @file reporting.hpp
 * @brief Builds events and hands them to the run's reporter, stamping each
 *        with the next ordinal from the run's tracker.
 */
#include <chrono>
#include <exception>
#include <optional>
#include <string>

#include "engine/collaborators.hpp"
#include "engine/events.hpp"
#include "engine/message_recorder.hpp"
#include "treespec_export.h"

namespace treespec::engine::reporting
{

using Millis = std::chrono::milliseconds;

TREESPEC_EXPORT void report_suite_starting(const RunArgs &args, const std::string &suite_name);
TREESPEC_EXPORT void report_suite_completed(const RunArgs &args, const std::string &suite_name, Millis duration);
TREESPEC_EXPORT void report_suite_aborted(const RunArgs &args, const std::string &suite_name,
                                          std::exception_ptr error, Millis duration);

TREESPEC_EXPORT void report_scope_opened(const RunArgs &args, const std::string &suite_name,
                                         const std::string &text, int level,
                                         const std::optional<LineInFile> &location);
TREESPEC_EXPORT void report_scope_closed(const RunArgs &args, const std::string &suite_name,
                                         const std::string &text, int level,
                                         const std::optional<LineInFile> &location);

TREESPEC_EXPORT void report_test_starting(const RunArgs &args, const std::string &suite_name,
                                          const std::string &test_name, const std::string &test_text,
                                          const std::optional<LineInFile> &location);
TREESPEC_EXPORT void report_test_succeeded(const RunArgs &args, const std::string &suite_name,
                                           const std::string &test_name, const std::string &test_text,
                                           Millis duration, const IndentedText &formatter,
                                           const std::optional<LineInFile> &location);
TREESPEC_EXPORT void report_test_failed(const RunArgs &args, const std::string &suite_name,
                                        std::exception_ptr error, const std::string &test_name,
                                        const std::string &test_text, Millis duration,
                                        const IndentedText &formatter,
                                        const std::optional<LineInFile> &location);
TREESPEC_EXPORT void report_test_pending(const RunArgs &args, const std::string &suite_name,
                                         const std::string &test_name, const std::string &test_text,
                                         Millis duration, const IndentedText &formatter,
                                         const std::optional<LineInFile> &location);
TREESPEC_EXPORT void report_test_canceled(const RunArgs &args, const std::string &suite_name,
                                          std::exception_ptr error, const std::string &test_name,
                                          const std::string &test_text, Millis duration,
                                          const IndentedText &formatter,
                                          const std::optional<LineInFile> &location);
TREESPEC_EXPORT void report_test_ignored(const RunArgs &args, const std::string &suite_name,
                                         const std::string &test_name, const std::string &test_text,
                                         int level, const std::optional<LineInFile> &location);

/**
 * @brief Reports an info (InfoProvided) or markup (MarkupProvided) message.
 *
 * @param test_name Set when the message belongs to a test.
 * @param about_pending,about_canceled The owning test's disposition, when known.
 */
TREESPEC_EXPORT void report_message_provided(const RunArgs &args, const std::string &suite_name,
                                             MessageKind kind, const std::optional<std::string> &test_name,
                                             const std::string &message, int level,
                                             const std::optional<LineInFile> &location,
                                             bool from_constructing_thread,
                                             std::optional<bool> about_pending = std::nullopt,
                                             std::optional<bool> about_canceled = std::nullopt);

} // namespace treespec::engine::reporting
