#pragma once
/**
 * @file errors.hpp
 * @brief Exception types raised by the engine and the control signals a test
 *        body may throw.
 *
 * Contract violations (registration after close, duplicate names, concurrent
 * modification, null arguments, unknown tests) derive from the standard logic
 * or runtime error classes so callers can catch them broadly.
 * `TestPendingException` and `TestCanceledException` are not failures: the
 * engine turns them into pending and canceled outcomes.
 */
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "engine/line_in_file.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

/**
 * @brief Base of the registration-time errors. Carries the location of the
 *        offending DSL call when it is known.
 */
class TREESPEC_EXPORT RegistrationError : public std::logic_error
{
  public:
    RegistrationError(const std::string &message, std::optional<LineInFile> location);

    const std::optional<LineInFile> &location() const noexcept { return location_; }

  private:
    std::optional<LineInFile> location_;
};

/// A test, branch or leaf was registered after the run began.
class TREESPEC_EXPORT RegistrationClosedError : public RegistrationError
{
  public:
    using RegistrationError::RegistrationError;
};

/// The computed full test name is already registered.
class TREESPEC_EXPORT DuplicateTestNameError : public RegistrationError
{
  public:
    DuplicateTestNameError(const std::string &test_name, std::optional<LineInFile> location);

    const std::string &test_name() const noexcept { return test_name_; }

  private:
    std::string test_name_;
};

/// A style's DSL was used in a way it does not allow (e.g. `it` before `behavior_of`).
class TREESPEC_EXPORT NotAllowedError : public RegistrationError
{
  public:
    using RegistrationError::RegistrationError;
};

/// Swap-and-verify found another writer between our read and our write.
class TREESPEC_EXPORT ConcurrentModificationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// A required run argument was missing (null reporter, empty stopper, null config map...).
class TREESPEC_EXPORT NullArgumentError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

/// `run_test_impl` was asked for a name that was never registered.
class TREESPEC_EXPORT UnknownTestError : public std::invalid_argument
{
  public:
    explicit UnknownTestError(const std::string &test_name);
};

/// Info or markup was sent after the suite finished running.
class TREESPEC_EXPORT InformerClosedError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

/**
 * @brief Thrown by a test body to report "not implemented yet".
 */
class TREESPEC_EXPORT TestPendingException : public std::exception
{
  public:
    const char *what() const noexcept override;
};

/**
 * @brief Thrown by a test body whose precondition could not be met.
 */
class TREESPEC_EXPORT TestCanceledException : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Marks a condition that must abort the whole run instead of failing one test.
 */
class TREESPEC_EXPORT AbortRunError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Ends the calling test as pending.
 */
[[noreturn]] TREESPEC_EXPORT void pending();

/**
 * @brief Ends the calling test as canceled with @p reason.
 */
[[noreturn]] TREESPEC_EXPORT void cancel(const std::string &reason);

/**
 * @brief True for the errors that must never be converted into a test outcome:
 *        `std::bad_alloc`, `std::bad_exception` and `AbortRunError`.
 */
TREESPEC_EXPORT bool is_abort_worthy(const std::exception_ptr &error) noexcept;

/**
 * @brief Best-effort description of a stored exception (`what()`, or
 *        "unknown exception" for non-standard payloads).
 */
TREESPEC_EXPORT std::string describe_exception(const std::exception_ptr &error);

} // namespace treespec::engine
