#include "engine/errors.hpp"

#include <new>

#include <fmt/format.h>

namespace treespec::engine
{

namespace
{
std::string with_location(const std::string &message, const std::optional<LineInFile> &location)
{
    if (!location)
        return message;
    return fmt::format("{} ({})", message, location->to_string());
}
} // namespace

RegistrationError::RegistrationError(const std::string &message, std::optional<LineInFile> location)
    : std::logic_error(with_location(message, location)), location_(std::move(location))
{
}

DuplicateTestNameError::DuplicateTestNameError(const std::string &test_name,
                                               std::optional<LineInFile> location)
    : RegistrationError(fmt::format("Duplicate test name: \"{}\"", test_name), std::move(location)),
      test_name_(test_name)
{
}

UnknownTestError::UnknownTestError(const std::string &test_name)
    : std::invalid_argument(fmt::format("No test in this suite has name: \"{}\"", test_name))
{
}

const char *TestPendingException::what() const noexcept
{
    return "Test is pending";
}

void pending()
{
    throw TestPendingException();
}

void cancel(const std::string &reason)
{
    throw TestCanceledException(reason);
}

bool is_abort_worthy(const std::exception_ptr &error) noexcept
{
    if (!error)
        return false;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::bad_alloc &)
    {
        return true;
    }
    catch (const std::bad_exception &)
    {
        return true;
    }
    catch (const AbortRunError &)
    {
        return true;
    }
    catch (...)
    {
        return false;
    }
}

std::string describe_exception(const std::exception_ptr &error)
{
    if (!error)
        return {};
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown exception";
    }
}

} // namespace treespec::engine
