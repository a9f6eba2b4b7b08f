#pragma once

#include <exception>
#include <string_view>
#include <utility>

#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace treespec::engine
{

/**
 * @brief A ScopeGuard whose cleanup runs on both exit paths with different
 *        error policies.
 *
 * Normal path: the caller invokes `guard.invoke_and_rethrow()` and a failing
 * cleanup propagates. Unwinding path (the guarded body threw): the guard's
 * destructor runs the cleanup; a cleanup failure is logged and dropped so the
 * body's exception is the one the caller sees.
 *
 * @param what Short description used in the log line; must outlive the guard.
 */
template <typename F> auto make_cleanup_guard(F &&cleanup, std::string_view what)
{
    const int exceptions_at_entry = std::uncaught_exceptions();
    return basics::make_scope_guard(
        [cleanup = std::forward<F>(cleanup), what, exceptions_at_entry]() mutable
        {
            if (std::uncaught_exceptions() <= exceptions_at_entry)
            {
                cleanup();
                return;
            }
            try
            {
                cleanup();
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("{} failed while another exception was propagating; suppressed: {}", what,
                             e.what());
            }
        });
}

} // namespace treespec::engine
