#include "engine/runner.hpp"

#include <chrono>

#include "engine/errors.hpp"
#include "engine/reporting.hpp"
#include "tsp_platform.hpp"
#include "utils/logger.hpp"

namespace treespec::engine
{

bool run_suite(Suite &suite, const RunArgs &args)
{
    args.require_non_null();
    const uint64_t start_ns = platform::monotonic_time_ns();
    auto elapsed = [start_ns]
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::nanoseconds(platform::elapsed_time_ns(start_ns)));
    };

    LOGGER_DEBUG("running suite '{}' ({} test(s) expected)", suite.suite_name(),
                 suite.expected_test_count(args.filter));
    reporting::report_suite_starting(args, suite.suite_name());
    try
    {
        suite.run(std::nullopt, args);
    }
    catch (const std::exception &e)
    {
        const std::exception_ptr error = std::current_exception();
        LOGGER_ERROR("suite '{}' aborted: {}", suite.suite_name(), e.what());
        reporting::report_suite_aborted(args, suite.suite_name(), error, elapsed());
        if (is_abort_worthy(error))
        {
            throw;
        }
        return false;
    }
    reporting::report_suite_completed(args, suite.suite_name(), elapsed());
    return true;
}

} // namespace treespec::engine
