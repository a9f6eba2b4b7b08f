#pragma once

#include "engine/collaborators.hpp"
#include "engine/suite.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

/**
 * @brief Runs a whole suite between SuiteStarting and SuiteCompleted events.
 *
 * An exception escaping the suite is reported as SuiteAborted. Abort-worthy
 * errors are then rethrown; anything else is swallowed after reporting and
 * the call returns false.
 *
 * @return true when the suite completed.
 */
TREESPEC_EXPORT bool run_suite(Suite &suite, const RunArgs &args);

} // namespace treespec::engine
