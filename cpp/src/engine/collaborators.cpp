#include "engine/collaborators.hpp"

#include "engine/errors.hpp"

namespace treespec::engine
{

void RunArgs::require_non_null() const
{
    if (!reporter)
        throw NullArgumentError("reporter was null");
    if (!stopper)
        throw NullArgumentError("stopper was null");
    if (config_map.is_null())
        throw NullArgumentError("config_map was null");
    if (!tracker)
        throw NullArgumentError("tracker was null");
}

RunArgs RunArgs::with_reporter(std::shared_ptr<Reporter> reporter)
{
    RunArgs args;
    args.reporter = std::move(reporter);
    return args;
}

} // namespace treespec::engine
