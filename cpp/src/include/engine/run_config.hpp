#pragma once
/**
 * @file run_config.hpp
 * @brief JSON run configuration: which tests to run, how to log, and the
 *        config map handed to tests.
 *
 * Format (every key optional):
 * @code{.json}
 * {
 *   "run": {
 *     "tags_to_include": ["fast"],
 *     "tags_to_exclude": ["slow"],
 *     "test_names": ["A stack should pop"],
 *     "stop_on_failure": false
 *   },
 *   "log": { "level": "info", "file": "/tmp/treespec.log" },
 *   "config_map": { "any": "value" }
 * }
 * @endcode
 */
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/collaborators.hpp"
#include "engine/filter.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

struct TREESPEC_EXPORT RunConfig
{
    std::optional<std::set<std::string>> tags_to_include;
    std::set<std::string> tags_to_exclude;
    std::optional<std::set<std::string>> test_names;
    bool stop_on_failure{false};

    std::optional<std::string> log_level; ///< trace, debug, info, warning, error, system
    std::optional<std::string> log_file;

    ConfigMap config_map = ConfigMap::object();

    /**
     * @brief Parses an already-loaded document.
     * @throws std::runtime_error on a malformed or mistyped field.
     */
    static RunConfig from_json(const nlohmann::json &j);

    /**
     * @brief Reads and parses @p path.
     * @throws std::runtime_error naming @p path when the file cannot be read
     *         or its content is invalid.
     */
    static RunConfig from_json_file(const std::string &path);

    /// Filter for these settings; the ignore tag is always excluded.
    Filter make_filter() const;

    /// Applies `log.level` and `log.file` to the process-wide Logger.
    void apply_logging() const;
};

} // namespace treespec::engine
