/**
 * @file run_config.cpp
 * @brief RunConfig JSON parsing.
 */
#include "engine/run_config.hpp"

#include <fstream>
#include <stdexcept>

#include "utils/logger.hpp"

namespace treespec::engine
{

namespace
{

std::set<std::string> parse_string_set(const nlohmann::json &j, const std::string &key)
{
    if (!j.is_array())
    {
        throw std::runtime_error("Run config: '" + key + "' must be an array of strings");
    }
    std::set<std::string> out;
    for (const auto &item : j)
    {
        if (!item.is_string())
        {
            throw std::runtime_error("Run config: '" + key + "' must be an array of strings");
        }
        out.insert(item.get<std::string>());
    }
    return out;
}

void parse_run_section(const nlohmann::json &r, RunConfig &cfg)
{
    if (!r.is_object())
    {
        throw std::runtime_error("Run config: 'run' must be an object");
    }
    if (r.contains("tags_to_include"))
    {
        cfg.tags_to_include = parse_string_set(r["tags_to_include"], "run.tags_to_include");
    }
    if (r.contains("tags_to_exclude"))
    {
        cfg.tags_to_exclude = parse_string_set(r["tags_to_exclude"], "run.tags_to_exclude");
    }
    if (r.contains("test_names"))
    {
        cfg.test_names = parse_string_set(r["test_names"], "run.test_names");
    }
    if (r.contains("stop_on_failure"))
    {
        if (!r["stop_on_failure"].is_boolean())
        {
            throw std::runtime_error("Run config: 'run.stop_on_failure' must be a boolean");
        }
        cfg.stop_on_failure = r["stop_on_failure"].get<bool>();
    }
}

void parse_log_section(const nlohmann::json &l, RunConfig &cfg)
{
    if (!l.is_object())
    {
        throw std::runtime_error("Run config: 'log' must be an object");
    }
    if (l.contains("level"))
    {
        if (!l["level"].is_string())
        {
            throw std::runtime_error("Run config: 'log.level' must be a string");
        }
        const std::string level = l["level"].get<std::string>();
        if (!utils::Logger::level_from_string(level))
        {
            throw std::runtime_error("Run config: invalid 'log.level' = '" + level +
                                     "' (must be trace, debug, info, warning, error or system)");
        }
        cfg.log_level = level;
    }
    if (l.contains("file"))
    {
        if (!l["file"].is_string())
        {
            throw std::runtime_error("Run config: 'log.file' must be a string");
        }
        cfg.log_file = l["file"].get<std::string>();
    }
}

} // namespace

RunConfig RunConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Run config: top level must be an object");
    }

    RunConfig cfg;
    if (j.contains("run"))
    {
        parse_run_section(j["run"], cfg);
    }
    if (j.contains("log"))
    {
        parse_log_section(j["log"], cfg);
    }
    if (j.contains("config_map"))
    {
        if (!j["config_map"].is_object())
        {
            throw std::runtime_error("Run config: 'config_map' must be an object");
        }
        cfg.config_map = j["config_map"];
    }
    return cfg;
}

RunConfig RunConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::runtime_error("Run config: cannot open file: " + path);
    }

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Run config: JSON parse error in '" + path + "': " + e.what());
    }

    try
    {
        return from_json(j);
    }
    catch (const std::runtime_error &e)
    {
        throw std::runtime_error(std::string(e.what()) + " (in '" + path + "')");
    }
}

Filter RunConfig::make_filter() const
{
    std::set<std::string> exclude = tags_to_exclude;
    exclude.insert(std::string(kIgnoreTagName));
    return Filter(tags_to_include, std::move(exclude), test_names);
}

void RunConfig::apply_logging() const
{
    auto &logger = utils::Logger::instance();
    if (log_file)
    {
        logger.set_logfile(*log_file);
    }
    if (log_level)
    {
        if (auto level = utils::Logger::level_from_string(*log_level))
        {
            logger.set_level(*level);
        }
    }
}

} // namespace treespec::engine
