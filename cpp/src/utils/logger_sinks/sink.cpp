#include "tsp_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <array>

namespace treespec::utils
{

namespace
{
// Indexed by Logger::Level; kept here so sinks do not depend on logger.hpp.
constexpr std::array<const char *, 6> kLevelNames{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "SYSTEM"};
} // namespace

const char *Sink::level_to_string_internal(int lvl)
{
    if (lvl < 0 || static_cast<size_t>(lvl) >= kLevelNames.size())
    {
        return "UNK";
    }
    return kLevelNames[static_cast<size_t>(lvl)];
}

std::string Sink::format_logmsg(const LogMessage &msg)
{
    return fmt::format("[TSP] [{:<6}] [{}] [TID:{}] {}\n", level_to_string_internal(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace treespec::utils
