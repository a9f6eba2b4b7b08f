/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous, thread-safe logger.
 *
 * @see include/utils/logger.hpp
 *
 * The active sink is a `std::unique_ptr<Sink>` guarded by `sink_mutex`. Sink
 * switches build the new sink on the calling thread first, so a file that
 * cannot be opened leaves the previous sink in place. Write failures are
 * collected under the lock and reported to the error callback after it is
 * released, so a callback that logs again cannot deadlock; a failure raised
 * from inside the callback is printed to stderr instead of re-entering it.
 ******************************************************************************/

#include "tsp_service.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"

namespace treespec::utils
{

struct LoggerImpl
{
    mutable std::mutex sink_mutex;
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::atomic<int> level{static_cast<int>(Logger::Level::L_INFO)};

    std::mutex callback_mutex;
    std::function<void(const std::string &)> write_error_callback;

    // A callback that logs while the sink is still failing lands here again on
    // the same thread; that nested failure goes to stderr only.
    void report_write_error(const std::string &what) noexcept
    {
        if (basics::RecursionGuard::is_recursing(this))
        {
            fmt::print(stderr, "[TSP] logger write failed inside error callback: {}\n", what);
            return;
        }
        basics::RecursionGuard in_report(this);

        std::function<void(const std::string &)> cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = write_error_callback;
        }
        try
        {
            if (cb)
            {
                cb(what);
                return;
            }
            fmt::print(stderr, "[TSP] logger write failed: {}\n", what);
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[TSP] logger error callback failed: %s\n", e.what());
        }
    }

    // Swaps in a new sink, flushing the old one first.
    void replace_sink(std::unique_ptr<Sink> next)
    {
        std::unique_ptr<Sink> previous;
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            if (sink)
            {
                sink->flush();
            }
            previous = std::exchange(sink, std::move(next));
        }
    }
};

Logger &Logger::instance()
{
    static Logger g_instance;
    return g_instance;
}

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger()
{
    std::lock_guard<std::mutex> lock(pImpl->sink_mutex);
    if (pImpl->sink)
    {
        try
        {
            pImpl->sink->flush();
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[TSP] logger flush at exit failed: %s\n", e.what());
        }
    }
}

void Logger::set_console()
{
    pImpl->replace_sink(std::make_unique<ConsoleSink>());
}

void Logger::set_logfile(const std::string &utf8_path)
{
    // Construct first: an unopenable path throws here and the current sink survives.
    auto next = std::make_unique<FileSink>(utf8_path);
    pImpl->replace_sink(std::move(next));
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(pImpl->sink_mutex);
    if (pImpl->sink)
    {
        pImpl->sink->flush();
    }
}

std::string Logger::sink_description() const
{
    std::lock_guard<std::mutex> lock(pImpl->sink_mutex);
    return pImpl->sink ? pImpl->sink->description() : std::string("None");
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return static_cast<Level>(pImpl->level.load(std::memory_order_relaxed));
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warning" || lower == "warn")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> lock(pImpl->callback_mutex);
    pImpl->write_error_callback = std::move(cb);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= pImpl->level.load(std::memory_order_relaxed);
}

void Logger::write_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    LogMessage msg{std::chrono::system_clock::now(), platform::get_pid(),
                   platform::get_native_thread_id(), static_cast<int>(lvl), std::move(body)};
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(pImpl->sink_mutex);
        try
        {
            pImpl->sink->write(msg);
        }
        catch (const std::exception &e)
        {
            failure = fmt::format("{}: {}", pImpl->sink->description(), e.what());
        }
    }
    if (!failure.empty())
    {
        pImpl->report_write_error(failure);
    }
}

} // namespace treespec::utils
