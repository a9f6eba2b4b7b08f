#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace treespec::utils
{

FileSink::FileSink(const std::string &path) : path_(path)
{
    file_ = std::fopen(path.c_str(), "a");
    if (file_ == nullptr)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (file_ != nullptr)
    {
        std::fclose(file_);
    }
}

void FileSink::write(const LogMessage &msg)
{
    const auto line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), file_) != line.size())
    {
        throw std::runtime_error(fmt::format("Short write to log file '{}'", path_.string()));
    }
}

void FileSink::flush()
{
    std::fflush(file_);
}

std::string FileSink::description() const
{
    return "File: " + path_.string();
}

} // namespace treespec::utils
