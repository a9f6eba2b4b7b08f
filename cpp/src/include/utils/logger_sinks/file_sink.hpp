#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace treespec::utils
{

/**
 * @brief Appends formatted log lines to a file.
 *
 * The file is opened in append mode on construction; failure to open throws
 * `std::runtime_error` naming the path.
 */
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

    const std::filesystem::path &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
    std::FILE *file_{nullptr};
};

} // namespace treespec::utils
