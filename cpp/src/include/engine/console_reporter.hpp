#pragma once

#include <cstdio>
#include <mutex>
#include <string>

#include "engine/collaborators.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

/**
 * @class ConsoleReporter
 * @brief Prints a run as an indented tree and keeps per-outcome counts.
 *
 * Output goes to a caller-supplied stream (stdout by default); the stream is
 * not owned. Calls from several threads are serialized.
 */
class TREESPEC_EXPORT ConsoleReporter : public Reporter
{
  public:
    struct Counts
    {
        int succeeded{0};
        int failed{0};
        int pending{0};
        int canceled{0};
        int ignored{0};
        int suites_aborted{0};
    };

    explicit ConsoleReporter(std::FILE *out = stdout) noexcept : out_(out) {}

    void apply(const Event &event) override;

    Counts counts() const;

    /// "Tests: succeeded 3, failed 1, canceled 0, ignored 1, pending 0"
    std::string summary() const;

  private:
    void print_line(const std::string &line);

    mutable std::mutex mutex_;
    std::FILE *out_;
    Counts counts_;
};

} // namespace treespec::engine
