#pragma once

#include <optional>
#include <string>
#include <vector>

#include "engine/collaborators.hpp"
#include "engine/filter.hpp"
#include "treespec_export.h"

namespace treespec::engine
{

/**
 * @class Suite
 * @brief A named collection of tests that can be run.
 *
 * Styles derive from Suite and delegate to an engine: `run` closes
 * registration and calls `run_tests`, which walks the tree and calls
 * `run_test` for each test the filter lets through.
 */
class TREESPEC_EXPORT Suite
{
  public:
    explicit Suite(std::string suite_name) : suite_name_(std::move(suite_name)) {}
    virtual ~Suite() = default;

    Suite(const Suite &) = delete;
    Suite &operator=(const Suite &) = delete;

    const std::string &suite_name() const noexcept { return suite_name_; }

    /// Test names in registration order.
    virtual std::vector<std::string> test_names() const = 0;
    virtual TagsMap tags() const = 0;

    /// Number of tests a run with @p filter would execute.
    virtual size_t expected_test_count(const Filter &filter) const
    {
        return filter.runnable_test_count(test_names(), tags());
    }

    /**
     * @brief Runs one test (when @p test_name is set) or the whole suite.
     */
    virtual void run(const std::optional<std::string> &test_name, const RunArgs &args) = 0;

  protected:
    virtual void run_tests(const std::optional<std::string> &test_name, const RunArgs &args) = 0;
    virtual void run_test(const std::string &test_name, const RunArgs &args) = 0;

  private:
    std::string suite_name_;
};

} // namespace treespec::engine
