#pragma once
/**
 * @file style_suite.hpp
 * @brief Common base of the styles whose tests take no fixture argument.
 *
 * Owns (or shares, for the path style) an Engine and wires the Suite run
 * hooks to it: `run` -> `run_impl`, `run_tests` -> `run_tests_impl`,
 * `run_test` -> `run_test_impl` with `with_fixture` as the invocation
 * strategy.
 */
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <source_location>
#include <string>
#include <vector>

#include "engine/super_engine.hpp"
#include "treespec_export.h"

namespace treespec::styles
{

/**
 * @brief What `with_fixture` receives: the test's name, tags and config map,
 *        and the body to call.
 */
struct NoArgTest
{
    std::string name;
    std::set<std::string> tags;
    engine::ConfigMap config_map;
    std::function<void()> body;

    void operator()() const { body(); }
};

class TREESPEC_EXPORT StyleSuite : public engine::Suite
{
  public:
    std::vector<std::string> test_names() const override;
    engine::TagsMap tags() const override;
    void run(const std::optional<std::string> &test_name, const engine::RunArgs &args) override;

    /// Child indices from the trunk to @p test_name. @throws engine::UnknownTestError
    std::vector<int> test_path(const std::string &test_name) const;

  protected:
    StyleSuite(std::string suite_name, std::shared_ptr<engine::Engine> engine);

    /**
     * @brief Runs one test. Override to set up and tear down around `test()`.
     */
    virtual void with_fixture(NoArgTest &test);

    /// Sends an info message: a tree leaf during construction, part of the test while one runs.
    void info(const std::string &message, std::source_location loc = std::source_location::current());
    void markup(const std::string &message, std::source_location loc = std::source_location::current());

    void run_tests(const std::optional<std::string> &test_name, const engine::RunArgs &args) override;
    void run_test(const std::string &test_name, const engine::RunArgs &args) override;

    engine::Engine &suite_engine() noexcept { return *engine_; }
    const engine::Engine &suite_engine() const noexcept { return *engine_; }

  private:
    std::shared_ptr<engine::Engine> engine_;
};

/// Message of the ConcurrentModificationError raised when two threads register into one suite.
TREESPEC_EXPORT std::string concurrent_modification_message(const std::string &style_name);

} // namespace treespec::styles
