#pragma once
/**
 * @file engine_suite.h
 * @brief A Suite driven directly through Engine calls, with the engine's
 *        protected plumbing exposed so tests can provoke races.
 */
#include <memory>
#include <optional>
#include <string>

#include "tsp_engine.hpp"

namespace treespec::test
{

class ExposedEngine : public engine::Engine
{
  public:
    ExposedEngine() : engine::Engine("Concurrent modification in EngineSuite", "EngineSuite") {}

    using engine::Engine::informer_slot;
    using engine::Engine::load_bundle;
    using engine::Engine::update_bundle;
};

inline const engine::LineInFile kHere{"engine_suite.h", 1, std::nullopt};

/**
 * @brief Registration goes straight to `core`; tests run their stored
 *        function with no fixture.
 */
class EngineSuite : public engine::Suite
{
  public:
    EngineSuite() : Suite("EngineSuite") {}

    ExposedEngine core;

    std::vector<std::string> test_names() const override { return core.test_names(); }
    engine::TagsMap tags() const override { return core.tags(); }

    void run(const std::optional<std::string> &test_name, const engine::RunArgs &args) override
    {
        core.run_impl(*this, test_name, args,
                        [this](const std::optional<std::string> &name, const engine::RunArgs &run_args)
                        { run_tests(name, run_args); });
    }

    void run_tests(const std::optional<std::string> &test_name, const engine::RunArgs &args) override
    {
        core.run_tests_impl(*this, test_name, args,
                              [this](const std::string &name, const engine::RunArgs &run_args)
                              { run_test(name, run_args); });
    }

    void run_test(const std::string &test_name, const engine::RunArgs &args) override
    {
        core.run_test_impl(*this, test_name, args,
                             [](const engine::Engine::TestLeaf &leaf)
                             { return engine::Outcome::capture(leaf.test_fun); });
    }

    // Registration shorthands.
    std::string test(const std::string &text, std::function<void()> body, const std::set<std::string> &tags = {})
    {
        return core.register_test(text, std::move(body), "test inside test", kHere, tags);
    }

    std::string ignored(const std::string &text, std::function<void()> body)
    {
        return core.register_ignored_test(text, std::move(body), "ignore inside test", kHere);
    }

    void branch(const std::string &description, const std::function<void()> &body,
                const std::optional<std::string> &child_prefix = std::nullopt)
    {
        core.register_nested_branch(description, child_prefix, body, "branch inside test", kHere);
    }

    void info(const std::string &message) { core.inform(message, kHere); }
    void markup(const std::string &message) { core.document(message, kHere); }
};

} // namespace treespec::test
