#pragma once
/**
 * @file fixture_fun_suite.hpp
 * @brief FunSuite whose tests take a fixture argument.
 *
 * The suite decides how a fixture is made and disposed of by implementing
 * `with_fixture`, which receives the test as a OneArgTest:
 * @code
 * class DbSuite : public FixtureFunSuite<Db>
 * {
 *   protected:
 *     void with_fixture(OneArgTest &test) override
 *     {
 *         Db db = Db::open_temp();
 *         auto close = treespec::basics::make_scope_guard([&] { db.close(); });
 *         test(db);
 *     }
 * };
 * @endcode
 */
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <source_location>
#include <string>
#include <vector>

#include "engine/super_engine.hpp"
#include "styles/style_suite.hpp"

namespace treespec::styles
{

template <typename Fixture> class FixtureFunSuite : public engine::Suite
{
  public:
    using FixtureParam = Fixture;
    using TestFun = std::function<void(Fixture &)>;

    struct OneArgTest
    {
        std::string name;
        std::set<std::string> tags;
        engine::ConfigMap config_map;
        TestFun body;

        void operator()(Fixture &fixture) const { body(fixture); }
    };

    std::vector<std::string> test_names() const override { return engine_.test_names(); }
    engine::TagsMap tags() const override { return engine_.tags(); }

    void run(const std::optional<std::string> &test_name, const engine::RunArgs &args) override
    {
        engine_.run_impl(*this, test_name, args,
                         [this](const std::optional<std::string> &name, const engine::RunArgs &run_args)
                         { run_tests(name, run_args); });
    }

  protected:
    explicit FixtureFunSuite(std::string suite_name)
        : Suite(std::move(suite_name)),
          engine_(concurrent_modification_message("FixtureFunSuite"), "FixtureFunSuite")
    {
    }

    virtual void with_fixture(OneArgTest &test) = 0;

    void test(const std::string &test_name, TestFun body, std::source_location loc = std::source_location::current())
    {
        test(test_name, {}, std::move(body), loc);
    }

    void test(const std::string &test_name, const std::set<std::string> &test_tags, TestFun body,
              std::source_location loc = std::source_location::current())
    {
        engine_.register_test(test_name, std::move(body), "A test clause may not appear inside another test clause.",
                              engine::LineInFile::from(loc), test_tags);
    }

    void ignore(const std::string &test_name, TestFun body,
                std::source_location loc = std::source_location::current())
    {
        engine_.register_ignored_test(test_name, std::move(body),
                                      "An ignore clause may not appear inside a test clause.",
                                      engine::LineInFile::from(loc));
    }

    void info(const std::string &message, std::source_location loc = std::source_location::current())
    {
        engine_.inform(message, engine::LineInFile::from(loc));
    }

    void markup(const std::string &message, std::source_location loc = std::source_location::current())
    {
        engine_.document(message, engine::LineInFile::from(loc));
    }

    void run_tests(const std::optional<std::string> &test_name, const engine::RunArgs &args) override
    {
        engine_.run_tests_impl(*this, test_name, args,
                               [this](const std::string &name, const engine::RunArgs &run_args)
                               { run_test(name, run_args); });
    }

    void run_test(const std::string &test_name, const engine::RunArgs &args) override
    {
        engine_.run_test_impl(*this, test_name, args,
                              [this, &args](const typename engine::FixtureEngine<Fixture>::TestLeaf &leaf)
                              {
                                  const engine::TagsMap all_tags = engine_.tags();
                                  auto found = all_tags.find(leaf.test_name);
                                  OneArgTest test{leaf.test_name,
                                                  found != all_tags.end() ? found->second
                                                                          : std::set<std::string>{},
                                                  args.config_map, leaf.test_fun};
                                  return engine::Outcome::capture([&] { with_fixture(test); });
                              });
    }

  private:
    engine::FixtureEngine<Fixture> engine_;
};

} // namespace treespec::styles
