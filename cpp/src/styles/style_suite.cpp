#include "styles/style_suite.hpp"

#include <fmt/format.h>

namespace treespec::styles
{

std::string concurrent_modification_message(const std::string &style_name)
{
    return fmt::format("Two threads attempted to modify {}'s internal data, which should only be modified "
                       "by the thread that constructs the object.",
                       style_name);
}

StyleSuite::StyleSuite(std::string suite_name, std::shared_ptr<engine::Engine> engine)
    : Suite(std::move(suite_name)), engine_(std::move(engine))
{
    if (!engine_)
    {
        throw engine::NullArgumentError("engine was null");
    }
}

std::vector<std::string> StyleSuite::test_names() const
{
    return engine_->test_names();
}

engine::TagsMap StyleSuite::tags() const
{
    return engine_->tags();
}

std::vector<int> StyleSuite::test_path(const std::string &test_name) const
{
    return engine_->test_path(test_name);
}

void StyleSuite::with_fixture(NoArgTest &test)
{
    test();
}

void StyleSuite::info(const std::string &message, std::source_location loc)
{
    engine_->inform(message, engine::LineInFile::from(loc));
}

void StyleSuite::markup(const std::string &message, std::source_location loc)
{
    engine_->document(message, engine::LineInFile::from(loc));
}

void StyleSuite::run(const std::optional<std::string> &test_name, const engine::RunArgs &args)
{
    engine_->run_impl(*this, test_name, args,
                      [this](const std::optional<std::string> &name, const engine::RunArgs &run_args)
                      { run_tests(name, run_args); });
}

void StyleSuite::run_tests(const std::optional<std::string> &test_name, const engine::RunArgs &args)
{
    engine_->run_tests_impl(*this, test_name, args,
                            [this](const std::string &name, const engine::RunArgs &run_args)
                            { run_test(name, run_args); });
}

void StyleSuite::run_test(const std::string &test_name, const engine::RunArgs &args)
{
    engine_->run_test_impl(*this, test_name, args,
                           [this, &args](const engine::Engine::TestLeaf &leaf)
                           {
                               const engine::TagsMap all_tags = engine_->tags();
                               auto found = all_tags.find(leaf.test_name);
                               NoArgTest test{leaf.test_name,
                                              found != all_tags.end() ? found->second : std::set<std::string>{},
                                              args.config_map, leaf.test_fun};
                               return engine::Outcome::capture([&] { with_fixture(test); });
                           });
}

} // namespace treespec::styles
