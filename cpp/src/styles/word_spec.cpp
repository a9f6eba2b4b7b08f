#include "styles/word_spec.hpp"

#include <fmt/format.h>

#include "styles/fun_spec.hpp"

namespace treespec::styles
{

namespace
{
constexpr const char *kInInsideIn = "An in clause may not appear inside another in clause.";
constexpr const char *kIgnoreInsideIn = "An ignore clause may not appear inside an in clause.";
} // namespace

WordSpec::WordSpec(std::string suite_name)
    : StyleSuite(std::move(suite_name),
                 std::make_shared<engine::Engine>(concurrent_modification_message("WordSpec"), "WordSpec"))
{
}

void WordSpec::register_verb_branch(const std::string &verb, const std::string &description,
                                    const std::function<void()> &body, std::source_location loc)
{
    const auto location = engine::LineInFile::from(loc);
    const std::string closed_message = fmt::format("A {} clause may not appear inside an in clause.", verb);
    register_branch_body(
        verb, description,
        [&] { suite_engine().register_nested_branch(description, verb, body, closed_message, location); },
        location);
}

void WordSpec::when(const std::string &description, const std::function<void()> &body, std::source_location loc)
{
    register_verb_branch("when", description, body, loc);
}

void WordSpec::should(const std::string &description, const std::function<void()> &body,
                      std::source_location loc)
{
    register_verb_branch("should", description, body, loc);
}

void WordSpec::must(const std::string &description, const std::function<void()> &body, std::source_location loc)
{
    register_verb_branch("must", description, body, loc);
}

void WordSpec::can(const std::string &description, const std::function<void()> &body, std::source_location loc)
{
    register_verb_branch("can", description, body, loc);
}

void WordSpec::which(const std::string &description, const std::function<void()> &body, std::source_location loc)
{
    register_verb_branch("which", description, body, loc);
}

void WordSpec::in(const std::string &spec_text, std::function<void()> body, std::source_location loc)
{
    in(spec_text, {}, std::move(body), loc);
}

void WordSpec::in(const std::string &spec_text, const std::set<std::string> &test_tags, std::function<void()> body,
                  std::source_location loc)
{
    suite_engine().register_test(spec_text, std::move(body), kInInsideIn, engine::LineInFile::from(loc),
                                 test_tags);
}

void WordSpec::ignore(const std::string &spec_text, std::function<void()> body, std::source_location loc)
{
    suite_engine().register_ignored_test(spec_text, std::move(body), kIgnoreInsideIn,
                                         engine::LineInFile::from(loc));
}

} // namespace treespec::styles
