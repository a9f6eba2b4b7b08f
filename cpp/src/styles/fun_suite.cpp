#include "styles/fun_suite.hpp"

namespace treespec::styles
{

namespace
{
constexpr const char *kTestInsideTest = "A test clause may not appear inside another test clause.";
constexpr const char *kIgnoreInsideTest = "An ignore clause may not appear inside a test clause.";
} // namespace

FunSuite::FunSuite(std::string suite_name)
    : StyleSuite(std::move(suite_name),
                 std::make_shared<engine::Engine>(concurrent_modification_message("FunSuite"), "FunSuite"))
{
}

void FunSuite::test(const std::string &test_name, std::function<void()> body, std::source_location loc)
{
    test(test_name, {}, std::move(body), loc);
}

void FunSuite::test(const std::string &test_name, const std::set<std::string> &test_tags,
                    std::function<void()> body, std::source_location loc)
{
    suite_engine().register_test(test_name, std::move(body), kTestInsideTest, engine::LineInFile::from(loc),
                                 test_tags);
}

void FunSuite::ignore(const std::string &test_name, std::function<void()> body, std::source_location loc)
{
    ignore(test_name, {}, std::move(body), loc);
}

void FunSuite::ignore(const std::string &test_name, const std::set<std::string> &test_tags,
                      std::function<void()> body, std::source_location loc)
{
    suite_engine().register_ignored_test(test_name, std::move(body), kIgnoreInsideTest,
                                         engine::LineInFile::from(loc), test_tags);
}

} // namespace treespec::styles
