#pragma once

#include "styles/style_suite.hpp"

namespace treespec::styles
{

/**
 * @class FunSuite
 * @brief Flat list of named tests.
 *
 * @code
 * class SetSuite : public FunSuite
 * {
 *   public:
 *     SetSuite() : FunSuite("SetSuite")
 *     {
 *         test("an empty set has size 0", [] { EXPECT_TRUE(std::set<int>{}.empty()); });
 *     }
 * };
 * @endcode
 */
class TREESPEC_EXPORT FunSuite : public StyleSuite
{
  protected:
    explicit FunSuite(std::string suite_name);

    void test(const std::string &test_name, std::function<void()> body,
              std::source_location loc = std::source_location::current());
    void test(const std::string &test_name, const std::set<std::string> &test_tags, std::function<void()> body,
              std::source_location loc = std::source_location::current());

    void ignore(const std::string &test_name, std::function<void()> body,
                std::source_location loc = std::source_location::current());
    void ignore(const std::string &test_name, const std::set<std::string> &test_tags, std::function<void()> body,
                std::source_location loc = std::source_location::current());
};

} // namespace treespec::styles
