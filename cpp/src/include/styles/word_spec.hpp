#pragma once

#include "styles/style_suite.hpp"

namespace treespec::styles
{

/**
 * @class WordSpec
 * @brief Scopes introduced by a verb (`when`, `should`, `must`, `can`,
 *        `which`) that becomes part of every name below them.
 *
 * @code
 * should("A Stack", [&] {
 *     in("pop values in last-in-first-out order", [] { ... });
 * });
 * @endcode
 * registers "A Stack should pop values in last-in-first-out order", and the
 * test is reported as "should pop values in last-in-first-out order".
 */
class TREESPEC_EXPORT WordSpec : public StyleSuite
{
  protected:
    explicit WordSpec(std::string suite_name);

    void when(const std::string &description, const std::function<void()> &body,
              std::source_location loc = std::source_location::current());
    void should(const std::string &description, const std::function<void()> &body,
                std::source_location loc = std::source_location::current());
    void must(const std::string &description, const std::function<void()> &body,
              std::source_location loc = std::source_location::current());
    void can(const std::string &description, const std::function<void()> &body,
             std::source_location loc = std::source_location::current());
    void which(const std::string &description, const std::function<void()> &body,
               std::source_location loc = std::source_location::current());

    void in(const std::string &spec_text, std::function<void()> body,
            std::source_location loc = std::source_location::current());
    void in(const std::string &spec_text, const std::set<std::string> &test_tags, std::function<void()> body,
            std::source_location loc = std::source_location::current());

    void ignore(const std::string &spec_text, std::function<void()> body,
                std::source_location loc = std::source_location::current());

  private:
    void register_verb_branch(const std::string &verb, const std::string &description,
                              const std::function<void()> &body, std::source_location loc);
};

} // namespace treespec::styles
