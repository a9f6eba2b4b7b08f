#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "treespec_export.h"

namespace treespec::engine
{

/// Test name -> tag names. Tests registered without tags have no entry.
using TagsMap = std::map<std::string, std::set<std::string>>;

/// The tag `register_ignored_test` attaches.
inline constexpr std::string_view kIgnoreTagName = "treespec.Ignore";

struct FilterDecision
{
    bool excluded{false};
    bool ignored{false};
};

/**
 * @brief Decides, per test, whether to run it, report it as ignored, or skip it.
 *
 * A test is excluded when a tag include set is given and the test carries none
 * of those tags, when it carries a tag from the exclude set (the ignore tag
 * aside), or when a name selection is given and does not list it. A test that
 * survives is ignored when it carries the ignore tag and the exclude set
 * contains the ignore tag, which the default filter does.
 */
class TREESPEC_EXPORT Filter
{
  public:
    Filter();
    Filter(std::optional<std::set<std::string>> tags_to_include, std::set<std::string> tags_to_exclude,
           std::optional<std::set<std::string>> test_names_to_include = std::nullopt);

    FilterDecision apply(const std::string &test_name, const TagsMap &tags) const;

    /**
     * @brief Bulk form: the surviving names, in input order, each paired with its ignored flag.
     */
    std::vector<std::pair<std::string, bool>> apply(const std::vector<std::string> &test_names,
                                                    const TagsMap &tags) const;

    /// Number of tests that would actually run (neither excluded nor ignored).
    size_t runnable_test_count(const std::vector<std::string> &test_names, const TagsMap &tags) const;

    const std::optional<std::set<std::string>> &tags_to_include() const noexcept { return tags_to_include_; }
    const std::set<std::string> &tags_to_exclude() const noexcept { return tags_to_exclude_; }

  private:
    std::optional<std::set<std::string>> tags_to_include_;
    std::set<std::string> tags_to_exclude_;
    std::optional<std::set<std::string>> test_names_to_include_;
};

} // namespace treespec::engine
