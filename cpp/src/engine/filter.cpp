#include "engine/filter.hpp"

#include <algorithm>

namespace treespec::engine
{

namespace
{
bool intersects(const std::set<std::string> &a, const std::set<std::string> &b)
{
    return std::any_of(a.begin(), a.end(), [&b](const std::string &tag) { return b.count(tag) != 0; });
}
} // namespace

Filter::Filter() : tags_to_exclude_{std::string(kIgnoreTagName)} {}

Filter::Filter(std::optional<std::set<std::string>> tags_to_include, std::set<std::string> tags_to_exclude,
               std::optional<std::set<std::string>> test_names_to_include)
    : tags_to_include_(std::move(tags_to_include)), tags_to_exclude_(std::move(tags_to_exclude)),
      test_names_to_include_(std::move(test_names_to_include))
{
}

FilterDecision Filter::apply(const std::string &test_name, const TagsMap &tags) const
{
    static const std::set<std::string> kNoTags;
    const auto it = tags.find(test_name);
    const auto &test_tags = it != tags.end() ? it->second : kNoTags;

    FilterDecision decision;
    if (test_names_to_include_ && test_names_to_include_->count(test_name) == 0)
    {
        decision.excluded = true;
        return decision;
    }
    if (tags_to_include_ && !intersects(test_tags, *tags_to_include_))
    {
        decision.excluded = true;
        return decision;
    }

    std::set<std::string> excluding = tags_to_exclude_;
    excluding.erase(std::string(kIgnoreTagName));
    if (intersects(test_tags, excluding))
    {
        decision.excluded = true;
        return decision;
    }

    const std::string ignore_tag(kIgnoreTagName);
    decision.ignored = tags_to_exclude_.count(ignore_tag) != 0 && test_tags.count(ignore_tag) != 0;
    return decision;
}

std::vector<std::pair<std::string, bool>> Filter::apply(const std::vector<std::string> &test_names,
                                                        const TagsMap &tags) const
{
    std::vector<std::pair<std::string, bool>> result;
    result.reserve(test_names.size());
    for (const auto &name : test_names)
    {
        const auto decision = apply(name, tags);
        if (!decision.excluded)
        {
            result.emplace_back(name, decision.ignored);
        }
    }
    return result;
}

size_t Filter::runnable_test_count(const std::vector<std::string> &test_names, const TagsMap &tags) const
{
    const auto survivors = apply(test_names, tags);
    return static_cast<size_t>(std::count_if(survivors.begin(), survivors.end(),
                                             [](const auto &entry) { return !entry.second; }));
}

} // namespace treespec::engine
