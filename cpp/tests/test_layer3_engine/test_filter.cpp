#include "test_preamble.h"

using namespace treespec::engine;

namespace
{
const std::string kIgnore(kIgnoreTagName);

TagsMap sample_tags()
{
    return TagsMap{{"slow test", {"slow"}}, {"db test", {"db", "slow"}}, {"ignored test", {kIgnore}}};
}
} // namespace

TEST(FilterTest, DefaultRunsEverythingAndIgnoresIgnored)
{
    const Filter filter;
    const auto tags = sample_tags();

    EXPECT_FALSE(filter.apply("plain", tags).excluded);
    EXPECT_FALSE(filter.apply("slow test", tags).excluded);

    const auto ignored = filter.apply("ignored test", tags);
    EXPECT_FALSE(ignored.excluded);
    EXPECT_TRUE(ignored.ignored);
}

TEST(FilterTest, IncludeSetRequiresOverlap)
{
    const Filter filter(std::set<std::string>{"db"}, {kIgnore});
    const auto tags = sample_tags();

    EXPECT_TRUE(filter.apply("plain", tags).excluded);
    EXPECT_TRUE(filter.apply("slow test", tags).excluded);
    EXPECT_FALSE(filter.apply("db test", tags).excluded);
}

TEST(FilterTest, ExcludeSetDropsTaggedTests)
{
    const Filter filter(std::nullopt, {"slow", kIgnore});
    const auto tags = sample_tags();

    EXPECT_TRUE(filter.apply("slow test", tags).excluded);
    EXPECT_TRUE(filter.apply("db test", tags).excluded);
    EXPECT_FALSE(filter.apply("plain", tags).excluded);
}

TEST(FilterTest, WithoutIgnoreTagInExcludeSetIgnoredTestsRun)
{
    const Filter filter(std::nullopt, {});
    const auto decision = filter.apply("ignored test", sample_tags());
    EXPECT_FALSE(decision.excluded);
    EXPECT_FALSE(decision.ignored);
}

TEST(FilterTest, NameSelectionExcludesOthers)
{
    const Filter filter(std::nullopt, {kIgnore}, std::set<std::string>{"plain"});
    const auto tags = sample_tags();
    EXPECT_FALSE(filter.apply("plain", tags).excluded);
    EXPECT_TRUE(filter.apply("slow test", tags).excluded);
}

TEST(FilterTest, BulkApplyKeepsOrderAndCountsRunnable)
{
    const Filter filter(std::nullopt, {"db", kIgnore});
    const std::vector<std::string> names{"plain", "db test", "ignored test", "slow test"};
    const auto tags = sample_tags();

    const auto survivors = filter.apply(names, tags);
    ASSERT_EQ(survivors.size(), 3u);
    EXPECT_EQ(survivors[0], std::make_pair(std::string("plain"), false));
    EXPECT_EQ(survivors[1], std::make_pair(std::string("ignored test"), true));
    EXPECT_EQ(survivors[2], std::make_pair(std::string("slow test"), false));
    EXPECT_EQ(filter.runnable_test_count(names, tags), 2u);
}
