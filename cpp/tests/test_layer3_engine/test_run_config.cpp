/**
 * @file test_run_config.cpp
 * @brief RunConfig parsing, validation errors and the filter it builds.
 */
#include "test_preamble.h"

namespace fs = std::filesystem;
using nlohmann::json;
using treespec::engine::RunConfig;
using treespec::utils::Logger;

namespace
{

/// Writes @p content to a per-test file and removes it afterwards.
class RunConfigFileTest : public ::testing::Test
{
  protected:
    fs::path path_;

    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() / (std::string("treespec_run_config_") + info->name() + ".json");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string &content)
    {
        std::ofstream out(path_);
        out << content;
    }
};

} // namespace

TEST(RunConfigTest, EmptyObjectGivesDefaults)
{
    const RunConfig cfg = RunConfig::from_json(json::object());
    EXPECT_FALSE(cfg.tags_to_include.has_value());
    EXPECT_TRUE(cfg.tags_to_exclude.empty());
    EXPECT_FALSE(cfg.test_names.has_value());
    EXPECT_FALSE(cfg.stop_on_failure);
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_TRUE(cfg.config_map.is_object());
    EXPECT_TRUE(cfg.config_map.empty());
}

TEST(RunConfigTest, ParsesEverySection)
{
    const json j = json::parse(R"({
        "run": {
            "tags_to_include": ["fast", "db"],
            "tags_to_exclude": ["slow"],
            "test_names": ["A Stack pops"],
            "stop_on_failure": true
        },
        "log": { "level": "debug", "file": "/tmp/treespec.log" },
        "config_map": { "host": "localhost", "port": 5432 }
    })");

    const RunConfig cfg = RunConfig::from_json(j);
    EXPECT_EQ(cfg.tags_to_include, (std::set<std::string>{"db", "fast"}));
    EXPECT_EQ(cfg.tags_to_exclude, (std::set<std::string>{"slow"}));
    EXPECT_EQ(cfg.test_names, (std::set<std::string>{"A Stack pops"}));
    EXPECT_TRUE(cfg.stop_on_failure);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file, "/tmp/treespec.log");
    EXPECT_EQ(cfg.config_map.at("port").get<int>(), 5432);
}

TEST(RunConfigTest, RejectsMistypedFields)
{
    EXPECT_THROW(RunConfig::from_json(json::array()), std::runtime_error);
    EXPECT_THROW(RunConfig::from_json(json{{"run", {{"tags_to_exclude", "slow"}}}}), std::runtime_error);
    EXPECT_THROW(RunConfig::from_json(json{{"run", {{"tags_to_exclude", {1, 2}}}}}), std::runtime_error);
    EXPECT_THROW(RunConfig::from_json(json{{"run", {{"stop_on_failure", "yes"}}}}), std::runtime_error);
    EXPECT_THROW(RunConfig::from_json(json{{"config_map", 3}}), std::runtime_error);
}

TEST(RunConfigTest, RejectsUnknownLogLevel)
{
    try
    {
        (void)RunConfig::from_json(json{{"log", {{"level", "chatty"}}}});
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("'log.level' = 'chatty'"));
    }
}

TEST(RunConfigTest, FilterAlwaysExcludesIgnoreTag)
{
    RunConfig cfg;
    cfg.tags_to_exclude = {"slow"};
    const auto filter = cfg.make_filter();

    EXPECT_EQ(filter.tags_to_exclude().count("slow"), 1u);
    EXPECT_EQ(filter.tags_to_exclude().count(std::string(treespec::engine::kIgnoreTagName)), 1u);

    const treespec::engine::TagsMap tags{{"later", {std::string(treespec::engine::kIgnoreTagName)}}};
    EXPECT_TRUE(filter.apply("later", tags).ignored);
}

TEST(RunConfigTest, ApplyLoggingSetsLevel)
{
    const auto saved = Logger::instance().level();
    RunConfig cfg;
    cfg.log_level = "error";
    cfg.apply_logging();
    EXPECT_EQ(Logger::instance().level(), Logger::Level::L_ERROR);
    Logger::instance().set_level(saved);
}

TEST_F(RunConfigFileTest, ReadsFile)
{
    write(R"({ "run": { "stop_on_failure": true } })");
    const RunConfig cfg = RunConfig::from_json_file(path_.string());
    EXPECT_TRUE(cfg.stop_on_failure);
}

TEST_F(RunConfigFileTest, MissingFileNamesThePath)
{
    try
    {
        (void)RunConfig::from_json_file(path_.string());
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("cannot open file"));
        EXPECT_THAT(e.what(), ::testing::HasSubstr(path_.string()));
    }
}

TEST_F(RunConfigFileTest, ParseErrorNamesThePath)
{
    write("{ not json");
    try
    {
        (void)RunConfig::from_json_file(path_.string());
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("JSON parse error"));
        EXPECT_THAT(e.what(), ::testing::HasSubstr(path_.string()));
    }
}

TEST_F(RunConfigFileTest, ValidationErrorNamesThePath)
{
    write(R"({ "log": { "level": 3 } })");
    try
    {
        (void)RunConfig::from_json_file(path_.string());
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("'log.level' must be a string"));
        EXPECT_THAT(e.what(), ::testing::HasSubstr("(in '" + path_.string() + "')"));
    }
}
