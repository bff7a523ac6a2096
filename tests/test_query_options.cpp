#include <gtest/gtest.h>
#include "query/query_options.h"
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace sidx;
using namespace std::chrono_literals;

class QueryOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "sidx_query_options_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(QueryOptionsTest, Defaults) {
    query::QueryOptions options;
    EXPECT_EQ(options.time_quota, 5000ms);
    EXPECT_EQ(options.checkpoint_interval, 1024u);
    EXPECT_EQ(options.result_limit, 0u);
    EXPECT_EQ(options.log_level, "info");
}

TEST_F(QueryOptionsTest, LoadFromYaml) {
    auto path = write("query.yaml",
                      "query:\n"
                      "  time_quota_ms: 250\n"
                      "  checkpoint_interval: 64\n"
                      "  result_limit: 100\n"
                      "logging:\n"
                      "  level: debug\n");

    auto options = query::QueryOptions::loadFromYaml(path);
    EXPECT_EQ(options.time_quota, 250ms);
    EXPECT_EQ(options.checkpoint_interval, 64u);
    EXPECT_EQ(options.result_limit, 100u);
    EXPECT_EQ(options.log_level, "debug");
}

TEST_F(QueryOptionsTest, MissingKeysKeepDefaults) {
    auto path = write("partial.yaml", "query:\n  result_limit: 7\n");
    auto options = query::QueryOptions::loadFromYaml(path);
    EXPECT_EQ(options.time_quota, 5000ms);
    EXPECT_EQ(options.result_limit, 7u);
}

TEST_F(QueryOptionsTest, InvalidIntervalIsClamped) {
    auto path = write("zero.yaml", "query:\n  checkpoint_interval: 0\n");
    EXPECT_EQ(query::QueryOptions::loadFromYaml(path).checkpoint_interval, 1u);
}

TEST_F(QueryOptionsTest, UnreadableFileFallsBackToDefaults) {
    auto options = query::QueryOptions::loadFromYaml((dir_ / "missing.yaml").string());
    EXPECT_EQ(options.time_quota, 5000ms);

    auto broken = write("broken.yaml", "query: [unclosed\n");
    EXPECT_EQ(query::QueryOptions::loadFromYaml(broken).checkpoint_interval, 1024u);
}

TEST_F(QueryOptionsTest, JsonRoundTripKeepsValues) {
    nlohmann::json j = {{"time_quota_ms", 1500}, {"result_limit", 3}, {"log_level", "warn"}};
    auto options = query::QueryOptions::fromJson(j);
    EXPECT_EQ(options.time_quota, 1500ms);
    EXPECT_EQ(options.result_limit, 3u);
    EXPECT_EQ(options.checkpoint_interval, 1024u);

    auto out = options.toJson();
    EXPECT_EQ(out["time_quota_ms"], 1500);
    EXPECT_EQ(out["log_level"], "warn");
}

TEST_F(QueryOptionsTest, JsonTypeErrorFallsBackToDefaults) {
    nlohmann::json j = {{"time_quota_ms", "soon"}};
    EXPECT_EQ(query::QueryOptions::fromJson(j).time_quota, 5000ms);
}

TEST(LoggerTest, LevelNames) {
    using utils::Logger;
    EXPECT_EQ(Logger::levelFromString("debug"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::levelFromString("WARN"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("bogus"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::ERROR), "error");
}

TEST(LoggerTest, InitWithFileSink) {
    using utils::Logger;
    auto file = std::filesystem::temp_directory_path() / "sidx_logger_test.log";

    Logger::init(file.string(), Logger::Level::DEBUG);
    ASSERT_TRUE(Logger::isInitialized());
    Logger::setPattern("%l %v");
    SIDX_DEBUG("planned {} groups", 3);
    EXPECT_TRUE(Logger::isEnabled(Logger::Level::DEBUG));
    Logger::setLevel(Logger::Level::WARN);
    EXPECT_FALSE(Logger::isEnabled(Logger::Level::INFO));
    SIDX_INFO("dropped below warn");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isEnabled(Logger::Level::CRITICAL));
    EXPECT_FALSE(Logger::isInitialized());

    std::ifstream in(file);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("debug planned 3 groups"), std::string::npos);
    EXPECT_EQ(content.find("dropped below warn"), std::string::npos);
    std::filesystem::remove(file);
}
