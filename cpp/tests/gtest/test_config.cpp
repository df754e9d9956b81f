// =============================================================================
// Configuration and Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "otree/config.hpp"
#include "otree/logging.hpp"
#include "otree/otree_algorithm.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace otree;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved = Config::getInstance().entries();
        path = std::filesystem::temp_directory_path() /
               ("otree_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".env");
    }

    void TearDown() override {
        for (const auto& [key, value] : saved) {
            Config::getInstance().set(key, value);
        }
        std::filesystem::remove(path);
        set_log_output(std::clog);
        set_log_level(LogLevel::INFO);
    }

    void write_file(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    std::map<std::string, std::string> saved;
    std::filesystem::path path;
};

TEST_F(ConfigTest, DefaultKeysPresent) {
    auto entries = Config::getInstance().entries();
    for (const char* key : {"index.desired_cube_size", "index.max_depth", "index.worker_threads",
                            "writer.commit_retries", "keeper.backend", "db.host", "db.name", "log.level"}) {
        EXPECT_TRUE(entries.contains(key)) << key;
    }
}

TEST_F(ConfigTest, TypedGet) {
    Config& config = Config::getInstance();
    config.set("test.int", "42");
    config.set("test.double", "2.5");
    config.set("test.flag", "Yes");
    config.set("test.bad", "abc");

    EXPECT_EQ(config.get<int>("test.int"), 42);
    EXPECT_EQ(config.get<long long>("test.int"), 42LL);
    EXPECT_DOUBLE_EQ(config.get<double>("test.double"), 2.5);
    EXPECT_TRUE(config.get<bool>("test.flag"));
    EXPECT_EQ(config.get<std::string>("test.int"), "42");
    EXPECT_EQ(config.get<int>("test.bad", 7), 7);
    EXPECT_EQ(config.get<int>("test.missing", 3), 3);
}

TEST_F(ConfigTest, FileOverridesValues) {
    write_file("# index settings\n"
               "index.max_depth = 12\n"
               "index.desired_cube_size=2500\n"
               "not a setting\n"
               "; trailing comment\n");

    ASSERT_TRUE(Config::getInstance().load(path.string()));
    EXPECT_EQ(Config::getInstance().get<int>("index.max_depth"), 12);

    IndexOptions options = IndexOptions::from_config();
    EXPECT_EQ(options.max_depth, 12u);
    EXPECT_EQ(options.desired_cube_size, 2500);
}

TEST_F(ConfigTest, InvalidValuesFailValidation) {
    write_file("index.max_depth=99\n");
    EXPECT_FALSE(Config::getInstance().load(path.string()));

    write_file("index.max_depth=10\nkeeper.backend=etcd\n");
    EXPECT_FALSE(Config::getInstance().load(path.string()));
}

TEST_F(ConfigTest, MissingFileKeepsEnvironmentValues) {
    Config::getInstance().set("index.max_depth", "24");
    Config::getInstance().set("keeper.backend", "local");
    EXPECT_TRUE(Config::getInstance().load("/nonexistent/otree.env"));
}

TEST_F(ConfigTest, LoggerFiltersByLevel) {
    std::ostringstream captured;
    set_log_output(captured);
    set_log_level(LogLevel::WARN);

    LOG_INFO("hidden message");
    LOG_WARN("cube ", 3, " overflowed");

    const std::string text = captured.str();
    EXPECT_EQ(text.find("hidden message"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("cube 3 overflowed"), std::string::npos);
    EXPECT_NE(text.find("test_config.cpp"), std::string::npos);
}

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
}

TEST_F(ConfigTest, LogScopeTagsLines) {
    std::ostringstream captured;
    set_log_output(captured);
    set_log_level(LogLevel::INFO);
    {
        LogScope outer("events", 2);
        LOG_INFO("outer line");
        {
            LogScope inner("optimizer");
            LOG_INFO("inner line");
        }
        LOG_INFO("outer again");
    }
    LOG_INFO("untagged");

    std::istringstream lines(captured.str());
    std::string line;
    std::vector<std::string> out;
    while (std::getline(lines, line)) out.push_back(line);

    ASSERT_EQ(out.size(), 4u);
    EXPECT_NE(out[0].find("{events@2} - outer line"), std::string::npos);
    EXPECT_NE(out[1].find("{optimizer} - inner line"), std::string::npos);
    EXPECT_NE(out[2].find("{events@2} - outer again"), std::string::npos);
    EXPECT_EQ(out[3].find('{'), std::string::npos);
    EXPECT_TRUE(Logger::getInstance().enabled(LogLevel::WARN));
    EXPECT_FALSE(Logger::getInstance().enabled(LogLevel::DEBUG));
}
