#include <gtest/gtest.h>
#include "torrentcast/core/config.hpp"
#include <filesystem>
#include <fstream>
#include <map>

using namespace torrentcast::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        path_ = std::filesystem::temp_directory_path() / "torrentcast_config_test.conf";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write_file(const std::string& contents) {
        std::ofstream out(path_);
        out << contents;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigTest, MissingKeyHasNoValue) {
    auto& config = Config::instance();
    config.set("server.port", "8080");

    ASSERT_TRUE(config.get("server.port").has_value());
    EXPECT_EQ(*config.get("server.port"), "8080");
    EXPECT_FALSE(config.get("server.missing").has_value());
    EXPECT_EQ(config.get_string("server.missing", "fallback"), "fallback");
    EXPECT_EQ(config.get_int("server.missing", 17), 17);
}

TEST_F(ConfigTest, BooleanSpellings) {
    auto& config = Config::instance();
    config.set("a", "yes");
    config.set("b", "ON");
    config.set("c", "0");
    config.set("d", "off");
    config.set("e", "maybe");

    EXPECT_TRUE(config.get_bool("a"));
    EXPECT_TRUE(config.get_bool("b"));
    EXPECT_FALSE(config.get_bool("c", true));
    EXPECT_FALSE(config.get_bool("d", true));
    EXPECT_TRUE(config.get_bool("e", true));
    EXPECT_FALSE(config.get_bool("e", false));
}

TEST_F(ConfigTest, LoadsSectionsAndComments) {
    write_file(
        "# torrentcast\n"
        "; alternate comment\n"
        "log.level = debug\n"
        "\n"
        "[server]\n"
        "port = 9000\n"
        "bind_address=127.0.0.1\n"
        "\n"
        "[ sessions ]\n"
        "max_active = 5\n"
        "not a pair\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(path_.string()));

    EXPECT_EQ(config.get_string("log.level"), "debug");
    EXPECT_EQ(config.get_int("server.port"), 9000);
    EXPECT_EQ(config.get_string("server.bind_address"), "127.0.0.1");
    EXPECT_EQ(config.get_int("sessions.max_active"), 5);
    EXPECT_FALSE(config.get("not a pair").has_value());
}

TEST_F(ConfigTest, LoadFailsForMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("/nonexistent/torrentcast.conf"));
}

TEST_F(ConfigTest, SavedFileLoadsBackIntoFreshConfig) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("standalone", "value");
    config.set("search.categories", "200,205");

    ASSERT_TRUE(config.save_to_file(path_.string()));

    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_file(path_.string()));
    EXPECT_EQ(reloaded.get_string("standalone"), "value");
    EXPECT_EQ(reloaded.get_string("search.categories"), "200,205");
    EXPECT_EQ(reloaded.get_int("server.port"), 5000);
    EXPECT_EQ(reloaded.get_string("search.endpoint"), "https://apibay.org/q.php");
}

TEST_F(ConfigTest, EnvironmentOverridesKnownKeys) {
    auto& config = Config::instance();
    config.set_defaults();

    std::map<std::string, std::string> env = {
        {"PORT", "7070"},
        {"TORRENTCAST_SESSIONS_MAX_ACTIVE", "8"},
        {"TORRENTCAST_LOG_LEVEL", "trace"},
        {"TORRENTCAST_UNKNOWN_KEY", "ignored"},
    };
    auto applied = config.apply_environment([&env](const std::string& name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) return std::nullopt;
        return it->second;
    });

    EXPECT_EQ(applied, 3u);
    EXPECT_EQ(config.get_int("server.port"), 7070);
    EXPECT_EQ(config.get_int("sessions.max_active"), 8);
    EXPECT_EQ(config.get_string("log.level"), "trace");
    EXPECT_FALSE(config.get("unknown.key").has_value());
}

TEST_F(ConfigTest, PrefixedPortWinsOverPlainPort) {
    auto& config = Config::instance();
    config.set_defaults();

    auto applied = config.apply_environment([](const std::string& name) -> std::optional<std::string> {
        if (name == "PORT") return std::string("7000");
        if (name == "TORRENTCAST_SERVER_PORT") return std::string("7001");
        return std::nullopt;
    });

    EXPECT_EQ(applied, 2u);
    EXPECT_EQ(config.get_int("server.port"), 7001);
}

TEST_F(ConfigTest, DefaultsCoverEveryComponent) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_int("server.port"), 5000);
    EXPECT_EQ(config.get_int("sessions.max_active"), 3);
    EXPECT_EQ(config.get_int("sessions.idle_timeout_seconds"), 1800);
    EXPECT_EQ(config.get_int("sessions.cleanup_interval_seconds"), 300);
    EXPECT_EQ(config.get_uint64("stream.chunk_size"), 65536u);
    EXPECT_EQ(config.get_int("priority.buffer_ahead"), 20);
    EXPECT_EQ(config.get_int("priority.initial_window"), 100);
    EXPECT_EQ(config.get_string("search.endpoint"), "https://apibay.org/q.php");
}

TEST_F(ConfigTest, GetList) {
    auto& config = Config::instance();
    config.set("search.categories", "200, 205 ,,299");

    auto categories = config.get_list("search.categories");
    ASSERT_EQ(categories.size(), 3u);
    EXPECT_EQ(categories[0], "200");
    EXPECT_EQ(categories[1], "205");
    EXPECT_EQ(categories[2], "299");

    EXPECT_TRUE(config.get_list("missing.list").empty());
}

TEST_F(ConfigTest, MalformedNumbersFallBack) {
    auto& config = Config::instance();
    config.set("server.port", "not-a-number");

    EXPECT_EQ(config.get_int("server.port", 5000), 5000);
    EXPECT_EQ(config.get_uint64("server.port", 7), 7u);
}
