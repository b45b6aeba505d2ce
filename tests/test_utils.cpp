// test/test_utils.cpp
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"admin_port=9200", "log_level=DEBUG"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_EQ(result->at("admin_port"), "9200");
    EXPECT_EQ(result->at("log_level"), "DEBUG");
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    auto result = Utils::parseArguments({"remote_password="});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("remote_password"), "");
}

TEST(UtilsTest, ParseArgumentsInvalid) {
    EXPECT_FALSE(Utils::parseArguments({"keyvalue"}).has_value());
    EXPECT_FALSE(Utils::parseArguments({"=value"}).has_value());
    // One bad argument rejects the whole command line.
    EXPECT_FALSE(Utils::parseArguments({"a=1", "invalid", "b=2"}).has_value());
}

// --- Conversions ---

TEST(UtilsTest, StringToNumbers) {
    EXPECT_EQ(Utils::stringToInt("42"), std::optional<int>(42));
    EXPECT_EQ(Utils::stringToInt("-7"), std::optional<int>(-7));
    EXPECT_FALSE(Utils::stringToInt("42abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999").has_value());

    EXPECT_EQ(Utils::stringToSize("104857600"), std::optional<std::size_t>(104857600));
    EXPECT_FALSE(Utils::stringToSize("-1").has_value());
    EXPECT_FALSE(Utils::stringToSize("").has_value());

    EXPECT_EQ(Utils::stringToDouble("1.5"), std::optional<double>(1.5));
    EXPECT_FALSE(Utils::stringToDouble("fast").has_value());
}

TEST(UtilsTest, StringToBoolAcceptsCommonSpellings) {
    for (const char* yes : {"true", "TRUE", "1", "yes", "On"}) {
        EXPECT_EQ(Utils::stringToBool(yes), std::optional<bool>(true)) << yes;
    }
    for (const char* no : {"false", "0", "No", "off"}) {
        EXPECT_EQ(Utils::stringToBool(no), std::optional<bool>(false)) << no;
    }
    EXPECT_FALSE(Utils::stringToBool("maybe").has_value());
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("WARN"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("ERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("verbose"), std::invalid_argument);
}

TEST(UtilsTest, TrimCaseAndCsv) {
    EXPECT_EQ(Utils::trim("  a b \t\n"), "a b");
    EXPECT_EQ(Utils::trim("   "), "");
    EXPECT_EQ(Utils::toUpper("get"), "GET");
    EXPECT_EQ(Utils::toLower("LRU"), "lru");
    EXPECT_EQ(Utils::splitCsv(" a, b,,c ,"), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(UtilsTest, ParseRemoteNodes) {
    auto nodes = Utils::parseRemoteNodes("redis-a:7000, redis-b");
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].host, "redis-a");
    EXPECT_EQ(nodes[0].port, 7000);
    EXPECT_EQ(nodes[1].host, "redis-b");
    EXPECT_EQ(nodes[1].port, 6379);

    EXPECT_THROW(Utils::parseRemoteNodes("redis:0"), std::invalid_argument);
    EXPECT_THROW(Utils::parseRemoteNodes("redis:port"), std::invalid_argument);
    EXPECT_THROW(Utils::parseRemoteNodes(":6379"), std::invalid_argument);
    EXPECT_THROW(Utils::parseRemoteNodes(""), std::invalid_argument);
}

// --- Glob matching ---

TEST(UtilsTest, GlobMatchWildcards) {
    EXPECT_TRUE(Utils::globMatch("*", ""));
    EXPECT_TRUE(Utils::globMatch("*", "anything"));
    EXPECT_TRUE(Utils::globMatch("user:*", "user:1"));
    EXPECT_FALSE(Utils::globMatch("user:*", "order:1"));
    EXPECT_TRUE(Utils::globMatch("user:?", "user:7"));
    EXPECT_FALSE(Utils::globMatch("user:?", "user:17"));
    EXPECT_TRUE(Utils::globMatch("*:profile:*", "tenant:profile:42"));
    EXPECT_TRUE(Utils::globMatch("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(Utils::globMatch("a*b*c", "aXXbYY"));
}

TEST(UtilsTest, GlobMatchClassesAndEscapes) {
    EXPECT_TRUE(Utils::globMatch("key:[abc]", "key:b"));
    EXPECT_FALSE(Utils::globMatch("key:[abc]", "key:d"));
    EXPECT_TRUE(Utils::globMatch("key:[0-9]", "key:5"));
    EXPECT_TRUE(Utils::globMatch("key:[!0-9]", "key:x"));
    EXPECT_FALSE(Utils::globMatch("key:[^0-9]", "key:5"));
    EXPECT_TRUE(Utils::globMatch("literal\\*", "literal*"));
    EXPECT_FALSE(Utils::globMatch("literal\\*", "literalX"));
    EXPECT_TRUE(Utils::globMatch("open[", "open["));
}

TEST(UtilsTest, EscapeGlobMatchesOnlyItself) {
    const std::string raw = "/api/items[1]?x=*";
    const std::string escaped = Utils::escapeGlob(raw);
    EXPECT_TRUE(Utils::globMatch(escaped, raw));
    EXPECT_FALSE(Utils::globMatch(escaped, "/api/items1?x=y"));
    EXPECT_TRUE(Utils::globMatch(escaped + "*", raw + "/more"));
}

// --- Request targets ---

TEST(UtilsTest, SplitTarget) {
    EXPECT_EQ(Utils::splitTarget("/cache/entries?limit=5"),
              (std::pair<std::string, std::string>{"/cache/entries", "limit=5"}));
    EXPECT_EQ(Utils::splitTarget("/cache/status"),
              (std::pair<std::string, std::string>{"/cache/status", ""}));
}

TEST(UtilsTest, PercentDecode) {
    EXPECT_EQ(Utils::percentDecode("user%3A1"), "user:1");
    EXPECT_EQ(Utils::percentDecode("a+b"), "a b");
    EXPECT_EQ(Utils::percentDecode("a+b", false), "a+b");
    EXPECT_EQ(Utils::percentDecode("100%"), "100%");
    EXPECT_EQ(Utils::percentDecode("%zz"), "%zz");
}

TEST(UtilsTest, PercentEncodeEscapesReservedAndBinaryBytes) {
    EXPECT_EQ(Utils::percentEncode("1&b=2", "&="), "1%26b%3D2");
    EXPECT_EQ(Utils::percentEncode("50%", ""), "50%25");
    EXPECT_EQ(Utils::percentEncode(std::string("\xFF\n", 2), ""), "%FF%0A");
    EXPECT_EQ(Utils::percentEncode("red shoes", ":"), "red shoes");
    EXPECT_EQ(Utils::percentDecode(Utils::percentEncode("a:b&c", ":&")), "a:b&c");
}

TEST(UtilsTest, ParseQuery) {
    auto params = Utils::parseQuery("tags=a%2Cb&flag&&limit=10");
    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params[0], (std::pair<std::string, std::string>{"tags", "a,b"}));
    EXPECT_EQ(params[1], (std::pair<std::string, std::string>{"flag", ""}));
    EXPECT_EQ(params[2], (std::pair<std::string, std::string>{"limit", "10"}));
    EXPECT_TRUE(Utils::parseQuery("").empty());
}

// --- Configuration ---

TEST(UtilsTest, ApplyConfigValue) {
    AppConfig config;
    EXPECT_TRUE(Utils::applyConfigValue(config, "memory_max_items", "500"));
    EXPECT_EQ(config.memory_max_items, 500u);
    EXPECT_TRUE(Utils::applyConfigValue(config, "eviction_policy", "LFU"));
    EXPECT_EQ(config.eviction_policy, "lfu");
    EXPECT_TRUE(Utils::applyConfigValue(config, "use_remote", "off"));
    EXPECT_FALSE(config.use_remote);
    EXPECT_TRUE(Utils::applyConfigValue(config, "remote_nodes", "a:7000,b:7001"));
    EXPECT_EQ(config.remote_nodes.size(), 2u);
    EXPECT_TRUE(Utils::applyConfigValue(config, "reconnect_multiplier", "1.5"));
    EXPECT_DOUBLE_EQ(config.reconnect_multiplier, 1.5);

    EXPECT_FALSE(Utils::applyConfigValue(config, "no_such_key", "1"));
    EXPECT_THROW(Utils::applyConfigValue(config, "admin_port", "abc"), std::invalid_argument);
    EXPECT_THROW(Utils::applyConfigValue(config, "default_ttl_seconds", "0"), std::invalid_argument);
    EXPECT_THROW(Utils::applyConfigValue(config, "eviction_policy", "fifo"), std::invalid_argument);
    EXPECT_THROW(Utils::applyConfigValue(config, "read_through", "sometimes"), std::invalid_argument);
    EXPECT_THROW(Utils::applyConfigValue(config, "reconnect_multiplier", "0.5"), std::invalid_argument);
}

TEST(UtilsTest, EveryConfigKeyIsApplicable) {
    for (const auto& key : Utils::configKeys()) {
        AppConfig config;
        bool known = false;
        try {
            known = Utils::applyConfigValue(config, key, "1");
        } catch (const std::invalid_argument&) {
            known = true;
        }
        EXPECT_TRUE(known) << key;
    }
}

TEST(UtilsTest, LoadConfigurationDefaults) {
    AppConfig config = Utils::loadConfiguration({}, {"/nonexistent/tiercache.config"});
    EXPECT_EQ(config.admin_port, 9100);
    EXPECT_EQ(config.default_ttl_seconds, 3600);
    EXPECT_EQ(config.eviction_policy, "lru");
    EXPECT_TRUE(config.use_remote);
}

TEST(UtilsTest, LoadConfigurationPrecedence) {
    const std::string path = ::testing::TempDir() + "tiercache_test.config";
    {
        std::ofstream file(path);
        file << "# comment\n"
             << "admin_port = 9300\n"
             << "memory_max_items = 250\n"
             << "key_namespace = from-file\n"
             << "malformed line\n"
             << "default_ttl_seconds = -5\n";
    }
    setenv("TIERCACHE_MEMORY_MAX_ITEMS", "400", 1);
    setenv("TIERCACHE_KEY_NAMESPACE", "from-env", 1);

    AppConfig config = Utils::loadConfiguration({{"key_namespace", "from-cli"}}, {path});

    unsetenv("TIERCACHE_MEMORY_MAX_ITEMS");
    unsetenv("TIERCACHE_KEY_NAMESPACE");
    std::remove(path.c_str());

    EXPECT_EQ(config.admin_port, 9300);
    EXPECT_EQ(config.memory_max_items, 400u);
    EXPECT_EQ(config.key_namespace, "from-cli");
    // Invalid values are reported and the default kept.
    EXPECT_EQ(config.default_ttl_seconds, 3600);
}

// --- Warm-up documents ---

TEST(UtilsTest, ParseWarmUpItems) {
    auto document = nlohmann::json::parse(R"([
        {"key": "greeting", "value": "hello", "ttl": 60, "tags": ["static"]},
        {"key": "user:1", "value": {"id": 1}, "dependencies": ["db:users"]},
        {"value": "missing key"},
        "not an object",
        {"key": "typed", "value": "<p/>", "type": "text/html", "ttl": null}
    ])");

    std::vector<std::string> errors;
    auto items = Utils::parseWarmUpItems(document, &errors);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(errors.size(), 2u);

    EXPECT_EQ(items[0].key, "greeting");
    EXPECT_EQ(items[0].value, (CacheValue{"hello", "text/plain"}));
    EXPECT_EQ(items[0].ttl_seconds, std::optional<int>(60));
    EXPECT_EQ(items[0].tags, (std::set<std::string>{"static"}));

    EXPECT_EQ(items[1].value.type, "application/json");
    EXPECT_EQ(nlohmann::json::parse(items[1].value.data)["id"], 1);
    EXPECT_EQ(items[1].dependencies, (std::set<std::string>{"db:users"}));
    EXPECT_FALSE(items[1].ttl_seconds.has_value());

    EXPECT_EQ(items[2].value.type, "text/html");
    EXPECT_FALSE(items[2].ttl_seconds.has_value());

    EXPECT_THROW(Utils::parseWarmUpItems(nlohmann::json::object()), std::invalid_argument);
}
