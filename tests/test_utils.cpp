// tests/test_utils.cpp
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/Errors.hpp"
#include "../src/models/ApiEndpointInfo.hpp"
#include "../src/utils/Utils.hpp"

namespace testing {
    void PrintTo(const ApiEndpointInfo& info, std::ostream* os) {
        *os << "ApiEndpointInfo{"
            << "url: " << info.url
            << ", host: " << info.host
            << ", port: " << info.port
            << ", base_path: " << info.base_path
            << ", is_https: " << (info.is_https ? "true" : "false")
            << "}";
    }
}

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"id=abc"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("id"), "abc");
}

TEST(UtilsTest, ParseArgumentsDashedKeysAndFlags) {
    std::vector<std::string> args = {"--parent-page=p1", "--no-cache", "title=Hello World"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 3);
    EXPECT_EQ(result->at("parent-page"), "p1");
    EXPECT_EQ(result->at("no-cache"), "true");
    EXPECT_EQ(result->at("title"), "Hello World");
}

TEST(UtilsTest, ParseArgumentsValueMayContainEquals) {
    std::vector<std::string> args = {R"(filter={"a":"b=c"})"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("filter"), R"({"a":"b=c"})");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    std::vector<std::string> args = {"keyvalue"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    EXPECT_FALSE(Utils::parseArguments({"=value"}).has_value());
    EXPECT_FALSE(Utils::parseArguments({"--=value"}).has_value());
    EXPECT_FALSE(Utils::parseArguments({"--"}).has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // Any invalid argument fails the whole parse
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

// --- Tests for small helpers ---

TEST(UtilsTest, StringToInt) {
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_EQ(Utils::stringToInt("-7"), -7);
    EXPECT_FALSE(Utils::stringToInt("42abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999").has_value());
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  abc \t\n"), "abc");
    EXPECT_EQ(Utils::trim("abc"), "abc");
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_THROW(Utils::stringToLogLevel("LOUD"), std::invalid_argument);
}

TEST(UtilsTest, UrlEncode) {
    EXPECT_EQ(Utils::urlEncode("abc-_.~123"), "abc-_.~123");
    EXPECT_EQ(Utils::urlEncode("a b&c=d/e+f"), "a%20b%26c%3Dd%2Fe%2Bf");
}

TEST(UtilsTest, BuildQueryStringSkipsAbsentValues) {
    EXPECT_EQ(Utils::buildQueryString({{"a", std::nullopt}}), "");
    EXPECT_EQ(Utils::buildQueryString({{"block_id", std::string("p1")}, {"start_cursor", std::nullopt},
                                       {"page_size", std::string("10")}}),
              "?block_id=p1&page_size=10");
}

// --- Tests for parseUrl ---

TEST(UtilsTest, ParseUrlHttpsWithPath) {
    ApiEndpointInfo info;
    ASSERT_TRUE(Utils::parseUrl("https://api.notion.com/v1", &info));
    EXPECT_EQ(info.host, "api.notion.com");
    EXPECT_EQ(info.port, 443);
    EXPECT_EQ(info.base_path, "/v1");
    EXPECT_TRUE(info.is_https);
    EXPECT_EQ(info.target("/pages/x"), "/v1/pages/x");
}

TEST(UtilsTest, ParseUrlExplicitPortAndTrailingSlash) {
    ApiEndpointInfo info;
    ASSERT_TRUE(Utils::parseUrl("https://localhost:8443/api/v1/", &info));
    EXPECT_EQ(info.host, "localhost");
    EXPECT_EQ(info.port, 8443);
    EXPECT_EQ(info.base_path, "/api/v1");
}

TEST(UtilsTest, ParseUrlHttpWithoutPath) {
    ApiEndpointInfo info;
    ASSERT_TRUE(Utils::parseUrl("http://example.com", &info));
    EXPECT_EQ(info.port, 80);
    EXPECT_EQ(info.base_path, "");
    EXPECT_FALSE(info.is_https);
}

TEST(UtilsTest, ParseUrlRejectsInvalid) {
    std::streambuf* oldCerr = std::cerr.rdbuf();
    std::ostringstream newCerr;
    std::cerr.rdbuf(newCerr.rdbuf());

    ApiEndpointInfo info;
    bool plain = Utils::parseUrl("api.notion.com/v1", &info);
    bool bad_port = Utils::parseUrl("https://host:70000/v1", &info);
    bool ftp = Utils::parseUrl("ftp://host/v1", &info);

    std::cerr.rdbuf(oldCerr);
    EXPECT_FALSE(plain);
    EXPECT_FALSE(bad_port);
    EXPECT_FALSE(ftp);
}

// --- Tests for applyConfiguration ---

TEST(UtilsTest, ApplyConfigurationNotionToken) {
    AppConfig config;
    Utils::applyConfiguration(json::parse(R"({"notion": {"apiToken": "secret_new"}})"), config);
    EXPECT_EQ(config.api_token, "secret_new");
}

TEST(UtilsTest, ApplyConfigurationLegacyMcpToken) {
    AppConfig config;
    Utils::applyConfiguration(json::parse(R"({"mcpServer": {"env": {"NOTION_API_TOKEN": "secret_legacy"}}})"), config);
    EXPECT_EQ(config.api_token, "secret_legacy");
}

TEST(UtilsTest, ApplyConfigurationPrefersNotionToken) {
    AppConfig config;
    Utils::applyConfiguration(json::parse(R"({
        "notion": {"apiToken": "secret_new"},
        "mcpServer": {"env": {"NOTION_API_TOKEN": "secret_legacy"}}
    })"), config);
    EXPECT_EQ(config.api_token, "secret_new");
}

TEST(UtilsTest, ApplyConfigurationCacheAndHttpSections) {
    AppConfig config;
    Utils::applyConfiguration(json::parse(R"({
        "log_level": "INFO",
        "cache": {
            "namespace": "team-a",
            "enabled": false,
            "single_flight": true,
            "default_ttl_seconds": 60,
            "short_ttl_seconds": 30,
            "medium_ttl_seconds": 120,
            "long_ttl_seconds": 600
        },
        "http": {
            "base_url": "https://proxy.internal:8443/notion/v1",
            "timeout_ms": 5000,
            "max_retries": 2
        }
    })"), config);

    EXPECT_EQ(config.log_level, LogUtils::LogLevel::INFO);
    EXPECT_EQ(config.cache_namespace, "team-a");
    EXPECT_FALSE(config.cache_enabled);
    EXPECT_TRUE(config.cache_single_flight);
    EXPECT_EQ(config.defaultTtl(), std::chrono::seconds(60));
    EXPECT_EQ(config.shortTtl(), std::chrono::seconds(30));
    EXPECT_EQ(config.mediumTtl(), std::chrono::seconds(120));
    EXPECT_EQ(config.longTtl(), std::chrono::seconds(600));
    EXPECT_EQ(config.api_endpoint.host, "proxy.internal");
    EXPECT_EQ(config.api_endpoint.port, 8443);
    EXPECT_EQ(config.api_endpoint.base_path, "/notion/v1");
    EXPECT_EQ(config.request_timeout_in_millis, 5000);
    EXPECT_EQ(config.request_max_retries, 2);
}

TEST(UtilsTest, ApplyConfigurationRejectsBadValues) {
    AppConfig config;
    EXPECT_THROW(Utils::applyConfiguration(json::parse(R"({"cache": {"short_ttl_seconds": 0}})"), config), ConfigError);
    EXPECT_THROW(Utils::applyConfiguration(json::parse(R"({"cache": {"enabled": "yes"}})"), config), ConfigError);
    EXPECT_THROW(Utils::applyConfiguration(json::parse(R"({"http": {"max_retries": -1}})"), config), ConfigError);
    EXPECT_THROW(Utils::applyConfiguration(json::parse(R"({"log_level": "LOUD"})"), config), ConfigError);
    EXPECT_THROW(Utils::applyConfiguration(json::parse("[]"), config), ConfigError);
}

TEST(UtilsTest, AppConfigDefaults) {
    AppConfig config;
    EXPECT_EQ(config.api_endpoint.host, "api.notion.com");
    EXPECT_EQ(config.api_endpoint.port, 443);
    EXPECT_EQ(config.api_endpoint.base_path, "/v1");
    EXPECT_EQ(config.notion_version, "2022-06-28");
    EXPECT_EQ(config.cache_namespace, "notion-workspace-manager");
    EXPECT_EQ(config.shortTtl(), std::chrono::minutes(5));
    EXPECT_EQ(config.mediumTtl(), std::chrono::minutes(15));
    EXPECT_EQ(config.longTtl(), std::chrono::hours(1));
    EXPECT_EQ(config.request_max_retries, 0);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
}

TEST(UtilsTest, ConfigToStringHidesToken) {
    AppConfig config;
    config.api_token = "secret_do_not_print";
    EXPECT_EQ(config.to_string().find("secret_do_not_print"), std::string::npos);
}

// --- Tests for loadConfiguration ---

class LoadConfigurationTest : public ::testing::Test {
protected:
    std::string path = "notion_cli_test_config.json";
    std::optional<std::string> saved_token;

    void SetUp() override {
        const char* token = std::getenv(Constants::TOKEN_ENV_VARIABLE);
        if (token != nullptr) {
            saved_token = token;
        }
        unsetenv(Constants::TOKEN_ENV_VARIABLE);
    }

    void TearDown() override {
        std::remove(path.c_str());
        if (saved_token) {
            setenv(Constants::TOKEN_ENV_VARIABLE, saved_token->c_str(), 1);
        } else {
            unsetenv(Constants::TOKEN_ENV_VARIABLE);
        }
    }

    void writeConfig(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }
};

TEST_F(LoadConfigurationTest, ReadsExplicitPath) {
    writeConfig(R"({"notion": {"apiToken": "secret_file"}, "cache": {"namespace": "ns-file"}})");

    AppConfig config = Utils::loadConfiguration({{"config", path}});
    EXPECT_EQ(config.api_token, "secret_file");
    EXPECT_EQ(config.cache_namespace, "ns-file");
    EXPECT_EQ(config.config_path, path);
}

TEST_F(LoadConfigurationTest, FallsBackToEnvironmentToken) {
    writeConfig(R"({"cache": {"namespace": "ns-env"}})");
    setenv(Constants::TOKEN_ENV_VARIABLE, "secret_env", 1);

    AppConfig config = Utils::loadConfiguration({{"config", path}});
    EXPECT_EQ(config.api_token, "secret_env");
}

TEST_F(LoadConfigurationTest, MissingTokenIsConfigError) {
    writeConfig(R"({"notion": {}})");

    try {
        Utils::loadConfiguration({{"config", path}});
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(),
            "Missing Notion API token in config.json (expected notion.apiToken or mcpServer.env.NOTION_API_TOKEN)");
    }
}

TEST_F(LoadConfigurationTest, MissingExplicitFileIsConfigError) {
    setenv(Constants::TOKEN_ENV_VARIABLE, "secret_env", 1);
    EXPECT_THROW(Utils::loadConfiguration({{"config", "does/not/exist.json"}}), ConfigError);
}

TEST_F(LoadConfigurationTest, InvalidJsonIsConfigError) {
    writeConfig("{not json");
    EXPECT_THROW(Utils::loadConfiguration({{"config", path}}), ConfigError);
}

TEST_F(LoadConfigurationTest, LogLevelArgumentOverridesFile) {
    writeConfig(R"({"notion": {"apiToken": "t"}, "log_level": "CERROR"})");

    AppConfig config = Utils::loadConfiguration({{"config", path}, {"log-level", "DEBUG"}});
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
}
