#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <regex>
#include <sstream>
#include <string>

#include "../models/ApiEndpointInfo.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// TTL policy tiers handed to the cache per key.
namespace CacheTTL {
    // Volatile listings: search, database queries, comments.
    static constexpr std::chrono::seconds SHORT{5 * 60};
    // Individual resource reads: pages, blocks, databases.
    static constexpr std::chrono::seconds MEDIUM{15 * 60};
    // User and identity data.
    static constexpr std::chrono::seconds LONG{60 * 60};
}

namespace Constants {
    static constexpr auto DEFAULT_BASE_URL = "https://api.notion.com/v1";
    static constexpr auto NOTION_VERSION = "2022-06-28";
    static constexpr auto DEFAULT_CACHE_NAMESPACE = "notion-workspace-manager";
    static constexpr auto TOKEN_ENV_VARIABLE = "NOTION_API_TOKEN";
    static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?(\/[^?#]*)?$)");
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Remote API
    std::string api_token;
    ApiEndpointInfo api_endpoint;
    std::string notion_version;

    // Cache configuration
    std::string cache_namespace;
    bool cache_enabled;
    bool cache_single_flight;
    int cache_default_ttl_seconds;
    int cache_short_ttl_seconds;
    int cache_medium_ttl_seconds;
    int cache_long_ttl_seconds;

    // Backend network configuration
    int request_timeout_in_millis;
    int request_max_retries;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Where the configuration was read from, empty when only defaults apply.
    std::string config_path;

    AppConfig() {
        api_endpoint.url = Constants::DEFAULT_BASE_URL;
        api_endpoint.host = "api.notion.com";
        api_endpoint.port = 443;
        api_endpoint.base_path = "/v1";
        api_endpoint.is_https = true;
        notion_version = Constants::NOTION_VERSION;

        cache_namespace = Constants::DEFAULT_CACHE_NAMESPACE;
        cache_enabled = true;
        cache_single_flight = false;
        cache_short_ttl_seconds = static_cast<int>(CacheTTL::SHORT.count());
        cache_medium_ttl_seconds = static_cast<int>(CacheTTL::MEDIUM.count());
        cache_long_ttl_seconds = static_cast<int>(CacheTTL::LONG.count());
        cache_default_ttl_seconds = cache_short_ttl_seconds;

        request_timeout_in_millis = 30000;
        request_max_retries = 0;

        log_level = LogUtils::LogLevel::CERROR;
    }

    std::chrono::milliseconds shortTtl() const { return std::chrono::seconds(cache_short_ttl_seconds); }
    std::chrono::milliseconds mediumTtl() const { return std::chrono::seconds(cache_medium_ttl_seconds); }
    std::chrono::milliseconds longTtl() const { return std::chrono::seconds(cache_long_ttl_seconds); }
    std::chrono::milliseconds defaultTtl() const { return std::chrono::seconds(cache_default_ttl_seconds); }

    // The token is never printed.
    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "config_path: " << (config_path.empty() ? "<none>" : config_path) << std::endl
            << "api_base_url: " << api_endpoint.url << std::endl
            << "api_host: " << api_endpoint.host << ":" << api_endpoint.port << std::endl
            << "notion_version: " << notion_version << std::endl
            << "api_token: " << (api_token.empty() ? "<missing>" : "<set>") << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_namespace: " << cache_namespace << std::endl
            << "cache_enabled: " << std::boolalpha << cache_enabled << std::noboolalpha << std::endl
            << "cache_single_flight: " << std::boolalpha << cache_single_flight << std::noboolalpha << std::endl
            << "cache_default_ttl_seconds: " << cache_default_ttl_seconds << std::endl
            << "cache_short_ttl_seconds: " << cache_short_ttl_seconds << std::endl
            << "cache_medium_ttl_seconds: " << cache_medium_ttl_seconds << std::endl
            << "cache_long_ttl_seconds: " << cache_long_ttl_seconds << std::endl
            << "// --- Logging --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "--- Backend Network Configurations --- " << std::endl
            << "request_timeout_in_millis: " << request_timeout_in_millis << std::endl
            << "request_max_retries: " << request_max_retries << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
