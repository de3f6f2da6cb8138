#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../core/Errors.hpp"

using namespace std;
using json = nlohmann::json;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return str;
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses "key=value", "--key=value" and bare "--flag" (stored as "true").
    // Keys keep their dashes: "--parent-page=x" -> {"parent-page", "x"}.
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& raw : args) {
            string arg = raw;
            bool dashed = arg.rfind("--", 0) == 0;
            if (dashed) {
                arg = arg.substr(2);
            }
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else if (dashed && !arg.empty() && delimiterPos == string::npos) {
                argMap[arg] = "true";
            } else {
                cerr << "Error: Invalid argument format: '" << raw << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    static std::vector<std::string> defaultConfigPaths() {
        std::vector<std::string> config_paths = {
            "config.json",      // Current directory
            "../config.json"    // Parent directory
        };
        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            config_paths.push_back(std::string(home) + "/.config/notion-cli/config.json");
        }
        return config_paths;
    }

    // Load configuration from the JSON config file and command-line arguments.
    // "config=<path>" selects the file explicitly; otherwise the default paths
    // are tried in order. Throws ConfigError when no API token can be found.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths;
        auto explicit_path = startupArguments.find("config");
        if (explicit_path != startupArguments.end()) {
            config_paths.push_back(explicit_path->second);
        } else {
            config_paths = defaultConfigPaths();
        }

        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            json file_json;
            try {
                file_json = json::parse(configFile);
            } catch (const json::parse_error& e) {
                throw ConfigError("Invalid JSON in " + config_path + ": " + e.what());
            }
            applyConfiguration(file_json, config);
            config.config_path = config_path;
            break;
        }

        if (config.config_path.empty() && explicit_path != startupArguments.end()) {
            throw ConfigError("Configuration file not found: " + explicit_path->second);
        }

        if (config.api_token.empty()) {
            const char* env_token = std::getenv(Constants::TOKEN_ENV_VARIABLE);
            if (env_token != nullptr) {
                config.api_token = env_token;
            }
        }

        // Process StartUp Arguments
        auto log_level = startupArguments.find("log-level");
        if (log_level != startupArguments.end()) {
            try {
                config.log_level = stringToLogLevel(log_level->second);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
        }

        if (config.api_token.empty()) {
            throw ConfigError("Missing Notion API token in config.json (expected notion.apiToken or mcpServer.env.NOTION_API_TOKEN)");
        }
        return config;
    }

    // Applies a parsed config.json on top of the defaults already in `config`.
    static void applyConfiguration(const json& file_json, AppConfig& config) {
        if (!file_json.is_object()) {
            throw ConfigError("Configuration root must be a JSON object");
        }

        try {
            // Support both the current format and the legacy MCP server format
            if (file_json.contains("notion") && file_json["notion"].is_object()
                && file_json["notion"].value("apiToken", "") != "") {
                config.api_token = file_json["notion"]["apiToken"].get<std::string>();
            } else if (file_json.contains("mcpServer")) {
                const json& mcp = file_json["mcpServer"];
                if (mcp.is_object() && mcp.contains("env") && mcp["env"].is_object()) {
                    config.api_token = mcp["env"].value("NOTION_API_TOKEN", "");
                }
            }

            if (file_json.contains("log_level")) {
                config.log_level = stringToLogLevel(file_json["log_level"].get<std::string>());
            }

            if (file_json.contains("cache")) {
                const json& cache = file_json["cache"];
                config.cache_namespace = cache.value("namespace", config.cache_namespace);
                config.cache_enabled = cache.value("enabled", config.cache_enabled);
                config.cache_single_flight = cache.value("single_flight", config.cache_single_flight);
                config.cache_default_ttl_seconds = positiveOr(cache, "default_ttl_seconds", config.cache_default_ttl_seconds);
                config.cache_short_ttl_seconds = positiveOr(cache, "short_ttl_seconds", config.cache_short_ttl_seconds);
                config.cache_medium_ttl_seconds = positiveOr(cache, "medium_ttl_seconds", config.cache_medium_ttl_seconds);
                config.cache_long_ttl_seconds = positiveOr(cache, "long_ttl_seconds", config.cache_long_ttl_seconds);
            }

            if (file_json.contains("http")) {
                const json& http = file_json["http"];
                if (http.contains("base_url")) {
                    ApiEndpointInfo endpoint;
                    endpoint.url = http["base_url"].get<std::string>();
                    if (!parseUrl(endpoint.url, &endpoint)) {
                        throw ConfigError("Invalid http.base_url: " + endpoint.url);
                    }
                    config.api_endpoint = endpoint;
                }
                config.notion_version = http.value("notion_version", config.notion_version);
                config.request_timeout_in_millis = positiveOr(http, "timeout_ms", config.request_timeout_in_millis);
                int retries = http.value("max_retries", config.request_max_retries);
                if (retries < 0) {
                    throw ConfigError("http.max_retries cannot be negative");
                }
                config.request_max_retries = retries;
            }
        } catch (const json::type_error& e) {
            throw ConfigError(std::string("Configuration value has the wrong type: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    static bool parseUrl(const std::string& url, ApiEndpointInfo* urlInfo) {
        std::smatch match;

        if (std::regex_match(url, match, Constants::url_regex)) {
            std::string scheme = match[1].str();
            bool is_https = (scheme == "https");
            int port;

            if (match[3].matched) { // Port is specified
                auto parsed = stringToInt(match[3].str());
                if (!parsed || *parsed <= 0 || *parsed > 65535) {
                    std::cerr << "Warning: Invalid port number in URL " << url << std::endl;
                    return false;
                }
                port = *parsed;
            } else {
                // Default port based on scheme
                port = is_https ? 443 : 80;
            }

            std::string path = match[4].matched ? match[4].str() : "";
            while (!path.empty() && path.back() == '/') {
                path.pop_back();
            }

            urlInfo->host = match[2].str();
            urlInfo->port = port;
            urlInfo->base_path = path;
            urlInfo->is_https = is_https;
            return true;
        }
        std::cerr << "Error: URL format does not match expected pattern: " << url << std::endl;
        return false; // URL format doesn't match
    }

    // Percent-encodes everything outside the RFC 3986 unreserved set.
    static std::string urlEncode(const std::string& value) {
        std::ostringstream escaped;
        escaped.fill('0');
        escaped << std::hex << std::uppercase;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                escaped << c;
            } else {
                escaped << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return escaped.str();
    }

    // "?a=1&b=2" from the present parameters, "" when none are present.
    static std::string buildQueryString(const std::vector<std::pair<std::string, std::optional<std::string>>>& params) {
        std::string query;
        for (const auto& [name, value] : params) {
            if (!value) {
                continue;
            }
            query += query.empty() ? "?" : "&";
            query += urlEncode(name) + "=" + urlEncode(*value);
        }
        return query;
    }

private:
    static int positiveOr(const json& section, const std::string& key, int fallback) {
        if (!section.contains(key)) {
            return fallback;
        }
        int value = section[key].get<int>();
        if (value <= 0) {
            throw ConfigError(key + " must be positive");
        }
        return value;
    }
};

#endif // UTILS_HPP
