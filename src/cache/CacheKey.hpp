#ifndef CACHEKEY_HPP
#define CACHEKEY_HPP

#include <regex>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Canonical cache keys and the patterns used to invalidate them.
//
// make("database_query", {{"id", "A"}, {"pageSize", 10}})
//     -> "database_query:id=A&pageSize=10"
//
// Null parameters are dropped and the rest are ordered by name, so equal
// requests always produce the same key. String values are written as-is,
// anything else as compact JSON, as are strings that would parse as JSON.
// '%', '&' and '=' are percent-encoded.
class CacheKey {
public:
    // params must be a JSON object or null; anything else is a programming error
    // and throws std::invalid_argument.
    static std::string make(const std::string& operation, const json& params = json::object());

    static std::string encodeComponent(const std::string& text);
    static std::string escapeRegex(const std::string& text);

    // Every key of one operation: ^<qualified_operation>(:|$)
    static std::regex operationPattern(const std::string& qualified_operation);

    // Keys of one operation whose parameter section contains `needle` anywhere.
    static std::regex mentionPattern(const std::string& qualified_operation, const std::string& needle);

    // Keys of one operation carrying exactly name=value among their parameters.
    static std::regex paramPattern(const std::string& qualified_operation,
                                   const std::string& name,
                                   const std::string& value);

private:
    static std::string encodeValue(const json& value);
};

#endif // CACHEKEY_HPP
