#include "CacheKey.hpp"

#include <sstream>
#include <stdexcept>

namespace {
    const std::string REGEX_SPECIAL_CHARS = R"(\^$.|?*+()[]{}/)";
}

std::string CacheKey::make(const std::string& operation, const json& params) {
    if (operation.empty()) {
        throw std::invalid_argument("Cache key operation cannot be empty");
    }
    if (params.is_null()) {
        return operation;
    }
    if (!params.is_object()) {
        throw std::invalid_argument("Cache key parameters for '" + operation + "' must be a JSON object");
    }

    // nlohmann::json objects iterate in key order, which gives the stable ordering.
    std::string encoded;
    for (const auto& item : params.items()) {
        if (item.value().is_null()) {
            continue;
        }
        if (!encoded.empty()) {
            encoded += '&';
        }
        encoded += encodeComponent(item.key()) + "=" + encodeValue(item.value());
    }

    if (encoded.empty()) {
        return operation;
    }
    return operation + ":" + encoded;
}

std::string CacheKey::encodeComponent(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '%': out += "%25"; break;
            case '&': out += "%26"; break;
            case '=': out += "%3D"; break;
            default: out += c;
        }
    }
    return out;
}

std::string CacheKey::encodeValue(const json& value) {
    // A string that reads as JSON ("10", "true") is quoted so it cannot collide
    // with the non-string value it spells.
    if (value.is_string() && !json::accept(value.get_ref<const std::string&>())) {
        return encodeComponent(value.get<std::string>());
    }
    return encodeComponent(value.dump());
}

std::string CacheKey::escapeRegex(const std::string& text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (REGEX_SPECIAL_CHARS.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::regex CacheKey::operationPattern(const std::string& qualified_operation) {
    return std::regex("^" + escapeRegex(qualified_operation) + "(?::|$)");
}

std::regex CacheKey::mentionPattern(const std::string& qualified_operation, const std::string& needle) {
    return std::regex("^" + escapeRegex(qualified_operation) + ":.*" + escapeRegex(needle));
}

std::regex CacheKey::paramPattern(const std::string& qualified_operation,
                                  const std::string& name,
                                  const std::string& value) {
    std::ostringstream ss;
    ss << "^" << escapeRegex(qualified_operation) << ":(?:.*&)?"
       << escapeRegex(encodeComponent(name) + "=" + encodeValue(json(value)))
       << "(?:&|$)";
    return std::regex(ss.str());
}
