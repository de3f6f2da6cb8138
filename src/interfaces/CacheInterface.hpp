#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>

#include <nlohmann/json.hpp>

#include "../models/CacheStats.hpp"

using json = nlohmann::json;

// Predicate over a fully qualified ("<namespace>:<key>") cache key.
using KeyPredicate = std::function<bool(const std::string&)>;

// Keys passed in are unqualified; implementations apply their namespace.
// Patterns and predicates see the qualified key.
class CacheInterface {
public:
    virtual ~CacheInterface() = default;

    // ttl <= 0 means "use the cache's default TTL".
    virtual void set(const std::string& key, const json& value,
                     std::chrono::milliseconds ttl = std::chrono::milliseconds::zero()) = 0;
    virtual std::optional<json> get(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;

    virtual bool invalidate(const std::string& key) = 0;
    virtual size_t invalidatePattern(const std::regex& pattern) = 0;
    virtual size_t invalidateIf(const KeyPredicate& predicate) = 0;
    virtual size_t clear() = 0;

    virtual CacheStats getStats() const = 0;
    virtual void resetStats() = 0;

    virtual void enable() = 0;
    virtual void disable() = 0;
    virtual bool isEnabled() const = 0;

    virtual std::string qualify(const std::string& key) const = 0;
};

#endif // CACHEINTERFACE_HPP
