#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"

struct CacheEntry {
    json value; // The actual data
    std::chrono::steady_clock::time_point expiry; // Use steady_clock for TTL
};

// Namespaced key -> (value, expiry) table.
//
// Expiry is lazy: an entry whose TTL has passed is removed by the read that
// finds it, never returned. purgeExpired() is an optional sweep and nothing
// depends on it being called. Entries are not bounded in number.
class InMemoryCache : public CacheInterface {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using ClockFn = std::function<TimePoint()>;

    // A null clock means std::chrono::steady_clock::now. Logger may be null.
    explicit InMemoryCache(std::string cache_namespace,
                           std::chrono::milliseconds default_ttl = std::chrono::minutes(5),
                           std::shared_ptr<ILogger> logger = nullptr,
                           ClockFn clock = nullptr);

    ~InMemoryCache() override = default;

    InMemoryCache(const InMemoryCache&) = delete;
    InMemoryCache& operator=(const InMemoryCache&) = delete;

    void set(const std::string& key, const json& value,
             std::chrono::milliseconds ttl = std::chrono::milliseconds::zero()) override;
    std::optional<json> get(const std::string& key) override;
    bool exists(const std::string& key) override;

    bool invalidate(const std::string& key) override;
    size_t invalidatePattern(const std::regex& pattern) override;
    size_t invalidateIf(const KeyPredicate& predicate) override;
    size_t clear() override;

    CacheStats getStats() const override;
    void resetStats() override;

    void enable() override;
    void disable() override;
    bool isEnabled() const override;

    std::string qualify(const std::string& key) const override;

    size_t purgeExpired();

    const std::string& cacheNamespace() const { return namespace_; }
    std::chrono::milliseconds defaultTtl() const { return default_ttl_; }

private:
    std::unordered_map<std::string, CacheEntry> cache_; // qualified key -> {value, expiry}

    mutable std::mutex mutex_;
    const std::string namespace_;
    const std::chrono::milliseconds default_ttl_;
    std::shared_ptr<ILogger> logger_;
    ClockFn clock_;
    std::atomic<bool> enabled_{true};

    // Guarded by mutex_
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t sets_ = 0;
    uint64_t invalidations_ = 0;
    uint64_t expirations_ = 0;

    static bool isExpired(const CacheEntry& entry, TimePoint now) { return now > entry.expiry; }
    size_t removeMatching(const KeyPredicate& predicate); // caller holds mutex_
    void logDebug(const std::string& message) const;
};

#endif // INMEMORYCACHE_HPP
