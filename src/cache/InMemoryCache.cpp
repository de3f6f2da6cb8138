#include "InMemoryCache.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

using namespace std::chrono;

InMemoryCache::InMemoryCache(std::string cache_namespace,
                             milliseconds default_ttl,
                             std::shared_ptr<ILogger> logger,
                             ClockFn clock)
    : namespace_(std::move(cache_namespace)),
      default_ttl_(default_ttl),
      logger_(std::move(logger)),
      clock_(clock ? std::move(clock) : ClockFn([] { return steady_clock::now(); })) {
    if (default_ttl_ <= milliseconds::zero()) {
        throw std::invalid_argument("Default TTL must be positive for cache namespace: " + namespace_);
    }
}

std::string InMemoryCache::qualify(const std::string& key) const {
    if (namespace_.empty()) {
        return key;
    }
    return namespace_ + ":" + key;
}

void InMemoryCache::set(const std::string& key, const json& value, milliseconds ttl) {
    milliseconds effective_ttl = (ttl > milliseconds::zero()) ? ttl : default_ttl_;
    std::string full_key = qualify(key);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheEntry& entry = cache_[full_key];
        entry.value = value;
        entry.expiry = clock_() + effective_ttl;
        ++sets_;
    }
    logDebug("Cache set for key : " + full_key + " (ttl " + std::to_string(effective_ttl.count()) + "ms)");
}

std::optional<json> InMemoryCache::get(const std::string& key) {
    std::string full_key = qualify(key);
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = cache_.find(full_key);
    if (it == cache_.end()) {
        ++misses_;
        lock.unlock();
        logDebug("Cache miss for key : " + full_key);
        return std::nullopt;
    }

    if (isExpired(it->second, clock_())) {
        cache_.erase(it);
        ++expirations_;
        ++misses_;
        lock.unlock();
        logDebug("Cache entry expired for key : " + full_key);
        return std::nullopt;
    }

    ++hits_;
    json value = it->second.value;
    lock.unlock();
    logDebug("Cache hit for key : " + full_key);
    return value;
}

bool InMemoryCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(qualify(key));
    return it != cache_.end() && !isExpired(it->second, clock_());
}

bool InMemoryCache::invalidate(const std::string& key) {
    std::string full_key = qualify(key);
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = cache_.erase(full_key) > 0;
        if (removed) {
            ++invalidations_;
        }
    }
    if (removed) {
        logDebug("Cache invalidated key : " + full_key);
    }
    return removed;
}

size_t InMemoryCache::invalidatePattern(const std::regex& pattern) {
    return invalidateIf([&pattern](const std::string& full_key) {
        return std::regex_search(full_key, pattern);
    });
}

size_t InMemoryCache::invalidateIf(const KeyPredicate& predicate) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = removeMatching(predicate);
        invalidations_ += removed;
    }
    if (removed > 0) {
        logDebug("Cache invalidated " + std::to_string(removed) + " entries in namespace " + namespace_);
    }
    return removed;
}

size_t InMemoryCache::clear() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = cache_.size();
        cache_.clear();
        hits_ = 0;
        misses_ = 0;
        sets_ = 0;
        invalidations_ = 0;
        expirations_ = 0;
    }
    logDebug("Cache cleared " + std::to_string(removed) + " entries in namespace " + namespace_);
    return removed;
}

CacheStats InMemoryCache::getStats() const {
    CacheStats stats;
    stats.cache_namespace = namespace_;
    stats.enabled = enabled_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    stats.hits = hits_;
    stats.misses = misses_;
    stats.sets = sets_;
    stats.invalidations = invalidations_;
    stats.expirations = expirations_;
    stats.size = cache_.size();
    return stats;
}

void InMemoryCache::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    hits_ = 0;
    misses_ = 0;
    sets_ = 0;
    invalidations_ = 0;
    expirations_ = 0;
}

void InMemoryCache::enable() {
    enabled_.store(true);
    logDebug("Cache enabled for namespace " + namespace_);
}

// Entries are kept; they become visible again after enable() if still fresh.
void InMemoryCache::disable() {
    enabled_.store(false);
    logDebug("Cache disabled for namespace " + namespace_);
}

bool InMemoryCache::isEnabled() const {
    return enabled_.load();
}

size_t InMemoryCache::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end(); ) {
        if (isExpired(it->second, now)) {
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expirations_ += removed;
    return removed;
}

// Private helper, caller holds mutex_
size_t InMemoryCache::removeMatching(const KeyPredicate& predicate) {
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end(); ) {
        if (predicate(it->first)) {
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void InMemoryCache::logDebug(const std::string& message) const {
    if (logger_ && logger_->isDebugEnabled()) {
        logger_->debug(message);
    }
}
