#ifndef FETCHCOORDINATOR_HPP
#define FETCHCOORDINATOR_HPP

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"

using json = nlohmann::json;

struct FetchOptions {
    std::chrono::milliseconds ttl{0};   // <= 0 falls back to the cache's default TTL
    bool bypass_cache = false;          // neither read nor write the cache for this call
    bool single_flight = false;         // share one producer call between concurrent misses
};

// Get-or-fetch on top of a CacheInterface.
//
// A hit never calls the producer. A miss calls it once and stores the result.
// A producer that throws stores nothing and the exception reaches the caller
// unchanged. A store that throws is logged and the fetched value is still
// returned. With bypass_cache, or while the cache is disabled, the producer
// is called directly and the cache (counters included) is left untouched.
//
// Concurrent misses on one key each call the producer unless single_flight is
// set, in which case later callers wait for the first caller's outcome.
class FetchCoordinator {
public:
    using Producer = std::function<json()>;

    FetchCoordinator(std::shared_ptr<CacheInterface> cache, std::shared_ptr<ILogger> logger);

    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    json getOrFetch(const std::string& key, const Producer& producer, const FetchOptions& options = {});

    // Number of single-flight producer calls currently running.
    size_t inFlightCount() const;

    std::shared_ptr<CacheInterface> cache() const { return cache_; }

private:
    json fetchAndStore(const std::string& key, const Producer& producer, const FetchOptions& options);
    json fetchSingleFlight(const std::string& key, const Producer& producer, const FetchOptions& options);
    void store(const std::string& key, const json& value, const FetchOptions& options);
    void finishInFlight(const std::string& key);

    std::shared_ptr<CacheInterface> cache_;
    std::shared_ptr<ILogger> logger_;

    mutable std::mutex in_flight_mutex_;
    std::unordered_map<std::string, std::shared_future<json>> in_flight_;
};

#endif // FETCHCOORDINATOR_HPP
