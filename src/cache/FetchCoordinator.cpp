#include "FetchCoordinator.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

FetchCoordinator::FetchCoordinator(std::shared_ptr<CacheInterface> cache, std::shared_ptr<ILogger> logger)
    : cache_(std::move(cache)), logger_(std::move(logger)) {
    if (!cache_) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

json FetchCoordinator::getOrFetch(const std::string& key, const Producer& producer, const FetchOptions& options) {
    if (!producer) {
        throw std::invalid_argument("Producer cannot be empty for key: " + key);
    }

    // --- Bypass: the cache is not consulted at all ---
    if (options.bypass_cache || !cache_->isEnabled()) {
        if (logger_->isDebugEnabled()) {
            logger_->debug("Bypassing cache for key : " + key);
        }
        return producer();
    }

    // --- Check Cache ---
    if (auto cached = cache_->get(key)) {
        return std::move(*cached);
    }

    if (options.single_flight) {
        return fetchSingleFlight(key, producer, options);
    }
    return fetchAndStore(key, producer, options);
}

json FetchCoordinator::fetchAndStore(const std::string& key, const Producer& producer, const FetchOptions& options) {
    json value;
    try {
        value = producer();
    } catch (const std::exception& e) {
        logger_->debug("Fetch failed for key : " + key + ", nothing cached: " + e.what());
        throw;
    }
    store(key, value, options);
    return value;
}

json FetchCoordinator::fetchSingleFlight(const std::string& key, const Producer& producer, const FetchOptions& options) {
    std::promise<json> promise;
    std::shared_future<json> shared;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            shared = it->second;
        } else {
            shared = promise.get_future().share();
            in_flight_.emplace(key, shared);
            leader = true;
        }
    }

    if (!leader) {
        if (logger_->isDebugEnabled()) {
            logger_->debug("Joining in-flight fetch for key : " + key);
        }
        return shared.get(); // rethrows the leader's exception
    }

    json value;
    try {
        value = producer();
    } catch (...) {
        // Waiters get the same exception; the slot is released so the next call retries.
        logger_->debug("Fetch failed for key : " + key + ", nothing cached");
        finishInFlight(key);
        promise.set_exception(std::current_exception());
        throw;
    }

    // Store before releasing the in-flight slot so a late caller finds the entry.
    store(key, value, options);
    finishInFlight(key);
    promise.set_value(value);
    return value;
}

void FetchCoordinator::store(const std::string& key, const json& value, const FetchOptions& options) {
    try {
        cache_->set(key, value, options.ttl);
    } catch (const std::exception& e) {
        // The fetched value is still good; only the cached copy is lost.
        logger_->warn("Failed to cache key : " + key + ": " + e.what());
    }
}

void FetchCoordinator::finishInFlight(const std::string& key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(key);
}

size_t FetchCoordinator::inFlightCount() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}
