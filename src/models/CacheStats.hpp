#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

// Point-in-time snapshot of a cache instance's counters.
struct CacheStats {
    std::string cache_namespace;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t invalidations = 0; // entries removed by invalidate or pattern invalidation; clear() resets it
    uint64_t expirations = 0;   // entries removed because their TTL had passed
    size_t size = 0;
    bool enabled = true;

    double hitRate() const {
        uint64_t lookups = hits + misses;
        if (lookups == 0) {
            return 0.0;
        }
        return static_cast<double>(hits) / static_cast<double>(lookups);
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"namespace", cache_namespace},
            {"enabled", enabled},
            {"size", size},
            {"hits", hits},
            {"misses", misses},
            {"hitRate", hitRate()},
            {"sets", sets},
            {"invalidations", invalidations},
            {"expirations", expirations}
        };
    }
};

#endif // CACHESTATS_HPP
