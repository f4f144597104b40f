#include "CacheConfig.hpp"
#include <stdexcept>
#include <string>

CacheConfig::CacheConfig()
:   sharedCache(true),
    heuristicCachingEnabled(DEFAULT_HEURISTIC_CACHING_ENABLED),
    heuristicCoefficient(DEFAULT_HEURISTIC_COEFFICIENT),
    heuristicDefaultLifetime(DEFAULT_HEURISTIC_LIFETIME),
    maxObjectSizeBytes(DEFAULT_MAX_OBJECT_SIZE_BYTES),
    maxCacheEntries(DEFAULT_MAX_CACHE_ENTRIES) {}

void CacheConfig::setSharedCache(bool isSharedCache) {
    sharedCache = isSharedCache;
}

void CacheConfig::setHeuristicCachingEnabled(bool enabled) {
    heuristicCachingEnabled = enabled;
}

void CacheConfig::setHeuristicCoefficient(float coefficient) {
    // also rejects NaN
    if (!(coefficient >= 0.0f && coefficient <= 1.0f)) {
        throw std::invalid_argument("heuristic coefficient must be in [0,1], got " + std::to_string(coefficient));
    }
    heuristicCoefficient = coefficient;
}

void CacheConfig::setHeuristicDefaultLifetime(long seconds) {
    if (seconds < 0) {
        throw std::invalid_argument("heuristic default lifetime must not be negative, got " + std::to_string(seconds));
    }
    heuristicDefaultLifetime = seconds;
}

void CacheConfig::setMaxObjectSizeBytes(size_t bytes) {
    maxObjectSizeBytes = bytes;
}

void CacheConfig::setMaxCacheEntries(size_t entries) {
    if (entries == 0) {
        throw std::invalid_argument("max cache entries must be at least 1");
    }
    maxCacheEntries = entries;
}
