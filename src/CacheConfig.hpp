#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <cstddef>

// Caching policy of one engine instance. Build it at startup, then share it
// read-only; the setters throw std::invalid_argument on out-of-range values.
class CacheConfig {
    public:
        static constexpr size_t DEFAULT_MAX_OBJECT_SIZE_BYTES = 8192;
        static constexpr size_t DEFAULT_MAX_CACHE_ENTRIES = 1000;
        static constexpr bool DEFAULT_HEURISTIC_CACHING_ENABLED = false;
        static constexpr float DEFAULT_HEURISTIC_COEFFICIENT = 0.1f;
        static constexpr long DEFAULT_HEURISTIC_LIFETIME = 0;

        CacheConfig();

        bool isSharedCache() const { return sharedCache; }
        void setSharedCache(bool isSharedCache);

        bool isHeuristicCachingEnabled() const { return heuristicCachingEnabled; }
        void setHeuristicCachingEnabled(bool enabled);

        // fraction of (Date - Last-Modified) used as heuristic lifetime, in [0,1]
        float getHeuristicCoefficient() const { return heuristicCoefficient; }
        void setHeuristicCoefficient(float coefficient);

        // seconds, used when Last-Modified is not available
        long getHeuristicDefaultLifetime() const { return heuristicDefaultLifetime; }
        void setHeuristicDefaultLifetime(long seconds);

        size_t getMaxObjectSizeBytes() const { return maxObjectSizeBytes; }
        void setMaxObjectSizeBytes(size_t bytes);

        size_t getMaxCacheEntries() const { return maxCacheEntries; }
        void setMaxCacheEntries(size_t entries);

    private:
        bool sharedCache;
        bool heuristicCachingEnabled;
        float heuristicCoefficient;
        long heuristicDefaultLifetime;
        size_t maxObjectSizeBytes;
        size_t maxCacheEntries;
};

#endif
