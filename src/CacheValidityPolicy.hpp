#ifndef CACHEVALIDITYPOLICY_HPP
#define CACHEVALIDITYPOLICY_HPP

#include <ctime>
#include <string>

#include "CacheConfig.hpp"
#include "CacheEntry.hpp"

// Age, freshness and staleness of a stored entry (RFC 7234 section 4.2).
// Every result is in whole seconds and never negative. Malformed header
// values never make an entry look fresher than it is.
class CacheValidityPolicy {
    public:
        // reported for an Age header that cannot be trusted
        static constexpr long MAX_AGE = 2147483648L;

        explicit CacheValidityPolicy(const CacheConfig & config);

        long getCurrentAgeSecs(const CacheEntry & entry, time_t now) const;
        long getFreshnessLifetimeSecs(const CacheEntry & entry) const;
        bool isResponseFresh(const CacheEntry & entry, time_t now) const;

        long getHeuristicFreshnessLifetimeSecs(const CacheEntry & entry,
                                               float coefficient,
                                               long defaultLifetime) const;
        bool isResponseHeuristicallyFresh(const CacheEntry & entry,
                                          time_t now,
                                          float coefficient,
                                          long defaultLifetime) const;

        long getStalenessSecs(const CacheEntry & entry, time_t now) const;

        bool mustRevalidate(const CacheEntry & entry) const;
        bool proxyRevalidate(const CacheEntry & entry) const;
        bool hasCacheControlDirective(const CacheEntry & entry, const std::string & name) const;

        bool contentLengthHeaderMatchesActualLength(const CacheEntry & entry) const;

    private:
        bool sharedCache;

        long getApparentAgeSecs(const CacheEntry & entry) const;
        long getAgeValue(const CacheEntry & entry) const;
        long getResponseDelaySecs(const CacheEntry & entry) const;
        long getResidentTimeSecs(const CacheEntry & entry, time_t now) const;

        // smallest value of the directive, -1 when absent, 0 when malformed
        long getDirectiveSecs(const CacheEntry & entry, const std::string & name) const;
};

#endif
