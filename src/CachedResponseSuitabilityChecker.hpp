#ifndef CACHEDRESPONSESUITABILITYCHECKER_HPP
#define CACHEDRESPONSESUITABILITYCHECKER_HPP

#include <ctime>
#include <string>

#include "CacheConfig.hpp"
#include "CacheEntry.hpp"
#include "CacheValidityPolicy.hpp"
#include "ConditionalRequestMatcher.hpp"
#include "Request.hpp"

// Decides whether a stored entry may answer a request without going to the
// origin. Holds only configuration, so one instance can serve any number of
// threads.
class CachedResponseSuitabilityChecker {
    public:

        enum Outcome {
            SERVE_FULL,
            SERVE_NOT_MODIFIED,
            MUST_FETCH
        };

        enum MissReason {
            NONE,
            UNSUPPORTED_CONDITIONAL_HEADERS,
            NOT_FRESH_ENOUGH,
            CONTENT_LENGTH_MISMATCH,
            VALIDATORS_DO_NOT_MATCH,
            REQUEST_NO_CACHE,
            REQUEST_NO_STORE,
            REQUEST_MAX_AGE_EXCEEDED,
            REQUEST_MAX_STALE_EXCEEDED,
            REQUEST_MIN_FRESH_NOT_MET,
            MALFORMED_REQUEST_DIRECTIVE
        };

        struct Result {
            Outcome outcome;
            MissReason reason;
            std::string detail;

            bool isHit() const { return outcome != MUST_FETCH; }

            static Result serveFull() { return {SERVE_FULL, NONE, ""}; }
            static Result serveNotModified() { return {SERVE_NOT_MODIFIED, NONE, ""}; }
            static Result miss(MissReason reason, const std::string & detail) { return {MUST_FETCH, reason, detail}; }
        };

        explicit CachedResponseSuitabilityChecker(const CacheConfig & config);
        CachedResponseSuitabilityChecker(const CacheValidityPolicy & validityPolicy, const CacheConfig & config);

        Result canServe(const Request & request, const CacheEntry & entry, time_t now) const;

        static const char * describe(MissReason reason);
        static const char * describe(Outcome outcome);

    private:
        CacheValidityPolicy validityPolicy;
        ConditionalRequestMatcher conditionalMatcher;
        bool sharedCache;
        bool useHeuristicCaching;
        float heuristicCoefficient;
        long heuristicDefaultLifetime;

        bool isFreshEnough(const CacheEntry & entry, const Request & request, time_t now) const;
        bool originInsistsOnFreshness(const CacheEntry & entry) const;

        // -1 when the request has no max-stale, LONG_MAX for a bare one
        long getMaxStale(const Request & request) const;

        Result checkRequestDirectives(const Request & request, const CacheEntry & entry, time_t now) const;
};

#endif
