#include "CachedResponseSuitabilityChecker.hpp"
#include "CacheControl.hpp"
#include <climits>
#include <optional>
#include <vector>

CachedResponseSuitabilityChecker::CachedResponseSuitabilityChecker(const CacheConfig & config)
:   CachedResponseSuitabilityChecker(CacheValidityPolicy(config), config) {}

CachedResponseSuitabilityChecker::CachedResponseSuitabilityChecker(const CacheValidityPolicy & validityPolicy,
                                                                   const CacheConfig & config)
:   validityPolicy(validityPolicy),
    sharedCache(config.isSharedCache()),
    useHeuristicCaching(config.isHeuristicCachingEnabled()),
    heuristicCoefficient(config.getHeuristicCoefficient()),
    heuristicDefaultLifetime(config.getHeuristicDefaultLifetime()) {}

CachedResponseSuitabilityChecker::Result
CachedResponseSuitabilityChecker::canServe(const Request & request, const CacheEntry & entry, time_t now) const {
    if (conditionalMatcher.hasUnsupportedConditionalHeaders(request)) {
        return Result::miss(UNSUPPORTED_CONDITIONAL_HEADERS, "request carries If-Match, If-Range or If-Unmodified-Since");
    }

    if (!isFreshEnough(entry, request, now)) {
        return Result::miss(NOT_FRESH_ENOUGH,
                            "age " + std::to_string(validityPolicy.getCurrentAgeSecs(entry, now))
                            + "s, freshness lifetime " + std::to_string(validityPolicy.getFreshnessLifetimeSecs(entry)) + "s");
    }

    if (!validityPolicy.contentLengthHeaderMatchesActualLength(entry)) {
        return Result::miss(CONTENT_LENGTH_MISMATCH,
                            "Content-Length " + entry.getFirstHeader("Content-Length").value_or("")
                            + " but " + std::to_string(entry.getBodyLength()) + " bytes stored");
    }

    bool conditional = conditionalMatcher.isConditional(request);
    if (conditional && !conditionalMatcher.allConditionalsMatch(request, entry, now)) {
        return Result::miss(VALIDATORS_DO_NOT_MATCH, "request validators do not match the stored entry");
    }

    Result directives = checkRequestDirectives(request, entry, now);
    if (!directives.isHit()) {
        return directives;
    }

    return conditional ? Result::serveNotModified() : Result::serveFull();
}

bool CachedResponseSuitabilityChecker::isFreshEnough(const CacheEntry & entry, const Request & request, time_t now) const {
    if (validityPolicy.isResponseFresh(entry, now)) {
        return true;
    }
    if (useHeuristicCaching &&
        validityPolicy.isResponseHeuristicallyFresh(entry, now, heuristicCoefficient, heuristicDefaultLifetime)) {
        return true;
    }
    if (originInsistsOnFreshness(entry)) {
        return false;
    }
    long maxStale = getMaxStale(request);
    if (maxStale == -1) {
        return false;
    }
    return maxStale > validityPolicy.getStalenessSecs(entry, now);
}

bool CachedResponseSuitabilityChecker::originInsistsOnFreshness(const CacheEntry & entry) const {
    if (validityPolicy.mustRevalidate(entry)) {
        return true;
    }
    if (!sharedCache) {
        return false;
    }
    return validityPolicy.proxyRevalidate(entry)
        || validityPolicy.hasCacheControlDirective(entry, CacheControl::S_MAXAGE);
}

long CachedResponseSuitabilityChecker::getMaxStale(const Request & request) const {
    long maxStale = -1;
    for (const CacheControl::Directive & directive : CacheControl::parse(request.getFields())) {
        if (directive.name != CacheControl::MAX_STALE) {
            continue;
        }
        if (!directive.hasValue || directive.value.empty()) {
            if (maxStale == -1) {
                maxStale = LONG_MAX;
            }
            continue;
        }
        std::optional<long> value = CacheControl::parseDeltaSeconds(directive.value);
        if (!value) {
            // unreadable, allow no staleness at all
            maxStale = 0;
            continue;
        }
        long secs = *value < 0 ? 0 : *value;
        if (maxStale == -1 || secs < maxStale) {
            maxStale = secs;
        }
    }
    return maxStale;
}

CachedResponseSuitabilityChecker::Result
CachedResponseSuitabilityChecker::checkRequestDirectives(const Request & request, const CacheEntry & entry, time_t now) const {
    for (const CacheControl::Directive & directive : CacheControl::parse(request.getFields())) {
        if (directive.name == CacheControl::NO_CACHE) {
            return Result::miss(REQUEST_NO_CACHE, "request has no-cache");
        }

        if (directive.name == CacheControl::NO_STORE) {
            return Result::miss(REQUEST_NO_STORE, "request has no-store");
        }

        if (directive.name == CacheControl::MAX_AGE) {
            std::optional<long> maxAge = CacheControl::parseDeltaSeconds(directive.value);
            if (!maxAge) {
                return Result::miss(MALFORMED_REQUEST_DIRECTIVE, "max-age=" + directive.value);
            }
            long age = validityPolicy.getCurrentAgeSecs(entry, now);
            if (age > *maxAge) {
                return Result::miss(REQUEST_MAX_AGE_EXCEEDED,
                                    "age " + std::to_string(age) + "s exceeds max-age=" + std::to_string(*maxAge));
            }
        }

        if (directive.name == CacheControl::MAX_STALE && directive.hasValue && !directive.value.empty()) {
            std::optional<long> maxStale = CacheControl::parseDeltaSeconds(directive.value);
            if (!maxStale) {
                return Result::miss(MALFORMED_REQUEST_DIRECTIVE, "max-stale=" + directive.value);
            }
            long freshness = validityPolicy.getFreshnessLifetimeSecs(entry);
            if (freshness > *maxStale) {
                return Result::miss(REQUEST_MAX_STALE_EXCEEDED,
                                    "freshness lifetime " + std::to_string(freshness)
                                    + "s exceeds max-stale=" + std::to_string(*maxStale));
            }
        }

        if (directive.name == CacheControl::MIN_FRESH) {
            std::optional<long> minFresh = CacheControl::parseDeltaSeconds(directive.value);
            if (!minFresh || *minFresh < 0) {
                return Result::miss(MALFORMED_REQUEST_DIRECTIVE, "min-fresh=" + directive.value);
            }
            long age = validityPolicy.getCurrentAgeSecs(entry, now);
            long freshness = validityPolicy.getFreshnessLifetimeSecs(entry);
            if (freshness - age < *minFresh) {
                return Result::miss(REQUEST_MIN_FRESH_NOT_MET,
                                    std::to_string(freshness - age) + "s of freshness left, min-fresh="
                                    + std::to_string(*minFresh));
            }
        }
    }
    return Result::serveFull();
}

const char * CachedResponseSuitabilityChecker::describe(MissReason reason) {
    switch (reason) {
        case NONE: return "suitable";
        case UNSUPPORTED_CONDITIONAL_HEADERS: return "request contained conditional headers we don't handle";
        case NOT_FRESH_ENOUGH: return "cache entry was not fresh enough";
        case CONTENT_LENGTH_MISMATCH: return "cache entry Content-Length and stored body do not match";
        case VALIDATORS_DO_NOT_MATCH: return "conditional request validators do not match";
        case REQUEST_NO_CACHE: return "request contained no-cache";
        case REQUEST_NO_STORE: return "request contained no-store";
        case REQUEST_MAX_AGE_EXCEEDED: return "cache entry is older than request max-age";
        case REQUEST_MAX_STALE_EXCEEDED: return "cache entry freshness lifetime exceeds request max-stale";
        case REQUEST_MIN_FRESH_NOT_MET: return "cache entry does not satisfy request min-fresh";
        case MALFORMED_REQUEST_DIRECTIVE: return "request Cache-Control directive was malformed";
    }
    return "unknown";
}

const char * CachedResponseSuitabilityChecker::describe(Outcome outcome) {
    switch (outcome) {
        case SERVE_FULL: return "serve full response from cache";
        case SERVE_NOT_MODIFIED: return "serve 304 Not Modified from cache";
        case MUST_FETCH: return "fetch from origin";
    }
    return "unknown";
}
