#include "CacheValidityPolicy.hpp"
#include "CacheControl.hpp"
#include "HttpDate.hpp"
#include <algorithm>
#include <limits>
#include <optional>

namespace {

    std::optional<time_t> headerDate(const CacheEntry & entry, const std::string & name) {
        std::optional<std::string> value = entry.getFirstHeader(name);
        if (!value) {
            return std::nullopt;
        }
        return HttpDate::parse(*value);
    }

    // both operands are non-negative
    long saturatingAdd(long a, long b) {
        return a > std::numeric_limits<long>::max() - b ? std::numeric_limits<long>::max() : a + b;
    }

}

CacheValidityPolicy::CacheValidityPolicy(const CacheConfig & config)
:   sharedCache(config.isSharedCache()) {}

long CacheValidityPolicy::getApparentAgeSecs(const CacheEntry & entry) const {
    std::optional<time_t> date = headerDate(entry, "Date");
    if (!date) {
        return 0;
    }
    return std::max(0L, static_cast<long>(entry.getResponseDate() - *date));
}

long CacheValidityPolicy::getAgeValue(const CacheEntry & entry) const {
    long ageValue = 0;
    for (const std::string & value : entry.getHeaderValues("Age")) {
        std::optional<long> age = CacheControl::parseDeltaSeconds(value);
        long headerAge = (age && *age >= 0) ? std::min(*age, MAX_AGE) : MAX_AGE;
        ageValue = std::max(ageValue, headerAge);
    }
    return ageValue;
}

long CacheValidityPolicy::getResponseDelaySecs(const CacheEntry & entry) const {
    return std::max(0L, static_cast<long>(entry.getResponseDate() - entry.getRequestDate()));
}

long CacheValidityPolicy::getResidentTimeSecs(const CacheEntry & entry, time_t now) const {
    return std::max(0L, static_cast<long>(now - entry.getResponseDate()));
}

long CacheValidityPolicy::getCurrentAgeSecs(const CacheEntry & entry, time_t now) const {
    long correctedAgeValue = saturatingAdd(getAgeValue(entry), getResponseDelaySecs(entry));
    long correctedInitialAge = std::max(getApparentAgeSecs(entry), correctedAgeValue);
    return saturatingAdd(correctedInitialAge, getResidentTimeSecs(entry, now));
}

long CacheValidityPolicy::getDirectiveSecs(const CacheEntry & entry, const std::string & name) const {
    long smallest = -1;
    for (const CacheControl::Directive & directive : CacheControl::parse(entry.getHeaders())) {
        if (directive.name != name) {
            continue;
        }
        std::optional<long> secs = CacheControl::parseDeltaSeconds(directive.value);
        if (!secs || *secs < 0) {
            return 0;
        }
        if (smallest == -1 || *secs < smallest) {
            smallest = *secs;
        }
    }
    return smallest;
}

long CacheValidityPolicy::getFreshnessLifetimeSecs(const CacheEntry & entry) const {
    if (sharedCache) {
        long sMaxAge = getDirectiveSecs(entry, CacheControl::S_MAXAGE);
        if (sMaxAge != -1) {
            return sMaxAge;
        }
    }

    long maxAge = getDirectiveSecs(entry, CacheControl::MAX_AGE);
    if (maxAge != -1) {
        return maxAge;
    }

    std::optional<time_t> date = headerDate(entry, "Date");
    std::optional<time_t> expires = headerDate(entry, "Expires");
    if (date && expires) {
        return std::max(0L, static_cast<long>(*expires - *date));
    }
    return 0;
}

bool CacheValidityPolicy::isResponseFresh(const CacheEntry & entry, time_t now) const {
    return getCurrentAgeSecs(entry, now) < getFreshnessLifetimeSecs(entry);
}

long CacheValidityPolicy::getHeuristicFreshnessLifetimeSecs(const CacheEntry & entry,
                                                            float coefficient,
                                                            long defaultLifetime) const {
    std::optional<time_t> date = headerDate(entry, "Date");
    std::optional<time_t> lastModified = headerDate(entry, "Last-Modified");
    if (!date || !lastModified) {
        return defaultLifetime;
    }
    long sinceModified = static_cast<long>(*date - *lastModified);
    if (sinceModified < 0) {
        return 0;
    }
    return static_cast<long>(coefficient * sinceModified);
}

bool CacheValidityPolicy::isResponseHeuristicallyFresh(const CacheEntry & entry,
                                                       time_t now,
                                                       float coefficient,
                                                       long defaultLifetime) const {
    return getCurrentAgeSecs(entry, now) < getHeuristicFreshnessLifetimeSecs(entry, coefficient, defaultLifetime);
}

long CacheValidityPolicy::getStalenessSecs(const CacheEntry & entry, time_t now) const {
    long age = getCurrentAgeSecs(entry, now);
    long freshness = getFreshnessLifetimeSecs(entry);
    return std::max(0L, age - freshness);
}

bool CacheValidityPolicy::mustRevalidate(const CacheEntry & entry) const {
    return hasCacheControlDirective(entry, CacheControl::MUST_REVALIDATE);
}

bool CacheValidityPolicy::proxyRevalidate(const CacheEntry & entry) const {
    return hasCacheControlDirective(entry, CacheControl::PROXY_REVALIDATE);
}

bool CacheValidityPolicy::hasCacheControlDirective(const CacheEntry & entry, const std::string & name) const {
    return CacheControl::hasDirective(entry.getHeaders(), name);
}

bool CacheValidityPolicy::contentLengthHeaderMatchesActualLength(const CacheEntry & entry) const {
    std::optional<std::string> contentLength = entry.getFirstHeader("Content-Length");
    if (!contentLength) {
        return true;
    }
    std::optional<long> declared = CacheControl::parseDeltaSeconds(*contentLength);
    return declared && *declared >= 0 && static_cast<size_t>(*declared) == entry.getBodyLength();
}
