#ifndef CACHEDHTTPRESPONSEGENERATOR_HPP
#define CACHEDHTTPRESPONSEGENERATOR_HPP

#include <ctime>

#include "CacheEntry.hpp"
#include "CacheValidityPolicy.hpp"
#include "Response.hpp"

// Builds the responses a cache hit sends back. The entry is only read.
class CachedHttpResponseGenerator {
    public:
        explicit CachedHttpResponseGenerator(const CacheValidityPolicy & validityPolicy);

        // stored status, headers and body plus Age, and Content-Length when
        // the stored response had no framing header
        Response generateFullResponse(const CacheEntry & entry, time_t now) const;

        // 304 carrying only Date, ETag, Content-Location, Expires,
        // Cache-Control and Vary (RFC 7232 section 4.1)
        Response generateNotModifiedResponse(const CacheEntry & entry, time_t now) const;

    private:
        CacheValidityPolicy validityPolicy;
};

#endif
