#ifndef CONDITIONALREQUESTMATCHER_HPP
#define CONDITIONALREQUESTMATCHER_HPP

#include <ctime>
#include <string>

#include "CacheEntry.hpp"
#include "Request.hpp"

// Conditional requests a cache may answer itself: If-None-Match and
// If-Modified-Since. If-Match, If-Range and If-Unmodified-Since always go to
// the origin.
class ConditionalRequestMatcher {
    public:
        bool isConditional(const Request & request) const;

        bool hasUnsupportedConditionalHeaders(const Request & request) const;

        // If-None-Match against the entry's ETag, "*" matches any ETag
        bool etagMatches(const Request & request, const CacheEntry & entry) const;

        // If-Modified-Since against the entry's Last-Modified. A date in the
        // future or one that does not parse never matches.
        bool lastModifiedMatches(const Request & request, const CacheEntry & entry, time_t now) const;

        // every validator kind the request carries has to match
        bool allConditionalsMatch(const Request & request, const CacheEntry & entry, time_t now) const;

    private:
        bool hasSupportedEtagValidator(const Request & request) const;
        bool hasSupportedLastModifiedValidator(const Request & request) const;
        bool hasValidDateField(const Request & request, const std::string & name) const;
};

#endif
