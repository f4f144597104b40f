#include "ConditionalRequestMatcher.hpp"
#include "HttpDate.hpp"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <optional>
#include <vector>

bool ConditionalRequestMatcher::isConditional(const Request & request) const {
    return hasSupportedEtagValidator(request) || hasSupportedLastModifiedValidator(request);
}

bool ConditionalRequestMatcher::hasUnsupportedConditionalHeaders(const Request & request) const {
    return request.hasHeader("If-Range")
        || request.hasHeader("If-Match")
        || hasValidDateField(request, "If-Unmodified-Since");
}

bool ConditionalRequestMatcher::hasSupportedEtagValidator(const Request & request) const {
    return request.hasHeader("If-None-Match");
}

bool ConditionalRequestMatcher::hasSupportedLastModifiedValidator(const Request & request) const {
    return hasValidDateField(request, "If-Modified-Since");
}

bool ConditionalRequestMatcher::hasValidDateField(const Request & request, const std::string & name) const {
    for (const std::string & value : request.getHeaders(name)) {
        if (HttpDate::parse(value)) {
            return true;
        }
    }
    return false;
}

bool ConditionalRequestMatcher::etagMatches(const Request & request, const CacheEntry & entry) const {
    std::optional<std::string> etag = entry.getFirstHeader("ETag");
    if (!etag) {
        return false;
    }
    std::string entryTag = boost::algorithm::trim_copy(*etag);

    for (const std::string & value : request.getHeaders("If-None-Match")) {
        std::vector<std::string> tags;
        boost::algorithm::split(tags, value, [](char c) { return c == ','; });
        for (std::string & tag : tags) {
            boost::algorithm::trim(tag);
            if (tag == "*" || tag == entryTag) {
                return true;
            }
        }
    }
    return false;
}

bool ConditionalRequestMatcher::lastModifiedMatches(const Request & request, const CacheEntry & entry, time_t now) const {
    std::optional<std::string> lastModifiedValue = entry.getFirstHeader("Last-Modified");
    if (!lastModifiedValue) {
        return false;
    }
    std::optional<time_t> lastModified = HttpDate::parse(*lastModifiedValue);
    if (!lastModified) {
        return false;
    }

    std::vector<std::string> values = request.getHeaders("If-Modified-Since");
    if (values.empty()) {
        return false;
    }
    for (const std::string & value : values) {
        std::optional<time_t> ifModifiedSince = HttpDate::parse(value);
        if (!ifModifiedSince || *ifModifiedSince > now || *lastModified > *ifModifiedSince) {
            return false;
        }
    }
    return true;
}

bool ConditionalRequestMatcher::allConditionalsMatch(const Request & request, const CacheEntry & entry, time_t now) const {
    if (hasSupportedEtagValidator(request) && !etagMatches(request, entry)) {
        return false;
    }
    if (hasSupportedLastModifiedValidator(request) && !lastModifiedMatches(request, entry, now)) {
        return false;
    }
    return true;
}
