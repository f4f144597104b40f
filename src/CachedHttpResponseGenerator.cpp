#include "CachedHttpResponseGenerator.hpp"
#include "HttpDate.hpp"
#include <climits>

CachedHttpResponseGenerator::CachedHttpResponseGenerator(const CacheValidityPolicy & validityPolicy)
:   validityPolicy(validityPolicy) {}

Response CachedHttpResponseGenerator::generateFullResponse(const CacheEntry & entry, time_t now) const {
    http::response<http::string_body> response;
    response.version(11);
    response.result(entry.getStatusCode());
    response.reason(entry.getReasonPhrase());
    for (const auto & field : entry.getHeaders()) {
        response.insert(field.name_string(), field.value());
    }
    response.body() = entry.getBody();

    if (response.count(http::field::transfer_encoding) == 0 &&
        response.count(http::field::content_length) == 0) {
        response.set(http::field::content_length, std::to_string(entry.getBodyLength()));
    }

    long age = validityPolicy.getCurrentAgeSecs(entry, now);
    if (age > 0) {
        if (age >= INT_MAX) {
            response.set(http::field::age, "2147483648");
        } else {
            response.set(http::field::age, std::to_string(age));
        }
    }

    return Response(std::move(response));
}

Response CachedHttpResponseGenerator::generateNotModifiedResponse(const CacheEntry & entry, time_t now) const {
    http::response<http::string_body> response;
    response.version(11);
    response.result(http::status::not_modified);
    response.reason("Not Modified");

    if (entry.hasHeader("Date")) {
        for (const std::string & value : entry.getHeaderValues("Date")) {
            response.insert(http::field::date, value);
        }
    } else {
        response.set(http::field::date, HttpDate::format(now));
    }

    static const http::field forwarded[] = {
        http::field::etag,
        http::field::content_location,
        http::field::expires,
        http::field::cache_control,
        http::field::vary
    };
    for (http::field name : forwarded) {
        auto range = entry.getHeaders().equal_range(name);
        for (auto it = range.first; it != range.second; ++it) {
            response.insert(name, it->value());
        }
    }

    return Response(std::move(response));
}
