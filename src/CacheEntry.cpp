#include "CacheEntry.hpp"
#include "HttpDate.hpp"
#include <stdexcept>

CacheEntry::CacheEntry(time_t requestDate,
    time_t responseDate,
    unsigned statusCode,
    const std::string & reasonPhrase,
    const http::fields & headers,
    const std::string & body
    ) 
:   request_date(requestDate),
    response_date(responseDate),
    status_code(statusCode),
    reason_phrase(reasonPhrase),
    response_headers(headers),
    response_body(body) {
    if (responseDate < requestDate) {
        throw std::invalid_argument("cache entry response date precedes its request date");
    }
    if (statusCode < 100 || statusCode > 999) {
        throw std::invalid_argument("invalid status code " + std::to_string(statusCode));
    }
}

CacheEntry CacheEntry::fromResponse(const Response & response, time_t requestDate, time_t responseDate) {
    return CacheEntry(requestDate,
                      responseDate,
                      response.getResult(),
                      response.getReason(),
                      response.getFields(),
                      response.getBody());
}

CacheEntry CacheEntry::updatedWith(const Response & notModified, time_t requestDate, time_t responseDate) const {
    if (notModified.getResult() != 304) {
        throw std::invalid_argument("can only update a cache entry from a 304 response, got "
                                    + std::to_string(notModified.getResult()));
    }

    std::optional<time_t> storedDate;
    if (auto value = getFirstHeader("Date")) {
        storedDate = HttpDate::parse(*value);
    }
    std::optional<time_t> receivedDate = HttpDate::parse(notModified.getHeader("Date"));

    // the stored response is newer than the validation, keep what we have
    if (storedDate && receivedDate && *storedDate > *receivedDate) {
        return CacheEntry(requestDate, responseDate, status_code, reason_phrase, response_headers, response_body);
    }

    http::fields merged;
    const http::fields & incoming = notModified.getFields();
    for (const auto & field : response_headers) {
        if (incoming.count(field.name_string()) == 0
            || field.name() == http::field::content_length
            || field.name() == http::field::transfer_encoding) {
            merged.insert(field.name_string(), field.value());
        }
    }
    for (const auto & field : incoming) {
        // 304 framing headers say nothing about the stored body
        if (field.name() == http::field::content_length || field.name() == http::field::transfer_encoding) {
            continue;
        }
        merged.insert(field.name_string(), field.value());
    }
    return CacheEntry(requestDate, responseDate, status_code, reason_phrase, merged, response_body);
}

std::optional<std::string> CacheEntry::getFirstHeader(const std::string & name) const {
    auto it = response_headers.find(name);
    if (it == response_headers.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

std::vector<std::string> CacheEntry::getHeaderValues(const std::string & name) const {
    std::vector<std::string> values;
    auto range = response_headers.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(std::string(it->value()));
    }
    return values;
}

bool CacheEntry::hasHeader(const std::string & name) const {
    return response_headers.count(name) > 0;
}
