#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <string>
#include <optional>
#include <ctime>
#include <vector>
#include <boost/beast/http/fields.hpp>

#include "Response.hpp"

namespace http = boost::beast::http;

// Snapshot of a response as it was received from the origin. Never changes
// after construction; updatedWith() builds a new entry instead.
class CacheEntry {

    private:
        time_t request_date;
        time_t response_date;
        unsigned status_code;
        std::string reason_phrase;
        http::fields response_headers;
        std::string response_body;

    public:
        // throws std::invalid_argument if responseDate < requestDate or the
        // status code is not a three digit number
        CacheEntry(time_t requestDate,
                   time_t responseDate,
                   unsigned statusCode,
                   const std::string & reasonPhrase,
                   const http::fields & headers,
                   const std::string & body);

        static CacheEntry fromResponse(const Response & response, time_t requestDate, time_t responseDate);

        // Entry after a successful revalidation: headers of the 304 replace
        // the stored ones of the same name, unless the stored Date is newer.
        // throws std::invalid_argument if notModified is not a 304
        CacheEntry updatedWith(const Response & notModified, time_t requestDate, time_t responseDate) const;

        time_t getRequestDate() const { return request_date; }
        time_t getResponseDate() const { return response_date; }
        unsigned getStatusCode() const { return status_code; }
        const std::string & getReasonPhrase() const { return reason_phrase; }
        const http::fields & getHeaders() const { return response_headers; }
        const std::string & getBody() const { return response_body; }
        size_t getBodyLength() const { return response_body.size(); }

        std::optional<std::string> getFirstHeader(const std::string & name) const;
        std::vector<std::string> getHeaderValues(const std::string & name) const;
        bool hasHeader(const std::string & name) const;
};
    

#endif
