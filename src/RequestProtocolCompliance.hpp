#ifndef REQUESTPROTOCOLCOMPLIANCE_HPP
#define REQUESTPROTOCOLCOMPLIANCE_HPP

#include <vector>

#include "Request.hpp"
#include "Response.hpp"

enum class RequestProtocolError {
    UNKNOWN,
    BODY_BUT_NO_LENGTH_ERROR,
    WEAK_ETAG_ON_PUTDELETE_METHOD_ERROR,
    WEAK_ETAG_AND_RANGE_ERROR,
    NO_CACHE_DIRECTIVE_WITH_FIELD_NAME
};

// Requests a cache has to answer with an error instead of serving or
// forwarding them.
class RequestProtocolCompliance {
    public:
        std::vector<RequestProtocolError> requestIsFatallyNonCompliant(const Request & request) const;

        // 411 for a body without length, 400 for everything else
        Response getErrorForRequest(RequestProtocolError error) const;

    private:
        bool hasBodyWithoutLength(const Request & request) const;
        bool hasWeakEtagOnPutOrDelete(const Request & request) const;
        bool hasWeakEtagWithRange(const Request & request) const;
        bool hasNoCacheWithFieldName(const Request & request) const;
};

#endif
