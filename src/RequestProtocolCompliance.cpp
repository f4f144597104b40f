#include "RequestProtocolCompliance.hpp"
#include "CacheControl.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <stdexcept>

namespace {

    bool isWeakTag(const std::string & value) {
        return boost::algorithm::starts_with(boost::algorithm::trim_copy(value), "W/");
    }

}

std::vector<RequestProtocolError> RequestProtocolCompliance::requestIsFatallyNonCompliant(const Request & request) const {
    std::vector<RequestProtocolError> errors;
    if (hasBodyWithoutLength(request)) {
        errors.push_back(RequestProtocolError::BODY_BUT_NO_LENGTH_ERROR);
    }
    if (hasWeakEtagOnPutOrDelete(request)) {
        errors.push_back(RequestProtocolError::WEAK_ETAG_ON_PUTDELETE_METHOD_ERROR);
    }
    if (hasWeakEtagWithRange(request)) {
        errors.push_back(RequestProtocolError::WEAK_ETAG_AND_RANGE_ERROR);
    }
    if (hasNoCacheWithFieldName(request)) {
        errors.push_back(RequestProtocolError::NO_CACHE_DIRECTIVE_WITH_FIELD_NAME);
    }
    return errors;
}

bool RequestProtocolCompliance::hasBodyWithoutLength(const Request & request) const {
    return request.hasBody()
        && !request.hasHeader("Content-Length")
        && !request.hasHeader("Transfer-Encoding");
}

bool RequestProtocolCompliance::hasWeakEtagOnPutOrDelete(const Request & request) const {
    std::string method = request.getMethod();
    if (method != "PUT" && method != "DELETE") {
        return false;
    }
    for (const std::string & value : request.getHeaders("If-Match")) {
        if (isWeakTag(value)) {
            return true;
        }
    }
    for (const std::string & value : request.getHeaders("If-None-Match")) {
        if (isWeakTag(value)) {
            return true;
        }
    }
    return false;
}

bool RequestProtocolCompliance::hasWeakEtagWithRange(const Request & request) const {
    if (!request.hasHeader("Range")) {
        return false;
    }
    for (const std::string & value : request.getHeaders("If-Range")) {
        if (isWeakTag(value)) {
            return true;
        }
    }
    return false;
}

bool RequestProtocolCompliance::hasNoCacheWithFieldName(const Request & request) const {
    for (const CacheControl::Directive & directive : CacheControl::parse(request.getFields())) {
        if (directive.name == CacheControl::NO_CACHE && directive.hasValue) {
            return true;
        }
    }
    return false;
}

Response RequestProtocolCompliance::getErrorForRequest(RequestProtocolError error) const {
    switch (error) {
        case RequestProtocolError::BODY_BUT_NO_LENGTH_ERROR:
            return Response::make(411, "Length Required", {{"Content-Length", "0"}});

        case RequestProtocolError::WEAK_ETAG_AND_RANGE_ERROR: {
            std::string body = "Weak eTag not compatible with byte range";
            return Response::make(400, "Bad Request",
                                  {{"Content-Type", "text/plain"}, {"Content-Length", std::to_string(body.size())}},
                                  body);
        }

        case RequestProtocolError::WEAK_ETAG_ON_PUTDELETE_METHOD_ERROR: {
            std::string body = "Weak eTag not compatible with PUT or DELETE requests";
            return Response::make(400, "Bad Request",
                                  {{"Content-Type", "text/plain"}, {"Content-Length", std::to_string(body.size())}},
                                  body);
        }

        case RequestProtocolError::NO_CACHE_DIRECTIVE_WITH_FIELD_NAME: {
            std::string body = "No-Cache directive MUST NOT include a field name";
            return Response::make(400, "Bad Request",
                                  {{"Content-Type", "text/plain"}, {"Content-Length", std::to_string(body.size())}},
                                  body);
        }

        case RequestProtocolError::UNKNOWN:
            break;
    }
    throw std::invalid_argument("no error response for an unknown protocol error");
}
