#include "Response.hpp"
#include <boost/lexical_cast.hpp>

Response Response::make(unsigned status,
                        const std::string & reason,
                        const std::vector<std::pair<std::string, std::string>> & headers,
                        const std::string & body) {
    http::response<http::string_body> res;
    res.version(11);
    res.result(status);
    res.reason(reason);
    for (const auto & header : headers) {
        res.insert(header.first, header.second);
    }
    res.body() = body;
    return Response(std::move(res));
}

std::string Response::getHeader(const std::string & key) const {
    auto it = response.find(key);
    return (it != response.end()) ? std::string(it->value()) : "";
}

std::vector<std::string> Response::getHeaders(const std::string & key) const {
    std::vector<std::string> values;
    auto range = response.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(std::string(it->value()));
    }
    return values;
}

bool Response::hasHeader(const std::string & key) const {
    return response.count(key) > 0;
}

std::string Response::getHeadersStr() const {
    return boost::lexical_cast<std::string>(response.base());
}
