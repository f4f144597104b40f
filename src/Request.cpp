#include "Request.hpp"

Request Request::make(const std::string & method,
                      const std::string & target,
                      const std::vector<std::pair<std::string, std::string>> & headers) {
    http::request<http::string_body> req;
    req.method_string(method);
    req.target(target);
    req.version(11);
    for (const auto & header : headers) {
        req.insert(header.first, header.second);
    }
    return Request(std::move(req));
}

std::string Request::getHeader(const std::string & key) const {
    auto it = request.find(key);
    return (it != request.end()) ? std::string(it->value()) : "";
}

std::vector<std::string> Request::getHeaders(const std::string & key) const {
    std::vector<std::string> values;
    auto range = request.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(std::string(it->value()));
    }
    return values;
}

bool Request::hasHeader(const std::string & key) const {
    return request.count(key) > 0;
}
