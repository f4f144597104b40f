#ifndef REQUEST_HPP
#define REQUEST_HPP

#include <string>
#include <vector>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = boost::beast::http;


class Request {
private:
    http::request<http::string_body> request;

public:
    Request() { request.version(11); }
    explicit Request(http::request<http::string_body> req) : request(std::move(req)) {}

    // GET target HTTP/1.1 with the given headers, in order
    static Request make(const std::string & method,
                        const std::string & target,
                        const std::vector<std::pair<std::string, std::string>> & headers = {});

    std::string getMethod() const { return std::string(request.method_string()); }
    std::string getUrl() const { return std::string(request.target()); }
    std::string getVersion() const { 
        return "HTTP/" 
        + std::to_string(request.version() / 10) 
        + "." 
        + std::to_string(request.version() % 10); 
    }
    unsigned getVersionNumber() const { return request.version(); }

    // first value of the header, "" when absent
    std::string getHeader(const std::string & key) const;
    // every value of the header, in order
    std::vector<std::string> getHeaders(const std::string & key) const;
    bool hasHeader(const std::string & key) const;

    const http::fields & getFields() const { return request.base(); }
    bool hasBody() const { return !request.body().empty(); }
    const std::string & getBody() const { return request.body(); }
    const http::request<http::string_body> & get() const { return request; }
};

#endif
