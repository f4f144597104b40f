#ifndef RESPONSE_HPP
#define RESPONSE_HPP

#include <string>
#include <vector>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = boost::beast::http;


class Response {
private:
    http::response<http::string_body> response;

public:
    Response() { response.version(11); }
    explicit Response(http::response<http::string_body> res) : response(std::move(res)) {}

    // HTTP/1.1 status with the given headers, in order, and body as is
    static Response make(unsigned status,
                         const std::string & reason,
                         const std::vector<std::pair<std::string, std::string>> & headers = {},
                         const std::string & body = "");

    std::string getVersion() const { 
        return "HTTP/" 
        + std::to_string(response.version() / 10) 
        + "." 
        + std::to_string(response.version() % 10); 
    }
    int getResult() const { return response.result_int(); }
    std::string getReason() const { return std::string(response.reason()); }

    // first value of the header, "" when absent
    std::string getHeader(const std::string & key) const;
    // every value of the header, in order
    std::vector<std::string> getHeaders(const std::string & key) const;
    bool hasHeader(const std::string & key) const;

    const http::fields & getFields() const { return response.base(); }
    bool hasBody() const { return !response.body().empty(); }
    const std::string & getBody() const { return response.body(); }
    const http::response<http::string_body> & get() const { return response; }

    // status line and headers as they go on the wire
    std::string getHeadersStr() const;
};

#endif
