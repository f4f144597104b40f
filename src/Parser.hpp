#ifndef PARSER_HPP
#define PARSER_HPP

#include <string>
#include <boost/asio/buffer.hpp>
#include <boost/beast/http.hpp>
#include "Logger.hpp"
#include "Request.hpp"
#include "Response.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;

// Complete HTTP/1.1 messages from raw bytes. A response without
// Content-Length or chunked framing ends with the input. Throws
// std::runtime_error for malformed or truncated input.
class Parser{
    public:
    
        Request parseRequest(const std::string & data);
        Response parseResponse(const std::string & data);

    private:

        template <class Body, bool isRequest>
        void feed(http::parser<isRequest, Body> & parser, const std::string & data);

        static inline Logger & logger = Logger::getInstance();

};

#endif
