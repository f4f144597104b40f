#include "Parser.hpp"
#include <stdexcept>

template <class Body, bool isRequest>
void Parser::feed(http::parser<isRequest, Body> & parser, const std::string & data){
    if (data.empty()){
        throw std::runtime_error("failed to parse data, empty message");
    }

    boost::system::error_code ec;
    size_t offset = 0;

    parser.eager(true);
    while (!parser.is_done()){
        size_t bytes_parsed = parser.put(asio::buffer(data.data() + offset, data.size() - offset), ec);
        offset += bytes_parsed;

        if (ec == http::error::need_more){
            ec = {};
            if (bytes_parsed > 0 && offset < data.size()){
                continue;
            }
            // everything we have is in, the message ends here
            parser.put_eof(ec);
            break;
        }
        if (ec){
            break;
        }
        if (bytes_parsed == 0){
            parser.put_eof(ec);
            break;
        }
    }

    if (ec || !parser.is_done()){
        std::string message = ec ? ec.message() : "incomplete message";
        logger.error("failed to parse data, ec:" + message + " code: " + std::to_string(ec.value()));
        throw std::runtime_error("failed to parse data, ec:" + message + " code: " + std::to_string(ec.value()));
    }
}

Request Parser::parseRequest(const std::string & data){
    http::request_parser<http::string_body> parser;
    feed(parser, data);

    http::request<http::string_body> request = parser.release();
    logger.debug("successfully parsed request method("
                 + std::string(request.method_string()) + ") bodyLen(" + std::to_string(request.body().size()) + ")");
    return Request(std::move(request));
}

Response Parser::parseResponse(const std::string & data){
    http::response_parser<http::string_body> parser;
    feed(parser, data);

    http::response<http::string_body> response = parser.release();
    logger.debug("successfully parsed response status(" + std::to_string(response.result_int())
                 + ") bodyLen(" + std::to_string(response.body().size()) + ")");
    return Response(std::move(response));
}
