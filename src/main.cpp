#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/lexical_cast.hpp>

#include "CacheConfig.hpp"
#include "CacheHandler.hpp"
#include "CacheStorage.hpp"
#include "Logger.hpp"
#include "Parser.hpp"

namespace {

    void usage(const char * program) {
        std::cerr << "usage: " << program
                  << " [--private] [--heuristic] [--coefficient F] [--default-lifetime S]"
                     " [--received-ago S] [--log-path PREFIX] [--log-level LEVEL] RESPONSE_FILE REQUEST_FILE" << std::endl;
    }

    std::string readFile(const std::string & path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("cannot open " + path);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // hand-written message files usually have bare \n line ends in the head
    std::string normalizeHead(const std::string & message) {
        if (message.find("\r\n") != std::string::npos) {
            return message;
        }
        size_t end = message.find("\n\n");
        std::string head = end == std::string::npos ? message : message.substr(0, end + 2);
        std::string rest = end == std::string::npos ? "" : message.substr(end + 2);
        std::string out;
        for (char c : head) {
            if (c == '\n') {
                out += '\r';
            }
            out += c;
        }
        return out + rest;
    }

    Logger::Level parseLevel(const std::string & name) {
        if (name == "debug") return Logger::DEBUG;
        if (name == "info") return Logger::INFO;
        if (name == "warning") return Logger::WARNING;
        if (name == "error") return Logger::ERROR;
        throw std::invalid_argument("unknown log level " + name);
    }

}

int main(int argc, char * argv[]) {
    CacheConfig config;
    long receivedAgo = 0;
    std::string logPath;
    Logger::Level logLevel = Logger::DEBUG;
    std::string responseFile;
    std::string requestFile;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool hasNext = i + 1 < argc;
            if (arg == "--private") {
                config.setSharedCache(false);
            } else if (arg == "--heuristic") {
                config.setHeuristicCachingEnabled(true);
            } else if (arg == "--coefficient" && hasNext) {
                config.setHeuristicCoefficient(boost::lexical_cast<float>(argv[++i]));
            } else if (arg == "--default-lifetime" && hasNext) {
                config.setHeuristicDefaultLifetime(boost::lexical_cast<long>(argv[++i]));
            } else if (arg == "--received-ago" && hasNext) {
                receivedAgo = boost::lexical_cast<long>(argv[++i]);
            } else if (arg == "--log-path" && hasNext) {
                logPath = argv[++i];
            } else if (arg == "--log-level" && hasNext) {
                logLevel = parseLevel(argv[++i]);
            } else if (responseFile.empty() && arg.rfind("--", 0) != 0) {
                responseFile = arg;
            } else if (requestFile.empty() && arg.rfind("--", 0) != 0) {
                requestFile = arg;
            } else {
                usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception & e) {
        std::cerr << "Error: " << e.what() << std::endl;
        usage(argv[0]);
        return 2;
    }
    if (responseFile.empty() || requestFile.empty() || receivedAgo < 0) {
        usage(argv[0]);
        return 2;
    }

    try {
        Logger & logger = Logger::getInstance();
        if (!logPath.empty()) {
            logger.setLogPath(logPath);
        }
        logger.setConsoleOutput(false);
        logger.setLevel(logLevel);

        Parser parser;
        Response stored = parser.parseResponse(normalizeHead(readFile(responseFile)));
        Request request = parser.parseRequest(normalizeHead(readFile(requestFile)));

        time_t now = time(nullptr);
        time_t received = now - receivedAgo;

        CacheStorage storage(config);
        CacheHandler handler(storage, config);
        // the stored response answered the same resource, with no conditions
        Request unconditional = Request::make(request.getMethod(), request.getUrl());
        if (!handler.storeResponse(unconditional, stored, received, received)) {
            std::cout << "response is not cacheable" << std::endl;
            return 1;
        }

        CacheHandler::Lookup result = handler.lookup(request, now);
        std::cout << "decision: " << CacheHandler::describe(result.decision) << std::endl;
        std::cout << "reason: " << result.reason << std::endl;
        if (result.response) {
            std::cout << std::endl << result.response->getHeadersStr() << result.response->getBody() << std::endl;
        }
        bool hit = result.decision == CacheHandler::RETURN_CACHE || result.decision == CacheHandler::RETURN_304;
        return hit ? 0 : 1;
    } catch (const std::exception & e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
