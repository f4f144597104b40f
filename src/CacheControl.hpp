#ifndef CACHECONTROL_HPP
#define CACHECONTROL_HPP

#include <optional>
#include <string>
#include <vector>
#include <boost/beast/http/fields.hpp>

namespace http = boost::beast::http;

// Cache-Control parsing shared by the validity policy, the suitability
// checker and the cacheability rules.
class CacheControl {
    public:

        static constexpr const char * NO_CACHE = "no-cache";
        static constexpr const char * NO_STORE = "no-store";
        static constexpr const char * MAX_AGE = "max-age";
        static constexpr const char * S_MAXAGE = "s-maxage";
        static constexpr const char * MAX_STALE = "max-stale";
        static constexpr const char * MIN_FRESH = "min-fresh";
        static constexpr const char * MUST_REVALIDATE = "must-revalidate";
        static constexpr const char * PROXY_REVALIDATE = "proxy-revalidate";
        static constexpr const char * PRIVATE = "private";
        static constexpr const char * PUBLIC = "public";
        static constexpr const char * ONLY_IF_CACHED = "only-if-cached";

        struct Directive {
            std::string name;       // lower case
            std::string value;      // unquoted, empty when absent
            bool hasValue;
        };

        // every directive of every Cache-Control line, in header order
        static std::vector<Directive> parse(const http::fields & headers);

        // one header value, e.g. `max-age=60, no-cache="Set-Cookie"`
        static std::vector<Directive> parseValue(const std::string & value);

        static bool hasDirective(const http::fields & headers, const std::string & name);

        // signed decimal integer, nullopt when the text is not one
        static std::optional<long> parseDeltaSeconds(const std::string & value);
};

#endif
