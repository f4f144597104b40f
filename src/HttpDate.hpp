#ifndef HTTPDATE_HPP
#define HTTPDATE_HPP

#include <ctime>
#include <optional>
#include <string>

// HTTP-date helpers. All values are seconds since the epoch, UTC.
class HttpDate {
    public:
        // Accepts the three formats of RFC 7231 7.1.1.1:
        //   Sun, 06 Nov 1994 08:49:37 GMT   (IMF-fixdate / RFC 1123)
        //   Sunday, 06-Nov-94 08:49:37 GMT  (RFC 850)
        //   Sun Nov  6 08:49:37 1994        (asctime)
        // Returns nullopt for anything else.
        static std::optional<time_t> parse(const std::string & value);

        // Fri, 31 Dec 9999 23:59:59 GMT, the last date format() can write
        static constexpr time_t LATEST = 253402300799;

        // Always IMF-fixdate. Throws std::out_of_range for a time gmtime_r
        // cannot represent.
        static std::string format(time_t time);

        // time + seconds, saturated to [0, LATEST]
        static time_t add(time_t time, long seconds);
};

#endif
