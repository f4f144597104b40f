#include "HttpDate.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace {

    const char * const DATE_PATTERNS[] = {
        "%a, %d %b %Y %H:%M:%S GMT",
        "%A, %d-%b-%y %H:%M:%S GMT",
        "%a %b %e %H:%M:%S %Y"
    };

}

std::optional<time_t> HttpDate::parse(const std::string & value) {
    std::string trimmed = boost::algorithm::trim_copy(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    for (const char * pattern : DATE_PATTERNS) {
        struct tm tm = {};
        const char * end = strptime(trimmed.c_str(), pattern, &tm);
        // the whole value has to be consumed, trailing junk means another format
        if (end == nullptr || *end != '\0') {
            continue;
        }
        return timegm(&tm);
    }
    return std::nullopt;
}

std::string HttpDate::format(time_t time) {
    std::tm tm;
    std::ostringstream oss;
    if (gmtime_r(&time, &tm) == nullptr) {
        throw std::out_of_range("time " + std::to_string(time) + " has no HTTP-date");
    }
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

time_t HttpDate::add(time_t time, long seconds) {
    time = std::max<time_t>(0, std::min(time, LATEST));
    if (seconds > LATEST - time) {
        return LATEST;
    }
    if (seconds < -time) {
        return 0;
    }
    return time + seconds;
}
