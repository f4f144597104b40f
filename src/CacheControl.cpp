#include "CacheControl.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace {

    // splits on commas that are not inside a quoted-string
    std::vector<std::string> splitElements(const std::string & value) {
        std::vector<std::string> elements;
        std::string current;
        bool quoted = false;
        for (size_t i = 0; i < value.size(); i++) {
            char c = value[i];
            if (quoted && c == '\\' && i + 1 < value.size()) {
                current += c;
                current += value[++i];
                continue;
            }
            if (c == '"') {
                quoted = !quoted;
            }
            if (c == ',' && !quoted) {
                elements.push_back(current);
                current.clear();
                continue;
            }
            current += c;
        }
        elements.push_back(current);
        return elements;
    }

    std::string unquote(const std::string & value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

}

std::vector<CacheControl::Directive> CacheControl::parseValue(const std::string & value) {
    std::vector<Directive> directives;
    for (const std::string & element : splitElements(value)) {
        std::string trimmed = boost::algorithm::trim_copy(element);
        if (trimmed.empty()) {
            continue;
        }
        Directive directive;
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            directive.name = trimmed;
            directive.hasValue = false;
        } else {
            directive.name = boost::algorithm::trim_copy(trimmed.substr(0, eq));
            directive.value = unquote(boost::algorithm::trim_copy(trimmed.substr(eq + 1)));
            directive.hasValue = true;
        }
        boost::algorithm::to_lower(directive.name);
        directives.push_back(directive);
    }
    return directives;
}

std::vector<CacheControl::Directive> CacheControl::parse(const http::fields & headers) {
    std::vector<Directive> directives;
    auto range = headers.equal_range(http::field::cache_control);
    for (auto it = range.first; it != range.second; ++it) {
        std::vector<Directive> line = parseValue(std::string(it->value()));
        directives.insert(directives.end(), line.begin(), line.end());
    }
    return directives;
}

bool CacheControl::hasDirective(const http::fields & headers, const std::string & name) {
    std::string wanted = boost::algorithm::to_lower_copy(name);
    for (const Directive & directive : parse(headers)) {
        if (directive.name == wanted) {
            return true;
        }
    }
    return false;
}

std::optional<long> CacheControl::parseDeltaSeconds(const std::string & value) {
    long seconds = 0;
    if (!boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(value), seconds)) {
        return std::nullopt;
    }
    return seconds;
}
