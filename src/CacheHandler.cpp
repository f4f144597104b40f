#include "CacheHandler.hpp"
#include "CacheControl.hpp"
#include "HttpDate.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <vector>

CacheHandler::CacheHandler(CacheStorage & storage, const CacheConfig & config)
:   storage(storage),
    config(config),
    validityPolicy(config),
    suitabilityChecker(validityPolicy, config),
    responseGenerator(validityPolicy) {}

std::string CacheHandler::cacheKey(const Request & request){
    return request.getMethod() + " " + request.getUrl();
}

bool CacheHandler::needToSend(Decision decision){
    return decision == CacheHandler::FETCH;
}

const char * CacheHandler::describe(Decision decision){
    switch(decision){
        case CacheHandler::RETURN_CACHE: return "RETURN_CACHE";
        case CacheHandler::RETURN_304: return "RETURN_304";
        case CacheHandler::RETURN_ERROR: return "RETURN_ERROR";
        case CacheHandler::RETURN_504: return "RETURN_504";
        case CacheHandler::FETCH: return "FETCH";
    }
    return "UNKNOWN";
}

bool CacheHandler::isServableFromCache(const Request & request) const{
    std::string method = request.getMethod();
    if (method != "GET" && method != "HEAD"){
        return false;
    }
    if (request.getVersionNumber() != 11){
        return false;
    }
    return !request.hasHeader("Pragma");
}

CacheHandler::Lookup CacheHandler::fetch(const Request & request,
                                         CachedResponseSuitabilityChecker::MissReason missReason,
                                         const std::string & reason) const{
    // the client would rather fail than wait for the origin
    if (CacheControl::hasDirective(request.getFields(), CacheControl::ONLY_IF_CACHED)){
        logger.info(cacheKey(request) + ": no valid cache, but has only-if-cached in request");
        Response timeout = Response::make(504, "Gateway Timeout", {{"Content-Length", "0"}});
        return {CacheHandler::RETURN_504, timeout, missReason, reason};
    }
    return {CacheHandler::FETCH, std::nullopt, missReason, reason};
}

CacheHandler::Lookup CacheHandler::lookup(const Request & request, time_t now){
    std::vector<RequestProtocolError> errors = requestCompliance.requestIsFatallyNonCompliant(request);
    if (!errors.empty()){
        logger.warning(cacheKey(request) + ": request is not protocol compliant, answering with an error");
        return {CacheHandler::RETURN_ERROR,
                requestCompliance.getErrorForRequest(errors.front()),
                CachedResponseSuitabilityChecker::NONE,
                "request is not protocol compliant"};
    }

    std::string key = cacheKey(request);
    if (!isServableFromCache(request)){
        logger.debug(key + ": not servable from cache");
        return fetch(request, CachedResponseSuitabilityChecker::NONE, "request not servable from cache");
    }

    std::optional<CacheEntry> entry = storage.getEntry(key);
    // no entry
    if (!entry){
        logger.info(key + ": not in cache");
        return fetch(request, CachedResponseSuitabilityChecker::NONE, "not in cache");
    }

    CachedResponseSuitabilityChecker::Result result = suitabilityChecker.canServe(request, *entry, now);
    switch(result.outcome){
        case CachedResponseSuitabilityChecker::SERVE_FULL:{
            logger.info(key + ": in cache, valid");
            return {CacheHandler::RETURN_CACHE,
                    responseGenerator.generateFullResponse(*entry, now),
                    CachedResponseSuitabilityChecker::NONE,
                    "in cache, valid"};
        }
        case CachedResponseSuitabilityChecker::SERVE_NOT_MODIFIED:{
            logger.info(key + ": in cache, validators match");
            return {CacheHandler::RETURN_304,
                    responseGenerator.generateNotModifiedResponse(*entry, now),
                    CachedResponseSuitabilityChecker::NONE,
                    "in cache, validators match"};
        }
        case CachedResponseSuitabilityChecker::MUST_FETCH:
            break;
    }

    std::string reason = std::string(CachedResponseSuitabilityChecker::describe(result.reason)) + ": " + result.detail;
    if (result.reason == CachedResponseSuitabilityChecker::CONTENT_LENGTH_MISMATCH){
        logger.warning(key + ": " + reason + ", evicting");
        storage.removeEntry(key);
    }else if (result.reason == CachedResponseSuitabilityChecker::NOT_FRESH_ENOUGH){
        long remaining = validityPolicy.getFreshnessLifetimeSecs(*entry) - validityPolicy.getCurrentAgeSecs(*entry, now);
        logger.info(key + ": in cache, but expired at " + HttpDate::format(HttpDate::add(now, remaining)));
    }else{
        logger.info(key + ": in cache, requires validation (" + reason + ")");
    }
    return fetch(request, result.reason, reason);
}

bool CacheHandler::isCacheable(const Request & request, const Response & response) const{
    std::string method = request.getMethod();
    if (method != "GET" && method != "HEAD"){
        logger.debug("not a GET or HEAD request");
        return false;
    }

    switch (response.getResult()){
        case 200:
        case 203:
        case 300:
        case 301:
        case 410:
            break;
        default:
            logger.debug("status " + std::to_string(response.getResult()) + " is not cacheable");
            return false;
    }

    if (CacheControl::hasDirective(request.getFields(), CacheControl::NO_STORE) ||
        CacheControl::hasDirective(response.getFields(), CacheControl::NO_STORE)){
        logger.debug("cache not allowed, no-store");
        return false;
    }

    if (config.isSharedCache()){
        if (CacheControl::hasDirective(response.getFields(), CacheControl::PRIVATE)){
            logger.debug("cache not allowed, private response in a shared cache");
            return false;
        }
        if (request.hasHeader("Authorization") &&
            !CacheControl::hasDirective(response.getFields(), CacheControl::S_MAXAGE) &&
            !CacheControl::hasDirective(response.getFields(), CacheControl::MUST_REVALIDATE) &&
            !CacheControl::hasDirective(response.getFields(), CacheControl::PUBLIC)){
            logger.debug("cache not allowed, authorized request in a shared cache");
            return false;
        }
    }

    for (const std::string & vary : response.getHeaders("Vary")){
        if (boost::algorithm::trim_copy(vary) == "*"){
            logger.debug("cache not allowed, Vary: *");
            return false;
        }
    }

    // without max-age the Expires/Date pair has to be readable
    if (!CacheControl::hasDirective(response.getFields(), CacheControl::MAX_AGE) &&
        !CacheControl::hasDirective(response.getFields(), CacheControl::S_MAXAGE)){
        std::vector<std::string> expires = response.getHeaders("Expires");
        std::vector<std::string> dates = response.getHeaders("Date");
        if (expires.size() > 1 || dates.size() > 1){
            logger.debug("multiple Expires or Date headers");
            return false;
        }
        if ((!expires.empty() && !HttpDate::parse(expires.front())) ||
            (!dates.empty() && !HttpDate::parse(dates.front()))){
            logger.debug("malformed Expires or Date header");
            return false;
        }
    }

    return true;
}

bool CacheHandler::storeResponse(const Request & request, const Response & response, time_t requestDate, time_t responseDate){
    std::string key = cacheKey(request);
    if (!isCacheable(request, response)){
        logger.info(key + ": not cacheable");
        return false;
    }
    CacheEntry entry = CacheEntry::fromResponse(response, requestDate, responseDate);
    if (!storage.putEntry(key, entry)){
        return false;
    }
    long lifetime = validityPolicy.getFreshnessLifetimeSecs(entry);
    long remaining = lifetime - validityPolicy.getCurrentAgeSecs(entry, responseDate);
    logger.info(key + ": cached, expires at " + HttpDate::format(HttpDate::add(responseDate, remaining)));
    if (validityPolicy.mustRevalidate(entry)){
        logger.info(key + ": cached, but requires re-validation");
    }
    return true;
}

std::optional<CacheEntry> CacheHandler::revalidated(const Request & request,
                                                    const Response & notModified,
                                                    time_t requestDate,
                                                    time_t responseDate){
    std::string key = cacheKey(request);
    std::optional<CacheEntry> entry = storage.getEntry(key);
    if (!entry){
        logger.warning(key + ": revalidated, but nothing was stored");
        return std::nullopt;
    }
    CacheEntry updated = entry->updatedWith(notModified, requestDate, responseDate);
    if (!storage.putEntry(key, updated)){
        logger.warning(key + ": revalidated, but the refreshed entry was not stored");
    }else{
        logger.info(key + ": revalidated, entry refreshed");
    }
    return updated;
}
