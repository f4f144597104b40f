#ifndef CACHEHANDLER_HPP
#define CACHEHANDLER_HPP

#include <ctime>
#include <optional>
#include <string>

#include "CacheConfig.hpp"
#include "CacheEntry.hpp"
#include "CacheStorage.hpp"
#include "CacheValidityPolicy.hpp"
#include "CachedHttpResponseGenerator.hpp"
#include "CachedResponseSuitabilityChecker.hpp"
#include "Logger.hpp"
#include "Request.hpp"
#include "RequestProtocolCompliance.hpp"
#include "Response.hpp"

// Front of the cache for a transport layer: look a request up, store what
// the origin sent back, fold a 304 from the origin into the stored entry.
class CacheHandler{
    public:

        enum Decision{
            RETURN_CACHE,
            RETURN_304,
            RETURN_ERROR,
            RETURN_504,
            FETCH
        };

        struct Lookup{
            Decision decision;
            // set for everything but FETCH
            std::optional<Response> response;
            CachedResponseSuitabilityChecker::MissReason missReason;
            std::string reason;
        };

        CacheHandler(CacheStorage & storage, const CacheConfig & config);

        static std::string cacheKey(const Request & request);

        // true when the transport has to contact the origin
        static bool needToSend(Decision decision);

        static const char * describe(Decision decision);

        bool isServableFromCache(const Request & request) const;

        Lookup lookup(const Request & request, time_t now);

        bool isCacheable(const Request & request, const Response & response) const;

        bool storeResponse(const Request & request, const Response & response, time_t requestDate, time_t responseDate);

        // stored entry refreshed by the origin's 304, nullopt if nothing was stored
        std::optional<CacheEntry> revalidated(const Request & request,
                                              const Response & notModified,
                                              time_t requestDate,
                                              time_t responseDate);

    private:
        CacheStorage & storage;
        CacheConfig config;
        CacheValidityPolicy validityPolicy;
        CachedResponseSuitabilityChecker suitabilityChecker;
        CachedHttpResponseGenerator responseGenerator;
        RequestProtocolCompliance requestCompliance;

        static inline Logger & logger = Logger::getInstance();

        Lookup fetch(const Request & request,
                     CachedResponseSuitabilityChecker::MissReason missReason,
                     const std::string & reason) const;
};

#endif
