#ifndef CACHESTORAGE_HPP
#define CACHESTORAGE_HPP

#include <string>
#include <unordered_map>
#include <mutex>
#include <optional>

#include "Logger.hpp"
#include "CacheConfig.hpp"
#include "CacheEntry.hpp"

// In-memory cache key -> entry map. Entries are copied in and out, so a
// caller never sees another thread's update half way. Concurrent writers of
// the same key: the last one wins.
class CacheStorage {
private:
    std::unordered_map<std::string, CacheEntry> cache_map;
    mutable std::mutex cache_mutex;
    size_t max_entries;
    size_t max_object_size;
    static inline Logger & logger = Logger::getInstance();

    // must be called with cache_mutex held
    void evictOldestEntry();

public:
    explicit CacheStorage(const CacheConfig & config);

    // false when the body is larger than the configured object size
    bool putEntry(const std::string & key, const CacheEntry & entry);
    std::optional<CacheEntry> getEntry(const std::string & key) const;
    void removeEntry(const std::string & key);
    size_t getCurrentSize() const;
};

#endif
