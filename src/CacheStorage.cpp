#include "CacheStorage.hpp"

CacheStorage::CacheStorage(const CacheConfig & config)
:   max_entries(config.getMaxCacheEntries()),
    max_object_size(config.getMaxObjectSizeBytes()) {}

bool CacheStorage::putEntry(const std::string & key, const CacheEntry & entry) {
    // if the entry is too large, do not cache
    if (entry.getBodyLength() > max_object_size) {
        logger.warning("Response too large to cache: " + key + " (" + std::to_string(entry.getBodyLength()) + " bytes)");
        return false;
    }

    std::lock_guard<std::mutex> lock(cache_mutex);

    auto it = cache_map.find(key);
    if (it != cache_map.end()) {
        it->second = entry;
        logger.debug("Replaced in cache: " + key);
        return true;
    }

    // ensure there is room for one more
    while (cache_map.size() >= max_entries && !cache_map.empty()) {
        evictOldestEntry();
    }
    cache_map.emplace(key, entry);
    logger.debug("Added to cache: " + key + ", now cache has " + std::to_string(cache_map.size()) + " entries");
    return true;
}

std::optional<CacheEntry> CacheStorage::getEntry(const std::string & key) const {
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto it = cache_map.find(key);
    if (it != cache_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

void CacheStorage::removeEntry(const std::string & key) {
    std::lock_guard<std::mutex> lock(cache_mutex);

    if (cache_map.erase(key) > 0) {
        logger.debug("Removed from cache: " + key);
    }
}

size_t CacheStorage::getCurrentSize() const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return cache_map.size();
}

void CacheStorage::evictOldestEntry() {
    // simple strategy: drop the entry received longest ago
    auto oldest = cache_map.begin();
    for (auto it = cache_map.begin(); it != cache_map.end(); ++it) {
        if (it->second.getResponseDate() < oldest->second.getResponseDate()) {
            oldest = it;
        }
    }
    if (oldest != cache_map.end()) {
        logger.info("NOTE evicted " + oldest->first + " from cache");
        cache_map.erase(oldest);
    }
}
