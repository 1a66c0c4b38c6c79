#ifndef CATALOG_CACHE_H
#define CATALOG_CACHE_H
#include "lru_cache.h"
#include "part_catalog.h"
#include <atomic>
#include <string>
#include <vector>

// Summary catalogs keyed by normalised directory path.
// Owned by the caller; nothing here is process global.
class CatalogCache {
public:
    explicit CatalogCache(size_t cap) : cache(cap) {}

    // Catalog from <dir>/all_parts.csv, read on a miss.
    // Throws std::runtime_error when the summary cannot be read.
    std::vector<UniquePart> load(const std::string& dir);

    // Drops the entry for `dir`. Returns true if one was cached.
    bool invalidate(const std::string& dir) { return cache.erase(normalizeKey(dir)); }
    void clear() { cache.clear(); }

    size_t size() const { return cache.size(); }
    size_t hits() const { return hitCount; }
    size_t misses() const { return missCount; }

    static std::string normalizeKey(const std::string& dir);

private:
    LRUCache<std::string, std::vector<UniquePart>> cache;
    std::atomic<size_t> hitCount{0};
    std::atomic<size_t> missCount{0};
};

#endif
