#include "catalog_cache.h"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

std::string CatalogCache::normalizeKey(const std::string& dir) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::path(dir), ec);
    if (ec) p = fs::absolute(fs::path(dir), ec);
    p = p.lexically_normal();
    std::string s = p.string();
    while (s.size() > 1 && (s.back() == '/' || s.back() == '\\'))
        s.pop_back();
    return s;
}

std::vector<UniquePart> CatalogCache::load(const std::string& dir) {
    std::string key = normalizeKey(dir);
    std::vector<UniquePart> parts;
    if (cache.get(key, parts)) {
        ++hitCount;
        return parts;
    }
    ++missCount;
    parts = readSummary((fs::path(key) / kSummaryFileName).string(), key);
    spdlog::debug("[CACHE] loaded {} part(s) for {}", parts.size(), key);
    cache.put(key, parts);
    return parts;
}
