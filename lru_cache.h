#ifndef LRU_CACHE_H
#define LRU_CACHE_H
#include <list>
#include <mutex>
#include <unordered_map>
#include <utility>

// Thread-safe LRU cache. A capacity of 0 is treated as 1.
template <class Key, class Value>
class LRUCache {
public:
    explicit LRUCache(size_t cap) : capacity(cap == 0 ? 1 : cap) {}

    bool get(const Key& k, Value& v) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = map.find(k);
        if (it == map.end()) return false;
        order.splice(order.begin(), order, it->second.second);
        v = it->second.first;
        return true;
    }

    void put(const Key& k, const Value& v) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = map.find(k);
        if (it != map.end()) {
            it->second.first = v;
            order.splice(order.begin(), order, it->second.second);
            return;
        }
        if (map.size() >= capacity) {
            map.erase(order.back());
            order.pop_back();
        }
        order.push_front(k);
        map.emplace(k, std::make_pair(v, order.begin()));
    }

    // Returns true if `k` was cached.
    bool erase(const Key& k) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = map.find(k);
        if (it == map.end()) return false;
        order.erase(it->second.second);
        map.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx);
        map.clear();
        order.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return map.size();
    }

private:
    size_t capacity;
    mutable std::mutex mtx;
    std::list<Key> order;
    std::unordered_map<Key, std::pair<Value, typename std::list<Key>::iterator>> map;
};

#endif
