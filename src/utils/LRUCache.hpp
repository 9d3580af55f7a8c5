#pragma once

#include <unordered_map>
#include <list>
#include <utility>
#include <cstddef>
#include <cstdint>

// Simple count-bounded LRU cache with hit/miss accounting.
// Not thread-safe; each owner keeps its own instance.
template <typename K, typename V>
class LRUCache {
public:
    explicit LRUCache(std::size_t capacity = 256) : capacity_(capacity) {}

    void setCapacity(std::size_t cap) { capacity_ = cap; trim(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t size() const { return items_.size(); }
    std::uint64_t hits() const { return hits_; }
    std::uint64_t misses() const { return misses_; }

    bool get(const K& key, V& out) {
        auto it = map_.find(key);
        if (it == map_.end()) {
            ++misses_;
            return false;
        }
        ++hits_;
        items_.splice(items_.begin(), items_, it->second);
        out = it->second->second;
        return true;
    }

    void put(const K& key, const V& val) {
        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->second = val;
            items_.splice(items_.begin(), items_, it->second);
            return;
        }
        items_.emplace_front(key, val);
        map_[items_.front().first] = items_.begin();
        trim();
    }

    void clear() {
        items_.clear();
        map_.clear();
        hits_ = 0;
        misses_ = 0;
    }

private:
    void trim() {
        while (capacity_ > 0 && items_.size() > capacity_) {
            auto last = items_.end();
            --last;
            map_.erase(last->first);
            items_.pop_back();
        }
    }

    std::size_t capacity_;
    std::list<std::pair<K,V>> items_;
    std::unordered_map<K, typename std::list<std::pair<K,V>>::iterator> map_;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};
