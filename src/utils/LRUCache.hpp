#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <unordered_map>
#include <utility>

// Count-bounded LRU cache. Not thread-safe; owners guard it with their own mutex.
template <typename K, typename V>
class LRUCache
{
public:
    explicit LRUCache(std::size_t capacity = 64)
        : capacity_(capacity)
    {
    }

    void setCapacity(std::size_t cap)
    {
        capacity_ = cap;
        trim();
    }

    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::size_t size() const { return items_.size(); }
    [[nodiscard]] bool contains(const K& key) const { return map_.find(key) != map_.end(); }

    bool get(const K& key, V& out)
    {
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        items_.splice(items_.begin(), items_, it->second);
        out = it->second->second;
        return true;
    }

    void put(const K& key, const V& val)
    {
        if (auto it = map_.find(key); it != map_.end())
        {
            it->second->second = val;
            items_.splice(items_.begin(), items_, it->second);
            return;
        }
        items_.emplace_front(key, val);
        map_[items_.front().first] = items_.begin();
        trim();
    }

    // Returns true when an entry was dropped.
    bool erase(const K& key)
    {
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        items_.erase(it->second);
        map_.erase(it);
        return true;
    }

    void clear()
    {
        items_.clear();
        map_.clear();
    }

private:
    void trim()
    {
        while (capacity_ > 0 && items_.size() > capacity_)
        {
            auto last = std::prev(items_.end());
            map_.erase(last->first);
            items_.pop_back();
        }
    }

    std::size_t capacity_;
    std::list<std::pair<K, V>> items_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
};
