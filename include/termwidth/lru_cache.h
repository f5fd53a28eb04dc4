/**
 * @file lru_cache.h
 * @brief Bounded, thread-safe least-recently-used cache.
 *
 * Every get(), put() and contains() counts as a use and moves the entry
 * to the most-recently-used position; peek() does not. When a new key is
 * inserted into a full cache the least-recently-used entry is evicted.
 *
 * All operations take an internal mutex, so one cache can be shared by
 * any number of threads.
 */

#ifndef TERMWIDTH_LRU_CACHE_H
#define TERMWIDTH_LRU_CACHE_H

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace termwidth {

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
  /// @param capacity Maximum number of entries; 0 disables storage.
  explicit LruCache(size_t capacity) : capacity_(capacity) {}

  LruCache(const LruCache&) = delete;
  LruCache& operator=(const LruCache&) = delete;

  std::optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  std::optional<Value> peek(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return std::nullopt;
    }
    return it->second->second;
  }

  void put(const Key& key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
      return;
    }

    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }

    if (entries_.size() == capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
    entries_.emplace_front(key, std::move(value));
    index_.emplace(key, entries_.begin());
  }

  bool contains(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return true;
  }

  /// @return true if @p key was present.
  bool erase(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  using Entry = std::pair<Key, Value>;
  using EntryList = std::list<Entry>;

  const size_t capacity_;
  mutable std::mutex mutex_;
  EntryList entries_; // most recently used first
  std::unordered_map<Key, typename EntryList::iterator, Hash> index_;
};

} // namespace termwidth

#endif // TERMWIDTH_LRU_CACHE_H
