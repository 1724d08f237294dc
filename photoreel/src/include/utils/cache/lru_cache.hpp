#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace photoreel {
template <typename K>
concept Hashable = std::copy_constructible<K> && std::equality_comparable<K> && requires(K key) {
  { std::hash<K>{}(key) } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Fixed-capacity least-recently-used map.
 *
 * Get() and Put() move the entry to the front. Put() on a full cache evicts
 * the back entry first.
 */
template <Hashable K, typename V>
class LruCache {
  using Entry        = std::pair<K, V>;
  using ListIterator = typename std::list<Entry>::iterator;

 public:
  static constexpr std::size_t kDefaultCapacity = 256;

  LruCache() : capacity_(kDefaultCapacity) {}
  explicit LruCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  auto Contains(const K& key) const -> bool { return map_.contains(key); }
  auto Size() const -> std::size_t { return list_.size(); }
  auto Capacity() const -> std::size_t { return capacity_; }
  auto Evictions() const -> std::size_t { return evict_count_; }

  auto Get(const K& key) -> std::optional<V> {
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    list_.splice(list_.begin(), list_, it->second);
    return it->second->second;
  }

  void Put(const K& key, V value) {
    auto it = map_.find(key);
    if (it != map_.end()) {
      it->second->second = std::move(value);
      list_.splice(list_.begin(), list_, it->second);
      return;
    }
    if (list_.size() >= capacity_) {
      Evict();
    }
    list_.emplace_front(key, std::move(value));
    map_[key] = list_.begin();
  }

  void Erase(const K& key) {
    auto it = map_.find(key);
    if (it != map_.end()) {
      list_.erase(it->second);
      map_.erase(it);
    }
  }

  auto Evict() -> std::optional<Entry> {
    if (list_.empty()) {
      return std::nullopt;
    }
    Entry evicted = std::move(list_.back());
    map_.erase(evicted.first);
    list_.pop_back();
    ++evict_count_;
    return evicted;
  }

  void SetCapacity(std::size_t capacity) {
    capacity_ = capacity == 0 ? 1 : capacity;
    while (list_.size() > capacity_) {
      Evict();
    }
  }

  void Clear() {
    map_.clear();
    list_.clear();
  }

 private:
  std::unordered_map<K, ListIterator> map_{};
  std::list<Entry>                    list_{};
  std::size_t                         capacity_;
  std::size_t                         evict_count_ = 0;
};
};  // namespace photoreel
