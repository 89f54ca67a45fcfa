/***
 * Name: stackscope::rt::BindingStore
 * Purpose: Concurrent associative store used to resolve scope identifiers to bound values.
 * Inputs: Keys and values supplied by the scope controller (or any caller).
 * Outputs: Stored values via load/loadOrStore/loadAndDelete/forEach.
 * Theory of Operation:
 *   Keys are spread over a fixed number of shards. Each shard owns an
 *   unordered_map guarded by a shared_mutex: load takes a shared lock so loads
 *   never wait on each other, while store/erase take the shard's exclusive lock
 *   and only contend with operations on the same shard. forEach copies one
 *   shard at a time and runs the callback without holding any lock, so the
 *   callback may call back into the store.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stackscope::rt {

template <typename K, typename V, typename Hash = std::hash<K>>
class BindingStore {
 public:
  explicit BindingStore(std::size_t shards = 16)
      : count_(shards == 0 ? 1 : shards), shards_(std::make_unique<Shard[]>(count_)) {}

  BindingStore(const BindingStore&) = delete;
  BindingStore& operator=(const BindingStore&) = delete;

  void store(const K& key, V value) {
    Shard& sh = shardFor(key);
    const std::unique_lock<std::shared_mutex> lk(sh.mu);
    sh.map.insert_or_assign(key, std::move(value));
  }

  std::optional<V> load(const K& key) const {
    const Shard& sh = shardFor(key);
    const std::shared_lock<std::shared_mutex> lk(sh.mu);
    auto it = sh.map.find(key);
    if (it == sh.map.end()) { return std::nullopt; }
    return it->second;
  }

  void erase(const K& key) {
    Shard& sh = shardFor(key);
    const std::unique_lock<std::shared_mutex> lk(sh.mu);
    sh.map.erase(key);
  }

  // Returns the existing value and true if present; otherwise stores value and returns it with false.
  std::pair<V, bool> loadOrStore(const K& key, V value) {
    Shard& sh = shardFor(key);
    const std::unique_lock<std::shared_mutex> lk(sh.mu);
    auto [it, inserted] = sh.map.try_emplace(key, std::move(value));
    return {it->second, !inserted};
  }

  std::optional<V> loadAndDelete(const K& key) {
    Shard& sh = shardFor(key);
    const std::unique_lock<std::shared_mutex> lk(sh.mu);
    auto it = sh.map.find(key);
    if (it == sh.map.end()) { return std::nullopt; }
    std::optional<V> out{std::move(it->second)};
    sh.map.erase(it);
    return out;
  }

  // Visits entries until fn returns false. Entries added or removed concurrently
  // may or may not be observed; each key is visited at most once.
  void forEach(const std::function<bool(const K&, const V&)>& fn) const {
    for (std::size_t i = 0; i < count_; ++i) {
      std::vector<std::pair<K, V>> snapshot;
      {
        const std::shared_lock<std::shared_mutex> lk(shards_[i].mu);
        snapshot.assign(shards_[i].map.begin(), shards_[i].map.end());
      }
      for (const auto& [key, value] : snapshot) {
        if (!fn(key, value)) { return; }
      }
    }
  }

  std::size_t size() const {
    std::size_t total = 0;
    for (std::size_t i = 0; i < count_; ++i) {
      const std::shared_lock<std::shared_mutex> lk(shards_[i].mu);
      total += shards_[i].map.size();
    }
    return total;
  }

  std::size_t shardCount() const { return count_; }

 private:
  struct Shard {
    mutable std::shared_mutex mu;
    std::unordered_map<K, V, Hash> map;
  };

  std::size_t indexFor(const K& key) const {
    // Sequential ids hash to themselves under std::hash; mix so neighbours spread out.
    auto h = static_cast<std::uint64_t>(Hash{}(key));
    h ^= h >> 33U;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33U;
    return static_cast<std::size_t>(h % count_);
  }

  Shard& shardFor(const K& key) { return shards_[indexFor(key)]; }
  const Shard& shardFor(const K& key) const { return shards_[indexFor(key)]; }

  std::size_t count_;
  std::unique_ptr<Shard[]> shards_;
};

} // namespace stackscope::rt
