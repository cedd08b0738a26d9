#pragma once

#include <chrono>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

#include "cardinality_cache_entry.hpp"
#include "store/abstract_cardinality_store.hpp"
#include "store/cache_key.hpp"
#include "types.hpp"

namespace cardex {

/**
 * Memoizes the cardinalities of exact (single value) CacheKeys in front of an AbstractCardinalityStore.
 *
 * Non-exact keys are never cached and are read straight from the store on every request.
 *
 * Entries are evicted once the cache holds more than `max_entries` entries (least recently used first) or once
 * `max_age` has passed since the entry was loaded. An expired entry is reloaded on its next request.
 *
 * The cache is thread-safe. Concurrent requests for the same missing key share one load from the store, requests
 * for different keys load independently. The store is bound at construction, use one cache per store.
 */
class CardinalityCache final {
 public:
  CardinalityCache(const std::shared_ptr<const AbstractCardinalityStore>& store, const size_t max_entries,
                   const std::chrono::milliseconds max_age);

  /**
   * Returns the cardinality of a single key, loading it from the store if it is not cached.
   */
  Cardinality get_cardinality(const CacheKey& key);

  /**
   * Returns the cardinalities of all `keys`, resolving all missing exact keys with one batched store request. The
   * result contains one entry per distinct key.
   */
  std::unordered_map<CacheKey, Cardinality> get_cardinalities(const std::vector<CacheKey>& keys);

  const std::shared_ptr<const AbstractCardinalityStore>& store() const;

  size_t max_entries() const;
  std::chrono::milliseconds max_age() const;

  size_t cache_hit_count() const;
  size_t cache_miss_count() const;
  size_t store_request_count() const;
  size_t eviction_count() const;

  size_t size() const;

  void clear();

  void set_log(const std::shared_ptr<std::ostream>& log);

  void print(std::ostream& stream) const;
  nlohmann::json to_json() const;

 private:
  // Returns the cached cardinality, evicting the entry first if it expired. Requires _mutex.
  std::optional<Cardinality> _lookup(const CacheKey& key);
  void _insert(const CacheKey& key, const Cardinality cardinality);
  void _evict(const std::unordered_map<CacheKey, CardinalityCacheEntry>::iterator iter, const char* reason);
  bool _is_expired(const CardinalityCacheEntry& entry, const std::chrono::steady_clock::time_point now) const;

  const std::shared_ptr<const AbstractCardinalityStore> _store;
  const size_t _max_entries;
  const std::chrono::milliseconds _max_age;

  mutable std::mutex _mutex;
  std::unordered_map<CacheKey, CardinalityCacheEntry> _cache;
  std::list<CacheKey> _lru_queue;  // Most recently used first

  // Loads that are currently running, for concurrent requests of the same key to wait on
  std::unordered_map<CacheKey, std::shared_future<Cardinality>> _pending_loads;

  std::shared_ptr<std::ostream> _log;
  size_t _hit_count{0};
  size_t _miss_count{0};
  size_t _store_request_count{0};
  size_t _eviction_count{0};
};

}  // namespace cardex
