#include "cardinality_cache.hpp"

#include <sstream>
#include <string>
#include <utility>

#include "utils/assert.hpp"

namespace cardex {

CardinalityCache::CardinalityCache(const std::shared_ptr<const AbstractCardinalityStore>& store,
                                   const size_t max_entries, const std::chrono::milliseconds max_age)
    : _store(store), _max_entries(max_entries), _max_age(max_age) {
  Assert(_store, "CardinalityCache needs a store to load from");
}

Cardinality CardinalityCache::get_cardinality(const CacheKey& key) {
  if (!key.range.is_exact()) {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ++_store_request_count;
    }
    return _store->get_cardinality(key);
  }

  auto promise = std::promise<Cardinality>{};

  {
    std::unique_lock<std::mutex> lock(_mutex);

    const auto cached = _lookup(key);
    if (cached) return *cached;

    const auto pending_iter = _pending_loads.find(key);
    if (pending_iter != _pending_loads.end()) {
      // Somebody else is already loading this key, wait for their result
      auto pending_load = pending_iter->second;
      lock.unlock();
      return pending_load.get();
    }

    _pending_loads.emplace(key, promise.get_future().share());
    ++_store_request_count;
  }

  auto cardinality = Cardinality{0};
  try {
    cardinality = _store->get_cardinality(key);
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _pending_loads.erase(key);
    }
    promise.set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _insert(key, cardinality);
    _pending_loads.erase(key);
  }
  promise.set_value(cardinality);

  return cardinality;
}

std::unordered_map<CacheKey, Cardinality> CardinalityCache::get_cardinalities(const std::vector<CacheKey>& keys) {
  auto cardinalities = std::unordered_map<CacheKey, Cardinality>{};

  auto uncacheable_keys = std::vector<CacheKey>{};
  auto keys_to_load = std::vector<CacheKey>{};
  auto promises = std::vector<std::promise<Cardinality>>{};
  auto pending_loads = std::vector<std::pair<CacheKey, std::shared_future<Cardinality>>>{};

  {
    std::lock_guard<std::mutex> lock(_mutex);

    for (const auto& key : keys) {
      if (cardinalities.count(key)) continue;

      if (!key.range.is_exact()) {
        uncacheable_keys.emplace_back(key);
        continue;
      }

      const auto cached = _lookup(key);
      if (cached) {
        cardinalities.emplace(key, *cached);
        continue;
      }

      const auto pending_iter = _pending_loads.find(key);
      if (pending_iter != _pending_loads.end()) {
        // Also catches duplicates within `keys` that this call claimed itself
        pending_loads.emplace_back(key, pending_iter->second);
        continue;
      }

      promises.emplace_back();
      _pending_loads.emplace(key, promises.back().get_future().share());
      keys_to_load.emplace_back(key);
    }

    if (!keys_to_load.empty()) ++_store_request_count;
    _store_request_count += uncacheable_keys.size();
  }

  if (!keys_to_load.empty()) {
    auto loaded = std::unordered_map<CacheKey, Cardinality>{};
    try {
      loaded = _store->get_cardinalities(keys_to_load);
      for (const auto& key : keys_to_load) {
        Assert(loaded.count(key), "Store did not return a cardinality for every requested key");
      }
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& key : keys_to_load) {
          _pending_loads.erase(key);
        }
      }
      for (auto& promise : promises) {
        promise.set_exception(std::current_exception());
      }
      throw;
    }

    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (const auto& key : keys_to_load) {
        _insert(key, loaded.at(key));
        _pending_loads.erase(key);
      }
    }

    for (auto key_idx = size_t{0}; key_idx < keys_to_load.size(); ++key_idx) {
      const auto cardinality = loaded.at(keys_to_load[key_idx]);
      promises[key_idx].set_value(cardinality);
      cardinalities.emplace(keys_to_load[key_idx], cardinality);
    }
  }

  for (const auto& key : uncacheable_keys) {
    cardinalities.emplace(key, _store->get_cardinality(key));
  }

  for (auto& [key, pending_load] : pending_loads) {
    cardinalities.emplace(key, pending_load.get());
  }

  return cardinalities;
}

const std::shared_ptr<const AbstractCardinalityStore>& CardinalityCache::store() const { return _store; }

size_t CardinalityCache::max_entries() const { return _max_entries; }

std::chrono::milliseconds CardinalityCache::max_age() const { return _max_age; }

size_t CardinalityCache::cache_hit_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _hit_count;
}

size_t CardinalityCache::cache_miss_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _miss_count;
}

size_t CardinalityCache::store_request_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _store_request_count;
}

size_t CardinalityCache::eviction_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _eviction_count;
}

size_t CardinalityCache::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _cache.size();
}

void CardinalityCache::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  _cache.clear();
  _lru_queue.clear();
  _hit_count = 0;
  _miss_count = 0;
  _store_request_count = 0;
  _eviction_count = 0;
}

void CardinalityCache::set_log(const std::shared_ptr<std::ostream>& log) {
  std::lock_guard<std::mutex> lock(_mutex);
  _log = log;
}

void CardinalityCache::print(std::ostream& stream) const {
  std::lock_guard<std::mutex> lock(_mutex);

  const auto now = std::chrono::steady_clock::now();

  stream << "-------------------- CACHED ENTRIES ------------------------" << std::endl;
  for (const auto& key : _lru_queue) {
    const auto& entry = _cache.at(key);
    stream << key << ": " << entry.cardinality << (_is_expired(entry, now) ? " (expired)" : "") << std::endl;
  }
  stream << "hits: " << _hit_count << ", misses: " << _miss_count << ", store requests: " << _store_request_count
         << ", evictions: " << _eviction_count << std::endl;
}

nlohmann::json CardinalityCache::to_json() const {
  std::lock_guard<std::mutex> lock(_mutex);

  const auto now = std::chrono::steady_clock::now();

  auto json = nlohmann::json::array();

  for (const auto& key : _lru_queue) {
    const auto& entry = _cache.at(key);

    std::stringstream key_stream;
    key_stream << key;

    auto entry_json = nlohmann::json();
    entry_json["key"] = key_stream.str();
    entry_json["value"] = entry.cardinality;
    entry_json["age_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.write_time).count();
    entry_json["request_count"] = entry.request_count;

    json.push_back(entry_json);
  }

  return json;
}

std::optional<Cardinality> CardinalityCache::_lookup(const CacheKey& key) {
  const auto iter = _cache.find(key);

  if (iter != _cache.end() && _is_expired(iter->second, std::chrono::steady_clock::now())) {
    _evict(iter, "EXPIRED");
  } else if (iter != _cache.end()) {
    auto& entry = iter->second;
    ++entry.request_count;
    ++_hit_count;
    _lru_queue.splice(_lru_queue.begin(), _lru_queue, entry.lru_position);

    if (_log) (*_log) << "CardinalityCache [HIT ]: " << key << ": " << entry.cardinality << std::endl;
    return entry.cardinality;
  }

  ++_miss_count;
  if (_log) (*_log) << "CardinalityCache [MISS]: " << key << std::endl;
  return std::nullopt;
}

void CardinalityCache::_insert(const CacheKey& key, const Cardinality cardinality) {
  if (_log) (*_log) << "CardinalityCache [PUT ]: " << key << ": " << cardinality << std::endl;

  // Only the request that registered the pending load inserts, so the key cannot be cached already
  DebugAssert(!_cache.count(key), "Key was loaded twice");

  _lru_queue.emplace_front(key);

  auto entry = CardinalityCacheEntry{};
  entry.cardinality = cardinality;
  entry.write_time = std::chrono::steady_clock::now();
  entry.request_count = 1;
  entry.lru_position = _lru_queue.begin();
  _cache.emplace(key, entry);

  while (_cache.size() > _max_entries) {
    _evict(_cache.find(_lru_queue.back()), "EVICT");
  }
}

void CardinalityCache::_evict(const std::unordered_map<CacheKey, CardinalityCacheEntry>::iterator iter,
                              const char* reason) {
  DebugAssert(iter != _cache.end(), "Cannot evict entry that is not cached");

  if (_log) (*_log) << "CardinalityCache [" << reason << "]: " << iter->first << std::endl;

  _lru_queue.erase(iter->second.lru_position);
  _cache.erase(iter);
  ++_eviction_count;
}

bool CardinalityCache::_is_expired(const CardinalityCacheEntry& entry,
                                   const std::chrono::steady_clock::time_point now) const {
  return now - entry.write_time >= _max_age;
}

}  // namespace cardex
