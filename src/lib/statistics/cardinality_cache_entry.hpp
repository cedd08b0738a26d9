#pragma once

#include <chrono>
#include <list>

#include "store/cache_key.hpp"
#include "types.hpp"

namespace cardex {

struct CardinalityCacheEntry {
  Cardinality cardinality{0};
  std::chrono::steady_clock::time_point write_time;
  size_t request_count{0};

  // Position in the LRU queue of the owning cache
  std::list<CacheKey>::iterator lru_position;
};

}  // namespace cardex
