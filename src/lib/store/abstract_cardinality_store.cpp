#include "abstract_cardinality_store.hpp"

namespace cardex {

Cardinality AbstractCardinalityStore::get_cardinality(const std::vector<CacheKey>& keys) const {
  auto sum = Cardinality{0};
  for (const auto& key : keys) {
    sum += get_cardinality(key);
  }
  return sum;
}

std::unordered_map<CacheKey, Cardinality> AbstractCardinalityStore::get_cardinalities(
    const std::vector<CacheKey>& keys) const {
  auto cardinalities = std::unordered_map<CacheKey, Cardinality>{};
  for (const auto& key : keys) {
    if (cardinalities.count(key)) continue;
    cardinalities.emplace(key, get_cardinality(key));
  }
  return cardinalities;
}

}  // namespace cardex
