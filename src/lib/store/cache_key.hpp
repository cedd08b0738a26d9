#pragma once

#include <functional>
#include <ostream>
#include <string>

#include "store/value_range.hpp"
#include "store/visibility.hpp"
#include "types.hpp"

namespace cardex {

/**
 * Identifies one cardinality lookup: the rows of `schema.table` whose value in `family` falls into `range`, counted
 * with the visibility of `authorizations`. Two keys are equal iff all fields match, including the full authorization
 * set. Exact ranges are stored normalized, so ["abc", "abc"] and exact("abc") make the same key.
 */
struct CacheKey {
  CacheKey(std::string schema, std::string table, ByteString family, Authorizations authorizations, ValueRange range);

  bool operator==(const CacheKey& rhs) const;
  bool operator!=(const CacheKey& rhs) const;

  size_t hash() const;

  const std::string schema;
  const std::string table;
  const ByteString family;
  const Authorizations authorizations;
  const ValueRange range;
};

std::ostream& operator<<(std::ostream& stream, const CacheKey& key);

}  // namespace cardex

namespace std {

template <>
struct hash<cardex::CacheKey> {
  size_t operator()(const cardex::CacheKey& key) const { return key.hash(); }
};

}  // namespace std
