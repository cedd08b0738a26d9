#include "cache_key.hpp"

#include <utility>

#include "boost/container_hash/hash.hpp"

namespace cardex {

CacheKey::CacheKey(std::string schema, std::string table, ByteString family, Authorizations authorizations,
                   ValueRange range)
    : schema(std::move(schema)),
      table(std::move(table)),
      family(std::move(family)),
      authorizations(std::move(authorizations)),
      range(range.normalized()) {}

bool CacheKey::operator==(const CacheKey& rhs) const {
  return schema == rhs.schema && table == rhs.table && family == rhs.family &&
         authorizations == rhs.authorizations && range == rhs.range;
}

bool CacheKey::operator!=(const CacheKey& rhs) const { return !operator==(rhs); }

size_t CacheKey::hash() const {
  auto hash = std::hash<std::string>{}(schema);
  boost::hash_combine(hash, table);
  boost::hash_combine(hash, family);
  boost::hash_combine(hash, authorizations.hash());
  boost::hash_combine(hash, range.hash());
  return hash;
}

std::ostream& operator<<(std::ostream& stream, const CacheKey& key) {
  return stream << key.schema << "." << key.table << ":" << key.family << " " << key.range << " "
                << key.authorizations;
}

}  // namespace cardex
