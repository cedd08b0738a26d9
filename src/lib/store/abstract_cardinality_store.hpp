#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "store/cache_key.hpp"
#include "store/visibility.hpp"
#include "types.hpp"

namespace cardex {

/**
 * Buffers increments to the counters of one table. Buffered increments are not visible to readers until flush() was
 * called. Writers are not thread-safe, use one writer per thread.
 */
class AbstractCardinalityWriter {
 public:
  virtual ~AbstractCardinalityWriter() = default;

  // Adds one row with `value` in column family `family`
  virtual void increment_cardinality(const ByteString& value, const ByteString& family,
                                     const ColumnVisibility& visibility) = 0;

  virtual void increment_row_count(const ColumnVisibility& visibility) = 0;

  // Makes all increments buffered by this writer visible to subsequent reads
  virtual void flush() = 0;
};

/**
 * Durable, authorization-aware storage of counters keyed by (table, column family, value, visibility). Reads sum up
 * all increments whose visibility is satisfied by the authorizations of the CacheKey. Implementations must be
 * thread-safe for concurrent readers.
 */
class AbstractCardinalityStore {
 public:
  virtual ~AbstractCardinalityStore() = default;

  /**
   * @defgroup Table lifecycle
   * @{
   */
  virtual void create_table(const std::string& schema, const std::string& table) = 0;
  virtual void drop_table(const std::string& schema, const std::string& table) = 0;
  virtual void rename_table(const std::string& schema, const std::string& old_table,
                            const std::string& new_table) = 0;
  virtual bool table_exists(const std::string& schema, const std::string& table) const = 0;
  /** @} */

  virtual std::unique_ptr<AbstractCardinalityWriter> new_writer(const std::string& schema,
                                                                const std::string& table) = 0;

  virtual Cardinality get_num_rows_in_table(const std::string& schema, const std::string& table,
                                            const Authorizations& authorizations) const = 0;

  // Number of rows matching the range of `key`, 0 if none were ever counted
  virtual Cardinality get_cardinality(const CacheKey& key) const = 0;

  // Sum of get_cardinality() over all `keys`, 0 for an empty collection
  virtual Cardinality get_cardinality(const std::vector<CacheKey>& keys) const;

  // Contains exactly one entry per distinct key in `keys`
  virtual std::unordered_map<CacheKey, Cardinality> get_cardinalities(const std::vector<CacheKey>& keys) const;
};

}  // namespace cardex
