#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "abstract_cardinality_store.hpp"

namespace cardex {

class InMemoryCardinalityStore;

struct CardinalityIncrement {
  ByteString family;
  ByteString value;
  ColumnVisibility visibility;
};

class InMemoryCardinalityWriter : public AbstractCardinalityWriter {
 public:
  InMemoryCardinalityWriter(InMemoryCardinalityStore& store, std::string schema, std::string table);

  void increment_cardinality(const ByteString& value, const ByteString& family,
                             const ColumnVisibility& visibility) override;
  void increment_row_count(const ColumnVisibility& visibility) override;
  void flush() override;

 private:
  InMemoryCardinalityStore& _store;
  const std::string _schema;
  const std::string _table;

  std::vector<CardinalityIncrement> _pending_cardinalities;
  std::vector<ColumnVisibility> _pending_row_counts;
};

/**
 * Keeps all counters in memory. Used by tests and the playground, and as a reference for the semantics every other
 * store has to follow. Must outlive all writers it created.
 */
class InMemoryCardinalityStore : public AbstractCardinalityStore {
 public:
  using AbstractCardinalityStore::get_cardinality;

  void create_table(const std::string& schema, const std::string& table) override;
  void drop_table(const std::string& schema, const std::string& table) override;
  void rename_table(const std::string& schema, const std::string& old_table, const std::string& new_table) override;
  bool table_exists(const std::string& schema, const std::string& table) const override;

  std::unique_ptr<AbstractCardinalityWriter> new_writer(const std::string& schema, const std::string& table) override;

  Cardinality get_num_rows_in_table(const std::string& schema, const std::string& table,
                                    const Authorizations& authorizations) const override;

  Cardinality get_cardinality(const CacheKey& key) const override;

  std::unordered_map<CacheKey, Cardinality> get_cardinalities(const std::vector<CacheKey>& keys) const override;

 protected:
  friend class InMemoryCardinalityWriter;

  // Count per visibility expression
  using VisibilityCounts = std::vector<std::pair<ColumnVisibility, Cardinality>>;

  struct TableCounters {
    // family -> value -> counts. Values are kept sorted for range reads.
    std::unordered_map<ByteString, std::map<ByteString, VisibilityCounts>> cardinalities;
    VisibilityCounts row_counts;
  };

  void _apply(const std::string& schema, const std::string& table, const std::vector<CardinalityIncrement>& cardinalities,
              const std::vector<ColumnVisibility>& row_counts);

  static std::string _qualified_name(const std::string& schema, const std::string& table);
  static void _add(VisibilityCounts& counts, const ColumnVisibility& visibility);
  static Cardinality _sum(const VisibilityCounts& counts, const Authorizations& authorizations);

  const TableCounters& _get_table(const std::string& schema, const std::string& table) const;
  Cardinality _get_cardinality(const CacheKey& key) const;

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, TableCounters> _tables;
};

}  // namespace cardex
