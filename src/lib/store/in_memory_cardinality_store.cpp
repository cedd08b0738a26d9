#include "in_memory_cardinality_store.hpp"

#include <mutex>

#include "store/store_exceptions.hpp"

namespace cardex {

InMemoryCardinalityWriter::InMemoryCardinalityWriter(InMemoryCardinalityStore& store, std::string schema,
                                                     std::string table)
    : _store(store), _schema(std::move(schema)), _table(std::move(table)) {}

void InMemoryCardinalityWriter::increment_cardinality(const ByteString& value, const ByteString& family,
                                                      const ColumnVisibility& visibility) {
  _pending_cardinalities.emplace_back(CardinalityIncrement{family, value, visibility});
}

void InMemoryCardinalityWriter::increment_row_count(const ColumnVisibility& visibility) {
  _pending_row_counts.emplace_back(visibility);
}

void InMemoryCardinalityWriter::flush() {
  if (_pending_cardinalities.empty() && _pending_row_counts.empty()) return;

  _store._apply(_schema, _table, _pending_cardinalities, _pending_row_counts);
  _pending_cardinalities.clear();
  _pending_row_counts.clear();
}

void InMemoryCardinalityStore::create_table(const std::string& schema, const std::string& table) {
  std::unique_lock<std::shared_mutex> lock(_mutex);

  const auto emplaced = _tables.emplace(_qualified_name(schema, table), TableCounters{}).second;
  if (!emplaced) throw TableExistsException("Metrics table " + _qualified_name(schema, table) + " already exists");
}

void InMemoryCardinalityStore::drop_table(const std::string& schema, const std::string& table) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  _tables.erase(_qualified_name(schema, table));
}

void InMemoryCardinalityStore::rename_table(const std::string& schema, const std::string& old_table,
                                            const std::string& new_table) {
  std::unique_lock<std::shared_mutex> lock(_mutex);

  const auto old_name = _qualified_name(schema, old_table);
  const auto new_name = _qualified_name(schema, new_table);

  const auto iter = _tables.find(old_name);
  if (iter == _tables.end()) throw MissingTableException("Metrics table " + old_name + " does not exist");
  if (_tables.count(new_name)) throw TableExistsException("Metrics table " + new_name + " already exists");

  auto counters = std::move(iter->second);
  _tables.erase(iter);
  _tables.emplace(new_name, std::move(counters));
}

bool InMemoryCardinalityStore::table_exists(const std::string& schema, const std::string& table) const {
  std::shared_lock<std::shared_mutex> lock(_mutex);
  return _tables.count(_qualified_name(schema, table)) > 0;
}

std::unique_ptr<AbstractCardinalityWriter> InMemoryCardinalityStore::new_writer(const std::string& schema,
                                                                                const std::string& table) {
  if (!table_exists(schema, table)) {
    throw MissingTableException("Metrics table " + _qualified_name(schema, table) + " does not exist");
  }
  return std::make_unique<InMemoryCardinalityWriter>(*this, schema, table);
}

Cardinality InMemoryCardinalityStore::get_num_rows_in_table(const std::string& schema, const std::string& table,
                                                            const Authorizations& authorizations) const {
  std::shared_lock<std::shared_mutex> lock(_mutex);
  return _sum(_get_table(schema, table).row_counts, authorizations);
}

Cardinality InMemoryCardinalityStore::get_cardinality(const CacheKey& key) const {
  std::shared_lock<std::shared_mutex> lock(_mutex);
  return _get_cardinality(key);
}

std::unordered_map<CacheKey, Cardinality> InMemoryCardinalityStore::get_cardinalities(
    const std::vector<CacheKey>& keys) const {
  // One consistent snapshot for the whole batch
  std::shared_lock<std::shared_mutex> lock(_mutex);

  auto cardinalities = std::unordered_map<CacheKey, Cardinality>{};
  for (const auto& key : keys) {
    if (cardinalities.count(key)) continue;
    cardinalities.emplace(key, _get_cardinality(key));
  }
  return cardinalities;
}

void InMemoryCardinalityStore::_apply(const std::string& schema, const std::string& table,
                                      const std::vector<CardinalityIncrement>& cardinalities,
                                      const std::vector<ColumnVisibility>& row_counts) {
  std::unique_lock<std::shared_mutex> lock(_mutex);

  const auto iter = _tables.find(_qualified_name(schema, table));
  if (iter == _tables.end()) {
    throw MissingTableException("Metrics table " + _qualified_name(schema, table) + " does not exist");
  }
  auto& counters = iter->second;

  for (const auto& increment : cardinalities) {
    _add(counters.cardinalities[increment.family][increment.value], increment.visibility);
  }

  for (const auto& visibility : row_counts) {
    _add(counters.row_counts, visibility);
  }
}

std::string InMemoryCardinalityStore::_qualified_name(const std::string& schema, const std::string& table) {
  return schema + "." + table;
}

void InMemoryCardinalityStore::_add(VisibilityCounts& counts, const ColumnVisibility& visibility) {
  for (auto& [existing_visibility, count] : counts) {
    if (existing_visibility == visibility) {
      ++count;
      return;
    }
  }
  counts.emplace_back(visibility, Cardinality{1});
}

Cardinality InMemoryCardinalityStore::_sum(const VisibilityCounts& counts, const Authorizations& authorizations) {
  auto sum = Cardinality{0};
  for (const auto& [visibility, count] : counts) {
    if (visibility.evaluate(authorizations)) sum += count;
  }
  return sum;
}

const InMemoryCardinalityStore::TableCounters& InMemoryCardinalityStore::_get_table(const std::string& schema,
                                                                                    const std::string& table) const {
  const auto iter = _tables.find(_qualified_name(schema, table));
  if (iter == _tables.end()) {
    throw MissingTableException("Metrics table " + _qualified_name(schema, table) + " does not exist");
  }
  return iter->second;
}

Cardinality InMemoryCardinalityStore::_get_cardinality(const CacheKey& key) const {
  const auto& counters = _get_table(key.schema, key.table);

  const auto family_iter = counters.cardinalities.find(key.family);
  if (family_iter == counters.cardinalities.end()) return 0;
  const auto& values = family_iter->second;

  const auto& range = key.range;
  auto value_iter = range.lower() ? values.lower_bound(range.lower()->value) : values.begin();

  auto sum = Cardinality{0};
  for (; value_iter != values.end(); ++value_iter) {
    const auto& value = value_iter->first;
    if (range.upper() && value > range.upper()->value) break;
    if (!range.contains(value)) continue;

    sum += _sum(value_iter->second, key.authorizations);
  }

  return sum;
}

}  // namespace cardex
