#pragma once

#include <atomic>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "store/value_range.hpp"
#include "types.hpp"

namespace cardex {

/**
 * A candidate index column of a query together with the value ranges its predicates select, grouped by the column
 * family the index counters are stored under. The CardinalityAggregator fills in the resolved cardinality, which
 * outlives the aggregation call so that the caller can pick the index to scan.
 *
 * The cardinality may be written by a background task after the call that requested it returned, so it is atomic.
 */
class IndexProbe {
 public:
  IndexProbe(std::string column, const ByteString& family, const std::vector<ValueRange>& ranges);

  const std::string& column() const;

  void add_ranges(const ByteString& family, const std::vector<ValueRange>& ranges);
  const std::map<ByteString, std::vector<ValueRange>>& ranges_by_family() const;

  std::optional<Cardinality> cardinality() const;
  void set_cardinality(const Cardinality cardinality);

 private:
  const std::string _column;
  std::map<ByteString, std::vector<ValueRange>> _ranges_by_family;

  std::atomic<bool> _is_resolved{false};
  std::atomic<Cardinality> _cardinality{0};
};

std::ostream& operator<<(std::ostream& stream, const IndexProbe& probe);

}  // namespace cardex
