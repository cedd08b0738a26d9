#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "nlohmann/json.hpp"

#include "index_probe.hpp"
#include "types.hpp"

namespace cardex {

/**
 * IndexProbes grouped by their resolved cardinality, iterated from the smallest to the largest cardinality. The order
 * of probes sharing the same cardinality is unspecified.
 */
class RankedCardinalities {
 public:
  using Map = std::map<Cardinality, std::vector<std::shared_ptr<IndexProbe>>>;

  void add(const Cardinality cardinality, const std::shared_ptr<IndexProbe>& probe);

  std::optional<Cardinality> smallest_cardinality() const;

  // All probes sharing the smallest cardinality, empty if there are none
  std::vector<std::shared_ptr<IndexProbe>> smallest() const;

  // Number of probes, not the number of distinct cardinalities
  size_t size() const;
  bool empty() const;

  Map::const_iterator begin() const;
  Map::const_iterator end() const;

  nlohmann::json to_json() const;

 private:
  Map _probes_by_cardinality;
  size_t _size{0};
};

}  // namespace cardex
