#include "ranked_cardinalities.hpp"

namespace cardex {

void RankedCardinalities::add(const Cardinality cardinality, const std::shared_ptr<IndexProbe>& probe) {
  _probes_by_cardinality[cardinality].emplace_back(probe);
  ++_size;
}

std::optional<Cardinality> RankedCardinalities::smallest_cardinality() const {
  if (_probes_by_cardinality.empty()) return std::nullopt;
  return _probes_by_cardinality.begin()->first;
}

std::vector<std::shared_ptr<IndexProbe>> RankedCardinalities::smallest() const {
  if (_probes_by_cardinality.empty()) return {};
  return _probes_by_cardinality.begin()->second;
}

size_t RankedCardinalities::size() const { return _size; }

bool RankedCardinalities::empty() const { return _size == 0; }

RankedCardinalities::Map::const_iterator RankedCardinalities::begin() const { return _probes_by_cardinality.begin(); }

RankedCardinalities::Map::const_iterator RankedCardinalities::end() const { return _probes_by_cardinality.end(); }

nlohmann::json RankedCardinalities::to_json() const {
  auto json = nlohmann::json::array();

  for (const auto& [cardinality, probes] : _probes_by_cardinality) {
    auto columns = nlohmann::json::array();
    for (const auto& probe : probes) {
      columns.push_back(probe->column());
    }
    json.push_back({{"cardinality", cardinality}, {"columns", columns}});
  }

  return json;
}

}  // namespace cardex
