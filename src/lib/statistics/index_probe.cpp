#include "index_probe.hpp"

#include <utility>

namespace cardex {

IndexProbe::IndexProbe(std::string column, const ByteString& family, const std::vector<ValueRange>& ranges)
    : _column(std::move(column)) {
  add_ranges(family, ranges);
}

const std::string& IndexProbe::column() const { return _column; }

void IndexProbe::add_ranges(const ByteString& family, const std::vector<ValueRange>& ranges) {
  auto& family_ranges = _ranges_by_family[family];
  family_ranges.insert(family_ranges.end(), ranges.begin(), ranges.end());
}

const std::map<ByteString, std::vector<ValueRange>>& IndexProbe::ranges_by_family() const {
  return _ranges_by_family;
}

std::optional<Cardinality> IndexProbe::cardinality() const {
  if (!_is_resolved.load()) return std::nullopt;
  return _cardinality.load();
}

void IndexProbe::set_cardinality(const Cardinality cardinality) {
  _cardinality.store(cardinality);
  _is_resolved.store(true);
}

std::ostream& operator<<(std::ostream& stream, const IndexProbe& probe) {
  stream << probe.column() << " [";
  auto first = true;
  for (const auto& [family, ranges] : probe.ranges_by_family()) {
    for (const auto& range : ranges) {
      if (!first) stream << ", ";
      stream << family << ":" << range;
      first = false;
    }
  }
  return stream << "]";
}

}  // namespace cardex
