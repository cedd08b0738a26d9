#pragma once

#include <functional>
#include <optional>
#include <ostream>

#include "types.hpp"

namespace cardex {

/**
 * A range over row values at row granularity. Values are byte strings ordered lexicographically, so the immediate
 * successor of a value `v` is `v + '\0'`. An absent bound is infinite.
 */
class ValueRange {
 public:
  struct Bound {
    ByteString value;
    bool inclusive{true};

    bool operator==(const Bound& rhs) const;
  };

  static ValueRange exact(const ByteString& value);
  static ValueRange between(const ByteString& lower, const ByteString& upper, const bool lower_inclusive = true,
                            const bool upper_inclusive = true);
  static ValueRange at_least(const ByteString& lower);
  static ValueRange greater_than(const ByteString& lower);
  static ValueRange at_most(const ByteString& upper);
  static ValueRange less_than(const ByteString& upper);
  static ValueRange all();

  ValueRange(std::optional<Bound> lower, std::optional<Bound> upper);

  const std::optional<Bound>& lower() const;
  const std::optional<Bound>& upper() const;

  /**
   * A range is exact if both of its bounds are closed and it denotes precisely one value, e.g., ["abc", "abc"] or
   * ["abc", "abc\0"). Only exact ranges are memoized by the CardinalityCache.
   */
  bool is_exact() const;

  // The single value of an exact range
  std::optional<ByteString> exact_value() const;

  // Exact ranges are rewritten to exact(value), so that all ranges denoting the same single value compare equal
  ValueRange normalized() const;

  bool contains(const ByteString& value) const;

  bool operator==(const ValueRange& rhs) const;
  bool operator!=(const ValueRange& rhs) const;

  size_t hash() const;

  static ByteString following_value(const ByteString& value);

 private:
  std::optional<Bound> _lower;
  std::optional<Bound> _upper;
};

std::ostream& operator<<(std::ostream& stream, const ValueRange& range);

}  // namespace cardex

namespace std {

template <>
struct hash<cardex::ValueRange> {
  size_t operator()(const cardex::ValueRange& range) const { return range.hash(); }
};

}  // namespace std
