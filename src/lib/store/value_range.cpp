#include "value_range.hpp"

#include <utility>

#include "boost/container_hash/hash.hpp"

#include "utils/assert.hpp"

namespace cardex {

bool ValueRange::Bound::operator==(const Bound& rhs) const {
  return value == rhs.value && inclusive == rhs.inclusive;
}

ValueRange ValueRange::exact(const ByteString& value) {
  return ValueRange{Bound{value, true}, Bound{following_value(value), false}};
}

ValueRange ValueRange::between(const ByteString& lower, const ByteString& upper, const bool lower_inclusive,
                               const bool upper_inclusive) {
  return ValueRange{Bound{lower, lower_inclusive}, Bound{upper, upper_inclusive}};
}

ValueRange ValueRange::at_least(const ByteString& lower) { return ValueRange{Bound{lower, true}, std::nullopt}; }

ValueRange ValueRange::greater_than(const ByteString& lower) { return ValueRange{Bound{lower, false}, std::nullopt}; }

ValueRange ValueRange::at_most(const ByteString& upper) { return ValueRange{std::nullopt, Bound{upper, true}}; }

ValueRange ValueRange::less_than(const ByteString& upper) { return ValueRange{std::nullopt, Bound{upper, false}}; }

ValueRange ValueRange::all() { return ValueRange{std::nullopt, std::nullopt}; }

ValueRange::ValueRange(std::optional<Bound> lower, std::optional<Bound> upper)
    : _lower(std::move(lower)), _upper(std::move(upper)) {
  if (_lower && _upper) {
    Assert(_lower->value <= _upper->value, "Lower bound of ValueRange must not exceed its upper bound");
    Assert(_lower->value != _upper->value || (_lower->inclusive && _upper->inclusive),
           "ValueRange with equal bounds must be closed on both ends");
  }
}

const std::optional<ValueRange::Bound>& ValueRange::lower() const { return _lower; }

const std::optional<ValueRange::Bound>& ValueRange::upper() const { return _upper; }

bool ValueRange::is_exact() const { return exact_value().has_value(); }

std::optional<ByteString> ValueRange::exact_value() const {
  if (!_lower || !_upper) return std::nullopt;

  // Smallest value contained in the range
  auto first_value = _lower->inclusive ? _lower->value : following_value(_lower->value);

  const auto is_single_value =
      _upper->inclusive ? _upper->value == first_value : _upper->value == following_value(first_value);
  if (!is_single_value) return std::nullopt;

  return first_value;
}

ValueRange ValueRange::normalized() const {
  const auto value = exact_value();
  if (!value) return *this;
  return exact(*value);
}

bool ValueRange::contains(const ByteString& value) const {
  if (_lower) {
    if (_lower->inclusive ? value < _lower->value : value <= _lower->value) return false;
  }
  if (_upper) {
    if (_upper->inclusive ? value > _upper->value : value >= _upper->value) return false;
  }
  return true;
}

bool ValueRange::operator==(const ValueRange& rhs) const { return _lower == rhs._lower && _upper == rhs._upper; }

bool ValueRange::operator!=(const ValueRange& rhs) const { return !operator==(rhs); }

size_t ValueRange::hash() const {
  auto hash = size_t{0};

  const auto combine_bound = [&](const std::optional<Bound>& bound) {
    boost::hash_combine(hash, bound.has_value());
    if (!bound) return;
    boost::hash_combine(hash, bound->value);
    boost::hash_combine(hash, bound->inclusive);
  };

  combine_bound(_lower);
  combine_bound(_upper);

  return hash;
}

ByteString ValueRange::following_value(const ByteString& value) { return value + '\0'; }

std::ostream& operator<<(std::ostream& stream, const ValueRange& range) {
  if (range.lower()) {
    stream << (range.lower()->inclusive ? "[" : "(") << "'" << range.lower()->value << "'";
  } else {
    stream << "(-inf";
  }

  stream << ", ";

  if (range.upper()) {
    stream << "'" << range.upper()->value << "'" << (range.upper()->inclusive ? "]" : ")");
  } else {
    stream << "+inf)";
  }

  return stream;
}

}  // namespace cardex
