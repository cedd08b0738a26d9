#pragma once

#include <cstdint>
#include <string>

namespace cardex {

// Number of rows matching a value or a range of values. Never negative.
using Cardinality = uint64_t;

// Row values and column families are raw byte strings, ordered lexicographically
using ByteString = std::string;

}  // namespace cardex
