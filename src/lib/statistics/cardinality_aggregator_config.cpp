#include "cardinality_aggregator_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

#include "scheduler/bounded_executor.hpp"
#include "utils/assert.hpp"

namespace cardex {

CardinalityAggregatorConfig::CardinalityAggregatorConfig()
    : max_concurrency(BoundedExecutor::default_max_concurrency()) {}

CardinalityAggregatorConfig CardinalityAggregatorConfig::from_json(const nlohmann::json& json) {
  AssertInput(json.is_object(), "CardinalityAggregatorConfig must be a JSON object");

  auto config = CardinalityAggregatorConfig{};

  // nlohmann stores integers built in code as signed and integers parsed from text as unsigned, accept both
  const auto get_non_negative = [](const std::string& key, const nlohmann::json& value) {
    AssertInput(value.is_number_integer() && (value.is_number_unsigned() || value.get<int64_t>() >= 0),
                "'" + key + "' must be a non-negative integer");
    AssertInput(value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()),
                "'" + key + "' is out of range");
    return value.get<uint64_t>();
  };

  for (const auto& [key, value] : json.items()) {
    if (key == "cache_max_entries") {
      config.cache_max_entries = get_non_negative(key, value);
    } else if (key == "cache_max_age_ms") {
      config.cache_max_age = std::chrono::milliseconds{static_cast<int64_t>(get_non_negative(key, value))};
    } else if (key == "max_concurrency") {
      config.max_concurrency = get_non_negative(key, value);
      AssertInput(config.max_concurrency > 0, "'max_concurrency' must be positive");
    } else if (key == "polling_interval_ms") {
      config.polling_interval = std::chrono::milliseconds{static_cast<int64_t>(get_non_negative(key, value))};
    } else if (key == "early_return_enabled") {
      AssertInput(value.is_boolean(), "'early_return_enabled' must be a boolean");
      config.early_return_enabled = value.get<bool>();
    } else {
      FailInput("Unknown CardinalityAggregatorConfig option '" + key + "'");
    }
  }

  return config;
}

CardinalityAggregatorConfig CardinalityAggregatorConfig::load(const std::string& path) {
  std::ifstream stream{path};
  AssertInput(stream.is_open(), "Couldn't open CardinalityAggregatorConfig '" + path + "'");

  auto json = nlohmann::json{};
  try {
    stream >> json;
  } catch (const nlohmann::json::parse_error& error) {
    FailInput("Couldn't parse CardinalityAggregatorConfig '" + path + "': " + error.what());
  }

  return from_json(json);
}

nlohmann::json CardinalityAggregatorConfig::to_json() const {
  return {{"cache_max_entries", cache_max_entries},
          {"cache_max_age_ms", cache_max_age.count()},
          {"max_concurrency", max_concurrency},
          {"polling_interval_ms", polling_interval.count()},
          {"early_return_enabled", early_return_enabled}};
}

}  // namespace cardex
