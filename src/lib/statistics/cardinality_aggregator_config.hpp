#pragma once

#include <chrono>
#include <string>

#include "nlohmann/json.hpp"

namespace cardex {

/**
 * Construction-time configuration of the CardinalityAggregator. The polling interval and the early return flag are
 * defaults that single calls may override.
 */
struct CardinalityAggregatorConfig {
  static CardinalityAggregatorConfig from_json(const nlohmann::json& json);
  static CardinalityAggregatorConfig load(const std::string& path);

  nlohmann::json to_json() const;

  size_t cache_max_entries{100'000};
  std::chrono::milliseconds cache_max_age{std::chrono::minutes{5}};
  size_t max_concurrency;
  std::chrono::milliseconds polling_interval{10};
  bool early_return_enabled{true};

  CardinalityAggregatorConfig();
};

}  // namespace cardex
