#include <chrono>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "statistics/cardinality_aggregator.hpp"
#include "store/in_memory_cardinality_store.hpp"
#include "types.hpp"

using namespace cardex;  // NOLINT

namespace {

const auto SCHEMA = std::string{"default"};
const auto TABLE = std::string{"orders"};

// Writes index counters for a table with a uniform `status`, a skewed `priority` and a unique `order_key` column
void generate_orders(AbstractCardinalityStore& store, const size_t row_count) {
  std::mt19937 generator(42);
  std::uniform_int_distribution<> status_distribution(0, 2);
  std::geometric_distribution<> priority_distribution(0.5);

  const auto statuses = std::vector<std::string>{"F", "O", "P"};

  auto writer = store.new_writer(SCHEMA, TABLE);
  for (auto row_id = size_t{0}; row_id < row_count; ++row_id) {
    const auto visibility = row_id % 10 == 0 ? ColumnVisibility{"audit"} : ColumnVisibility{};

    writer->increment_cardinality(statuses[status_distribution(generator)], "cf_status", visibility);
    writer->increment_cardinality(std::to_string(priority_distribution(generator)), "cf_priority", visibility);
    writer->increment_cardinality(std::to_string(100'000 + row_id), "cf_order_key", visibility);
    writer->increment_row_count(visibility);
  }
  writer->flush();
}

}  // namespace

int main() {
  const auto store = std::make_shared<InMemoryCardinalityStore>();
  store->create_table(SCHEMA, TABLE);
  generate_orders(*store, 100'000);

  std::cout << "Rows in " << SCHEMA << "." << TABLE << ": " << store->get_num_rows_in_table(SCHEMA, TABLE, {})
            << " (" << store->get_num_rows_in_table(SCHEMA, TABLE, {"audit"}) << " with audit authorization)"
            << std::endl;

  auto config = CardinalityAggregatorConfig{};
  config.cache_max_entries = 1'000;

  auto aggregator = CardinalityAggregator{store, config};
  aggregator.set_log(std::shared_ptr<std::ostream>(&std::cout, [](auto*) {}));

  // status = 'F' AND priority IN (0, 1) AND order_key BETWEEN 150000 AND 150099
  const auto probes = std::vector<std::shared_ptr<IndexProbe>>{
      std::make_shared<IndexProbe>("status", "cf_status", std::vector<ValueRange>{ValueRange::exact("F")}),
      std::make_shared<IndexProbe>("priority", "cf_priority",
                                   std::vector<ValueRange>{ValueRange::exact("0"), ValueRange::exact("1")}),
      std::make_shared<IndexProbe>("order_key", "cf_order_key",
                                   std::vector<ValueRange>{ValueRange::between("150000", "150099")})};

  for (const auto early_return_enabled : {false, true}) {
    const auto ranked = aggregator.get_cardinalities(SCHEMA, TABLE, {"audit"}, probes, 1'000,
                                                     std::chrono::milliseconds{1}, early_return_enabled);
    std::cout << ranked.to_json().dump(2) << std::endl;
  }

  aggregator.cache()->print(std::cout);
  std::cout << std::endl;

  return 0;
}
