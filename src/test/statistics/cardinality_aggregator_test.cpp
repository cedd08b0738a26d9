#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../base_test.hpp"
#include "../testing_stores.hpp"
#include "gtest/gtest.h"

#include "statistics/cardinality_aggregator.hpp"
#include "store/in_memory_cardinality_store.hpp"
#include "store/store_exceptions.hpp"
#include "utils/interrupt_token.hpp"

using namespace std::literals::chrono_literals;  // NOLINT

namespace cardex {

class CardinalityAggregatorTest : public BaseTest {
 public:
  void SetUp() override {
    store = std::make_shared<TestingCardinalityStore>(std::make_shared<InMemoryCardinalityStore>());
    store->create_table("default", "index_test_table");

    auto writer = store->new_writer("default", "index_test_table");
    increment_all(*writer, {"abc"}, "cf_firstname");
    for (auto round = 0; round < 5; ++round) increment_all(*writer, {"1"}, "cf_age");
    for (auto round = 0; round < 3; ++round) increment_all(*writer, {"2"}, "cf_age");
    for (auto round = 0; round < 10; ++round) increment_all(*writer, {"berlin"}, "cf_city");
    for (auto round = 0; round < 20; ++round) increment_all(*writer, {"paris"}, "cf_city");
    increment_all(*writer, {"abc", "1", "2"}, "cf_firstname", ColumnVisibility{"foo"});

    auto config = CardinalityAggregatorConfig{};
    config.max_concurrency = 4;
    aggregator = std::make_shared<CardinalityAggregator>(store, config);

    firstname = std::make_shared<IndexProbe>("firstname", "cf_firstname", std::vector<ValueRange>{ValueRange::exact("abc")});
    age = std::make_shared<IndexProbe>("age", "cf_age",
                                       std::vector<ValueRange>{ValueRange::exact("1"), ValueRange::exact("2")});
    city = std::make_shared<IndexProbe>("city", "cf_city", std::vector<ValueRange>{ValueRange::between("a", "z")});
  }

  void TearDown() override {
    // Held background tasks must be able to finish before the aggregator shuts down
    store->release();
  }

  RankedCardinalities get_all(const std::vector<std::shared_ptr<IndexProbe>>& probes,
                              const Authorizations& authorizations = {}) {
    return aggregator->get_cardinalities("default", "index_test_table", authorizations, probes, 0, 0ms, false);
  }

  static std::vector<std::string> columns_of(const RankedCardinalities& ranked, const Cardinality cardinality) {
    auto columns = std::vector<std::string>{};
    for (const auto& [ranked_cardinality, probes] : ranked) {
      if (ranked_cardinality != cardinality) continue;
      for (const auto& probe : probes) columns.emplace_back(probe->column());
    }
    std::sort(columns.begin(), columns.end());
    return columns;
  }

  static bool contains_column(const RankedCardinalities& ranked, const std::string& column) {
    for (const auto& [cardinality, probes] : ranked) {
      for (const auto& probe : probes) {
        if (probe->column() == column) return true;
      }
    }
    return false;
  }

  template <typename Predicate>
  static bool eventually(Predicate predicate) {
    for (auto attempt = 0; attempt < 500; ++attempt) {
      if (predicate()) return true;
      std::this_thread::sleep_for(10ms);
    }
    return false;
  }

  std::shared_ptr<TestingCardinalityStore> store;
  std::shared_ptr<CardinalityAggregator> aggregator;
  std::shared_ptr<IndexProbe> firstname, age, city;
};

TEST_F(CardinalityAggregatorTest, RanksAllColumnsWithoutEarlyReturn) {
  const auto ranked = get_all({city, age, firstname});

  ASSERT_EQ(ranked.size(), 3u);
  auto iter = ranked.begin();
  EXPECT_EQ(iter->first, 1u);
  EXPECT_EQ(iter->second.front()->column(), "firstname");
  ++iter;
  EXPECT_EQ(iter->first, 8u);
  EXPECT_EQ(iter->second.front()->column(), "age");
  ++iter;
  EXPECT_EQ(iter->first, 30u);
  EXPECT_EQ(iter->second.front()->column(), "city");

  EXPECT_EQ(firstname->cardinality(), 1u);
  EXPECT_EQ(age->cardinality(), 8u);
  EXPECT_EQ(city->cardinality(), 30u);
}

TEST_F(CardinalityAggregatorTest, MatchesUncachedSums) {
  const auto ranked = get_all({city, age, firstname}, {"foo"});

  for (const auto& probe : {firstname, age, city}) {
    auto expected = Cardinality{0};
    for (const auto& [family, ranges] : probe->ranges_by_family()) {
      for (const auto& range : ranges) {
        expected += store->get_cardinality(CacheKey{"default", "index_test_table", family, {"foo"}, range});
      }
    }
    EXPECT_EQ(probe->cardinality(), expected) << probe->column();
  }

  EXPECT_EQ(firstname->cardinality(), 2u);
  EXPECT_EQ(ranked.smallest_cardinality(), 2u);
}

TEST_F(CardinalityAggregatorTest, ProbeCardinalityIsUnsetBeforeResolution) {
  EXPECT_EQ(firstname->cardinality(), std::nullopt);
  get_all({firstname});
  EXPECT_EQ(firstname->cardinality(), 1u);
}

TEST_F(CardinalityAggregatorTest, OnlyExactRangesAreCached) {
  get_all({city, age, firstname});
  EXPECT_EQ(store->single_requests.load(), 1u);     // firstname
  EXPECT_EQ(store->batch_requests.load(), 1u);      // age
  EXPECT_EQ(store->range_set_requests.load(), 1u);  // city

  get_all({city, age, firstname});
  EXPECT_EQ(store->single_requests.load(), 1u);
  EXPECT_EQ(store->batch_requests.load(), 1u);
  EXPECT_EQ(store->range_set_requests.load(), 2u);

  EXPECT_EQ(aggregator->cache()->size(), 3u);
}

TEST_F(CardinalityAggregatorTest, CacheIsSharedAcrossCalls) {
  const auto other_age = std::make_shared<IndexProbe>("age", "cf_age", std::vector<ValueRange>{ValueRange::exact("1")});
  get_all({age});
  get_all({other_age});

  EXPECT_EQ(other_age->cardinality(), 5u);
  EXPECT_EQ(store->single_requests.load(), 0u);
  EXPECT_EQ(store->batch_requests.load(), 1u);
}

TEST_F(CardinalityAggregatorTest, AuthorizationsAreCachedSeparately) {
  get_all({firstname});
  EXPECT_EQ(firstname->cardinality(), 1u);
  get_all({firstname}, {"foo"});
  EXPECT_EQ(firstname->cardinality(), 2u);
  EXPECT_EQ(store->single_requests.load(), 2u);
}

TEST_F(CardinalityAggregatorTest, MixedRangesAndFamilies) {
  const auto probe = std::make_shared<IndexProbe>(
      "mixed", "cf_city", std::vector<ValueRange>{ValueRange::exact("berlin"), ValueRange::at_least("p")});
  probe->add_ranges("cf_age", {ValueRange::exact("2")});

  get_all({probe});
  EXPECT_EQ(probe->cardinality(), 33u);
}

TEST_F(CardinalityAggregatorTest, ProbeWithoutRanges) {
  const auto probe = std::make_shared<IndexProbe>("empty", "cf_city", std::vector<ValueRange>{});
  const auto ranked = get_all({probe});
  EXPECT_EQ(ranked.smallest_cardinality(), 0u);
  EXPECT_EQ(probe->cardinality(), 0u);
}

TEST_F(CardinalityAggregatorTest, TiesAreGrouped) {
  const auto other_firstname =
      std::make_shared<IndexProbe>("other_firstname", "cf_firstname", std::vector<ValueRange>{ValueRange::exact("abc")});

  const auto ranked = get_all({firstname, other_firstname, city});

  EXPECT_EQ(ranked.size(), 3u);
  EXPECT_EQ(columns_of(ranked, 1), (std::vector<std::string>{"firstname", "other_firstname"}));
  EXPECT_EQ(ranked.smallest().size(), 2u);
}

TEST_F(CardinalityAggregatorTest, EmptyProbes) {
  const auto ranked = get_all({});
  EXPECT_TRUE(ranked.empty());
  EXPECT_EQ(store->total_requests(), 0u);
}

TEST_F(CardinalityAggregatorTest, EarlyReturn) {
  store->hold("cf_city");

  const auto ranked =
      aggregator->get_cardinalities("default", "index_test_table", {}, {city, age, firstname}, 1, 5ms, true);

  EXPECT_EQ(ranked.smallest_cardinality(), 1u);
  EXPECT_TRUE(contains_column(ranked, "firstname"));
  EXPECT_FALSE(contains_column(ranked, "city"));
  EXPECT_EQ(city->cardinality(), std::nullopt);

  // The abandoned column still finishes in the background
  store->release();
  EXPECT_TRUE(eventually([&]() { return city->cardinality().has_value(); }));
  EXPECT_EQ(city->cardinality(), 30u);
}

TEST_F(CardinalityAggregatorTest, AbandonedExactLookupsPopulateTheCache) {
  const auto slow = std::make_shared<IndexProbe>("slow", "cf_slow", std::vector<ValueRange>{ValueRange::exact("x")});
  store->hold("cf_slow");

  aggregator->get_cardinalities("default", "index_test_table", {}, {slow, firstname}, 1, 5ms, true);
  store->release();

  EXPECT_TRUE(eventually([&]() { return slow->cardinality().has_value(); }));
  EXPECT_TRUE(eventually([&]() { return aggregator->cache()->size() == 2u; }));

  const auto requests = store->single_requests.load();
  get_all({slow});
  EXPECT_EQ(store->single_requests.load(), requests);
}

TEST_F(CardinalityAggregatorTest, NoEarlyReturnAboveThreshold) {
  const auto ranked =
      aggregator->get_cardinalities("default", "index_test_table", {}, {city, age, firstname}, 0, 1ms, true);
  EXPECT_EQ(ranked.size(), 3u);
}

TEST_F(CardinalityAggregatorTest, ThresholdIgnoredWithoutEarlyReturn) {
  store->delay("cf_city", 50ms);

  const auto ranked = aggregator->get_cardinalities("default", "index_test_table", {}, {city, age, firstname},
                                                    1'000'000, 5ms, false);
  EXPECT_EQ(ranked.size(), 3u);
  EXPECT_TRUE(contains_column(ranked, "city"));
}

TEST_F(CardinalityAggregatorTest, ConfigDefaults) {
  auto config = CardinalityAggregatorConfig{};
  config.early_return_enabled = false;
  config.max_concurrency = 2;
  aggregator = std::make_shared<CardinalityAggregator>(store, config);

  const auto ranked = aggregator->get_cardinalities("default", "index_test_table", {}, {city, age, firstname}, 100);
  EXPECT_EQ(ranked.size(), 3u);
  EXPECT_EQ(aggregator->executor().max_concurrency(), 2u);
}

TEST_F(CardinalityAggregatorTest, FailuresAreAggregated) {
  store->fail("cf_city");
  const auto broken = std::make_shared<IndexProbe>("broken", "cf_city", std::vector<ValueRange>{ValueRange::exact("x")});
  broken->add_ranges("cf_age", {ValueRange::exact("1")});

  try {
    get_all({city, broken, firstname});
    FAIL() << "Expected CardinalityAggregationException";
  } catch (const CardinalityAggregationException& exception) {
    EXPECT_FALSE(exception.causes().empty());
    EXPECT_TRUE(exception.has_cause<StoreUnavailableException>());
    EXPECT_FALSE(exception.has_cause<InterruptedException>());
    EXPECT_NE(std::string{exception.what()}.find("Store unreachable"), std::string::npos);
  }
}

TEST_F(CardinalityAggregatorTest, MissingTable) {
  EXPECT_THROW(aggregator->get_cardinalities("default", "missing", {}, {firstname}, 0, 0ms, false),
               MissingTableException);
  EXPECT_EQ(store->total_requests(), 0u);
}

TEST_F(CardinalityAggregatorTest, BackgroundFailuresAreOnlyLogged) {
  const auto log = std::make_shared<std::stringstream>();
  aggregator->set_log(log);

  const auto broken = std::make_shared<IndexProbe>("broken", "cf_broken", std::vector<ValueRange>{ValueRange::exact("x")});
  store->hold("cf_broken");
  store->fail("cf_broken");

  const auto ranked =
      aggregator->get_cardinalities("default", "index_test_table", {}, {broken, firstname}, 1, 5ms, true);
  EXPECT_EQ(ranked.smallest_cardinality(), 1u);

  store->release();

  // Wait until the executor is idle, the failure has been logged by then
  EXPECT_TRUE(eventually([&]() {
    return aggregator->executor().active_count() == 0 && aggregator->executor().queued_count() == 0;
  }));
  aggregator->shutdown();

  EXPECT_NE(log->str().find("Background cardinality task for column broken failed"), std::string::npos);
  EXPECT_NE(log->str().find("Returning early"), std::string::npos);
  EXPECT_EQ(broken->cardinality(), std::nullopt);
}

TEST_F(CardinalityAggregatorTest, UnknownErrorsAreAggregated) {
  store->fail_with_unknown_error("cf_bad");
  const auto bad = std::make_shared<IndexProbe>("bad", "cf_bad", std::vector<ValueRange>{ValueRange::exact("x")});

  try {
    get_all({bad, firstname});
    FAIL() << "Expected CardinalityAggregationException";
  } catch (const CardinalityAggregationException& exception) {
    EXPECT_EQ(exception.causes().size(), 1u);
    EXPECT_FALSE(exception.has_cause<StoreUnavailableException>());
    EXPECT_NE(std::string{exception.what()}.find("unknown error"), std::string::npos);
  }
}

TEST_F(CardinalityAggregatorTest, UnknownBackgroundErrorsAreOnlyLogged) {
  const auto log = std::make_shared<std::stringstream>();
  aggregator->set_log(log);

  const auto bad = std::make_shared<IndexProbe>("bad", "cf_bad", std::vector<ValueRange>{ValueRange::exact("x")});
  store->hold("cf_bad");
  store->fail_with_unknown_error("cf_bad");

  const auto ranked = aggregator->get_cardinalities("default", "index_test_table", {}, {bad, firstname}, 1, 5ms, true);
  EXPECT_EQ(ranked.smallest_cardinality(), 1u);

  store->release();
  EXPECT_TRUE(eventually([&]() {
    return aggregator->executor().active_count() == 0 && aggregator->executor().queued_count() == 0;
  }));
  aggregator->shutdown();

  EXPECT_NE(log->str().find("Background cardinality task for column bad failed with an unknown error"),
            std::string::npos);
}

TEST_F(CardinalityAggregatorTest, NestedFanOutSharesOneBound) {
  auto config = CardinalityAggregatorConfig{};
  config.max_concurrency = 1;
  aggregator = std::make_shared<CardinalityAggregator>(store, config);

  auto max_active_count = std::atomic<size_t>{0};
  store->set_read_hook([&]() {
    const auto active_count = aggregator->executor().active_count();
    auto observed = max_active_count.load();
    while (active_count > observed && !max_active_count.compare_exchange_weak(observed, active_count)) {}
  });

  const auto make_probe = [](const std::string& column, const std::vector<ValueRange>& age_ranges,
                             const std::vector<ValueRange>& city_ranges,
                             const std::vector<ValueRange>& firstname_ranges) {
    auto probe = std::make_shared<IndexProbe>(column, "cf_age", age_ranges);
    probe->add_ranges("cf_city", city_ranges);
    probe->add_ranges("cf_firstname", firstname_ranges);
    return probe;
  };

  const auto probes = std::vector<std::shared_ptr<IndexProbe>>{
      make_probe("a", {ValueRange::exact("1")}, {ValueRange::between("a", "z")}, {ValueRange::exact("abc")}),
      make_probe("b", {ValueRange::exact("1"), ValueRange::exact("2")}, {ValueRange::exact("berlin")},
                 {ValueRange::at_least("a")}),
      make_probe("c", {ValueRange::at_most("1")}, {ValueRange::exact("paris")}, {ValueRange::exact("abc")}),
      make_probe("d", {ValueRange::all()}, {ValueRange::exact("berlin"), ValueRange::exact("paris")},
                 {ValueRange::exact("zzz")}),
      make_probe("e", {ValueRange::exact("2")}, {ValueRange::greater_than("berlin")}, {ValueRange::between("a", "b")})};

  const auto ranked = get_all(probes);
  store->set_read_hook(nullptr);

  ASSERT_EQ(ranked.size(), 5u);
  EXPECT_EQ(probes[0]->cardinality(), 36u);
  EXPECT_EQ(probes[1]->cardinality(), 19u);
  EXPECT_EQ(probes[2]->cardinality(), 26u);
  EXPECT_EQ(probes[3]->cardinality(), 38u);
  EXPECT_EQ(probes[4]->cardinality(), 24u);

  auto cardinalities = std::vector<Cardinality>{};
  for (const auto& [cardinality, ranked_probes] : ranked) cardinalities.emplace_back(cardinality);
  EXPECT_EQ(cardinalities, (std::vector<Cardinality>{19, 24, 26, 36, 38}));

  EXPECT_EQ(max_active_count.load(), 1u);
  EXPECT_EQ(aggregator->executor().worker_count(), 1u);
}

TEST_F(CardinalityAggregatorTest, EquivalentExactRangesShareOneKey) {
  const auto probe = std::make_shared<IndexProbe>(
      "firstname", "cf_firstname", std::vector<ValueRange>{ValueRange::exact("abc"), ValueRange::between("abc", "abc")});

  get_all({probe});

  EXPECT_EQ(probe->cardinality(), 1u);
  EXPECT_EQ(aggregator->cache()->size(), 1u);
}

class CardinalityAggregatorInterruptTest : public CardinalityAggregatorTest,
                                          public ::testing::WithParamInterface<bool> {};

TEST_P(CardinalityAggregatorInterruptTest, InterruptWhileWaiting) {
  const auto early_return_enabled = GetParam();
  store->hold("cf_city");
  const auto interrupt_token = std::make_shared<InterruptToken>();

  auto interrupter = std::thread([&]() {
    std::this_thread::sleep_for(20ms);
    interrupt_token->interrupt();
  });

  try {
    aggregator->get_cardinalities("default", "index_test_table", {}, {city}, 0, 5ms, early_return_enabled,
                                  interrupt_token);
    ADD_FAILURE() << "Expected CardinalityAggregationException";
  } catch (const CardinalityAggregationException& exception) {
    EXPECT_TRUE(exception.has_cause<InterruptedException>());
  }
  interrupter.join();

  EXPECT_TRUE(interrupt_token->is_interrupted());
  EXPECT_EQ(city->cardinality(), std::nullopt);
}

TEST_P(CardinalityAggregatorInterruptTest, InterruptedBeforeTheCall) {
  const auto interrupt_token = std::make_shared<InterruptToken>();
  interrupt_token->interrupt();

  EXPECT_THROW(aggregator->get_cardinalities("default", "index_test_table", {}, {city, firstname}, 0, 5ms, GetParam(),
                                             interrupt_token),
               CardinalityAggregationException);
  EXPECT_TRUE(interrupt_token->is_interrupted());

  interrupt_token->clear();
  const auto ranked = aggregator->get_cardinalities("default", "index_test_table", {}, {city, firstname}, 0, 5ms,
                                                    GetParam(), interrupt_token);
  EXPECT_EQ(ranked.size(), 2u);
}

INSTANTIATE_TEST_SUITE_P(CardinalityAggregatorInterruptTestInstances, CardinalityAggregatorInterruptTest,
                         ::testing::Values(false, true));

TEST_F(CardinalityAggregatorTest, ConcurrentCalls) {
  constexpr auto THREAD_COUNT = 8;
  auto threads = std::vector<std::thread>{};
  auto smallest = std::vector<Cardinality>(THREAD_COUNT, 0);

  for (auto thread_id = 0; thread_id < THREAD_COUNT; ++thread_id) {
    threads.emplace_back([&, thread_id]() {
      const auto probes = std::vector<std::shared_ptr<IndexProbe>>{
          std::make_shared<IndexProbe>("age", "cf_age",
                                       std::vector<ValueRange>{ValueRange::exact("1"), ValueRange::exact("2")}),
          std::make_shared<IndexProbe>("city", "cf_city", std::vector<ValueRange>{ValueRange::exact("paris")})};
      const auto ranked = get_all(probes);
      smallest[thread_id] = ranked.smallest_cardinality().value_or(0);
    });
  }
  for (auto& thread : threads) thread.join();

  for (const auto cardinality : smallest) {
    EXPECT_EQ(cardinality, 8u);
  }

  // Concurrent lookups of the same values wait for the first load instead of reaching the store
  EXPECT_EQ(aggregator->cache()->size(), 3u);
  EXPECT_EQ(store->batch_requests.load(), 1u);
  EXPECT_EQ(store->single_requests.load(), 1u);
}

}  // namespace cardex
