#include <memory>
#include <sstream>

#include "../base_test.hpp"
#include "gtest/gtest.h"

#include "statistics/index_probe.hpp"
#include "statistics/ranked_cardinalities.hpp"

namespace cardex {

class RankedCardinalitiesTest : public BaseTest {
 protected:
  static std::shared_ptr<IndexProbe> probe(const std::string& column) {
    return std::make_shared<IndexProbe>(column, "cf_" + column, std::vector<ValueRange>{ValueRange::exact("x")});
  }
};

TEST_F(RankedCardinalitiesTest, Empty) {
  const auto ranked = RankedCardinalities{};
  EXPECT_TRUE(ranked.empty());
  EXPECT_EQ(ranked.size(), 0u);
  EXPECT_EQ(ranked.smallest_cardinality(), std::nullopt);
  EXPECT_TRUE(ranked.smallest().empty());
  EXPECT_EQ(ranked.to_json(), nlohmann::json::array());
}

TEST_F(RankedCardinalitiesTest, OrderedBySmallestCardinality) {
  auto ranked = RankedCardinalities{};
  ranked.add(30, probe("city"));
  ranked.add(1, probe("firstname"));
  ranked.add(8, probe("age"));
  ranked.add(1, probe("lastname"));

  EXPECT_EQ(ranked.size(), 4u);
  EXPECT_EQ(ranked.smallest_cardinality(), 1u);
  ASSERT_EQ(ranked.smallest().size(), 2u);
  EXPECT_EQ(ranked.smallest()[0]->column(), "firstname");
  EXPECT_EQ(ranked.smallest()[1]->column(), "lastname");

  auto cardinalities = std::vector<Cardinality>{};
  for (const auto& [cardinality, probes] : ranked) cardinalities.emplace_back(cardinality);
  EXPECT_EQ(cardinalities, (std::vector<Cardinality>{1, 8, 30}));

  const auto expected_json = R"([
    {"cardinality": 1, "columns": ["firstname", "lastname"]},
    {"cardinality": 8, "columns": ["age"]},
    {"cardinality": 30, "columns": ["city"]}
  ])"_json;
  EXPECT_EQ(ranked.to_json(), expected_json);
}

TEST_F(RankedCardinalitiesTest, IndexProbe) {
  auto age = IndexProbe{"age", "cf_age", {ValueRange::exact("1")}};
  age.add_ranges("cf_age", {ValueRange::exact("2")});
  age.add_ranges("cf_age_v2", {ValueRange::at_least("3")});

  ASSERT_EQ(age.ranges_by_family().size(), 2u);
  EXPECT_EQ(age.ranges_by_family().at("cf_age").size(), 2u);
  EXPECT_EQ(age.ranges_by_family().at("cf_age_v2").front(), ValueRange::at_least("3"));

  EXPECT_EQ(age.cardinality(), std::nullopt);
  age.set_cardinality(0);
  EXPECT_EQ(age.cardinality(), 0u);

  std::stringstream stream;
  stream << age;
  EXPECT_NE(stream.str().find("age"), std::string::npos);
}

}  // namespace cardex
