//
// Rolling statistics and latest-value snapshot tests
//
#include "test_utils.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <liquidity_monitor/transforms/transforms.h>

using namespace liquidity_monitor;
using namespace liquidity_monitor::test;
using namespace liquidity_monitor::transforms;
using Catch::Matchers::WithinAbs;

TEST_CASE("RollingStats columns", "[transforms][stats]") {
  auto stats = RollingStats(DailySeries({1.0, 2.0, 3.0, 4.0, 5.0}), 5, 3);

  REQUIRE(stats.num_rows() == 5);
  REQUIRE(stats.column_names() ==
          std::vector<std::string>{"mean", "std", "min", "max", "median",
                                   "skew", "kurt"});

  auto mean = ToValues(stats["mean"]);
  auto sd = ToValues(stats["std"]);
  auto median = ToValues(stats["median"]);
  auto skew = ToValues(stats["skew"]);
  auto kurt = ToValues(stats["kurt"]);

  SECTION("Below min_periods") {
    REQUIRE(std::isnan(mean[0]));
    REQUIRE(std::isnan(mean[1]));
  }

  SECTION("Skew needs three points and kurtosis four") {
    REQUIRE(mean[2] == Catch::Approx(2.0));
    REQUIRE_THAT(skew[2], WithinAbs(0.0, 1e-12));
    REQUIRE(std::isnan(kurt[2]));
  }

  SECTION("Full window") {
    REQUIRE(mean[4] == Catch::Approx(3.0));
    REQUIRE(sd[4] == Catch::Approx(std::sqrt(2.5)));
    REQUIRE(ToValues(stats["min"])[4] == Catch::Approx(1.0));
    REQUIRE(ToValues(stats["max"])[4] == Catch::Approx(5.0));
    REQUIRE(median[4] == Catch::Approx(3.0));
    REQUIRE_THAT(skew[4], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(kurt[4], WithinAbs(-1.2, 1e-12));
  }
}

TEST_CASE("RollingStats even-sized median and skewed window",
          "[transforms][stats]") {
  auto stats = RollingStats(DailySeries({1.0, 1.0, 1.0, 10.0}), 4, 4);
  REQUIRE(ToValues(stats["median"])[3] == Catch::Approx(1.0));
  REQUIRE(ToValues(stats["skew"])[3] > 0.0);
}

TEST_CASE("RollingStats skips NaN observations", "[transforms][stats]") {
  auto stats = RollingStats(DailySeries({1.0, 2.0, NAN_SCALAR, 4.0, 5.0}), 5, 3);
  REQUIRE(std::isnan(ToValues(stats["mean"])[2]));
  REQUIRE(ToValues(stats["mean"])[3] == Catch::Approx(7.0 / 3.0));
  REQUIRE(ToValues(stats["mean"])[4] == Catch::Approx(3.0));
  REQUIRE(ToValues(stats["median"])[4] == Catch::Approx(3.0));
  REQUIRE(ToValues(stats["min"])[4] == Catch::Approx(1.0));
  REQUIRE(ToValues(stats["max"])[4] == Catch::Approx(5.0));
}

TEST_CASE("GetLatestValues", "[transforms][snapshot]") {
  SECTION("Short history reports the level only") {
    auto snapshot = GetLatestValues(DailySeries(Linear(100, 1.0, 1.0)));
    REQUIRE(snapshot.values.size() == 1);
    REQUIRE(snapshot.get(metric::LATEST) == 100.0);
    REQUIRE(snapshot.as_of_ns == LastNanos(100, NANOS_PER_DAY));
  }

  SECTION("Changes can be switched off") {
    auto snapshot = GetLatestValues(DailySeries(Linear(400, 1.0, 1.0)), false);
    REQUIRE(snapshot.values.size() == 1);
  }

  SECTION("More than a year of history") {
    auto snapshot = GetLatestValues(DailySeries(Linear(400, 1.0, 1.0)));
    REQUIRE(snapshot.values.size() == 7);

    REQUIRE(snapshot.get(metric::LATEST) == 400.0);
    REQUIRE_THAT(*snapshot.get(metric::YOY),
                 WithinAbs((400.0 / 148.0 - 1.0) * 100.0, 1e-9));
    REQUIRE(snapshot.get(metric::ONE_MONTH_CHANGE).has_value());
    REQUIRE(snapshot.get(metric::THREE_MONTH_ANN).has_value());
    REQUIRE(snapshot.get(metric::ZSCORE_3Y).has_value());
    REQUIRE(*snapshot.get(metric::PERCENTILE_3Y) == Catch::Approx(100.0));
    // Five years need more than 630 observations
    REQUIRE_FALSE(snapshot.get(metric::ZSCORE_5Y).has_value());
  }

  SECTION("Empty series") {
    auto snapshot = GetLatestValues(MakeEmptySeries("empty"));
    REQUIRE_FALSE(snapshot.as_of_ns);
    REQUIRE_FALSE(snapshot.get(metric::LATEST));
  }
}
