//
// Change, z-score, inflection and percentile transform tests
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

TEST_CASE("PctChange", "[transforms][change]") {
  SECTION("Percent over the lag") {
    auto values = ToValues(PctChange(DailySeries({100.0, 110.0, 121.0}), 1));
    REQUIRE(std::isnan(values[0]));
    REQUIRE_THAT(values[1], WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(values[2], WithinAbs(10.0, 1e-9));
  }

  SECTION("Zero base is undefined") {
    auto values = ToValues(PctChange(DailySeries({0.0, 5.0}), 1));
    REQUIRE(std::isnan(values[1]));
  }

  SECTION("Lag longer than the series") {
    auto values = ToValues(PctChange(DailySeries({1.0, 2.0}), 5));
    REQUIRE(CountNaN(values) == 2);
  }

  SECTION("Output keeps the input index") {
    auto input = DailySeries({1.0, 2.0, 3.0});
    REQUIRE(ToTimestamps(PctChange(input, 1)) == ToTimestamps(input));
  }

  SECTION("Non-positive lag is rejected") {
    REQUIRE_THROWS(PctChange(DailySeries({1.0, 2.0}), 0));
  }
}

TEST_CASE("YoY and one-month change use calendar lags", "[transforms][change]") {
  auto series = DailySeries(Linear(300, 100.0, 1.0));

  auto yoy = LatestValue(YoY(series));
  REQUIRE(yoy.has_value());
  // 399 vs 147
  REQUIRE_THAT(*yoy, WithinAbs((399.0 / 147.0 - 1.0) * 100.0, 1e-9));

  auto one_month = LatestValue(OneMonthChange(series));
  REQUIRE(one_month.has_value());
  REQUIRE_THAT(*one_month, WithinAbs((399.0 / 378.0 - 1.0) * 100.0, 1e-9));
}

TEST_CASE("ThreeMonthAnnualized compounds the quarterly change",
          "[transforms][change]") {
  auto values =
      ToValues(ThreeMonthAnnualized(WeeklySeries({100.0, 110.0}), 1));
  REQUIRE(std::isnan(values[0]));
  REQUIRE_THAT(values[1], WithinAbs(46.41, 1e-9));

  // Weekly credit growing 1% per quarter annualizes to ~4.06%
  auto credit = WeeklySeries(Geometric(40, 1000.0, std::pow(1.01, 1.0 / 13) - 1));
  auto latest = LatestValue(ThreeMonthAnnualized(credit, periods::WEEKLY_3M));
  REQUIRE(latest.has_value());
  REQUIRE_THAT(*latest, WithinAbs((std::pow(1.01, 4) - 1) * 100.0, 1e-6));
}

TEST_CASE("Diff and Acceleration", "[transforms][change]") {
  std::vector<double> squares;
  for (int i = 0; i < 8; ++i) {
    squares.push_back(static_cast<double>(i * i));
  }
  auto series = DailySeries(squares);

  auto diff = ToValues(Diff(series, 1));
  REQUIRE(std::isnan(diff[0]));
  REQUIRE(diff[3] == Catch::Approx(5.0));

  auto accel = ToValues(Acceleration(series, 1, 1));
  REQUIRE(CountNaN(accel) == 2);
  for (size_t i = 2; i < accel.size(); ++i) {
    REQUIRE(accel[i] == Catch::Approx(2.0));
  }

  REQUIRE(CountNaN(ToValues(Acceleration(series, 2, 3))) == 5);
}

TEST_CASE("RollingWindowOptions", "[transforms][zscore]") {
  RollingWindowOptions options{.window_years = 3,
                               .periods_per_year = periods::WEEKLY_PER_YEAR};
  REQUIRE(options.Window() == 156);
  REQUIRE(options.MinPeriods() == 78);

  options.min_periods = 10;
  REQUIRE(options.MinPeriods() == 10);

  REQUIRE_THROWS(RollingWindowOptions{.window_years = 0}.Window());
}

TEST_CASE("RollingZScore", "[transforms][zscore]") {
  const RollingWindowOptions options{.window_years = 1, .periods_per_year = 10};

  SECTION("Exactly half a window of leading NaNs") {
    auto values = ToValues(RollingZScore(DailySeries(Wave(40, 50.0, 5.0)), options));
    REQUIRE(values.size() == 40);
    for (size_t i = 0; i < 5; ++i) {
      REQUIRE(std::isnan(values[i]));
    }
    for (size_t i = 5; i < values.size(); ++i) {
      REQUIRE_FALSE(std::isnan(values[i]));
    }
  }

  SECTION("Full window of a linear series") {
    auto values = ToValues(RollingZScore(DailySeries(Linear(30, 0.0, 1.0)), options));
    // Window 0..9: mean 4.5, sample std sqrt(82.5 / 9)
    const double expected = 4.5 / std::sqrt(82.5 / 9.0);
    for (size_t i = 9; i < values.size(); ++i) {
      REQUIRE_THAT(values[i], WithinAbs(expected, 1e-9));
    }
  }

  SECTION("Zero dispersion is undefined") {
    auto values = ToValues(RollingZScore(DailySeries(Constant(30, 7.0)), options));
    REQUIRE(CountNaN(values) == values.size());
  }

  SECTION("NaN observations stay NaN and are skipped in the window") {
    auto raw = Linear(30, 0.0, 1.0);
    raw[20] = NAN_SCALAR;
    auto values = ToValues(RollingZScore(DailySeries(raw), options));
    REQUIRE(std::isnan(values[20]));
    REQUIRE_FALSE(std::isnan(values[21]));
  }
}

TEST_CASE("ZScoreChange differences the z-score", "[transforms][zscore]") {
  const RollingWindowOptions options{.window_years = 1, .periods_per_year = 20};
  auto series = DailySeries(Wave(80, 10.0, 2.0));

  auto z = ToValues(RollingZScore(series, options));
  auto change = ToValues(ZScoreChange(series, options, 5));
  REQUIRE(change.size() == z.size());
  for (size_t i = 15; i < change.size(); ++i) {
    REQUIRE_THAT(change[i], WithinAbs(z[i] - z[i - 5], 1e-12));
  }
}

TEST_CASE("DetectInflection", "[transforms][inflection]") {
  auto series = DailySeries({1.0, 2.0, 3.0, 2.0, 1.0, 2.0, 3.0});

  SECTION("Marks peaks and troughs") {
    auto flags = ToValues(DetectInflection(series, 3));
    REQUIRE(flags == std::vector<double>{0, 0, 1, 0, -1, 0, 0});
  }

  SECTION("Sensitivity filters small moves") {
    // The peak has no 3-period history, the trough moved -50%
    auto flags = ToValues(DetectInflection(series, 3, 1.0));
    REQUIRE(flags == std::vector<double>{0, 0, 0, 0, -1, 0, 0});

    auto strict = ToValues(DetectInflection(series, 3, 60.0));
    REQUIRE(strict == std::vector<double>(7, 0.0));
  }

  SECTION("Windows containing NaN never mark") {
    auto flags = ToValues(
        DetectInflection(DailySeries({1.0, 2.0, 3.0, NAN_SCALAR, 1.0}), 3));
    REQUIRE(flags == std::vector<double>(5, 0.0));
  }

  SECTION("Plateaus are not inflections") {
    auto flags = ToValues(DetectInflection(DailySeries({1.0, 3.0, 3.0, 1.0}), 3));
    REQUIRE(flags == std::vector<double>(4, 0.0));
  }

  SECTION("Wider windows are centered on the point") {
    auto hump = DailySeries({1.0, 2.0, 3.0, 4.0, 5.0, 4.0, 3.0, 2.0, 1.0});
    auto flags = ToValues(DetectInflection(hump, 5));
    REQUIRE(flags == std::vector<double>{0, 0, 0, 0, 1, 0, 0, 0, 0});
  }

  SECTION("Lookback longer than the series") {
    auto flags = ToValues(DetectInflection(series, 21));
    REQUIRE(flags == std::vector<double>(7, 0.0));
  }
}

TEST_CASE("PercentileOfScore", "[transforms][percentile]") {
  using epoch_core::PercentileKind;
  const std::vector<double> ties{1.0, 2.0, 2.0, 3.0};
  REQUIRE(PercentileOfScore(ties, 2.0, PercentileKind::Rank) == Catch::Approx(62.5));
  REQUIRE(PercentileOfScore(ties, 2.0, PercentileKind::Weak) == Catch::Approx(75.0));

  const std::vector<double> distinct{1.0, 2.0, 3.0, 4.0};
  REQUIRE(PercentileOfScore(distinct, 2.5) == Catch::Approx(50.0));
  REQUIRE(PercentileOfScore(distinct, 4.0) == Catch::Approx(100.0));
  REQUIRE(PercentileOfScore(distinct, 0.0) == Catch::Approx(0.0));

  const std::vector<double> with_nan{1.0, NAN_SCALAR, 3.0};
  REQUIRE(PercentileOfScore(with_nan, 3.0, PercentileKind::Weak) ==
          Catch::Approx(100.0));

  REQUIRE(std::isnan(PercentileOfScore(distinct, NAN_SCALAR)));
  REQUIRE(std::isnan(PercentileOfScore(std::vector<double>{}, 1.0)));
}

TEST_CASE("RollingPercentile", "[transforms][percentile]") {
  const RollingWindowOptions options{.window_years = 1, .periods_per_year = 10};

  SECTION("A rising series sits at the top of its window") {
    auto values = ToValues(RollingPercentile(DailySeries(Linear(25, 1.0, 1.0)), options));
    REQUIRE(CountNaN(values) == 4);
    for (size_t i = 4; i < values.size(); ++i) {
      REQUIRE(values[i] == Catch::Approx(100.0));
    }
  }

  SECTION("Values stay within 0 and 100") {
    auto values = ToValues(RollingPercentile(DailySeries(Wave(60, 20.0, 8.0)), options));
    for (double v : values) {
      if (!std::isnan(v)) {
        REQUIRE(v >= 0.0);
        REQUIRE(v <= 100.0);
      }
    }
  }

  SECTION("NaN observations produce NaN") {
    auto raw = Linear(25, 1.0, 1.0);
    raw[12] = NAN_SCALAR;
    auto values = ToValues(RollingPercentile(DailySeries(raw), options));
    REQUIRE(std::isnan(values[12]));
    REQUIRE(values[13] == Catch::Approx(100.0));
  }
}
