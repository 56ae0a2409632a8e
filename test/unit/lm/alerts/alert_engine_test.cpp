//
// Alert rule and engine tests
//
#include "test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <liquidity_monitor/alerts/alert_engine.h>

using namespace liquidity_monitor;
using namespace liquidity_monitor::alerts;
using namespace liquidity_monitor::test;
using epoch_core::AlertLevel;

namespace {
constexpr int64_t END_NANOS = BASE_NANOS + 1500 * NANOS_PER_DAY;

Clock FixedClock(int64_t nanos = END_NANOS) {
  return [nanos] { return FromNanos(nanos); };
}

TimeSeries Daily(std::vector<double> const &values) {
  return EndingAt(values, NANOS_PER_DAY, END_NANOS);
}

TimeSeries Weekly(std::vector<double> const &values) {
  return EndingAt(values, NANOS_PER_WEEK, END_NANOS);
}

// Steady uptrend with a step of `jump` over the final month
std::vector<double> SteppedTrend(double jump) {
  auto values = Linear(500, 100.0, 0.1);
  for (size_t i = 479; i < values.size(); ++i) {
    values[i] += jump;
  }
  return values;
}

IndicatorMap BeliefIndicators(double valuation_jump) {
  return {
      {"valuation", Daily(SteppedTrend(valuation_jump))},
      {"earnings", Daily(Linear(500, 100.0, 0.1))},
  };
}

// Volatility and spreads at the top of their ranges
IndicatorMap CollateralIndicators(double equity_step) {
  return {
      {"vix", Daily(Linear(800, 15.0, 0.02))},
      {"spread", Weekly(Linear(200, 4.0, 0.01))},
      {"equity", Daily(Linear(100, 4000.0, equity_step))},
  };
}

IndicatorMap ContractionIndicators(double spread_step) {
  return {
      {"credit_growth", Weekly(Geometric(40, 1000.0, -0.002))},
      {"spread", Weekly(Linear(40, 4.0, spread_step))},
  };
}
} // namespace

TEST_CASE("Alert message format", "[alerts][alert]") {
  Alert alert{
      .level = AlertLevel::Red,
      .rule_name = rule::COLLATERAL_STRESS,
      .title = "Collateral stress",
      .what_changed = "VIX 95%ile",
      .vulnerability_path = "margin calls",
      .additional_checks = {"Leveraged ETF flows", "High-yield issuance halt"},
      .timestamp = FromNanos(END_NANOS),
  };
  REQUIRE(alert.FormatMessage() ==
          "[Red] Collateral stress: VIX 95%ile -> Vulnerability path: margin "
          "calls. Additional checks: Leveraged ETF flows, High-yield issuance "
          "halt");

  Alert later = alert;
  later.timestamp = FromNanos(END_NANOS + 1);
  REQUIRE_FALSE(alert == later);
  REQUIRE(alert == Alert{alert});
}

TEST_CASE("Belief overheating", "[alerts][belief]") {
  SECTION("Valuation running well ahead of earnings") {
    auto alert = CheckBeliefOverheating(BeliefIndicators(20.0), {}, std::nullopt,
                                        FixedClock());
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Red);
    REQUIRE(alert->rule_name == rule::BELIEF_OVERHEATING);
    REQUIRE(alert->additional_checks.size() == 2);
    REQUIRE(ToNanos(alert->timestamp) == END_NANOS);
  }

  SECTION("Moderate gap") {
    auto alert = CheckBeliefOverheating(BeliefIndicators(8.0), {}, std::nullopt,
                                        FixedClock());
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Yellow);
  }

  SECTION("Valuation in step with earnings") {
    REQUIRE_FALSE(CheckBeliefOverheating(BeliefIndicators(0.0), {}, std::nullopt,
                                         FixedClock()));
  }

  SECTION("Thresholds come from the config") {
    AlertConfig config;
    config.belief_zscore_gap_red = 1.5;
    auto alert = CheckBeliefOverheating(BeliefIndicators(20.0), config,
                                        std::nullopt, FixedClock());
    REQUIRE(alert->level == AlertLevel::Yellow);
  }

  SECTION("Aliases resolve valuation and earnings") {
    IndicatorMap indicators{
        {"pe_ratio", Daily(SteppedTrend(20.0))},
        {"forward_eps", Daily(Linear(500, 100.0, 0.1))},
    };
    REQUIRE(CheckBeliefOverheating(indicators, {}, std::nullopt, FixedClock()));
  }

  SECTION("Less than a year of history") {
    IndicatorMap indicators{
        {"valuation", Daily(Linear(200, 100.0, 0.1))},
        {"earnings", Daily(Linear(200, 100.0, 0.1))},
    };
    REQUIRE_FALSE(CheckBeliefOverheating(indicators));
  }

  SECTION("Missing earnings") {
    REQUIRE_FALSE(CheckBeliefOverheating(
        {{"valuation", Daily(SteppedTrend(20.0))}}));
  }
}

TEST_CASE("Collateral stress", "[alerts][collateral]") {
  SECTION("Two red signals") {
    auto alert = CheckCollateralStress(CollateralIndicators(-10.0), {},
                                       std::nullopt, FixedClock());
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Red);
    REQUIRE(alert->what_changed ==
            "VIX 100%ile, spread 100%ile, equity 1M -6.5%");
  }

  SECTION("One red and one yellow signal") {
    auto indicators = CollateralIndicators(-6.5);
    indicators["spread"] = Weekly(Linear(200, 6.0, -0.01));
    auto alert =
        CheckCollateralStress(indicators, {}, std::nullopt, FixedClock());
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Yellow);
  }

  SECTION("Calm markets") {
    IndicatorMap indicators{
        {"vix", Daily(Linear(800, 40.0, -0.02))},
        {"spread", Weekly(Linear(200, 6.0, -0.01))},
        {"equity", Daily(Linear(100, 4000.0, 1.0))},
    };
    REQUIRE_FALSE(CheckCollateralStress(indicators));
  }

  SECTION("Short volatility history") {
    auto indicators = CollateralIndicators(-10.0);
    indicators["vix"] = Daily(Linear(756, 15.0, 0.02));
    REQUIRE_FALSE(CheckCollateralStress(indicators));
  }

  SECTION("Missing equity") {
    auto indicators = CollateralIndicators(-10.0);
    indicators.erase("equity");
    REQUIRE_FALSE(CheckCollateralStress(indicators));
  }
}

TEST_CASE("Balance sheet contraction", "[alerts][contraction]") {
  SECTION("Shrinking credit with widening spreads") {
    auto alert = CheckBalanceSheetContraction(ContractionIndicators(0.05), {},
                                              std::nullopt, FixedClock());
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Red);
    REQUIRE(alert->what_changed.find("spread widened 0.20pp") !=
            std::string::npos);
  }

  SECTION("Shrinking credit with stable spreads") {
    auto alert = CheckBalanceSheetContraction(ContractionIndicators(-0.05), {},
                                              std::nullopt, FixedClock());
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Yellow);
    REQUIRE(alert->what_changed.find("spread") == std::string::npos);
  }

  SECTION("Spread unavailable") {
    auto indicators = ContractionIndicators(0.05);
    indicators.erase("spread");
    auto alert = CheckBalanceSheetContraction(indicators);
    REQUIRE(alert.has_value());
    REQUIRE(alert->level == AlertLevel::Yellow);
  }

  SECTION("Growing credit") {
    IndicatorMap indicators{
        {"bank_credit", Weekly(Geometric(40, 1000.0, 0.002))},
        {"spread", Weekly(Linear(40, 4.0, 0.05))},
    };
    REQUIRE_FALSE(CheckBalanceSheetContraction(indicators));
  }

  SECTION("Less than six months of credit") {
    IndicatorMap indicators{
        {"credit_growth", Weekly(Geometric(25, 1000.0, -0.002))},
    };
    REQUIRE_FALSE(CheckBalanceSheetContraction(indicators));
  }
}

TEST_CASE("AlertEngine runs every rule", "[alerts][engine]") {
  IndicatorMap indicators = BeliefIndicators(20.0);
  indicators.merge(CollateralIndicators(-10.0));
  indicators["credit_growth"] = Weekly(Geometric(40, 1000.0, -0.002));

  AlertEngine engine{{}, FixedClock()};
  auto alerts = engine.CheckAllAlerts(indicators);

  REQUIRE(alerts.size() == 3);
  REQUIRE(alerts[0].rule_name == rule::BELIEF_OVERHEATING);
  REQUIRE(alerts[1].rule_name == rule::COLLATERAL_STRESS);
  REQUIRE(alerts[2].rule_name == rule::BALANCE_SHEET_CONTRACTION);
  // The collateral spread is rising, so contraction escalates
  REQUIRE(alerts[2].level == AlertLevel::Red);
  REQUIRE(engine.History() == alerts);

  SECTION("Repeat checks are deterministic and append to history") {
    auto again = engine.CheckAllAlerts(indicators);
    REQUIRE(again == alerts);
    REQUIRE(engine.History().size() == 6);

    AlertEngine other{{}, FixedClock()};
    REQUIRE(other.CheckAllAlerts(indicators) == alerts);
  }

  SECTION("Summary covers the last ten alerts") {
    REQUIRE(engine.GetSummary() == AlertSummary{.green = 0, .yellow = 0, .red = 3});
    for (int i = 0; i < 4; ++i) {
      engine.CheckAllAlerts(indicators);
    }
    REQUIRE(engine.History().size() == 15);
    auto summary = engine.GetSummary();
    REQUIRE(summary.green + summary.yellow + summary.red == 10);
  }

  SECTION("Recent alerts are newest first") {
    auto recent = engine.GetRecentAlerts(2);
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].rule_name == rule::BALANCE_SHEET_CONTRACTION);
    REQUIRE(recent[1].rule_name == rule::COLLATERAL_STRESS);
    REQUIRE(engine.GetRecentAlerts(50).size() == 3);
  }
}

TEST_CASE("AlertEngine with no data", "[alerts][engine]") {
  AlertEngine engine{{}, FixedClock()};
  REQUIRE(engine.CheckAllAlerts({}).empty());
  REQUIRE(engine.History().empty());
  REQUIRE(engine.GetSummary() == AlertSummary{});
  REQUIRE(engine.GetRecentAlerts().empty());
}

TEST_CASE("AlertEngine checks as of a past date", "[alerts][engine]") {
  // Contraction only appears in the last ten weeks of credit
  auto credit = Geometric(40, 1000.0, 0.002);
  for (size_t i = 30; i < credit.size(); ++i) {
    credit[i] = credit[29] * std::pow(0.99, static_cast<double>(i - 29));
  }
  IndicatorMap indicators{{"credit_growth", Weekly(credit)}};

  AlertEngine engine{{}, FixedClock()};
  REQUIRE(engine.CheckAllAlerts(indicators).size() == 1);
  REQUIRE(engine
              .CheckAllAlerts(indicators,
                              FromNanos(END_NANOS - 12 * NANOS_PER_WEEK))
              .empty());
}
