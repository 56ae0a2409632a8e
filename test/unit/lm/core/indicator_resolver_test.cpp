//
// Indicator alias resolution tests
//
#include "test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <liquidity_monitor/core/indicator_resolver.h>

using namespace liquidity_monitor;
using namespace liquidity_monitor::test;
using epoch_core::IndicatorRole;

TEST_CASE("IndicatorResolver picks the first available alias",
          "[core][resolver]") {
  IndicatorMap indicators{
      {"bank_credit", WeeklySeries({1.0, 2.0})},
      {"credit", WeeklySeries({3.0})},
      {"hy_spread", WeeklySeries({4.0})},
      {"sp500", DailySeries({5.0})},
  };
  IndicatorResolver resolver{indicators};

  REQUIRE(resolver.SourceName(IndicatorRole::Credit) == "credit");
  REQUIRE(resolver.SourceName(IndicatorRole::Spread) == "hy_spread");
  REQUIRE(resolver.SourceName(IndicatorRole::Equity) == "sp500");
  REQUIRE(resolver.Get(IndicatorRole::Credit)->size() == 1);
  REQUIRE_FALSE(resolver.Has(IndicatorRole::Volatility));
  REQUIRE_FALSE(resolver.Get(IndicatorRole::Volatility));
}

TEST_CASE("IndicatorResolver skips empty series", "[core][resolver]") {
  IndicatorMap indicators{
      {"credit_growth", MakeEmptySeries("credit_growth")},
      {"bank_credit", WeeklySeries({1.0, 2.0})},
  };
  IndicatorResolver resolver{indicators};

  REQUIRE(resolver.SourceName(IndicatorRole::Credit) == "bank_credit");
}

TEST_CASE("IndicatorResolver alias table", "[core][resolver]") {
  REQUIRE(IndicatorResolver::Aliases(IndicatorRole::Credit) ==
          std::vector<std::string>{"credit_growth", "credit", "bank_credit"});
  REQUIRE(IndicatorResolver::Aliases(IndicatorRole::Valuation) ==
          std::vector<std::string>{"valuation", "pe_ratio"});
  REQUIRE(IndicatorResolver::Aliases(IndicatorRole::Earnings) ==
          std::vector<std::string>{"earnings", "forward_eps"});
  REQUIRE_THROWS(IndicatorResolver::Aliases(IndicatorRole::Null));
}
