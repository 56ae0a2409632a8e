#pragma once
#include <epoch_core/enum_wrapper.h>
#include <yaml-cpp/yaml.h>
#include <array>
#include <functional>
#include <string>
#include <string_view>

// Point-in-time market liquidity regime
CREATE_ENUM(MarketRegime,
            Expansion,   // credit growing, spreads tight, volatility calm
            LateCycle,   // credit still growing, valuations outrunning earnings
            Contraction, // credit slowing, spreads widening
            Stress);     // volatility spike, spread blowout, equity drawdown

CREATE_ENUM(AlertLevel, Green, Yellow, Red);

// Canonical indicator roles consumed by the classifier and the alert rules
CREATE_ENUM(IndicatorRole,
            Credit,
            Spread,
            Volatility,
            Equity,
            Valuation,
            Earnings,
            ValuationZScore,
            EarningsZScore);

CREATE_ENUM(PercentileKind,
            Rank,  // mean of strict and weak rank, ties split
            Weak); // share of window values <= latest

namespace liquidity_monitor {

// Tie-break order for argmax over regime scores
constexpr std::array<epoch_core::MarketRegime, 4> REGIME_ORDER{
    epoch_core::MarketRegime::Expansion, epoch_core::MarketRegime::LateCycle,
    epoch_core::MarketRegime::Contraction, epoch_core::MarketRegime::Stress};

// Observation counts for daily market data
namespace periods {
constexpr int64_t DAILY_PER_YEAR = 252;
constexpr int64_t WEEKLY_PER_YEAR = 52;
constexpr int64_t MONTHLY_PER_YEAR = 12;
constexpr int64_t DAILY_1M = 21;
constexpr int64_t DAILY_3M = 63;
constexpr int64_t WEEKLY_1M = 4;
constexpr int64_t WEEKLY_3M = 13;
} // namespace periods

constexpr int64_t NANOS_PER_DAY = 86'400'000'000'000LL;

// Raw indicator names accepted at the input boundary
namespace indicators {
constexpr auto CREDIT_GROWTH = "credit_growth";
constexpr auto CREDIT = "credit";
constexpr auto BANK_CREDIT = "bank_credit";
constexpr auto SPREAD = "spread";
constexpr auto HY_SPREAD = "hy_spread";
constexpr auto VIX = "vix";
constexpr auto EQUITY = "equity";
constexpr auto SP500 = "sp500";
constexpr auto VALUATION = "valuation";
constexpr auto PE_RATIO = "pe_ratio";
constexpr auto EARNINGS = "earnings";
constexpr auto FORWARD_EPS = "forward_eps";
constexpr auto VALUATION_ZSCORE = "valuation_zscore";
constexpr auto EARNINGS_ZSCORE = "earnings_zscore";

// Names counted by the classifier's data-quality check
constexpr std::array<std::string_view, 5> DATA_QUALITY_SET{
    CREDIT_GROWTH, BANK_CREDIT, SPREAD, HY_SPREAD, VIX};
} // namespace indicators

std::string_view RegimeDisplayName(epoch_core::MarketRegime regime);
std::string_view RegimeDescription(epoch_core::MarketRegime regime);

using FileLoaderInterface = std::function<YAML::Node(std::string const &)>;
} // namespace liquidity_monitor
