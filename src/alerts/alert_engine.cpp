#include <liquidity_monitor/alerts/alert_engine.h>
#include <liquidity_monitor/core/indicator_resolver.h>
#include <liquidity_monitor/transforms/transforms.h>

#include <array>
#include <epoch_core/macros.h>
#include <format>
#include <spdlog/spdlog.h>

namespace liquidity_monitor::alerts {
using epoch_core::AlertLevel;
using epoch_core::IndicatorRole;

namespace {
// Belief overheating needs a year of daily valuation/earnings history.
constexpr int64_t BELIEF_MIN_LENGTH = periods::DAILY_PER_YEAR;
constexpr int64_t BELIEF_CHANGE_PERIODS = periods::DAILY_1M;
constexpr int64_t ZSCORE_YEARS = 3;

constexpr int64_t VIX_MIN_LENGTH = 3 * periods::DAILY_PER_YEAR;
constexpr int64_t SPREAD_MIN_LENGTH = 3 * periods::WEEKLY_PER_YEAR;
constexpr int64_t EQUITY_MIN_LENGTH = periods::DAILY_1M;

// Credit is weekly: six months of history, 13-week growth, 4-week widening.
constexpr int64_t CREDIT_MIN_LENGTH = 26;
constexpr int64_t SPREAD_WIDENING_PERIODS = periods::WEEKLY_1M;

} // namespace

void AlertConfig::decode(YAML::Node const &node) {
  const auto read = [&node](std::string const &key, double &field) {
    field = node[key].as<double>(field);
  };
  read("belief_zscore_gap_yellow", belief_zscore_gap_yellow);
  read("belief_zscore_gap_red", belief_zscore_gap_red);
  read("vix_percentile_yellow", vix_percentile_yellow);
  read("vix_percentile_red", vix_percentile_red);
  read("spread_percentile_yellow", spread_percentile_yellow);
  read("spread_percentile_red", spread_percentile_red);
  read("equity_drawdown_yellow", equity_drawdown_yellow);
  read("equity_drawdown_red", equity_drawdown_red);
  read("credit_3m_threshold", credit_3m_threshold);
  read("credit_deceleration_threshold", credit_deceleration_threshold);

  AssertFromFormat(belief_zscore_gap_yellow <= belief_zscore_gap_red,
                   "belief gap yellow {} exceeds red {}",
                   belief_zscore_gap_yellow, belief_zscore_gap_red);
  AssertFromFormat(vix_percentile_yellow <= vix_percentile_red,
                   "vix percentile yellow {} exceeds red {}",
                   vix_percentile_yellow, vix_percentile_red);
  AssertFromFormat(spread_percentile_yellow <= spread_percentile_red,
                   "spread percentile yellow {} exceeds red {}",
                   spread_percentile_yellow, spread_percentile_red);
  AssertFromFormat(equity_drawdown_red <= equity_drawdown_yellow,
                   "equity drawdown red {} is above yellow {}",
                   equity_drawdown_red, equity_drawdown_yellow);
}

OptionalAlert CheckBeliefOverheating(IndicatorMap const &indicators,
                                     AlertConfig const &config,
                                     OptionalDateTime const &as_of,
                                     Clock const &clock) {
  const IndicatorResolver resolver{indicators};
  const auto valuation = resolver.Get(IndicatorRole::Valuation);
  const auto earnings = resolver.Get(IndicatorRole::Earnings);
  if (!valuation || !earnings) {
    SPDLOG_DEBUG("{}: valuation or earnings unavailable",
                 rule::BELIEF_OVERHEATING);
    return std::nullopt;
  }
  if (static_cast<int64_t>(valuation->size()) < BELIEF_MIN_LENGTH ||
      static_cast<int64_t>(earnings->size()) < BELIEF_MIN_LENGTH) {
    SPDLOG_DEBUG("{}: insufficient history", rule::BELIEF_OVERHEATING);
    return std::nullopt;
  }

  const transforms::RollingWindowOptions window{.window_years = ZSCORE_YEARS};
  const auto val_change = LatestValue(
      transforms::ZScoreChange(*valuation, window, BELIEF_CHANGE_PERIODS),
      as_of);
  const auto earn_change = LatestValue(
      transforms::ZScoreChange(*earnings, window, BELIEF_CHANGE_PERIODS),
      as_of);
  if (!val_change || !earn_change) {
    return std::nullopt;
  }

  const double gap = *val_change - *earn_change;
  AlertLevel level;
  if (gap >= config.belief_zscore_gap_red) {
    level = AlertLevel::Red;
  } else if (gap >= config.belief_zscore_gap_yellow) {
    level = AlertLevel::Yellow;
  } else {
    return std::nullopt;
  }

  return Alert{
      .level = level,
      .rule_name = rule::BELIEF_OVERHEATING,
      .title = "Belief overheating",
      .what_changed = std::format(
          "Valuation z-score rising {:.2f} sigma faster than earnings", gap),
      .vulnerability_path =
          "valuation expansion -> sharp reversal risk on an earnings miss",
      .additional_checks = {"Forward EPS revisions",
                            "Analyst consensus changes"},
      .timestamp = clock(),
  };
}

OptionalAlert CheckCollateralStress(IndicatorMap const &indicators,
                                    AlertConfig const &config,
                                    OptionalDateTime const &as_of,
                                    Clock const &clock) {
  const IndicatorResolver resolver{indicators};
  const auto vix = resolver.Get(IndicatorRole::Volatility);
  const auto spread = resolver.Get(IndicatorRole::Spread);
  const auto equity = resolver.Get(IndicatorRole::Equity);
  if (!vix || !spread || !equity) {
    SPDLOG_DEBUG("{}: volatility, spread or equity unavailable",
                 rule::COLLATERAL_STRESS);
    return std::nullopt;
  }

  std::optional<double> vix_percentile, spread_percentile, equity_1m;
  if (static_cast<int64_t>(vix->size()) > VIX_MIN_LENGTH) {
    vix_percentile = LatestValue(
        transforms::RollingPercentile(
            *vix, {.window_years = 3,
                   .periods_per_year = periods::DAILY_PER_YEAR}),
        as_of);
  }
  if (static_cast<int64_t>(spread->size()) > SPREAD_MIN_LENGTH) {
    spread_percentile = LatestValue(
        transforms::RollingPercentile(
            *spread, {.window_years = 3,
                      .periods_per_year = periods::WEEKLY_PER_YEAR}),
        as_of);
  }
  if (static_cast<int64_t>(equity->size()) > EQUITY_MIN_LENGTH) {
    equity_1m = LatestValue(transforms::OneMonthChange(*equity), as_of);
  }

  if (!vix_percentile || !spread_percentile || !equity_1m) {
    SPDLOG_DEBUG("{}: insufficient history", rule::COLLATERAL_STRESS);
    return std::nullopt;
  }

  const int red_signals = (*vix_percentile >= config.vix_percentile_red) +
                          (*spread_percentile >= config.spread_percentile_red) +
                          (*equity_1m <= config.equity_drawdown_red);
  const int yellow_signals =
      (*vix_percentile >= config.vix_percentile_yellow) +
      (*spread_percentile >= config.spread_percentile_yellow) +
      (*equity_1m <= config.equity_drawdown_yellow);

  AlertLevel level;
  if (red_signals >= 2) {
    level = AlertLevel::Red;
  } else if (yellow_signals >= 2) {
    level = AlertLevel::Yellow;
  } else {
    return std::nullopt;
  }

  return Alert{
      .level = level,
      .rule_name = rule::COLLATERAL_STRESS,
      .title = "Collateral stress",
      .what_changed =
          std::format("VIX {:.0f}%ile, spread {:.0f}%ile, equity 1M {:.1f}%",
                      *vix_percentile, *spread_percentile, *equity_1m),
      .vulnerability_path = "collateral value decline -> margin calls -> "
                            "forced liquidation -> further decline",
      .additional_checks = {"Leveraged ETF flows", "High-yield issuance halt"},
      .timestamp = clock(),
  };
}

OptionalAlert CheckBalanceSheetContraction(IndicatorMap const &indicators,
                                           AlertConfig const &config,
                                           OptionalDateTime const &as_of,
                                           Clock const &clock) {
  const IndicatorResolver resolver{indicators};
  const auto credit = resolver.Get(IndicatorRole::Credit);
  if (!credit || static_cast<int64_t>(credit->size()) < CREDIT_MIN_LENGTH) {
    SPDLOG_DEBUG("{}: credit unavailable or too short",
                 rule::BALANCE_SHEET_CONTRACTION);
    return std::nullopt;
  }

  const auto credit_growth = LatestValue(
      transforms::ThreeMonthAnnualized(*credit, periods::WEEKLY_3M), as_of);
  if (!credit_growth) {
    return std::nullopt;
  }

  std::optional<double> spread_change;
  if (const auto spread = resolver.Get(IndicatorRole::Spread);
      spread && static_cast<int64_t>(spread->size()) > SPREAD_WIDENING_PERIODS) {
    spread_change = LatestValue(
        transforms::Diff(*spread, SPREAD_WIDENING_PERIODS), as_of);
  }
  const bool spread_widening = spread_change && *spread_change > 0;

  AlertLevel level;
  if (*credit_growth < config.credit_3m_threshold) {
    level = spread_widening ? AlertLevel::Red : AlertLevel::Yellow;
  } else if (*credit_growth < config.credit_deceleration_threshold) {
    level = AlertLevel::Yellow;
  } else {
    return std::nullopt;
  }

  const auto spread_msg =
      spread_widening ? std::format(", spread widened {:.2f}pp", *spread_change)
                      : std::string{};

  return Alert{
      .level = level,
      .rule_name = rule::BALANCE_SHEET_CONTRACTION,
      .title = "Balance sheet contraction",
      .what_changed = std::format("Bank credit 3M annualized {:.1f}%{}",
                                  *credit_growth, spread_msg),
      .vulnerability_path = "credit contraction -> asset price decline -> "
                            "collateral impairment -> further credit "
                            "contraction",
      .additional_checks = {"M2 growth", "Fed balance sheet change"},
      .timestamp = clock(),
  };
}

AlertEngine::AlertEngine(AlertConfig config, Clock clock)
    : m_config(std::move(config)), m_clock(std::move(clock)) {
  AssertFromFormat(static_cast<bool>(m_clock), "AlertEngine requires a clock");
}

std::vector<Alert> AlertEngine::CheckAllAlerts(IndicatorMap const &indicators,
                                               OptionalDateTime const &as_of) {
  using RuleFn = OptionalAlert (*)(IndicatorMap const &, AlertConfig const &,
                                   OptionalDateTime const &, Clock const &);
  constexpr std::array<std::pair<std::string_view, RuleFn>, 3> rules{{
      {rule::BELIEF_OVERHEATING, &CheckBeliefOverheating},
      {rule::COLLATERAL_STRESS, &CheckCollateralStress},
      {rule::BALANCE_SHEET_CONTRACTION, &CheckBalanceSheetContraction},
  }};

  std::vector<Alert> triggered;
  for (auto const &[name, check] : rules) {
    OptionalAlert alert;
    try {
      alert = check(indicators, m_config, as_of, m_clock);
    } catch (std::exception const &e) {
      SPDLOG_ERROR("Alert rule {} failed: {}", name, e.what());
      continue;
    }
    if (alert) {
      SPDLOG_DEBUG("Alert triggered: {}", alert->FormatMessage());
      m_history.push_back(*alert);
      triggered.push_back(std::move(*alert));
    }
  }
  return triggered;
}

AlertSummary AlertEngine::GetSummary() const {
  AlertSummary summary;
  const size_t start = m_history.size() > 10 ? m_history.size() - 10 : 0;
  for (size_t i = start; i < m_history.size(); ++i) {
    switch (m_history[i].level) {
    case AlertLevel::Green:
      ++summary.green;
      break;
    case AlertLevel::Yellow:
      ++summary.yellow;
      break;
    case AlertLevel::Red:
      ++summary.red;
      break;
    default:
      break;
    }
  }
  return summary;
}

std::vector<Alert> AlertEngine::GetRecentAlerts(size_t n) const {
  const size_t count = std::min(n, m_history.size());
  return std::vector<Alert>(m_history.rbegin(), m_history.rbegin() + count);
}

} // namespace liquidity_monitor::alerts
