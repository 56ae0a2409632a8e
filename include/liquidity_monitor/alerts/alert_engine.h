#pragma once
//
// Rule-based severity alerts
//
// Three independent rules run on every check. A rule whose inputs are
// missing or too short is skipped; it never prevents the others from
// running.
//

#include <liquidity_monitor/alerts/alert.h>
#include <liquidity_monitor/core/series_utils.h>
#include <optional>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace liquidity_monitor::alerts {

struct AlertConfig {
  // Belief overheating: valuation z-score change minus earnings z-score change
  double belief_zscore_gap_yellow{0.3};
  double belief_zscore_gap_red{0.6};

  // Collateral stress
  double vix_percentile_yellow{75.0};
  double vix_percentile_red{90.0};
  double spread_percentile_yellow{70.0};
  double spread_percentile_red{85.0};
  double equity_drawdown_yellow{-3.0};
  double equity_drawdown_red{-7.0};

  // Balance-sheet contraction, on 3M annualised credit growth
  double credit_3m_threshold{0.0};
  double credit_deceleration_threshold{-2.0};

  void decode(YAML::Node const &);
};

struct AlertSummary {
  size_t green{0};
  size_t yellow{0};
  size_t red{0};

  bool operator==(AlertSummary const &) const = default;
};

using OptionalAlert = std::optional<Alert>;
using OptionalDateTime = std::optional<epoch_frame::DateTime>;

OptionalAlert CheckBeliefOverheating(IndicatorMap const &indicators,
                                     AlertConfig const &config = {},
                                     OptionalDateTime const &as_of = std::nullopt,
                                     Clock const &clock = SystemClock);

OptionalAlert CheckCollateralStress(IndicatorMap const &indicators,
                                    AlertConfig const &config = {},
                                    OptionalDateTime const &as_of = std::nullopt,
                                    Clock const &clock = SystemClock);

OptionalAlert
CheckBalanceSheetContraction(IndicatorMap const &indicators,
                             AlertConfig const &config = {},
                             OptionalDateTime const &as_of = std::nullopt,
                             Clock const &clock = SystemClock);

/**
 * @brief Runs the alert rules and keeps an append-only history.
 *
 * Not internally synchronised; a single writer is assumed.
 */
class AlertEngine {
public:
  explicit AlertEngine(AlertConfig config = {}, Clock clock = SystemClock);

  // Triggered alerts in rule order; each is also appended to the history.
  std::vector<Alert> CheckAllAlerts(IndicatorMap const &indicators,
                                    OptionalDateTime const &as_of = std::nullopt);

  // Counts by level over the last 10 history entries
  AlertSummary GetSummary() const;

  // Last `n` alerts, most recent first
  std::vector<Alert> GetRecentAlerts(size_t n = 10) const;

  std::vector<Alert> const &History() const { return m_history; }

  AlertConfig const &Config() const { return m_config; }

private:
  AlertConfig m_config;
  Clock m_clock;
  std::vector<Alert> m_history;
};

} // namespace liquidity_monitor::alerts

namespace YAML {
template <> struct convert<liquidity_monitor::alerts::AlertConfig> {
  static bool decode(const Node &node,
                     liquidity_monitor::alerts::AlertConfig &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
