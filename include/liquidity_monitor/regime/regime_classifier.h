#pragma once
//
// Point-in-time market regime classification
//
// Up to five scalar metrics are extracted from the indicator map, each rule
// adds weighted points to the four regime totals, and the totals are scaled
// so the leader sits at `normalization_factor` x 100. Every call is an
// independent judgement; nothing is carried between calls.
//

#include <liquidity_monitor/core/constants.h>
#include <liquidity_monitor/core/series_utils.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace liquidity_monitor::regime {

struct RegimeThresholds {
  double credit_growth_expansion{3.0};
  double credit_growth_contraction{0.0};
  double spread_zscore_tight{-0.5};
  double spread_zscore_wide{1.0};
  double vix_percentile_low{30.0};
  double vix_percentile_high{70.0};
  double vix_stress{90.0};
  double valuation_earnings_gap{0.5};
  double equity_drawdown{-5.0};

  void decode(YAML::Node const &);
};

// Calibrated point contributions per rule outcome
struct RegimeWeights {
  double credit_expansion{30.0};
  double credit_contraction{30.0};
  double credit_neutral_expansion{15.0};
  double credit_neutral_late_cycle{15.0};

  double spread_tight_expansion{25.0};
  double spread_wide_contraction{20.0};
  double spread_wide_stress{15.0};
  double spread_neutral_late_cycle{15.0};

  double vix_low_expansion{25.0};
  double vix_stress_stress{40.0};
  double vix_high_contraction{20.0};
  double vix_high_stress{10.0};
  double vix_neutral_late_cycle{10.0};

  double equity_drawdown_stress{30.0};
  double equity_drawdown_contraction{10.0};

  double gap_late_cycle{30.0};
  double gap_expansion_penalty{10.0};

  // Leader's share of 100 after normalisation
  double normalization_factor{0.7};

  void decode(YAML::Node const &);
};

// Observation windows used when extracting metrics
struct RegimeWindows {
  int64_t credit_periods_3m{periods::WEEKLY_3M};
  int64_t credit_min_length{63};
  int64_t spread_periods_per_year{periods::WEEKLY_PER_YEAR};
  int64_t spread_min_length{156};
  int64_t vix_periods_per_year{periods::DAILY_PER_YEAR};
  int64_t vix_min_length{756};
  int64_t equity_periods_1m{periods::DAILY_1M};
  int64_t equity_min_length{21};
  int64_t window_years{3};

  void decode(YAML::Node const &);
};

struct RegimeClassifierOptions {
  RegimeThresholds thresholds{};
  RegimeWeights weights{};
  RegimeWindows windows{};
  // Data older than this is reported as stale
  int64_t max_staleness_days{7};

  void decode(YAML::Node const &);
};

// Scalars the rule table consumes; each may be unavailable
struct RegimeMetrics {
  std::optional<double> credit_growth_3m{};
  std::optional<double> spread_zscore{};
  std::optional<double> spread_level{};
  std::optional<double> vix_percentile{};
  std::optional<double> vix_level{};
  std::optional<double> equity_1m_return{};
  std::optional<double> valuation_earnings_gap{};
};

struct RegimeScore {
  double expansion{0};
  double late_cycle{0};
  double contraction{0};
  double stress{0};

  double Get(epoch_core::MarketRegime regime) const;

  // Highest score; ties go to the earlier regime in REGIME_ORDER
  epoch_core::MarketRegime PrimaryRegime() const;

  // (top - second) / 100
  double Confidence() const;

  bool operator==(RegimeScore const &) const = default;
};

struct RegimeResult {
  epoch_core::MarketRegime primary_regime{epoch_core::MarketRegime::Null};
  RegimeScore scores{};
  std::vector<std::string> explanations{};
  double confidence{0};
  std::optional<std::string> data_quality_warning{};
};

class RegimeClassifier {
public:
  explicit RegimeClassifier(RegimeClassifierOptions options = {},
                            Clock clock = SystemClock);

  RegimeResult
  Classify(IndicatorMap const &indicators,
           std::optional<epoch_frame::DateTime> const &as_of = std::nullopt) const;

  RegimeMetrics ExtractMetrics(
      IndicatorMap const &indicators,
      std::optional<epoch_frame::DateTime> const &as_of = std::nullopt) const;

  RegimeScore ScoreMetrics(RegimeMetrics const &metrics) const;

  // Always three lines; unavailable metrics get a neutral sentence.
  std::vector<std::string>
  GenerateExplanations(RegimeMetrics const &metrics,
                       epoch_core::MarketRegime primary) const;

  std::optional<std::string>
  CheckDataQuality(IndicatorMap const &indicators) const;

  RegimeClassifierOptions const &Options() const { return m_options; }

private:
  RegimeClassifierOptions m_options;
  Clock m_clock;
};

RegimeScore CalculateRegimeScores(IndicatorMap const &indicators);

std::pair<epoch_core::MarketRegime, std::vector<std::string>>
DetermineRegime(IndicatorMap const &indicators);

} // namespace liquidity_monitor::regime

namespace YAML {
template <> struct convert<liquidity_monitor::regime::RegimeThresholds> {
  static bool decode(const Node &node,
                     liquidity_monitor::regime::RegimeThresholds &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::regime::RegimeWeights> {
  static bool decode(const Node &node,
                     liquidity_monitor::regime::RegimeWeights &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::regime::RegimeWindows> {
  static bool decode(const Node &node,
                     liquidity_monitor::regime::RegimeWindows &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::regime::RegimeClassifierOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::regime::RegimeClassifierOptions &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
