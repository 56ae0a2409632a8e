#include <liquidity_monitor/regime/regime_classifier.h>
#include <liquidity_monitor/core/indicator_resolver.h>
#include <liquidity_monitor/transforms/transforms.h>

#include <algorithm>
#include <cmath>
#include <epoch_core/macros.h>
#include <format>
#include <functional>
#include <spdlog/spdlog.h>

namespace liquidity_monitor::regime {
using epoch_core::IndicatorRole;
using epoch_core::MarketRegime;

void RegimeThresholds::decode(YAML::Node const &node) {
  credit_growth_expansion =
      node["credit_growth_expansion"].as<double>(credit_growth_expansion);
  credit_growth_contraction =
      node["credit_growth_contraction"].as<double>(credit_growth_contraction);
  spread_zscore_tight =
      node["spread_zscore_tight"].as<double>(spread_zscore_tight);
  spread_zscore_wide = node["spread_zscore_wide"].as<double>(spread_zscore_wide);
  vix_percentile_low = node["vix_percentile_low"].as<double>(vix_percentile_low);
  vix_percentile_high =
      node["vix_percentile_high"].as<double>(vix_percentile_high);
  vix_stress = node["vix_stress"].as<double>(vix_stress);
  valuation_earnings_gap =
      node["valuation_earnings_gap"].as<double>(valuation_earnings_gap);
  equity_drawdown = node["equity_drawdown"].as<double>(equity_drawdown);

  AssertFromFormat(credit_growth_contraction <= credit_growth_expansion,
                   "credit contraction cutoff {} exceeds expansion cutoff {}",
                   credit_growth_contraction, credit_growth_expansion);
  AssertFromFormat(spread_zscore_tight <= spread_zscore_wide,
                   "spread tight cutoff {} exceeds wide cutoff {}",
                   spread_zscore_tight, spread_zscore_wide);
  AssertFromFormat(vix_percentile_low <= vix_percentile_high &&
                       vix_percentile_high <= vix_stress,
                   "vix cutoffs must satisfy low <= high <= stress");
}

void RegimeWeights::decode(YAML::Node const &node) {
  const auto read = [&node](std::string const &key, double &field) {
    field = node[key].as<double>(field);
  };
  read("credit_expansion", credit_expansion);
  read("credit_contraction", credit_contraction);
  read("credit_neutral_expansion", credit_neutral_expansion);
  read("credit_neutral_late_cycle", credit_neutral_late_cycle);
  read("spread_tight_expansion", spread_tight_expansion);
  read("spread_wide_contraction", spread_wide_contraction);
  read("spread_wide_stress", spread_wide_stress);
  read("spread_neutral_late_cycle", spread_neutral_late_cycle);
  read("vix_low_expansion", vix_low_expansion);
  read("vix_stress_stress", vix_stress_stress);
  read("vix_high_contraction", vix_high_contraction);
  read("vix_high_stress", vix_high_stress);
  read("vix_neutral_late_cycle", vix_neutral_late_cycle);
  read("equity_drawdown_stress", equity_drawdown_stress);
  read("equity_drawdown_contraction", equity_drawdown_contraction);
  read("gap_late_cycle", gap_late_cycle);
  read("gap_expansion_penalty", gap_expansion_penalty);
  read("normalization_factor", normalization_factor);
}

void RegimeWindows::decode(YAML::Node const &node) {
  const auto read = [&node](std::string const &key, int64_t &field) {
    field = node[key].as<int64_t>(field);
    AssertFromFormat(field > 0, "regime window {} must be positive", key);
  };
  read("credit_periods_3m", credit_periods_3m);
  read("credit_min_length", credit_min_length);
  read("spread_periods_per_year", spread_periods_per_year);
  read("spread_min_length", spread_min_length);
  read("vix_periods_per_year", vix_periods_per_year);
  read("vix_min_length", vix_min_length);
  read("equity_periods_1m", equity_periods_1m);
  read("equity_min_length", equity_min_length);
  read("window_years", window_years);
}

void RegimeClassifierOptions::decode(YAML::Node const &node) {
  thresholds = node["thresholds"].as<RegimeThresholds>(thresholds);
  weights = node["weights"].as<RegimeWeights>(weights);
  windows = node["windows"].as<RegimeWindows>(windows);
  max_staleness_days =
      node["max_staleness_days"].as<int64_t>(max_staleness_days);
}

double RegimeScore::Get(MarketRegime regime) const {
  switch (regime) {
  case MarketRegime::Expansion:
    return expansion;
  case MarketRegime::LateCycle:
    return late_cycle;
  case MarketRegime::Contraction:
    return contraction;
  case MarketRegime::Stress:
    return stress;
  default:
    break;
  }
  AssertFromFormat(false, "Invalid MarketRegime: {}",
                   epoch_core::MarketRegimeWrapper::ToString(regime));
  std::unreachable();
}

MarketRegime RegimeScore::PrimaryRegime() const {
  MarketRegime best = REGIME_ORDER.front();
  for (auto regime : REGIME_ORDER) {
    if (Get(regime) > Get(best)) {
      best = regime;
    }
  }
  return best;
}

double RegimeScore::Confidence() const {
  std::vector<double> sorted;
  for (auto regime : REGIME_ORDER) {
    sorted.push_back(Get(regime));
  }
  if (sorted.size() < 2) {
    return 1.0;
  }
  std::ranges::sort(sorted, std::greater{});
  return (sorted[0] - sorted[1]) / 100.0;
}

RegimeClassifier::RegimeClassifier(RegimeClassifierOptions options, Clock clock)
    : m_options(std::move(options)), m_clock(std::move(clock)) {
  AssertFromFormat(static_cast<bool>(m_clock),
                   "RegimeClassifier requires a clock");
}

RegimeResult
RegimeClassifier::Classify(IndicatorMap const &indicators,
                           std::optional<epoch_frame::DateTime> const &as_of) const {
  const auto metrics = ExtractMetrics(indicators, as_of);
  const auto scores = ScoreMetrics(metrics);
  const auto primary = scores.PrimaryRegime();

  return RegimeResult{
      .primary_regime = primary,
      .scores = scores,
      .explanations = GenerateExplanations(metrics, primary),
      .confidence = scores.Confidence(),
      .data_quality_warning = CheckDataQuality(indicators),
  };
}

RegimeMetrics RegimeClassifier::ExtractMetrics(
    IndicatorMap const &indicators,
    std::optional<epoch_frame::DateTime> const &as_of) const {
  const IndicatorResolver resolver{indicators};
  const auto &windows = m_options.windows;
  RegimeMetrics metrics;

  const auto hasHistory = [](std::optional<TimeSeries> const &series,
                             int64_t min_length, std::string_view name) {
    if (!series) {
      SPDLOG_DEBUG("regime: {} unavailable", name);
      return false;
    }
    if (static_cast<int64_t>(series->size()) <= min_length) {
      SPDLOG_DEBUG("regime: {} has {} points, needs more than {}", name,
                   series->size(), min_length);
      return false;
    }
    return true;
  };

  if (const auto credit = resolver.Get(IndicatorRole::Credit);
      hasHistory(credit, windows.credit_min_length, "credit")) {
    metrics.credit_growth_3m = LatestValue(
        transforms::ThreeMonthAnnualized(*credit, windows.credit_periods_3m),
        as_of);
  }

  if (const auto spread = resolver.Get(IndicatorRole::Spread);
      hasHistory(spread, windows.spread_min_length, "spread")) {
    metrics.spread_zscore = LatestValue(
        transforms::RollingZScore(
            *spread, {.window_years = windows.window_years,
                      .periods_per_year = windows.spread_periods_per_year}),
        as_of);
    metrics.spread_level = LatestValue(*spread, as_of);
  }

  if (const auto vix = resolver.Get(IndicatorRole::Volatility);
      hasHistory(vix, windows.vix_min_length, "volatility")) {
    metrics.vix_percentile = LatestValue(
        transforms::RollingPercentile(
            *vix, {.window_years = windows.window_years,
                   .periods_per_year = windows.vix_periods_per_year}),
        as_of);
    metrics.vix_level = LatestValue(*vix, as_of);
  }

  if (const auto equity = resolver.Get(IndicatorRole::Equity);
      hasHistory(equity, windows.equity_min_length, "equity")) {
    metrics.equity_1m_return = LatestValue(
        transforms::OneMonthChange(*equity, windows.equity_periods_1m), as_of);
  }

  const auto valuation = resolver.Get(IndicatorRole::ValuationZScore);
  const auto earnings = resolver.Get(IndicatorRole::EarningsZScore);
  if (valuation && earnings) {
    metrics.valuation_earnings_gap = LatestValue(
        AlignedDifference(*valuation, *earnings, "valuation_earnings_gap"),
        as_of);
  }

  return metrics;
}

RegimeScore RegimeClassifier::ScoreMetrics(RegimeMetrics const &metrics) const {
  const auto &t = m_options.thresholds;
  const auto &w = m_options.weights;
  double expansion = 0, late_cycle = 0, contraction = 0, stress = 0;

  if (const auto credit = metrics.credit_growth_3m) {
    if (*credit > t.credit_growth_expansion) {
      expansion += w.credit_expansion;
    } else if (*credit < t.credit_growth_contraction) {
      contraction += w.credit_contraction;
    } else {
      late_cycle += w.credit_neutral_late_cycle;
      expansion += w.credit_neutral_expansion;
    }
  }

  if (const auto spread_z = metrics.spread_zscore) {
    if (*spread_z < t.spread_zscore_tight) {
      expansion += w.spread_tight_expansion;
    } else if (*spread_z > t.spread_zscore_wide) {
      contraction += w.spread_wide_contraction;
      stress += w.spread_wide_stress;
    } else {
      late_cycle += w.spread_neutral_late_cycle;
    }
  }

  if (const auto vix_pct = metrics.vix_percentile) {
    if (*vix_pct < t.vix_percentile_low) {
      expansion += w.vix_low_expansion;
    } else if (*vix_pct > t.vix_stress) {
      stress += w.vix_stress_stress;
    } else if (*vix_pct > t.vix_percentile_high) {
      contraction += w.vix_high_contraction;
      stress += w.vix_high_stress;
    } else {
      late_cycle += w.vix_neutral_late_cycle;
    }
  }

  if (const auto equity_1m = metrics.equity_1m_return;
      equity_1m && *equity_1m < t.equity_drawdown) {
    stress += w.equity_drawdown_stress;
    contraction += w.equity_drawdown_contraction;
  }

  if (const auto gap = metrics.valuation_earnings_gap;
      gap && *gap > t.valuation_earnings_gap) {
    late_cycle += w.gap_late_cycle;
    expansion -= w.gap_expansion_penalty;
  }

  const double max_score = std::max({expansion, late_cycle, contraction, stress, 1.0});
  const double factor = 100.0 / max_score * w.normalization_factor;
  const auto normalize = [factor](double total) {
    return std::clamp(total * factor, 0.0, 100.0);
  };

  return RegimeScore{
      .expansion = normalize(expansion),
      .late_cycle = normalize(late_cycle),
      .contraction = normalize(contraction),
      .stress = normalize(stress),
  };
}

std::vector<std::string>
RegimeClassifier::GenerateExplanations(RegimeMetrics const &metrics,
                                       MarketRegime primary) const {
  std::vector<std::string> lines;
  lines.reserve(3);

  if (const auto credit = metrics.credit_growth_3m) {
    if (primary == MarketRegime::Expansion) {
      lines.push_back(std::format(
          "Credit growth sustained ({:.1f}% 3M annualized) - balance sheet "
          "expanding",
          *credit));
    } else if (primary == MarketRegime::Contraction) {
      lines.push_back(std::format(
          "Credit growth slowing ({:.1f}% 3M annualized) - balance sheet "
          "contraction pressure",
          *credit));
    } else {
      lines.push_back(
          std::format("Credit growth {:.1f}% (3M annualized)", *credit));
    }
  } else {
    lines.emplace_back("Credit growth data unavailable");
  }

  const auto vix_pct = metrics.vix_percentile;
  const auto spread_z = metrics.spread_zscore;
  if (vix_pct && spread_z) {
    if (primary == MarketRegime::Stress) {
      lines.push_back(std::format(
          "Volatility at {:.0f}th percentile, spread z={:.1f} - collateral "
          "stress signal",
          *vix_pct, *spread_z));
    } else if (primary == MarketRegime::Expansion) {
      lines.push_back(std::format(
          "Volatility in bottom {:.0f}%ile, spreads tight - risk-on "
          "environment",
          100.0 - *vix_pct));
    } else {
      lines.push_back(std::format("Volatility {:.0f}%ile, spread z-score {:.1f}",
                                  *vix_pct, *spread_z));
    }
  } else {
    lines.emplace_back("Volatility and spread data unavailable");
  }

  const auto gap = metrics.valuation_earnings_gap;
  if (primary == MarketRegime::LateCycle && gap) {
    lines.push_back(std::format(
        "Valuation exceeds earnings by {:.1f} sigma - belief overheating "
        "warning",
        *gap));
  } else if (primary == MarketRegime::Expansion) {
    lines.emplace_back("Vulnerability: monitor credit over-extension");
  } else if (primary == MarketRegime::Contraction) {
    lines.emplace_back("Vulnerability: watch spread widening -> collateral "
                       "impairment -> forced selling");
  } else if (primary == MarketRegime::Stress) {
    lines.emplace_back(
        "Vulnerability: leveraged position liquidation, liquidity crunch risk");
  } else {
    lines.emplace_back("Assessing persistence of the current regime");
  }

  return lines;
}

std::optional<std::string>
RegimeClassifier::CheckDataQuality(IndicatorMap const &indicators) const {
  std::vector<std::string> warnings;

  const auto available = std::ranges::count_if(
      indicators::DATA_QUALITY_SET, [&indicators](std::string_view name) {
        auto it = indicators.find(std::string{name});
        return it != indicators.end() && it->second.size() > 0;
      });
  if (available < 3) {
    warnings.push_back(std::format("Missing core indicators: {} missing",
                                   3 - available));
  }

  std::vector<std::string> names;
  for (auto const &[name, series] : indicators) {
    names.push_back(name);
  }
  std::ranges::sort(names);

  const auto now = ToNanos(m_clock());
  for (auto const &name : names) {
    const auto latest = LatestTimestamp(indicators.at(name));
    if (!latest) {
      continue;
    }
    const auto days_old = static_cast<int64_t>(std::floor(
        static_cast<double>(now - *latest) / static_cast<double>(NANOS_PER_DAY)));
    if (days_old > m_options.max_staleness_days) {
      warnings.push_back(std::format("{} data is {} days old", name, days_old));
    }
  }

  if (warnings.empty()) {
    return std::nullopt;
  }

  std::string joined;
  for (auto const &warning : warnings) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += warning;
  }
  return joined;
}

RegimeScore CalculateRegimeScores(IndicatorMap const &indicators) {
  return RegimeClassifier{}.Classify(indicators).scores;
}

std::pair<MarketRegime, std::vector<std::string>>
DetermineRegime(IndicatorMap const &indicators) {
  auto result = RegimeClassifier{}.Classify(indicators);
  return {result.primary_regime, std::move(result.explanations)};
}

} // namespace liquidity_monitor::regime
