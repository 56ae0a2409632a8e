#include <liquidity_monitor/derived/piecewise_score.h>

#include <algorithm>
#include <cmath>
#include <epoch_core/macros.h>
#include <utility>

namespace liquidity_monitor::derived {

PiecewiseScorer::PiecewiseScorer(std::vector<ScoreBand> bands, double top_bound,
                                 std::optional<std::string> missing_label)
    : m_bands(std::move(bands)), m_top_bound(top_bound) {
  AssertFromFormat(!m_bands.empty(), "PiecewiseScorer requires at least one band");
  m_missing_label = missing_label.value_or(m_bands.front().label);
  for (size_t i = 0; i < m_bands.size(); ++i) {
    auto const &band = m_bands[i];
    AssertFromFormat(band.score_lo <= band.score_hi,
                     "band {} has an inverted score range [{}, {}]",
                     band.label, band.score_lo, band.score_hi);
    if (i > 0) {
      AssertFromFormat(band.lower_bound > m_bands[i - 1].lower_bound,
                       "band lower bounds must be strictly increasing: {} "
                       "after {}",
                       band.lower_bound, m_bands[i - 1].lower_bound);
      AssertFromFormat(band.score_lo >= m_bands[i - 1].score_hi,
                       "band {} score range overlaps the band below it",
                       band.label);
    }
  }
  AssertFromFormat(m_top_bound > m_bands.back().lower_bound,
                   "top bound {} must exceed last lower bound {}", m_top_bound,
                   m_bands.back().lower_bound);
}

size_t PiecewiseScorer::BandIndex(double value) const {
  size_t matched = 0;
  for (size_t i = 0; i < m_bands.size(); ++i) {
    if (value >= m_bands[i].lower_bound) {
      matched = i;
    }
  }
  return matched;
}

double PiecewiseScorer::UpperBound(size_t band) const {
  return band + 1 < m_bands.size() ? m_bands[band + 1].lower_bound
                                   : m_top_bound;
}

BandScore PiecewiseScorer::Score(double value) const {
  if (std::isnan(value)) {
    return {m_missing_label, NAN_SCALAR};
  }

  const auto index = BandIndex(value);
  auto const &band = m_bands[index];
  const double lower = band.lower_bound;
  const double upper = UpperBound(index);

  const double position = (value - lower) / (upper - lower);
  const double score =
      band.score_lo + position * (band.score_hi - band.score_lo);
  return {band.label, std::clamp(score, band.score_lo, band.score_hi)};
}

std::pair<TimeSeries, TimeSeries>
PiecewiseScorer::Apply(TimeSeries const &series, std::string const &label_name,
                       std::string const &score_name) const {
  const auto values = ToValues(series);
  std::vector<std::string> labels;
  std::vector<double> scores;
  labels.reserve(values.size());
  scores.reserve(values.size());

  for (double v : values) {
    auto [label, score] = Score(v);
    labels.push_back(std::move(label));
    scores.push_back(score);
  }

  return {MakeLabelSeries(series.index(), labels, label_name),
          MakeSeries(series.index(), scores, score_name)};
}

} // namespace liquidity_monitor::derived
