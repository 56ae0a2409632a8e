#pragma once
#include <liquidity_monitor/core/series_utils.h>
#include <optional>
#include <string>
#include <vector>

namespace liquidity_monitor::derived {

struct ScoreBand {
  double lower_bound;
  std::string label;
  double score_lo;
  double score_hi;
};

struct BandScore {
  std::string label;
  double score;
};

/**
 * @brief Classify a value into ordered bands, then rescale within the band.
 *
 * Bands are checked in increasing order and every band whose lower bound is
 * at or below the value overwrites the previous match, so a value sitting
 * exactly on a boundary belongs to the higher band. Inside a band the value
 * is mapped linearly from [lower_bound, next lower_bound) onto
 * [score_lo, score_hi]; the last band runs up to `top_bound`. Values under
 * the first bound take the first band at its `score_lo`. NaN takes
 * `missing_label` (the first band's label by default) with a NaN score.
 */
class PiecewiseScorer {
public:
  PiecewiseScorer(std::vector<ScoreBand> bands, double top_bound,
                  std::optional<std::string> missing_label = std::nullopt);

  BandScore Score(double value) const;

  // Label and score series on the input's index
  std::pair<TimeSeries, TimeSeries> Apply(TimeSeries const &series,
                                          std::string const &label_name,
                                          std::string const &score_name) const;

  std::vector<ScoreBand> const &Bands() const { return m_bands; }
  double TopBound() const { return m_top_bound; }
  std::string const &MissingLabel() const { return m_missing_label; }

private:
  std::vector<ScoreBand> m_bands;
  double m_top_bound;
  std::string m_missing_label;

  size_t BandIndex(double value) const;
  double UpperBound(size_t band) const;
};

} // namespace liquidity_monitor::derived
