#pragma once
//
// Stateless time-series transforms
//
// Every function returns a new series on the input's index. Points without
// enough history are NaN. Window lengths are given in observations; callers
// pass the periods-per-year of their data rather than having it inferred.
//

#include <liquidity_monitor/core/constants.h>
#include <liquidity_monitor/core/series_utils.h>
#include <optional>
#include <span>

namespace liquidity_monitor::transforms {

struct RollingWindowOptions {
  int64_t window_years{3};
  int64_t periods_per_year{periods::DAILY_PER_YEAR};
  // Defaults to half the window
  std::optional<int64_t> min_periods{};

  int64_t Window() const;
  int64_t MinPeriods() const;
};

// Percentage change over `periods` observations, in percent.
TimeSeries PctChange(TimeSeries const &series, int64_t periods);

TimeSeries YoY(TimeSeries const &series,
               int64_t periods = periods::DAILY_PER_YEAR);

TimeSeries OneMonthChange(TimeSeries const &series,
                          int64_t periods = periods::DAILY_1M);

// ((1 + r_3m)^4 - 1) * 100
TimeSeries ThreeMonthAnnualized(TimeSeries const &series,
                                int64_t periods_3m = periods::DAILY_3M);

// x[t] - x[t - periods]
TimeSeries Diff(TimeSeries const &series, int64_t periods);

/**
 * @brief (x - rolling mean) / rolling sample std over a trailing window.
 *
 * A point needs more than `min_periods` valid observations in its window,
 * so a series without gaps has exactly `min_periods` leading NaNs. A zero
 * rolling std yields NaN.
 */
TimeSeries RollingZScore(TimeSeries const &series,
                         RollingWindowOptions const &options = {});

TimeSeries ZScoreChange(TimeSeries const &series,
                        RollingWindowOptions const &options = {},
                        int64_t change_periods = periods::DAILY_1M);

// Second difference: Diff(Diff(x, first), second)
TimeSeries Acceleration(TimeSeries const &series,
                        int64_t first_diff_periods = periods::DAILY_1M,
                        int64_t second_diff_periods = periods::DAILY_1M);

/**
 * @brief Marks local peaks (+1) and troughs (-1); everything else is 0.
 *
 * A peak equals the max of a centered window of `lookback` observations
 * and is strictly above both neighbours. Windows that run off either end
 * of the series or contain NaN never mark a point. With `sensitivity` > 0
 * the absolute percent change over `lookback` must also reach it.
 */
TimeSeries DetectInflection(TimeSeries const &series,
                            int64_t lookback = periods::DAILY_1M,
                            double sensitivity = 0.0);

// Percentile of `score` within `values` (non-NaN entries only), in [0, 100].
double PercentileOfScore(std::span<const double> values, double score,
                         epoch_core::PercentileKind kind =
                             epoch_core::PercentileKind::Rank);

/**
 * @brief Percentile of each value against the valid values of its trailing
 * window. NaN when the window holds fewer than `min_periods` valid points or
 * the current value is NaN.
 */
TimeSeries RollingPercentile(TimeSeries const &series,
                             RollingWindowOptions const &options = {},
                             epoch_core::PercentileKind kind =
                                 epoch_core::PercentileKind::Rank);

// Columns: mean, std, min, max, median, skew, kurt
epoch_frame::DataFrame
RollingStats(TimeSeries const &series,
             int64_t window = periods::DAILY_PER_YEAR,
             std::optional<int64_t> min_periods = std::nullopt);

// Snapshot keys
namespace metric {
constexpr auto LATEST = "latest";
constexpr auto YOY = "yoy";
constexpr auto THREE_MONTH_ANN = "3m_ann";
constexpr auto ONE_MONTH_CHANGE = "1m_change";
constexpr auto ZSCORE_3Y = "zscore_3y";
constexpr auto ZSCORE_5Y = "zscore_5y";
constexpr auto PERCENTILE_3Y = "percentile_3y";
} // namespace metric

// Latest level plus, with more than a year of daily history, the latest
// value of each standard transform.
MetricSnapshot GetLatestValues(TimeSeries const &series,
                               bool include_changes = true);

} // namespace liquidity_monitor::transforms
