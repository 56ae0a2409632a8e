#include <liquidity_monitor/transforms/transforms.h>

#include <algorithm>
#include <cmath>
#include <arrow/compute/api.h>
#include <epoch_core/macros.h>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>

namespace liquidity_monitor::transforms {
using namespace epoch_frame;

namespace {

void AssertPositive(int64_t value, std::string_view what) {
  AssertFromFormat(value > 0, "{} must be positive, got {}", what, value);
}

// Rounding noise on a constant window is treated as zero dispersion.
bool IsZeroDispersion(double sd, double mean) {
  return sd <= 1e-12 * std::max(1.0, std::abs(mean));
}

// E[(x - mean)^order] over the valid values of a window
double CentralMoment(Series const &valid, int order, double mean) {
  return (valid - Scalar{mean})
      .power(Scalar{static_cast<double>(order)})
      .mean()
      .as_double();
}

// Bias-corrected sample skewness; needs three points.
double Skew(Series const &valid, double mean) {
  const auto n = static_cast<double>(valid.size());
  if (valid.size() < 3) {
    return NAN_SCALAR;
  }
  const double m2 = CentralMoment(valid, 2, mean);
  if (IsZeroDispersion(std::sqrt(m2), mean)) {
    return NAN_SCALAR;
  }
  const double m3 = CentralMoment(valid, 3, mean);
  return std::sqrt(n * (n - 1)) / (n - 2) * m3 / std::pow(m2, 1.5);
}

// Bias-corrected excess kurtosis; needs four points.
double Kurtosis(Series const &valid, double mean) {
  const auto n = static_cast<double>(valid.size());
  if (valid.size() < 4) {
    return NAN_SCALAR;
  }
  const double m2 = CentralMoment(valid, 2, mean);
  if (IsZeroDispersion(std::sqrt(m2), mean)) {
    return NAN_SCALAR;
  }
  const double g2 = CentralMoment(valid, 4, mean) / (m2 * m2) - 3.0;
  return (n - 1) / ((n - 2) * (n - 3)) * ((n + 1) * g2 + 6.0);
}

double SampleStd(Series const &valid) {
  if (valid.size() < 2) {
    return NAN_SCALAR;
  }
  return valid.stddev(arrow::compute::VarianceOptions{1}).as_double();
}

/**
 * Trailing-window aggregate over the valid observations of each window.
 * Windows are partial at the start of the series; `fn` sees the window and
 * its non-null values and is only called when at least `min_count` (and at
 * least one) values are valid.
 */
template <typename Fn>
Series RollingValid(Series const &series, int64_t window, int64_t min_count,
                    std::string const &name, Fn &&fn) {
  if (series.size() == 0) {
    return series.rename(name);
  }
  return NaNToNull(series)
      .rolling_apply({.window_size = window, .min_periods = 1})
      .apply([&](Series const &w) {
        const Series valid = w.drop_null();
        if (valid.size() == 0 ||
            static_cast<int64_t>(valid.size()) < min_count) {
          return Scalar{NAN_SCALAR};
        }
        return Scalar{fn(w, valid)};
      })
      .rename(name);
}

// Last observation of a window, NaN if missing
double Current(Series const &window) {
  const auto last = window.iloc(static_cast<int64_t>(window.size()) - 1);
  return last.is_null() ? NAN_SCALAR : last.as_double();
}

// Centered rolling max or min; windows with a missing value or running off
// either end of the series are NaN.
Series CenteredExtreme(Series const &values, int64_t lookback, bool is_max) {
  const int64_t offset = (lookback - 1) / 2;
  const auto trailing =
      values.rolling_apply({.window_size = lookback, .min_periods = lookback})
          .apply([is_max](Series const &w) {
            if (w.count_null().as_int64() > 0) {
              return Scalar{NAN_SCALAR};
            }
            return is_max ? w.max() : w.min();
          });
  return offset == 0 ? trailing : trailing.shift(-offset);
}

} // namespace

int64_t RollingWindowOptions::Window() const {
  const auto window = window_years * periods_per_year;
  AssertPositive(window, "rolling window");
  return window;
}

int64_t RollingWindowOptions::MinPeriods() const {
  const auto result = min_periods.value_or(Window() / 2);
  AssertFromFormat(result >= 0, "min_periods must be non-negative, got {}",
                   result);
  return result;
}

TimeSeries PctChange(TimeSeries const &series, int64_t periods) {
  AssertPositive(periods, "pct_change periods");
  const auto ratio = SafeDivide(series, series.shift(periods), "ratio");
  return ((ratio - Scalar{1.0}) * Scalar{100.0}).rename("pct_change");
}

TimeSeries YoY(TimeSeries const &series, int64_t periods) {
  return PctChange(series, periods);
}

TimeSeries OneMonthChange(TimeSeries const &series, int64_t periods) {
  return PctChange(series, periods);
}

TimeSeries ThreeMonthAnnualized(TimeSeries const &series, int64_t periods_3m) {
  const auto growth =
      PctChange(series, periods_3m) * Scalar{0.01} + Scalar{1.0};
  return ((growth.power(Scalar{4.0}) - Scalar{1.0}) * Scalar{100.0})
      .rename("3m_annualized");
}

TimeSeries Diff(TimeSeries const &series, int64_t periods) {
  AssertPositive(periods, "diff periods");
  return (series - series.shift(periods)).rename("diff");
}

TimeSeries RollingZScore(TimeSeries const &series,
                         RollingWindowOptions const &options) {
  const auto min_periods = options.MinPeriods();
  return RollingValid(
      series, options.Window(), min_periods + 1, "zscore",
      [](Series const &window, Series const &valid) {
        const double current = Current(window);
        const double mean = valid.mean().as_double();
        const double sd = SampleStd(valid);
        if (std::isnan(current) || std::isnan(sd) ||
            IsZeroDispersion(sd, mean)) {
          return NAN_SCALAR;
        }
        return (current - mean) / sd;
      });
}

TimeSeries ZScoreChange(TimeSeries const &series,
                        RollingWindowOptions const &options,
                        int64_t change_periods) {
  return Diff(RollingZScore(series, options), change_periods)
      .rename("zscore_change");
}

TimeSeries Acceleration(TimeSeries const &series, int64_t first_diff_periods,
                        int64_t second_diff_periods) {
  AssertPositive(first_diff_periods, "first_diff_periods");
  AssertPositive(second_diff_periods, "second_diff_periods");
  return Diff(Diff(series, first_diff_periods), second_diff_periods)
      .rename("acceleration");
}

TimeSeries DetectInflection(TimeSeries const &series, int64_t lookback,
                            double sensitivity) {
  AssertPositive(lookback, "inflection lookback");
  const auto n = series.size();
  std::vector<int64_t> out(n, 0);
  if (static_cast<int64_t>(n) < std::max<int64_t>(lookback, 3)) {
    return Series(series.index(), factory::array::make_array(out),
                  "inflection");
  }

  const auto values = NaNToNull(series);
  const auto x = ToValues(values);
  const auto prev = ToValues(values.shift(1));
  const auto next = ToValues(values.shift(-1));
  const auto hi = ToValues(CenteredExtreme(values, lookback, true));
  const auto lo = ToValues(CenteredExtreme(values, lookback, false));
  const auto move = sensitivity > 0 ? ToValues(PctChange(series, lookback))
                                    : std::vector<double>{};

  // NaN fails every comparison below
  for (size_t i = 0; i < n; ++i) {
    const bool isPeak = x[i] == hi[i] && prev[i] < x[i] && next[i] < x[i];
    const bool isTrough = x[i] == lo[i] && prev[i] > x[i] && next[i] > x[i];
    if (!isPeak && !isTrough) {
      continue;
    }
    if (sensitivity > 0 && !(std::abs(move[i]) >= sensitivity)) {
      continue;
    }
    out[i] = isPeak ? 1 : -1;
  }
  return Series(series.index(), factory::array::make_array(out), "inflection");
}

double PercentileOfScore(std::span<const double> values, double score,
                         epoch_core::PercentileKind kind) {
  if (std::isnan(score)) {
    return NAN_SCALAR;
  }
  int64_t n = 0, left = 0, right = 0;
  for (double v : values) {
    if (std::isnan(v)) {
      continue;
    }
    ++n;
    left += v < score;
    right += v <= score;
  }
  if (n == 0) {
    return NAN_SCALAR;
  }

  switch (kind) {
  case epoch_core::PercentileKind::Rank:
    return static_cast<double>(left + right + (right > left ? 1 : 0)) * 50.0 /
           static_cast<double>(n);
  case epoch_core::PercentileKind::Weak:
    return static_cast<double>(right) * 100.0 / static_cast<double>(n);
  default:
    break;
  }
  AssertFromFormat(false, "Invalid PercentileKind: {}",
                   epoch_core::PercentileKindWrapper::ToString(kind));
  std::unreachable();
}

TimeSeries RollingPercentile(TimeSeries const &series,
                             RollingWindowOptions const &options,
                             epoch_core::PercentileKind kind) {
  return RollingValid(
      series, options.Window(), options.MinPeriods(), "percentile",
      [kind](Series const &window, Series const &valid) {
        const auto view = valid.contiguous_array().to_view<double>();
        return PercentileOfScore(
            std::span<const double>{view->raw_values(),
                                    static_cast<size_t>(view->length())},
            Current(window), kind);
      });
}

DataFrame RollingStats(TimeSeries const &series, int64_t window,
                       std::optional<int64_t> min_periods) {
  AssertPositive(window, "rolling stats window");
  const auto min_count = min_periods.value_or(window / 2);

  const auto rolling = [&](std::string const &name, auto &&fn) {
    return RollingValid(series, window, min_count, name,
                        [&fn](Series const &, Series const &valid) {
                          return fn(valid);
                        });
  };

  const auto mean = [](Series const &valid) {
    return valid.mean().as_double();
  };
  const std::vector<Series> columns{
      rolling("mean", mean),
      rolling("std", SampleStd),
      rolling("min",
              [](Series const &valid) { return valid.min().as_double(); }),
      rolling("max",
              [](Series const &valid) { return valid.max().as_double(); }),
      rolling("median",
              [](Series const &valid) {
                return valid.quantile(arrow::compute::QuantileOptions{0.5})
                    .as_double();
              }),
      rolling("skew",
              [&](Series const &valid) { return Skew(valid, mean(valid)); }),
      rolling("kurt", [&](Series const &valid) {
        return Kurtosis(valid, mean(valid));
      }),
  };

  std::vector<arrow::ChunkedArrayPtr> arrays;
  for (auto const &column : columns) {
    arrays.push_back(column.array());
  }
  return make_dataframe(series.index(), arrays,
                        {"mean", "std", "min", "max", "median", "skew", "kurt"});
}

MetricSnapshot GetLatestValues(TimeSeries const &series, bool include_changes) {
  MetricSnapshot snapshot;
  if (series.size() == 0) {
    snapshot.values[metric::LATEST] = std::nullopt;
    return snapshot;
  }

  snapshot.as_of_ns = LatestTimestamp(series);
  snapshot.values[metric::LATEST] = LatestValue(series);

  if (!include_changes ||
      static_cast<int64_t>(series.size()) <= periods::DAILY_PER_YEAR) {
    return snapshot;
  }

  snapshot.values[metric::YOY] = LatestValue(YoY(series));
  snapshot.values[metric::THREE_MONTH_ANN] =
      LatestValue(ThreeMonthAnnualized(series));
  snapshot.values[metric::ONE_MONTH_CHANGE] =
      LatestValue(OneMonthChange(series));
  snapshot.values[metric::ZSCORE_3Y] =
      LatestValue(RollingZScore(series, {.window_years = 3}));
  snapshot.values[metric::ZSCORE_5Y] =
      LatestValue(RollingZScore(series, {.window_years = 5}));
  snapshot.values[metric::PERCENTILE_3Y] =
      LatestValue(RollingPercentile(series, {.window_years = 3}));
  return snapshot;
}

} // namespace liquidity_monitor::transforms
