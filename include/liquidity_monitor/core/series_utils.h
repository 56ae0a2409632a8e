#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_frame/datetime.h>
#include <epoch_frame/series.h>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace liquidity_monitor {
constexpr double NAN_SCALAR = std::numeric_limits<double>::quiet_NaN();

// A single indicator: values on a strictly increasing UTC datetime index.
using TimeSeries = epoch_frame::Series;
using IndicatorMap = std::unordered_map<std::string, TimeSeries>;

// Source of "now" for staleness checks and alert timestamps
using Clock = std::function<epoch_frame::DateTime()>;

inline epoch_frame::DateTime SystemClock() {
  return epoch_frame::DateTime::now();
}

// Metric name -> nullable scalar, all taken as of the same date.
struct MetricSnapshot {
  std::optional<int64_t> as_of_ns{};
  std::unordered_map<std::string, std::optional<double>> values{};

  std::optional<double> get(std::string const &key) const {
    auto it = values.find(key);
    return it == values.end() ? std::nullopt : it->second;
  }
};

// Values as doubles; nulls read back as NaN.
std::vector<double> ToValues(TimeSeries const &series);

// Index timestamps in nanoseconds since epoch.
std::vector<int64_t> ToTimestamps(TimeSeries const &series);

int64_t ToNanos(epoch_frame::DateTime const &dt);

TimeSeries MakeSeries(epoch_frame::IndexPtr const &index,
                      std::vector<double> const &values,
                      std::string const &name);

TimeSeries MakeLabelSeries(epoch_frame::IndexPtr const &index,
                           std::vector<std::string> const &labels,
                           std::string const &name);

TimeSeries MakeFlagSeries(epoch_frame::IndexPtr const &index,
                          std::vector<bool> const &flags,
                          std::string const &name);

TimeSeries MakeSeries(std::vector<int64_t> const &timestamps,
                      std::vector<double> const &values,
                      std::string const &name);

TimeSeries MakeEmptySeries(std::string const &name);

inline bool IsEmpty(std::optional<TimeSeries> const &series) {
  return !series || series->size() == 0;
}

std::optional<int64_t> LatestTimestamp(TimeSeries const &series);

/**
 * @brief Last finite value at or before `as_of` (latest point if unset).
 *
 * A NaN at the selected position is reported as unavailable rather than
 * searched past: the value "as of" a date is the observation on that date.
 */
std::optional<double>
LatestValue(TimeSeries const &series,
            std::optional<epoch_frame::DateTime> const &as_of = std::nullopt);

// NaN observations as nulls, so window aggregates skip them.
TimeSeries NaNToNull(TimeSeries const &series);

// numerator / denominator on the numerator's index, positionally; NaN where
// the denominator is zero.
TimeSeries SafeDivide(TimeSeries const &numerator,
                      TimeSeries const &denominator, std::string const &name);

// lhs - rhs on the union of both indices; NaN where either side is missing.
TimeSeries AlignedDifference(TimeSeries const &lhs, TimeSeries const &rhs,
                             std::string const &name);

} // namespace liquidity_monitor
