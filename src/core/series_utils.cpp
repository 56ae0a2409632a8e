#include <liquidity_monitor/core/series_utils.h>

#include <algorithm>
#include <arrow/compute/api.h>
#include <cmath>
#include <epoch_core/macros.h>
#include <epoch_frame/common.h>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <epoch_frame/index.h>
#include <map>

namespace liquidity_monitor {
using namespace epoch_frame;

std::vector<double> ToValues(TimeSeries const &series) {
  std::vector<double> out;
  if (series.size() == 0) {
    return out;
  }

  auto array = series.contiguous_array();
  if (array.type()->id() != arrow::Type::DOUBLE) {
    array = array.cast(arrow::float64());
  }

  const auto view = array.to_view<double>();
  AssertFromFormat(view, "series values are not numeric");

  out.reserve(view->length());
  for (int64_t i = 0; i < view->length(); ++i) {
    out.push_back(view->IsNull(i) ? NAN_SCALAR : view->Value(i));
  }
  return out;
}

std::vector<int64_t> ToTimestamps(TimeSeries const &series) {
  if (series.size() == 0) {
    return {};
  }
  return series.index()->array().cast(arrow::int64()).to_vector<int64_t>();
}

int64_t ToNanos(DateTime const &dt) { return dt.timestamp().value; }

TimeSeries MakeSeries(IndexPtr const &index, std::vector<double> const &values,
                      std::string const &name) {
  AssertFromFormat(index->size() == values.size(),
                   "index/value length mismatch for {}: {} != {}", name,
                   index->size(), values.size());
  return Series(index, factory::array::make_array(values), name);
}

TimeSeries MakeLabelSeries(IndexPtr const &index,
                           std::vector<std::string> const &labels,
                           std::string const &name) {
  AssertFromFormat(index->size() == labels.size(),
                   "index/label length mismatch for {}", name);
  return Series(index, factory::array::make_array(labels), name);
}

TimeSeries MakeFlagSeries(IndexPtr const &index, std::vector<bool> const &flags,
                          std::string const &name) {
  AssertFromFormat(index->size() == flags.size(),
                   "index/flag length mismatch for {}", name);
  return Series(index, factory::array::make_array(flags), name);
}

TimeSeries MakeSeries(std::vector<int64_t> const &timestamps,
                      std::vector<double> const &values,
                      std::string const &name) {
  auto index = factory::index::make_datetime_index(timestamps, "index", "UTC");
  return MakeSeries(index, values, name);
}

TimeSeries MakeEmptySeries(std::string const &name) {
  return MakeSeries(std::vector<int64_t>{}, std::vector<double>{}, name);
}

std::optional<int64_t> LatestTimestamp(TimeSeries const &series) {
  if (series.size() == 0) {
    return std::nullopt;
  }
  return ToTimestamps(series).back();
}

std::optional<double> LatestValue(TimeSeries const &series,
                                  std::optional<DateTime> const &as_of) {
  const auto values = ToValues(series);
  if (values.empty()) {
    return std::nullopt;
  }

  size_t end = values.size();
  if (as_of) {
    const auto timestamps = ToTimestamps(series);
    const auto cutoff = ToNanos(*as_of);
    end = static_cast<size_t>(
        std::upper_bound(timestamps.begin(), timestamps.end(), cutoff) -
        timestamps.begin());
  }

  if (end == 0 || std::isnan(values[end - 1])) {
    return std::nullopt;
  }
  return values[end - 1];
}

TimeSeries NaNToNull(TimeSeries const &series) {
  const arrow::Datum values{series.array()};
  const auto is_nan = AssertResultIsOk(arrow::compute::IsNan(values));
  const auto nullable = AssertResultIsOk(arrow::compute::IfElse(
      is_nan, arrow::MakeNullScalar(arrow::float64()), values));
  return Series{series.index(), nullable.chunked_array()};
}

TimeSeries SafeDivide(TimeSeries const &numerator,
                      TimeSeries const &denominator, std::string const &name) {
  AssertFromFormat(numerator.size() == denominator.size(),
                   "{}: length mismatch ({} vs {})", name, numerator.size(),
                   denominator.size());
  const arrow::Datum values{denominator.array()};
  const auto is_zero =
      AssertResultIsOk(arrow::compute::Equal(values, arrow::Datum(0.0)));
  const auto safe = AssertResultIsOk(
      arrow::compute::IfElse(is_zero, arrow::Datum(NAN_SCALAR), values));
  return (numerator / Series{numerator.index(), safe.chunked_array()})
      .rename(name);
}

TimeSeries AlignedDifference(TimeSeries const &lhs, TimeSeries const &rhs,
                             std::string const &name) {
  std::map<int64_t, std::pair<double, double>> merged;

  const auto lhs_ts = ToTimestamps(lhs);
  const auto lhs_values = ToValues(lhs);
  for (size_t i = 0; i < lhs_ts.size(); ++i) {
    merged[lhs_ts[i]] = {lhs_values[i], NAN_SCALAR};
  }

  const auto rhs_ts = ToTimestamps(rhs);
  const auto rhs_values = ToValues(rhs);
  for (size_t i = 0; i < rhs_ts.size(); ++i) {
    auto [it, inserted] =
        merged.try_emplace(rhs_ts[i], NAN_SCALAR, rhs_values[i]);
    if (!inserted) {
      it->second.second = rhs_values[i];
    }
  }

  std::vector<int64_t> timestamps;
  std::vector<double> values;
  timestamps.reserve(merged.size());
  values.reserve(merged.size());
  for (auto const &[ts, pair] : merged) {
    timestamps.push_back(ts);
    values.push_back(pair.first - pair.second);
  }
  return MakeSeries(timestamps, values, name);
}

} // namespace liquidity_monitor
