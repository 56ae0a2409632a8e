#include <liquidity_monitor/serialization/json.h>
#include <liquidity_monitor/core/series_utils.h>

#include <glaze/glaze.hpp>
#include <stdexcept>

namespace liquidity_monitor::serialization {

namespace {
template <typename T> std::string WriteJson(T const &value, const char *what) {
  std::string out;
  auto ec = glz::write_json(value, out);
  if (ec) {
    throw std::runtime_error(std::string{"Failed to serialize "} + what +
                             " to JSON");
  }
  return out;
}
} // namespace

RegimeResultDto ToDto(regime::RegimeResult const &result) {
  return RegimeResultDto{
      .primary_regime =
          epoch_core::MarketRegimeWrapper::ToString(result.primary_regime),
      .display_name = std::string{RegimeDisplayName(result.primary_regime)},
      .description = std::string{RegimeDescription(result.primary_regime)},
      .scores = {.expansion = result.scores.expansion,
                 .late_cycle = result.scores.late_cycle,
                 .contraction = result.scores.contraction,
                 .stress = result.scores.stress},
      .explanations = result.explanations,
      .confidence = result.confidence,
      .data_quality_warning = result.data_quality_warning,
  };
}

AlertDto ToDto(alerts::Alert const &alert) {
  return AlertDto{
      .level = epoch_core::AlertLevelWrapper::ToString(alert.level),
      .rule = alert.rule_name,
      .title = alert.title,
      .what_changed = alert.what_changed,
      .vulnerability = alert.vulnerability_path,
      .checks = alert.additional_checks,
      .message = alert.FormatMessage(),
      .timestamp_ns = ToNanos(alert.timestamp),
  };
}

std::string ToJson(regime::RegimeResult const &result) {
  return WriteJson(ToDto(result), "RegimeResult");
}

std::string ToJson(alerts::Alert const &alert) {
  return WriteJson(ToDto(alert), "Alert");
}

std::string ToJson(std::vector<alerts::Alert> const &alerts) {
  std::vector<AlertDto> dtos;
  dtos.reserve(alerts.size());
  for (auto const &alert : alerts) {
    dtos.push_back(ToDto(alert));
  }
  return WriteJson(dtos, "Alert list");
}

} // namespace liquidity_monitor::serialization
