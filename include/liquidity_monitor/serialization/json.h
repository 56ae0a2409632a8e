#pragma once
#include <liquidity_monitor/alerts/alert.h>
#include <liquidity_monitor/regime/regime_classifier.h>
#include <optional>
#include <string>
#include <vector>

namespace liquidity_monitor::serialization {

// Plain records handed to the presentation layer

struct RegimeScoreDto {
  double expansion{};
  double late_cycle{};
  double contraction{};
  double stress{};
};

struct RegimeResultDto {
  std::string primary_regime;
  std::string display_name;
  std::string description;
  RegimeScoreDto scores{};
  std::vector<std::string> explanations{};
  double confidence{};
  std::optional<std::string> data_quality_warning{};
};

struct AlertDto {
  std::string level;
  std::string rule;
  std::string title;
  std::string what_changed;
  std::string vulnerability;
  std::vector<std::string> checks{};
  std::string message;
  int64_t timestamp_ns{};
};

RegimeResultDto ToDto(regime::RegimeResult const &result);
AlertDto ToDto(alerts::Alert const &alert);

// Throw std::runtime_error if glaze reports an error
std::string ToJson(regime::RegimeResult const &result);
std::string ToJson(alerts::Alert const &alert);
std::string ToJson(std::vector<alerts::Alert> const &alerts);

} // namespace liquidity_monitor::serialization
