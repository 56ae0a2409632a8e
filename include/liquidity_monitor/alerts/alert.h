#pragma once
#include <liquidity_monitor/core/constants.h>
#include <epoch_frame/datetime.h>
#include <string>
#include <vector>

namespace liquidity_monitor::alerts {

// Rule identifiers
namespace rule {
constexpr auto BELIEF_OVERHEATING = "belief_overheating";
constexpr auto COLLATERAL_STRESS = "collateral_stress";
constexpr auto BALANCE_SHEET_CONTRACTION = "balance_sheet_contraction";
} // namespace rule

/**
 * @brief A triggered monitoring rule.
 *
 * The vulnerability path describes what to watch, not a cause. Exactly two
 * follow-up checks are attached by every rule.
 */
struct Alert {
  epoch_core::AlertLevel level{epoch_core::AlertLevel::Null};
  std::string rule_name;
  std::string title;
  std::string what_changed;
  std::string vulnerability_path;
  std::vector<std::string> additional_checks;
  epoch_frame::DateTime timestamp;

  // "[Red] Title: what changed -> Vulnerability path: ... Additional checks: a, b"
  std::string FormatMessage() const;

  bool operator==(Alert const &other) const;
};

} // namespace liquidity_monitor::alerts
