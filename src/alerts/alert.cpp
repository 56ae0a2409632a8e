#include <liquidity_monitor/alerts/alert.h>
#include <liquidity_monitor/core/series_utils.h>

#include <algorithm>
#include <format>

namespace liquidity_monitor::alerts {

std::string Alert::FormatMessage() const {
  std::string checks;
  const auto count = std::min<size_t>(additional_checks.size(), 2);
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      checks += ", ";
    }
    checks += additional_checks[i];
  }

  return std::format("[{}] {}: {} -> Vulnerability path: {}. Additional "
                     "checks: {}",
                     epoch_core::AlertLevelWrapper::ToString(level), title,
                     what_changed, vulnerability_path, checks);
}

bool Alert::operator==(Alert const &other) const {
  return level == other.level && rule_name == other.rule_name &&
         title == other.title && what_changed == other.what_changed &&
         vulnerability_path == other.vulnerability_path &&
         additional_checks == other.additional_checks &&
         ToNanos(timestamp) == ToNanos(other.timestamp);
}

} // namespace liquidity_monitor::alerts
