#pragma once
#include <liquidity_monitor/core/constants.h>
#include <liquidity_monitor/core/series_utils.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace liquidity_monitor {

/**
 * @brief Maps raw indicator names onto canonical roles.
 *
 * Each role has an ordered alias list; the first alias present with a
 * non-empty series wins. Resolution happens once at the input boundary so
 * rules and the classifier only ever ask for a role.
 */
class IndicatorResolver {
public:
  explicit IndicatorResolver(IndicatorMap const &indicators);

  [[nodiscard]] std::optional<TimeSeries>
  Get(epoch_core::IndicatorRole role) const;

  [[nodiscard]] bool Has(epoch_core::IndicatorRole role) const {
    return m_resolved.contains(role);
  }

  // Raw name that satisfied the role, if any
  [[nodiscard]] std::optional<std::string>
  SourceName(epoch_core::IndicatorRole role) const;

  static std::vector<std::string> const &
  Aliases(epoch_core::IndicatorRole role);

private:
  std::unordered_map<epoch_core::IndicatorRole, std::pair<std::string, TimeSeries>>
      m_resolved;
};

} // namespace liquidity_monitor
