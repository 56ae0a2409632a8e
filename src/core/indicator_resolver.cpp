#include <liquidity_monitor/core/indicator_resolver.h>
#include <epoch_core/macros.h>
#include <spdlog/spdlog.h>

namespace liquidity_monitor {
using epoch_core::IndicatorRole;

std::vector<std::string> const &IndicatorResolver::Aliases(IndicatorRole role) {
  using namespace indicators;
  static const std::unordered_map<IndicatorRole, std::vector<std::string>>
      aliases{
          {IndicatorRole::Credit, {CREDIT_GROWTH, CREDIT, BANK_CREDIT}},
          {IndicatorRole::Spread, {SPREAD, HY_SPREAD}},
          {IndicatorRole::Volatility, {VIX}},
          {IndicatorRole::Equity, {EQUITY, SP500}},
          {IndicatorRole::Valuation, {VALUATION, PE_RATIO}},
          {IndicatorRole::Earnings, {EARNINGS, FORWARD_EPS}},
          {IndicatorRole::ValuationZScore, {VALUATION_ZSCORE}},
          {IndicatorRole::EarningsZScore, {EARNINGS_ZSCORE}},
      };

  auto it = aliases.find(role);
  AssertFromFormat(it != aliases.end(), "No aliases registered for role {}",
                   epoch_core::IndicatorRoleWrapper::ToString(role));
  return it->second;
}

IndicatorResolver::IndicatorResolver(IndicatorMap const &indicators) {
  for (auto const &roleName : epoch_core::IndicatorRoleWrapper::GetAllAsStrings()) {
    const auto role = epoch_core::IndicatorRoleWrapper::FromString(roleName);
    if (role == IndicatorRole::Null) {
      continue;
    }
    for (auto const &alias : Aliases(role)) {
      auto it = indicators.find(alias);
      if (it == indicators.end() || it->second.size() == 0) {
        continue;
      }
      m_resolved.emplace(role, std::pair{alias, it->second});
      SPDLOG_DEBUG("Resolved {} -> {}", roleName, alias);
      break;
    }
  }
}

std::optional<TimeSeries> IndicatorResolver::Get(IndicatorRole role) const {
  auto it = m_resolved.find(role);
  if (it == m_resolved.end()) {
    return std::nullopt;
  }
  return it->second.second;
}

std::optional<std::string> IndicatorResolver::SourceName(IndicatorRole role) const {
  auto it = m_resolved.find(role);
  if (it == m_resolved.end()) {
    return std::nullopt;
  }
  return it->second.first;
}

} // namespace liquidity_monitor
