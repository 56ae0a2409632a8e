#include <liquidity_monitor/core/constants.h>
#include <epoch_core/macros.h>
#include <utility>

namespace liquidity_monitor {

std::string_view RegimeDisplayName(epoch_core::MarketRegime regime) {
  switch (regime) {
  case epoch_core::MarketRegime::Expansion:
    return "Expansion";
  case epoch_core::MarketRegime::LateCycle:
    return "Late-cycle";
  case epoch_core::MarketRegime::Contraction:
    return "Contraction";
  case epoch_core::MarketRegime::Stress:
    return "Stress";
  default:
    break;
  }
  AssertFromFormat(false, "Invalid MarketRegime: {}",
                   epoch_core::MarketRegimeWrapper::ToString(regime));
  std::unreachable();
}

std::string_view RegimeDescription(epoch_core::MarketRegime regime) {
  switch (regime) {
  case epoch_core::MarketRegime::Expansion:
    return "Credit and balance sheets expanding, spreads tightening, "
           "volatility calm - risk-on environment";
  case epoch_core::MarketRegime::LateCycle:
    return "Credit growth continues but valuation expansion outpaces "
           "earnings improvement - watch for belief overheating";
  case epoch_core::MarketRegime::Contraction:
    return "Credit growth slowing or reversing, spreads widening, volatility "
           "rising - balance sheet contraction underway";
  case epoch_core::MarketRegime::Stress:
    return "Volatility spike with spread blowout and risk-asset sell-off - "
           "collateral impairment, credit crunch risk";
  default:
    break;
  }
  AssertFromFormat(false, "Invalid MarketRegime: {}",
                   epoch_core::MarketRegimeWrapper::ToString(regime));
  std::unreachable();
}

} // namespace liquidity_monitor
