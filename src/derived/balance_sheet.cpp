#include <liquidity_monitor/derived/balance_sheet.h>
#include <liquidity_monitor/transforms/transforms.h>

#include <arrow/compute/api.h>
#include <epoch_core/macros.h>
#include <epoch_frame/common.h>
#include <spdlog/spdlog.h>
#include <tuple>

namespace liquidity_monitor::derived {

namespace {

bool HasSameLength(TimeSeries const &lhs, TimeSeries const &rhs,
                   std::string_view metric) {
  if (lhs.size() == rhs.size()) {
    return true;
  }
  SPDLOG_WARN("{}: input length mismatch ({} vs {})", metric, lhs.size(),
              rhs.size());
  return false;
}

bool IsMissing(std::optional<TimeSeries> const &series, std::string_view metric,
               std::string_view input) {
  if (!IsEmpty(series)) {
    return false;
  }
  SPDLOG_WARN("{}: {} series missing or empty", metric, input);
  return true;
}

// Positional view of `series` on another index of the same length
TimeSeries OnIndex(TimeSeries const &series, epoch_frame::IndexPtr const &index) {
  return epoch_frame::Series{index, series.array()};
}

// Comparisons against a missing value read as false
TimeSeries NullAsFalse(TimeSeries const &flags, std::string const &name) {
  const auto filled = epoch_frame::AssertResultIsOk(arrow::compute::CallFunction(
      "coalesce", {arrow::Datum{flags.array()}, arrow::Datum(false)}));
  return epoch_frame::Series{flags.index(), filled.chunked_array()}.rename(name);
}

template <typename Bundle>
void ApplyScorer(Bundle &bundle, PiecewiseScorer const &scorer,
                 TimeSeries const &driver) {
  std::tie(bundle.regime, bundle.score) =
      scorer.Apply(driver, "regime", "score");
}

} // namespace

void QtPaceOptions::decode(YAML::Node const &node) {
  periods_1m = node["periods_1m"].as<int64_t>(periods_1m);
  aggressive_threshold =
      node["aggressive_threshold"].as<double>(aggressive_threshold);
  stress_threshold = node["stress_threshold"].as<double>(stress_threshold);
  top_bound = node["top_bound"].as<double>(top_bound);
}

PiecewiseScorer QtPaceOptions::MakeScorer() const {
  return PiecewiseScorer{{{0.0, label::NORMAL, 0.0, 50.0},
                          {aggressive_threshold, label::AGGRESSIVE, 50.0, 75.0},
                          {stress_threshold, label::STRESS, 75.0, 100.0}},
                         top_bound};
}

void ReserveRegimeOptions::decode(YAML::Node const &node) {
  tight_threshold = node["tight_threshold"].as<double>(tight_threshold);
  ample_threshold = node["ample_threshold"].as<double>(ample_threshold);
  abundant_threshold =
      node["abundant_threshold"].as<double>(abundant_threshold);
  top_bound = node["top_bound"].as<double>(top_bound);
  reverse_repo_weight =
      node["reverse_repo_weight"].as<double>(reverse_repo_weight);
}

PiecewiseScorer ReserveRegimeOptions::MakeScorer() const {
  return PiecewiseScorer{{{0.0, label::SCARCE, 0.0, 25.0},
                          {tight_threshold, label::TIGHT, 25.0, 50.0},
                          {ample_threshold, label::AMPLE, 50.0, 75.0},
                          {abundant_threshold, label::ABUNDANT, 75.0, 100.0}},
                         top_bound};
}

void MoneyMarketStressOptions::decode(YAML::Node const &node) {
  elevated_threshold =
      node["elevated_threshold"].as<double>(elevated_threshold);
  stress_threshold = node["stress_threshold"].as<double>(stress_threshold);
  top_bound = node["top_bound"].as<double>(top_bound);
  periods_1m = node["periods_1m"].as<int64_t>(periods_1m);
}

PiecewiseScorer MoneyMarketStressOptions::MakeScorer() const {
  return PiecewiseScorer{{{0.0, label::NORMAL, 0.0, 50.0},
                          {elevated_threshold, label::ELEVATED, 50.0, 90.0},
                          {stress_threshold, label::STRESS, 90.0, 100.0}},
                         top_bound};
}

void FedLendingStressOptions::decode(YAML::Node const &node) {
  elevated_threshold =
      node["elevated_threshold"].as<double>(elevated_threshold);
  stress_threshold = node["stress_threshold"].as<double>(stress_threshold);
  top_bound = node["top_bound"].as<double>(top_bound);
  periods_per_year = node["periods_per_year"].as<int64_t>(periods_per_year);
  percentile_years = node["percentile_years"].as<int64_t>(percentile_years);
}

PiecewiseScorer FedLendingStressOptions::MakeScorer() const {
  return PiecewiseScorer{{{0.0, label::NORMAL, 0.0, 50.0},
                          {elevated_threshold, label::ELEVATED, 50.0, 90.0},
                          {stress_threshold, label::STRESS, 90.0, 100.0}},
                         top_bound};
}

void TgaDragOptions::decode(YAML::Node const &node) {
  normal_threshold = node["normal_threshold"].as<double>(normal_threshold);
  elevated_threshold =
      node["elevated_threshold"].as<double>(elevated_threshold);
  stress_threshold = node["stress_threshold"].as<double>(stress_threshold);
  top_bound = node["top_bound"].as<double>(top_bound);
}

PiecewiseScorer TgaDragOptions::MakeScorer() const {
  return PiecewiseScorer{{{0.0, label::MINIMAL, 0.0, 50.0},
                          {normal_threshold, label::NORMAL, 50.0, 75.0},
                          {elevated_threshold, label::ELEVATED, 75.0, 90.0},
                          {stress_threshold, label::STRESS, 90.0, 100.0}},
                         top_bound, label::NORMAL};
}

void ReserveDemandOptions::decode(YAML::Node const &node) {
  elevated_threshold =
      node["elevated_threshold"].as<double>(elevated_threshold);
  stress_threshold = node["stress_threshold"].as<double>(stress_threshold);
  top_bound = node["top_bound"].as<double>(top_bound);
  crisis_threshold = node["crisis_threshold"].as<double>(crisis_threshold);
}

PiecewiseScorer ReserveDemandOptions::MakeScorer() const {
  return PiecewiseScorer{{{0.0, label::NORMAL, 0.0, 50.0},
                          {elevated_threshold, label::ELEVATED, 50.0, 90.0},
                          {stress_threshold, label::STRESS, 90.0, 100.0}},
                         top_bound};
}

void IdentityCheckOptions::decode(YAML::Node const &node) {
  tolerance = node["tolerance"].as<double>(tolerance);
  AssertFromFormat(tolerance >= 0, "identity tolerance must be non-negative");
}

void BalanceSheetOptions::decode(YAML::Node const &node) {
  qt_pace = node["qt_pace"].as<QtPaceOptions>(qt_pace);
  reserve_regime =
      node["reserve_regime"].as<ReserveRegimeOptions>(reserve_regime);
  money_market =
      node["money_market_stress"].as<MoneyMarketStressOptions>(money_market);
  fed_lending =
      node["fed_lending_stress"].as<FedLendingStressOptions>(fed_lending);
  tga_drag = node["tga_reserve_drag"].as<TgaDragOptions>(tga_drag);
  reserve_demand =
      node["reserve_demand_proxy"].as<ReserveDemandOptions>(reserve_demand);
  identity = node["identity_check"].as<IdentityCheckOptions>(identity);
}

QtPaceBundle CalculateQtPace(std::optional<TimeSeries> const &fed_assets,
                             QtPaceOptions const &options) {
  QtPaceBundle bundle;
  if (IsMissing(fed_assets, "qt_pace", "fed_assets")) {
    return bundle;
  }

  bundle.pace_pct =
      transforms::PctChange(*fed_assets, options.periods_1m).rename("pace_pct");
  bundle.change_1m =
      transforms::Diff(*fed_assets, options.periods_1m).rename("change_1m");

  // Runoff is scored; expansion months sit below the first band
  ApplyScorer(bundle, options.MakeScorer(),
              bundle.pace_pct * epoch_frame::Scalar{-1.0});
  return bundle;
}

ReserveRegimeBundle
ClassifyReserveRegime(std::optional<TimeSeries> const &reserves,
                      std::optional<TimeSeries> const &reverse_repo,
                      ReserveRegimeOptions const &options) {
  ReserveRegimeBundle bundle;
  if (IsMissing(reserves, "reserve_regime", "reserves")) {
    return bundle;
  }

  auto effective = *reserves;
  if (!IsEmpty(reverse_repo)) {
    if (HasSameLength(*reserves, *reverse_repo, "reserve_regime")) {
      effective = effective - OnIndex(*reverse_repo, reserves->index()) *
                                  epoch_frame::Scalar{options.reverse_repo_weight};
    } else {
      SPDLOG_WARN("reserve_regime: classifying unadjusted reserves");
    }
  }

  bundle.effective_reserves = effective.rename("effective_reserves");
  ApplyScorer(bundle, options.MakeScorer(), bundle.effective_reserves);
  return bundle;
}

MoneyMarketStressBundle
DetectMoneyMarketStress(std::optional<TimeSeries> const &reverse_repo,
                        MoneyMarketStressOptions const &options) {
  MoneyMarketStressBundle bundle;
  if (IsMissing(reverse_repo, "money_market_stress", "reverse_repo")) {
    return bundle;
  }

  bundle.rrp_level = *reverse_repo;
  bundle.rrp_change_1m =
      transforms::PctChange(*reverse_repo, options.periods_1m);
  bundle.rrp_acceleration = transforms::Acceleration(
      *reverse_repo, options.periods_1m, options.periods_1m);
  ApplyScorer(bundle, options.MakeScorer(), *reverse_repo);
  return bundle;
}

FedLendingStressBundle
CalculateFedLendingStress(std::optional<TimeSeries> const &fed_lending,
                          FedLendingStressOptions const &options) {
  FedLendingStressBundle bundle;
  if (IsMissing(fed_lending, "fed_lending_stress", "fed_lending")) {
    return bundle;
  }

  bundle.lending_level = *fed_lending;
  bundle.lending_yoy = transforms::YoY(*fed_lending, options.periods_per_year);
  bundle.lending_percentile_3y = transforms::RollingPercentile(
      *fed_lending,
      {.window_years = options.percentile_years,
       .periods_per_year = options.periods_per_year},
      epoch_core::PercentileKind::Weak);
  ApplyScorer(bundle, options.MakeScorer(), *fed_lending);
  return bundle;
}

TgaDragBundle CalculateTgaReserveDrag(std::optional<TimeSeries> const &tga,
                                      std::optional<TimeSeries> const &reserves,
                                      TgaDragOptions const &options) {
  TgaDragBundle bundle;
  if (IsMissing(tga, "tga_reserve_drag", "tga") ||
      IsMissing(reserves, "tga_reserve_drag", "reserves") ||
      !HasSameLength(*tga, *reserves, "tga_reserve_drag")) {
    return bundle;
  }

  const auto aligned_reserves = OnIndex(*reserves, tga->index());
  bundle.tga_ratio =
      SafeDivide(*tga, *tga + aligned_reserves, "tga_ratio");
  bundle.tga_level = *tga;
  bundle.effective_reserves =
      (aligned_reserves - aligned_reserves * bundle.tga_ratio)
          .rename("effective_reserves");
  ApplyScorer(bundle, options.MakeScorer(), bundle.tga_ratio);
  return bundle;
}

ReserveDemandBundle
CalculateReserveDemandProxy(std::optional<TimeSeries> const &reverse_repo,
                            std::optional<TimeSeries> const &reserves,
                            ReserveDemandOptions const &options) {
  ReserveDemandBundle bundle;
  if (IsMissing(reverse_repo, "reserve_demand_proxy", "reverse_repo") ||
      IsMissing(reserves, "reserve_demand_proxy", "reserves") ||
      !HasSameLength(*reverse_repo, *reserves, "reserve_demand_proxy")) {
    return bundle;
  }

  const auto total = *reverse_repo + OnIndex(*reserves, reverse_repo->index());
  bundle.demand_ratio = SafeDivide(*reverse_repo, total, "demand_proxy_ratio");
  bundle.total_overnight_liquidity = total.rename("total_overnight_liquidity");
  bundle.crisis_indicator = NullAsFalse(
      bundle.demand_ratio > epoch_frame::Scalar{options.crisis_threshold},
      "crisis_indicator");
  ApplyScorer(bundle, options.MakeScorer(), bundle.demand_ratio);
  return bundle;
}

IdentityCheckBundle
VerifyBalanceSheetIdentity(std::optional<TimeSeries> const &reserves,
                           std::optional<TimeSeries> const &securities,
                           std::optional<TimeSeries> const &lending,
                           std::optional<TimeSeries> const &reverse_repo,
                           std::optional<TimeSeries> const &tga,
                           IdentityCheckOptions const &options) {
  constexpr auto kMetric = "balance_sheet_identity";
  IdentityCheckBundle bundle;
  if (IsMissing(reserves, kMetric, "reserves") ||
      IsMissing(securities, kMetric, "securities") ||
      IsMissing(lending, kMetric, "lending") ||
      IsMissing(reverse_repo, kMetric, "reverse_repo") ||
      IsMissing(tga, kMetric, "tga")) {
    return bundle;
  }
  for (auto const *other : {&*securities, &*lending, &*reverse_repo, &*tga}) {
    if (!HasSameLength(*reserves, *other, kMetric)) {
      return bundle;
    }
  }

  const auto index = reserves->index();
  const auto first_diff = [&index](TimeSeries const &series) {
    return OnIndex(transforms::Diff(series, 1), index);
  };

  const auto d_reserves = first_diff(*reserves);
  const auto rhs = first_diff(*securities) + first_diff(*lending) -
                   first_diff(*reverse_repo) - first_diff(*tga);
  const auto residual = d_reserves - rhs;
  const auto magnitude = epoch_frame::AssertResultIsOk(
      arrow::compute::AbsoluteValue(arrow::Datum{residual.array()}));

  bundle.identity_lhs = d_reserves.rename("identity_lhs");
  bundle.identity_rhs = rhs.rename("identity_rhs");
  bundle.residual = residual.rename("residual");
  bundle.imbalance_magnitude =
      epoch_frame::Series{index, magnitude.chunked_array()}.rename(
          "imbalance_magnitude");
  bundle.is_balanced = NullAsFalse(
      bundle.imbalance_magnitude <= epoch_frame::Scalar{options.tolerance},
      "is_balanced");
  return bundle;
}

} // namespace liquidity_monitor::derived
