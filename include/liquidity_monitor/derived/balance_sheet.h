#pragma once
//
// Central-bank balance-sheet diagnostics
//
// Each scored diagnostic classifies its driver series into ordered bands and
// rescales within the band (see PiecewiseScorer). All outputs share the
// driver's index. Missing, empty, or mismatched inputs produce an empty
// bundle. Levels are in billions USD.
//

#include <liquidity_monitor/core/constants.h>
#include <liquidity_monitor/core/series_utils.h>
#include <liquidity_monitor/derived/piecewise_score.h>
#include <optional>
#include <yaml-cpp/yaml.h>

namespace liquidity_monitor::derived {

// Band labels
namespace label {
constexpr auto NORMAL = "Normal";
constexpr auto AGGRESSIVE = "Aggressive";
constexpr auto ELEVATED = "Elevated";
constexpr auto STRESS = "Stress";
constexpr auto MINIMAL = "Minimal";
constexpr auto SCARCE = "Scarce";
constexpr auto TIGHT = "Tight";
constexpr auto AMPLE = "Ample";
constexpr auto ABUNDANT = "Abundant";
} // namespace label

struct QtPaceOptions {
  int64_t periods_1m{periods::DAILY_1M};
  // Bands on the monthly runoff, in percent of assets
  double aggressive_threshold{0.6};
  double stress_threshold{1.2};
  double top_bound{2.0};

  void decode(YAML::Node const &);
  PiecewiseScorer MakeScorer() const;
};

struct ReserveRegimeOptions {
  double tight_threshold{500.0};
  double ample_threshold{1500.0};
  double abundant_threshold{2500.0};
  double top_bound{4000.0};
  // Share of reverse repo subtracted from reserves
  double reverse_repo_weight{0.1};

  void decode(YAML::Node const &);
  PiecewiseScorer MakeScorer() const;
};

struct MoneyMarketStressOptions {
  double elevated_threshold{500.0};
  double stress_threshold{1500.0};
  double top_bound{2200.0};
  int64_t periods_1m{periods::DAILY_1M};

  void decode(YAML::Node const &);
  PiecewiseScorer MakeScorer() const;
};

struct FedLendingStressOptions {
  double elevated_threshold{100.0};
  double stress_threshold{300.0};
  double top_bound{1000.0};
  int64_t periods_per_year{periods::DAILY_PER_YEAR};
  int64_t percentile_years{3};

  void decode(YAML::Node const &);
  PiecewiseScorer MakeScorer() const;
};

struct TgaDragOptions {
  double normal_threshold{0.05};
  double elevated_threshold{0.15};
  double stress_threshold{0.25};
  double top_bound{1.0};

  void decode(YAML::Node const &);
  PiecewiseScorer MakeScorer() const;
};

struct ReserveDemandOptions {
  double elevated_threshold{0.3};
  double stress_threshold{0.5};
  double top_bound{1.0};
  double crisis_threshold{0.5};

  void decode(YAML::Node const &);
  PiecewiseScorer MakeScorer() const;
};

struct IdentityCheckOptions {
  double tolerance{50.0};

  void decode(YAML::Node const &);
};

struct BalanceSheetOptions {
  QtPaceOptions qt_pace{};
  ReserveRegimeOptions reserve_regime{};
  MoneyMarketStressOptions money_market{};
  FedLendingStressOptions fed_lending{};
  TgaDragOptions tga_drag{};
  ReserveDemandOptions reserve_demand{};
  IdentityCheckOptions identity{};

  void decode(YAML::Node const &);
};

// Label and 0-100 score shared by every scored diagnostic
struct ScoredBundle {
  TimeSeries regime{MakeEmptySeries("regime")};
  TimeSeries score{MakeEmptySeries("score")};

  bool empty() const { return regime.size() == 0; }
};

struct QtPaceBundle : ScoredBundle {
  TimeSeries pace_pct{MakeEmptySeries("pace_pct")};
  TimeSeries change_1m{MakeEmptySeries("change_1m")};
};

struct ReserveRegimeBundle : ScoredBundle {
  TimeSeries effective_reserves{MakeEmptySeries("effective_reserves")};
};

struct MoneyMarketStressBundle : ScoredBundle {
  TimeSeries rrp_level{MakeEmptySeries("rrp_level")};
  TimeSeries rrp_change_1m{MakeEmptySeries("rrp_change_1m")};
  TimeSeries rrp_acceleration{MakeEmptySeries("rrp_acceleration")};
};

struct FedLendingStressBundle : ScoredBundle {
  TimeSeries lending_level{MakeEmptySeries("lending_level")};
  TimeSeries lending_yoy{MakeEmptySeries("lending_yoy")};
  TimeSeries lending_percentile_3y{MakeEmptySeries("lending_percentile_3y")};
};

struct TgaDragBundle : ScoredBundle {
  TimeSeries tga_ratio{MakeEmptySeries("tga_ratio")};
  TimeSeries tga_level{MakeEmptySeries("tga_level")};
  TimeSeries effective_reserves{MakeEmptySeries("effective_reserves")};
};

struct ReserveDemandBundle : ScoredBundle {
  TimeSeries demand_ratio{MakeEmptySeries("demand_proxy_ratio")};
  TimeSeries total_overnight_liquidity{
      MakeEmptySeries("total_overnight_liquidity")};
  TimeSeries crisis_indicator{MakeEmptySeries("crisis_indicator")};
};

struct IdentityCheckBundle {
  TimeSeries identity_lhs{MakeEmptySeries("identity_lhs")};
  TimeSeries identity_rhs{MakeEmptySeries("identity_rhs")};
  TimeSeries residual{MakeEmptySeries("residual")};
  TimeSeries is_balanced{MakeEmptySeries("is_balanced")};
  TimeSeries imbalance_magnitude{MakeEmptySeries("imbalance_magnitude")};

  bool empty() const { return identity_lhs.size() == 0; }
};

/**
 * @brief Monthly pace of central-bank asset runoff (negative) or growth
 * (positive), in percent.
 *
 * The score rises with the runoff rate, so expansion months are Normal with
 * a score of 0.
 */
QtPaceBundle CalculateQtPace(std::optional<TimeSeries> const &fed_assets,
                             QtPaceOptions const &options = {});

// Abundant / Ample / Tight / Scarce on reserves less a share of reverse repo
ReserveRegimeBundle
ClassifyReserveRegime(std::optional<TimeSeries> const &reserves,
                      std::optional<TimeSeries> const &reverse_repo = std::nullopt,
                      ReserveRegimeOptions const &options = {});

MoneyMarketStressBundle
DetectMoneyMarketStress(std::optional<TimeSeries> const &reverse_repo,
                        MoneyMarketStressOptions const &options = {});

FedLendingStressBundle
CalculateFedLendingStress(std::optional<TimeSeries> const &fed_lending,
                          FedLendingStressOptions const &options = {});

// ratio = TGA / (TGA + reserves)
TgaDragBundle CalculateTgaReserveDrag(std::optional<TimeSeries> const &tga,
                                      std::optional<TimeSeries> const &reserves,
                                      TgaDragOptions const &options = {});

// ratio = RRP / (RRP + reserves)
ReserveDemandBundle
CalculateReserveDemandProxy(std::optional<TimeSeries> const &reverse_repo,
                            std::optional<TimeSeries> const &reserves,
                            ReserveDemandOptions const &options = {});

/**
 * @brief Checks dReserves = dSecurities + dLending - dReverseRepo - dTGA.
 *
 * Differences are positional, so the five series must be aligned and of
 * equal length. The first period has no difference: its residual is NaN and
 * it is reported as unbalanced.
 */
IdentityCheckBundle
VerifyBalanceSheetIdentity(std::optional<TimeSeries> const &reserves,
                           std::optional<TimeSeries> const &securities,
                           std::optional<TimeSeries> const &lending,
                           std::optional<TimeSeries> const &reverse_repo,
                           std::optional<TimeSeries> const &tga,
                           IdentityCheckOptions const &options = {});

} // namespace liquidity_monitor::derived

namespace YAML {
template <> struct convert<liquidity_monitor::derived::QtPaceOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::QtPaceOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::ReserveRegimeOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::ReserveRegimeOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::MoneyMarketStressOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::MoneyMarketStressOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::FedLendingStressOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::FedLendingStressOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::TgaDragOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::TgaDragOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::ReserveDemandOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::ReserveDemandOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::IdentityCheckOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::IdentityCheckOptions &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<liquidity_monitor::derived::BalanceSheetOptions> {
  static bool decode(const Node &node,
                     liquidity_monitor::derived::BalanceSheetOptions &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
