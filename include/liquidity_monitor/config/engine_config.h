#pragma once
//
// Engine-wide configuration
//
// All sections are optional; a missing key keeps the compiled default.
//

#include <liquidity_monitor/alerts/alert_engine.h>
#include <liquidity_monitor/core/constants.h>
#include <liquidity_monitor/derived/balance_sheet.h>
#include <liquidity_monitor/regime/regime_classifier.h>
#include <string>
#include <yaml-cpp/yaml.h>

namespace liquidity_monitor::config {

constexpr auto DEFAULT_CONFIG_FILE = "liquidity_monitor.yaml";

struct EngineConfig {
  regime::RegimeClassifierOptions regime{};
  alerts::AlertConfig alerts{};
  derived::BalanceSheetOptions balance_sheet{};

  void decode(YAML::Node const &);
};

EngineConfig LoadEngineConfig(FileLoaderInterface const &loader,
                              std::string const &name = DEFAULT_CONFIG_FILE);

// Loader that resolves names relative to `directory`
FileLoaderInterface MakeDirectoryLoader(std::string directory);

} // namespace liquidity_monitor::config

namespace YAML {
template <> struct convert<liquidity_monitor::config::EngineConfig> {
  static bool decode(const Node &node,
                     liquidity_monitor::config::EngineConfig &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
