#include <liquidity_monitor/config/engine_config.h>

#include <epoch_core/macros.h>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace liquidity_monitor::config {

void EngineConfig::decode(YAML::Node const &node) {
  AssertFromFormat(node.IsMap() || node.IsNull(),
                   "Engine config must be a map, got node type {}",
                   static_cast<int>(node.Type()));
  regime = node["regime"].as<regime::RegimeClassifierOptions>(regime);
  alerts = node["alerts"].as<alerts::AlertConfig>(alerts);
  balance_sheet =
      node["balance_sheet"].as<derived::BalanceSheetOptions>(balance_sheet);
}

EngineConfig LoadEngineConfig(FileLoaderInterface const &loader,
                              std::string const &name) {
  AssertFromFormat(static_cast<bool>(loader),
                   "LoadEngineConfig requires a file loader");
  const YAML::Node root = loader(name);
  EngineConfig config;
  if (!root.IsDefined() || root.IsNull()) {
    SPDLOG_WARN("Config {} is empty, using defaults", name);
    return config;
  }
  config.decode(root);
  SPDLOG_DEBUG("Loaded engine config from {}", name);
  return config;
}

FileLoaderInterface MakeDirectoryLoader(std::string directory) {
  return [directory = std::move(directory)](std::string const &path) {
    return YAML::LoadFile(std::filesystem::path{directory} / path);
  };
}

} // namespace liquidity_monitor::config
