#include "oms/config/engine_config.hpp"
#include "oms/codec/json_codec.hpp"
#include "oms/core/error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iostream>

namespace oms {
namespace config {

namespace {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Section helpers
// -----------------------------------------------------------------------------
// Every section is an object whose keys must come from a fixed list. A typo
// in a config file ("aggresiveness") is reported instead of being ignored.
// -----------------------------------------------------------------------------
void requireObject(const json& node, const std::string& path) {
  if (!node.is_object()) {
    throw ConfigError(path + ": expected an object");
  }
}

void rejectUnknownKeys(const json& node, const std::string& path,
                       std::initializer_list<const char*> known) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    const bool recognized =
        std::any_of(known.begin(), known.end(),
                    [&](const char* k) { return it.key() == k; });
    if (!recognized) {
      throw ConfigError(path + ": unknown key '" + it.key() + "'");
    }
  }
}

template <typename T>
void read(const json& node, const char* key, const std::string& path,
          T& out) {
  auto it = node.find(key);
  if (it == node.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(path + "." + key + ": " + e.what());
  }
}

VenueProfile parseVenue(const json& node, const std::string& path) {
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"name", "expected_latency_ms", "dark_pool",
                     "fee_per_share"});
  VenueProfile venue;
  read(node, "name", path, venue.name);
  read(node, "expected_latency_ms", path, venue.expected_latency_ms);
  read(node, "dark_pool", path, venue.dark_pool);
  read(node, "fee_per_share", path, venue.fee_per_share);
  if (venue.name.empty()) {
    throw ConfigError(path + ".name: must not be empty");
  }
  if (venue.expected_latency_ms < 0) {
    throw ConfigError(path + ".expected_latency_ms: must be >= 0");
  }
  return venue;
}

RouterConfig parseRouter(const json& node) {
  const std::string path = "router";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"routing_strategy", "venues", "max_venue_latency_ms",
                     "enable_dark_pools", "aggressiveness"});
  RouterConfig cfg;

  std::string strategy = toString(cfg.routing_strategy);
  read(node, "routing_strategy", path, strategy);
  try {
    cfg.routing_strategy = parseRoutingStrategy(strategy);
  } catch (const ValidationError& e) {
    throw ConfigError(path + ".routing_strategy: " + e.what());
  }

  if (auto it = node.find("venues"); it != node.end()) {
    if (!it->is_array()) {
      throw ConfigError(path + ".venues: expected an array");
    }
    for (std::size_t i = 0; i < it->size(); ++i) {
      const std::string venue_path =
          path + ".venues[" + std::to_string(i) + "]";
      VenueProfile venue = parseVenue((*it)[i], venue_path);
      if (cfg.findVenue(venue.name) != nullptr) {
        throw ConfigError(venue_path + ".name: duplicate venue '" +
                          venue.name + "'");
      }
      cfg.venues.push_back(std::move(venue));
    }
  }

  read(node, "max_venue_latency_ms", path, cfg.max_venue_latency_ms);
  read(node, "enable_dark_pools", path, cfg.enable_dark_pools);
  read(node, "aggressiveness", path, cfg.aggressiveness);

  if (cfg.aggressiveness <= 0.0 || cfg.aggressiveness > 1.0) {
    throw ConfigError(path + ".aggressiveness: must be in (0, 1]");
  }
  if (cfg.max_venue_latency_ms < 0) {
    throw ConfigError(path + ".max_venue_latency_ms: must be >= 0");
  }
  return cfg;
}

DispatcherConfig parseDispatcher(const json& node) {
  const std::string path = "dispatcher";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"venue_timeout_ms", "worker_threads", "enable_fallback"});
  DispatcherConfig cfg;
  read(node, "venue_timeout_ms", path, cfg.venue_timeout_ms);
  read(node, "worker_threads", path, cfg.worker_threads);
  read(node, "enable_fallback", path, cfg.enable_fallback);
  if (cfg.venue_timeout_ms <= 0) {
    throw ConfigError(path + ".venue_timeout_ms: must be > 0");
  }
  if (cfg.worker_threads == 0) {
    throw ConfigError(path + ".worker_threads: must be > 0");
  }
  return cfg;
}

SchedulerConfig parseScheduler(const json& node) {
  const std::string path = "scheduler";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"default_slice_interval_ms", "tick_interval_ms",
                     "max_catch_up_slices", "max_finished_schedules",
                     "on_schedule_tolerance", "default_benchmark"});
  SchedulerConfig cfg;
  read(node, "default_slice_interval_ms", path, cfg.default_slice_interval_ms);
  read(node, "tick_interval_ms", path, cfg.tick_interval_ms);
  read(node, "max_catch_up_slices", path, cfg.max_catch_up_slices);
  read(node, "max_finished_schedules", path, cfg.max_finished_schedules);
  read(node, "on_schedule_tolerance", path, cfg.on_schedule_tolerance);

  std::string benchmark = codec::toString(cfg.default_benchmark);
  read(node, "default_benchmark", path, benchmark);
  try {
    cfg.default_benchmark = codec::parseBenchmarkType(benchmark);
  } catch (const ValidationError& e) {
    throw ConfigError(path + ".default_benchmark: " + e.what());
  }

  if (cfg.default_slice_interval_ms <= 0) {
    throw ConfigError(path + ".default_slice_interval_ms: must be > 0");
  }
  if (cfg.tick_interval_ms < 0) {
    throw ConfigError(path + ".tick_interval_ms: must be >= 0");
  }
  if (cfg.max_catch_up_slices < 0) {
    throw ConfigError(path + ".max_catch_up_slices: must be >= 0");
  }
  if (cfg.on_schedule_tolerance < 0.0 || cfg.on_schedule_tolerance >= 1.0) {
    throw ConfigError(path + ".on_schedule_tolerance: must be in [0, 1)");
  }
  return cfg;
}

ComplianceLimits parseCompliance(const json& node) {
  const std::string path = "compliance";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"max_order_quantity", "max_order_notional",
                     "restricted_symbols", "large_order_warning_quantity"});
  ComplianceLimits cfg;
  read(node, "max_order_quantity", path, cfg.max_order_quantity);
  read(node, "max_order_notional", path, cfg.max_order_notional);
  read(node, "restricted_symbols", path, cfg.restricted_symbols);
  read(node, "large_order_warning_quantity", path,
       cfg.large_order_warning_quantity);
  if (cfg.max_order_quantity <= 0 || cfg.max_order_notional <= 0.0) {
    throw ConfigError(path + ": limits must be positive");
  }
  return cfg;
}

AnalyticsWeights parseAnalytics(const json& node) {
  const std::string path = "analytics";
  requireObject(node, path);
  rejectUnknownKeys(node, path, {"slippage_weight", "off_schedule_penalty"});
  AnalyticsWeights cfg;
  read(node, "slippage_weight", path, cfg.slippage_weight);
  read(node, "off_schedule_penalty", path, cfg.off_schedule_penalty);
  return cfg;
}

IpcConfig parseIpc(const json& node) {
  const std::string path = "ipc";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"cmd_endpoint", "pub_endpoint", "market_data_endpoint"});
  IpcConfig cfg;
  read(node, "cmd_endpoint", path, cfg.cmd_endpoint);
  read(node, "pub_endpoint", path, cfg.pub_endpoint);
  read(node, "market_data_endpoint", path, cfg.market_data_endpoint);
  return cfg;
}

}  // namespace

// -----------------------------------------------------------------------------
// RouterConfig::findVenue
// -----------------------------------------------------------------------------
const VenueProfile* RouterConfig::findVenue(const std::string& name) const {
  auto it = std::find_if(venues.begin(), venues.end(),
                         [&](const VenueProfile& v) { return v.name == name; });
  return it == venues.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const json& document) {
  requireObject(document, "<root>");
  rejectUnknownKeys(document, "<root>",
                    {"router", "dispatcher", "scheduler", "compliance",
                     "analytics", "ipc"});

  EngineConfig cfg;
  if (auto it = document.find("router"); it != document.end()) {
    cfg.router = parseRouter(*it);
  }
  if (auto it = document.find("dispatcher"); it != document.end()) {
    cfg.dispatcher = parseDispatcher(*it);
  }
  if (auto it = document.find("scheduler"); it != document.end()) {
    cfg.scheduler = parseScheduler(*it);
  }
  if (auto it = document.find("compliance"); it != document.end()) {
    cfg.compliance = parseCompliance(*it);
  }
  if (auto it = document.find("analytics"); it != document.end()) {
    cfg.analytics = parseAnalytics(*it);
  }
  if (auto it = document.find("ipc"); it != document.end()) {
    cfg.ipc = parseIpc(*it);
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  json document;
  try {
    in >> document;
  } catch (const json::parse_error& e) {
    throw ConfigError("malformed config file '" + path + "': " + e.what());
  }

  EngineConfig cfg = parseEngineConfig(document);
  std::cout << "[EngineConfig] loaded " << path << ": "
            << cfg.router.venues.size() << " venue(s), strategy="
            << toString(cfg.router.routing_strategy) << "\n";
  return cfg;
}

// -----------------------------------------------------------------------------
// RoutingStrategy <-> text
// -----------------------------------------------------------------------------
RoutingStrategy parseRoutingStrategy(const std::string& text) {
  if (text == "BEST_EXECUTION") return RoutingStrategy::BestExecution;
  if (text == "LOWEST_COST") return RoutingStrategy::LowestCost;
  if (text == "FASTEST") return RoutingStrategy::Fastest;
  if (text == "DARK_POOL") return RoutingStrategy::DarkPool;
  if (text == "CUSTOM") return RoutingStrategy::Custom;
  throw ValidationError("unknown routing strategy '" + text + "'");
}

const char* toString(RoutingStrategy strategy) {
  switch (strategy) {
    case RoutingStrategy::BestExecution: return "BEST_EXECUTION";
    case RoutingStrategy::LowestCost:    return "LOWEST_COST";
    case RoutingStrategy::Fastest:       return "FASTEST";
    case RoutingStrategy::DarkPool:      return "DARK_POOL";
    case RoutingStrategy::Custom:        return "CUSTOM";
  }
  return "UNKNOWN";
}

}  // namespace config
}  // namespace oms
