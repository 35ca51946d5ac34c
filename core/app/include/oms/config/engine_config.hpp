#pragma once

#include "oms/domain/order.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace oms {
namespace config {

// -----------------------------------------------------------------------------
// RoutingStrategy
// -----------------------------------------------------------------------------
//   BestExecution  rank venues by book VWAP only.
//   LowestCost     rank by VWAP adjusted for the venue's per-share fee.
//   Fastest        rank by expected latency first, VWAP second.
//   DarkPool       dark venues first (implies dark venues are eligible).
//   Custom         skip the single-venue shortcut and always run the greedy
//                  split down the VWAP ranking.
// -----------------------------------------------------------------------------
enum class RoutingStrategy {
  BestExecution,
  LowestCost,
  Fastest,
  DarkPool,
  Custom,
};

struct VenueProfile {
  std::string name;
  std::int64_t expected_latency_ms{0};
  bool dark_pool{false};
  double fee_per_share{0.0};
};

// -----------------------------------------------------------------------------
// RouterConfig
// -----------------------------------------------------------------------------
//
// @brief  Every option the Router recognizes, with its default.
//
// @details
// venues is ordered: list position is the final deterministic tie-break
// after VWAP and expected latency. A venue absent from this list is never
// routed to, whatever the quote source returns.
//
// max_venue_latency_ms excludes venues whose expected latency exceeds it
// (0 disables the filter). aggressiveness is the fraction of each displayed
// price level the router is allowed to plan against, in (0, 1].
// -----------------------------------------------------------------------------
struct RouterConfig {
  RoutingStrategy routing_strategy{RoutingStrategy::BestExecution};
  std::vector<VenueProfile> venues;
  std::int64_t max_venue_latency_ms{0};
  bool enable_dark_pools{false};
  double aggressiveness{1.0};

  // nullptr when the venue is not configured.
  const VenueProfile* findVenue(const std::string& name) const;
};

struct DispatcherConfig {
  // Deadline handed to every venue call. Expiry is a VenueFailure.
  std::int64_t venue_timeout_ms{2000};
  std::size_t worker_threads{4};
  // One fallback sub-plan per failed venue when true.
  bool enable_fallback{true};
};

// -----------------------------------------------------------------------------
// SchedulerConfig
// -----------------------------------------------------------------------------
// tick_interval_ms drives the per-order timer thread. 0 disables the timer
// threads entirely; ticks are then driven by AlgorithmicScheduler::tick().
// max_finished_schedules bounds how many finished schedules stay queryable.
// -----------------------------------------------------------------------------
struct SchedulerConfig {
  std::int64_t default_slice_interval_ms{300000};
  std::int64_t tick_interval_ms{1000};
  int max_catch_up_slices{3};
  std::size_t max_finished_schedules{1000};
  double on_schedule_tolerance{0.10};
  domain::BenchmarkType default_benchmark{domain::BenchmarkType::Arrival};
};

struct ComplianceLimits {
  domain::Quantity max_order_quantity{1000000};
  double max_order_notional{50000000.0};
  std::vector<std::string> restricted_symbols;
  domain::Quantity large_order_warning_quantity{100000};
};

// -----------------------------------------------------------------------------
// AnalyticsWeights
// -----------------------------------------------------------------------------
// Tuning weights for the execution quality score reported by
// monitorProgress(). score = 100 - |slippage_bps| * slippage_weight
//                            - (on schedule ? 0 : off_schedule_penalty),
// clamped to [0, 100].
// -----------------------------------------------------------------------------
struct AnalyticsWeights {
  double slippage_weight{0.1};
  double off_schedule_penalty{10.0};
};

struct IpcConfig {
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
  // SUB endpoint of the market data feed used by oms_gateway. Empty disables
  // the feed.
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
};

struct EngineConfig {
  RouterConfig router;
  DispatcherConfig dispatcher;
  SchedulerConfig scheduler;
  ComplianceLimits compliance;
  AnalyticsWeights analytics;
  IpcConfig ipc;
};

// -----------------------------------------------------------------------------
// parseEngineConfig / loadEngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Build an EngineConfig from a JSON document.
//
// @details
// Missing keys keep their defaults. Unknown keys, wrong value types and out
// of range values raise ConfigError naming the offending path, e.g.
// "router.venues[1].fee_per_share".
//
// Throws: ConfigError.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document);
EngineConfig loadEngineConfig(const std::string& path);

RoutingStrategy parseRoutingStrategy(const std::string& text);
const char* toString(RoutingStrategy strategy);

}  // namespace config
}  // namespace oms
