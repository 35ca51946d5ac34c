// =============================================================================
// router_test.cpp
// =============================================================================
// Unit tests for oms::Router and oms::walkBook.
//
// Validates:
//   - Two-venue split when the best venue cannot cover the order
//   - Single-venue shortcut, and CUSTOM forcing the greedy split
//   - BUY ranks by lowest VWAP, SELL by highest
//   - Tie-breaks: lower latency, then configuration order
//   - Venues outside the configuration are never used
//   - Thin books reported via confidence, not errors
//   - Dark-pool, latency, fee and aggressiveness options
//   - Excluded venues (fallback path)
// =============================================================================

#include "oms/routing/router.hpp"

#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <random>
#include <set>
#include <string>
#include <vector>

using oms::domain::Order;
using oms::domain::QuoteSnapshot;
using oms::test::oneLevelBook;
using oms::test::venue;

namespace {

Order order(oms::domain::Side side, oms::domain::Quantity qty) {
  Order o;
  o.order_id = 1;
  o.symbol = "AAPL";
  o.side = side;
  o.order_type = oms::domain::OrderType::Limit;
  o.quantity = qty;
  o.remaining_quantity = qty;
  o.limit_price = 150.0;
  o.status = oms::domain::OrderStatus::New;
  return o;
}

oms::config::RouterConfig twoVenues() {
  oms::config::RouterConfig cfg;
  cfg.venues = {venue("A", 2), venue("B", 2)};
  return cfg;
}

}  // namespace

// =============================================================================
// walkBook()
// =============================================================================

TEST(WalkBookTest, WalksLevelsUntilQuantityIsCovered) {
  const std::vector<oms::domain::PriceLevel> levels = {
      {100.0, 100}, {101.0, 100}, {102.0, 100}};

  const oms::BookWalk walk = oms::walkBook(levels, 150);
  EXPECT_EQ(walk.filled, 150);
  EXPECT_NEAR(walk.vwap, (100.0 * 100 + 101.0 * 50) / 150.0, 1e-9);

  const oms::BookWalk thin = oms::walkBook(levels, 1000);
  EXPECT_EQ(thin.filled, 300);
  EXPECT_NEAR(thin.vwap, 101.0, 1e-9);

  EXPECT_EQ(oms::walkBook({}, 10).filled, 0);
  EXPECT_DOUBLE_EQ(oms::walkBook({}, 10).vwap, 0.0);
}

// =============================================================================
// Allocation
// =============================================================================

TEST(RouterTest, SplitsAcrossVenuesWhenBestCannotFill) {
  oms::Router router(twoVenues());
  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(149.99, 100, 150.00, 600);
  quotes["B"] = oneLevelBook(149.99, 100, 150.01, 500);

  const auto plan = router.route(order(oms::domain::Side::Buy, 1000), quotes);

  ASSERT_EQ(plan.routes.size(), 2u);
  EXPECT_EQ(plan.routes[0].venue, "A");
  EXPECT_EQ(plan.routes[0].quantity, 600);
  EXPECT_EQ(plan.routes[0].priority, 1);
  EXPECT_DOUBLE_EQ(plan.routes[0].expected_price, 150.00);
  EXPECT_EQ(plan.routes[1].venue, "B");
  EXPECT_EQ(plan.routes[1].quantity, 400);
  EXPECT_EQ(plan.routes[1].priority, 2);
  EXPECT_EQ(plan.primary_venue, "A");
  EXPECT_EQ(plan.routed_quantity, 1000);
  EXPECT_DOUBLE_EQ(plan.confidence, 1.0);
}

TEST(RouterTest, SingleVenueWhenBestCoversEverything) {
  oms::Router router(twoVenues());
  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(0, 0, 150.02, 5000);
  quotes["B"] = oneLevelBook(0, 0, 150.01, 5000);

  const auto plan = router.route(order(oms::domain::Side::Buy, 1000), quotes);
  ASSERT_EQ(plan.routes.size(), 1u);
  EXPECT_EQ(plan.primary_venue, "B");
  EXPECT_EQ(plan.routes[0].quantity, 1000);
}

TEST(RouterTest, CustomStrategyAlwaysSplitsGreedily) {
  auto cfg = twoVenues();
  cfg.routing_strategy = oms::config::RoutingStrategy::Custom;
  oms::Router router(cfg);
  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(0, 0, 150.00, 5000);
  quotes["B"] = oneLevelBook(0, 0, 150.01, 5000);

  // The best venue takes everything it can; custom only skips the shortcut.
  const auto plan = router.route(order(oms::domain::Side::Buy, 1000), quotes);
  ASSERT_EQ(plan.routes.size(), 1u);
  EXPECT_EQ(plan.routes[0].venue, "A");

  quotes["A"] = oneLevelBook(0, 0, 150.00, 300);
  const auto split = router.route(order(oms::domain::Side::Buy, 1000), quotes);
  ASSERT_EQ(split.routes.size(), 2u);
  EXPECT_EQ(split.routes[0].quantity, 300);
  EXPECT_EQ(split.routes[1].quantity, 700);
}

TEST(RouterTest, SellPrefersHighestVwap) {
  oms::Router router(twoVenues());
  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(149.98, 1000, 150.00, 100);
  quotes["B"] = oneLevelBook(149.99, 1000, 150.01, 100);

  const auto plan = router.route(order(oms::domain::Side::Sell, 500), quotes);
  ASSERT_EQ(plan.routes.size(), 1u);
  EXPECT_EQ(plan.primary_venue, "B");
  EXPECT_DOUBLE_EQ(plan.routes[0].expected_price, 149.99);
}

TEST(RouterTest, TiesBrokenByLatencyThenConfigurationOrder) {
  oms::config::RouterConfig cfg;
  cfg.venues = {venue("SLOW", 9), venue("FAST", 1), venue("FAST2", 1)};
  oms::Router router(cfg);

  QuoteSnapshot quotes;
  quotes["SLOW"] = oneLevelBook(0, 0, 150.00, 100);
  quotes["FAST"] = oneLevelBook(0, 0, 150.00, 100);
  quotes["FAST2"] = oneLevelBook(0, 0, 150.00, 100);

  const auto plan = router.route(order(oms::domain::Side::Buy, 300), quotes);
  ASSERT_EQ(plan.routes.size(), 3u);
  EXPECT_EQ(plan.routes[0].venue, "FAST");
  EXPECT_EQ(plan.routes[1].venue, "FAST2");
  EXPECT_EQ(plan.routes[2].venue, "SLOW");
}

TEST(RouterTest, ThinBookReportedThroughConfidence) {
  oms::Router router(twoVenues());
  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(0, 0, 150.00, 200);
  quotes["B"] = oneLevelBook(0, 0, 150.01, 50);

  const auto plan = router.route(order(oms::domain::Side::Buy, 1000), quotes);
  EXPECT_EQ(plan.routed_quantity, 250);
  EXPECT_EQ(plan.requested_quantity, 1000);
  EXPECT_DOUBLE_EQ(plan.confidence, 0.25);
}

TEST(RouterTest, EmptyPlanWhenNoLiquidity) {
  oms::Router router(twoVenues());
  const auto plan = router.route(order(oms::domain::Side::Buy, 100), {});
  EXPECT_TRUE(plan.empty());
  EXPECT_EQ(plan.routed_quantity, 0);
  EXPECT_DOUBLE_EQ(plan.confidence, 0.0);
}

TEST(RouterTest, UnconfiguredVenuesAreIgnored) {
  oms::Router router(twoVenues());
  QuoteSnapshot quotes;
  quotes["ROGUE"] = oneLevelBook(0, 0, 1.00, 1'000'000);
  quotes["B"] = oneLevelBook(0, 0, 150.01, 1000);

  const auto plan = router.route(order(oms::domain::Side::Buy, 500), quotes);
  ASSERT_EQ(plan.routes.size(), 1u);
  EXPECT_EQ(plan.primary_venue, "B");
}

TEST(RouterTest, PlansNeverLeaveConfiguredVenues) {
  oms::config::RouterConfig cfg;
  cfg.venues = {venue("A"), venue("B"), venue("C")};
  oms::Router router(cfg);
  const std::set<std::string> allowed = {"A", "B", "C"};
  const std::vector<std::string> universe = {"A", "B", "C", "X", "Y"};

  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> px(99.0, 101.0);
  std::uniform_int_distribution<oms::domain::Quantity> qty(0, 2000);

  for (int trial = 0; trial < 200; ++trial) {
    QuoteSnapshot quotes;
    for (const auto& v : universe) {
      quotes[v] = oneLevelBook(px(rng) - 0.5, qty(rng), px(rng), qty(rng));
    }
    const auto side =
        trial % 2 == 0 ? oms::domain::Side::Buy : oms::domain::Side::Sell;
    const auto plan = router.route(order(side, 1 + qty(rng)), quotes);

    oms::domain::Quantity sum = 0;
    for (const auto& r : plan.routes) {
      EXPECT_EQ(allowed.count(r.venue), 1u) << r.venue;
      EXPECT_GT(r.quantity, 0);
      sum += r.quantity;
    }
    EXPECT_EQ(sum, plan.routed_quantity);
    EXPECT_LE(plan.routed_quantity, plan.requested_quantity);
  }
}

// =============================================================================
// Options
// =============================================================================

TEST(RouterTest, DarkPoolsNeedToBeEnabled) {
  oms::config::RouterConfig cfg;
  cfg.venues = {venue("LIT", 1), venue("DARK", 1, true)};
  QuoteSnapshot quotes;
  quotes["LIT"] = oneLevelBook(0, 0, 150.02, 1000);
  quotes["DARK"] = oneLevelBook(0, 0, 150.00, 1000);

  oms::Router lit_only(cfg);
  EXPECT_EQ(lit_only.eligibleVenues(), std::vector<std::string>{"LIT"});
  EXPECT_EQ(lit_only.route(order(oms::domain::Side::Buy, 100), quotes)
                .primary_venue,
            "LIT");

  cfg.enable_dark_pools = true;
  oms::Router with_dark(cfg);
  EXPECT_EQ(with_dark.route(order(oms::domain::Side::Buy, 100), quotes)
                .primary_venue,
            "DARK");
}

TEST(RouterTest, DarkPoolStrategyPrefersDarkVenues) {
  oms::config::RouterConfig cfg;
  cfg.routing_strategy = oms::config::RoutingStrategy::DarkPool;
  cfg.venues = {venue("LIT", 1), venue("DARK", 1, true)};
  oms::Router router(cfg);

  QuoteSnapshot quotes;
  quotes["LIT"] = oneLevelBook(0, 0, 150.00, 1000);
  quotes["DARK"] = oneLevelBook(0, 0, 150.05, 1000);
  EXPECT_EQ(router.route(order(oms::domain::Side::Buy, 100), quotes)
                .primary_venue,
            "DARK");
}

TEST(RouterTest, LatencyCeilingFiltersVenues) {
  oms::config::RouterConfig cfg;
  cfg.venues = {venue("NEAR", 2), venue("FAR", 50)};
  cfg.max_venue_latency_ms = 10;
  oms::Router router(cfg);
  EXPECT_EQ(router.eligibleVenues(), std::vector<std::string>{"NEAR"});
}

TEST(RouterTest, FastestRanksByLatencyFirst) {
  oms::config::RouterConfig cfg;
  cfg.routing_strategy = oms::config::RoutingStrategy::Fastest;
  cfg.venues = {venue("CHEAP", 20), venue("QUICK", 1)};
  oms::Router router(cfg);

  QuoteSnapshot quotes;
  quotes["CHEAP"] = oneLevelBook(0, 0, 150.00, 1000);
  quotes["QUICK"] = oneLevelBook(0, 0, 150.10, 1000);
  EXPECT_EQ(router.route(order(oms::domain::Side::Buy, 100), quotes)
                .primary_venue,
            "QUICK");
}

TEST(RouterTest, LowestCostAddsFees) {
  oms::config::RouterConfig cfg;
  cfg.routing_strategy = oms::config::RoutingStrategy::LowestCost;
  cfg.venues = {venue("PRICEY", 1, false, 0.05), venue("FREE", 1, false, 0.0)};
  oms::Router router(cfg);

  QuoteSnapshot quotes;
  quotes["PRICEY"] = oneLevelBook(0, 0, 150.00, 1000);
  quotes["FREE"] = oneLevelBook(0, 0, 150.02, 1000);
  EXPECT_EQ(router.route(order(oms::domain::Side::Buy, 100), quotes)
                .primary_venue,
            "FREE");
}

TEST(RouterTest, AggressivenessLimitsDepthPerLevel) {
  auto cfg = twoVenues();
  cfg.aggressiveness = 0.5;
  oms::Router router(cfg);

  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(0, 0, 150.00, 1000);
  quotes["B"] = oneLevelBook(0, 0, 150.01, 1000);

  const auto plan = router.route(order(oms::domain::Side::Buy, 800), quotes);
  ASSERT_EQ(plan.routes.size(), 2u);
  EXPECT_EQ(plan.routes[0].quantity, 500);
  EXPECT_EQ(plan.routes[1].quantity, 300);
}

TEST(RouterTest, ExcludedVenuesAreSkipped) {
  oms::Router router(twoVenues());
  QuoteSnapshot quotes;
  quotes["A"] = oneLevelBook(0, 0, 150.00, 1000);
  quotes["B"] = oneLevelBook(0, 0, 150.01, 1000);

  const auto plan =
      router.route(order(oms::domain::Side::Buy, 1000), 300, quotes, {"A"});
  ASSERT_EQ(plan.routes.size(), 1u);
  EXPECT_EQ(plan.primary_venue, "B");
  EXPECT_EQ(plan.requested_quantity, 300);
  EXPECT_EQ(router.eligibleVenues({"A"}), std::vector<std::string>{"B"});
}
