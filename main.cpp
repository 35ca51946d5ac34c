// -----------------------------------------------------------------------------
// oms_gateway: single executable entry point.
//
//   1) Load the EngineConfig (optional JSON path in argv[1]).
//   2) Build the simulated market: a SimulatedMarket serving quotes and
//      market volume, seeded with a small static book per configured venue,
//      and a SimulatedVenueEndpoint executing against it.
//   3) Create the OrderManagementEngine over those ports and an in-memory
//      order store, subscribe a lifecycle logger and start it with the IPC
//      server (REP commands, PUB telemetry).
//   4) Run the MarketDataFeed recv loop on its own thread so live books and
//      prints replace the seeded ones.
//   5) Expire due DAY/GTD orders once a second until Ctrl-C.
//   6) Shut down cleanly.
//
// Thread layout:
//   main thread          -> expiry loop, waits for SIGINT
//   market_data thread   -> MarketDataFeed::run() (ZMQ SUB recv loop)
//   engine threads       -> routing thread, dispatcher pool, scheduler
//                           timers, IPC server (see OrderManagementEngine)
// -----------------------------------------------------------------------------

#include "oms/config/engine_config.hpp"
#include "oms/core/error.hpp"
#include "oms/engine/order_management_engine.hpp"
#include "oms/events/event_types.hpp"
#include "oms/gateway/market_data_feed.hpp"
#include "oms/ledger/in_memory_order_store.hpp"
#include "oms/sim/simulated_market.hpp"
#include "oms/sim/simulated_venue_endpoint.hpp"
#include "oms/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

// Set by the SIGINT handler, polled by the main loop.
std::atomic<bool> g_stop_requested{false};

void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

struct SeedSymbol {
  const char* symbol;
  double mid;
};

constexpr SeedSymbol kSeedSymbols[] = {
    {"AAPL", 150.00}, {"MSFT", 310.00}, {"GOOGL", 135.00}};

// Venues used when the configuration names none.
std::vector<oms::config::VenueProfile> defaultVenues() {
  return {{"ARCA", 2, false, 0.0030},
          {"BATS", 3, false, 0.0025},
          {"IEX", 5, false, 0.0009}};
}

// -----------------------------------------------------------------------------
// seedBooks
// -----------------------------------------------------------------------------
// Five levels a side around each seed mid. Later venues in the list quote a
// cent wider and a little thinner so routing has something to rank.
// -----------------------------------------------------------------------------
void seedBooks(oms::SimulatedMarket& market,
               const std::vector<oms::config::VenueProfile>& venues) {
  for (std::size_t v = 0; v < venues.size(); ++v) {
    const double widen = 0.01 * static_cast<double>(v);
    const oms::domain::Quantity base =
        1000 - 100 * static_cast<oms::domain::Quantity>(v % 5);

    for (const auto& seed : kSeedSymbols) {
      oms::domain::OrderBookSnapshot book;
      for (int level = 0; level < 5; ++level) {
        const double step = 0.01 * level;
        const oms::domain::Quantity depth = base + 200 * level;
        book.bids.push_back({seed.mid - 0.01 - widen - step, depth});
        book.asks.push_back({seed.mid + 0.01 + widen + step, depth});
      }
      market.setBook(venues[v].name, seed.symbol, std::move(book));
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  oms::config::EngineConfig config;
  if (argc > 1) {
    try {
      config = oms::config::loadEngineConfig(argv[1]);
    } catch (const oms::ConfigError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] configuration loaded from " << argv[1] << "\n";
  }
  if (config.router.venues.empty()) {
    config.router.venues = defaultVenues();
    std::cout << "[main] no venues configured, using ARCA/BATS/IEX\n";
  }

  // -------------------------------------------------------------------------
  // 2) Simulated market and venues.
  // -------------------------------------------------------------------------
  oms::LiveTimeProvider clock;
  oms::SimulatedMarket market(clock);
  seedBooks(market, config.router.venues);
  oms::SimulatedVenueEndpoint endpoint(market, clock);
  oms::InMemoryOrderStore store;

  // -------------------------------------------------------------------------
  // 3) Engine.
  // Subscribers run on whichever thread publishes (routing thread,
  // dispatcher pool, scheduler timers), so they only log.
  // -------------------------------------------------------------------------
  oms::EnginePorts ports{market, market, endpoint, nullptr, &store};
  oms::OrderManagementEngine engine(config, clock, ports);

  engine.eventBus().subscribe<oms::OrderUpdateEvent>(
      [](const oms::OrderUpdateEvent& e) {
        std::cout << "[OrderUpdate] order_id=" << e.order.order_id << " "
                  << oms::domain::toString(e.previous_status) << " -> "
                  << oms::domain::toString(e.order.status)
                  << " filled=" << e.order.filled_quantity << "/"
                  << e.order.quantity;
        if (!e.reason.empty()) {
          std::cout << " (" << e.reason << ")";
        }
        std::cout << "\n";
      });

  engine.eventBus().subscribe<oms::ExecutionReportEvent>(
      [](const oms::ExecutionReportEvent& e) {
        std::cout << "[ExecutionReport] order_id=" << e.report.order_id
                  << " exec_id=" << e.report.execution_id
                  << " venue=" << e.report.venue
                  << " qty=" << e.report.quantity
                  << " price=" << e.report.price << "\n";
      });

  engine.eventBus().subscribe<oms::VenueFailureEvent>(
      [](const oms::VenueFailureEvent& e) {
        std::cerr << "[VenueFailure] WARNING: order_id=" << e.order_id
                  << " venue=" << e.venue << " qty=" << e.quantity
                  << (e.timed_out ? " (timeout)" : "") << ": " << e.error
                  << "\n";
      });

  engine.start(/*enable_ipc=*/true);

  // -------------------------------------------------------------------------
  // 4) Market data feed.
  // -------------------------------------------------------------------------
  std::unique_ptr<oms::MarketDataFeed> feed;
  std::thread feed_thread;
  if (!config.ipc.market_data_endpoint.empty()) {
    feed = std::make_unique<oms::MarketDataFeed>(
        market, config.ipc.market_data_endpoint);
    feed_thread = std::thread([&feed] { feed->run(); });
  }

  // -------------------------------------------------------------------------
  // 5) Expiry loop until Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] oms_gateway running. CMD=" << config.ipc.cmd_endpoint
            << " PUB=" << config.ipc.pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  auto next_expiry = std::chrono::steady_clock::now();
  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (std::chrono::steady_clock::now() < next_expiry) {
      continue;
    }
    next_expiry += std::chrono::seconds(1);
    const auto expired = engine.expireOrders();
    if (!expired.empty()) {
      std::cout << "[main] expired " << expired.size() << " order(s)\n";
    }
  }

  // -------------------------------------------------------------------------
  // 6) Clean shutdown: feed first, then the engine.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  if (feed) {
    feed->stop();
    feed_thread.join();
  }
  engine.stop();

  return 0;
}
