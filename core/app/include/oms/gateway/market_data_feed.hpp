#pragma once

#include "oms/sim/simulated_market.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// MarketDataFeed: ZeroMQ bridge feeding the simulated market
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON market data and applies
//         each message to a SimulatedMarket, which then serves as the
//         engine's quote and market volume source.
//
// @details
// Two message shapes are understood:
//
//   {"type":"book","venue":"ARCA","symbol":"AAPL",
//    "bids":[[150.00,500],[149.99,800]],"asks":[[150.01,400]]}
//       replaces the venue's book for the symbol. Levels are given best
//       first, as [price, quantity] pairs.
//
//   {"type":"trade","symbol":"AAPL","price":150.02,"quantity":300,
//    "timestamp_ms":1700000000000}
//       records a market print. timestamp_ms is optional and defaults to
//       the market clock.
//
// A malformed message is logged and skipped; the loop keeps running.
//
// Thread model:
//   run() blocks on the calling thread until stop() is called from another
//   thread. recv uses a 100 ms timeout so stop() is observed promptly.
//
// Ownership:
//   Owned by main(). Borrows the SimulatedMarket, which must outlive it.
// -----------------------------------------------------------------------------
class MarketDataFeed {
 public:
  MarketDataFeed(SimulatedMarket& market, const std::string& endpoint);
  ~MarketDataFeed() = default;

  MarketDataFeed(const MarketDataFeed&) = delete;
  MarketDataFeed& operator=(const MarketDataFeed&) = delete;
  MarketDataFeed(MarketDataFeed&&) = delete;
  MarketDataFeed& operator=(MarketDataFeed&&) = delete;

  void run();
  void stop();

  std::uint64_t appliedCount() const { return applied_.load(); }

  // Decodes one payload and applies it to `market`. Returns false (after
  // logging) when the payload is not a valid book or trade message.
  static bool apply(SimulatedMarket& market, const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulatedMarket& market_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // Cleared by stop(); a stop() before run() makes run() return at once.
  std::atomic<bool> running_{true};
  std::atomic<std::uint64_t> applied_{0};
};

}  // namespace oms
