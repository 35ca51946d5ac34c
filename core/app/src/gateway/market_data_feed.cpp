#include "oms/gateway/market_data_feed.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

namespace oms {

namespace {

using json = nlohmann::json;

std::vector<domain::PriceLevel> parseLevels(const json& side) {
  std::vector<domain::PriceLevel> levels;
  for (const auto& level : side) {
    domain::PriceLevel pl;
    pl.price = level.at(0).get<domain::Price>();
    pl.quantity = level.at(1).get<domain::Quantity>();
    if (pl.price <= 0.0 || pl.quantity <= 0) {
      continue;
    }
    levels.push_back(pl);
  }
  return levels;
}

}  // namespace

MarketDataFeed::MarketDataFeed(SimulatedMarket& market,
                               const std::string& endpoint)
    : market_(market) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);

  std::cout << "[MarketDataFeed] connected to " << endpoint << "\n";
}

void MarketDataFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }

    if (apply(market_, msg.to_string())) {
      applied_.fetch_add(1);
    }
  }
}

void MarketDataFeed::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// apply(): decode a book or trade message into the simulated market
// -----------------------------------------------------------------------------
bool MarketDataFeed::apply(SimulatedMarket& market, const std::string& payload) {
  try {
    const auto msg = json::parse(payload);
    const std::string type = msg.at("type").get<std::string>();

    if (type == "book") {
      domain::OrderBookSnapshot book;
      book.bids = parseLevels(msg.at("bids"));
      book.asks = parseLevels(msg.at("asks"));
      market.setBook(msg.at("venue").get<std::string>(),
                     msg.at("symbol").get<std::string>(), std::move(book));
      return true;
    }

    if (type == "trade") {
      const auto symbol = msg.at("symbol").get<std::string>();
      const auto price = msg.at("price").get<domain::Price>();
      const auto quantity = msg.at("quantity").get<domain::Quantity>();
      if (price <= 0.0 || quantity <= 0) {
        std::cerr << "[MarketDataFeed] WARNING: non-positive trade ignored: "
                  << payload << "\n";
        return false;
      }
      if (auto it = msg.find("timestamp_ms"); it != msg.end()) {
        market.recordTrade(symbol, quantity, price, it->get<std::int64_t>());
      } else {
        market.recordTrade(symbol, quantity, price);
      }
      return true;
    }

    std::cerr << "[MarketDataFeed] WARNING: unknown message type '" << type
              << "'\n";
  } catch (const json::exception& e) {
    std::cerr << "[MarketDataFeed] JSON parse error: " << e.what()
              << ": payload: " << payload << "\n";
  }
  return false;
}

}  // namespace oms
