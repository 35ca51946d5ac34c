#include "oms/sim/simulated_market.hpp"

#include <algorithm>
#include <cstddef>

namespace oms {

namespace {

constexpr int kDefaultProfileBuckets = 78;  // 5-minute buckets, 6.5h session

// Weight of bucket `i` of `n` on a U-shaped session curve.
double uShapeWeight(int i, int n) {
  const double x = (static_cast<double>(i) + 0.5) / static_cast<double>(n);
  return 1.0 + 8.0 * (x - 0.5) * (x - 0.5);
}

// Resamples `curve` to `buckets` entries by nearest source bucket.
std::vector<double> resample(const std::vector<double>& curve, int buckets) {
  std::vector<double> out;
  out.reserve(static_cast<std::size_t>(buckets));
  for (int i = 0; i < buckets; ++i) {
    const double pos = (static_cast<double>(i) + 0.5) *
                       static_cast<double>(curve.size()) /
                       static_cast<double>(buckets);
    auto src = static_cast<std::size_t>(pos);
    if (src >= curve.size()) {
      src = curve.size() - 1;
    }
    out.push_back(curve[src]);
  }
  return out;
}

}  // namespace

SimulatedMarket::SimulatedMarket(const ITimeProvider& clock) : clock_(clock) {}

void SimulatedMarket::setBook(const domain::Venue& venue,
                              const std::string& symbol,
                              domain::OrderBookSnapshot book) {
  std::lock_guard lock(mutex_);
  books_[{venue, symbol}] = std::move(book);
}

void SimulatedMarket::setVolumeProfile(const std::string& symbol,
                                       std::vector<double> curve) {
  std::lock_guard lock(mutex_);
  profiles_[symbol] = std::move(curve);
}

void SimulatedMarket::recordTrade(const std::string& symbol,
                                  domain::Quantity quantity,
                                  domain::Price price) {
  recordTrade(symbol, quantity, price, clock_.now_ms());
}

void SimulatedMarket::recordTrade(const std::string& symbol,
                                  domain::Quantity quantity,
                                  domain::Price price,
                                  std::int64_t timestamp_ms) {
  std::lock_guard lock(mutex_);
  recordLocked(symbol, quantity, price, timestamp_ms);
}

void SimulatedMarket::recordLocked(const std::string& symbol,
                                   domain::Quantity quantity,
                                   domain::Price price,
                                   std::int64_t timestamp_ms) {
  if (quantity <= 0) {
    return;
  }
  prints_[symbol].push_back(Print{timestamp_ms, quantity, price});
}

// -----------------------------------------------------------------------------
// take(): consume displayed liquidity up to quantity and limit
// -----------------------------------------------------------------------------
TakeResult SimulatedMarket::take(const domain::Venue& venue,
                                 const std::string& symbol, domain::Side side,
                                 domain::Quantity quantity,
                                 std::optional<domain::Price> limit_price) {
  std::lock_guard lock(mutex_);
  TakeResult result;

  auto it = books_.find({venue, symbol});
  if (it == books_.end() || quantity <= 0) {
    return result;
  }

  auto& levels =
      side == domain::Side::Buy ? it->second.asks : it->second.bids;
  const std::int64_t now = clock_.now_ms();
  double notional = 0.0;

  auto level = levels.begin();
  while (level != levels.end() && result.filled < quantity) {
    if (limit_price.has_value()) {
      const bool through = side == domain::Side::Buy
                               ? level->price > *limit_price
                               : level->price < *limit_price;
      if (through) {
        break;
      }
    }
    const domain::Quantity qty =
        std::min(level->quantity, quantity - result.filled);
    result.filled += qty;
    notional += static_cast<double>(qty) * level->price;
    recordLocked(symbol, qty, level->price, now);

    level->quantity -= qty;
    if (level->quantity == 0) {
      level = levels.erase(level);
    } else {
      ++level;
    }
  }

  if (result.filled > 0) {
    result.average_price = notional / static_cast<double>(result.filled);
  }
  return result;
}

// -----------------------------------------------------------------------------
// IQuoteSource
// -----------------------------------------------------------------------------
domain::QuoteSnapshot SimulatedMarket::quotes(
    const std::string& symbol, const std::vector<domain::Venue>& venues) {
  std::lock_guard lock(mutex_);
  domain::QuoteSnapshot out;
  for (const auto& venue : venues) {
    auto it = books_.find({venue, symbol});
    if (it != books_.end()) {
      out.emplace(venue, it->second);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// IMarketVolumeSource
// -----------------------------------------------------------------------------
std::vector<double> SimulatedMarket::historicalVolumeProfile(
    const std::string& symbol, int buckets) {
  if (buckets <= 0) {
    return {};
  }
  std::lock_guard lock(mutex_);
  auto it = profiles_.find(symbol);
  if (it != profiles_.end() && !it->second.empty()) {
    return resample(it->second, buckets);
  }

  std::vector<double> session;
  session.reserve(kDefaultProfileBuckets);
  for (int i = 0; i < kDefaultProfileBuckets; ++i) {
    session.push_back(uShapeWeight(i, kDefaultProfileBuckets));
  }
  return resample(session, buckets);
}

domain::Quantity SimulatedMarket::marketVolume(const std::string& symbol,
                                               std::int64_t from_ms,
                                               std::int64_t to_ms) {
  std::lock_guard lock(mutex_);
  domain::Quantity total = 0;
  auto it = prints_.find(symbol);
  if (it == prints_.end()) {
    return total;
  }
  for (const auto& print : it->second) {
    if (print.timestamp_ms >= from_ms && print.timestamp_ms <= to_ms) {
      total += print.quantity;
    }
  }
  return total;
}

domain::Price SimulatedMarket::marketVwap(const std::string& symbol,
                                          std::int64_t from_ms,
                                          std::int64_t to_ms) {
  std::lock_guard lock(mutex_);
  auto it = prints_.find(symbol);
  if (it == prints_.end()) {
    return 0.0;
  }
  double notional = 0.0;
  domain::Quantity volume = 0;
  for (const auto& print : it->second) {
    if (print.timestamp_ms >= from_ms && print.timestamp_ms <= to_ms) {
      notional += static_cast<double>(print.quantity) * print.price;
      volume += print.quantity;
    }
  }
  return volume > 0 ? notional / static_cast<double>(volume) : 0.0;
}

}  // namespace oms
