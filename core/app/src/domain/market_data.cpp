#include "oms/domain/market_data.hpp"

namespace oms {
namespace domain {

Price midPrice(const OrderBookSnapshot& book) {
  const bool has_bid = !book.bids.empty();
  const bool has_ask = !book.asks.empty();
  if (has_bid && has_ask) {
    return (book.bids.front().price + book.asks.front().price) / 2.0;
  }
  if (has_bid) {
    return book.bids.front().price;
  }
  if (has_ask) {
    return book.asks.front().price;
  }
  return 0.0;
}

}  // namespace domain
}  // namespace oms
