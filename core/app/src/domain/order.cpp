#include "oms/domain/order.hpp"

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// referencePrice
// -----------------------------------------------------------------------------
Price referencePrice(const Order& order) {
  if (order.limit_price.has_value()) {
    return *order.limit_price;
  }
  if (order.price > 0.0) {
    return order.price;
  }
  if (order.stop_price.has_value()) {
    return *order.stop_price;
  }
  return 0.0;
}

// -----------------------------------------------------------------------------
// toString helpers
// -----------------------------------------------------------------------------
const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market:    return "MARKET";
    case OrderType::Limit:     return "LIMIT";
    case OrderType::Stop:      return "STOP";
    case OrderType::StopLimit: return "STOP_LIMIT";
  }
  return "UNKNOWN";
}

const char* toString(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::Day: return "DAY";
    case TimeInForce::Gtc: return "GTC";
    case TimeInForce::Ioc: return "IOC";
    case TimeInForce::Fok: return "FOK";
    case TimeInForce::Gtd: return "GTD";
  }
  return "UNKNOWN";
}

const char* toString(AlgorithmType type) {
  switch (type) {
    case AlgorithmType::None:    return "NONE";
    case AlgorithmType::Twap:    return "TWAP";
    case AlgorithmType::Vwap:    return "VWAP";
    case AlgorithmType::Pov:     return "POV";
    case AlgorithmType::Iceberg: return "ICEBERG";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace oms
