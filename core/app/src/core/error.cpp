#include "oms/core/error.hpp"

#include <sstream>
#include <utility>

namespace oms {

namespace {

std::string describeRejection(domain::OrderId order_id,
                              const domain::ComplianceResult& result) {
  std::ostringstream out;
  out << "order " << order_id << " rejected by compliance:";
  for (const auto& check : result.blockingChecks()) {
    out << " " << check.name;
    if (!check.message.empty()) {
      out << " (" << check.message << ")";
    }
  }
  return out.str();
}

}  // namespace

ComplianceRejection::ComplianceRejection(domain::OrderId order_id,
                                         domain::ComplianceResult result)
    : OmsError(describeRejection(order_id, result)),
      order_id_(order_id),
      result_(std::move(result)) {}

UnknownOrder::UnknownOrder(domain::OrderId order_id)
    : OmsError("unknown order " + std::to_string(order_id)),
      order_id_(order_id) {}

TerminalOrder::TerminalOrder(domain::OrderId order_id,
                             domain::OrderStatus status)
    : OmsError("order " + std::to_string(order_id) + " is terminal (" +
               domain::toString(status) + ")"),
      order_id_(order_id),
      status_(status) {}

VenueFailure::VenueFailure(domain::Venue venue, const std::string& message,
                           bool timed_out)
    : OmsError("venue " + venue + ": " + message),
      venue_(std::move(venue)),
      timed_out_(timed_out) {}

InvalidTransition::InvalidTransition(domain::OrderId order_id,
                                     domain::OrderStatus from,
                                     domain::OrderStatus to)
    : OmsError("order " + std::to_string(order_id) +
               ": invalid transition " + domain::toString(from) + " -> " +
               domain::toString(to)),
      order_id_(order_id),
      from_(from),
      to_(to) {}

// -----------------------------------------------------------------------------
// errorCode(): most-derived type first
// -----------------------------------------------------------------------------
const char* errorCode(const OmsError& error) {
  if (dynamic_cast<const ValidationError*>(&error)) {
    return "VALIDATION_ERROR";
  }
  if (dynamic_cast<const ComplianceRejection*>(&error)) {
    return "COMPLIANCE_REJECTION";
  }
  if (dynamic_cast<const UnknownOrder*>(&error)) {
    return "UNKNOWN_ORDER";
  }
  if (dynamic_cast<const TerminalOrder*>(&error)) {
    return "TERMINAL_ORDER";
  }
  if (dynamic_cast<const VenueFailure*>(&error)) {
    return "VENUE_FAILURE";
  }
  if (dynamic_cast<const InvalidTransition*>(&error)) {
    return "INVALID_TRANSITION";
  }
  if (dynamic_cast<const ConfigError*>(&error)) {
    return "CONFIG_ERROR";
  }
  return "OMS_ERROR";
}

}  // namespace oms
