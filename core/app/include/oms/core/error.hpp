#pragma once

#include "oms/domain/compliance.hpp"
#include "oms/domain/market_data.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_status.hpp"

#include <stdexcept>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// OmsError hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Exception taxonomy for the order lifecycle core.
//
// @details
//   ValidationError      malformed request, caller's fault, never retried.
//   ComplianceRejection  blocking compliance failure; the order ends REJECTED.
//   UnknownOrder         operation on an order id the ledger does not hold.
//   TerminalOrder        operation on a FILLED/CANCELED/REJECTED/EXPIRED order.
//   VenueFailure         transient venue error or timeout. Contained by the
//                        ExecutionDispatcher; never reaches the submitter.
//   InvalidTransition    event not legal for the order's current status. The
//                        ledger is left untouched.
//   ConfigError          unreadable or unknown configuration.
//
// Every class derives from OmsError (itself a std::runtime_error) so request
// handling code can catch the whole family in one place.
// -----------------------------------------------------------------------------
class OmsError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public OmsError {
 public:
  using OmsError::OmsError;
};

class ComplianceRejection : public OmsError {
 public:
  ComplianceRejection(domain::OrderId order_id,
                      domain::ComplianceResult result);

  domain::OrderId orderId() const { return order_id_; }
  const domain::ComplianceResult& result() const { return result_; }

 private:
  domain::OrderId order_id_;
  domain::ComplianceResult result_;
};

class UnknownOrder : public OmsError {
 public:
  explicit UnknownOrder(domain::OrderId order_id);

  domain::OrderId orderId() const { return order_id_; }

 private:
  domain::OrderId order_id_;
};

class TerminalOrder : public OmsError {
 public:
  TerminalOrder(domain::OrderId order_id, domain::OrderStatus status);

  domain::OrderId orderId() const { return order_id_; }
  domain::OrderStatus status() const { return status_; }

 private:
  domain::OrderId order_id_;
  domain::OrderStatus status_;
};

class VenueFailure : public OmsError {
 public:
  VenueFailure(domain::Venue venue, const std::string& message,
               bool timed_out = false);

  const domain::Venue& venue() const { return venue_; }
  bool timedOut() const { return timed_out_; }

 private:
  domain::Venue venue_;
  bool timed_out_;
};

class InvalidTransition : public OmsError {
 public:
  InvalidTransition(domain::OrderId order_id, domain::OrderStatus from,
                    domain::OrderStatus to);

  domain::OrderId orderId() const { return order_id_; }
  domain::OrderStatus from() const { return from_; }
  domain::OrderStatus to() const { return to_; }

 private:
  domain::OrderId order_id_;
  domain::OrderStatus from_;
  domain::OrderStatus to_;
};

class ConfigError : public OmsError {
 public:
  using OmsError::OmsError;
};

// Short machine-readable tag ("VALIDATION_ERROR", "UNKNOWN_ORDER", ...) used
// by the command gateway when it reports an error back to a client.
const char* errorCode(const OmsError& error);

}  // namespace oms
