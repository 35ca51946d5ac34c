#include "oms/compliance/rule_based_compliance_gate.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

namespace oms {

RuleBasedComplianceGate::RuleBasedComplianceGate(
    config::ComplianceLimits limits)
    : limits_(std::move(limits)) {}

// -----------------------------------------------------------------------------
// check(): evaluate every rule, report all of them
// -----------------------------------------------------------------------------
domain::ComplianceResult RuleBasedComplianceGate::check(
    const domain::Order& order) {
  using domain::Severity;

  domain::ComplianceResult result;

  // --- Kill switch ----------------------------------------------------------
  {
    domain::ComplianceCheck c{"TRADING_HALTED", Severity::Error, true,
                              "trading active"};
    if (halted_.load()) {
      std::lock_guard lock(reason_mutex_);
      c.passed = false;
      c.message = "trading halted: " + halt_reason_;
    }
    result.checks.push_back(std::move(c));
  }

  // --- Quantity ------------------------------------------------------------
  {
    std::ostringstream msg;
    msg << "quantity " << order.quantity << " (limit "
        << limits_.max_order_quantity << ")";
    result.checks.push_back(domain::ComplianceCheck{
        "MAX_ORDER_QUANTITY", Severity::Error,
        order.quantity <= limits_.max_order_quantity, msg.str()});
  }

  // --- Notional ------------------------------------------------------------
  {
    const double notional =
        static_cast<double>(order.quantity) * domain::referencePrice(order);
    std::ostringstream msg;
    msg << "notional " << notional << " (limit " << limits_.max_order_notional
        << ")";
    result.checks.push_back(domain::ComplianceCheck{
        "MAX_ORDER_NOTIONAL", Severity::Error,
        notional <= limits_.max_order_notional, msg.str()});
  }

  // --- Restricted list -----------------------------------------------------
  {
    const bool restricted =
        std::find(limits_.restricted_symbols.begin(),
                  limits_.restricted_symbols.end(),
                  order.symbol) != limits_.restricted_symbols.end();
    result.checks.push_back(domain::ComplianceCheck{
        "RESTRICTED_SECURITY", Severity::Error, !restricted,
        restricted ? order.symbol + " is restricted"
                   : order.symbol + " not restricted"});
  }

  // --- Large order (non-blocking) -------------------------------------------
  {
    const bool large = limits_.large_order_warning_quantity > 0 &&
                       order.quantity >= limits_.large_order_warning_quantity;
    std::ostringstream msg;
    msg << "quantity " << order.quantity << " (warning at "
        << limits_.large_order_warning_quantity << ")";
    result.checks.push_back(domain::ComplianceCheck{
        "LARGE_ORDER", Severity::Warning, !large, msg.str()});
  }

  result.passed = !result.blocking();
  if (!result.passed) {
    std::cerr << "[ComplianceGate] order " << order.order_id << " "
              << order.symbol << " blocked by "
              << result.blockingChecks().size() << " check(s)\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void RuleBasedComplianceGate::halt(const std::string& reason) {
  {
    std::lock_guard lock(reason_mutex_);
    halt_reason_ = reason;
  }
  halted_.store(true);
  std::cerr << "[ComplianceGate] CRITICAL: " << reason
            << ". ALL NEW ORDERS BLOCKED.\n";
}

void RuleBasedComplianceGate::resumeTrading() {
  halted_.store(false);
  std::cout << "[ComplianceGate] trading resumed.\n";
}

bool RuleBasedComplianceGate::isHalted() const { return halted_.load(); }

}  // namespace oms
