#pragma once

#include "oms/config/engine_config.hpp"
#include "oms/ports/i_compliance_gate.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// RuleBasedComplianceGate
// -----------------------------------------------------------------------------
//
// @brief  Default IComplianceGate: static pre-trade limits plus an operator
//         kill switch.
//
// @details
// Every check is reported, passed or not, so the caller can show the full
// picture:
//
//   TRADING_HALTED       ERROR    kill switch engaged via halt().
//   MAX_ORDER_QUANTITY   ERROR    quantity > limits.max_order_quantity.
//   MAX_ORDER_NOTIONAL   ERROR    quantity * referencePrice() above the
//                                 notional limit. Orders with no reference
//                                 price (plain market orders) pass.
//   RESTRICTED_SECURITY  ERROR    symbol on the restricted list.
//   LARGE_ORDER          WARNING  quantity >= large_order_warning_quantity.
//
// Thread model:
//   check() is safe from any thread. halt()/resumeTrading() use an atomic
//   flag, so an operator thread can flip the switch while orders flow.
// -----------------------------------------------------------------------------
class RuleBasedComplianceGate final : public ports::IComplianceGate {
 public:
  explicit RuleBasedComplianceGate(config::ComplianceLimits limits);

  RuleBasedComplianceGate(const RuleBasedComplianceGate&) = delete;
  RuleBasedComplianceGate& operator=(const RuleBasedComplianceGate&) = delete;

  domain::ComplianceResult check(const domain::Order& order) override;

  void halt(const std::string& reason);
  void resumeTrading();
  bool isHalted() const;

 private:
  config::ComplianceLimits limits_;
  std::atomic<bool> halted_{false};
  mutable std::mutex reason_mutex_;
  std::string halt_reason_;
};

}  // namespace oms
