#pragma once

#include <string>
#include <vector>

namespace oms {
namespace domain {

enum class Severity {
  Info,
  Warning,
  Error,
};

// -----------------------------------------------------------------------------
// ComplianceCheck / ComplianceResult
// -----------------------------------------------------------------------------
//
// @brief  Outcome of the pre-trade compliance gate for one order.
//
// @details
// A check with severity Error that did not pass blocks the order. Warnings
// are recorded and surfaced but never block. The result is a gating input
// only; the core does not persist it.
// -----------------------------------------------------------------------------
struct ComplianceCheck {
  std::string name;
  Severity severity{Severity::Info};
  bool passed{true};
  std::string message;
};

struct ComplianceResult {
  bool passed{true};
  std::vector<ComplianceCheck> checks;

  // True when any Error-severity check failed, regardless of `passed`.
  bool blocking() const;

  std::vector<ComplianceCheck> blockingChecks() const;
  std::vector<ComplianceCheck> warnings() const;
};

const char* toString(Severity severity);

}  // namespace domain
}  // namespace oms
