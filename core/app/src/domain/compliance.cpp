#include "oms/domain/compliance.hpp"

#include <algorithm>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// blocking(): any failed Error-severity check blocks the order
// -----------------------------------------------------------------------------
bool ComplianceResult::blocking() const {
  return std::any_of(checks.begin(), checks.end(),
                     [](const ComplianceCheck& c) {
                       return !c.passed && c.severity == Severity::Error;
                     });
}

std::vector<ComplianceCheck> ComplianceResult::blockingChecks() const {
  std::vector<ComplianceCheck> out;
  for (const auto& check : checks) {
    if (!check.passed && check.severity == Severity::Error) {
      out.push_back(check);
    }
  }
  return out;
}

std::vector<ComplianceCheck> ComplianceResult::warnings() const {
  std::vector<ComplianceCheck> out;
  for (const auto& check : checks) {
    if (!check.passed && check.severity == Severity::Warning) {
      out.push_back(check);
    }
  }
  return out;
}

const char* toString(Severity severity) {
  switch (severity) {
    case Severity::Info:    return "INFO";
    case Severity::Warning: return "WARNING";
    case Severity::Error:   return "ERROR";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace oms
