#pragma once

#include "oms/time/i_time_provider.hpp"

namespace oms {

// Wall-clock implementation used by the oms_gateway executable.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace oms
