#pragma once

#include "riskledger/time/i_time_provider.hpp"

namespace riskledger {

// Wall-clock ITimeProvider. main() reads it once to start the simulated clock
// on the current trading day.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskledger
