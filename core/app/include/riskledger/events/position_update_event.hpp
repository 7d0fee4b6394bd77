#pragma once

#include "riskledger/domain/account_snapshot.hpp"
#include "riskledger/domain/position.hpp"

#include <cstdint>

namespace riskledger {

// Position and account state right after a fill was applied. Both come from
// the same ledger snapshot, so they are mutually consistent.
struct PositionUpdateEvent {
  domain::Position position;
  domain::AccountSnapshot account;
  std::int64_t timestamp_ms{0};
};

}  // namespace riskledger
