#pragma once

#include <cstdint>

#include "internal/model/ledger.hpp"

namespace timebank::model {

/*
  Materialized projection of one ledger. Rebuildable from the ledger at
  any time; version increments on every write.
*/
struct BalanceSnapshot {
  BalanceKey      key;
  BalanceTotals   totals;
  uint64_t        version = 0;
  util::TimePoint updated_at{};

  int64_t Available() const {
    return totals.Available();
  }
};

} // namespace timebank::model
