#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "internal/util/time.hpp"

namespace timebank::model {

enum class EntryType : std::uint8_t {
  kAccrual,
  kHold,
  kHoldRelease,
  kUsage,
  kAdjustment,
  kExpiration,
  kCarryover,
};

enum class SourceType : std::uint8_t {
  kRequest,
  kPayroll,
  kAdmin,
  kSystem,
};

std::string_view          ToString(EntryType type);
std::string_view          ToString(SourceType type);
std::optional<EntryType>  ParseEntryType(std::string_view text);
std::optional<SourceType> ParseSourceType(std::string_view text);

using Metadata = std::map<std::string, std::string>;

struct BalanceKey {
  std::string company_id;
  std::string employee_id;
  std::string policy_id;

  std::string ToString() const {
    return company_id + "/" + employee_id + "/" + policy_id;
  }

  bool operator==(const BalanceKey&) const = default;
  bool operator<(const BalanceKey& other) const {
    return std::tie(company_id, employee_id, policy_id) < std::tie(other.company_id, other.employee_id, other.policy_id);
  }
};

/*
  Unique across the whole ledger. Reposting under the same key is a
  no-op.
*/
struct IdempotencyKey {
  SourceType  source_type = SourceType::kSystem;
  std::string source_id;
  EntryType   entry_type = EntryType::kAccrual;

  std::string ToString() const {
    return std::string(model::ToString(source_type)) + ":" + source_id + ":" + std::string(model::ToString(entry_type));
  }

  bool operator<(const IdempotencyKey& other) const {
    return std::tie(source_type, source_id, entry_type) < std::tie(other.source_type, other.source_id, other.entry_type);
  }
};

/*
  Append-only. Positive amounts credit the balance, negative debit it.
*/
struct LedgerEntry {
  std::string     id;
  std::string     company_id;
  std::string     employee_id;
  std::string     policy_id;
  std::string     policy_version_id;
  EntryType       entry_type     = EntryType::kAccrual;
  int64_t         amount_minutes = 0;
  util::TimePoint effective_at{};
  SourceType      source_type = SourceType::kSystem;
  std::string     source_id;
  Metadata        metadata;
  util::TimePoint created_at{};

  BalanceKey Key() const {
    return {company_id, employee_id, policy_id};
  }

  IdempotencyKey Idempotency() const {
    return {source_type, source_id, entry_type};
  }
};

// Half-open [from, to) on effective_at; unset bounds are open.
struct LedgerRange {
  std::optional<util::TimePoint> from;
  std::optional<util::TimePoint> to;

  bool Contains(util::TimePoint t) const {
    return (!from || *from <= t) && (!to || t < *to);
  }
};

/*
  Running totals of one ledger.

    accrued = sum(accrual, adjustment, carryover, expiration)
    used    = -sum(usage)
    held    = -sum(hold, hold_release)

  so accrued - used - held always equals the ledger sum.
*/
struct BalanceTotals {
  int64_t accrued_minutes = 0;
  int64_t used_minutes    = 0;
  int64_t held_minutes    = 0;

  void Apply(EntryType type, int64_t amount_minutes);

  void Apply(const LedgerEntry& entry) {
    Apply(entry.entry_type, entry.amount_minutes);
  }

  int64_t Available() const {
    return accrued_minutes - used_minutes - held_minutes;
  }

  static BalanceTotals Fold(const std::vector<LedgerEntry>& entries);

  bool operator==(const BalanceTotals&) const = default;
};

} // namespace timebank::model
