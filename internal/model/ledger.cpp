#include "ledger.hpp"

#include <array>
#include <utility>

namespace timebank::model {

namespace {

constexpr std::array<std::pair<EntryType, std::string_view>, 7> kEntryTypes = {{
    {EntryType::kAccrual, "ACCRUAL"},
    {EntryType::kHold, "HOLD"},
    {EntryType::kHoldRelease, "HOLD_RELEASE"},
    {EntryType::kUsage, "USAGE"},
    {EntryType::kAdjustment, "ADJUSTMENT"},
    {EntryType::kExpiration, "EXPIRATION"},
    {EntryType::kCarryover, "CARRYOVER"},
}};

constexpr std::array<std::pair<SourceType, std::string_view>, 4> kSourceTypes = {{
    {SourceType::kRequest, "REQUEST"},
    {SourceType::kPayroll, "PAYROLL"},
    {SourceType::kAdmin, "ADMIN"},
    {SourceType::kSystem, "SYSTEM"},
}};

} // namespace

std::string_view ToString(EntryType type) {
  for (const auto& [value, name] : kEntryTypes) {
    if (value == type) return name;
  }
  return "UNKNOWN";
}

std::string_view ToString(SourceType type) {
  for (const auto& [value, name] : kSourceTypes) {
    if (value == type) return name;
  }
  return "UNKNOWN";
}

std::optional<EntryType> ParseEntryType(std::string_view text) {
  for (const auto& [value, name] : kEntryTypes) {
    if (name == text) return value;
  }
  return std::nullopt;
}

std::optional<SourceType> ParseSourceType(std::string_view text) {
  for (const auto& [value, name] : kSourceTypes) {
    if (name == text) return value;
  }
  return std::nullopt;
}

void BalanceTotals::Apply(EntryType type, int64_t amount_minutes) {
  switch (type) {
    case EntryType::kAccrual:
    case EntryType::kAdjustment:
    case EntryType::kCarryover:
    case EntryType::kExpiration:
      accrued_minutes += amount_minutes;
      break;
    case EntryType::kUsage:
      used_minutes -= amount_minutes;
      break;
    case EntryType::kHold:
    case EntryType::kHoldRelease:
      held_minutes -= amount_minutes;
      break;
  }
}

BalanceTotals BalanceTotals::Fold(const std::vector<LedgerEntry>& entries) {
  BalanceTotals totals;
  for (const auto& entry : entries) {
    totals.Apply(entry);
  }
  return totals;
}

} // namespace timebank::model
