#include "carryover_service.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/service/retry.hpp"
#include "internal/util/errors.hpp"

namespace timebank::service {

using observability::IntField;
using observability::StringField;

namespace {

model::LedgerEntry SystemEntry(const model::Assignment& assignment, const model::PolicyVersion& version,
                               model::EntryType type, int64_t amount_minutes, const std::string& source_id,
                               const util::Date& date) {
  model::LedgerEntry entry;
  entry.company_id        = assignment.company_id;
  entry.employee_id       = assignment.employee_id;
  entry.policy_id         = assignment.policy_id;
  entry.policy_version_id = version.id;
  entry.entry_type        = type;
  entry.amount_minutes    = amount_minutes;
  entry.effective_at      = util::StartOfDayUtc(date);
  entry.source_type       = model::SourceType::kSystem;
  entry.source_id         = source_id;
  return entry;
}

model::BalanceKey KeyOf(const model::Assignment& assignment) {
  return {assignment.company_id, assignment.employee_id, assignment.policy_id};
}

} // namespace

CarryoverService::CarryoverService(ServiceContext ctx)
    : ctx_(std::move(ctx)),
      projector_(ctx_.repository),
      versions_(ctx_.repository, ctx_.clock),
      audit_(ctx_.repository) {
}

template <typename Fn>
CarryoverRunSummary CarryoverService::RunBatch(const char* operation, const util::Date& active_on,
                                               const std::optional<std::string>& company_id, Fn&& per_item) {
  model::AssignmentFilter filter;
  filter.company_id = company_id;
  filter.active_on  = active_on;

  std::vector<model::Assignment> assignments;
  {
    auto tx     = ctx_.repository->Begin();
    assignments = ctx_.repository->ListAssignments(*tx, filter);
    tx->Commit();
  }

  CarryoverRunSummary summary;
  for (const auto& assignment : assignments) {
    try {
      const ItemResult result = per_item(assignment);
      if (result.carryovers == 0 && result.expirations == 0) {
        ++summary.skipped;
      }
      summary.carryovers += result.carryovers;
      summary.expirations += result.expirations;
    } catch (const util::NoEffectiveVersion&) {
      ++summary.skipped;
    } catch (const util::StoreUnavailable& e) {
      TIMEBANK_LOG_ERROR("batch aborted", {StringField("operation", operation),
                                           StringField("assignment_id", assignment.id),
                                           StringField("error", e.what())});
      throw;
    } catch (const std::exception& e) {
      ++summary.errors;
      TIMEBANK_LOG_ERROR("batch item failed", {StringField("operation", operation),
                                               StringField("employee_id", assignment.employee_id),
                                               StringField("policy_id", assignment.policy_id),
                                               StringField("error", e.what())});
    }
  }

  TIMEBANK_LOG_INFO("batch complete", {StringField("operation", operation),
                                       StringField("date", util::FormatDate(active_on)),
                                       IntField("carryovers", summary.carryovers),
                                       IntField("expirations", summary.expirations),
                                       IntField("skipped", summary.skipped), IntField("errors", summary.errors)});
  return summary;
}

CarryoverRunSummary CarryoverService::RunCarryover(const util::Date& date,
                                                   const std::optional<std::string>& company_id) {
  if (date.month() != 1 || date.day() != 1) {
    TIMEBANK_LOG_DEBUG("carryover runs on January 1 only", {StringField("date", util::FormatDate(date))});
    return {};
  }
  // Assignments still open on the last day of the year being closed.
  const util::Date year_end(date.year() - 1, 12, 31);
  return RunBatch("carryover", year_end, company_id,
                  [&](const model::Assignment& assignment) { return CarryOver(assignment, date); });
}

CarryoverRunSummary CarryoverService::RunExpiration(const util::Date& date,
                                                    const std::optional<std::string>& company_id) {
  return RunBatch("expiration", date, company_id,
                  [&](const model::Assignment& assignment) { return Expire(assignment, date); });
}

CarryoverService::ItemResult CarryoverService::CarryOver(const model::Assignment& assignment, const util::Date& date) {
  const auto closed_year = date.year() - 1;
  const util::Date year_end(closed_year, 12, 31);

  return WithConflictRetry("carryover", ctx_.options.max_conflict_retries, [&] {
    ItemResult result;
    const auto now     = ctx_.clock->Now();
    auto       tx      = ctx_.repository->Begin();
    const auto version = versions_.ResolveEffective(*tx, assignment.policy_id, year_end);
    const auto* rules  = model::RulesOf(version.settings);
    if (rules == nullptr || !rules->carryover.enabled) {
      return result;
    }

    const auto source_id = "carryover:" + assignment.id + ":" + std::to_string(closed_year);
    auto       snapshot  = projector_.LockOrCreate(*tx, KeyOf(assignment), now);
    // Once the marker exists the year is closed.
    if (ctx_.repository->FindLedgerEntry(*tx, {model::SourceType::kSystem, source_id, model::EntryType::kCarryover})) {
      return result;
    }

    const int64_t available = std::max<int64_t>(snapshot.Available(), 0);
    const int64_t carried =
        rules->carryover.cap_minutes ? std::min(available, *rules->carryover.cap_minutes) : available;
    const int64_t excess = available - carried;

    model::Metadata metadata = {{"year", std::to_string(closed_year)},
                                {"carried_minutes", std::to_string(carried)},
                                {"expired_minutes", std::to_string(excess)}};

    std::vector<model::LedgerEntry> entries;
    if (excess > 0) {
      auto expiration     = SystemEntry(assignment, version, model::EntryType::kExpiration, -excess, source_id, date);
      expiration.metadata = metadata;
      entries.push_back(std::move(expiration));
    }
    auto marker     = SystemEntry(assignment, version, model::EntryType::kCarryover, 0, source_id, date);
    marker.metadata = metadata;
    entries.push_back(std::move(marker));

    const auto outcome = projector_.Post(*tx, snapshot, std::move(entries),
                                         ledger::BalanceConstraint::ForVersion(version), now);
    if (outcome == ledger::PostOutcome::kReplayed) {
      return result;
    }

    result.carryovers = 1;
    result.expirations = excess > 0 ? 1 : 0;
    audit_.Record(*tx, assignment.company_id, {}, "balance", snapshot.key.ToString(), "carried_over",
                  {{"year", std::to_string(closed_year)},
                   {"carried_minutes", std::to_string(carried)},
                   {"expired_minutes", std::to_string(excess)}},
                  now);
    tx->Commit();
    return result;
  });
}

CarryoverService::ItemResult CarryoverService::Expire(const model::Assignment& assignment, const util::Date& date) {
  return WithConflictRetry("expiration", ctx_.options.max_conflict_retries, [&] {
    ItemResult result;
    const auto now     = ctx_.clock->Now();
    auto       tx      = ctx_.repository->Begin();
    const auto version = versions_.ResolveEffective(*tx, assignment.policy_id, date);
    const auto* rules  = model::RulesOf(version.settings);
    if (rules == nullptr) {
      return result;
    }

    const auto year     = std::to_string(date.year());
    auto       snapshot = projector_.LockOrCreate(*tx, KeyOf(assignment), now);

    const auto& expiration = rules->expiration;
    if (expiration.enabled && expiration.expires_on_month && expiration.expires_on_day &&
        date.month() == *expiration.expires_on_month && date.day() == *expiration.expires_on_day) {
      if (PostExpiration(*tx, snapshot, version, "expiration:" + assignment.id + ":" + year + ":calendar",
                         snapshot.Available(), date, {{"rule", "calendar"}}, now)) {
        ++result.expirations;
      }
    }

    const auto& carryover = rules->carryover;
    if (carryover.enabled && carryover.expires_after_days) {
      const util::Date jan1(date.year(), 1, 1);
      if (date - jan1 == *carryover.expires_after_days) {
        const auto carried_year = std::to_string(date.year() - 1);
        auto marker = ctx_.repository->FindLedgerEntry(
            *tx, {model::SourceType::kSystem, "carryover:" + assignment.id + ":" + carried_year,
                  model::EntryType::kCarryover});
        if (marker) {
          const auto it      = marker->metadata.find("carried_minutes");
          const auto carried = it == marker->metadata.end() ? 0 : std::stoll(it->second);
          if (PostExpiration(*tx, snapshot, version, "expiration:" + assignment.id + ":" + carried_year + ":carryover",
                             carried, date, {{"rule", "carryover"}, {"year", carried_year}}, now)) {
            ++result.expirations;
          }
        }
      }
    }

    if (expiration.enabled && expiration.expires_after_days) {
      const auto       earned_on = date - *expiration.expires_after_days;
      model::LedgerRange range;
      range.from = util::StartOfDayUtc(earned_on);
      range.to   = util::StartOfDayUtc(earned_on + 1);
      for (const auto& entry : ctx_.repository->ListLedgerEntries(*tx, snapshot.key, range)) {
        if (entry.entry_type != model::EntryType::kAccrual || entry.amount_minutes <= 0) {
          continue;
        }
        if (PostExpiration(*tx, snapshot, version, "expiration:" + assignment.id + ":" + entry.id + ":aged",
                           entry.amount_minutes, date, {{"rule", "aged"}, {"accrual_entry_id", entry.id}}, now)) {
          ++result.expirations;
        }
      }
    }

    tx->Commit();
    return result;
  });
}

bool CarryoverService::PostExpiration(db::Transaction& tx, model::BalanceSnapshot& snapshot,
                                      const model::PolicyVersion& version, const std::string& source_id,
                                      int64_t minutes, const util::Date& date, model::Metadata metadata,
                                      util::TimePoint now) {
  const model::IdempotencyKey key{model::SourceType::kSystem, source_id, model::EntryType::kExpiration};
  if (ctx_.repository->FindLedgerEntry(tx, key)) {
    return false;
  }
  const int64_t amount = std::min(minutes, snapshot.Available());
  if (amount <= 0) {
    return false;
  }

  model::LedgerEntry entry;
  entry.company_id        = snapshot.key.company_id;
  entry.employee_id       = snapshot.key.employee_id;
  entry.policy_id         = snapshot.key.policy_id;
  entry.policy_version_id = version.id;
  entry.entry_type        = model::EntryType::kExpiration;
  entry.amount_minutes    = -amount;
  entry.effective_at      = util::StartOfDayUtc(date);
  entry.source_type       = model::SourceType::kSystem;
  entry.source_id         = source_id;
  entry.metadata          = std::move(metadata);
  if (minutes != amount) {
    entry.metadata["requested_minutes"] = std::to_string(minutes);
  }

  const auto outcome =
      projector_.Post(tx, snapshot, {std::move(entry)}, ledger::BalanceConstraint::ForVersion(version), now);
  if (outcome == ledger::PostOutcome::kReplayed) {
    return false;
  }
  audit_.Record(tx, snapshot.key.company_id, {}, "balance", snapshot.key.ToString(), "expired",
                {{"source_id", source_id}, {"amount_minutes", std::to_string(amount)}}, now);
  TIMEBANK_LOG_INFO("balance expired", {StringField("balance", snapshot.key.ToString()),
                                        StringField("source_id", source_id), IntField("minutes", amount)});
  return true;
}

} // namespace timebank::service
