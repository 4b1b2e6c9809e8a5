#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace timebank::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Policies
// ---------------------------------------------------------------------

Result MemoryRepository::InsertPolicy(Transaction& t, const model::Policy& p) {
  auto& s = TX(t).Mutable();
  if (s.policies.contains(p.id)) return Result::Err(ErrorCode::AlreadyExists, "policy id exists");
  for (const auto& [_, existing] : s.policies) {
    if (existing.company_id == p.company_id && existing.key == p.key) {
      return Result::Err(ErrorCode::AlreadyExists, "policy key exists");
    }
  }
  s.policies[p.id] = p;
  return Result::Ok();
}

std::optional<model::Policy> MemoryRepository::GetPolicy(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.policies.find(id);
  if (it == s.policies.end()) return std::nullopt;
  return it->second;
}

std::optional<model::Policy> MemoryRepository::FindPolicyByKey(Transaction& t, const std::string& company_id,
                                                               const std::string& key) {
  for (const auto& [_, policy] : TX(t).View().policies) {
    if (policy.company_id == company_id && policy.key == key) return policy;
  }
  return std::nullopt;
}

Result MemoryRepository::InsertPolicyVersion(Transaction& t, const model::PolicyVersion& v) {
  auto& s = TX(t).Mutable();
  if (!s.policies.contains(v.policy_id)) return Result::Err(ErrorCode::NotFound, "policy not found");
  if (s.versions.contains(v.id)) return Result::Err(ErrorCode::AlreadyExists, "version id exists");
  for (const auto& [_, existing] : s.versions) {
    if (existing.policy_id == v.policy_id && existing.version == v.version) {
      return Result::Err(ErrorCode::AlreadyExists, "version number exists");
    }
  }
  s.versions[v.id] = v;
  return Result::Ok();
}

Result MemoryRepository::CloseVersion(Transaction& t, const std::string& version_id, const util::Date& effective_to) {
  auto& s  = TX(t).Mutable();
  auto  it = s.versions.find(version_id);
  if (it == s.versions.end()) return Result::Err(ErrorCode::NotFound);
  it->second.effective_to = effective_to;
  return Result::Ok();
}

std::vector<model::PolicyVersion> MemoryRepository::ListPolicyVersions(Transaction& t, const std::string& policy_id) {
  std::vector<model::PolicyVersion> out;
  for (const auto& [_, version] : TX(t).View().versions) {
    if (version.policy_id == policy_id) out.push_back(version);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.version < b.version; });
  return out;
}

// ---------------------------------------------------------------------
// Assignments
// ---------------------------------------------------------------------

Result MemoryRepository::InsertAssignment(Transaction& t, const model::Assignment& a) {
  auto& s = TX(t).Mutable();
  if (s.assignments.contains(a.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.assignments[a.id] = a;
  return Result::Ok();
}

std::vector<model::Assignment> MemoryRepository::ListAssignments(Transaction& t, const model::AssignmentFilter& filter) {
  std::vector<model::Assignment> out;
  for (const auto& [_, assignment] : TX(t).View().assignments) {
    if (filter.Matches(assignment)) out.push_back(assignment);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.effective_from, a.id) < std::tie(b.effective_from, b.id);
  });
  return out;
}

// ---------------------------------------------------------------------
// Ledger
// ---------------------------------------------------------------------

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntry& e) {
  auto&      s   = TX(t).Mutable();
  const auto key = e.Idempotency();
  if (s.ledger_index.contains(key)) return Result::Err(ErrorCode::AlreadyExists, key.ToString());
  s.ledger_index.emplace(key, s.ledger.size());
  s.ledger.push_back(e);
  return Result::Ok();
}

std::optional<model::LedgerEntry> MemoryRepository::FindLedgerEntry(Transaction& t, const model::IdempotencyKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.ledger_index.find(key);
  if (it == s.ledger_index.end()) return std::nullopt;
  return s.ledger[it->second];
}

std::vector<model::LedgerEntry> MemoryRepository::ListLedgerEntries(Transaction& t, const model::BalanceKey& key,
                                                                    const model::LedgerRange& range) {
  std::vector<model::LedgerEntry> out;
  for (const auto& entry : TX(t).View().ledger) {
    if (entry.Key() == key && range.Contains(entry.effective_at)) out.push_back(entry);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.effective_at, a.created_at) < std::tie(b.effective_at, b.created_at);
  });
  return out;
}

// ---------------------------------------------------------------------
// Balance snapshots
// ---------------------------------------------------------------------

std::optional<model::BalanceSnapshot> MemoryRepository::LockBalance(Transaction& t, const model::BalanceKey& key) {
  // The writer lock taken in Begin() already excludes other writers.
  return GetBalance(t, key);
}

std::optional<model::BalanceSnapshot> MemoryRepository::GetBalance(Transaction& t, const model::BalanceKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.balances.find(key);
  if (it == s.balances.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertBalance(Transaction& t, const model::BalanceSnapshot& b) {
  auto& s = TX(t).Mutable();
  if (s.balances.contains(b.key)) return Result::Err(ErrorCode::AlreadyExists);
  s.balances[b.key] = b;
  return Result::Ok();
}

Result MemoryRepository::UpdateBalance(Transaction& t, const model::BalanceSnapshot& b, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.balances.find(b.key);
  if (it == s.balances.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "stale balance version");
  it->second = b;
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Time-off requests
// ---------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, const model::TimeOffRequest& r) {
  auto& s = TX(t).Mutable();
  if (s.requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (!r.idempotency_key.empty() &&
      FindRequestByIdempotencyKey(t, r.company_id, r.employee_id, r.idempotency_key).has_value()) {
    return Result::Err(ErrorCode::AlreadyExists, "request idempotency key exists");
  }
  s.requests[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::TimeOffRequest& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.requests.find(r.id);
  if (it == s.requests.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

std::optional<model::TimeOffRequest> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TimeOffRequest> MemoryRepository::FindRequestByIdempotencyKey(Transaction& t,
                                                                                   const std::string& company_id,
                                                                                   const std::string& employee_id,
                                                                                   const std::string& idempotency_key) {
  for (const auto& [_, request] : TX(t).View().requests) {
    if (request.company_id == company_id && request.employee_id == employee_id &&
        request.idempotency_key == idempotency_key) {
      return request;
    }
  }
  return std::nullopt;
}

std::vector<model::TimeOffRequest> MemoryRepository::ListRequests(Transaction& t, const model::BalanceKey& key) {
  std::vector<model::TimeOffRequest> out;
  for (const auto& [_, request] : TX(t).View().requests) {
    if (request.company_id == key.company_id && request.employee_id == key.employee_id &&
        request.policy_id == key.policy_id) {
      out.push_back(request);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.start_at < b.start_at; });
  return out;
}

// ---------------------------------------------------------------------
// Audit
// ---------------------------------------------------------------------

Result MemoryRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  TX(t).Mutable().audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, const model::AuditFilter& filter) {
  std::vector<model::AuditRecord> out;
  const auto&                     audit = TX(t).View().audit;
  for (auto it = audit.rbegin(); it != audit.rend() && out.size() < filter.limit; ++it) {
    if (it->company_id != filter.company_id) continue;
    if (!filter.entity_type.empty() && it->entity_type != filter.entity_type) continue;
    if (!filter.entity_id.empty() && it->entity_id != filter.entity_id) continue;
    out.push_back(*it);
  }
  return out;
}

} // namespace timebank::db::memory
