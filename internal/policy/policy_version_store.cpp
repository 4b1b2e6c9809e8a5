#include "policy_version_store.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/service/audit_log.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timebank::policy {

using observability::IntField;
using observability::StringField;

PolicyVersionStore::PolicyVersionStore(std::shared_ptr<db::Repository> repository,
                                       std::shared_ptr<util::TimeSource> clock)
    : repository_(std::move(repository)),
      clock_(std::move(clock)),
      audit_(std::make_unique<service::AuditLog>(repository_)) {
}

PolicyVersionStore::~PolicyVersionStore() = default;

CreatedPolicy PolicyVersionStore::CreatePolicy(const std::string& company_id, const std::string& key,
                                               const std::string& category, const NewPolicyVersion& initial) {
  if (company_id.empty() || key.empty()) {
    throw util::ValidationError("policy needs company_id and key");
  }
  model::Validate(initial.settings);

  const auto now = clock_->Now();
  auto       tx  = repository_->Begin();
  if (repository_->FindPolicyByKey(*tx, company_id, key)) {
    throw util::AlreadyExists("policy key '" + key + "' already exists for company " + company_id);
  }

  model::Policy policy;
  policy.id         = util::NewId();
  policy.company_id = company_id;
  policy.key        = key;
  policy.category   = category;
  policy.created_at = now;
  service::ThrowIfDbError(repository_->InsertPolicy(*tx, policy), "create policy");

  auto version = InsertNext(*tx, policy, initial);
  audit_->Record(*tx, company_id, initial.created_by, "policy", policy.id, "created",
                 {{"key", key}, {"kind", std::string(model::ToString(version.Kind()))}}, now);
  tx->Commit();

  TIMEBANK_LOG_INFO("policy created", {StringField("policy_id", policy.id), StringField("key", key),
                                       StringField("company_id", company_id)});
  return {policy, version};
}

model::PolicyVersion PolicyVersionStore::Create(const std::string& policy_id, const NewPolicyVersion& next) {
  model::Validate(next.settings);

  auto tx     = repository_->Begin();
  auto policy = repository_->GetPolicy(*tx, policy_id);
  if (!policy) {
    throw util::NotFound("policy " + policy_id + " not found");
  }
  auto version = InsertNext(*tx, *policy, next);
  tx->Commit();

  TIMEBANK_LOG_INFO("policy version created",
                    {StringField("policy_id", policy_id), IntField("version", version.version),
                     StringField("effective_from", util::FormatDate(version.effective_from))});
  return version;
}

model::PolicyVersion PolicyVersionStore::InsertNext(db::Transaction& tx, const model::Policy& policy,
                                                    const NewPolicyVersion& next) {
  const auto now      = clock_->Now();
  auto       versions = repository_->ListPolicyVersions(tx, policy.id);

  model::PolicyVersion version;
  version.id             = util::NewId();
  version.policy_id      = policy.id;
  version.version        = 1;
  version.effective_from = next.effective_from;
  version.settings       = next.settings;
  version.created_by     = next.created_by;
  version.change_reason  = next.change_reason;
  version.created_at     = now;

  auto current = std::find_if(versions.begin(), versions.end(), [](const auto& v) { return !v.effective_to; });
  if (!versions.empty()) {
    if (current == versions.end()) {
      throw util::StoreUnavailable("policy " + policy.id + " has no open version");
    }
    if (next.effective_from < current->effective_from) {
      throw util::InvalidEffectiveDate("effective_from " + util::FormatDate(next.effective_from) +
                                       " precedes current version " + std::to_string(current->version) +
                                       " effective_from " + util::FormatDate(current->effective_from));
    }
    version.version = versions.back().version + 1;
    service::ThrowIfDbError(repository_->CloseVersion(tx, current->id, next.effective_from),
                            "close policy version " + current->id);
  }

  service::ThrowIfDbError(repository_->InsertPolicyVersion(tx, version), "insert policy version");
  audit_->Record(tx, policy.company_id, next.created_by, "policy_version", version.id, "created",
                 {{"policy_id", policy.id},
                  {"version", std::to_string(version.version)},
                  {"effective_from", util::FormatDate(version.effective_from)},
                  {"change_reason", next.change_reason}},
                 now);
  return version;
}

model::PolicyVersion PolicyVersionStore::ResolveEffective(const std::string& policy_id, const util::Date& on) {
  auto tx      = repository_->Begin();
  auto version = ResolveEffective(*tx, policy_id, on);
  tx->Commit();
  return version;
}

model::PolicyVersion PolicyVersionStore::ResolveEffective(db::Transaction& tx, const std::string& policy_id,
                                                          const util::Date& on) {
  const auto versions = repository_->ListPolicyVersions(tx, policy_id);
  // Ascending by version, so scanning backwards breaks ties toward the
  // highest version. A version created with the same effective_from as
  // its predecessor leaves the predecessor with an empty interval.
  for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
    if (it->CoversDate(on)) {
      return *it;
    }
  }
  throw util::NoEffectiveVersion("policy " + policy_id + " has no version effective on " + util::FormatDate(on));
}

model::PolicyVersion PolicyVersionStore::Current(const std::string& policy_id) {
  auto tx      = repository_->Begin();
  auto version = Current(*tx, policy_id);
  tx->Commit();
  return version;
}

model::PolicyVersion PolicyVersionStore::Current(db::Transaction& tx, const std::string& policy_id) {
  const auto versions = repository_->ListPolicyVersions(tx, policy_id);
  for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
    if (!it->effective_to) {
      return *it;
    }
  }
  throw util::NoEffectiveVersion("policy " + policy_id + " has no current version");
}

std::vector<model::PolicyVersion> PolicyVersionStore::ListVersions(const std::string& policy_id) {
  auto tx       = repository_->Begin();
  auto versions = repository_->ListPolicyVersions(*tx, policy_id);
  tx->Commit();
  return versions;
}

model::Policy PolicyVersionStore::GetPolicy(const std::string& policy_id) {
  auto tx     = repository_->Begin();
  auto policy = repository_->GetPolicy(*tx, policy_id);
  tx->Commit();
  if (!policy) {
    throw util::NotFound("policy " + policy_id + " not found");
  }
  return *policy;
}

} // namespace timebank::policy
