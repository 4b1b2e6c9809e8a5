#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/policy.hpp"
#include "internal/util/time.hpp"

namespace timebank::service {
class AuditLog;
}

namespace timebank::policy {

struct NewPolicyVersion {
  util::Date            effective_from;
  model::PolicySettings settings;
  std::string           created_by;
  std::string           change_reason;
};

struct CreatedPolicy {
  model::Policy        policy;
  model::PolicyVersion version;
};

/*
  Effective-dated, append-only policy configuration.

  For one policy the version intervals are contiguous: creating a
  version end-dates the current one at the new effective_from. Versions
  are never deleted, so ledger entries keep resolving to the version
  that produced them.
*/
class PolicyVersionStore {
 public:
  PolicyVersionStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock);
  ~PolicyVersionStore();

  // Policy key is unique per company; fails with AlreadyExists.
  CreatedPolicy CreatePolicy(const std::string& company_id, const std::string& key, const std::string& category,
                             const NewPolicyVersion& initial);

  // Fails with InvalidEffectiveDate if effective_from precedes the
  // current version's effective_from, NotFound for an unknown policy.
  model::PolicyVersion Create(const std::string& policy_id, const NewPolicyVersion& next);

  // Throws NoEffectiveVersion when no version covers `on`.
  model::PolicyVersion ResolveEffective(const std::string& policy_id, const util::Date& on);
  model::PolicyVersion ResolveEffective(db::Transaction& tx, const std::string& policy_id, const util::Date& on);

  model::PolicyVersion Current(const std::string& policy_id);
  model::PolicyVersion Current(db::Transaction& tx, const std::string& policy_id);

  std::vector<model::PolicyVersion> ListVersions(const std::string& policy_id);

  model::Policy GetPolicy(const std::string& policy_id);

 private:
  model::PolicyVersion InsertNext(db::Transaction& tx, const model::Policy& policy, const NewPolicyVersion& next);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::TimeSource> clock_;
  std::unique_ptr<service::AuditLog> audit_;
};

} // namespace timebank::policy
