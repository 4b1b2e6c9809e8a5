#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/duration/duration_calculator.hpp"
#include "internal/ledger/balance_projector.hpp"
#include "internal/model/request.hpp"
#include "internal/policy/policy_version_store.hpp"
#include "internal/service/audit_log.hpp"
#include "internal/service/service_context.hpp"

namespace timebank::service {

struct SubmitRequestInput {
  std::string     company_id;
  std::string     employee_id;
  std::string     policy_id;
  util::TimePoint start_at{};
  util::TimePoint end_at{};
  std::string     reason;
  std::string     idempotency_key; // optional; unique per company and employee
  std::string     actor_id;
};

/*
  Time-off request lifecycle and its ledger effects.

    submit                 Hold(-m)
    approve                HoldRelease(+m), Usage(-m)
    deny                   HoldRelease(+m)
    cancel from Submitted  HoldRelease(+m)
    cancel from Draft      nothing

  Each transition is one transaction under the balance lock. The
  request row is re-read after the lock is taken so two racing
  decisions on one request cannot both apply.
*/
class RequestService {
 public:
  explicit RequestService(ServiceContext ctx);

  // Stores a Draft with its computed minutes. No ledger effect.
  model::TimeOffRequest CreateDraft(const SubmitRequestInput& input);

  // Draft -> Submitted.
  model::TimeOffRequest Submit(const std::string& request_id, const std::string& actor_id = {});

  // Create and submit in one transaction.
  model::TimeOffRequest SubmitRequest(const SubmitRequestInput& input);

  model::TimeOffRequest Approve(const std::string& request_id, const std::string& actor_id,
                                const std::string& note = {});
  model::TimeOffRequest Deny(const std::string& request_id, const std::string& actor_id, const std::string& note = {});
  model::TimeOffRequest Cancel(const std::string& request_id, const std::string& actor_id);

  model::TimeOffRequest              Get(const std::string& request_id);
  std::vector<model::TimeOffRequest> List(const model::BalanceKey& key);

 private:
  int64_t ComputeMinutes(const SubmitRequestInput& input) const;

  // Returns the stored request when input.idempotency_key was seen before.
  std::optional<model::TimeOffRequest> FindPrevious(db::Transaction& tx, const SubmitRequestInput& input);

  model::TimeOffRequest Find(db::Transaction& tx, const std::string& request_id);

  // Locks the request's balance row, then reads the request under it.
  // Every status change goes through this lock.
  model::TimeOffRequest LockedRequest(db::Transaction& tx, const std::string& request_id, util::TimePoint now);

  // Runs the submit checks and posts the hold. `request` is Submitted on return.
  void PlaceHold(db::Transaction& tx, model::TimeOffRequest& request, const std::string& actor_id,
                 util::TimePoint now, bool insert);

  model::TimeOffRequest Decide(const std::string& request_id, model::RequestEvent event, const std::string& actor_id,
                               const std::string& note);

  ServiceContext                        ctx_;
  duration::DurationCalculator          durations_;
  ledger::BalanceProjector              projector_;
  policy::PolicyVersionStore            versions_;
  AuditLog                              audit_;
};

} // namespace timebank::service
