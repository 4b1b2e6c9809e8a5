#include "audit_log.hpp"

#include "internal/db/codec/settings_codec.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timebank::service {

AuditLog::AuditLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void AuditLog::Record(db::Transaction& tx, const std::string& company_id, const std::string& actor_id,
                      const std::string& entity_type, const std::string& entity_id, const std::string& action,
                      std::initializer_list<std::pair<std::string, std::string>> detail, util::TimePoint now) {
  model::AuditRecord record;
  record.id          = util::NewId();
  record.company_id  = company_id;
  record.actor_id    = actor_id.empty() ? "system" : actor_id;
  record.entity_type = entity_type;
  record.entity_id   = entity_id;
  record.action      = action;
  record.detail      = db::codec::EncodeMetadata(model::Metadata(detail.begin(), detail.end()));
  record.created_at  = now;
  ThrowIfDbError(repository_->InsertAudit(tx, record), "write audit record");
}

std::vector<model::AuditRecord> AuditLog::Query(const model::AuditFilter& filter) {
  if (filter.company_id.empty()) {
    throw util::ValidationError("audit query requires company_id");
  }
  auto tx      = repository_->Begin();
  auto records = repository_->ListAudit(*tx, filter);
  tx->Commit();
  return records;
}

} // namespace timebank::service
