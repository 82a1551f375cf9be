#include "audit_log.hpp"

#include <algorithm>

#include "internal/core/db_error.hpp"
#include "internal/util/uuid.hpp"

namespace narrative::core {

AuditValues& AuditValues::Set(std::string_view key, std::string_view value) {
  (*values_.mutable_fields())[std::string(key)].set_string_value(std::string(value));
  return *this;
}

AuditValues& AuditValues::Set(std::string_view key, const char* value) {
  return Set(key, std::string_view(value));
}

AuditValues& AuditValues::Set(std::string_view key, const std::string& value) {
  return Set(key, std::string_view(value));
}

AuditValues& AuditValues::Set(std::string_view key, int64_t value) {
  (*values_.mutable_fields())[std::string(key)].set_number_value(static_cast<double>(value));
  return *this;
}

AuditValues& AuditValues::Set(std::string_view key, const std::optional<std::string>& value) {
  if (!value) return SetNull(key);
  return Set(key, std::string_view(*value));
}

AuditValues& AuditValues::Set(std::string_view key, const std::vector<std::string>& values) {
  auto* list = (*values_.mutable_fields())[std::string(key)].mutable_list_value();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
  return *this;
}

AuditValues& AuditValues::SetNull(std::string_view key) {
  (*values_.mutable_fields())[std::string(key)].set_null_value(google::protobuf::NULL_VALUE);
  return *this;
}

AuditLog::AuditLog(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

db::model::CurationLogRecord AuditLog::Append(db::Transaction& tx, const AuditEvent& event) {
  db::model::CurationLogRecord record;
  record.id            = util::NewId();
  record.narrative_id  = event.narrative_id;
  record.action_type   = std::string(event.action_type);
  record.old_values    = event.old_values.Build();
  record.new_values    = event.new_values.Build();
  record.reason        = event.reason;
  record.actor_id      = event.actor_id;
  record.actor_type    = event.actor_type;
  record.session_id    = event.session_id;
  record.created_at_ms = clock_->NowMs();

  ThrowIfDbError(repository_->AppendCurationLog(tx, record), "append " + record.action_type + " for " + record.narrative_id);
  return record;
}

std::vector<db::model::CurationLogRecord> AuditLog::ForNarrative(db::Transaction& tx, const std::string& narrative_id) {
  return repository_->ListCurationLog(tx, narrative_id);
}

std::vector<db::model::CurationLogRecord> AuditLog::Recent(db::Transaction& tx, const std::string& narrative_id, std::size_t limit) {
  auto entries = repository_->ListCurationLog(tx, narrative_id);
  std::reverse(entries.begin(), entries.end());
  if (entries.size() > limit) entries.resize(limit);
  return entries;
}

std::vector<db::model::CurationLogRecord> AuditLog::All(db::Transaction& tx) {
  return repository_->ListCurationLog(tx, std::nullopt);
}

uint64_t AuditLog::Count(db::Transaction& tx) {
  return repository_->CountCurationLog(tx);
}

} // namespace narrative::core
