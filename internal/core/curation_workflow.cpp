#include "curation_workflow.hpp"

#include "internal/util/errors.hpp"

namespace narrative::core {

using narrative::model::CurationStatus;

CurationWorkflow::CurationWorkflow(std::shared_ptr<NarrativeStore> store, std::shared_ptr<AuditLog> audit,
                                   std::shared_ptr<const util::TimeSource> clock)
    : store_(std::move(store)), audit_(std::move(audit)), clock_(std::move(clock)) {
}

void CurationWorkflow::CheckTransition(CurationStatus from, CurationStatus to) {
  if (!narrative::model::CanTransition(from, to)) {
    throw util::InvalidTransition("transition " + std::string(narrative::model::ToString(from)) + " -> " +
                                  std::string(narrative::model::ToString(to)) + " is not allowed");
  }
}

StatusChange CurationWorkflow::UpdateStatus(db::Transaction& tx, const std::string& narrative_id, CurationStatus next,
                                            const std::string& actor_id, const std::string& notes, const std::string& session_id) {
  if (actor_id.empty()) throw util::ValidationError("actor_id is required");

  auto record  = store_->GetForUpdate(tx, narrative_id);
  auto current = record.status;
  CheckTransition(current, next);

  if (current != next) {
    record.status = next;
    if (next == CurationStatus::kPublished) {
      record.published_at_ms = clock_->NowMs();
      record.published_by    = actor_id;
    } else if (current == CurationStatus::kPublished) {
      record.published_at_ms.reset();
      record.published_by.reset();
    }
    record = store_->Save(tx, std::move(record));
  }

  AuditEvent event;
  event.narrative_id = narrative_id;
  event.action_type  = action::kStatusChanged;
  event.old_values.Set("status", narrative::model::ToString(current));
  event.new_values.Set("status", narrative::model::ToString(next));
  event.reason     = notes.empty() ? "Status updated" : notes;
  event.actor_id   = actor_id;
  event.session_id = session_id;
  audit_->Append(tx, event);

  return StatusChange{current, std::move(record)};
}

} // namespace narrative::core
