#pragma once

#include <memory>
#include <string>

#include "internal/core/audit_log.hpp"
#include "internal/core/narrative_store.hpp"

namespace narrative::core {

struct StatusChange {
  narrative::model::CurationStatus previous = narrative::model::CurationStatus::kAutoGenerated;
  db::model::NarrativeRecord       narrative;
};

/*
  Editorial state machine over curation_status.

  A rejected transition throws InvalidTransition before anything is
  written. An accepted one writes the status and appends exactly one
  status_changed entry. A self-transition only appends the entry.

  published_at / published_by are set on entering published and cleared
  on leaving it, so published_at is set exactly when status is published.
*/
class CurationWorkflow {
 public:
  CurationWorkflow(std::shared_ptr<NarrativeStore> store, std::shared_ptr<AuditLog> audit, std::shared_ptr<const util::TimeSource> clock);

  static void CheckTransition(narrative::model::CurationStatus from, narrative::model::CurationStatus to);

  StatusChange UpdateStatus(db::Transaction& tx, const std::string& narrative_id, narrative::model::CurationStatus next, const std::string& actor_id,
                            const std::string& notes, const std::string& session_id);

 private:
  std::shared_ptr<NarrativeStore>        store_;
  std::shared_ptr<AuditLog>              audit_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace narrative::core
