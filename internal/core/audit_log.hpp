#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace narrative::core {

namespace action {
inline constexpr std::string_view kCreated             = "created";
inline constexpr std::string_view kCreatedManualParent = "created_manual_parent";
inline constexpr std::string_view kAssignedToParent    = "assigned_to_parent";
inline constexpr std::string_view kRemovedFromParent   = "removed_from_parent";
inline constexpr std::string_view kStatusChanged       = "status_changed";
inline constexpr std::string_view kNoteAdded           = "note_added";
inline constexpr std::string_view kPriorityChanged     = "priority_changed";
inline constexpr std::string_view kReviewerAssigned    = "reviewer_assigned";
inline constexpr std::string_view kReviewDeadlineSet   = "review_deadline_set";
inline constexpr std::string_view kClusterGroupLinked  = "cluster_group_linked";
inline constexpr std::string_view kDeleted             = "deleted";
} // namespace action

/*
  Builds the old_values / new_values JSON objects of an audit entry.
*/
class AuditValues {
 public:
  AuditValues& Set(std::string_view key, std::string_view value);
  AuditValues& Set(std::string_view key, const char* value);
  AuditValues& Set(std::string_view key, const std::string& value);
  AuditValues& Set(std::string_view key, int64_t value);
  AuditValues& Set(std::string_view key, const std::optional<std::string>& value);
  AuditValues& Set(std::string_view key, const std::vector<std::string>& values);
  AuditValues& SetNull(std::string_view key);

  const google::protobuf::Struct& Build() const {
    return values_;
  }

 private:
  google::protobuf::Struct values_;
};

struct AuditEvent {
  std::string                 narrative_id;
  std::string_view            action_type;
  AuditValues                 old_values;
  AuditValues                 new_values;
  std::string                 reason;
  std::string                 actor_id;
  narrative::model::ActorType actor_type = narrative::model::ActorType::kUser;
  std::string                 session_id;
};

/*
  Append-only ledger over narrative_curation_log. Writes happen inside
  the caller's transaction so an entry commits together with the change
  it describes.
*/
class AuditLog {
 public:
  AuditLog(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock);

  db::model::CurationLogRecord Append(db::Transaction& tx, const AuditEvent& event);

  std::vector<db::model::CurationLogRecord> ForNarrative(db::Transaction& tx, const std::string& narrative_id);

  // Newest first, at most limit entries.
  std::vector<db::model::CurationLogRecord> Recent(db::Transaction& tx, const std::string& narrative_id, std::size_t limit);

  std::vector<db::model::CurationLogRecord> All(db::Transaction& tx);

  uint64_t Count(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace narrative::core
