#include "curation_engine.hpp"

#include <algorithm>
#include <type_traits>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace narrative::core {

using db::model::ClusterGroupRecord;
using db::model::CurationNote;
using db::model::NarrativeRecord;
using narrative::model::ActorType;
using narrative::model::CurationSource;
using narrative::model::CurationStatus;

namespace {

constexpr int kMaxLockAttempts = 3;

void ValidatePriority(int32_t priority) {
  if (priority < 1 || priority > 5) {
    throw util::ValidationError("editorial_priority must be in [1,5], got " + std::to_string(priority));
  }
}

std::vector<std::string> Dedupe(const std::vector<std::string>& ids) {
  std::vector<std::string>        out;
  std::unordered_set<std::string> seen;
  for (const auto& id : ids) {
    if (seen.insert(id).second) out.push_back(id);
  }
  return out;
}

// Shares the lock namespace with narrative ids, which never carry this prefix.
std::string GroupKey(const std::string& group_id) {
  return "group:" + group_id;
}

void RecordAudit(std::string_view action_type, uint64_t count = 1) {
  observability::Metrics::Instance().RecordAuditEntries(action_type, count);
}

} // namespace

CurationEngine::CurationEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock, CurationLimits limits)
    : repository_(std::move(repository)), clock_(std::move(clock)), limits_(limits) {
  if (!repository_) throw std::invalid_argument("CurationEngine: repository is required");
  if (!clock_) throw std::invalid_argument("CurationEngine: time source is required");

  store_    = std::make_shared<NarrativeStore>(repository_, clock_);
  audit_    = std::make_shared<AuditLog>(repository_, clock_);
  cache_    = std::make_shared<HierarchyCache>(repository_, clock_);
  groups_   = std::make_shared<ClusterGroupRegistry>(repository_, clock_, limits_);
  workflow_ = std::make_shared<CurationWorkflow>(store_, audit_, clock_);
  reports_  = std::make_shared<CurationReports>(repository_, clock_);
}

std::shared_ptr<std::mutex> CurationEngine::KeyMutex(const std::string& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::mutex>();
  }
  return key_mutex;
}

CurationEngine::LockSet CurationEngine::LockKeys(std::vector<std::string> keys) {
  // a global order keeps multi-root assignments deadlock free
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  LockSet locks;
  locks.reserve(keys.size());
  for (const auto& key : keys) {
    locks.emplace_back(*KeyMutex(key));
  }
  return locks;
}

std::vector<std::string> CurationEngine::ResolveRoots(db::Transaction& tx, const std::vector<std::string>& narrative_ids) {
  std::vector<std::string> roots;
  roots.reserve(narrative_ids.size());
  for (const auto& id : narrative_ids) {
    auto record = repository_->GetNarrative(tx, id);
    roots.push_back(record && record->parent_id ? *record->parent_id : id);
  }
  std::sort(roots.begin(), roots.end());
  roots.erase(std::unique(roots.begin(), roots.end()), roots.end());
  return roots;
}

template <typename Fn>
auto CurationEngine::Mutate(const std::vector<std::string>& narrative_ids, const std::vector<std::string>& extra_keys, Fn&& fn) {
  std::shared_lock structure(structure_mutex_);

  for (int attempt = 0; attempt < kMaxLockAttempts; ++attempt) {
    std::vector<std::string> roots;
    {
      auto probe = repository_->Begin();
      roots      = ResolveRoots(*probe, narrative_ids);
      probe->Rollback();
    }

    auto keys = roots;
    keys.insert(keys.end(), extra_keys.begin(), extra_keys.end());
    auto locks = LockKeys(std::move(keys));
    auto tx    = repository_->Begin();
    if (ResolveRoots(*tx, narrative_ids) != roots) {
      continue;
    }

    auto result = fn(*tx);
    tx->Commit();
    return result;
  }
  throw util::ConcurrentModification("hierarchy changed while acquiring narrative locks; retry");
}

template <typename Fn>
auto CurationEngine::Mutate(const std::vector<std::string>& narrative_ids, Fn&& fn) {
  return Mutate(narrative_ids, {}, std::forward<Fn>(fn));
}

template <typename Fn>
auto CurationEngine::InTransaction(Fn&& fn) {
  auto tx     = repository_->Begin();
  auto result = fn(*tx);
  tx->Commit();
  return result;
}

void CurationEngine::RequireActor(const std::string& actor_id, const char* field) const {
  if (actor_id.empty()) throw util::ValidationError(std::string(field) + " is required");
}

void CurationEngine::ValidateTitle(const std::string& title) const {
  if (title.empty()) throw util::ValidationError("title is required");
  if (Utf8Length(title) > limits_.max_title_length) {
    throw util::ValidationError("title exceeds " + std::to_string(limits_.max_title_length) + " characters");
  }
}

NarrativeRecord CurationEngine::IngestPipelineNarrative(const PipelineNarrative& input) {
  ValidateTitle(input.title);
  if (input.summary.empty()) throw util::ValidationError("summary is required");

  const auto session = util::NewId();
  auto       created = Mutate({}, [&](db::Transaction& tx) {
    NarrativeRecord fields;
    fields.id                 = util::NewId();
    fields.title              = input.title;
    fields.summary            = input.summary;
    fields.confidence_rating  = input.confidence_rating;
    fields.source             = CurationSource::kPipeline;
    fields.status             = CurationStatus::kAutoGenerated;
    fields.editorial_priority = 5;
    fields.display_id         = input.display_id.value_or("EN-" + util::FormatDate(clock_->NowMs()) + "-" + fields.id.substr(0, 8));

    auto root = store_->CreateRoot(tx, std::move(fields));

    AuditEvent event;
    event.narrative_id = root.id;
    event.action_type  = action::kCreated;
    event.new_values.Set("title", root.title).Set("status", narrative::model::ToString(root.status)).Set("display_id", root.display_id);
    event.reason     = "Pipeline narrative ingested";
    event.actor_id   = "pipeline";
    event.actor_type = ActorType::kPipeline;
    event.session_id = session;
    audit_->Append(tx, event);

    cache_->OnRootCreated(tx, root);
    return root;
  });

  RecordAudit(action::kCreated);
  return created;
}

NarrativeRecord CurationEngine::CreateManualParent(const ManualParentRequest& request) {
  ValidateTitle(request.title);
  if (request.summary.empty()) throw util::ValidationError("summary is required");
  RequireActor(request.curator_id, "curator_id");
  ValidatePriority(request.editorial_priority);
  if (request.cluster_ids.size() > limits_.max_cluster_ids) {
    throw util::ValidationError("at most " + std::to_string(limits_.max_cluster_ids) + " cluster ids per manual parent");
  }

  const auto session = util::NewId();
  auto       created = Mutate({}, [&](db::Transaction& tx) {
    const auto now = clock_->NowMs();

    NarrativeRecord fields;
    fields.id                 = util::NewId();
    fields.display_id         = "EN-" + util::FormatDate(now) + "-M" + std::to_string(now / 1000) + "-" + fields.id.substr(0, 8);
    fields.title              = request.title;
    fields.summary            = request.summary;
    fields.source             = CurationSource::kManual;
    fields.status             = CurationStatus::kManualDraft;
    fields.curator_id         = request.curator_id;
    fields.editorial_priority = request.editorial_priority;
    fields.manual_cluster_ids = request.cluster_ids;
    fields.review_deadline_ms = request.review_deadline_ms;
    fields.confidence_rating  = "medium";
    fields.created_at_ms      = now;

    auto root = store_->CreateRoot(tx, std::move(fields));

    AuditEvent event;
    event.narrative_id = root.id;
    event.action_type  = action::kCreatedManualParent;
    event.new_values.Set("title", root.title)
        .Set("display_id", root.display_id)
        .Set("cluster_ids", root.manual_cluster_ids)
        .Set("editorial_priority", static_cast<int64_t>(root.editorial_priority));
    event.reason     = "Manual parent narrative created";
    event.actor_id   = request.curator_id;
    event.session_id = session;
    audit_->Append(tx, event);

    cache_->OnRootCreated(tx, root);
    return root;
  });

  RecordAudit(action::kCreatedManualParent);
  NARRATIVE_LOG_INFO("manual parent created", {observability::StringField("narrative_id", created.id),
                                               observability::StringField("curator_id", request.curator_id),
                                               observability::IntField("cluster_ids", static_cast<int64_t>(request.cluster_ids.size()))});
  return created;
}

AssignmentResult CurationEngine::AssignChildren(const std::string& parent_id, const std::vector<std::string>& child_ids,
                                                const std::string& curator_id, const std::string& rationale) {
  RequireActor(curator_id, "curator_id");
  const auto children = Dedupe(child_ids);
  if (children.empty()) throw util::ValidationError("at least one child narrative is required");
  if (children.size() > limits_.max_children_per_assignment) {
    throw util::ValidationError("at most " + std::to_string(limits_.max_children_per_assignment) + " children per assignment");
  }

  std::vector<std::string> lock_ids = children;
  lock_ids.push_back(parent_id);

  const auto session = util::NewId();
  auto       result  = Mutate(lock_ids, [&](db::Transaction& tx) {
    auto parent = repository_->GetNarrativeForUpdate(tx, parent_id);
    if (!parent) throw util::InvalidParentReference("parent narrative " + parent_id + " does not exist");
    if (!parent->IsManualRoot()) throw util::ValidationError("narrative " + parent_id + " is not a manual parent narrative");

    AssignmentResult out;
    for (const auto& child_id : children) {
      auto existing = store_->Find(tx, child_id);
      if (!existing || existing->parent_id) {
        out.skipped_ids.push_back(child_id);
        continue;
      }

      auto child = store_->SetParent(tx, child_id, parent_id);

      AuditEvent event;
      event.narrative_id = child_id;
      event.action_type  = action::kAssignedToParent;
      event.old_values.SetNull("parent_id");
      event.new_values.Set("parent_id", parent_id).Set("parent_title", parent->title);
      event.reason     = rationale.empty() ? "Assigned to manual parent narrative" : rationale;
      event.actor_id   = curator_id;
      event.session_id = session;
      audit_->Append(tx, event);

      cache_->OnChildAttached(tx, *parent, child);
      out.assigned_ids.push_back(child_id);
    }
    out.assigned_count = out.assigned_ids.size();

    CurationNote note;
    note.action       = "children_assigned";
    note.detail       = "Assigned " + std::to_string(out.assigned_count) + " child narratives" + (rationale.empty() ? "" : ": " + rationale);
    note.actor        = curator_id;
    note.timestamp_ms = clock_->NowMs();
    parent->curation_notes.push_back(std::move(note));
    auto saved = store_->Save(tx, std::move(*parent));
    cache_->OnNarrativeUpdated(tx, saved);

    return out;
  });

  RecordAudit(action::kAssignedToParent, result.assigned_count);
  NARRATIVE_LOG_INFO("children assigned", {observability::StringField("parent_id", parent_id),
                                           observability::IntField("assigned", static_cast<int64_t>(result.assigned_count)),
                                           observability::IntField("skipped", static_cast<int64_t>(result.skipped_ids.size()))});
  return result;
}

NarrativeRecord CurationEngine::DetachChild(const std::string& child_id, const std::string& curator_id, const std::string& reason) {
  RequireActor(curator_id, "curator_id");

  const auto session  = util::NewId();
  auto       detached = Mutate({child_id}, [&](db::Transaction& tx) {
    const auto previous = store_->ClearParent(tx, child_id);
    auto       child    = store_->Get(tx, child_id);

    AuditEvent event;
    event.narrative_id = child_id;
    event.action_type  = action::kRemovedFromParent;
    event.old_values.Set("parent_id", previous);
    event.new_values.SetNull("parent_id");
    event.reason     = reason.empty() ? "Removed from parent narrative" : reason;
    event.actor_id   = curator_id;
    event.session_id = session;
    audit_->Append(tx, event);

    cache_->OnChildDetached(tx, previous, child_id);
    cache_->OnRootCreated(tx, child);
    return child;
  });

  RecordAudit(action::kRemovedFromParent);
  return detached;
}

StatusChange CurationEngine::UpdateStatus(const std::string& narrative_id, CurationStatus next, const std::string& actor_id,
                                          const std::string& notes) {
  RequireActor(actor_id, "actor_id");

  const auto session = util::NewId();
  auto       change  = Mutate({narrative_id}, [&](db::Transaction& tx) {
    auto result = workflow_->UpdateStatus(tx, narrative_id, next, actor_id, notes, session);
    if (result.previous != next) cache_->OnNarrativeUpdated(tx, result.narrative);
    return result;
  });

  RecordAudit(action::kStatusChanged);
  if (change.previous != next) {
    observability::Metrics::Instance().RecordStatusTransition(narrative::model::ToString(change.previous), narrative::model::ToString(next));
  }
  return change;
}

NarrativeRecord CurationEngine::AddCurationNote(const std::string& narrative_id, const std::string& actor_id, const std::string& note_action,
                                                const std::string& detail) {
  RequireActor(actor_id, "actor_id");
  if (detail.empty()) throw util::ValidationError("note detail is required");

  const auto session = util::NewId();
  auto       updated = Mutate({narrative_id}, [&](db::Transaction& tx) {
    auto record = store_->GetForUpdate(tx, narrative_id);

    CurationNote note;
    note.action       = note_action.empty() ? "note" : note_action;
    note.detail       = detail;
    note.actor        = actor_id;
    note.timestamp_ms = clock_->NowMs();

    AuditEvent event;
    event.narrative_id = narrative_id;
    event.action_type  = action::kNoteAdded;
    event.new_values.Set("action", note.action).Set("detail", note.detail);
    event.reason     = "Curation note added";
    event.actor_id   = actor_id;
    event.session_id = session;

    record.curation_notes.push_back(std::move(note));
    auto saved = store_->Save(tx, std::move(record));
    audit_->Append(tx, event);
    cache_->OnNarrativeUpdated(tx, saved);
    return saved;
  });

  RecordAudit(action::kNoteAdded);
  return updated;
}

NarrativeRecord CurationEngine::SetEditorialPriority(const std::string& narrative_id, int32_t priority, const std::string& actor_id) {
  RequireActor(actor_id, "actor_id");
  ValidatePriority(priority);

  const auto session = util::NewId();
  auto       updated = Mutate({narrative_id}, [&](db::Transaction& tx) {
    auto record = store_->GetForUpdate(tx, narrative_id);

    AuditEvent event;
    event.narrative_id = narrative_id;
    event.action_type  = action::kPriorityChanged;
    event.old_values.Set("editorial_priority", static_cast<int64_t>(record.editorial_priority));
    event.new_values.Set("editorial_priority", static_cast<int64_t>(priority));
    event.reason     = "Editorial priority changed";
    event.actor_id   = actor_id;
    event.session_id = session;

    record.editorial_priority = priority;
    auto saved                = store_->Save(tx, std::move(record));
    audit_->Append(tx, event);
    cache_->OnNarrativeUpdated(tx, saved);
    return saved;
  });

  RecordAudit(action::kPriorityChanged);
  return updated;
}

NarrativeRecord CurationEngine::AssignReviewer(const std::string& narrative_id, const std::string& reviewer_id, const std::string& actor_id) {
  RequireActor(actor_id, "actor_id");
  RequireActor(reviewer_id, "reviewer_id");

  const auto session = util::NewId();
  auto       updated = Mutate({narrative_id}, [&](db::Transaction& tx) {
    auto record = store_->GetForUpdate(tx, narrative_id);

    AuditEvent event;
    event.narrative_id = narrative_id;
    event.action_type  = action::kReviewerAssigned;
    event.old_values.Set("reviewer_id", record.reviewer_id);
    event.new_values.Set("reviewer_id", reviewer_id);
    event.reason     = "Reviewer assigned";
    event.actor_id   = actor_id;
    event.session_id = session;

    record.reviewer_id = reviewer_id;
    auto saved         = store_->Save(tx, std::move(record));
    audit_->Append(tx, event);
    cache_->OnNarrativeUpdated(tx, saved);
    return saved;
  });

  RecordAudit(action::kReviewerAssigned);
  return updated;
}

NarrativeRecord CurationEngine::SetReviewDeadline(const std::string& narrative_id, std::optional<uint64_t> deadline_ms, const std::string& actor_id) {
  RequireActor(actor_id, "actor_id");

  const auto session = util::NewId();
  auto       updated = Mutate({narrative_id}, [&](db::Transaction& tx) {
    auto record = store_->GetForUpdate(tx, narrative_id);

    AuditEvent event;
    event.narrative_id = narrative_id;
    event.action_type  = action::kReviewDeadlineSet;
    if (record.review_deadline_ms) {
      event.old_values.Set("review_deadline_ms", static_cast<int64_t>(*record.review_deadline_ms));
    } else {
      event.old_values.SetNull("review_deadline_ms");
    }
    if (deadline_ms) {
      event.new_values.Set("review_deadline_ms", static_cast<int64_t>(*deadline_ms));
    } else {
      event.new_values.SetNull("review_deadline_ms");
    }
    event.reason     = deadline_ms ? "Review deadline set" : "Review deadline cleared";
    event.actor_id   = actor_id;
    event.session_id = session;

    record.review_deadline_ms = deadline_ms;
    auto saved                = store_->Save(tx, std::move(record));
    audit_->Append(tx, event);
    cache_->OnNarrativeUpdated(tx, saved);
    return saved;
  });

  RecordAudit(action::kReviewDeadlineSet);
  return updated;
}

std::vector<NarrativeRecord> CurationEngine::DeleteNarrative(const std::string& narrative_id, const std::string& actor_id,
                                                             const std::string& reason) {
  RequireActor(actor_id, "actor_id");

  const auto session = util::NewId();
  auto       removed = Mutate({narrative_id}, [&](db::Transaction& tx) {
    auto target  = store_->Get(tx, narrative_id);
    auto deleted = store_->Delete(tx, narrative_id);

    for (const auto& record : deleted) {
      AuditEvent event;
      event.narrative_id = record.id;
      event.action_type  = action::kDeleted;
      event.old_values.Set("title", record.title).Set("status", narrative::model::ToString(record.status)).Set("parent_id", record.parent_id);
      event.reason     = reason.empty() ? "Narrative deleted" : reason;
      event.actor_id   = actor_id;
      event.session_id = session;
      audit_->Append(tx, event);
    }

    if (target.parent_id) {
      cache_->OnChildDetached(tx, *target.parent_id, target.id);
    } else {
      cache_->OnRootRemoved(tx, target.id);
    }
    return deleted;
  });

  RecordAudit(action::kDeleted, removed.size());
  NARRATIVE_LOG_INFO("narrative deleted", {observability::StringField("narrative_id", narrative_id), observability::StringField("actor_id", actor_id),
                                           observability::IntField("removed", static_cast<int64_t>(removed.size()))});
  return removed;
}

NarrativeRecord CurationEngine::GetNarrative(const std::string& narrative_id) {
  return InTransaction([&](db::Transaction& tx) { return store_->Get(tx, narrative_id); });
}

std::vector<NarrativeRecord> CurationEngine::GetChildren(const std::string& parent_id) {
  return InTransaction([&](db::Transaction& tx) { return store_->GetChildren(tx, parent_id); });
}

std::optional<NarrativeRecord> CurationEngine::GetParent(const std::string& child_id) {
  return InTransaction([&](db::Transaction& tx) { return store_->GetParent(tx, child_id); });
}

NarrativeRecord CurationEngine::GetRoot(const std::string& narrative_id) {
  return InTransaction([&](db::Transaction& tx) { return store_->GetRoot(tx, narrative_id); });
}

NarrativeDetails CurationEngine::Details(const std::string& narrative_id) {
  return InTransaction([&](db::Transaction& tx) {
    NarrativeDetails details;
    details.narrative = store_->Get(tx, narrative_id);
    if (details.narrative.parent_id) details.parent = store_->Find(tx, *details.narrative.parent_id);
    details.children        = repository_->ListChildren(tx, narrative_id);
    details.cluster_groups  = groups_->List(tx, narrative_id);
    details.recent_activity = audit_->Recent(tx, narrative_id, limits_.audit_entries_in_details);
    return details;
  });
}

std::vector<db::model::CurationLogRecord> CurationEngine::AuditTrail(const std::string& narrative_id) {
  return InTransaction([&](db::Transaction& tx) { return audit_->ForNarrative(tx, narrative_id); });
}

ClusterGroupRecord CurationEngine::CreateClusterGroup(const ClusterGroupDraft& draft) {
  std::shared_lock structure(structure_mutex_);
  return InTransaction([&](db::Transaction& tx) { return groups_->CreateGroup(tx, draft); });
}

ClusterGroupRecord CurationEngine::LinkClusterGroup(const std::string& group_id, const std::string& parent_narrative_id, const std::string& actor_id) {
  RequireActor(actor_id, "actor_id");

  const auto session = util::NewId();
  auto       linked  = Mutate({parent_narrative_id}, {GroupKey(group_id)}, [&](db::Transaction& tx) {
    const auto before = groups_->Get(tx, group_id);
    auto       group  = groups_->LinkToParent(tx, group_id, parent_narrative_id);

    AuditEvent event;
    event.narrative_id = parent_narrative_id;
    event.action_type  = action::kClusterGroupLinked;
    event.old_values.Set("parent_narrative_id", before.parent_narrative_id);
    event.new_values.Set("group_id", group.id).Set("group_name", group.name).Set("cluster_ids", group.cluster_ids);
    event.reason     = "Cluster group linked";
    event.actor_id   = actor_id;
    event.session_id = session;
    audit_->Append(tx, event);
    return group;
  });

  RecordAudit(action::kClusterGroupLinked);
  return linked;
}

ClusterGroupRecord CurationEngine::ApproveClusterGroup(const std::string& group_id, const std::string& reviewer_id, const std::string& review_notes) {
  std::shared_lock structure(structure_mutex_);
  auto             group_lock = LockKeys({GroupKey(group_id)});
  return InTransaction([&](db::Transaction& tx) { return groups_->Approve(tx, group_id, reviewer_id, review_notes); });
}

ClusterGroupRecord CurationEngine::GetClusterGroup(const std::string& group_id) {
  return InTransaction([&](db::Transaction& tx) { return groups_->Get(tx, group_id); });
}

std::vector<ClusterGroupRecord> CurationEngine::ListClusterGroups(const std::optional<std::string>& parent_narrative_id) {
  return InTransaction([&](db::Transaction& tx) { return groups_->List(tx, parent_narrative_id); });
}

std::vector<DashboardRow> CurationEngine::Dashboard(DashboardQuery query) {
  if (query.limit == 0) query.limit = limits_.default_dashboard_limit;
  if (query.limit > limits_.max_dashboard_limit) {
    throw util::ValidationError("dashboard limit must be in [1," + std::to_string(limits_.max_dashboard_limit) + "]");
  }
  return InTransaction([&](db::Transaction& tx) { return reports_->Dashboard(tx, query); });
}

std::vector<PendingReview> CurationEngine::PendingReviews(const std::optional<std::string>& reviewer_id) {
  auto reviews = InTransaction([&](db::Transaction& tx) { return reports_->PendingReviews(tx, reviewer_id); });
  if (!reviewer_id) observability::Metrics::Instance().SetPendingReviews(reviews.size());
  return reviews;
}

WorkflowReport CurationEngine::ValidateWorkflow() {
  auto report = InTransaction([&](db::Transaction& tx) { return reports_->ValidateWorkflow(tx); });
  if (report.overall_status != CheckStatus::kPass) {
    NARRATIVE_LOG_WARN("workflow validation found issues", {observability::StringField("overall_status", ToString(report.overall_status))});
  }
  return report;
}

IntegrityReport CurationEngine::ValidateIntegrity() {
  return InTransaction([&](db::Transaction& tx) { return store_->ValidateIntegrity(tx); });
}

HierarchyStats CurationEngine::Stats() {
  return InTransaction([&](db::Transaction& tx) { return reports_->Stats(tx); });
}

db::model::HierarchyCacheRecord CurationEngine::GetHierarchyCache(const std::string& parent_id) {
  auto entry = InTransaction([&](db::Transaction& tx) { return cache_->Get(tx, parent_id); });
  if (!entry) throw util::NotFound("hierarchy cache entry for " + parent_id);
  return std::move(*entry);
}

std::vector<db::model::HierarchyCacheRecord> CurationEngine::ListHierarchyCache() {
  return InTransaction([&](db::Transaction& tx) { return cache_->List(tx); });
}

RefreshResult CurationEngine::RefreshHierarchyCache() {
  std::unique_lock structure(structure_mutex_);
  auto             result = InTransaction([&](db::Transaction& tx) { return cache_->Refresh(tx); });
  NARRATIVE_LOG_INFO("hierarchy cache refreshed", {observability::IntField("written", static_cast<int64_t>(result.entries_written)),
                                                   observability::IntField("removed", static_cast<int64_t>(result.entries_removed))});
  return result;
}

} // namespace narrative::core
