#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/audit_log.hpp"
#include "internal/core/cluster_group_registry.hpp"
#include "internal/core/curation_limits.hpp"
#include "internal/core/curation_reports.hpp"
#include "internal/core/curation_workflow.hpp"
#include "internal/core/hierarchy_cache.hpp"
#include "internal/core/narrative_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace narrative::core {

struct PipelineNarrative {
  std::string                title;
  std::string                summary;
  std::string                confidence_rating;
  std::optional<std::string> display_id;
};

struct ManualParentRequest {
  std::string              title;
  std::string              summary;
  std::string              curator_id;
  std::vector<std::string> cluster_ids;
  int32_t                  editorial_priority = 3;
  std::optional<uint64_t>  review_deadline_ms;
};

struct AssignmentResult {
  uint64_t                 assigned_count = 0;
  std::vector<std::string> assigned_ids;
  // Already parented or missing; not an error.
  std::vector<std::string> skipped_ids;
};

struct NarrativeDetails {
  db::model::NarrativeRecord                 narrative;
  std::optional<db::model::NarrativeRecord>  parent;
  std::vector<db::model::NarrativeRecord>    children;
  std::vector<db::model::ClusterGroupRecord> cluster_groups;
  std::vector<db::model::CurationLogRecord>  recent_activity;
};

/*
  CurationEngine

  Editorial entry points. Each mutating call runs in one repository
  transaction: the narrative rows, their audit entries and the affected
  hierarchy cache entries commit or roll back together, and every audit
  entry written by one call shares a session id.

  Concurrency:
    - mutations lock the root narratives they touch (a child is locked
      through its parent), so different subtrees proceed in parallel
    - roots are resolved before locking and re-checked inside the
      transaction; a hierarchy that moved in between is retried
    - RefreshHierarchyCache excludes all mutations while it rebuilds
*/
class CurationEngine {
 public:
  CurationEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock, CurationLimits limits = {});

  // ---------------------------------------------------------------------
  // Narratives
  // ---------------------------------------------------------------------

  db::model::NarrativeRecord IngestPipelineNarrative(const PipelineNarrative& input);
  db::model::NarrativeRecord CreateManualParent(const ManualParentRequest& request);

  AssignmentResult AssignChildren(const std::string& parent_id, const std::vector<std::string>& child_ids, const std::string& curator_id,
                                  const std::string& rationale);

  // Returns the detached child, now a root.
  db::model::NarrativeRecord DetachChild(const std::string& child_id, const std::string& curator_id, const std::string& reason);

  StatusChange UpdateStatus(const std::string& narrative_id, narrative::model::CurationStatus next, const std::string& actor_id,
                            const std::string& notes);

  db::model::NarrativeRecord AddCurationNote(const std::string& narrative_id, const std::string& actor_id, const std::string& note_action,
                                             const std::string& detail);
  db::model::NarrativeRecord SetEditorialPriority(const std::string& narrative_id, int32_t priority, const std::string& actor_id);
  db::model::NarrativeRecord AssignReviewer(const std::string& narrative_id, const std::string& reviewer_id, const std::string& actor_id);
  db::model::NarrativeRecord SetReviewDeadline(const std::string& narrative_id, std::optional<uint64_t> deadline_ms, const std::string& actor_id);

  // Returns every removed narrative, children first.
  std::vector<db::model::NarrativeRecord> DeleteNarrative(const std::string& narrative_id, const std::string& actor_id, const std::string& reason);

  db::model::NarrativeRecord                GetNarrative(const std::string& narrative_id);
  std::vector<db::model::NarrativeRecord>   GetChildren(const std::string& parent_id);
  std::optional<db::model::NarrativeRecord> GetParent(const std::string& child_id);
  db::model::NarrativeRecord                GetRoot(const std::string& narrative_id);
  NarrativeDetails                          Details(const std::string& narrative_id);
  std::vector<db::model::CurationLogRecord> AuditTrail(const std::string& narrative_id);

  // ---------------------------------------------------------------------
  // Cluster groups
  // ---------------------------------------------------------------------

  db::model::ClusterGroupRecord CreateClusterGroup(const ClusterGroupDraft& draft);
  db::model::ClusterGroupRecord LinkClusterGroup(const std::string& group_id, const std::string& parent_narrative_id, const std::string& actor_id);
  db::model::ClusterGroupRecord ApproveClusterGroup(const std::string& group_id, const std::string& reviewer_id, const std::string& review_notes);
  db::model::ClusterGroupRecord GetClusterGroup(const std::string& group_id);
  std::vector<db::model::ClusterGroupRecord> ListClusterGroups(const std::optional<std::string>& parent_narrative_id);

  // ---------------------------------------------------------------------
  // Reports and maintenance
  // ---------------------------------------------------------------------

  // limit 0 selects the configured default.
  std::vector<DashboardRow>  Dashboard(DashboardQuery query);
  std::vector<PendingReview> PendingReviews(const std::optional<std::string>& reviewer_id);
  WorkflowReport             ValidateWorkflow();
  IntegrityReport            ValidateIntegrity();
  HierarchyStats             Stats();

  db::model::HierarchyCacheRecord              GetHierarchyCache(const std::string& parent_id);
  std::vector<db::model::HierarchyCacheRecord> ListHierarchyCache();
  RefreshResult                                RefreshHierarchyCache();

  const CurationLimits& Limits() const {
    return limits_;
  }

 private:
  using LockSet = std::vector<std::unique_lock<std::mutex>>;

  std::shared_ptr<std::mutex> KeyMutex(const std::string& key);
  LockSet                     LockKeys(std::vector<std::string> keys);
  std::vector<std::string>    ResolveRoots(db::Transaction& tx, const std::vector<std::string>& narrative_ids);

  // Locks the roots of narrative_ids plus extra_keys, then runs fn in a
  // transaction that commits when fn returns.
  template <typename Fn>
  auto Mutate(const std::vector<std::string>& narrative_ids, const std::vector<std::string>& extra_keys, Fn&& fn);
  template <typename Fn>
  auto Mutate(const std::vector<std::string>& narrative_ids, Fn&& fn);

  template <typename Fn>
  auto InTransaction(Fn&& fn);

  void RequireActor(const std::string& actor_id, const char* field) const;
  void ValidateTitle(const std::string& title) const;

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const util::TimeSource> clock_;
  CurationLimits                          limits_;

  std::shared_ptr<NarrativeStore>       store_;
  std::shared_ptr<AuditLog>             audit_;
  std::shared_ptr<HierarchyCache>       cache_;
  std::shared_ptr<ClusterGroupRegistry> groups_;
  std::shared_ptr<CurationWorkflow>     workflow_;
  std::shared_ptr<CurationReports>      reports_;

  // Held shared by mutations, exclusively by a full cache rebuild.
  std::shared_mutex structure_mutex_;

  mutable std::mutex                                                   key_mutexes_guard_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

} // namespace narrative::core
