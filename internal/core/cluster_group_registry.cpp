#include "cluster_group_registry.hpp"

#include "internal/core/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace narrative::core {

using db::model::ClusterGroupRecord;
using narrative::model::ClusterGroupStatus;

ClusterGroupRegistry::ClusterGroupRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock,
                                           CurationLimits limits)
    : repository_(std::move(repository)), clock_(std::move(clock)), limits_(limits) {
}

ClusterGroupRecord ClusterGroupRegistry::CreateGroup(db::Transaction& tx, const ClusterGroupDraft& draft) {
  if (draft.name.empty()) throw util::ValidationError("cluster group name is required");
  if (Utf8Length(draft.name) > limits_.max_group_name_length) {
    throw util::ValidationError("cluster group name exceeds " + std::to_string(limits_.max_group_name_length) + " characters");
  }
  if (draft.cluster_ids.empty()) throw util::ValidationError("cluster group needs at least one cluster id");
  if (draft.cluster_ids.size() > limits_.max_cluster_ids) {
    throw util::ValidationError("cluster group exceeds " + std::to_string(limits_.max_cluster_ids) + " cluster ids");
  }
  if (draft.curator_id.empty()) throw util::ValidationError("curator_id is required");

  ClusterGroupRecord group;
  group.id                     = util::NewId();
  group.name                   = draft.name;
  group.description            = draft.description;
  group.cluster_ids            = draft.cluster_ids;
  group.curator_id             = draft.curator_id;
  group.rationale              = draft.rationale;
  group.strategic_significance = draft.strategic_significance;
  group.status                 = ClusterGroupStatus::kDraft;
  group.created_at_ms          = clock_->NowMs();
  group.updated_at_ms          = group.created_at_ms;

  ThrowIfDbError(repository_->InsertClusterGroup(tx, group), "insert cluster group " + group.name);
  return group;
}

ClusterGroupRecord ClusterGroupRegistry::LinkToParent(db::Transaction& tx, const std::string& group_id, const std::string& parent_narrative_id) {
  auto group  = Get(tx, group_id);
  auto parent = repository_->GetNarrative(tx, parent_narrative_id);
  if (!parent) {
    throw util::InvalidParentReference("narrative " + parent_narrative_id + " does not exist");
  }
  if (!parent->IsManualRoot()) {
    throw util::ValidationError("narrative " + parent_narrative_id + " is not a manual parent narrative");
  }

  group.parent_narrative_id = parent_narrative_id;
  group.updated_at_ms       = clock_->NowMs();
  ThrowIfDbError(repository_->UpdateClusterGroup(tx, group), "link cluster group " + group_id);
  return group;
}

ClusterGroupRecord ClusterGroupRegistry::Approve(db::Transaction& tx, const std::string& group_id, const std::string& reviewer_id,
                                                 const std::string& review_notes) {
  if (reviewer_id.empty()) throw util::ValidationError("reviewer_id is required");

  auto group = Get(tx, group_id);
  auto next  = narrative::model::NextStage(group.status);
  if (!next) {
    throw util::InvalidTransition("cluster group " + group_id + " is already approved");
  }

  const auto now    = clock_->NowMs();
  group.status      = *next;
  group.reviewer_id = reviewer_id;
  if (!review_notes.empty()) group.review_notes = review_notes;
  group.updated_at_ms = now;
  if (group.status == ClusterGroupStatus::kApproved) group.approved_at_ms = now;

  ThrowIfDbError(repository_->UpdateClusterGroup(tx, group), "approve cluster group " + group_id);
  return group;
}

ClusterGroupRecord ClusterGroupRegistry::Get(db::Transaction& tx, const std::string& group_id) {
  auto group = repository_->GetClusterGroup(tx, group_id);
  if (!group) throw util::NotFound("cluster group " + group_id);
  return std::move(*group);
}

std::vector<ClusterGroupRecord> ClusterGroupRegistry::List(db::Transaction& tx, const std::optional<std::string>& parent_narrative_id) {
  return repository_->ListClusterGroups(tx, parent_narrative_id);
}

} // namespace narrative::core
