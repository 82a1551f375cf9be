#include "proto_convert.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace narrative::service {

namespace v1 = narrative::curation::v1;
using narrative::model::ActorType;
using narrative::model::ClusterGroupStatus;
using narrative::model::CurationSource;
using narrative::model::CurationStatus;

v1::CurationStatus ToProto(CurationStatus status) {
  switch (status) {
    case CurationStatus::kAutoGenerated:
      return v1::CURATION_STATUS_AUTO_GENERATED;
    case CurationStatus::kManualDraft:
      return v1::CURATION_STATUS_MANUAL_DRAFT;
    case CurationStatus::kPendingReview:
      return v1::CURATION_STATUS_PENDING_REVIEW;
    case CurationStatus::kReviewed:
      return v1::CURATION_STATUS_REVIEWED;
    case CurationStatus::kApproved:
      return v1::CURATION_STATUS_APPROVED;
    case CurationStatus::kPublished:
      return v1::CURATION_STATUS_PUBLISHED;
    case CurationStatus::kArchived:
      return v1::CURATION_STATUS_ARCHIVED;
  }
  return v1::CURATION_STATUS_UNSPECIFIED;
}

v1::CurationSource ToProto(CurationSource source) {
  switch (source) {
    case CurationSource::kPipeline:
      return v1::CURATION_SOURCE_PIPELINE;
    case CurationSource::kManual:
      return v1::CURATION_SOURCE_MANUAL;
    case CurationSource::kHybridAssisted:
      return v1::CURATION_SOURCE_HYBRID_ASSISTED;
  }
  return v1::CURATION_SOURCE_UNSPECIFIED;
}

v1::ActorType ToProto(ActorType actor_type) {
  switch (actor_type) {
    case ActorType::kUser:
      return v1::ACTOR_TYPE_USER;
    case ActorType::kSystem:
      return v1::ACTOR_TYPE_SYSTEM;
    case ActorType::kPipeline:
      return v1::ACTOR_TYPE_PIPELINE;
  }
  return v1::ACTOR_TYPE_UNSPECIFIED;
}

v1::ClusterGroupStatus ToProto(ClusterGroupStatus status) {
  switch (status) {
    case ClusterGroupStatus::kDraft:
      return v1::CLUSTER_GROUP_STATUS_DRAFT;
    case ClusterGroupStatus::kPendingReview:
      return v1::CLUSTER_GROUP_STATUS_PENDING_REVIEW;
    case ClusterGroupStatus::kApproved:
      return v1::CLUSTER_GROUP_STATUS_APPROVED;
  }
  return v1::CLUSTER_GROUP_STATUS_UNSPECIFIED;
}

CurationStatus FromProto(v1::CurationStatus status) {
  switch (status) {
    case v1::CURATION_STATUS_AUTO_GENERATED:
      return CurationStatus::kAutoGenerated;
    case v1::CURATION_STATUS_MANUAL_DRAFT:
      return CurationStatus::kManualDraft;
    case v1::CURATION_STATUS_PENDING_REVIEW:
      return CurationStatus::kPendingReview;
    case v1::CURATION_STATUS_REVIEWED:
      return CurationStatus::kReviewed;
    case v1::CURATION_STATUS_APPROVED:
      return CurationStatus::kApproved;
    case v1::CURATION_STATUS_PUBLISHED:
      return CurationStatus::kPublished;
    case v1::CURATION_STATUS_ARCHIVED:
      return CurationStatus::kArchived;
    default:
      throw util::ValidationError("curation status is required, got " + std::to_string(static_cast<int>(status)));
  }
}

v1::Narrative ToProto(const db::model::NarrativeRecord& record) {
  v1::Narrative out;
  out.set_id(record.id);
  out.set_display_id(record.display_id);
  if (record.parent_id) out.set_parent_id(*record.parent_id);
  out.set_title(record.title);
  out.set_summary(record.summary);
  out.set_source(ToProto(record.source));
  out.set_status(ToProto(record.status));
  if (record.curator_id) out.set_curator_id(*record.curator_id);
  if (record.reviewer_id) out.set_reviewer_id(*record.reviewer_id);
  if (record.published_by) out.set_published_by(*record.published_by);
  out.set_editorial_priority(record.editorial_priority);
  if (record.review_deadline_ms) out.set_review_deadline_ms(*record.review_deadline_ms);
  if (record.published_at_ms) out.set_published_at_ms(*record.published_at_ms);
  for (const auto& cluster_id : record.manual_cluster_ids) {
    out.add_manual_cluster_ids(cluster_id);
  }
  for (const auto& note : record.curation_notes) {
    auto* n = out.add_curation_notes();
    n->set_action(note.action);
    n->set_detail(note.detail);
    n->set_actor(note.actor);
    n->set_timestamp_ms(note.timestamp_ms);
  }
  out.set_confidence_rating(record.confidence_rating);
  out.set_created_at_ms(record.created_at_ms);
  out.set_updated_at_ms(record.updated_at_ms);
  out.set_version(record.version);
  return out;
}

v1::AuditEntry ToProto(const db::model::CurationLogRecord& record) {
  v1::AuditEntry out;
  out.set_sequence(record.sequence);
  out.set_id(record.id);
  out.set_narrative_id(record.narrative_id);
  out.set_action_type(record.action_type);
  *out.mutable_old_values() = record.old_values;
  *out.mutable_new_values() = record.new_values;
  out.set_reason(record.reason);
  out.set_actor_id(record.actor_id);
  out.set_actor_type(ToProto(record.actor_type));
  out.set_session_id(record.session_id);
  out.set_created_at_ms(record.created_at_ms);
  return out;
}

v1::ClusterGroup ToProto(const db::model::ClusterGroupRecord& record) {
  v1::ClusterGroup out;
  out.set_id(record.id);
  out.set_name(record.name);
  out.set_description(record.description);
  for (const auto& cluster_id : record.cluster_ids) {
    out.add_cluster_ids(cluster_id);
  }
  if (record.parent_narrative_id) out.set_parent_narrative_id(*record.parent_narrative_id);
  out.set_curator_id(record.curator_id);
  out.set_rationale(record.rationale);
  out.set_strategic_significance(record.strategic_significance);
  out.set_status(ToProto(record.status));
  if (record.reviewer_id) out.set_reviewer_id(*record.reviewer_id);
  out.set_review_notes(record.review_notes);
  out.set_created_at_ms(record.created_at_ms);
  out.set_updated_at_ms(record.updated_at_ms);
  if (record.approved_at_ms) out.set_approved_at_ms(*record.approved_at_ms);
  return out;
}

v1::HierarchyCacheEntry ToProto(const db::model::HierarchyCacheRecord& record) {
  v1::HierarchyCacheEntry out;
  out.set_parent_id(record.parent_id);
  out.set_parent_title(record.parent_title);
  out.set_child_count(record.child_count);
  for (const auto& id : record.child_ids) {
    out.add_child_ids(id);
  }
  for (const auto& title : record.child_titles) {
    out.add_child_titles(title);
  }
  if (record.first_child_created_at_ms) out.set_first_child_created_at_ms(*record.first_child_created_at_ms);
  if (record.latest_child_created_at_ms) out.set_latest_child_created_at_ms(*record.latest_child_created_at_ms);
  if (record.latest_child_updated_at_ms) out.set_latest_child_updated_at_ms(*record.latest_child_updated_at_ms);
  out.set_confidence_diversity(record.confidence_diversity);
  out.set_predominant_child_confidence(record.predominant_child_confidence);
  out.set_cache_updated_at_ms(record.cache_updated_at_ms);
  return out;
}

v1::DashboardRow ToProto(const core::DashboardRow& row) {
  v1::DashboardRow out;
  *out.mutable_narrative() = ToProto(row.narrative);
  out.set_child_count(row.child_count);
  out.set_manual_cluster_count(static_cast<uint32_t>(row.manual_cluster_count));
  out.set_is_parent(row.is_parent);
  out.set_is_manual(row.is_manual);
  out.set_is_overdue(row.is_overdue);
  if (row.last_activity_ms) out.set_last_activity_ms(*row.last_activity_ms);
  return out;
}

v1::PendingReview ToProto(const core::PendingReview& review) {
  v1::PendingReview out;
  *out.mutable_row() = ToProto(review.row);
  out.set_review_urgency(review.review_urgency);
  if (review.days_until_deadline) out.set_days_until_deadline(*review.days_until_deadline);
  return out;
}

v1::WorkflowReport ToProto(const core::WorkflowReport& report) {
  v1::WorkflowReport out;
  out.set_generated_at_ms(report.generated_at_ms);
  out.set_overall_status(std::string(core::ToString(report.overall_status)));
  for (const auto& check : report.checks) {
    auto* c = out.add_checks();
    c->set_check_name(check.check_name);
    c->set_status(std::string(core::ToString(check.status)));
    c->set_details(check.details);
    c->set_affected_count(check.affected_count);
  }
  return out;
}

v1::IntegrityReport ToProto(const core::IntegrityReport& report) {
  v1::IntegrityReport out;
  out.set_ok(report.ok);
  for (const auto& check : report.checks) {
    auto* c = out.add_checks();
    c->set_name(check.name);
    c->set_count(check.offending_ids.size());
    for (const auto& id : check.offending_ids) {
      c->add_offending_ids(id);
    }
  }
  return out;
}

v1::HierarchyStats ToProto(const core::HierarchyStats& stats) {
  v1::HierarchyStats out;
  out.set_total_narratives(stats.total_narratives);
  out.set_root_narratives(stats.root_narratives);
  out.set_child_narratives(stats.child_narratives);
  out.set_parents_with_children(stats.parents_with_children);
  out.set_avg_children_per_parent(stats.avg_children_per_parent);
  out.set_max_children_per_parent(stats.max_children_per_parent);
  return out;
}

} // namespace narrative::service
