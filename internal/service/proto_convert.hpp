#pragma once

#include "internal/core/curation_engine.hpp"
#include "internal/db/model/cluster_group_record.hpp"
#include "internal/db/model/curation_log_record.hpp"
#include "internal/db/model/hierarchy_cache_record.hpp"
#include "internal/db/model/narrative_record.hpp"
#include "narrative/curation/v1.hpp"

namespace narrative::service {

/*
  Record <-> wire conversions. Enum conversions from the wire reject the
  UNSPECIFIED value with util::ValidationError.
*/

narrative::curation::v1::CurationStatus ToProto(narrative::model::CurationStatus status);
narrative::curation::v1::CurationSource ToProto(narrative::model::CurationSource source);
narrative::curation::v1::ActorType      ToProto(narrative::model::ActorType actor_type);
narrative::curation::v1::ClusterGroupStatus ToProto(narrative::model::ClusterGroupStatus status);

narrative::model::CurationStatus FromProto(narrative::curation::v1::CurationStatus status);

narrative::curation::v1::Narrative           ToProto(const db::model::NarrativeRecord& record);
narrative::curation::v1::AuditEntry          ToProto(const db::model::CurationLogRecord& record);
narrative::curation::v1::ClusterGroup        ToProto(const db::model::ClusterGroupRecord& record);
narrative::curation::v1::HierarchyCacheEntry ToProto(const db::model::HierarchyCacheRecord& record);
narrative::curation::v1::DashboardRow        ToProto(const core::DashboardRow& row);
narrative::curation::v1::PendingReview       ToProto(const core::PendingReview& review);
narrative::curation::v1::WorkflowReport      ToProto(const core::WorkflowReport& report);
narrative::curation::v1::IntegrityReport     ToProto(const core::IntegrityReport& report);
narrative::curation::v1::HierarchyStats      ToProto(const core::HierarchyStats& stats);

} // namespace narrative::service
