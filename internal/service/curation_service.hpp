#pragma once

#include "narrative/curation/v1.hpp"
#include "service_context.hpp"

namespace narrative::service {

/*
  Wire-level facade over core::CurationEngine. Every call records a
  span, a request count and its latency; failures are logged and
  rethrown for the transport to map.
*/
class CurationService {
 public:
  explicit CurationService(ServiceContext ctx);

  narrative::curation::v1::NarrativeResponse
  IngestPipelineNarrative(const narrative::curation::v1::IngestPipelineNarrativeRequest& req);

  narrative::curation::v1::NarrativeResponse
  CreateManualParent(const narrative::curation::v1::CreateManualParentRequest& req);

  narrative::curation::v1::AssignChildrenResponse
  AssignChildren(const narrative::curation::v1::AssignChildrenRequest& req);

  narrative::curation::v1::NarrativeResponse
  DetachChild(const narrative::curation::v1::DetachChildRequest& req);

  narrative::curation::v1::UpdateStatusResponse
  UpdateStatus(const narrative::curation::v1::UpdateStatusRequest& req);

  narrative::curation::v1::NarrativeResponse
  AddCurationNote(const narrative::curation::v1::AddCurationNoteRequest& req);

  narrative::curation::v1::NarrativeResponse
  SetEditorialPriority(const narrative::curation::v1::SetEditorialPriorityRequest& req);

  narrative::curation::v1::NarrativeResponse
  AssignReviewer(const narrative::curation::v1::AssignReviewerRequest& req);

  narrative::curation::v1::NarrativeResponse
  SetReviewDeadline(const narrative::curation::v1::SetReviewDeadlineRequest& req);

  narrative::curation::v1::DeleteNarrativeResponse
  DeleteNarrative(const narrative::curation::v1::DeleteNarrativeRequest& req);

  narrative::curation::v1::NarrativeResponse
  GetNarrative(const narrative::curation::v1::GetNarrativeRequest& req);

  narrative::curation::v1::GetChildrenResponse
  GetChildren(const narrative::curation::v1::GetNarrativeRequest& req);

  narrative::curation::v1::GetParentResponse
  GetParent(const narrative::curation::v1::GetNarrativeRequest& req);

  narrative::curation::v1::NarrativeResponse
  GetRoot(const narrative::curation::v1::GetNarrativeRequest& req);

  narrative::curation::v1::NarrativeDetailsResponse
  GetNarrativeDetails(const narrative::curation::v1::GetNarrativeRequest& req);

  narrative::curation::v1::AuditTrailResponse
  GetAuditTrail(const narrative::curation::v1::GetNarrativeRequest& req);

  narrative::curation::v1::ClusterGroupResponse
  CreateClusterGroup(const narrative::curation::v1::CreateClusterGroupRequest& req);

  narrative::curation::v1::ClusterGroupResponse
  LinkClusterGroup(const narrative::curation::v1::LinkClusterGroupRequest& req);

  narrative::curation::v1::ClusterGroupResponse
  ApproveClusterGroup(const narrative::curation::v1::ApproveClusterGroupRequest& req);

  narrative::curation::v1::ListClusterGroupsResponse
  ListClusterGroups(const narrative::curation::v1::ListClusterGroupsRequest& req);

  narrative::curation::v1::DashboardResponse
  GetDashboard(const narrative::curation::v1::DashboardRequest& req);

  narrative::curation::v1::PendingReviewsResponse
  GetPendingReviews(const narrative::curation::v1::PendingReviewsRequest& req);

  narrative::curation::v1::WorkflowReport
  ValidateWorkflow(const narrative::curation::v1::ValidateWorkflowRequest& req);

  narrative::curation::v1::IntegrityReport
  ValidateIntegrity(const narrative::curation::v1::ValidateIntegrityRequest& req);

  narrative::curation::v1::HierarchyCacheResponse
  GetHierarchyCache(const narrative::curation::v1::HierarchyCacheRequest& req);

  narrative::curation::v1::RefreshHierarchyCacheResponse
  RefreshHierarchyCache(const narrative::curation::v1::RefreshHierarchyCacheRequest& req);

  narrative::curation::v1::HierarchyStats
  GetHierarchyStats(const narrative::curation::v1::HierarchyStatsRequest& req);

  narrative::curation::v1::HealthCheckResponse
  HealthCheck(const narrative::curation::v1::HealthCheckRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace narrative::service
