#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/curation_service.hpp"
#include "narrative/curation/v1.hpp"
#include "narrative/curation/v1/curation_service.grpc.pb.h"

namespace narrative::grpc {

class CurationServer final : public narrative::curation::v1::CurationService::Service {
 public:
  explicit CurationServer(std::shared_ptr<narrative::service::CurationService> svc);

  ::grpc::Status IngestPipelineNarrative(::grpc::ServerContext*, const narrative::curation::v1::IngestPipelineNarrativeRequest*,
                                         narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status CreateManualParent(::grpc::ServerContext*, const narrative::curation::v1::CreateManualParentRequest*,
                                    narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status AssignChildren(::grpc::ServerContext*, const narrative::curation::v1::AssignChildrenRequest*,
                                narrative::curation::v1::AssignChildrenResponse*) override;
  ::grpc::Status DetachChild(::grpc::ServerContext*, const narrative::curation::v1::DetachChildRequest*,
                             narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status UpdateStatus(::grpc::ServerContext*, const narrative::curation::v1::UpdateStatusRequest*,
                              narrative::curation::v1::UpdateStatusResponse*) override;
  ::grpc::Status AddCurationNote(::grpc::ServerContext*, const narrative::curation::v1::AddCurationNoteRequest*,
                                 narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status SetEditorialPriority(::grpc::ServerContext*, const narrative::curation::v1::SetEditorialPriorityRequest*,
                                      narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status AssignReviewer(::grpc::ServerContext*, const narrative::curation::v1::AssignReviewerRequest*,
                                narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status SetReviewDeadline(::grpc::ServerContext*, const narrative::curation::v1::SetReviewDeadlineRequest*,
                                   narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status DeleteNarrative(::grpc::ServerContext*, const narrative::curation::v1::DeleteNarrativeRequest*,
                                 narrative::curation::v1::DeleteNarrativeResponse*) override;
  ::grpc::Status GetNarrative(::grpc::ServerContext*, const narrative::curation::v1::GetNarrativeRequest*,
                              narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status GetChildren(::grpc::ServerContext*, const narrative::curation::v1::GetNarrativeRequest*,
                             narrative::curation::v1::GetChildrenResponse*) override;
  ::grpc::Status GetParent(::grpc::ServerContext*, const narrative::curation::v1::GetNarrativeRequest*,
                           narrative::curation::v1::GetParentResponse*) override;
  ::grpc::Status GetRoot(::grpc::ServerContext*, const narrative::curation::v1::GetNarrativeRequest*,
                         narrative::curation::v1::NarrativeResponse*) override;
  ::grpc::Status GetNarrativeDetails(::grpc::ServerContext*, const narrative::curation::v1::GetNarrativeRequest*,
                                     narrative::curation::v1::NarrativeDetailsResponse*) override;
  ::grpc::Status GetAuditTrail(::grpc::ServerContext*, const narrative::curation::v1::GetNarrativeRequest*,
                               narrative::curation::v1::AuditTrailResponse*) override;
  ::grpc::Status CreateClusterGroup(::grpc::ServerContext*, const narrative::curation::v1::CreateClusterGroupRequest*,
                                    narrative::curation::v1::ClusterGroupResponse*) override;
  ::grpc::Status LinkClusterGroup(::grpc::ServerContext*, const narrative::curation::v1::LinkClusterGroupRequest*,
                                  narrative::curation::v1::ClusterGroupResponse*) override;
  ::grpc::Status ApproveClusterGroup(::grpc::ServerContext*, const narrative::curation::v1::ApproveClusterGroupRequest*,
                                     narrative::curation::v1::ClusterGroupResponse*) override;
  ::grpc::Status ListClusterGroups(::grpc::ServerContext*, const narrative::curation::v1::ListClusterGroupsRequest*,
                                   narrative::curation::v1::ListClusterGroupsResponse*) override;
  ::grpc::Status GetDashboard(::grpc::ServerContext*, const narrative::curation::v1::DashboardRequest*,
                              narrative::curation::v1::DashboardResponse*) override;
  ::grpc::Status GetPendingReviews(::grpc::ServerContext*, const narrative::curation::v1::PendingReviewsRequest*,
                                   narrative::curation::v1::PendingReviewsResponse*) override;
  ::grpc::Status ValidateWorkflow(::grpc::ServerContext*, const narrative::curation::v1::ValidateWorkflowRequest*,
                                  narrative::curation::v1::WorkflowReport*) override;
  ::grpc::Status ValidateIntegrity(::grpc::ServerContext*, const narrative::curation::v1::ValidateIntegrityRequest*,
                                   narrative::curation::v1::IntegrityReport*) override;
  ::grpc::Status GetHierarchyCache(::grpc::ServerContext*, const narrative::curation::v1::HierarchyCacheRequest*,
                                   narrative::curation::v1::HierarchyCacheResponse*) override;
  ::grpc::Status RefreshHierarchyCache(::grpc::ServerContext*, const narrative::curation::v1::RefreshHierarchyCacheRequest*,
                                       narrative::curation::v1::RefreshHierarchyCacheResponse*) override;
  ::grpc::Status GetHierarchyStats(::grpc::ServerContext*, const narrative::curation::v1::HierarchyStatsRequest*,
                                   narrative::curation::v1::HierarchyStats*) override;
  ::grpc::Status HealthCheck(::grpc::ServerContext*, const narrative::curation::v1::HealthCheckRequest*,
                             narrative::curation::v1::HealthCheckResponse*) override;

 private:
  std::shared_ptr<narrative::service::CurationService> service_;
};

} // namespace narrative::grpc
