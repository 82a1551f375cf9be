#include "curation_server.hpp"

#include "grpc_error.hpp"

namespace narrative::grpc {

using namespace narrative::curation::v1;

CurationServer::CurationServer(std::shared_ptr<narrative::service::CurationService> svc) : service_(std::move(svc)) {
}

::grpc::Status CurationServer::IngestPipelineNarrative(::grpc::ServerContext*, const IngestPipelineNarrativeRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->IngestPipelineNarrative(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::CreateManualParent(::grpc::ServerContext*, const CreateManualParentRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->CreateManualParent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::AssignChildren(::grpc::ServerContext*, const AssignChildrenRequest* req, AssignChildrenResponse* resp) {
  try {
    *resp = service_->AssignChildren(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::DetachChild(::grpc::ServerContext*, const DetachChildRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->DetachChild(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::UpdateStatus(::grpc::ServerContext*, const UpdateStatusRequest* req, UpdateStatusResponse* resp) {
  try {
    *resp = service_->UpdateStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::AddCurationNote(::grpc::ServerContext*, const AddCurationNoteRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->AddCurationNote(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::SetEditorialPriority(::grpc::ServerContext*, const SetEditorialPriorityRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->SetEditorialPriority(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::AssignReviewer(::grpc::ServerContext*, const AssignReviewerRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->AssignReviewer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::SetReviewDeadline(::grpc::ServerContext*, const SetReviewDeadlineRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->SetReviewDeadline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::DeleteNarrative(::grpc::ServerContext*, const DeleteNarrativeRequest* req, DeleteNarrativeResponse* resp) {
  try {
    *resp = service_->DeleteNarrative(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetNarrative(::grpc::ServerContext*, const GetNarrativeRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->GetNarrative(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetChildren(::grpc::ServerContext*, const GetNarrativeRequest* req, GetChildrenResponse* resp) {
  try {
    *resp = service_->GetChildren(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetParent(::grpc::ServerContext*, const GetNarrativeRequest* req, GetParentResponse* resp) {
  try {
    *resp = service_->GetParent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetRoot(::grpc::ServerContext*, const GetNarrativeRequest* req, NarrativeResponse* resp) {
  try {
    *resp = service_->GetRoot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetNarrativeDetails(::grpc::ServerContext*, const GetNarrativeRequest* req, NarrativeDetailsResponse* resp) {
  try {
    *resp = service_->GetNarrativeDetails(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetAuditTrail(::grpc::ServerContext*, const GetNarrativeRequest* req, AuditTrailResponse* resp) {
  try {
    *resp = service_->GetAuditTrail(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::CreateClusterGroup(::grpc::ServerContext*, const CreateClusterGroupRequest* req, ClusterGroupResponse* resp) {
  try {
    *resp = service_->CreateClusterGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::LinkClusterGroup(::grpc::ServerContext*, const LinkClusterGroupRequest* req, ClusterGroupResponse* resp) {
  try {
    *resp = service_->LinkClusterGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::ApproveClusterGroup(::grpc::ServerContext*, const ApproveClusterGroupRequest* req, ClusterGroupResponse* resp) {
  try {
    *resp = service_->ApproveClusterGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::ListClusterGroups(::grpc::ServerContext*, const ListClusterGroupsRequest* req, ListClusterGroupsResponse* resp) {
  try {
    *resp = service_->ListClusterGroups(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetDashboard(::grpc::ServerContext*, const DashboardRequest* req, DashboardResponse* resp) {
  try {
    *resp = service_->GetDashboard(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetPendingReviews(::grpc::ServerContext*, const PendingReviewsRequest* req, PendingReviewsResponse* resp) {
  try {
    *resp = service_->GetPendingReviews(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::ValidateWorkflow(::grpc::ServerContext*, const ValidateWorkflowRequest* req, WorkflowReport* resp) {
  try {
    *resp = service_->ValidateWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::ValidateIntegrity(::grpc::ServerContext*, const ValidateIntegrityRequest* req, IntegrityReport* resp) {
  try {
    *resp = service_->ValidateIntegrity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetHierarchyCache(::grpc::ServerContext*, const HierarchyCacheRequest* req, HierarchyCacheResponse* resp) {
  try {
    *resp = service_->GetHierarchyCache(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::RefreshHierarchyCache(::grpc::ServerContext*, const RefreshHierarchyCacheRequest* req,
                                                     RefreshHierarchyCacheResponse* resp) {
  try {
    *resp = service_->RefreshHierarchyCache(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::GetHierarchyStats(::grpc::ServerContext*, const HierarchyStatsRequest* req, HierarchyStats* resp) {
  try {
    *resp = service_->GetHierarchyStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CurationServer::HealthCheck(::grpc::ServerContext*, const HealthCheckRequest* req, HealthCheckResponse* resp) {
  try {
    *resp = service_->HealthCheck(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace narrative::grpc
