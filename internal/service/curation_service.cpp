#include "curation_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/core/curation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/time.hpp"

namespace narrative::service {

using namespace narrative::curation::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

using narrative::observability::Route;

template <typename Fn>
auto ObserveRpc(Route route, const std::string& narrative_id, Fn&& fn) {
  narrative::observability::SpanScope span(route);
  if (!narrative_id.empty()) {
    span.SetAttribute("narrative.id", narrative_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    narrative::observability::Metrics::Instance().RecordRequest(route, true);
    narrative::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    NARRATIVE_LOG_ERROR("RPC failed", {narrative::observability::RouteField(route), narrative::observability::StringField("error", ex.what()),
                                       narrative::observability::StringField("narrative_id", narrative_id)});
    narrative::observability::Metrics::Instance().RecordRequest(route, false);
    narrative::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& values) {
  return {values.begin(), values.end()};
}

NarrativeResponse Wrap(const narrative::db::model::NarrativeRecord& record) {
  NarrativeResponse resp;
  *resp.mutable_narrative() = ToProto(record);
  return resp;
}

ClusterGroupResponse Wrap(const narrative::db::model::ClusterGroupRecord& record) {
  ClusterGroupResponse resp;
  *resp.mutable_group() = ToProto(record);
  return resp;
}

} // namespace

CurationService::CurationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine) throw std::invalid_argument("CurationService: engine is required");
}

NarrativeResponse CurationService::IngestPipelineNarrative(const IngestPipelineNarrativeRequest& req) {
  return ObserveRpc(Route::kIngestPipelineNarrative, "", [&] {
    narrative::core::PipelineNarrative input;
    input.title             = req.title();
    input.summary           = req.summary();
    input.confidence_rating = req.confidence_rating();
    return Wrap(ctx_.engine->IngestPipelineNarrative(input));
  });
}

NarrativeResponse CurationService::CreateManualParent(const CreateManualParentRequest& req) {
  return ObserveRpc(Route::kCreateManualParent, "", [&] {
    narrative::core::ManualParentRequest request;
    request.title       = req.title();
    request.summary     = req.summary();
    request.curator_id  = req.curator_id();
    request.cluster_ids = ToVector(req.cluster_ids());
    if (req.editorial_priority() != 0) request.editorial_priority = req.editorial_priority();
    if (req.has_review_deadline_ms()) request.review_deadline_ms = req.review_deadline_ms();
    return Wrap(ctx_.engine->CreateManualParent(request));
  });
}

AssignChildrenResponse CurationService::AssignChildren(const AssignChildrenRequest& req) {
  return ObserveRpc(Route::kAssignChildren, req.parent_id(), [&] {
    const auto result = ctx_.engine->AssignChildren(req.parent_id(), ToVector(req.child_ids()), req.curator_id(), req.rationale());

    AssignChildrenResponse resp;
    resp.set_assigned_count(static_cast<uint32_t>(result.assigned_count));
    for (const auto& id : result.assigned_ids) {
      resp.add_assigned_ids(id);
    }
    for (const auto& id : result.skipped_ids) {
      resp.add_skipped_ids(id);
    }
    return resp;
  });
}

NarrativeResponse CurationService::DetachChild(const DetachChildRequest& req) {
  return ObserveRpc(Route::kDetachChild, req.child_id(),
                    [&] { return Wrap(ctx_.engine->DetachChild(req.child_id(), req.curator_id(), req.reason())); });
}

UpdateStatusResponse CurationService::UpdateStatus(const UpdateStatusRequest& req) {
  return ObserveRpc(Route::kUpdateStatus, req.narrative_id(), [&] {
    const auto change = ctx_.engine->UpdateStatus(req.narrative_id(), FromProto(req.status()), req.actor_id(), req.notes());

    UpdateStatusResponse resp;
    resp.set_previous_status(ToProto(change.previous));
    *resp.mutable_narrative() = ToProto(change.narrative);
    return resp;
  });
}

NarrativeResponse CurationService::AddCurationNote(const AddCurationNoteRequest& req) {
  return ObserveRpc(Route::kAddCurationNote, req.narrative_id(),
                    [&] { return Wrap(ctx_.engine->AddCurationNote(req.narrative_id(), req.actor_id(), req.action(), req.detail())); });
}

NarrativeResponse CurationService::SetEditorialPriority(const SetEditorialPriorityRequest& req) {
  return ObserveRpc(Route::kSetEditorialPriority, req.narrative_id(),
                    [&] { return Wrap(ctx_.engine->SetEditorialPriority(req.narrative_id(), req.editorial_priority(), req.actor_id())); });
}

NarrativeResponse CurationService::AssignReviewer(const AssignReviewerRequest& req) {
  return ObserveRpc(Route::kAssignReviewer, req.narrative_id(),
                    [&] { return Wrap(ctx_.engine->AssignReviewer(req.narrative_id(), req.reviewer_id(), req.actor_id())); });
}

NarrativeResponse CurationService::SetReviewDeadline(const SetReviewDeadlineRequest& req) {
  return ObserveRpc(Route::kSetReviewDeadline, req.narrative_id(), [&] {
    std::optional<uint64_t> deadline;
    if (req.has_review_deadline_ms()) deadline = req.review_deadline_ms();
    return Wrap(ctx_.engine->SetReviewDeadline(req.narrative_id(), deadline, req.actor_id()));
  });
}

DeleteNarrativeResponse CurationService::DeleteNarrative(const DeleteNarrativeRequest& req) {
  return ObserveRpc(Route::kDeleteNarrative, req.narrative_id(), [&] {
    DeleteNarrativeResponse resp;
    for (const auto& record : ctx_.engine->DeleteNarrative(req.narrative_id(), req.actor_id(), req.reason())) {
      resp.add_deleted_ids(record.id);
    }
    return resp;
  });
}

NarrativeResponse CurationService::GetNarrative(const GetNarrativeRequest& req) {
  return ObserveRpc(Route::kGetNarrative, req.narrative_id(), [&] { return Wrap(ctx_.engine->GetNarrative(req.narrative_id())); });
}

GetChildrenResponse CurationService::GetChildren(const GetNarrativeRequest& req) {
  return ObserveRpc(Route::kGetChildren, req.narrative_id(), [&] {
    GetChildrenResponse resp;
    for (const auto& child : ctx_.engine->GetChildren(req.narrative_id())) {
      *resp.add_children() = ToProto(child);
    }
    return resp;
  });
}

GetParentResponse CurationService::GetParent(const GetNarrativeRequest& req) {
  return ObserveRpc(Route::kGetParent, req.narrative_id(), [&] {
    GetParentResponse resp;
    if (auto parent = ctx_.engine->GetParent(req.narrative_id())) {
      *resp.mutable_parent() = ToProto(*parent);
    }
    return resp;
  });
}

NarrativeResponse CurationService::GetRoot(const GetNarrativeRequest& req) {
  return ObserveRpc(Route::kGetRoot, req.narrative_id(), [&] { return Wrap(ctx_.engine->GetRoot(req.narrative_id())); });
}

NarrativeDetailsResponse CurationService::GetNarrativeDetails(const GetNarrativeRequest& req) {
  return ObserveRpc(Route::kGetNarrativeDetails, req.narrative_id(), [&] {
    const auto details = ctx_.engine->Details(req.narrative_id());

    NarrativeDetailsResponse resp;
    *resp.mutable_narrative() = ToProto(details.narrative);
    if (details.parent) *resp.mutable_parent() = ToProto(*details.parent);
    for (const auto& child : details.children) {
      *resp.add_children() = ToProto(child);
    }
    for (const auto& group : details.cluster_groups) {
      *resp.add_cluster_groups() = ToProto(group);
    }
    for (const auto& entry : details.recent_activity) {
      *resp.add_recent_activity() = ToProto(entry);
    }
    return resp;
  });
}

AuditTrailResponse CurationService::GetAuditTrail(const GetNarrativeRequest& req) {
  return ObserveRpc(Route::kGetAuditTrail, req.narrative_id(), [&] {
    AuditTrailResponse resp;
    for (const auto& entry : ctx_.engine->AuditTrail(req.narrative_id())) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

ClusterGroupResponse CurationService::CreateClusterGroup(const CreateClusterGroupRequest& req) {
  return ObserveRpc(Route::kCreateClusterGroup, "", [&] {
    narrative::core::ClusterGroupDraft draft;
    draft.name                   = req.name();
    draft.description            = req.description();
    draft.cluster_ids            = ToVector(req.cluster_ids());
    draft.curator_id             = req.curator_id();
    draft.rationale              = req.rationale();
    draft.strategic_significance = req.strategic_significance();
    return Wrap(ctx_.engine->CreateClusterGroup(draft));
  });
}

ClusterGroupResponse CurationService::LinkClusterGroup(const LinkClusterGroupRequest& req) {
  return ObserveRpc(Route::kLinkClusterGroup, req.parent_narrative_id(),
                    [&] { return Wrap(ctx_.engine->LinkClusterGroup(req.group_id(), req.parent_narrative_id(), req.actor_id())); });
}

ClusterGroupResponse CurationService::ApproveClusterGroup(const ApproveClusterGroupRequest& req) {
  return ObserveRpc(Route::kApproveClusterGroup, "",
                    [&] { return Wrap(ctx_.engine->ApproveClusterGroup(req.group_id(), req.reviewer_id(), req.review_notes())); });
}

ListClusterGroupsResponse CurationService::ListClusterGroups(const ListClusterGroupsRequest& req) {
  return ObserveRpc(Route::kListClusterGroups, req.parent_narrative_id(), [&] {
    std::optional<std::string> parent;
    if (req.has_parent_narrative_id()) parent = req.parent_narrative_id();

    ListClusterGroupsResponse resp;
    for (const auto& group : ctx_.engine->ListClusterGroups(parent)) {
      *resp.add_groups() = ToProto(group);
    }
    return resp;
  });
}

DashboardResponse CurationService::GetDashboard(const DashboardRequest& req) {
  return ObserveRpc(Route::kGetDashboard, "", [&] {
    narrative::core::DashboardQuery query;
    if (req.has_curator_id()) query.curator_id = req.curator_id();
    for (auto status : req.statuses()) {
      query.statuses.push_back(FromProto(static_cast<CurationStatus>(status)));
    }
    query.limit = req.limit();

    DashboardResponse resp;
    for (const auto& row : ctx_.engine->Dashboard(std::move(query))) {
      *resp.add_rows() = ToProto(row);
    }
    return resp;
  });
}

PendingReviewsResponse CurationService::GetPendingReviews(const PendingReviewsRequest& req) {
  return ObserveRpc(Route::kGetPendingReviews, "", [&] {
    std::optional<std::string> reviewer;
    if (req.has_reviewer_id()) reviewer = req.reviewer_id();

    PendingReviewsResponse resp;
    for (const auto& review : ctx_.engine->PendingReviews(reviewer)) {
      *resp.add_items() = ToProto(review);
    }
    return resp;
  });
}

WorkflowReport CurationService::ValidateWorkflow(const ValidateWorkflowRequest&) {
  return ObserveRpc(Route::kValidateWorkflow, "", [&] { return ToProto(ctx_.engine->ValidateWorkflow()); });
}

IntegrityReport CurationService::ValidateIntegrity(const ValidateIntegrityRequest&) {
  return ObserveRpc(Route::kValidateIntegrity, "", [&] { return ToProto(ctx_.engine->ValidateIntegrity()); });
}

HierarchyCacheResponse CurationService::GetHierarchyCache(const HierarchyCacheRequest& req) {
  return ObserveRpc(Route::kGetHierarchyCache, req.parent_id(), [&] {
    HierarchyCacheResponse resp;
    if (!req.parent_id().empty()) {
      *resp.add_entries() = ToProto(ctx_.engine->GetHierarchyCache(req.parent_id()));
      return resp;
    }
    for (const auto& entry : ctx_.engine->ListHierarchyCache()) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

RefreshHierarchyCacheResponse CurationService::RefreshHierarchyCache(const RefreshHierarchyCacheRequest&) {
  return ObserveRpc(Route::kRefreshHierarchyCache, "", [&] {
    const auto result = ctx_.engine->RefreshHierarchyCache();

    RefreshHierarchyCacheResponse resp;
    resp.set_entries_written(static_cast<uint32_t>(result.entries_written));
    resp.set_entries_removed(static_cast<uint32_t>(result.entries_removed));
    return resp;
  });
}

HierarchyStats CurationService::GetHierarchyStats(const HierarchyStatsRequest&) {
  return ObserveRpc(Route::kGetHierarchyStats, "", [&] { return ToProto(ctx_.engine->Stats()); });
}

HealthCheckResponse CurationService::HealthCheck(const HealthCheckRequest&) {
  return ObserveRpc(Route::kHealthCheck, "", [&] {
    HealthCheckResponse resp;
    if (ctx_.repository) {
      auto tx = ctx_.repository->Begin();
      ctx_.repository->CountCurationLog(*tx);
      tx->Commit();
    }
    resp.set_status("SERVING");
    resp.set_checked_at_ms(ctx_.clock ? ctx_.clock->NowMs() : narrative::util::ToUnixMillis(narrative::util::Now()));
    return resp;
  });
}

} // namespace narrative::service
