#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace narrative::observability {

/*
  RPC routes of narrative.curation.v1.CurationService.

  Spans are named "<service>/<method>" and every request metric and
  log line carries the method name. Mutating routes write narrative
  state and audit entries; the rest only read.
*/

inline constexpr std::string_view kCurationServiceName = "narrative.curation.v1.CurationService";

enum class Route : std::uint8_t {
  kIngestPipelineNarrative,
  kCreateManualParent,
  kAssignChildren,
  kDetachChild,
  kUpdateStatus,
  kAddCurationNote,
  kSetEditorialPriority,
  kAssignReviewer,
  kSetReviewDeadline,
  kDeleteNarrative,
  kGetNarrative,
  kGetChildren,
  kGetParent,
  kGetRoot,
  kGetNarrativeDetails,
  kGetAuditTrail,
  kCreateClusterGroup,
  kLinkClusterGroup,
  kApproveClusterGroup,
  kListClusterGroups,
  kGetDashboard,
  kGetPendingReviews,
  kValidateWorkflow,
  kValidateIntegrity,
  kGetHierarchyCache,
  kRefreshHierarchyCache,
  kGetHierarchyStats,
  kHealthCheck,
};

struct RouteInfo {
  Route            route;
  std::string_view method;
  bool             mutating;
};

// Indexed by Route.
inline constexpr std::array<RouteInfo, 28> kRoutes = {{
    {Route::kIngestPipelineNarrative, "IngestPipelineNarrative", true},
    {Route::kCreateManualParent, "CreateManualParent", true},
    {Route::kAssignChildren, "AssignChildren", true},
    {Route::kDetachChild, "DetachChild", true},
    {Route::kUpdateStatus, "UpdateStatus", true},
    {Route::kAddCurationNote, "AddCurationNote", true},
    {Route::kSetEditorialPriority, "SetEditorialPriority", true},
    {Route::kAssignReviewer, "AssignReviewer", true},
    {Route::kSetReviewDeadline, "SetReviewDeadline", true},
    {Route::kDeleteNarrative, "DeleteNarrative", true},
    {Route::kGetNarrative, "GetNarrative", false},
    {Route::kGetChildren, "GetChildren", false},
    {Route::kGetParent, "GetParent", false},
    {Route::kGetRoot, "GetRoot", false},
    {Route::kGetNarrativeDetails, "GetNarrativeDetails", false},
    {Route::kGetAuditTrail, "GetAuditTrail", false},
    {Route::kCreateClusterGroup, "CreateClusterGroup", true},
    {Route::kLinkClusterGroup, "LinkClusterGroup", true},
    {Route::kApproveClusterGroup, "ApproveClusterGroup", true},
    {Route::kListClusterGroups, "ListClusterGroups", false},
    {Route::kGetDashboard, "GetDashboard", false},
    {Route::kGetPendingReviews, "GetPendingReviews", false},
    {Route::kValidateWorkflow, "ValidateWorkflow", false},
    {Route::kValidateIntegrity, "ValidateIntegrity", false},
    {Route::kGetHierarchyCache, "GetHierarchyCache", false},
    {Route::kRefreshHierarchyCache, "RefreshHierarchyCache", true},
    {Route::kGetHierarchyStats, "GetHierarchyStats", false},
    {Route::kHealthCheck, "HealthCheck", false},
}};

constexpr const RouteInfo& Describe(Route route) {
  return kRoutes[static_cast<std::size_t>(route)];
}

constexpr std::string_view MethodName(Route route) {
  return Describe(route).method;
}

constexpr bool IsMutating(Route route) {
  return Describe(route).mutating;
}

inline std::string SpanName(Route route) {
  std::string name(kCurationServiceName);
  name += '/';
  name += MethodName(route);
  return name;
}

} // namespace narrative::observability
