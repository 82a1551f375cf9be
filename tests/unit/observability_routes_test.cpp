#include "internal/observability/routes.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include <google/protobuf/descriptor.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "narrative/curation/v1.hpp"

namespace {

using narrative::observability::kRoutes;
using narrative::observability::Route;

void TestRouteTableIsIndexedByRoute() {
  for (std::size_t i = 0; i < kRoutes.size(); ++i) {
    assert(static_cast<std::size_t>(kRoutes[i].route) == i);
  }
  assert(narrative::observability::MethodName(Route::kHealthCheck) == "HealthCheck");
}

void TestRoutesMatchServiceDefinition() {
  const auto* file    = narrative::curation::v1::AssignChildrenRequest::descriptor()->file();
  const auto* service = file->FindServiceByName("CurationService");
  assert(service != nullptr);
  assert(service->full_name() == narrative::observability::kCurationServiceName);
  assert(static_cast<std::size_t>(service->method_count()) == kRoutes.size());

  std::set<std::string> methods;
  for (const auto& info : kRoutes) {
    assert(service->FindMethodByName(std::string(info.method)) != nullptr);
    methods.insert(std::string(info.method));
  }
  assert(methods.size() == kRoutes.size());
}

void TestSpanNamesAndMutatingRoutes() {
  assert(narrative::observability::SpanName(Route::kAssignChildren) == "narrative.curation.v1.CurationService/AssignChildren");
  assert(narrative::observability::SpanName(Route::kGetPendingReviews) == "narrative.curation.v1.CurationService/GetPendingReviews");

  assert(narrative::observability::IsMutating(Route::kUpdateStatus));
  assert(narrative::observability::IsMutating(Route::kDeleteNarrative));
  assert(narrative::observability::IsMutating(Route::kApproveClusterGroup));
  assert(narrative::observability::IsMutating(Route::kRefreshHierarchyCache));
  assert(!narrative::observability::IsMutating(Route::kGetDashboard));
  assert(!narrative::observability::IsMutating(Route::kValidateWorkflow));
  assert(!narrative::observability::IsMutating(Route::kHealthCheck));
}

void TestRouteFieldAndNoopInstrumentation() {
  const auto field = narrative::observability::RouteField(Route::kDetachChild);
  assert(field.key == "rpc.method");
  assert(field.value == "DetachChild");

  // no exporter is configured, so spans and metrics record nothing
  narrative::observability::SpanScope span(Route::kUpdateStatus);
  span.SetAttribute("narrative.id", "n-1");
  narrative::observability::Metrics::Instance().RecordRequest(Route::kUpdateStatus, true);
  narrative::observability::Metrics::Instance().ObserveRequestLatencyMs(Route::kUpdateStatus, 1.5);
}

} // namespace

int main() {
  TestRouteTableIsIndexedByRoute();
  TestRoutesMatchServiceDefinition();
  TestSpanNamesAndMutatingRoutes();
  TestRouteFieldAndNoopInstrumentation();

  std::cout << "narrative_unit_observability_routes: pass\n";
  return 0;
}
