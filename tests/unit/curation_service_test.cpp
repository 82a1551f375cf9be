#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/curation_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/curation_service.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "narrative/curation/v1.hpp"

namespace {

namespace v1 = narrative::curation::v1;

using narrative::service::CurationService;
using narrative::util::ManualTimeSource;

constexpr uint64_t kNow = 1'750'000'000'000ULL;

narrative::service::ServiceContext BuildServiceContext(const std::shared_ptr<ManualTimeSource>& clock) {
  narrative::service::ServiceContext ctx;
  auto repository = std::make_shared<narrative::db::memory::MemoryRepository>();
  ctx.repository  = repository;
  ctx.clock       = clock;
  ctx.engine      = std::make_shared<narrative::core::CurationEngine>(repository, clock);
  return ctx;
}

std::string Ingest(CurationService& service, const std::string& title) {
  v1::IngestPipelineNarrativeRequest req;
  req.set_title(title);
  req.set_summary(title + " summary");
  req.set_confidence_rating("high");
  return service.IngestPipelineNarrative(req).narrative().id();
}

std::string CreateParent(CurationService& service, const std::string& title) {
  v1::CreateManualParentRequest req;
  req.set_title(title);
  req.set_summary("summary");
  req.set_curator_id("editor-7");
  req.add_cluster_ids("cl-17");
  req.add_cluster_ids("cl-22");
  return service.CreateManualParent(req).narrative().id();
}

void TestEditorialFlowOverWireTypes() {
  auto            clock = std::make_shared<ManualTimeSource>(kNow);
  CurationService service(BuildServiceContext(clock));

  const auto a      = Ingest(service, "a");
  const auto b      = Ingest(service, "b");
  const auto parent = CreateParent(service, "Greenland Dispute");

  v1::GetNarrativeRequest get;
  get.set_narrative_id(parent);
  const auto created = service.GetNarrative(get).narrative();
  assert(created.source() == v1::CURATION_SOURCE_MANUAL);
  assert(created.status() == v1::CURATION_STATUS_MANUAL_DRAFT);
  // priority 0 on the wire selects the default
  assert(created.editorial_priority() == 3);
  assert(created.manual_cluster_ids_size() == 2);
  assert(!created.has_parent_id());
  assert(!created.has_published_at_ms());

  v1::AssignChildrenRequest assign;
  assign.set_parent_id(parent);
  assign.add_child_ids(a);
  assign.add_child_ids(b);
  assign.add_child_ids("missing");
  assign.set_curator_id("editor-7");
  const auto assigned = service.AssignChildren(assign);
  assert(assigned.assigned_count() == 2);
  assert(assigned.skipped_ids_size() == 1);
  assert(assigned.skipped_ids(0) == "missing");

  const auto children = service.GetChildren(get);
  assert(children.children_size() == 2);

  v1::GetNarrativeRequest get_child;
  get_child.set_narrative_id(a);
  assert(service.GetParent(get_child).parent().id() == parent);
  assert(service.GetRoot(get_child).narrative().id() == parent);
  assert(!service.GetParent(get).has_parent());

  v1::UpdateStatusRequest status;
  status.set_narrative_id(parent);
  status.set_status(v1::CURATION_STATUS_PENDING_REVIEW);
  status.set_actor_id("editor-7");
  const auto moved = service.UpdateStatus(status);
  assert(moved.previous_status() == v1::CURATION_STATUS_MANUAL_DRAFT);
  assert(moved.narrative().status() == v1::CURATION_STATUS_PENDING_REVIEW);

  v1::HierarchyCacheRequest cache;
  cache.set_parent_id(parent);
  const auto entries = service.GetHierarchyCache(cache);
  assert(entries.entries_size() == 1);
  assert(entries.entries(0).child_count() == 2);
  assert(entries.entries(0).predominant_child_confidence() == "high");

  const auto details = service.GetNarrativeDetails(get);
  assert(details.children_size() == 2);
  assert(details.recent_activity_size() == 2);
  assert(details.recent_activity(0).action_type() == "status_changed");

  const auto trail = service.GetAuditTrail(get_child);
  assert(trail.entries_size() == 2);
  assert(trail.entries(0).actor_type() == v1::ACTOR_TYPE_PIPELINE);
  assert(trail.entries(1).action_type() == "assigned_to_parent");
  assert(trail.entries(1).new_values().fields().at("parent_id").string_value() == parent);

  v1::PendingReviewsRequest pending;
  assert(service.GetPendingReviews(pending).items_size() == 1);

  const auto stats = service.GetHierarchyStats(v1::HierarchyStatsRequest{});
  assert(stats.total_narratives() == 3);
  assert(stats.child_narratives() == 2);

  const auto integrity = service.ValidateIntegrity(v1::ValidateIntegrityRequest{});
  assert(integrity.ok());

  const auto workflow = service.ValidateWorkflow(v1::ValidateWorkflowRequest{});
  assert(workflow.overall_status() == "PASS");
  assert(workflow.checks_size() == 5);
}

void TestErrorsPropagateAsTypedExceptions() {
  auto            clock = std::make_shared<ManualTimeSource>(kNow);
  CurationService service(BuildServiceContext(clock));
  const auto      parent = CreateParent(service, "parent");

  v1::UpdateStatusRequest status;
  status.set_narrative_id(parent);
  status.set_status(v1::CURATION_STATUS_PUBLISHED);
  status.set_actor_id("editor-7");

  bool threw = false;
  try {
    service.UpdateStatus(status);
  } catch (const narrative::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  status.set_status(v1::CURATION_STATUS_UNSPECIFIED);
  threw = false;
  try {
    service.UpdateStatus(status);
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  v1::GetNarrativeRequest get;
  get.set_narrative_id("missing");
  threw = false;
  try {
    service.GetNarrative(get);
  } catch (const narrative::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  v1::HierarchyCacheRequest cache;
  cache.set_parent_id("missing");
  threw = false;
  try {
    service.GetHierarchyCache(cache);
  } catch (const narrative::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestClusterGroupsAndDeadlines() {
  auto            clock = std::make_shared<ManualTimeSource>(kNow);
  CurationService service(BuildServiceContext(clock));
  const auto      parent = CreateParent(service, "parent");

  v1::CreateClusterGroupRequest create;
  create.set_name("Arctic");
  create.add_cluster_ids("cl-17");
  create.set_curator_id("editor-7");
  const auto group = service.CreateClusterGroup(create).group();
  assert(group.status() == v1::CLUSTER_GROUP_STATUS_DRAFT);
  assert(!group.has_parent_narrative_id());

  v1::LinkClusterGroupRequest link;
  link.set_group_id(group.id());
  link.set_parent_narrative_id(parent);
  link.set_actor_id("editor-7");
  assert(service.LinkClusterGroup(link).group().parent_narrative_id() == parent);

  v1::ListClusterGroupsRequest list;
  list.set_parent_narrative_id(parent);
  assert(service.ListClusterGroups(list).groups_size() == 1);
  assert(service.ListClusterGroups(v1::ListClusterGroupsRequest{}).groups_size() == 1);

  v1::SetReviewDeadlineRequest deadline;
  deadline.set_narrative_id(parent);
  deadline.set_review_deadline_ms(kNow + 1000);
  deadline.set_actor_id("editor-7");
  assert(service.SetReviewDeadline(deadline).narrative().review_deadline_ms() == kNow + 1000);

  deadline.clear_review_deadline_ms();
  assert(!service.SetReviewDeadline(deadline).narrative().has_review_deadline_ms());

  v1::DeleteNarrativeRequest del;
  del.set_narrative_id(parent);
  del.set_actor_id("chief-1");
  const auto deleted = service.DeleteNarrative(del);
  assert(deleted.deleted_ids_size() == 1);
  assert(service.ListClusterGroups(v1::ListClusterGroupsRequest{}).groups_size() == 0);
}

void TestHealthCheck() {
  auto            clock = std::make_shared<ManualTimeSource>(kNow);
  CurationService service(BuildServiceContext(clock));

  const auto health = service.HealthCheck(v1::HealthCheckRequest{});
  assert(health.status() == "SERVING");
  assert(health.checked_at_ms() == kNow);
}

void TestStatusConversion() {
  using narrative::model::CurationStatus;
  for (auto status : narrative::model::kAllCurationStatuses) {
    assert(narrative::service::FromProto(narrative::service::ToProto(status)) == status);
  }
}

} // namespace

int main() {
  TestEditorialFlowOverWireTypes();
  TestErrorsPropagateAsTypedExceptions();
  TestClusterGroupsAndDeadlines();
  TestHealthCheck();
  TestStatusConversion();

  std::cout << "narrative_unit_curation_service: pass\n";
  return 0;
}
