#include "internal/core/curation_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using narrative::core::CurationEngine;
using narrative::core::ManualParentRequest;
using narrative::core::PipelineNarrative;
using narrative::db::memory::MemoryRepository;
using narrative::model::CurationStatus;
using narrative::util::ManualTimeSource;

constexpr uint64_t kStart = 1'760'000'000'000ULL;

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualTimeSource> clock      = std::make_shared<ManualTimeSource>(kStart);
  CurationEngine                    engine{repository, clock};

  std::string Ingest(const std::string& title, const std::string& confidence = "high") {
    clock->Advance(1000);
    return engine.IngestPipelineNarrative(PipelineNarrative{title, title + " summary", confidence, std::nullopt}).id;
  }

  std::string Parent(const std::string& title, int32_t priority = 3) {
    clock->Advance(1000);
    ManualParentRequest request;
    request.title              = title;
    request.summary            = title + " summary";
    request.curator_id         = "curator-1";
    request.cluster_ids        = {"cl-1"};
    request.editorial_priority = priority;
    return engine.CreateManualParent(request).id;
  }
};

void TestEditorialLifecycle() {
  Fixture f;
  const auto a = f.Ingest("Arctic shipping lanes");
  const auto b = f.Ingest("Rare earth deposits");
  const auto c = f.Ingest("Unrelated weather story");

  f.clock->Advance(1000);
  ManualParentRequest request;
  request.title              = "Greenland Dispute";
  request.summary            = "Sovereignty and resource competition around Greenland";
  request.curator_id         = "editor-7";
  request.cluster_ids        = {"cl-17", "cl-22"};
  request.editorial_priority = 2;
  const auto parent          = f.engine.CreateManualParent(request);
  assert(parent.status == CurationStatus::kManualDraft);
  assert(parent.source == narrative::model::CurationSource::kManual);
  assert(parent.curator_id == std::optional<std::string>("editor-7"));
  assert(parent.manual_cluster_ids == (std::vector<std::string>{"cl-17", "cl-22"}));
  assert(parent.display_id.rfind("EN-", 0) == 0);

  const auto assigned = f.engine.AssignChildren(parent.id, {a, b}, "editor-7", "same geopolitical thread");
  assert(assigned.assigned_count == 2);
  assert(assigned.skipped_ids.empty());
  assert(f.engine.GetNarrative(a).parent_id == std::optional<std::string>(parent.id));
  assert(f.engine.GetNarrative(b).parent_id == std::optional<std::string>(parent.id));
  assert(!f.engine.GetNarrative(c).parent_id);

  f.engine.UpdateStatus(parent.id, CurationStatus::kPendingReview, "editor-7", "ready for review");

  bool threw = false;
  try {
    f.engine.UpdateStatus(parent.id, CurationStatus::kPublished, "editor-7", "skip review");
  } catch (const narrative::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(f.engine.GetNarrative(parent.id).status == CurationStatus::kPendingReview);

  f.engine.UpdateStatus(parent.id, CurationStatus::kApproved, "chief-1", "approved");
  f.clock->Advance(5000);
  const auto published = f.engine.UpdateStatus(parent.id, CurationStatus::kPublished, "chief-1", "go live");
  assert(published.previous == CurationStatus::kApproved);
  assert(published.narrative.published_at_ms == std::optional<uint64_t>(f.clock->NowMs()));
  assert(published.narrative.published_by == std::optional<std::string>("chief-1"));

  f.engine.RefreshHierarchyCache();
  const auto entry = f.engine.GetHierarchyCache(parent.id);
  assert(entry.child_count == 2);
  assert(entry.child_ids == (std::vector<std::string>{a, b}));
  assert(entry.parent_title == "Greenland Dispute");

  // created_manual_parent, status_changed x3 (the rejected publish wrote nothing)
  const auto trail = f.engine.AuditTrail(parent.id);
  assert(trail.size() == 4);
  assert(trail.front().action_type == "created_manual_parent");
  for (std::size_t i = 1; i < trail.size(); ++i) {
    assert(trail[i].action_type == "status_changed");
    assert(trail[i].sequence > trail[i - 1].sequence);
  }
}

void TestAssignmentSharesSessionId() {
  Fixture f;
  const auto a      = f.Ingest("a");
  const auto b      = f.Ingest("b");
  const auto parent = f.Parent("parent");

  f.engine.AssignChildren(parent, {a, b}, "curator-1", "");

  const auto trail_a = f.engine.AuditTrail(a);
  const auto trail_b = f.engine.AuditTrail(b);
  assert(trail_a.back().action_type == "assigned_to_parent");
  assert(trail_b.back().action_type == "assigned_to_parent");
  assert(trail_a.back().session_id == trail_b.back().session_id);
  assert(trail_a.back().reason == "Assigned to manual parent narrative");
  assert(trail_a.back().new_values.fields().at("parent_id").string_value() == parent);

  const auto notes = f.engine.GetNarrative(parent).curation_notes;
  assert(notes.size() == 1);
  assert(notes[0].action == "children_assigned");
}

void TestAssignmentSkipsParentedAndMissingChildren() {
  Fixture f;
  const auto a      = f.Ingest("a");
  const auto b      = f.Ingest("b");
  const auto first  = f.Parent("first");
  const auto second = f.Parent("second");

  assert(f.engine.AssignChildren(first, {a}, "curator-1", "").assigned_count == 1);

  const auto result = f.engine.AssignChildren(second, {a, b, "missing", b}, "curator-1", "");
  assert(result.assigned_count == 1);
  assert(result.assigned_ids == (std::vector<std::string>{b}));
  assert(result.skipped_ids == (std::vector<std::string>{a, "missing"}));
  assert(f.engine.GetNarrative(a).parent_id == std::optional<std::string>(first));
}

void TestAssignmentRejectsInvalidParents() {
  Fixture f;
  const auto a        = f.Ingest("a");
  const auto pipeline = f.Ingest("pipeline root");

  bool threw = false;
  try {
    f.engine.AssignChildren("no-such-parent", {a}, "curator-1", "");
  } catch (const narrative::util::InvalidParentReference&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.engine.AssignChildren(pipeline, {a}, "curator-1", "");
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto parent = f.Parent("parent");
  threw             = false;
  try {
    f.engine.AssignChildren(parent, {parent}, "curator-1", "");
  } catch (const narrative::util::SelfReferenceError&) {
    threw = true;
  }
  assert(threw);

  std::vector<std::string> too_many;
  for (int i = 0; i < 21; ++i) too_many.push_back("n-" + std::to_string(i));
  threw = false;
  try {
    f.engine.AssignChildren(parent, too_many, "curator-1", "");
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!f.engine.GetNarrative(a).parent_id);
}

void TestParentWithChildrenCannotBecomeChild() {
  Fixture f;
  const auto a     = f.Ingest("a");
  const auto outer = f.Parent("outer");
  const auto inner = f.Parent("inner");
  f.engine.AssignChildren(inner, {a}, "curator-1", "");

  bool threw = false;
  try {
    f.engine.AssignChildren(outer, {inner}, "curator-1", "");
  } catch (const narrative::util::DepthViolation&) {
    threw = true;
  }
  assert(threw);
  assert(!f.engine.GetNarrative(inner).parent_id);
}

void TestDetachMakesChildARoot() {
  Fixture f;
  const auto a      = f.Ingest("a");
  const auto b      = f.Ingest("b");
  const auto parent = f.Parent("parent");
  f.engine.AssignChildren(parent, {a, b}, "curator-1", "");

  const auto detached = f.engine.DetachChild(a, "curator-1", "wrong story");
  assert(!detached.parent_id);
  assert(f.engine.GetRoot(a).id == a);
  assert(f.engine.GetRoot(b).id == parent);

  const auto entry = f.engine.GetHierarchyCache(parent);
  assert(entry.child_count == 1);
  assert(entry.child_ids == (std::vector<std::string>{b}));
  assert(f.engine.GetHierarchyCache(a).child_count == 0);

  const auto trail = f.engine.AuditTrail(a);
  assert(trail.back().action_type == "removed_from_parent");
  assert(trail.back().reason == "wrong story");

  bool threw = false;
  try {
    f.engine.DetachChild(a, "curator-1", "");
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteParentRemovesChildren() {
  Fixture f;
  const auto a      = f.Ingest("a");
  const auto b      = f.Ingest("b");
  const auto parent = f.Parent("parent");
  f.engine.AssignChildren(parent, {a, b}, "curator-1", "");

  const auto removed = f.engine.DeleteNarrative(parent, "chief-1", "duplicate");
  assert(removed.size() == 3);
  assert(removed.back().id == parent);

  bool threw = false;
  try {
    f.engine.GetNarrative(a);
  } catch (const narrative::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.engine.GetHierarchyCache(parent);
  } catch (const narrative::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // audit entries outlive the narratives they describe
  const auto trail = f.engine.AuditTrail(parent);
  assert(trail.back().action_type == "deleted");
  assert(f.engine.AuditTrail(a).back().action_type == "deleted");
}

void TestEditorialFieldUpdates() {
  Fixture f;
  const auto parent = f.Parent("parent", 4);

  assert(f.engine.SetEditorialPriority(parent, 1, "chief-1").editorial_priority == 1);

  bool threw = false;
  try {
    f.engine.SetEditorialPriority(parent, 6, "chief-1");
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  assert(f.engine.AssignReviewer(parent, "reviewer-2", "chief-1").reviewer_id == std::optional<std::string>("reviewer-2"));

  const auto deadline = kStart + 3 * narrative::util::kMillisPerDay;
  assert(f.engine.SetReviewDeadline(parent, deadline, "chief-1").review_deadline_ms == std::optional<uint64_t>(deadline));
  assert(!f.engine.SetReviewDeadline(parent, std::nullopt, "chief-1").review_deadline_ms);

  const auto noted = f.engine.AddCurationNote(parent, "reviewer-2", "", "needs a second source");
  assert(noted.curation_notes.back().action == "note");
  assert(noted.curation_notes.back().actor == "reviewer-2");

  std::set<std::string> actions;
  for (const auto& entry : f.engine.AuditTrail(parent)) actions.insert(entry.action_type);
  assert(actions.count("priority_changed") == 1);
  assert(actions.count("reviewer_assigned") == 1);
  assert(actions.count("review_deadline_set") == 1);
  assert(actions.count("note_added") == 1);
}

void TestManualParentValidation() {
  Fixture f;
  ManualParentRequest request;
  request.title      = std::string(501, 'x');
  request.summary    = "summary";
  request.curator_id = "curator-1";

  bool threw = false;
  try {
    f.engine.CreateManualParent(request);
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  // 500 code points of two-byte characters is still within the limit
  request.title.clear();
  for (int i = 0; i < 500; ++i) request.title += "\xC3\xA9";
  assert(f.engine.CreateManualParent(request).title == request.title);

  request.title      = "ok";
  request.curator_id = "";
  threw              = false;
  try {
    f.engine.CreateManualParent(request);
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestManualParentsInSameSecondGetDistinctDisplayIds() {
  Fixture f;
  ManualParentRequest request;
  request.title       = "Arctic";
  request.summary     = "summary";
  request.curator_id  = "curator-1";
  request.cluster_ids = {"cl-1"};

  const auto first = f.engine.CreateManualParent(request);
  f.clock->Advance(10);
  const auto second = f.engine.CreateManualParent(request);

  assert(first.display_id != second.display_id);
  assert(first.display_id.rfind("EN-20251009-M1760000000-", 0) == 0);
  assert(second.display_id.rfind("EN-20251009-M1760000000-", 0) == 0);
  assert(f.engine.GetNarrative(second.id).display_id == second.display_id);

  const auto pipeline_a = f.engine.IngestPipelineNarrative(PipelineNarrative{"a", "a summary", "high", std::nullopt});
  const auto pipeline_b = f.engine.IngestPipelineNarrative(PipelineNarrative{"b", "b summary", "high", std::nullopt});
  assert(pipeline_a.display_id != pipeline_b.display_id);

  bool threw = false;
  try {
    f.engine.IngestPipelineNarrative(PipelineNarrative{"c", "c summary", "high", pipeline_a.display_id});
  } catch (const narrative::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestClusterGroupLinkAndApprove() {
  Fixture f;
  const auto parent = f.Parent("parent");

  narrative::core::ClusterGroupDraft draft;
  draft.name        = "Arctic clusters";
  draft.cluster_ids = {"cl-17", "cl-22"};
  draft.curator_id  = "curator-1";
  const auto group  = f.engine.CreateClusterGroup(draft);
  assert(group.status == narrative::model::ClusterGroupStatus::kDraft);

  const auto linked = f.engine.LinkClusterGroup(group.id, parent, "curator-1");
  assert(linked.parent_narrative_id == std::optional<std::string>(parent));
  assert(f.engine.AuditTrail(parent).back().action_type == "cluster_group_linked");
  assert(f.engine.ListClusterGroups(parent).size() == 1);
  assert(f.engine.Details(parent).cluster_groups.size() == 1);

  assert(f.engine.ApproveClusterGroup(group.id, "reviewer-2", "").status == narrative::model::ClusterGroupStatus::kPendingReview);
  const auto approved = f.engine.ApproveClusterGroup(group.id, "reviewer-2", "looks right");
  assert(approved.status == narrative::model::ClusterGroupStatus::kApproved);
  assert(approved.approved_at_ms.has_value());

  bool threw = false;
  try {
    f.engine.ApproveClusterGroup(group.id, "reviewer-2", "");
  } catch (const narrative::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentAssignmentOfSameChild() {
  Fixture f;
  const auto child = f.Ingest("contested");
  std::vector<std::string> parents;
  for (int i = 0; i < 8; ++i) parents.push_back(f.Parent("parent-" + std::to_string(i)));

  std::atomic<int>         assigned{0};
  std::vector<std::thread> threads;
  for (const auto& parent : parents) {
    threads.emplace_back([&, parent] {
      for (int attempt = 0; attempt < 5; ++attempt) {
        try {
          assigned += static_cast<int>(f.engine.AssignChildren(parent, {child}, "curator-1", "").assigned_count);
          return;
        } catch (const narrative::util::ConcurrentModification&) {
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(assigned.load() == 1);
  const auto owner = f.engine.GetNarrative(child).parent_id;
  assert(owner.has_value());
  assert(std::find(parents.begin(), parents.end(), *owner) != parents.end());

  uint64_t total_children = 0;
  for (const auto& parent : parents) total_children += f.engine.GetHierarchyCache(parent).child_count;
  assert(total_children == 1);
  assert(f.engine.ValidateIntegrity().ok);
}

void TestParallelUpdatesOnDisjointRoots() {
  Fixture f;
  std::vector<std::string> roots;
  for (int i = 0; i < 6; ++i) roots.push_back(f.Parent("root-" + std::to_string(i)));

  std::vector<std::thread> threads;
  for (const auto& root : roots) {
    threads.emplace_back([&, root] {
      for (int i = 0; i < 10; ++i) {
        f.engine.AddCurationNote(root, "curator-1", "note", "note " + std::to_string(i));
      }
    });
  }
  for (auto& t : threads) t.join();

  for (const auto& root : roots) {
    assert(f.engine.GetNarrative(root).curation_notes.size() == 10);
    assert(f.engine.AuditTrail(root).size() == 11);
  }
}

void TestRefreshIsIdempotent() {
  Fixture f;
  const auto a      = f.Ingest("a", "high");
  const auto b      = f.Ingest("b", "low");
  const auto parent = f.Parent("parent");
  f.engine.AssignChildren(parent, {a, b}, "curator-1", "");

  f.engine.RefreshHierarchyCache();
  const auto second = f.engine.RefreshHierarchyCache();
  assert(second.entries_written == 0);
  assert(second.entries_removed == 0);

  const auto entry = f.engine.GetHierarchyCache(parent);
  assert(entry.confidence_diversity == 2);
}

} // namespace

int main() {
  TestEditorialLifecycle();
  TestAssignmentSharesSessionId();
  TestAssignmentSkipsParentedAndMissingChildren();
  TestAssignmentRejectsInvalidParents();
  TestParentWithChildrenCannotBecomeChild();
  TestDetachMakesChildARoot();
  TestDeleteParentRemovesChildren();
  TestEditorialFieldUpdates();
  TestManualParentValidation();
  TestManualParentsInSameSecondGetDistinctDisplayIds();
  TestClusterGroupLinkAndApprove();
  TestConcurrentAssignmentOfSameChild();
  TestParallelUpdatesOnDisjointRoots();
  TestRefreshIsIdempotent();

  std::cout << "narrative_unit_curation_engine: pass\n";
  return 0;
}
