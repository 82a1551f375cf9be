#include "internal/core/curation_reports.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/curation_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using narrative::core::CheckStatus;
using narrative::core::CurationEngine;
using narrative::core::CurationReports;
using narrative::core::DashboardQuery;
using narrative::core::DashboardRow;
using narrative::core::ManualParentRequest;
using narrative::core::PipelineNarrative;
using narrative::db::memory::MemoryRepository;
using narrative::model::CurationStatus;
using narrative::util::kMillisPerDay;
using narrative::util::ManualTimeSource;

constexpr uint64_t kNow = 1'700'000'000'000ULL;

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualTimeSource> clock      = std::make_shared<ManualTimeSource>(kNow);
  CurationEngine                    engine{repository, clock};

  std::string Pipeline(const std::string& title) {
    clock->Advance(1000);
    return engine.IngestPipelineNarrative(PipelineNarrative{title, "summary", "medium", std::nullopt}).id;
  }

  std::string Manual(const std::string& title, int32_t priority, const std::string& curator = "curator-1") {
    clock->Advance(1000);
    ManualParentRequest request;
    request.title              = title;
    request.summary            = "summary";
    request.curator_id         = curator;
    request.cluster_ids        = {"cl-1", "cl-2"};
    request.editorial_priority = priority;
    return engine.CreateManualParent(request).id;
  }
};

void TestDashboardFiltersAndOrders() {
  Fixture f;
  const auto untouched = f.Pipeline("untouched pipeline story");
  const auto promoted  = f.Pipeline("promoted pipeline story");
  f.engine.UpdateStatus(promoted, CurationStatus::kPendingReview, "editor-1", "");

  const auto low    = f.Manual("low priority", 4);
  const auto high_a = f.Manual("high priority a", 1);
  const auto high_b = f.Manual("high priority b", 1, "curator-2");
  f.clock->Advance(1000);
  f.engine.AssignChildren(high_a, {untouched}, "curator-1", "");

  auto rows = f.engine.Dashboard(DashboardQuery{});
  // the untouched pipeline narrative is excluded even after being parented
  assert(rows.size() == 4);
  // priority ascending, then most recently updated first
  assert(rows[0].narrative.id == high_a);
  assert(rows[1].narrative.id == high_b);
  assert(rows[2].narrative.id == low);
  assert(rows[3].narrative.id == promoted);

  assert(rows[0].is_parent);
  assert(rows[0].child_count == 1);
  assert(rows[0].is_manual);
  assert(rows[0].manual_cluster_count == 2);
  assert(rows[0].last_activity_ms.has_value());
  assert(!rows[3].is_manual);

  DashboardQuery by_curator;
  by_curator.curator_id = "curator-2";
  rows                  = f.engine.Dashboard(by_curator);
  assert(rows.size() == 1);
  assert(rows[0].narrative.id == high_b);

  DashboardQuery by_status;
  by_status.statuses = {CurationStatus::kPendingReview};
  rows               = f.engine.Dashboard(by_status);
  assert(rows.size() == 1);
  assert(rows[0].narrative.id == promoted);

  DashboardQuery limited;
  limited.limit = 2;
  assert(f.engine.Dashboard(limited).size() == 2);

  DashboardQuery too_large;
  too_large.limit = 201;
  bool threw      = false;
  try {
    f.engine.Dashboard(too_large);
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestReviewUrgency() {
  DashboardRow row;
  row.narrative.editorial_priority = 4;
  assert(CurationReports::ReviewUrgency(row, kNow) == 4);

  row.child_count = 4;
  assert(CurationReports::ReviewUrgency(row, kNow) == 3);

  row.child_count                  = 0;
  row.narrative.editorial_priority = 2;
  assert(CurationReports::ReviewUrgency(row, kNow) == 3);

  row.narrative.review_deadline_ms = kNow + kMillisPerDay / 2;
  assert(CurationReports::ReviewUrgency(row, kNow) == 4);

  row.narrative.review_deadline_ms = kNow - 1;
  assert(CurationReports::ReviewUrgency(row, kNow) == 5);

  row.narrative.review_deadline_ms = kNow + 3 * kMillisPerDay;
  row.narrative.editorial_priority = 5;
  assert(CurationReports::ReviewUrgency(row, kNow) == 5);
}

void TestPendingReviewsOrderedByUrgency() {
  Fixture f;
  const auto relaxed = f.Manual("relaxed", 3);
  const auto due     = f.Manual("due soon", 5);
  const auto late    = f.Manual("late", 5);
  const auto draft   = f.Manual("still drafting", 1);
  (void)draft;

  for (const auto& id : {relaxed, due, late}) {
    f.engine.UpdateStatus(id, CurationStatus::kPendingReview, "curator-1", "");
  }
  f.engine.SetReviewDeadline(due, f.clock->NowMs() + kMillisPerDay / 2, "curator-1");
  f.engine.SetReviewDeadline(late, f.clock->NowMs() - 2 * kMillisPerDay - 1, "curator-1");
  f.engine.AssignReviewer(due, "reviewer-9", "curator-1");

  const auto reviews = f.engine.PendingReviews(std::nullopt);
  assert(reviews.size() == 3);
  assert(reviews[0].row.narrative.id == late);
  assert(reviews[0].review_urgency == 5);
  assert(reviews[0].row.is_overdue);
  assert(reviews[0].days_until_deadline == std::optional<int64_t>(-2));
  assert(reviews[1].row.narrative.id == due);
  assert(reviews[1].review_urgency == 4);
  assert(reviews[1].days_until_deadline == std::optional<int64_t>(0));
  assert(reviews[2].row.narrative.id == relaxed);
  assert(!reviews[2].days_until_deadline);

  const auto mine = f.engine.PendingReviews(std::string("reviewer-9"));
  assert(mine.size() == 1);
  assert(mine[0].row.narrative.id == due);
}

void TestValidateWorkflow() {
  Fixture f;
  const auto child  = f.Pipeline("child");
  const auto parent = f.Manual("parent", 3);
  f.engine.AssignChildren(parent, {child}, "curator-1", "");

  auto report = f.engine.ValidateWorkflow();
  assert(report.overall_status == CheckStatus::kPass);
  assert(report.checks.size() == 5);
  assert(report.generated_at_ms == f.clock->NowMs());
  for (const auto& check : report.checks) {
    assert(check.status == CheckStatus::kPass);
    assert(check.affected_count == 0);
    assert(check.details.rfind("no ", 0) == 0);
  }

  const auto lonely = f.Manual("lonely parent", 3);
  narrative::core::ClusterGroupDraft draft;
  draft.name        = "unlinked";
  draft.cluster_ids = {"cl-5"};
  draft.curator_id  = "curator-1";
  f.engine.CreateClusterGroup(draft);

  report = f.engine.ValidateWorkflow();
  // orphans are warnings, never failures
  assert(report.overall_status == CheckStatus::kWarning);
  for (const auto& check : report.checks) {
    if (check.check_name == "orphaned_manual_parents") {
      assert(check.status == CheckStatus::kWarning);
      assert(check.affected_count == 1);
      assert(check.details.find(lonely) != std::string::npos);
    } else if (check.check_name == "orphaned_cluster_groups") {
      assert(check.status == CheckStatus::kWarning);
      assert(check.affected_count == 1);
    } else {
      assert(check.status == CheckStatus::kPass);
    }
  }
  assert(narrative::core::ToString(report.overall_status) == "WARNING");
}

void TestStats() {
  Fixture f;
  const auto a  = f.Pipeline("a");
  const auto b  = f.Pipeline("b");
  const auto c  = f.Pipeline("c");
  const auto p1 = f.Manual("p1", 3);
  const auto p2 = f.Manual("p2", 3);
  f.Manual("p3", 3);
  f.engine.AssignChildren(p1, {a, b}, "curator-1", "");
  f.engine.AssignChildren(p2, {c}, "curator-1", "");

  const auto stats = f.engine.Stats();
  assert(stats.total_narratives == 6);
  assert(stats.root_narratives == 3);
  assert(stats.child_narratives == 3);
  assert(stats.parents_with_children == 2);
  assert(stats.max_children_per_parent == 2);
  assert(stats.avg_children_per_parent == 1.5);
}

} // namespace

int main() {
  TestDashboardFiltersAndOrders();
  TestReviewUrgency();
  TestPendingReviewsOrderedByUrgency();
  TestValidateWorkflow();
  TestStats();

  std::cout << "narrative_unit_curation_reports: pass\n";
  return 0;
}
