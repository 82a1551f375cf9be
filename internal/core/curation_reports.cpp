#include "curation_reports.hpp"

#include <algorithm>
#include <unordered_map>

namespace narrative::core {

using db::model::NarrativeRecord;
using narrative::model::CurationSource;
using narrative::model::CurationStatus;

namespace {

bool IsReviewStatus(CurationStatus status) {
  return status == CurationStatus::kPendingReview || status == CurationStatus::kReviewed;
}

bool IsClosed(CurationStatus status) {
  return status == CurationStatus::kPublished || status == CurationStatus::kArchived;
}

bool IsOverdue(const NarrativeRecord& n, uint64_t now_ms) {
  return n.review_deadline_ms && *n.review_deadline_ms < now_ms && !IsClosed(n.status);
}

std::string JoinIds(const std::vector<std::string>& ids, std::size_t max_shown = 10) {
  std::string out;
  for (std::size_t i = 0; i < ids.size() && i < max_shown; ++i) {
    if (i > 0) out += ", ";
    out += ids[i];
  }
  if (ids.size() > max_shown) out += ", ...";
  return out;
}

WorkflowCheck MakeCheck(std::string name, CheckStatus severity, const std::vector<std::string>& ids, const std::string& what) {
  WorkflowCheck check;
  check.check_name     = std::move(name);
  check.affected_count = ids.size();
  if (ids.empty()) {
    check.status  = CheckStatus::kPass;
    check.details = "no " + what;
  } else {
    check.status  = severity;
    check.details = std::to_string(ids.size()) + " " + what + ": " + JoinIds(ids);
  }
  return check;
}

} // namespace

CurationReports::CurationReports(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

std::vector<DashboardRow> CurationReports::Rows(db::Transaction& tx, uint64_t now_ms) {
  const auto narratives = repository_->ListNarratives(tx);

  std::unordered_map<std::string, uint64_t> child_counts;
  for (const auto& n : narratives) {
    if (n.parent_id) ++child_counts[*n.parent_id];
  }

  std::unordered_map<std::string, uint64_t> last_activity;
  for (const auto& entry : repository_->ListCurationLog(tx, std::nullopt)) {
    auto& latest = last_activity[entry.narrative_id];
    latest       = std::max(latest, entry.created_at_ms);
  }

  std::vector<DashboardRow> rows;
  rows.reserve(narratives.size());
  for (const auto& n : narratives) {
    DashboardRow row;
    row.narrative            = n;
    row.child_count          = child_counts.contains(n.id) ? child_counts.at(n.id) : 0;
    row.manual_cluster_count = n.manual_cluster_ids.size();
    row.is_parent            = row.child_count > 0;
    row.is_manual            = n.source == CurationSource::kManual;
    row.is_overdue           = IsOverdue(n, now_ms);
    if (auto it = last_activity.find(n.id); it != last_activity.end()) row.last_activity_ms = it->second;
    rows.push_back(std::move(row));
  }
  return rows;
}

std::vector<DashboardRow> CurationReports::Dashboard(db::Transaction& tx, const DashboardQuery& query) {
  auto rows = Rows(tx, clock_->NowMs());

  std::erase_if(rows, [&](const DashboardRow& row) {
    const auto& n       = row.narrative;
    const bool  curated = n.source != CurationSource::kPipeline || n.status != CurationStatus::kAutoGenerated;
    if (!curated) return true;
    if (query.curator_id && n.curator_id != *query.curator_id) return true;
    if (!query.statuses.empty() && std::find(query.statuses.begin(), query.statuses.end(), n.status) == query.statuses.end()) return true;
    return false;
  });

  std::sort(rows.begin(), rows.end(), [](const DashboardRow& a, const DashboardRow& b) {
    if (a.narrative.editorial_priority != b.narrative.editorial_priority) return a.narrative.editorial_priority < b.narrative.editorial_priority;
    if (a.narrative.updated_at_ms != b.narrative.updated_at_ms) return a.narrative.updated_at_ms > b.narrative.updated_at_ms;
    return a.narrative.id < b.narrative.id;
  });

  if (query.limit > 0 && rows.size() > query.limit) rows.resize(query.limit);
  return rows;
}

int32_t CurationReports::ReviewUrgency(const DashboardRow& row, uint64_t now_ms) {
  const auto& n = row.narrative;
  if (n.review_deadline_ms) {
    if (*n.review_deadline_ms < now_ms) return 5;
    if (*n.review_deadline_ms - now_ms <= util::kMillisPerDay) return 4;
  }
  if (n.editorial_priority <= 2) return 3;
  if (row.child_count > 3) return 3;
  return n.editorial_priority;
}

std::vector<PendingReview> CurationReports::PendingReviews(db::Transaction& tx, const std::optional<std::string>& reviewer_id) {
  const auto now = clock_->NowMs();

  std::vector<PendingReview> out;
  for (auto& row : Rows(tx, now)) {
    if (!IsReviewStatus(row.narrative.status)) continue;
    if (reviewer_id && row.narrative.reviewer_id != *reviewer_id) continue;

    PendingReview review;
    review.review_urgency = ReviewUrgency(row, now);
    if (row.narrative.review_deadline_ms) {
      const auto delta           = static_cast<int64_t>(*row.narrative.review_deadline_ms) - static_cast<int64_t>(now);
      review.days_until_deadline = delta / static_cast<int64_t>(util::kMillisPerDay);
    }
    review.row = std::move(row);
    out.push_back(std::move(review));
  }

  std::sort(out.begin(), out.end(), [](const PendingReview& a, const PendingReview& b) {
    if (a.review_urgency != b.review_urgency) return a.review_urgency > b.review_urgency;
    const auto& da = a.row.narrative.review_deadline_ms;
    const auto& db = b.row.narrative.review_deadline_ms;
    if (da.has_value() != db.has_value()) return da.has_value();
    if (da && *da != *db) return *da < *db;
    return a.row.narrative.id < b.row.narrative.id;
  });
  return out;
}

WorkflowReport CurationReports::ValidateWorkflow(db::Transaction& tx) {
  const auto now        = clock_->NowMs();
  const auto narratives = repository_->ListNarratives(tx);

  std::unordered_map<std::string, const NarrativeRecord*> by_id;
  std::unordered_map<std::string, uint64_t>               child_counts;
  for (const auto& n : narratives) {
    by_id.emplace(n.id, &n);
    if (n.parent_id) ++child_counts[*n.parent_id];
  }

  std::vector<std::string> orphaned_parents;
  std::vector<std::string> invalid_parents;
  std::vector<std::string> status_issues;
  std::vector<std::string> overdue;
  for (const auto& n : narratives) {
    if (n.IsManualRoot() && !child_counts.contains(n.id)) orphaned_parents.push_back(n.id);

    if (n.parent_id) {
      auto it = by_id.find(*n.parent_id);
      if (it == by_id.end() || it->second->parent_id || *n.parent_id == n.id) invalid_parents.push_back(n.id);
    }

    const bool published_without_timestamp = n.status == CurationStatus::kPublished && !n.published_at_ms;
    const bool review_without_curator      = n.status == CurationStatus::kPendingReview && !n.curator_id;
    if (published_without_timestamp || review_without_curator) status_issues.push_back(n.id);

    if (IsReviewStatus(n.status) && n.review_deadline_ms && *n.review_deadline_ms < now) overdue.push_back(n.id);
  }

  std::vector<std::string> orphaned_groups;
  for (const auto& group : repository_->ListClusterGroups(tx, std::nullopt)) {
    if (!group.parent_narrative_id || !by_id.contains(*group.parent_narrative_id)) orphaned_groups.push_back(group.id);
  }

  WorkflowReport report;
  report.generated_at_ms = now;
  report.checks          = {
      MakeCheck("orphaned_manual_parents", CheckStatus::kWarning, orphaned_parents, "manual parents without children"),
      MakeCheck("invalid_parent_references", CheckStatus::kFail, invalid_parents, "narratives with invalid parent references"),
      MakeCheck("status_workflow_issues", CheckStatus::kWarning, status_issues, "narratives with inconsistent workflow fields"),
      MakeCheck("overdue_reviews", CheckStatus::kWarning, overdue, "reviews past their deadline"),
      MakeCheck("orphaned_cluster_groups", CheckStatus::kWarning, orphaned_groups, "cluster groups not linked to a narrative"),
  };

  for (const auto& check : report.checks) {
    report.overall_status = std::max(report.overall_status, check.status);
  }
  return report;
}

HierarchyStats CurationReports::Stats(db::Transaction& tx) {
  const auto narratives = repository_->ListNarratives(tx);

  HierarchyStats                            stats;
  std::unordered_map<std::string, uint64_t> child_counts;
  for (const auto& n : narratives) {
    ++stats.total_narratives;
    if (n.parent_id) {
      ++stats.child_narratives;
      ++child_counts[*n.parent_id];
    } else {
      ++stats.root_narratives;
    }
  }

  uint64_t total_children = 0;
  for (const auto& [_, count] : child_counts) {
    total_children += count;
    stats.max_children_per_parent = std::max(stats.max_children_per_parent, count);
  }
  stats.parents_with_children = child_counts.size();
  if (stats.parents_with_children > 0) {
    stats.avg_children_per_parent = static_cast<double>(total_children) / static_cast<double>(stats.parents_with_children);
  }
  return stats;
}

} // namespace narrative::core
