#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace narrative::core {

struct DashboardQuery {
  std::optional<std::string>                    curator_id;
  std::vector<narrative::model::CurationStatus> statuses;
  uint32_t                                      limit = 0;
};

struct DashboardRow {
  db::model::NarrativeRecord narrative;
  uint64_t                   child_count          = 0;
  uint64_t                   manual_cluster_count = 0;
  bool                       is_parent            = false;
  bool                       is_manual            = false;
  bool                       is_overdue           = false;
  std::optional<uint64_t>    last_activity_ms;
};

struct PendingReview {
  DashboardRow           row;
  int32_t                review_urgency = 0;
  std::optional<int64_t> days_until_deadline;
};

enum class CheckStatus { kPass, kWarning, kFail };

constexpr std::string_view ToString(CheckStatus status) {
  switch (status) {
    case CheckStatus::kPass:
      return "PASS";
    case CheckStatus::kWarning:
      return "WARNING";
    case CheckStatus::kFail:
      return "FAIL";
  }
  return "UNKNOWN";
}

struct WorkflowCheck {
  std::string check_name;
  CheckStatus status = CheckStatus::kPass;
  std::string details;
  uint64_t    affected_count = 0;
};

struct WorkflowReport {
  uint64_t                   generated_at_ms = 0;
  CheckStatus                overall_status  = CheckStatus::kPass;
  std::vector<WorkflowCheck> checks;
};

struct HierarchyStats {
  uint64_t total_narratives        = 0;
  uint64_t root_narratives         = 0;
  uint64_t child_narratives        = 0;
  uint64_t parents_with_children   = 0;
  double   avg_children_per_parent = 0.0;
  uint64_t max_children_per_parent = 0;
};

/*
  Read-only editorial views computed from narratives, the curation log
  and cluster groups.
*/
class CurationReports {
 public:
  CurationReports(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock);

  // Manual/hybrid narratives plus anything that left auto_generated,
  // ordered by priority then most recently updated.
  std::vector<DashboardRow> Dashboard(db::Transaction& tx, const DashboardQuery& query);

  // pending_review and reviewed narratives, most urgent first.
  std::vector<PendingReview> PendingReviews(db::Transaction& tx, const std::optional<std::string>& reviewer_id);

  WorkflowReport ValidateWorkflow(db::Transaction& tx);

  HierarchyStats Stats(db::Transaction& tx);

  static int32_t ReviewUrgency(const DashboardRow& row, uint64_t now_ms);

 private:
  std::vector<DashboardRow> Rows(db::Transaction& tx, uint64_t now_ms);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace narrative::core
