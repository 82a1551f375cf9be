#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/curation.hpp"

namespace narrative::db::model {

struct ClusterGroupRecord {
  std::string                id;
  std::string                name;
  std::string                description;
  std::vector<std::string>   cluster_ids;
  std::optional<std::string> parent_narrative_id;

  std::string curator_id;
  std::string rationale;
  std::string strategic_significance;

  narrative::model::ClusterGroupStatus status = narrative::model::ClusterGroupStatus::kDraft;
  std::optional<std::string>           reviewer_id;
  std::string                          review_notes;

  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
  std::optional<uint64_t> approved_at_ms;

  bool operator==(const ClusterGroupRecord&) const = default;
};

} // namespace narrative::db::model
