#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/curation_limits.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace narrative::core {

struct ClusterGroupDraft {
  std::string              name;
  std::string              description;
  std::vector<std::string> cluster_ids;
  std::string              curator_id;
  std::string              rationale;
  std::string              strategic_significance;
};

/*
  Curator-defined groupings of external cluster ids. A group moves
  draft -> pending_review -> approved, one stage per Approve() call,
  independently of any narrative status.
*/
class ClusterGroupRegistry {
 public:
  ClusterGroupRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock, CurationLimits limits);

  db::model::ClusterGroupRecord CreateGroup(db::Transaction& tx, const ClusterGroupDraft& draft);

  // InvalidParentReference if the narrative is missing, ValidationError
  // if it is not a manual root.
  db::model::ClusterGroupRecord LinkToParent(db::Transaction& tx, const std::string& group_id, const std::string& parent_narrative_id);

  // InvalidTransition once the group is approved.
  db::model::ClusterGroupRecord Approve(db::Transaction& tx, const std::string& group_id, const std::string& reviewer_id,
                                        const std::string& review_notes);

  db::model::ClusterGroupRecord              Get(db::Transaction& tx, const std::string& group_id);
  std::vector<db::model::ClusterGroupRecord> List(db::Transaction& tx, const std::optional<std::string>& parent_narrative_id);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const util::TimeSource> clock_;
  CurationLimits                          limits_;
};

} // namespace narrative::core
