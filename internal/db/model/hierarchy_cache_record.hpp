#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace narrative::db::model {

struct HierarchyMember {
  std::string id;
  std::string title;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
  std::string confidence_rating;

  bool operator==(const HierarchyMember&) const = default;
};

/*
  Derived aggregate for one root narrative.

  members is ordered by (created_at_ms, id); every other field except
  cache_updated_at_ms is a pure function of parent_title and members.
*/
struct HierarchyCacheRecord {
  std::string                  parent_id;
  std::string                  parent_title;
  std::vector<HierarchyMember> members;

  uint64_t                 child_count = 0;
  std::vector<std::string> child_ids;
  std::vector<std::string> child_titles;
  std::optional<uint64_t>  first_child_created_at_ms;
  std::optional<uint64_t>  latest_child_created_at_ms;
  std::optional<uint64_t>  latest_child_updated_at_ms;
  uint32_t                 confidence_diversity = 0;
  std::string              predominant_child_confidence;

  uint64_t cache_updated_at_ms = 0;

  // Compares the aggregate, ignoring when it was written.
  bool SameContent(const HierarchyCacheRecord& other) const {
    return parent_id == other.parent_id && parent_title == other.parent_title && members == other.members && child_count == other.child_count &&
           child_ids == other.child_ids && child_titles == other.child_titles && first_child_created_at_ms == other.first_child_created_at_ms &&
           latest_child_created_at_ms == other.latest_child_created_at_ms && latest_child_updated_at_ms == other.latest_child_updated_at_ms &&
           confidence_diversity == other.confidence_diversity && predominant_child_confidence == other.predominant_child_confidence;
  }
};

} // namespace narrative::db::model
