#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace narrative::core {

struct RefreshResult {
  uint64_t entries_written = 0;
  uint64_t entries_removed = 0;
};

/*
  HierarchyCache

  Maintains one narrative_hierarchy_cache row per root narrative. The
  On* hooks run inside the mutating transaction and patch only the
  affected root's entry; Refresh() rebuilds every entry from the
  narratives table and writes only those that differ, so running it
  twice in a row changes nothing.
*/
class HierarchyCache {
 public:
  HierarchyCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock);

  void OnRootCreated(db::Transaction& tx, const db::model::NarrativeRecord& root);
  void OnChildAttached(db::Transaction& tx, const db::model::NarrativeRecord& parent, const db::model::NarrativeRecord& child);
  void OnChildDetached(db::Transaction& tx, const std::string& parent_id, const std::string& child_id);
  void OnNarrativeUpdated(db::Transaction& tx, const db::model::NarrativeRecord& record);
  void OnRootRemoved(db::Transaction& tx, const std::string& root_id);

  std::optional<db::model::HierarchyCacheRecord> Get(db::Transaction& tx, const std::string& parent_id);
  std::vector<db::model::HierarchyCacheRecord>   List(db::Transaction& tx);

  RefreshResult Refresh(db::Transaction& tx);

  // Derives every aggregate field from parent_title and members.
  static db::model::HierarchyCacheRecord Recompute(std::string parent_id, std::string parent_title,
                                                   std::vector<db::model::HierarchyMember> members, uint64_t now_ms);

  static db::model::HierarchyMember MemberOf(const db::model::NarrativeRecord& child);

 private:
  // Cached entry for a root, or one rebuilt from the narratives table.
  db::model::HierarchyCacheRecord Load(db::Transaction& tx, const db::model::NarrativeRecord& root);
  db::model::HierarchyCacheRecord Build(db::Transaction& tx, const db::model::NarrativeRecord& root);
  void                            Store(db::Transaction& tx, const db::model::HierarchyCacheRecord& entry);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace narrative::core
