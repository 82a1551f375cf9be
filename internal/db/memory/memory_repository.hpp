#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace narrative::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                                InsertNarrative(Transaction&, const model::NarrativeRecord&) override;
  std::optional<model::NarrativeRecord> GetNarrative(Transaction&, const std::string&) override;
  std::optional<model::NarrativeRecord> GetNarrativeForUpdate(Transaction&, const std::string&) override;
  std::vector<model::NarrativeRecord>   ListNarratives(Transaction&) override;
  std::vector<model::NarrativeRecord>   ListChildren(Transaction&, const std::string& parent_id) override;
  Result                                UpdateNarrative(Transaction&, const model::NarrativeRecord&, uint64_t expected_version) override;
  Result                                DeleteNarrative(Transaction&, const std::string&) override;

  Result                                AppendCurationLog(Transaction&, model::CurationLogRecord&) override;
  std::vector<model::CurationLogRecord> ListCurationLog(Transaction&, const std::optional<std::string>& narrative_id) override;
  uint64_t                              CountCurationLog(Transaction&) override;

  Result                                   InsertClusterGroup(Transaction&, const model::ClusterGroupRecord&) override;
  std::optional<model::ClusterGroupRecord> GetClusterGroup(Transaction&, const std::string&) override;
  Result                                   UpdateClusterGroup(Transaction&, const model::ClusterGroupRecord&) override;
  std::vector<model::ClusterGroupRecord>   ListClusterGroups(Transaction&, const std::optional<std::string>& parent_narrative_id) override;

  Result                                     UpsertHierarchyCache(Transaction&, const model::HierarchyCacheRecord&) override;
  std::optional<model::HierarchyCacheRecord> GetHierarchyCache(Transaction&, const std::string&) override;
  std::vector<model::HierarchyCacheRecord>   ListHierarchyCache(Transaction&) override;
  Result                                     DeleteHierarchyCache(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::NarrativeRecord>    narratives;
    std::unordered_map<std::string, model::ClusterGroupRecord> cluster_groups;
    std::map<std::string, model::HierarchyCacheRecord>         hierarchy_cache;

    std::vector<model::CurationLogRecord> curation_log;
    uint64_t                              next_log_sequence = 1;
  };

  static bool DisplayIdTaken(const State& state, const model::NarrativeRecord& record);

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;

  // Row key -> committed_version_ of the last commit that wrote it.
  std::unordered_map<std::string, uint64_t> row_versions_;
};

} // namespace narrative::db::memory
