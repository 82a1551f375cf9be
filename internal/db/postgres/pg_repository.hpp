#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace narrative::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                                InsertNarrative(Transaction&, const model::NarrativeRecord&) override;
  std::optional<model::NarrativeRecord> GetNarrative(Transaction&, const std::string& id) override;
  std::optional<model::NarrativeRecord> GetNarrativeForUpdate(Transaction&, const std::string& id) override;
  std::vector<model::NarrativeRecord>   ListNarratives(Transaction&) override;
  std::vector<model::NarrativeRecord>   ListChildren(Transaction&, const std::string& parent_id) override;
  Result                                UpdateNarrative(Transaction&, const model::NarrativeRecord&, uint64_t expected_version) override;
  Result                                DeleteNarrative(Transaction&, const std::string& id) override;

  Result                                AppendCurationLog(Transaction&, model::CurationLogRecord& record) override;
  std::vector<model::CurationLogRecord> ListCurationLog(Transaction&, const std::optional<std::string>& narrative_id) override;
  uint64_t                              CountCurationLog(Transaction&) override;

  Result                                   InsertClusterGroup(Transaction&, const model::ClusterGroupRecord&) override;
  std::optional<model::ClusterGroupRecord> GetClusterGroup(Transaction&, const std::string& id) override;
  Result                                   UpdateClusterGroup(Transaction&, const model::ClusterGroupRecord&) override;
  std::vector<model::ClusterGroupRecord>   ListClusterGroups(Transaction&, const std::optional<std::string>& parent_narrative_id) override;

  Result                                     UpsertHierarchyCache(Transaction&, const model::HierarchyCacheRecord&) override;
  std::optional<model::HierarchyCacheRecord> GetHierarchyCache(Transaction&, const std::string& parent_id) override;
  std::vector<model::HierarchyCacheRecord>   ListHierarchyCache(Transaction&) override;
  Result                                     DeleteHierarchyCache(Transaction&, const std::string& parent_id) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace narrative::db::postgres
