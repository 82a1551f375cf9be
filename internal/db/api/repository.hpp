#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cluster_group_record.hpp"
#include "internal/db/model/curation_log_record.hpp"
#include "internal/db/model/hierarchy_cache_record.hpp"
#include "internal/db/model/narrative_record.hpp"

namespace narrative::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - UpdateNarrative is a compare-and-swap on version
  - The curation log is append-only; nothing here mutates or removes entries

  The DB is the source of truth for:
    narratives and their parent links
    the curation log
    cluster groups

  narrative_hierarchy_cache is derived state owned by core::HierarchyCache.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Narratives
  // ---------------------------------------------------------------------

  virtual Result InsertNarrative(Transaction&, const model::NarrativeRecord&) = 0;

  virtual std::optional<model::NarrativeRecord> GetNarrative(Transaction&, const std::string& id) = 0;

  // Same as GetNarrative, and the row stays claimed by this transaction
  // until it ends.
  virtual std::optional<model::NarrativeRecord> GetNarrativeForUpdate(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::NarrativeRecord> ListNarratives(Transaction&) = 0;

  // Ordered by created_at ascending, then id.
  virtual std::vector<model::NarrativeRecord> ListChildren(Transaction&, const std::string& parent_id) = 0;

  // Fails with Conflict unless the stored version equals expected_version.
  virtual Result UpdateNarrative(Transaction&, const model::NarrativeRecord&, uint64_t expected_version) = 0;

  virtual Result DeleteNarrative(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Curation log
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendCurationLog(Transaction&, model::CurationLogRecord& record) = 0;

  // Ordered by sequence. nullopt lists the whole log.
  virtual std::vector<model::CurationLogRecord> ListCurationLog(Transaction&, const std::optional<std::string>& narrative_id) = 0;

  virtual uint64_t CountCurationLog(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Cluster groups
  // ---------------------------------------------------------------------

  virtual Result InsertClusterGroup(Transaction&, const model::ClusterGroupRecord&) = 0;

  virtual std::optional<model::ClusterGroupRecord> GetClusterGroup(Transaction&, const std::string& id) = 0;

  virtual Result UpdateClusterGroup(Transaction&, const model::ClusterGroupRecord&) = 0;

  // Ordered by created_at ascending. nullopt lists every group.
  virtual std::vector<model::ClusterGroupRecord> ListClusterGroups(Transaction&, const std::optional<std::string>& parent_narrative_id) = 0;

  // ---------------------------------------------------------------------
  // Hierarchy cache
  // ---------------------------------------------------------------------

  virtual Result UpsertHierarchyCache(Transaction&, const model::HierarchyCacheRecord&) = 0;

  virtual std::optional<model::HierarchyCacheRecord> GetHierarchyCache(Transaction&, const std::string& parent_id) = 0;

  // Ordered by parent_id.
  virtual std::vector<model::HierarchyCacheRecord> ListHierarchyCache(Transaction&) = 0;

  virtual Result DeleteHierarchyCache(Transaction&, const std::string& parent_id) = 0;
};

} // namespace narrative::db
