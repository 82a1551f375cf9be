#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace narrative::db::memory {

/*
  Transaction = snapshot + claimed rows

  Reads are served from a private snapshot. Every row the transaction
  writes or reads for update is claimed; Commit() fails if any claimed
  row was committed by someone else after the snapshot was taken, and
  otherwise merges only the claimed rows plus appended log entries.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void Claim(std::string row_key);

  static std::string NarrativeKey(const std::string& id);
  static std::string ClusterGroupKey(const std::string& id);
  static std::string HierarchyCacheKey(const std::string& parent_id);
  // Guards narratives.display_id uniqueness; carries no row.
  static std::string DisplayIdKey(const std::string& display_id);

 private:
  void ApplyRow(const std::string& row_key);

  MemoryRepository&               repo_;
  MemoryRepository::State         working_;
  uint64_t                        snapshot_version_ = 0;
  std::size_t                     log_base_         = 0;
  std::unordered_set<std::string> claimed_;
  bool                            committed_   = false;
  bool                            rolled_back_ = false;
};

} // namespace narrative::db::memory
