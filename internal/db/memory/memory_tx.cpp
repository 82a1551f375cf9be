#include "memory_tx.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace narrative::db::memory {

namespace {

constexpr char kNarrativePrefix[]      = "narrative/";
constexpr char kClusterGroupPrefix[]   = "group/";
constexpr char kHierarchyCachePrefix[] = "cache/";
constexpr char kDisplayIdPrefix[]      = "display/";

template <typename Map>
void CopyRow(const Map& from, Map& to, const std::string& id) {
  const auto it = from.find(id);
  if (it == from.end()) {
    to.erase(id);
  } else {
    to.insert_or_assign(id, it->second);
  }
}

bool StripPrefix(const std::string& key, std::string_view prefix, std::string* rest) {
  if (key.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  *rest = key.substr(prefix.size());
  return true;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
  log_base_         = working_.curation_log.size();
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

std::string MemoryTransaction::NarrativeKey(const std::string& id) {
  return kNarrativePrefix + id;
}

std::string MemoryTransaction::ClusterGroupKey(const std::string& id) {
  return kClusterGroupPrefix + id;
}

std::string MemoryTransaction::HierarchyCacheKey(const std::string& parent_id) {
  return kHierarchyCachePrefix + parent_id;
}

std::string MemoryTransaction::DisplayIdKey(const std::string& display_id) {
  return kDisplayIdPrefix + display_id;
}

void MemoryTransaction::Claim(std::string row_key) {
  claimed_.insert(std::move(row_key));
}

void MemoryTransaction::ApplyRow(const std::string& row_key) {
  std::string id;
  if (StripPrefix(row_key, kNarrativePrefix, &id)) {
    CopyRow(working_.narratives, repo_.committed_.narratives, id);
  } else if (StripPrefix(row_key, kClusterGroupPrefix, &id)) {
    CopyRow(working_.cluster_groups, repo_.committed_.cluster_groups, id);
  } else if (StripPrefix(row_key, kHierarchyCachePrefix, &id)) {
    CopyRow(working_.hierarchy_cache, repo_.committed_.hierarchy_cache, id);
  }
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& key : claimed_) {
    const auto it = repo_.row_versions_.find(key);
    if (it != repo_.row_versions_.end() && it->second > snapshot_version_) {
      throw util::ConcurrentModification("transaction conflict: " + key + " was modified by a concurrent transaction");
    }
  }

  const auto version = ++repo_.committed_version_;
  for (const auto& key : claimed_) {
    ApplyRow(key);
    repo_.row_versions_[key] = version;
  }

  // Log entries are re-sequenced in commit order.
  for (std::size_t i = log_base_; i < working_.curation_log.size(); ++i) {
    auto entry     = working_.curation_log[i];
    entry.sequence = repo_.committed_.next_log_sequence++;
    repo_.committed_.curation_log.push_back(std::move(entry));
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace narrative::db::memory
