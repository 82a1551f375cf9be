#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace narrative::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRepository::DisplayIdTaken(const State& state, const model::NarrativeRecord& record) {
  return std::any_of(state.narratives.begin(), state.narratives.end(), [&](const auto& entry) {
    return entry.first != record.id && entry.second.display_id == record.display_id;
  });
}

// ------------------------------------------------------------------
// Narratives
// ------------------------------------------------------------------

Result MemoryRepository::InsertNarrative(Transaction& t, const model::NarrativeRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.narratives.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "narrative " + r.id);
  if (DisplayIdTaken(s, r)) return Result::Err(ErrorCode::AlreadyExists, "narrative display_id " + r.display_id);
  if (r.parent_id && !s.narratives.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "parent " + *r.parent_id + " does not exist");
  }
  s.narratives[r.id] = r;
  TX(t).Claim(MemoryTransaction::NarrativeKey(r.id));
  TX(t).Claim(MemoryTransaction::DisplayIdKey(r.display_id));
  return Result::Ok();
}

std::optional<model::NarrativeRecord> MemoryRepository::GetNarrative(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.narratives.find(id);
  if (it == s.narratives.end()) return std::nullopt;
  return it->second;
}

std::optional<model::NarrativeRecord> MemoryRepository::GetNarrativeForUpdate(Transaction& t, const std::string& id) {
  TX(t).Claim(MemoryTransaction::NarrativeKey(id));
  return GetNarrative(t, id);
}

std::vector<model::NarrativeRecord> MemoryRepository::ListNarratives(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::NarrativeRecord> out;
  out.reserve(s.narratives.size());
  for (const auto& [_, record] : s.narratives) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

std::vector<model::NarrativeRecord> MemoryRepository::ListChildren(Transaction& t, const std::string& parent_id) {
  std::vector<model::NarrativeRecord> out;
  for (const auto& [_, record] : TX(t).View().narratives) {
    if (record.parent_id == parent_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateNarrative(Transaction& t, const model::NarrativeRecord& r, uint64_t expected_version) {
  auto&      s  = TX(t).Mutable();
  const auto it = s.narratives.find(r.id);
  if (it == s.narratives.end()) return Result::Err(ErrorCode::NotFound, "narrative " + r.id);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "narrative " + r.id + " version " + std::to_string(it->second.version) + " != expected " +
                                                std::to_string(expected_version));
  }
  if (r.display_id != it->second.display_id) {
    if (DisplayIdTaken(s, r)) return Result::Err(ErrorCode::AlreadyExists, "narrative display_id " + r.display_id);
    TX(t).Claim(MemoryTransaction::DisplayIdKey(r.display_id));
  }
  if (r.parent_id && !s.narratives.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "parent " + *r.parent_id + " does not exist");
  }
  it->second = r;
  TX(t).Claim(MemoryTransaction::NarrativeKey(r.id));
  return Result::Ok();
}

Result MemoryRepository::DeleteNarrative(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();

  // Mirrors ON DELETE CASCADE on narratives.parent_id and
  // manual_cluster_groups.parent_narrative_id.
  for (auto it = s.narratives.begin(); it != s.narratives.end();) {
    if (it->first == id || it->second.parent_id == id) {
      TX(t).Claim(MemoryTransaction::NarrativeKey(it->first));
      it = s.narratives.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = s.cluster_groups.begin(); it != s.cluster_groups.end();) {
    if (it->second.parent_narrative_id == id) {
      TX(t).Claim(MemoryTransaction::ClusterGroupKey(it->first));
      it = s.cluster_groups.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Curation log
// ------------------------------------------------------------------

Result MemoryRepository::AppendCurationLog(Transaction& t, model::CurationLogRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_log_sequence++;
  s.curation_log.push_back(r);
  return Result::Ok();
}

std::vector<model::CurationLogRecord> MemoryRepository::ListCurationLog(Transaction& t, const std::optional<std::string>& narrative_id) {
  std::vector<model::CurationLogRecord> out;
  for (const auto& entry : TX(t).View().curation_log) {
    if (!narrative_id || entry.narrative_id == *narrative_id) out.push_back(entry);
  }
  return out;
}

uint64_t MemoryRepository::CountCurationLog(Transaction& t) {
  return TX(t).View().curation_log.size();
}

// ------------------------------------------------------------------
// Cluster groups
// ------------------------------------------------------------------

Result MemoryRepository::InsertClusterGroup(Transaction& t, const model::ClusterGroupRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.cluster_groups.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "cluster group " + r.id);
  if (r.parent_narrative_id && !s.narratives.contains(*r.parent_narrative_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "narrative " + *r.parent_narrative_id + " does not exist");
  }
  s.cluster_groups[r.id] = r;
  TX(t).Claim(MemoryTransaction::ClusterGroupKey(r.id));
  return Result::Ok();
}

std::optional<model::ClusterGroupRecord> MemoryRepository::GetClusterGroup(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.cluster_groups.find(id);
  if (it == s.cluster_groups.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateClusterGroup(Transaction& t, const model::ClusterGroupRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.cluster_groups.contains(r.id)) return Result::Err(ErrorCode::NotFound, "cluster group " + r.id);
  if (r.parent_narrative_id && !s.narratives.contains(*r.parent_narrative_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "narrative " + *r.parent_narrative_id + " does not exist");
  }
  s.cluster_groups[r.id] = r;
  TX(t).Claim(MemoryTransaction::ClusterGroupKey(r.id));
  return Result::Ok();
}

std::vector<model::ClusterGroupRecord> MemoryRepository::ListClusterGroups(Transaction& t, const std::optional<std::string>& parent_narrative_id) {
  std::vector<model::ClusterGroupRecord> out;
  for (const auto& [_, group] : TX(t).View().cluster_groups) {
    if (!parent_narrative_id || group.parent_narrative_id == *parent_narrative_id) out.push_back(group);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Hierarchy cache
// ------------------------------------------------------------------

Result MemoryRepository::UpsertHierarchyCache(Transaction& t, const model::HierarchyCacheRecord& r) {
  TX(t).Mutable().hierarchy_cache.insert_or_assign(r.parent_id, r);
  TX(t).Claim(MemoryTransaction::HierarchyCacheKey(r.parent_id));
  return Result::Ok();
}

std::optional<model::HierarchyCacheRecord> MemoryRepository::GetHierarchyCache(Transaction& t, const std::string& parent_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.hierarchy_cache.find(parent_id);
  if (it == s.hierarchy_cache.end()) return std::nullopt;
  return it->second;
}

std::vector<model::HierarchyCacheRecord> MemoryRepository::ListHierarchyCache(Transaction& t) {
  std::vector<model::HierarchyCacheRecord> out;
  for (const auto& [_, entry] : TX(t).View().hierarchy_cache) {
    out.push_back(entry);
  }
  return out;
}

Result MemoryRepository::DeleteHierarchyCache(Transaction& t, const std::string& parent_id) {
  TX(t).Mutable().hierarchy_cache.erase(parent_id);
  TX(t).Claim(MemoryTransaction::HierarchyCacheKey(parent_id));
  return Result::Ok();
}

} // namespace narrative::db::memory
