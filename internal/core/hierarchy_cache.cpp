#include "hierarchy_cache.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

#include "internal/core/db_error.hpp"

namespace narrative::core {

using db::model::HierarchyCacheRecord;
using db::model::HierarchyMember;
using db::model::NarrativeRecord;

HierarchyCache::HierarchyCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

HierarchyCacheRecord HierarchyCache::Recompute(std::string parent_id, std::string parent_title, std::vector<HierarchyMember> members,
                                               uint64_t now_ms) {
  std::sort(members.begin(), members.end(), [](const HierarchyMember& a, const HierarchyMember& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });

  HierarchyCacheRecord entry;
  entry.parent_id           = std::move(parent_id);
  entry.parent_title        = std::move(parent_title);
  entry.child_count         = members.size();
  entry.cache_updated_at_ms = now_ms;

  std::map<std::string, uint32_t> confidence_counts;
  for (const auto& m : members) {
    entry.child_ids.push_back(m.id);
    entry.child_titles.push_back(m.title);
    if (!m.confidence_rating.empty()) ++confidence_counts[m.confidence_rating];
  }

  if (!members.empty()) {
    entry.first_child_created_at_ms  = members.front().created_at_ms;
    entry.latest_child_created_at_ms = members.back().created_at_ms;
    uint64_t latest_update           = 0;
    for (const auto& m : members) {
      latest_update = std::max(latest_update, m.updated_at_ms);
    }
    entry.latest_child_updated_at_ms = latest_update;
  }

  entry.confidence_diversity = static_cast<uint32_t>(confidence_counts.size());
  uint32_t best              = 0;
  // std::map iterates in key order, so the first maximum wins ties
  for (const auto& [confidence, count] : confidence_counts) {
    if (count > best) {
      best                               = count;
      entry.predominant_child_confidence = confidence;
    }
  }

  entry.members = std::move(members);
  return entry;
}

HierarchyMember HierarchyCache::MemberOf(const NarrativeRecord& child) {
  return HierarchyMember{child.id, child.title, child.created_at_ms, child.updated_at_ms, child.confidence_rating};
}

HierarchyCacheRecord HierarchyCache::Build(db::Transaction& tx, const NarrativeRecord& root) {
  std::vector<HierarchyMember> members;
  for (const auto& child : repository_->ListChildren(tx, root.id)) {
    members.push_back(MemberOf(child));
  }
  return Recompute(root.id, root.title, std::move(members), clock_->NowMs());
}

HierarchyCacheRecord HierarchyCache::Load(db::Transaction& tx, const NarrativeRecord& root) {
  if (auto cached = repository_->GetHierarchyCache(tx, root.id)) {
    return std::move(*cached);
  }
  return Build(tx, root);
}

void HierarchyCache::Store(db::Transaction& tx, const HierarchyCacheRecord& entry) {
  ThrowIfDbError(repository_->UpsertHierarchyCache(tx, entry), "upsert hierarchy cache " + entry.parent_id);
}

void HierarchyCache::OnRootCreated(db::Transaction& tx, const NarrativeRecord& root) {
  Store(tx, Build(tx, root));
}

void HierarchyCache::OnChildAttached(db::Transaction& tx, const NarrativeRecord& parent, const NarrativeRecord& child) {
  auto entry   = Load(tx, parent);
  auto members = std::move(entry.members);
  std::erase_if(members, [&](const HierarchyMember& m) { return m.id == child.id; });
  members.push_back(MemberOf(child));
  Store(tx, Recompute(parent.id, parent.title, std::move(members), clock_->NowMs()));

  // the child stops being a root
  ThrowIfDbError(repository_->DeleteHierarchyCache(tx, child.id), "drop hierarchy cache " + child.id);
}

void HierarchyCache::OnChildDetached(db::Transaction& tx, const std::string& parent_id, const std::string& child_id) {
  auto parent = repository_->GetNarrative(tx, parent_id);
  if (!parent) {
    return;
  }

  auto entry   = Load(tx, *parent);
  auto members = std::move(entry.members);
  std::erase_if(members, [&](const HierarchyMember& m) { return m.id == child_id; });
  Store(tx, Recompute(parent->id, parent->title, std::move(members), clock_->NowMs()));
}

void HierarchyCache::OnNarrativeUpdated(db::Transaction& tx, const NarrativeRecord& record) {
  if (record.IsRoot()) {
    auto cached = repository_->GetHierarchyCache(tx, record.id);
    if (!cached) {
      Store(tx, Build(tx, record));
      return;
    }
    if (cached->parent_title != record.title) {
      Store(tx, Recompute(record.id, record.title, std::move(cached->members), clock_->NowMs()));
    }
    return;
  }

  auto parent = repository_->GetNarrative(tx, *record.parent_id);
  if (!parent) {
    return;
  }

  auto entry   = Load(tx, *parent);
  auto members = entry.members;
  std::erase_if(members, [&](const HierarchyMember& m) { return m.id == record.id; });
  members.push_back(MemberOf(record));

  auto updated = Recompute(parent->id, parent->title, std::move(members), clock_->NowMs());
  if (!updated.SameContent(entry)) Store(tx, updated);
}

void HierarchyCache::OnRootRemoved(db::Transaction& tx, const std::string& root_id) {
  ThrowIfDbError(repository_->DeleteHierarchyCache(tx, root_id), "drop hierarchy cache " + root_id);
}

std::optional<HierarchyCacheRecord> HierarchyCache::Get(db::Transaction& tx, const std::string& parent_id) {
  return repository_->GetHierarchyCache(tx, parent_id);
}

std::vector<HierarchyCacheRecord> HierarchyCache::List(db::Transaction& tx) {
  return repository_->ListHierarchyCache(tx);
}

RefreshResult HierarchyCache::Refresh(db::Transaction& tx) {
  const auto narratives = repository_->ListNarratives(tx);
  const auto now        = clock_->NowMs();

  std::map<std::string, std::vector<HierarchyMember>> members_by_root;
  for (const auto& n : narratives) {
    if (n.IsRoot()) members_by_root[n.id];
  }
  for (const auto& n : narratives) {
    if (n.parent_id && members_by_root.contains(*n.parent_id)) {
      members_by_root[*n.parent_id].push_back(MemberOf(n));
    }
  }

  RefreshResult                   result;
  std::unordered_set<std::string> roots;
  for (const auto& n : narratives) {
    if (!n.IsRoot()) continue;
    roots.insert(n.id);

    auto fresh  = Recompute(n.id, n.title, std::move(members_by_root[n.id]), now);
    auto cached = repository_->GetHierarchyCache(tx, n.id);
    if (cached && cached->SameContent(fresh)) continue;

    Store(tx, fresh);
    ++result.entries_written;
  }

  for (const auto& entry : repository_->ListHierarchyCache(tx)) {
    if (roots.contains(entry.parent_id)) continue;
    ThrowIfDbError(repository_->DeleteHierarchyCache(tx, entry.parent_id), "drop hierarchy cache " + entry.parent_id);
    ++result.entries_removed;
  }
  return result;
}

} // namespace narrative::core
