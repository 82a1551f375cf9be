#include "internal/core/hierarchy_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/narrative_store.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using narrative::core::HierarchyCache;
using narrative::core::NarrativeStore;
using narrative::db::memory::MemoryRepository;
using narrative::db::model::HierarchyMember;
using narrative::db::model::NarrativeRecord;
using narrative::model::CurationSource;
using narrative::model::CurationStatus;
using narrative::util::ManualTimeSource;

void TestRecomputeAggregates() {
  const auto entry = HierarchyCache::Recompute("p", "Parent",
                                               {
                                                   HierarchyMember{"c3", "third", 300, 900, "low"},
                                                   HierarchyMember{"c1", "first", 100, 150, "high"},
                                                   HierarchyMember{"c2", "second", 100, 400, "high"},
                                                   HierarchyMember{"c4", "fourth", 400, 410, ""},
                                               },
                                               5000);

  assert(entry.child_count == 4);
  assert(entry.child_ids == (std::vector<std::string>{"c1", "c2", "c3", "c4"}));
  assert(entry.child_titles == (std::vector<std::string>{"first", "second", "third", "fourth"}));
  assert(entry.first_child_created_at_ms == std::optional<uint64_t>(100));
  assert(entry.latest_child_created_at_ms == std::optional<uint64_t>(400));
  assert(entry.latest_child_updated_at_ms == std::optional<uint64_t>(900));
  // empty ratings do not count toward diversity
  assert(entry.confidence_diversity == 2);
  assert(entry.predominant_child_confidence == "high");
  assert(entry.cache_updated_at_ms == 5000);
}

void TestRecomputeWithoutChildren() {
  const auto entry = HierarchyCache::Recompute("p", "Parent", {}, 7);
  assert(entry.child_count == 0);
  assert(entry.child_ids.empty());
  assert(!entry.first_child_created_at_ms);
  assert(!entry.latest_child_updated_at_ms);
  assert(entry.confidence_diversity == 0);
  assert(entry.predominant_child_confidence.empty());
}

void TestPredominantConfidenceTieBreak() {
  const auto entry = HierarchyCache::Recompute("p", "Parent",
                                               {
                                                   HierarchyMember{"a", "a", 1, 1, "medium"},
                                                   HierarchyMember{"b", "b", 2, 2, "high"},
                                               },
                                               9);
  // equal counts resolve to the lexicographically smallest rating
  assert(entry.predominant_child_confidence == "high");
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualTimeSource> clock      = std::make_shared<ManualTimeSource>(1000);
  NarrativeStore                    store{repository, clock};
  HierarchyCache                    cache{repository, clock};

  NarrativeRecord Create(narrative::db::Transaction& tx, const std::string& title, CurationSource source) {
    clock->Advance(10);
    NarrativeRecord fields;
    fields.title             = title;
    fields.summary           = "summary";
    fields.source            = source;
    fields.status            = source == CurationSource::kManual ? CurationStatus::kManualDraft : CurationStatus::kAutoGenerated;
    fields.confidence_rating = "medium";
    auto root                = store.CreateRoot(tx, fields);
    cache.OnRootCreated(tx, root);
    return root;
  }
};

void TestHooksTrackAttachAndDetach() {
  Fixture f;
  auto    tx = f.repository->Begin();

  auto parent = f.Create(*tx, "parent", CurationSource::kManual);
  auto child  = f.Create(*tx, "child", CurationSource::kPipeline);
  assert(f.cache.Get(*tx, child.id));

  auto attached = f.store.SetParent(*tx, child.id, parent.id);
  f.cache.OnChildAttached(*tx, parent, attached);

  // a narrative that became a child no longer has its own entry
  assert(!f.cache.Get(*tx, child.id));
  auto entry = f.cache.Get(*tx, parent.id);
  assert(entry->child_count == 1);
  assert(entry->child_ids[0] == child.id);

  attached.title = "child renamed";
  attached       = f.store.Save(*tx, attached);
  f.cache.OnNarrativeUpdated(*tx, attached);
  assert(f.cache.Get(*tx, parent.id)->child_titles[0] == "child renamed");

  parent.title = "parent renamed";
  parent       = f.store.Save(*tx, parent);
  f.cache.OnNarrativeUpdated(*tx, parent);
  assert(f.cache.Get(*tx, parent.id)->parent_title == "parent renamed");

  f.store.ClearParent(*tx, child.id);
  f.cache.OnChildDetached(*tx, parent.id, child.id);
  f.cache.OnRootCreated(*tx, f.store.Get(*tx, child.id));
  assert(f.cache.Get(*tx, parent.id)->child_count == 0);
  assert(f.cache.Get(*tx, child.id));

  f.cache.OnRootRemoved(*tx, parent.id);
  assert(!f.cache.Get(*tx, parent.id));
}

void TestRefreshRepairsDriftAndIsIdempotent() {
  Fixture f;
  auto    tx = f.repository->Begin();

  auto parent = f.Create(*tx, "parent", CurationSource::kManual);
  auto child  = f.Create(*tx, "child", CurationSource::kPipeline);

  // attach without the hook so the cache drifts
  f.store.SetParent(*tx, child.id, parent.id);
  assert(f.cache.Get(*tx, parent.id)->child_count == 0);

  narrative::db::model::HierarchyCacheRecord stale;
  stale.parent_id    = "gone";
  stale.parent_title = "deleted root";
  assert(f.repository->UpsertHierarchyCache(*tx, stale));

  const auto first = f.cache.Refresh(*tx);
  assert(first.entries_written == 1);
  // the stale root and the former root's own entry
  assert(first.entries_removed == 2);
  assert(f.cache.Get(*tx, parent.id)->child_count == 1);

  f.clock->Advance(1000);
  const auto second = f.cache.Refresh(*tx);
  assert(second.entries_written == 0);
  assert(second.entries_removed == 0);
  assert(f.cache.List(*tx).size() == 1);
}

} // namespace

int main() {
  TestRecomputeAggregates();
  TestRecomputeWithoutChildren();
  TestPredominantConfidenceTieBreak();
  TestHooksTrackAttachAndDetach();
  TestRefreshRepairsDriftAndIsIdempotent();

  std::cout << "narrative_unit_hierarchy_cache: pass\n";
  return 0;
}
