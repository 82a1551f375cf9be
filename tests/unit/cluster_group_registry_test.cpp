#include "internal/core/cluster_group_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/narrative_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using narrative::core::ClusterGroupDraft;
using narrative::core::ClusterGroupRegistry;
using narrative::core::NarrativeStore;
using narrative::db::memory::MemoryRepository;
using narrative::model::ClusterGroupStatus;
using narrative::util::ManualTimeSource;

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualTimeSource> clock      = std::make_shared<ManualTimeSource>(5000);
  NarrativeStore                    store{repository, clock};
  ClusterGroupRegistry              groups{repository, clock, narrative::core::CurationLimits{}};

  std::string Root(narrative::db::Transaction& tx, narrative::model::CurationSource source) {
    narrative::db::model::NarrativeRecord fields;
    fields.title   = "root";
    fields.summary = "summary";
    fields.source  = source;
    fields.status  = source == narrative::model::CurationSource::kManual ? narrative::model::CurationStatus::kManualDraft
                                                                         : narrative::model::CurationStatus::kAutoGenerated;
    return store.CreateRoot(tx, fields).id;
  }
};

ClusterGroupDraft MakeDraft() {
  ClusterGroupDraft draft;
  draft.name                   = "Arctic resource clusters";
  draft.description            = "clusters covering mineral claims";
  draft.cluster_ids            = {"cl-17", "cl-22"};
  draft.curator_id             = "curator-1";
  draft.rationale              = "same actors";
  draft.strategic_significance = "high";
  return draft;
}

void TestCreateValidatesDraft() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto group = f.groups.CreateGroup(*tx, MakeDraft());
  assert(group.status == ClusterGroupStatus::kDraft);
  assert(!group.parent_narrative_id);
  assert(group.created_at_ms == 5000);

  auto no_clusters        = MakeDraft();
  no_clusters.cluster_ids = {};
  auto long_name          = MakeDraft();
  long_name.name          = std::string(256, 'n');
  auto no_curator         = MakeDraft();
  no_curator.curator_id   = "";

  for (const auto& draft : {no_clusters, long_name, no_curator}) {
    bool threw = false;
    try {
      f.groups.CreateGroup(*tx, draft);
    } catch (const narrative::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestLinkRequiresManualRoot() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto group    = f.groups.CreateGroup(*tx, MakeDraft());
  const auto manual   = f.Root(*tx, narrative::model::CurationSource::kManual);
  const auto pipeline = f.Root(*tx, narrative::model::CurationSource::kPipeline);

  bool threw = false;
  try {
    f.groups.LinkToParent(*tx, group.id, "missing");
  } catch (const narrative::util::InvalidParentReference&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.groups.LinkToParent(*tx, group.id, pipeline);
  } catch (const narrative::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto linked = f.groups.LinkToParent(*tx, group.id, manual);
  assert(linked.parent_narrative_id == std::optional<std::string>(manual));
  assert(f.groups.List(*tx, manual).size() == 1);
  assert(f.groups.List(*tx, pipeline).empty());
  assert(f.groups.List(*tx, std::nullopt).size() == 1);
}

void TestApproveAdvancesOneStage() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto group = f.groups.CreateGroup(*tx, MakeDraft());

  f.clock->Advance(100);
  const auto pending = f.groups.Approve(*tx, group.id, "reviewer-1", "");
  assert(pending.status == ClusterGroupStatus::kPendingReview);
  assert(!pending.approved_at_ms);

  f.clock->Advance(100);
  const auto approved = f.groups.Approve(*tx, group.id, "reviewer-2", "verified");
  assert(approved.status == ClusterGroupStatus::kApproved);
  assert(approved.reviewer_id == std::optional<std::string>("reviewer-2"));
  assert(approved.review_notes == "verified");
  assert(approved.approved_at_ms == std::optional<uint64_t>(5200));

  bool threw = false;
  try {
    f.groups.Approve(*tx, group.id, "reviewer-2", "");
  } catch (const narrative::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.groups.Get(*tx, "missing");
  } catch (const narrative::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateValidatesDraft();
  TestLinkRequiresManualRoot();
  TestApproveAdvancesOneStage();

  std::cout << "narrative_unit_cluster_group_registry: pass\n";
  return 0;
}
