#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

#if NARRATIVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if NARRATIVE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using narrative::db::ErrorCode;
using narrative::db::Repository;
using narrative::db::memory::MemoryRepository;
using narrative::db::model::ClusterGroupRecord;
using narrative::db::model::CurationLogRecord;
using narrative::db::model::CurationNote;
using narrative::db::model::HierarchyCacheRecord;
using narrative::db::model::HierarchyMember;
using narrative::db::model::NarrativeRecord;
using narrative::model::ClusterGroupStatus;
using narrative::model::CurationSource;
using narrative::model::CurationStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

NarrativeRecord MakeNarrative(const std::string& id, uint64_t created_at_ms) {
  NarrativeRecord record;
  record.id                = id;
  record.display_id        = "EN-20250101-" + id;
  record.title             = "title " + id;
  record.summary           = "summary " + id;
  record.source            = CurationSource::kPipeline;
  record.status            = CurationStatus::kAutoGenerated;
  record.confidence_rating = "high";
  record.created_at_ms     = created_at_ms;
  record.updated_at_ms     = created_at_ms;
  return record;
}

NarrativeRecord MakeManualParent(const std::string& id, uint64_t created_at_ms) {
  auto record               = MakeNarrative(id, created_at_ms);
  record.source             = CurationSource::kManual;
  record.status             = CurationStatus::kManualDraft;
  record.curator_id         = "editor-7";
  record.editorial_priority = 2;
  record.review_deadline_ms = created_at_ms + 86'400'000;
  record.manual_cluster_ids = {"cl-17", "cl-22"};
  record.curation_notes     = {CurationNote{"created", "initial draft", "editor-7", created_at_ms}};
  return record;
}

void VerifyNarrativeReadWrite(Repository& repo, const std::string& prefix) {
  const auto parent_id = prefix + "-parent";
  const auto child_a   = prefix + "-child-a";
  const auto child_b   = prefix + "-child-b";

  {
    auto tx = repo.Begin();
    assert(repo.InsertNarrative(*tx, MakeManualParent(parent_id, 1000)));

    auto b      = MakeNarrative(child_b, 3000);
    b.parent_id = parent_id;
    assert(repo.InsertNarrative(*tx, b));

    auto a      = MakeNarrative(child_a, 2000);
    a.parent_id = parent_id;
    assert(repo.InsertNarrative(*tx, a));
    tx->Commit();
  }

  // a failed statement poisons a postgres transaction, so constraint
  // failures get a transaction of their own
  {
    auto tx = repo.Begin();
    assert(repo.InsertNarrative(*tx, MakeNarrative(child_a, 2000)).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx              = repo.Begin();
    auto duplicate       = MakeNarrative(prefix + "-dup-display", 4000);
    duplicate.display_id = MakeNarrative(child_a, 2000).display_id;
    assert(repo.InsertNarrative(*tx, duplicate).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx     = repo.Begin();
    auto parent = repo.GetNarrative(*tx, parent_id);
    assert(parent.has_value());
    assert(*parent == MakeManualParent(parent_id, 1000));

    const auto children = repo.ListChildren(*tx, parent_id);
    assert(children.size() == 2);
    assert(children[0].id == child_a);
    assert(children[1].id == child_b);
    assert(children[0].parent_id == std::optional<std::string>(parent_id));

    auto updated            = *parent;
    updated.status          = CurationStatus::kPublished;
    updated.published_at_ms = 5000;
    updated.published_by    = "chief-1";
    updated.reviewer_id     = "reviewer-2";
    updated.version         = 2;
    assert(repo.UpdateNarrative(*tx, updated, 1));

    const auto stale = repo.UpdateNarrative(*tx, updated, 1);
    assert(stale.code == ErrorCode::Conflict);

    auto reread = repo.GetNarrativeForUpdate(*tx, parent_id);
    assert(reread.has_value());
    assert(*reread == updated);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteNarrative(*tx, parent_id));
    assert(!repo.GetNarrative(*tx, parent_id));
    assert(!repo.GetNarrative(*tx, child_a));
    assert(!repo.GetNarrative(*tx, child_b));
    tx->Commit();
  }
}

void VerifyCurationLogReadWrite(Repository& repo, const std::string& prefix) {
  const auto narrative_id = prefix + "-audited";

  auto tx         = repo.Begin();
  auto base_count = repo.CountCurationLog(*tx);

  std::vector<uint64_t> sequences;
  for (int i = 0; i < 3; ++i) {
    CurationLogRecord entry;
    entry.id           = prefix + "-log-" + std::to_string(i);
    entry.narrative_id = i == 2 ? prefix + "-other" : narrative_id;
    entry.action_type  = "status_changed";
    (*entry.old_values.mutable_fields())["status"].set_string_value("approved");
    (*entry.new_values.mutable_fields())["status"].set_string_value("published");
    (*entry.new_values.mutable_fields())["priority"].set_number_value(2);
    entry.reason        = "go live";
    entry.actor_id      = "chief-1";
    entry.actor_type    = narrative::model::ActorType::kSystem;
    entry.session_id    = prefix + "-session";
    entry.created_at_ms = 1000 + i;
    assert(repo.AppendCurationLog(*tx, entry));
    sequences.push_back(entry.sequence);
  }
  tx->Commit();

  assert(sequences[0] < sequences[1]);
  assert(sequences[1] < sequences[2]);

  auto read    = repo.Begin();
  auto entries = repo.ListCurationLog(*read, narrative_id);
  assert(entries.size() == 2);
  assert(entries[0].id == prefix + "-log-0");
  assert(entries[0].sequence < entries[1].sequence);
  assert(entries[0].actor_type == narrative::model::ActorType::kSystem);
  assert(entries[0].old_values.fields().at("status").string_value() == "approved");
  assert(entries[0].new_values.fields().at("priority").number_value() == 2.0);
  assert(entries[0].session_id == prefix + "-session");
  assert(repo.CountCurationLog(*read) == base_count + 3);
  read->Commit();
}

void VerifyClusterGroupReadWrite(Repository& repo, const std::string& prefix) {
  const auto parent_id = prefix + "-group-parent";

  auto tx = repo.Begin();
  assert(repo.InsertNarrative(*tx, MakeManualParent(parent_id, 1000)));

  ClusterGroupRecord group;
  group.id                     = prefix + "-group";
  group.name                   = "Arctic";
  group.description            = "clusters on arctic claims";
  group.cluster_ids            = {"cl-17", "cl-22"};
  group.curator_id             = "editor-7";
  group.rationale              = "same actors";
  group.strategic_significance = "high";
  group.created_at_ms          = 1000;
  group.updated_at_ms          = 1000;
  assert(repo.InsertClusterGroup(*tx, group));

  group.parent_narrative_id = parent_id;
  group.status              = ClusterGroupStatus::kApproved;
  group.reviewer_id         = "reviewer-2";
  group.review_notes        = "ok";
  group.approved_at_ms      = 2000;
  group.updated_at_ms       = 2000;
  assert(repo.UpdateClusterGroup(*tx, group));

  auto read = repo.GetClusterGroup(*tx, group.id);
  assert(read.has_value());
  assert(*read == group);
  assert(repo.ListClusterGroups(*tx, parent_id).size() == 1);

  assert(repo.DeleteNarrative(*tx, parent_id));
  assert(!repo.GetClusterGroup(*tx, group.id));
  tx->Commit();

  auto dangling_tx             = repo.Begin();
  auto dangling                = group;
  dangling.id                  = prefix + "-dangling";
  dangling.parent_narrative_id = prefix + "-missing";
  assert(repo.InsertClusterGroup(*dangling_tx, dangling).code == ErrorCode::ConstraintViolation);
  dangling_tx->Rollback();
}

void VerifyHierarchyCacheReadWrite(Repository& repo, const std::string& prefix) {
  HierarchyCacheRecord entry;
  entry.parent_id                    = prefix + "-cache-root";
  entry.parent_title                 = "Greenland Dispute";
  entry.members                      = {HierarchyMember{"a", "first", 10, 20, "high"}, HierarchyMember{"b", "second", 11, 30, "low"}};
  entry.child_count                  = 2;
  entry.child_ids                    = {"a", "b"};
  entry.child_titles                 = {"first", "second"};
  entry.first_child_created_at_ms    = 10;
  entry.latest_child_created_at_ms   = 11;
  entry.latest_child_updated_at_ms   = 30;
  entry.confidence_diversity         = 2;
  entry.predominant_child_confidence = "high";
  entry.cache_updated_at_ms          = 99;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertHierarchyCache(*tx, entry));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto read = repo.GetHierarchyCache(*tx, entry.parent_id);
    assert(read.has_value());
    assert(read->SameContent(entry));
    assert(read->cache_updated_at_ms == 99);

    entry.parent_title = "renamed";
    assert(repo.UpsertHierarchyCache(*tx, entry));
    assert(repo.GetHierarchyCache(*tx, entry.parent_id)->parent_title == "renamed");

    assert(repo.DeleteHierarchyCache(*tx, entry.parent_id));
    assert(!repo.GetHierarchyCache(*tx, entry.parent_id));
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertNarrative(*tx, MakeNarrative(id, 1000)));
    CurationLogRecord entry;
    entry.id           = id + "-log";
    entry.narrative_id = id;
    entry.action_type  = "created";
    entry.actor_id     = "pipeline";
    assert(repo.AppendCurationLog(*tx, entry));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetNarrative(*tx, id));
  assert(repo.ListCurationLog(*tx, id).empty());
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertNarrative(*tx, MakeNarrative(id, 1000)));
    tx->Commit();
  }

  // a single-connection backend serializes transactions; a second Begin()
  // on this thread would wait for the first forever
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetNarrative(*tx1, id);
  auto r2 = repo.GetNarrative(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->title   = "first writer";
  r1->version = 2;
  r2->title   = "second writer";
  r2->version = 2;

  assert(repo.UpdateNarrative(*tx1, *r1, 1));
  tx1->Commit();

  // the loser is rejected either at the compare-and-swap or at commit
  bool       rejected = false;
  const auto second   = repo.UpdateNarrative(*tx2, *r2, 1);
  if (!second) {
    assert(second.code == ErrorCode::Conflict);
    rejected = true;
    tx2->Rollback();
  } else {
    try {
      tx2->Commit();
    } catch (const narrative::util::ConcurrentModification&) {
      rejected = true;
    }
  }
  assert(rejected);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetNarrative(*verify_tx, id);
  assert(final.has_value());
  assert(final->title == "first writer");
  assert(final->version == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertNarrative(*tx, MakeManualParent(id, 1000)));

    auto child      = MakeNarrative(id + "-child", 2000);
    child.parent_id = id;
    assert(repo->InsertNarrative(*tx, child));

    CurationLogRecord entry;
    entry.id            = id + "-log";
    entry.narrative_id  = id;
    entry.action_type   = "created_manual_parent";
    entry.actor_id      = "editor-7";
    entry.created_at_ms = NowMs();
    assert(repo->AppendCurationLog(*tx, entry));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto parent = repo->GetNarrative(*tx, id);
  assert(parent.has_value());
  assert(parent->manual_cluster_ids == (std::vector<std::string>{"cl-17", "cl-22"}));
  assert(parent->curation_notes.size() == 1);

  auto children = repo->ListChildren(*tx, id);
  assert(children.size() == 1);
  assert(children[0].id == id + "-child");

  auto log = repo->ListCurationLog(*tx, id);
  assert(log.size() == 1);
  assert(log[0].action_type == "created_manual_parent");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if NARRATIVE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("narrative_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<narrative::db::sqlite::SqliteDB>(db_path);
    for (const auto& statement : narrative::db::sql::SqliteSchema()) {
      db->Exec(statement);
    }
    return std::make_shared<narrative::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if NARRATIVE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("NARRATIVE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("NARRATIVE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<narrative::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& statement : narrative::db::sql::PostgresSchema()) {
        tx.exec(statement);
      }
      tx.commit();
    }
    return std::make_shared<narrative::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();
    VerifyNarrativeReadWrite(*repo, prefix + "-narratives");
    VerifyCurationLogReadWrite(*repo, prefix + "-log");
    VerifyClusterGroupReadWrite(*repo, prefix + "-groups");
    VerifyHierarchyCacheReadWrite(*repo, prefix + "-cache");
    VerifyRollbackBehavior(*repo, prefix + "-rollback");
    VerifyConcurrentUpdates(*repo, prefix + "-concurrency", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if NARRATIVE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if NARRATIVE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "narrative_integration_repository_parity: pass\n";
  return 0;
}
