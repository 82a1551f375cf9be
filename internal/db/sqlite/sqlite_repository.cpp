#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/json_columns.hpp"

namespace narrative::db::sqlite {

using narrative::db::ErrorCode;
using narrative::db::Result;

namespace json = narrative::db::sql;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement PrepareOrNull(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    st = nullptr;
  }
  return Statement(st, &sqlite3_finalize);
}

// Reads have no Result to carry a failure, so they throw.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = PrepareOrNull(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

template <typename T>
T ParseColumn(std::optional<T> parsed, const std::string& raw, const char* column) {
  if (!parsed) throw std::runtime_error(std::string("unexpected ") + column + " value '" + raw + "'");
  return *parsed;
}

// ------------------------------------------------------------------
// Narrative rows
// ------------------------------------------------------------------

constexpr const char* kNarrativeColumns =
    "id,display_id,parent_id,title,summary,curation_source,curation_status,curator_id,reviewer_id,published_by,"
    "editorial_priority,review_deadline_ms,published_at_ms,manual_cluster_ids,curation_notes,confidence_rating,"
    "created_at_ms,updated_at_ms,version";

// Binds ?1..?19 in kNarrativeColumns order.
void BindNarrative(sqlite3_stmt* st, const model::NarrativeRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.display_id);
  BindOptText(st, 3, r.parent_id);
  BindText(st, 4, r.title);
  BindText(st, 5, r.summary);
  BindText(st, 6, narrative::model::ToString(r.source));
  BindText(st, 7, narrative::model::ToString(r.status));
  BindOptText(st, 8, r.curator_id);
  BindOptText(st, 9, r.reviewer_id);
  BindOptText(st, 10, r.published_by);
  BindI32(st, 11, r.editorial_priority);
  BindOptU64(st, 12, r.review_deadline_ms);
  BindOptU64(st, 13, r.published_at_ms);
  BindText(st, 14, json::EncodeStringList(r.manual_cluster_ids));
  BindText(st, 15, json::EncodeNotes(r.curation_notes));
  BindText(st, 16, r.confidence_rating);
  BindU64(st, 17, r.created_at_ms);
  BindU64(st, 18, r.updated_at_ms);
  BindU64(st, 19, r.version);
}

model::NarrativeRecord ReadNarrative(sqlite3_stmt* st) {
  model::NarrativeRecord r;
  r.id           = ColText(st, 0);
  r.display_id   = ColText(st, 1);
  r.parent_id    = ColOptText(st, 2);
  r.title        = ColText(st, 3);
  r.summary      = ColText(st, 4);
  auto source    = ColText(st, 5);
  r.source       = ParseColumn(narrative::model::ParseCurationSource(source), source, "curation_source");
  auto status    = ColText(st, 6);
  r.status       = ParseColumn(narrative::model::ParseCurationStatus(status), status, "curation_status");
  r.curator_id   = ColOptText(st, 7);
  r.reviewer_id  = ColOptText(st, 8);
  r.published_by = ColOptText(st, 9);

  r.editorial_priority = ColI32(st, 10);
  r.review_deadline_ms = ColOptU64(st, 11);
  r.published_at_ms    = ColOptU64(st, 12);
  r.manual_cluster_ids = json::DecodeStringList(ColText(st, 13));
  r.curation_notes     = json::DecodeNotes(ColText(st, 14));
  r.confidence_rating  = ColText(st, 15);
  r.created_at_ms      = ColU64(st, 16);
  r.updated_at_ms      = ColU64(st, 17);
  r.version            = ColU64(st, 18);
  return r;
}

std::vector<model::NarrativeRecord> QueryNarratives(sqlite3* db, const std::string& sql, const std::optional<std::string>& arg) {
  auto st = PrepareOrThrow(db, sql.c_str());
  if (arg) BindText(st.get(), 1, *arg);

  std::vector<model::NarrativeRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadNarrative(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Cluster group rows
// ------------------------------------------------------------------

constexpr const char* kClusterGroupColumns =
    "id,group_name,group_description,cluster_ids,parent_narrative_id,curator_id,curation_rationale,strategic_significance,"
    "status,reviewer_id,review_notes,created_at_ms,updated_at_ms,approved_at_ms";

void BindClusterGroup(sqlite3_stmt* st, const model::ClusterGroupRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.name);
  BindText(st, 3, r.description);
  BindText(st, 4, json::EncodeStringList(r.cluster_ids));
  BindOptText(st, 5, r.parent_narrative_id);
  BindText(st, 6, r.curator_id);
  BindText(st, 7, r.rationale);
  BindText(st, 8, r.strategic_significance);
  BindText(st, 9, narrative::model::ToString(r.status));
  BindOptText(st, 10, r.reviewer_id);
  BindText(st, 11, r.review_notes);
  BindU64(st, 12, r.created_at_ms);
  BindU64(st, 13, r.updated_at_ms);
  BindOptU64(st, 14, r.approved_at_ms);
}

model::ClusterGroupRecord ReadClusterGroup(sqlite3_stmt* st) {
  model::ClusterGroupRecord r;
  r.id                     = ColText(st, 0);
  r.name                   = ColText(st, 1);
  r.description            = ColText(st, 2);
  r.cluster_ids            = json::DecodeStringList(ColText(st, 3));
  r.parent_narrative_id    = ColOptText(st, 4);
  r.curator_id             = ColText(st, 5);
  r.rationale              = ColText(st, 6);
  r.strategic_significance = ColText(st, 7);
  auto status              = ColText(st, 8);
  r.status                 = ParseColumn(narrative::model::ParseClusterGroupStatus(status), status, "status");
  r.reviewer_id            = ColOptText(st, 9);
  r.review_notes           = ColText(st, 10);
  r.created_at_ms          = ColU64(st, 11);
  r.updated_at_ms          = ColU64(st, 12);
  r.approved_at_ms         = ColOptU64(st, 13);
  return r;
}

// ------------------------------------------------------------------
// Hierarchy cache rows
// ------------------------------------------------------------------

constexpr const char* kHierarchyCacheColumns =
    "parent_id,parent_title,members,child_count,child_ids,child_titles,first_child_created_at_ms,latest_child_created_at_ms,"
    "latest_child_updated_at_ms,confidence_diversity,predominant_child_confidence,cache_updated_at_ms";

model::HierarchyCacheRecord ReadHierarchyCache(sqlite3_stmt* st) {
  model::HierarchyCacheRecord r;
  r.parent_id                    = ColText(st, 0);
  r.parent_title                 = ColText(st, 1);
  r.members                      = json::DecodeMembers(ColText(st, 2));
  r.child_count                  = ColU64(st, 3);
  r.child_ids                    = json::DecodeStringList(ColText(st, 4));
  r.child_titles                 = json::DecodeStringList(ColText(st, 5));
  r.first_child_created_at_ms    = ColOptU64(st, 6);
  r.latest_child_created_at_ms   = ColOptU64(st, 7);
  r.latest_child_updated_at_ms   = ColOptU64(st, 8);
  r.confidence_diversity         = static_cast<uint32_t>(ColI32(st, 9));
  r.predominant_child_confidence = ColText(st, 10);
  r.cache_updated_at_ms          = ColU64(st, 11);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Narratives
// ------------------------------------------------------------------

Result SqliteRepository::InsertNarrative(Transaction& t, const model::NarrativeRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO narratives(") + kNarrativeColumns +
                          ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19);";
  auto st = PrepareOrNull(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindNarrative(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::NarrativeRecord> SqliteRepository::GetNarrative(Transaction& t, const std::string& id) {
  auto rows = QueryNarratives(TX(t).Handle(), std::string("SELECT ") + kNarrativeColumns + " FROM narratives WHERE id=?1;", id);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::NarrativeRecord> SqliteRepository::GetNarrativeForUpdate(Transaction& t, const std::string& id) {
  // BEGIN IMMEDIATE already holds the database write lock.
  return GetNarrative(t, id);
}

std::vector<model::NarrativeRecord> SqliteRepository::ListNarratives(Transaction& t) {
  return QueryNarratives(TX(t).Handle(), std::string("SELECT ") + kNarrativeColumns + " FROM narratives ORDER BY created_at_ms, id;",
                         std::nullopt);
}

std::vector<model::NarrativeRecord> SqliteRepository::ListChildren(Transaction& t, const std::string& parent_id) {
  return QueryNarratives(TX(t).Handle(),
                         std::string("SELECT ") + kNarrativeColumns + " FROM narratives WHERE parent_id=?1 ORDER BY created_at_ms, id;", parent_id);
}

Result SqliteRepository::UpdateNarrative(Transaction& t, const model::NarrativeRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE narratives SET display_id=?2,parent_id=?3,title=?4,summary=?5,curation_source=?6,curation_status=?7,"
      "curator_id=?8,reviewer_id=?9,published_by=?10,editorial_priority=?11,review_deadline_ms=?12,published_at_ms=?13,"
      "manual_cluster_ids=?14,curation_notes=?15,confidence_rating=?16,created_at_ms=?17,updated_at_ms=?18,version=?19 "
      "WHERE id=?1 AND version=?20;";
  auto st = PrepareOrNull(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindNarrative(st.get(), r);
  BindU64(st.get(), 20, expected_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  if (!GetNarrative(t, r.id)) return Result::Err(ErrorCode::NotFound, "narrative " + r.id);
  return Result::Err(ErrorCode::Conflict, "narrative " + r.id + " changed since version " + std::to_string(expected_version));
}

Result SqliteRepository::DeleteNarrative(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  // children and linked cluster groups go with it through ON DELETE CASCADE
  auto st = PrepareOrNull(db, "DELETE FROM narratives WHERE id=?1;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Curation log
// ------------------------------------------------------------------

Result SqliteRepository::AppendCurationLog(Transaction& t, model::CurationLogRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO narrative_curation_log(id,narrative_id,action_type,old_values,new_values,reason,actor_id,actor_type,"
      "session_id,created_at_ms) VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10);";
  auto st = PrepareOrNull(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.narrative_id);
  BindText(st.get(), 3, r.action_type);
  BindText(st.get(), 4, json::EncodeStruct(r.old_values));
  BindText(st.get(), 5, json::EncodeStruct(r.new_values));
  BindText(st.get(), 6, r.reason);
  BindText(st.get(), 7, r.actor_id);
  BindText(st.get(), 8, narrative::model::ToString(r.actor_type));
  BindText(st.get(), 9, r.session_id);
  BindU64(st.get(), 10, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::CurationLogRecord> SqliteRepository::ListCurationLog(Transaction& t, const std::optional<std::string>& narrative_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT sequence,id,narrative_id,action_type,old_values,new_values,reason,actor_id,actor_type,session_id,created_at_ms "
      "FROM narrative_curation_log WHERE (?1 IS NULL OR narrative_id=?1) ORDER BY sequence;";
  auto st = PrepareOrThrow(db, sql);
  BindOptText(st.get(), 1, narrative_id);

  std::vector<model::CurationLogRecord> out;
  while (StepRow(db, st.get())) {
    model::CurationLogRecord r;
    r.sequence     = ColU64(st.get(), 0);
    r.id           = ColText(st.get(), 1);
    r.narrative_id = ColText(st.get(), 2);
    r.action_type  = ColText(st.get(), 3);
    r.old_values   = json::DecodeStruct(ColText(st.get(), 4));
    r.new_values   = json::DecodeStruct(ColText(st.get(), 5));
    r.reason       = ColText(st.get(), 6);
    r.actor_id     = ColText(st.get(), 7);
    auto actor     = ColText(st.get(), 8);
    r.actor_type   = ParseColumn(narrative::model::ParseActorType(actor), actor, "actor_type");
    r.session_id   = ColText(st.get(), 9);
    r.created_at_ms = ColU64(st.get(), 10);
    out.push_back(std::move(r));
  }
  return out;
}

uint64_t SqliteRepository::CountCurationLog(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COUNT(*) FROM narrative_curation_log;");
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

// ------------------------------------------------------------------
// Cluster groups
// ------------------------------------------------------------------

Result SqliteRepository::InsertClusterGroup(Transaction& t, const model::ClusterGroupRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("INSERT INTO manual_cluster_groups(") + kClusterGroupColumns + ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14);";
  auto st = PrepareOrNull(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindClusterGroup(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ClusterGroupRecord> SqliteRepository::GetClusterGroup(Transaction& t, const std::string& id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kClusterGroupColumns + " FROM manual_cluster_groups WHERE id=?1;";
  auto              st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadClusterGroup(st.get());
}

Result SqliteRepository::UpdateClusterGroup(Transaction& t, const model::ClusterGroupRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE manual_cluster_groups SET group_name=?2,group_description=?3,cluster_ids=?4,parent_narrative_id=?5,curator_id=?6,"
      "curation_rationale=?7,strategic_significance=?8,status=?9,reviewer_id=?10,review_notes=?11,created_at_ms=?12,"
      "updated_at_ms=?13,approved_at_ms=?14 WHERE id=?1;";
  auto st = PrepareOrNull(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindClusterGroup(st.get(), r);
  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "cluster group " + r.id);
  return Result::Ok();
}

std::vector<model::ClusterGroupRecord> SqliteRepository::ListClusterGroups(Transaction& t, const std::optional<std::string>& parent_narrative_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kClusterGroupColumns +
                          " FROM manual_cluster_groups WHERE (?1 IS NULL OR parent_narrative_id=?1) ORDER BY created_at_ms, id;";
  auto st = PrepareOrThrow(db, sql.c_str());
  BindOptText(st.get(), 1, parent_narrative_id);

  std::vector<model::ClusterGroupRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadClusterGroup(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Hierarchy cache
// ------------------------------------------------------------------

Result SqliteRepository::UpsertHierarchyCache(Transaction& t, const model::HierarchyCacheRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO narrative_hierarchy_cache(") + kHierarchyCacheColumns +
                          ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12) "
                          "ON CONFLICT(parent_id) DO UPDATE SET parent_title=excluded.parent_title,members=excluded.members,"
                          "child_count=excluded.child_count,child_ids=excluded.child_ids,child_titles=excluded.child_titles,"
                          "first_child_created_at_ms=excluded.first_child_created_at_ms,"
                          "latest_child_created_at_ms=excluded.latest_child_created_at_ms,"
                          "latest_child_updated_at_ms=excluded.latest_child_updated_at_ms,"
                          "confidence_diversity=excluded.confidence_diversity,"
                          "predominant_child_confidence=excluded.predominant_child_confidence,"
                          "cache_updated_at_ms=excluded.cache_updated_at_ms;";
  auto st = PrepareOrNull(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.parent_id);
  BindText(st.get(), 2, r.parent_title);
  BindText(st.get(), 3, json::EncodeMembers(r.members));
  BindU64(st.get(), 4, r.child_count);
  BindText(st.get(), 5, json::EncodeStringList(r.child_ids));
  BindText(st.get(), 6, json::EncodeStringList(r.child_titles));
  BindOptU64(st.get(), 7, r.first_child_created_at_ms);
  BindOptU64(st.get(), 8, r.latest_child_created_at_ms);
  BindOptU64(st.get(), 9, r.latest_child_updated_at_ms);
  BindI32(st.get(), 10, static_cast<int>(r.confidence_diversity));
  BindText(st.get(), 11, r.predominant_child_confidence);
  BindU64(st.get(), 12, r.cache_updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::HierarchyCacheRecord> SqliteRepository::GetHierarchyCache(Transaction& t, const std::string& parent_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kHierarchyCacheColumns + " FROM narrative_hierarchy_cache WHERE parent_id=?1;";
  auto              st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, parent_id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadHierarchyCache(st.get());
}

std::vector<model::HierarchyCacheRecord> SqliteRepository::ListHierarchyCache(Transaction& t) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kHierarchyCacheColumns + " FROM narrative_hierarchy_cache ORDER BY parent_id;";
  auto              st  = PrepareOrThrow(db, sql.c_str());

  std::vector<model::HierarchyCacheRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadHierarchyCache(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteHierarchyCache(Transaction& t, const std::string& parent_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "DELETE FROM narrative_hierarchy_cache WHERE parent_id=?1;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, parent_id);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace narrative::db::sqlite
