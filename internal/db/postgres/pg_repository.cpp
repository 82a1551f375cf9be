#include "pg_repository.hpp"

#include <stdexcept>

#include "internal/db/sql/json_columns.hpp"

namespace narrative::db::postgres {

namespace json = narrative::db::sql;

namespace {

std::optional<int64_t> ToParam(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return U64(f);
}

template <typename T>
T ParseColumn(std::optional<T> parsed, const std::string& raw, const char* column) {
  if (!parsed) throw std::runtime_error(std::string("unexpected ") + column + " value '" + raw + "'");
  return *parsed;
}

model::NarrativeRecord ReadNarrative(const pqxx::row& row) {
  model::NarrativeRecord r;
  r.id                 = Text(row[0]);
  r.display_id         = Text(row[1]);
  r.parent_id          = OptText(row[2]);
  r.title              = Text(row[3]);
  r.summary            = Text(row[4]);
  auto source          = Text(row[5]);
  r.source             = ParseColumn(narrative::model::ParseCurationSource(source), source, "curation_source");
  auto status          = Text(row[6]);
  r.status             = ParseColumn(narrative::model::ParseCurationStatus(status), status, "curation_status");
  r.curator_id         = OptText(row[7]);
  r.reviewer_id        = OptText(row[8]);
  r.published_by       = OptText(row[9]);
  r.editorial_priority = row[10].as<int32_t>();
  r.review_deadline_ms = OptU64(row[11]);
  r.published_at_ms    = OptU64(row[12]);
  r.manual_cluster_ids = json::DecodeStringList(Text(row[13]));
  r.curation_notes     = json::DecodeNotes(Text(row[14]));
  r.confidence_rating  = Text(row[15]);
  r.created_at_ms      = U64(row[16]);
  r.updated_at_ms      = U64(row[17]);
  r.version            = U64(row[18]);
  return r;
}

std::vector<model::NarrativeRecord> ReadNarratives(const pqxx::result& res) {
  std::vector<model::NarrativeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadNarrative(row));
  }
  return out;
}

model::ClusterGroupRecord ReadClusterGroup(const pqxx::row& row) {
  model::ClusterGroupRecord r;
  r.id                     = Text(row[0]);
  r.name                   = Text(row[1]);
  r.description            = Text(row[2]);
  r.cluster_ids            = json::DecodeStringList(Text(row[3]));
  r.parent_narrative_id    = OptText(row[4]);
  r.curator_id             = Text(row[5]);
  r.rationale              = Text(row[6]);
  r.strategic_significance = Text(row[7]);
  auto status              = Text(row[8]);
  r.status                 = ParseColumn(narrative::model::ParseClusterGroupStatus(status), status, "status");
  r.reviewer_id            = OptText(row[9]);
  r.review_notes           = Text(row[10]);
  r.created_at_ms          = U64(row[11]);
  r.updated_at_ms          = U64(row[12]);
  r.approved_at_ms         = OptU64(row[13]);
  return r;
}

model::HierarchyCacheRecord ReadHierarchyCache(const pqxx::row& row) {
  model::HierarchyCacheRecord r;
  r.parent_id                    = Text(row[0]);
  r.parent_title                 = Text(row[1]);
  r.members                      = json::DecodeMembers(Text(row[2]));
  r.child_count                  = U64(row[3]);
  r.child_ids                    = json::DecodeStringList(Text(row[4]));
  r.child_titles                 = json::DecodeStringList(Text(row[5]));
  r.first_child_created_at_ms    = OptU64(row[6]);
  r.latest_child_created_at_ms   = OptU64(row[7]);
  r.latest_child_updated_at_ms   = OptU64(row[8]);
  r.confidence_diversity         = static_cast<uint32_t>(row[9].as<int32_t>());
  r.predominant_child_confidence = Text(row[10]);
  r.cache_updated_at_ms          = U64(row[11]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Narratives
// ------------------------------------------------------------------

Result PgRepository::InsertNarrative(Transaction& t, const model::NarrativeRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_narrative", r.id, r.display_id, r.parent_id, r.title, r.summary,
                               std::string(narrative::model::ToString(r.source)), std::string(narrative::model::ToString(r.status)),
                               r.curator_id, r.reviewer_id, r.published_by, r.editorial_priority, ToParam(r.review_deadline_ms),
                               ToParam(r.published_at_ms), json::EncodeStringList(r.manual_cluster_ids), json::EncodeNotes(r.curation_notes),
                               r.confidence_rating, static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.updated_at_ms),
                               static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NarrativeRecord> PgRepository::GetNarrative(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_narrative", id);
  if (res.empty()) return std::nullopt;
  return ReadNarrative(res[0]);
}

std::optional<model::NarrativeRecord> PgRepository::GetNarrativeForUpdate(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_narrative_for_update", id);
  if (res.empty()) return std::nullopt;
  return ReadNarrative(res[0]);
}

std::vector<model::NarrativeRecord> PgRepository::ListNarratives(Transaction& t) {
  return ReadNarratives(TX(t).Work().exec_prepared("list_narratives"));
}

std::vector<model::NarrativeRecord> PgRepository::ListChildren(Transaction& t, const std::string& parent_id) {
  return ReadNarratives(TX(t).Work().exec_prepared("list_children", parent_id));
}

Result PgRepository::UpdateNarrative(Transaction& t, const model::NarrativeRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared(
        "update_narrative", r.id, r.display_id, r.parent_id, r.title, r.summary, std::string(narrative::model::ToString(r.source)),
        std::string(narrative::model::ToString(r.status)), r.curator_id, r.reviewer_id, r.published_by, r.editorial_priority,
        ToParam(r.review_deadline_ms), ToParam(r.published_at_ms), json::EncodeStringList(r.manual_cluster_ids),
        json::EncodeNotes(r.curation_notes), r.confidence_rating, static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.updated_at_ms),
        static_cast<int64_t>(r.version), static_cast<int64_t>(expected_version));
    if (res.affected_rows() > 0) return Result::Ok();

    if (!GetNarrative(t, r.id)) return Result::Err(ErrorCode::NotFound, "narrative " + r.id);
    return Result::Err(ErrorCode::Conflict, "narrative " + r.id + " changed since version " + std::to_string(expected_version));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteNarrative(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_narrative", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Curation log
// ------------------------------------------------------------------

Result PgRepository::AppendCurationLog(Transaction& t, model::CurationLogRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("append_curation_log", r.id, r.narrative_id, r.action_type, json::EncodeStruct(r.old_values),
                                          json::EncodeStruct(r.new_values), r.reason, r.actor_id,
                                          std::string(narrative::model::ToString(r.actor_type)), r.session_id,
                                          static_cast<int64_t>(r.created_at_ms));
    r.sequence = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CurationLogRecord> PgRepository::ListCurationLog(Transaction& t, const std::optional<std::string>& narrative_id) {
  auto res = TX(t).Work().exec_prepared("list_curation_log", narrative_id);

  std::vector<model::CurationLogRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::CurationLogRecord r;
    r.sequence      = U64(row[0]);
    r.id            = Text(row[1]);
    r.narrative_id  = Text(row[2]);
    r.action_type   = Text(row[3]);
    r.old_values    = json::DecodeStruct(Text(row[4]));
    r.new_values    = json::DecodeStruct(Text(row[5]));
    r.reason        = Text(row[6]);
    r.actor_id      = Text(row[7]);
    auto actor      = Text(row[8]);
    r.actor_type    = ParseColumn(narrative::model::ParseActorType(actor), actor, "actor_type");
    r.session_id    = Text(row[9]);
    r.created_at_ms = U64(row[10]);
    out.push_back(std::move(r));
  }
  return out;
}

uint64_t PgRepository::CountCurationLog(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("count_curation_log");
  return U64(res[0][0]);
}

// ------------------------------------------------------------------
// Cluster groups
// ------------------------------------------------------------------

Result PgRepository::InsertClusterGroup(Transaction& t, const model::ClusterGroupRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_cluster_group", r.id, r.name, r.description, json::EncodeStringList(r.cluster_ids), r.parent_narrative_id,
                               r.curator_id, r.rationale, r.strategic_significance, std::string(narrative::model::ToString(r.status)),
                               r.reviewer_id, r.review_notes, static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.updated_at_ms),
                               ToParam(r.approved_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ClusterGroupRecord> PgRepository::GetClusterGroup(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_cluster_group", id);
  if (res.empty()) return std::nullopt;
  return ReadClusterGroup(res[0]);
}

Result PgRepository::UpdateClusterGroup(Transaction& t, const model::ClusterGroupRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_cluster_group", r.id, r.name, r.description, json::EncodeStringList(r.cluster_ids),
                                          r.parent_narrative_id, r.curator_id, r.rationale, r.strategic_significance,
                                          std::string(narrative::model::ToString(r.status)), r.reviewer_id, r.review_notes,
                                          static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.updated_at_ms),
                                          ToParam(r.approved_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "cluster group " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ClusterGroupRecord> PgRepository::ListClusterGroups(Transaction& t, const std::optional<std::string>& parent_narrative_id) {
  auto res = TX(t).Work().exec_prepared("list_cluster_groups", parent_narrative_id);

  std::vector<model::ClusterGroupRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadClusterGroup(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Hierarchy cache
// ------------------------------------------------------------------

Result PgRepository::UpsertHierarchyCache(Transaction& t, const model::HierarchyCacheRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_hierarchy_cache", r.parent_id, r.parent_title, json::EncodeMembers(r.members),
                               static_cast<int64_t>(r.child_count), json::EncodeStringList(r.child_ids), json::EncodeStringList(r.child_titles),
                               ToParam(r.first_child_created_at_ms), ToParam(r.latest_child_created_at_ms),
                               ToParam(r.latest_child_updated_at_ms), static_cast<int32_t>(r.confidence_diversity),
                               r.predominant_child_confidence, static_cast<int64_t>(r.cache_updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HierarchyCacheRecord> PgRepository::GetHierarchyCache(Transaction& t, const std::string& parent_id) {
  auto res = TX(t).Work().exec_prepared("get_hierarchy_cache", parent_id);
  if (res.empty()) return std::nullopt;
  return ReadHierarchyCache(res[0]);
}

std::vector<model::HierarchyCacheRecord> PgRepository::ListHierarchyCache(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_hierarchy_cache");

  std::vector<model::HierarchyCacheRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadHierarchyCache(row));
  }
  return out;
}

Result PgRepository::DeleteHierarchyCache(Transaction& t, const std::string& parent_id) {
  try {
    TX(t).Work().exec_prepared("delete_hierarchy_cache", parent_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace narrative::db::postgres
