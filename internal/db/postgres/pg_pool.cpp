#include "pg_pool.hpp"

namespace narrative::db::postgres {

namespace {

constexpr const char* kNarrativeColumns =
    "id,display_id,parent_id,title,summary,curation_source,curation_status,curator_id,reviewer_id,published_by,"
    "editorial_priority,review_deadline_ms,published_at_ms,manual_cluster_ids::text,curation_notes::text,confidence_rating,"
    "created_at_ms,updated_at_ms,version";

constexpr const char* kClusterGroupColumns =
    "id,group_name,group_description,cluster_ids::text,parent_narrative_id,curator_id,curation_rationale,strategic_significance,"
    "status,reviewer_id,review_notes,created_at_ms,updated_at_ms,approved_at_ms";

constexpr const char* kHierarchyCacheColumns =
    "parent_id,parent_title,members::text,child_count,child_ids::text,child_titles::text,first_child_created_at_ms,"
    "latest_child_created_at_ms,latest_child_updated_at_ms,confidence_diversity,predominant_child_confidence,cache_updated_at_ms";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_narrative",
               "INSERT INTO narratives(id,display_id,parent_id,title,summary,curation_source,curation_status,curator_id,reviewer_id,"
               "published_by,editorial_priority,review_deadline_ms,published_at_ms,manual_cluster_ids,curation_notes,confidence_rating,"
               "created_at_ms,updated_at_ms,version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14::jsonb,$15::jsonb,$16,$17,$18,$19)");

  conn.prepare("get_narrative", Select(kNarrativeColumns, "FROM narratives WHERE id=$1"));
  conn.prepare("get_narrative_for_update", Select(kNarrativeColumns, "FROM narratives WHERE id=$1 FOR UPDATE"));
  conn.prepare("list_narratives", Select(kNarrativeColumns, "FROM narratives ORDER BY created_at_ms, id"));
  conn.prepare("list_children", Select(kNarrativeColumns, "FROM narratives WHERE parent_id=$1 ORDER BY created_at_ms, id"));

  conn.prepare("update_narrative",
               "UPDATE narratives SET display_id=$2,parent_id=$3,title=$4,summary=$5,curation_source=$6,curation_status=$7,"
               "curator_id=$8,reviewer_id=$9,published_by=$10,editorial_priority=$11,review_deadline_ms=$12,published_at_ms=$13,"
               "manual_cluster_ids=$14::jsonb,curation_notes=$15::jsonb,confidence_rating=$16,created_at_ms=$17,updated_at_ms=$18,"
               "version=$19 WHERE id=$1 AND version=$20");

  conn.prepare("delete_narrative", "DELETE FROM narratives WHERE id=$1");

  conn.prepare("append_curation_log",
               "INSERT INTO narrative_curation_log(id,narrative_id,action_type,old_values,new_values,reason,actor_id,actor_type,"
               "session_id,created_at_ms) VALUES($1,$2,$3,$4::jsonb,$5::jsonb,$6,$7,$8,$9,$10) RETURNING sequence");

  conn.prepare("list_curation_log",
               "SELECT sequence,id,narrative_id,action_type,old_values::text,new_values::text,reason,actor_id,actor_type,session_id,"
               "created_at_ms FROM narrative_curation_log WHERE ($1::text IS NULL OR narrative_id=$1) ORDER BY sequence");

  conn.prepare("count_curation_log", "SELECT COUNT(*) FROM narrative_curation_log");

  conn.prepare("insert_cluster_group",
               "INSERT INTO manual_cluster_groups(id,group_name,group_description,cluster_ids,parent_narrative_id,curator_id,"
               "curation_rationale,strategic_significance,status,reviewer_id,review_notes,created_at_ms,updated_at_ms,approved_at_ms) "
               "VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14)");

  conn.prepare("get_cluster_group", Select(kClusterGroupColumns, "FROM manual_cluster_groups WHERE id=$1"));

  conn.prepare("update_cluster_group",
               "UPDATE manual_cluster_groups SET group_name=$2,group_description=$3,cluster_ids=$4::jsonb,parent_narrative_id=$5,"
               "curator_id=$6,curation_rationale=$7,strategic_significance=$8,status=$9,reviewer_id=$10,review_notes=$11,"
               "created_at_ms=$12,updated_at_ms=$13,approved_at_ms=$14 WHERE id=$1");


  conn.prepare("list_cluster_groups",
               Select(kClusterGroupColumns, "FROM manual_cluster_groups WHERE ($1::text IS NULL OR parent_narrative_id=$1) "
                                            "ORDER BY created_at_ms, id"));

  conn.prepare("upsert_hierarchy_cache",
               "INSERT INTO narrative_hierarchy_cache(parent_id,parent_title,members,child_count,child_ids,child_titles,"
               "first_child_created_at_ms,latest_child_created_at_ms,latest_child_updated_at_ms,confidence_diversity,"
               "predominant_child_confidence,cache_updated_at_ms) "
               "VALUES($1,$2,$3::jsonb,$4,$5::jsonb,$6::jsonb,$7,$8,$9,$10,$11,$12) "
               "ON CONFLICT(parent_id) DO UPDATE SET parent_title=EXCLUDED.parent_title,members=EXCLUDED.members,"
               "child_count=EXCLUDED.child_count,child_ids=EXCLUDED.child_ids,child_titles=EXCLUDED.child_titles,"
               "first_child_created_at_ms=EXCLUDED.first_child_created_at_ms,"
               "latest_child_created_at_ms=EXCLUDED.latest_child_created_at_ms,"
               "latest_child_updated_at_ms=EXCLUDED.latest_child_updated_at_ms,confidence_diversity=EXCLUDED.confidence_diversity,"
               "predominant_child_confidence=EXCLUDED.predominant_child_confidence,cache_updated_at_ms=EXCLUDED.cache_updated_at_ms");

  conn.prepare("get_hierarchy_cache", Select(kHierarchyCacheColumns, "FROM narrative_hierarchy_cache WHERE parent_id=$1"));
  conn.prepare("list_hierarchy_cache", Select(kHierarchyCacheColumns, "FROM narrative_hierarchy_cache ORDER BY parent_id"));
  conn.prepare("delete_hierarchy_cache", "DELETE FROM narrative_hierarchy_cache WHERE parent_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // broken connection: drop it and let Acquire() open a fresh one
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace narrative::db::postgres
