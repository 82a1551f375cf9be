#include "migrations.hpp"

#include <stdexcept>

namespace narrative::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS narratives ("
      " id TEXT PRIMARY KEY,"
      " display_id TEXT NOT NULL UNIQUE,"
      " parent_id TEXT REFERENCES narratives(id) ON DELETE CASCADE,"
      " title TEXT NOT NULL,"
      " summary TEXT NOT NULL,"
      " curation_source TEXT NOT NULL,"
      " curation_status TEXT NOT NULL,"
      " curator_id TEXT,"
      " reviewer_id TEXT,"
      " published_by TEXT,"
      " editorial_priority INTEGER NOT NULL CHECK (editorial_priority BETWEEN 1 AND 5),"
      " review_deadline_ms INTEGER,"
      " published_at_ms INTEGER,"
      " manual_cluster_ids TEXT NOT NULL DEFAULT '[]',"
      " curation_notes TEXT NOT NULL DEFAULT '[]',"
      " confidence_rating TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " version INTEGER NOT NULL,"
      " CHECK (parent_id IS NULL OR parent_id <> id));",
      "CREATE INDEX IF NOT EXISTS idx_narratives_parent ON narratives(parent_id, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_narratives_status ON narratives(curation_status);",
      "CREATE TABLE IF NOT EXISTS narrative_curation_log ("
      " sequence INTEGER PRIMARY KEY AUTOINCREMENT,"
      " id TEXT NOT NULL UNIQUE,"
      " narrative_id TEXT NOT NULL,"
      " action_type TEXT NOT NULL,"
      " old_values TEXT NOT NULL DEFAULT '{}',"
      " new_values TEXT NOT NULL DEFAULT '{}',"
      " reason TEXT NOT NULL DEFAULT '',"
      " actor_id TEXT NOT NULL,"
      " actor_type TEXT NOT NULL DEFAULT 'user',"
      " session_id TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_curation_log_narrative ON narrative_curation_log(narrative_id, sequence);",
      "CREATE TABLE IF NOT EXISTS manual_cluster_groups ("
      " id TEXT PRIMARY KEY,"
      " group_name TEXT NOT NULL,"
      " group_description TEXT NOT NULL DEFAULT '',"
      " cluster_ids TEXT NOT NULL DEFAULT '[]',"
      " parent_narrative_id TEXT REFERENCES narratives(id) ON DELETE CASCADE,"
      " curator_id TEXT NOT NULL,"
      " curation_rationale TEXT NOT NULL DEFAULT '',"
      " strategic_significance TEXT NOT NULL DEFAULT '',"
      " status TEXT NOT NULL DEFAULT 'draft',"
      " reviewer_id TEXT,"
      " review_notes TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " approved_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS idx_cluster_groups_parent ON manual_cluster_groups(parent_narrative_id);",
      "CREATE TABLE IF NOT EXISTS narrative_hierarchy_cache ("
      " parent_id TEXT PRIMARY KEY,"
      " parent_title TEXT NOT NULL,"
      " members TEXT NOT NULL DEFAULT '[]',"
      " child_count INTEGER NOT NULL,"
      " child_ids TEXT NOT NULL DEFAULT '[]',"
      " child_titles TEXT NOT NULL DEFAULT '[]',"
      " first_child_created_at_ms INTEGER,"
      " latest_child_created_at_ms INTEGER,"
      " latest_child_updated_at_ms INTEGER,"
      " confidence_diversity INTEGER NOT NULL,"
      " predominant_child_confidence TEXT NOT NULL DEFAULT '',"
      " cache_updated_at_ms INTEGER NOT NULL);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS narratives ("
      " id TEXT PRIMARY KEY,"
      " display_id TEXT NOT NULL UNIQUE,"
      " parent_id TEXT REFERENCES narratives(id) ON DELETE CASCADE,"
      " title TEXT NOT NULL,"
      " summary TEXT NOT NULL,"
      " curation_source TEXT NOT NULL,"
      " curation_status TEXT NOT NULL,"
      " curator_id TEXT,"
      " reviewer_id TEXT,"
      " published_by TEXT,"
      " editorial_priority INTEGER NOT NULL CHECK (editorial_priority BETWEEN 1 AND 5),"
      " review_deadline_ms BIGINT,"
      " published_at_ms BIGINT,"
      " manual_cluster_ids JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " curation_notes JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " confidence_rating TEXT NOT NULL DEFAULT '',"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " version BIGINT NOT NULL,"
      " CHECK (parent_id IS NULL OR parent_id <> id));",
      "CREATE INDEX IF NOT EXISTS idx_narratives_parent ON narratives(parent_id, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_narratives_status ON narratives(curation_status);",
      "CREATE TABLE IF NOT EXISTS narrative_curation_log ("
      " sequence BIGSERIAL PRIMARY KEY,"
      " id TEXT NOT NULL UNIQUE,"
      " narrative_id TEXT NOT NULL,"
      " action_type TEXT NOT NULL,"
      " old_values JSONB NOT NULL DEFAULT '{}'::jsonb,"
      " new_values JSONB NOT NULL DEFAULT '{}'::jsonb,"
      " reason TEXT NOT NULL DEFAULT '',"
      " actor_id TEXT NOT NULL,"
      " actor_type TEXT NOT NULL DEFAULT 'user',"
      " session_id TEXT NOT NULL DEFAULT '',"
      " created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_curation_log_narrative ON narrative_curation_log(narrative_id, sequence);",
      "CREATE TABLE IF NOT EXISTS manual_cluster_groups ("
      " id TEXT PRIMARY KEY,"
      " group_name TEXT NOT NULL,"
      " group_description TEXT NOT NULL DEFAULT '',"
      " cluster_ids JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " parent_narrative_id TEXT REFERENCES narratives(id) ON DELETE CASCADE,"
      " curator_id TEXT NOT NULL,"
      " curation_rationale TEXT NOT NULL DEFAULT '',"
      " strategic_significance TEXT NOT NULL DEFAULT '',"
      " status TEXT NOT NULL DEFAULT 'draft',"
      " reviewer_id TEXT,"
      " review_notes TEXT NOT NULL DEFAULT '',"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " approved_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS idx_cluster_groups_parent ON manual_cluster_groups(parent_narrative_id);",
      "CREATE TABLE IF NOT EXISTS narrative_hierarchy_cache ("
      " parent_id TEXT PRIMARY KEY,"
      " parent_title TEXT NOT NULL,"
      " members JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " child_count BIGINT NOT NULL,"
      " child_ids JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " child_titles JSONB NOT NULL DEFAULT '[]'::jsonb,"
      " first_child_created_at_ms BIGINT,"
      " latest_child_created_at_ms BIGINT,"
      " latest_child_updated_at_ms BIGINT,"
      " confidence_diversity INTEGER NOT NULL,"
      " predominant_child_confidence TEXT NOT NULL DEFAULT '',"
      " cache_updated_at_ms BIGINT NOT NULL);",
  };
  return kSchema;
}

} // namespace narrative::db::sql
