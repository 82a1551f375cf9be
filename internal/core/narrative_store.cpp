#include "narrative_store.hpp"

#include <algorithm>
#include <unordered_map>

#include "internal/core/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace narrative::core {

using db::model::NarrativeRecord;
using narrative::model::CurationSource;

NarrativeStore::NarrativeStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

NarrativeRecord NarrativeStore::CreateRoot(db::Transaction& tx, NarrativeRecord fields) {
  if (!narrative::model::IsEntryStatus(fields.source, fields.status)) {
    throw util::ValidationError("status " + std::string(narrative::model::ToString(fields.status)) + " is not valid for a new " +
                                std::string(narrative::model::ToString(fields.source)) + " narrative");
  }
  if (fields.editorial_priority < 1 || fields.editorial_priority > 5) {
    throw util::ValidationError("editorial_priority must be in [1,5], got " + std::to_string(fields.editorial_priority));
  }

  const auto now = clock_->NowMs();
  if (fields.id.empty()) fields.id = util::NewId();
  if (fields.created_at_ms == 0) fields.created_at_ms = now;
  if (fields.display_id.empty()) fields.display_id = "EN-" + util::FormatDate(fields.created_at_ms) + "-" + fields.id.substr(0, 8);
  fields.updated_at_ms = fields.created_at_ms;
  fields.parent_id.reset();
  fields.published_at_ms.reset();
  fields.published_by.reset();
  fields.version = 1;

  ThrowIfDbError(repository_->InsertNarrative(tx, fields), "insert narrative " + fields.id);
  return fields;
}

NarrativeRecord NarrativeStore::SetParent(db::Transaction& tx, const std::string& child_id, const std::string& parent_id) {
  if (child_id == parent_id) {
    throw util::SelfReferenceError("narrative " + child_id + " cannot be its own parent");
  }

  auto child  = GetForUpdate(tx, child_id);
  auto parent = repository_->GetNarrativeForUpdate(tx, parent_id);
  if (!parent) {
    throw util::InvalidParentReference("parent narrative " + parent_id + " does not exist");
  }
  if (parent->parent_id) {
    throw util::DepthViolation("narrative " + parent_id + " is itself a child of " + *parent->parent_id + "; hierarchy depth is limited to 2");
  }
  if (child.parent_id) {
    throw util::AlreadyParented("narrative " + child_id + " already has parent " + *child.parent_id);
  }
  if (!repository_->ListChildren(tx, child_id).empty()) {
    throw util::DepthViolation("narrative " + child_id + " has children of its own; hierarchy depth is limited to 2");
  }

  child.parent_id = parent_id;
  return Save(tx, std::move(child));
}

std::string NarrativeStore::ClearParent(db::Transaction& tx, const std::string& child_id) {
  auto child = GetForUpdate(tx, child_id);
  if (!child.parent_id) {
    throw util::ValidationError("narrative " + child_id + " has no parent");
  }

  auto previous = *child.parent_id;
  child.parent_id.reset();
  Save(tx, std::move(child));
  return previous;
}

std::vector<NarrativeRecord> NarrativeStore::Delete(db::Transaction& tx, const std::string& id) {
  auto target = GetForUpdate(tx, id);

  std::vector<NarrativeRecord> removed;
  for (auto& child : repository_->ListChildren(tx, id)) {
    ThrowIfDbError(repository_->DeleteNarrative(tx, child.id), "delete child " + child.id);
    removed.push_back(std::move(child));
  }
  ThrowIfDbError(repository_->DeleteNarrative(tx, id), "delete narrative " + id);
  removed.push_back(std::move(target));
  return removed;
}

NarrativeRecord NarrativeStore::Get(db::Transaction& tx, const std::string& id) {
  auto record = repository_->GetNarrative(tx, id);
  if (!record) throw util::NotFound("narrative " + id);
  return std::move(*record);
}

std::optional<NarrativeRecord> NarrativeStore::Find(db::Transaction& tx, const std::string& id) {
  return repository_->GetNarrative(tx, id);
}

NarrativeRecord NarrativeStore::GetForUpdate(db::Transaction& tx, const std::string& id) {
  auto record = repository_->GetNarrativeForUpdate(tx, id);
  if (!record) throw util::NotFound("narrative " + id);
  return std::move(*record);
}

std::vector<NarrativeRecord> NarrativeStore::GetChildren(db::Transaction& tx, const std::string& parent_id) {
  if (!repository_->GetNarrative(tx, parent_id)) throw util::NotFound("narrative " + parent_id);
  return repository_->ListChildren(tx, parent_id);
}

std::optional<NarrativeRecord> NarrativeStore::GetParent(db::Transaction& tx, const std::string& child_id) {
  auto child = Get(tx, child_id);
  if (!child.parent_id) return std::nullopt;
  return repository_->GetNarrative(tx, *child.parent_id);
}

NarrativeRecord NarrativeStore::GetRoot(db::Transaction& tx, const std::string& id) {
  auto record = Get(tx, id);
  if (!record.parent_id) return record;
  auto parent = repository_->GetNarrative(tx, *record.parent_id);
  if (!parent) throw util::InvalidParentReference("narrative " + id + " references missing parent " + *record.parent_id);
  return std::move(*parent);
}

std::vector<NarrativeRecord> NarrativeStore::List(db::Transaction& tx) {
  return repository_->ListNarratives(tx);
}

NarrativeRecord NarrativeStore::Save(db::Transaction& tx, NarrativeRecord record) {
  const auto expected = record.version;
  record.version      = expected + 1;
  record.updated_at_ms = std::max(clock_->NowMs(), record.updated_at_ms);

  ThrowIfDbError(repository_->UpdateNarrative(tx, record, expected), "update narrative " + record.id);
  return record;
}

IntegrityReport NarrativeStore::ValidateIntegrity(db::Transaction& tx) {
  const auto narratives = repository_->ListNarratives(tx);

  std::unordered_map<std::string, const NarrativeRecord*> by_id;
  for (const auto& n : narratives) {
    by_id.emplace(n.id, &n);
  }

  IntegrityCheck self_references{"self_references", {}};
  IntegrityCheck dangling_parents{"dangling_parent_references", {}};
  IntegrityCheck depth_violations{"depth_violations", {}};
  IntegrityCheck manual_source_mismatch{"manual_roots_without_manual_source", {}};

  for (const auto& n : narratives) {
    if (n.parent_id) {
      if (*n.parent_id == n.id) {
        self_references.offending_ids.push_back(n.id);
        continue;
      }
      auto it = by_id.find(*n.parent_id);
      if (it == by_id.end()) {
        dangling_parents.offending_ids.push_back(n.id);
      } else if (it->second->parent_id) {
        depth_violations.offending_ids.push_back(n.id);
      }
    } else if (!n.manual_cluster_ids.empty() && n.source != CurationSource::kManual) {
      // cluster ids are only carried by manual parents
      manual_source_mismatch.offending_ids.push_back(n.id);
    }
  }

  IntegrityReport report;
  report.checks = {self_references, dangling_parents, depth_violations, manual_source_mismatch};
  for (const auto& check : report.checks) {
    if (!check.offending_ids.empty()) report.ok = false;
  }
  return report;
}

} // namespace narrative::core
