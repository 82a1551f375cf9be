#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace narrative::core {

struct IntegrityCheck {
  std::string              name;
  std::vector<std::string> offending_ids;
};

struct IntegrityReport {
  bool                        ok = true;
  std::vector<IntegrityCheck> checks;
};

/*
  NarrativeStore

  Owns narratives and their parent links. Every method runs inside the
  caller's transaction and enforces the structural rules:

    - a narrative is never its own parent
    - the hierarchy is at most two levels deep
    - a parent link is set only on an orphan; it is never overwritten
    - deleting a narrative deletes its children first

  Writes bump version and updated_at and go through the repository's
  version compare-and-swap.
*/
class NarrativeStore {
 public:
  NarrativeStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::TimeSource> clock);

  // Inserts a root. Assigns id, timestamps and version when unset.
  // ValidationError if the status is not an entry status for the source.
  db::model::NarrativeRecord CreateRoot(db::Transaction& tx, db::model::NarrativeRecord fields);

  // Returns the updated child.
  db::model::NarrativeRecord SetParent(db::Transaction& tx, const std::string& child_id, const std::string& parent_id);

  // Detaches a child and returns its previous parent id.
  std::string ClearParent(db::Transaction& tx, const std::string& child_id);

  // Returns every removed narrative, children first.
  std::vector<db::model::NarrativeRecord> Delete(db::Transaction& tx, const std::string& id);

  db::model::NarrativeRecord                Get(db::Transaction& tx, const std::string& id);
  std::optional<db::model::NarrativeRecord> Find(db::Transaction& tx, const std::string& id);
  db::model::NarrativeRecord                GetForUpdate(db::Transaction& tx, const std::string& id);

  // Ordered by creation time. NotFound if the parent does not exist.
  std::vector<db::model::NarrativeRecord>   GetChildren(db::Transaction& tx, const std::string& parent_id);
  std::optional<db::model::NarrativeRecord> GetParent(db::Transaction& tx, const std::string& child_id);
  db::model::NarrativeRecord                GetRoot(db::Transaction& tx, const std::string& id);
  std::vector<db::model::NarrativeRecord>   List(db::Transaction& tx);

  // Persists a modified record read earlier in the same transaction.
  db::model::NarrativeRecord Save(db::Transaction& tx, db::model::NarrativeRecord record);

  IntegrityReport ValidateIntegrity(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace narrative::core
