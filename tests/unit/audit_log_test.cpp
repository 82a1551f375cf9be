#include "internal/core/audit_log.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using narrative::core::AuditEvent;
using narrative::core::AuditLog;
using narrative::core::AuditValues;
using narrative::db::memory::MemoryRepository;
using narrative::util::ManualTimeSource;

AuditEvent MakeEvent(const std::string& narrative_id, std::string_view action_type) {
  AuditEvent event;
  event.narrative_id = narrative_id;
  event.action_type  = action_type;
  event.actor_id     = "curator-1";
  event.session_id   = "session-1";
  event.reason       = "test";
  return event;
}

void TestAuditValuesBuildJsonObjects() {
  AuditValues values;
  values.Set("title", "Greenland")
      .Set("priority", static_cast<int64_t>(2))
      .Set("reviewer_id", std::optional<std::string>{})
      .Set("cluster_ids", std::vector<std::string>{"cl-17", "cl-22"});

  const auto& fields = values.Build().fields();
  assert(fields.at("title").string_value() == "Greenland");
  assert(fields.at("priority").number_value() == 2.0);
  assert(fields.at("reviewer_id").has_null_value());
  assert(fields.at("cluster_ids").list_value().values_size() == 2);
  assert(fields.at("cluster_ids").list_value().values(1).string_value() == "cl-22");
}

void TestAppendStampsEntries() {
  auto     repository = std::make_shared<MemoryRepository>();
  auto     clock      = std::make_shared<ManualTimeSource>(42'000);
  AuditLog log(repository, clock);

  auto tx    = repository->Begin();
  auto event = MakeEvent("n1", narrative::core::action::kStatusChanged);
  event.old_values.Set("status", "approved");
  event.new_values.Set("status", "published");
  event.actor_type = narrative::model::ActorType::kSystem;

  const auto entry = log.Append(*tx, event);
  assert(!entry.id.empty());
  assert(entry.sequence > 0);
  assert(entry.created_at_ms == 42'000);
  assert(entry.action_type == "status_changed");
  assert(entry.actor_type == narrative::model::ActorType::kSystem);
  assert(entry.old_values.fields().at("status").string_value() == "approved");
  tx->Commit();

  auto read = repository->Begin();
  assert(log.Count(*read) == 1);
  assert(log.ForNarrative(*read, "n1")[0].id == entry.id);
}

void TestSequenceAndRecentOrdering() {
  auto     repository = std::make_shared<MemoryRepository>();
  auto     clock      = std::make_shared<ManualTimeSource>(1);
  AuditLog log(repository, clock);

  {
    auto tx = repository->Begin();
    for (int i = 0; i < 5; ++i) {
      clock->Advance(1);
      log.Append(*tx, MakeEvent("n1", narrative::core::action::kNoteAdded));
    }
    log.Append(*tx, MakeEvent("n2", narrative::core::action::kCreated));
    tx->Commit();
  }

  auto       tx      = repository->Begin();
  const auto entries = log.ForNarrative(*tx, "n1");
  assert(entries.size() == 5);
  for (std::size_t i = 1; i < entries.size(); ++i) {
    assert(entries[i].sequence > entries[i - 1].sequence);
  }

  const auto recent = log.Recent(*tx, "n1", 2);
  assert(recent.size() == 2);
  assert(recent[0].sequence == entries[4].sequence);
  assert(recent[1].sequence == entries[3].sequence);

  assert(log.All(*tx).size() == 6);
}

void TestRolledBackEntriesDisappear() {
  auto     repository = std::make_shared<MemoryRepository>();
  auto     clock      = std::make_shared<ManualTimeSource>(1);
  AuditLog log(repository, clock);

  {
    auto tx = repository->Begin();
    log.Append(*tx, MakeEvent("n1", narrative::core::action::kCreated));
    tx->Rollback();
  }

  auto tx = repository->Begin();
  assert(log.Count(*tx) == 0);
}

} // namespace

int main() {
  TestAuditValuesBuildJsonObjects();
  TestAppendStampsEntries();
  TestSequenceAndRecentOrdering();
  TestRolledBackEntriesDisappear();

  std::cout << "narrative_unit_audit_log: pass\n";
  return 0;
}
