#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/media_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/access_record.hpp"
#include "internal/db/model/media_record.hpp"
#include "internal/util/errors.hpp"

#if ARCHIVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using archive::core::CallContext;
using archive::core::MediaRegistry;
using archive::db::ErrorCode;
using archive::db::Repository;
using archive::db::memory::MemoryRepository;
using archive::db::model::AccessRecord;
using archive::db::model::MediaRecord;

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

MediaRecord Record(uint64_t id, const std::string& owner) {
  MediaRecord record;
  record.record_id           = id;
  record.owner               = owner;
  record.created_at          = 1000 + id;
  record.metadata.name       = "clip-" + std::to_string(id) + ".mp4";
  record.metadata.byte_count = 4096;
  record.metadata.summary    = "integration";
  record.metadata.labels     = {"zeta", "alpha", "mid"};
  return record;
}

void VerifyInsertGetUpdateDelete(Repository& repo) {
  auto tx = repo.Begin();

  const auto record = Record(1, "alice");
  assert(repo.InsertRecord(*tx, record));
  assert(repo.InsertRecord(*tx, record).code == ErrorCode::AlreadyExists);

  auto resolved = repo.GetRecord(*tx, 1);
  assert(resolved.has_value());
  assert(*resolved == record);

  // labels come back in insertion order, not sorted
  assert(resolved->metadata.labels[0] == "zeta");
  assert(resolved->metadata.labels[2] == "mid");

  auto updated               = archive::db::model::WithOwner(record, "bob");
  updated.metadata.labels    = {"single"};
  updated.metadata.byte_count = 1;
  assert(repo.UpdateRecord(*tx, updated));
  assert(*repo.GetRecord(*tx, 1) == updated);

  assert(repo.UpdateRecord(*tx, Record(99, "nobody")).code == ErrorCode::NotFound);

  assert(repo.DeleteRecord(*tx, 1));
  assert(!repo.GetRecord(*tx, 1).has_value());
  assert(repo.DeleteRecord(*tx, 1).code == ErrorCode::NotFound);

  tx->Commit();
  assert(tx->IsCommitted());
}

void VerifyAccessMatrix(Repository& repo) {
  auto tx = repo.Begin();

  assert(!repo.GetAccess(*tx, 5, "alice").has_value());
  assert(repo.UpsertAccess(*tx, AccessRecord{5, "alice", true}));
  assert(repo.UpsertAccess(*tx, AccessRecord{5, "alice", true}));

  auto entry = repo.GetAccess(*tx, 5, "alice");
  assert(entry.has_value());
  assert(entry->can_access);
  assert(!repo.GetAccess(*tx, 5, "bob").has_value());

  assert(repo.DeleteAccess(*tx, 5, "alice"));
  assert(repo.DeleteAccess(*tx, 5, "alice"));
  assert(!repo.GetAccess(*tx, 5, "alice").has_value());

  tx->Commit();
}

void VerifyRollbackDiscardsEverything(Repository& repo) {
  uint64_t before = 0;
  {
    auto tx = repo.Begin();
    before  = repo.GetTotalItems(*tx);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.SetTotalItems(*tx, before + 1));
    assert(repo.InsertRecord(*tx, Record(before + 1, "alice")));
    assert(repo.UpsertAccess(*tx, AccessRecord{before + 1, "alice", true}));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.GetTotalItems(*tx) == before);
  assert(!repo.GetRecord(*tx, before + 1).has_value());
  assert(!repo.GetAccess(*tx, before + 1, "alice").has_value());
  tx->Commit();
}

void VerifyRegistryOverBackend(std::shared_ptr<Repository> repo) {
  MediaRegistry registry(repo);

  const auto first = registry.TotalItems();
  archive::db::model::MediaMetadata fields;
  fields.name       = "clip.mp4";
  fields.byte_count = 1024;
  fields.summary    = "demo";
  fields.labels     = {"video"};

  const auto id = registry.ArchiveNewMedia(CallContext{"A", 10}, fields);
  assert(id == first + 1);
  assert(registry.CheckMediaAccess(id, "A"));

  fields.byte_count = 0;
  try {
    registry.ArchiveNewMedia(CallContext{"A", 11}, fields);
    assert(false && "zero byte_count must be rejected");
  } catch (const archive::util::InvalidSize&) {
  }
  assert(registry.TotalItems() == id);

  registry.TransferMediaOwnership(CallContext{"A", 12}, id, "B");
  registry.RemoveMediaRecord(CallContext{"B", 13}, id);
  assert(!registry.GetMediaRecord(id).has_value());
  assert(registry.TotalItems() == id);
}

void VerifyConflictingCommitsAreRejected(BackendFactory& backend, Repository& repo) {
  if (!backend.supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  const auto base = repo.GetTotalItems(*tx1);
  assert(repo.SetTotalItems(*tx1, base + 1));
  assert(repo.SetTotalItems(*tx2, base + 1));
  tx1->Commit();

  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify = repo.Begin();
  assert(repo.GetTotalItems(*verify) == base + 1);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->SetTotalItems(*tx, 42));
    assert(repo->InsertRecord(*tx, Record(42, "alice")));
    assert(repo->UpsertAccess(*tx, AccessRecord{42, "bob", true}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetTotalItems(*tx) == 42);

  auto record = repo->GetRecord(*tx, 42);
  assert(record.has_value());
  assert(*record == Record(42, "alice"));

  auto entry = repo->GetAccess(*tx, 42, "bob");
  assert(entry.has_value() && entry->can_access);
  tx->Commit();

  backend.cleanup();
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

#if ARCHIVE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("media_archive_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<archive::db::sqlite::SqliteDB>(db_path);
    assert(db->Path() == db_path);
    archive::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<archive::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}

// Generated columns over json_extract() fail while the statement steps, so a
// malformed value turns into a read error at a chosen row.
void VerifySqliteReadErrorsAreNotMissingRows() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("media_archive_integration_read_errors_" + std::to_string(NowMs()) + ".db")).string();

  {
    auto db = std::make_shared<archive::db::sqlite::SqliteDB>(db_path);
    db->Exec(
        "CREATE TABLE media_record (record_id INTEGER PRIMARY KEY, owner TEXT NOT NULL, byte_count INTEGER NOT NULL, created_at INTEGER NOT "
        "NULL, name_json TEXT, name TEXT GENERATED ALWAYS AS (json_extract(name_json, '$')) VIRTUAL, summary TEXT NOT NULL);");
    db->Exec(
        "CREATE TABLE media_label (record_id INTEGER NOT NULL, position INTEGER NOT NULL, label_json TEXT, label TEXT GENERATED ALWAYS AS "
        "(json_extract(label_json, '$')) VIRTUAL, PRIMARY KEY (record_id, position));");
    archive::db::sqlite::BootstrapSchema(*db);

    db->Exec(
        "INSERT INTO media_record(record_id,owner,byte_count,created_at,name_json,summary) VALUES "
        "(1,'alice',10,1,'\"good.mp4\"','labels break'),(2,'alice',10,1,'not json','name breaks');");
    db->Exec("INSERT INTO media_label(record_id,position,label_json) VALUES (1,0,'\"video\"'),(1,1,'not json');");

    auto repo = std::make_shared<archive::db::sqlite::SqliteRepository>(db);

    const auto read_fails = [&](uint64_t record_id) {
      auto tx = repo->Begin();
      try {
        (void)repo->GetRecord(*tx, record_id);
      } catch (const archive::util::NotFound&) {
        return false;
      } catch (const std::runtime_error&) {
        return true;
      }
      return false;
    };

    // failure in the label loop: no truncated label list
    assert(read_fails(1));
    // failure on the record row: not reported as an absent record
    assert(read_fails(2));

    {
      auto tx = repo->Begin();
      assert(!repo->GetRecord(*tx, 3).has_value());
      tx->Commit();
    }

    MediaRegistry                     registry(repo);
    bool                              missing = false;
    bool                              failed  = false;
    archive::db::model::MediaMetadata fields;
    fields.name       = "x";
    fields.byte_count = 1;
    fields.summary    = "y";
    fields.labels     = {"z"};
    try {
      registry.ModifyMediaMetadata(CallContext{"alice", 1}, 2, fields);
    } catch (const archive::util::NotFound&) {
      missing = true;
    } catch (const std::runtime_error&) {
      failed = true;
    }
    assert(!missing && failed);
  }

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
  std::cout << "  sqlite read errors: ok\n";
}
#endif

void RunBackend(BackendFactory backend) {
  {
    auto repo = backend.make_repository();
    VerifyInsertGetUpdateDelete(*repo);
    VerifyAccessMatrix(*repo);
    VerifyRollbackDiscardsEverything(*repo);
    VerifyConflictingCommitsAreRejected(backend, *repo);
    VerifyRegistryOverBackend(repo);
  }

  VerifyRestartDurability(backend);
  std::cout << "  backend " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if ARCHIVE_DB_SQLITE
  RunBackend(MakeSqliteFactory());
  VerifySqliteReadErrorsAreNotMissingRows();
#endif

  std::cout << "media_archive_integration_repository_parity: pass\n";
  return 0;
}
