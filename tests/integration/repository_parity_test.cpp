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

#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if RELAY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using relay::db::ErrorCode;
using relay::db::Repository;
using relay::db::memory::MemoryRepository;
using relay::db::model::BufferRecord;
using relay::db::model::ChunkRecord;
using relay::db::model::ConnectionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ConnectionRecord MakeConnection(const std::string& id) {
  ConnectionRecord record;
  record.id               = id;
  record.client_id        = "client-" + id;
  record.request_id       = "req-" + id;
  record.status           = "connecting";
  record.provider         = "openai";
  record.model            = "gpt-4o";
  record.connected_at_ms  = NowMs();
  record.last_activity_ms = record.connected_at_ms;
  record.options_json     = R"({"bufferSizeBytes":"8192"})";
  record.created_at_ms    = record.connected_at_ms;
  record.updated_at_ms    = record.connected_at_ms;
  return record;
}

ChunkRecord MakeChunk(const std::string& connection_id, uint64_t sequence, uint64_t timestamp_ms) {
  ChunkRecord chunk;
  chunk.id            = connection_id + "-" + std::to_string(sequence);
  chunk.connection_id = connection_id;
  chunk.sequence      = sequence;
  chunk.type          = "content";
  chunk.data          = std::string("\x00\xC5payload", 9) + std::to_string(sequence);
  chunk.original_size = chunk.data.size();
  chunk.size_bytes    = chunk.data.size();
  chunk.checksum      = "abc123";
  chunk.timestamp_ms  = timestamp_ms;
  return chunk;
}

void InsertConnection(Repository& repo, const ConnectionRecord& record) {
  auto tx     = repo.Begin();
  auto result = repo.InsertConnection(*tx, record);
  assert(result);
  tx->Commit();
}

void VerifyConnectionLifecycle(Repository& repo, const std::string& id) {
  auto record    = MakeConnection(id);
  record.user_id = "user-1";
  InsertConnection(repo, record);

  {
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertConnection(*tx, record);
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    assert(duplicate.Describe().rfind("already exists", 0) == 0);
    tx->Rollback();
  }

  {
    auto tx   = repo.Begin();
    auto read = repo.GetConnection(*tx, id);
    assert(read.has_value());
    assert(read->client_id == record.client_id);
    assert(read->user_id == "user-1");
    assert(read->session_id.empty());
    assert(read->status == "connecting");
    assert(read->options_json == record.options_json);

    read->status             = "streaming";
    read->chunks_received    = 7;
    read->bytes_received     = 700;
    read->average_latency_ms = 12.5;
    auto update              = repo.UpdateConnection(*tx, *read);
    assert(update);

    auto updated = repo.GetConnection(*tx, id);
    assert(updated->status == "streaming");
    assert(updated->chunks_received == 7);
    assert(updated->average_latency_ms == 12.5);
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto missing = repo.UpdateConnection(*tx, MakeConnection(id + "-missing"));
    assert(missing.code == ErrorCode::NotFound);
    assert(!repo.GetConnection(*tx, id + "-missing").has_value());
    tx->Rollback();
  }
}

void VerifyBufferUpsert(Repository& repo, const std::string& id) {
  InsertConnection(repo, MakeConnection(id));

  BufferRecord buffer;
  buffer.connection_id       = id;
  buffer.max_size_bytes      = 8192;
  buffer.flush_threshold     = 0.8;
  buffer.compression_enabled = true;
  buffer.last_flush_ms       = NowMs();
  buffer.updated_at_ms       = buffer.last_flush_ms;

  auto tx    = repo.Begin();
  auto first = repo.UpsertBuffer(*tx, buffer);
  assert(first);

  buffer.flush_count   = 3;
  buffer.resident_bytes = 100;
  auto second          = repo.UpsertBuffer(*tx, buffer);
  assert(second);

  auto read = repo.GetBuffer(*tx, id);
  assert(read.has_value());
  assert(read->flush_count == 3);
  assert(read->resident_bytes == 100);
  assert(read->compression_enabled);
  assert(!read->encryption_enabled);
  assert(read->flush_threshold == 0.8);
  tx->Commit();
}

void VerifyChunkHistory(Repository& repo, const std::string& id) {
  InsertConnection(repo, MakeConnection(id));
  const uint64_t base = NowMs();

  {
    std::vector<ChunkRecord> batch;
    for (uint64_t seq = 0; seq < 5; ++seq) batch.push_back(MakeChunk(id, seq, base + seq * 100));
    batch[3].key_epoch   = 2;
    batch[3].compression = "zstd";

    auto tx     = repo.Begin();
    auto result = repo.SaveChunkBatch(*tx, batch);
    assert(result);
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto all = repo.ReadChunks(*tx, id, 0, std::nullopt, std::nullopt);
  assert(all.size() == 5);
  for (uint64_t seq = 0; seq < 5; ++seq) assert(all[seq].sequence == seq);
  assert(all[0].data == MakeChunk(id, 0, 0).data);
  assert(all[3].key_epoch == 2u);
  assert(all[3].compression == "zstd");
  assert(!all[2].key_epoch.has_value());
  assert(all[2].compression == "none");

  auto tail = repo.ReadChunks(*tx, id, 2, 2, std::nullopt);
  assert(tail.size() == 2);
  assert(tail[0].sequence == 2 && tail[1].sequence == 3);

  auto recent = repo.ReadChunks(*tx, id, 0, std::nullopt, base + 250);
  assert(recent.size() == 2);
  assert(recent[0].sequence == 3);

  assert(repo.ReadChunks(*tx, id + "-none", 0, std::nullopt, std::nullopt).empty());
  tx->Commit();
}

void VerifyBatchIsAllOrNothing(Repository& repo, const std::string& id) {
  InsertConnection(repo, MakeConnection(id));
  const uint64_t now = NowMs();

  {
    auto tx     = repo.Begin();
    auto result = repo.SaveChunkBatch(*tx, {MakeChunk(id, 0, now)});
    assert(result);
    tx->Commit();
  }

  {
    // sequence 0 collides, so nothing from this batch may land
    std::vector<ChunkRecord> batch = {MakeChunk(id, 1, now), MakeChunk(id, 0, now)};
    batch[1].id                    = id + "-dup";
    auto tx                        = repo.Begin();
    auto result                    = repo.SaveChunkBatch(*tx, batch);
    assert(!result);
    tx->Rollback();
  }

  auto tx     = repo.Begin();
  auto stored = repo.ReadChunks(*tx, id, 0, std::nullopt, std::nullopt);
  assert(stored.size() == 1);
  assert(stored[0].sequence == 0);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx     = repo.Begin();
    auto insert = repo.InsertConnection(*tx, MakeConnection(id));
    assert(insert);
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetConnection(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  InsertConnection(*repo, MakeConnection(id));
  {
    auto tx     = repo->Begin();
    auto result = repo->SaveChunkBatch(*tx, {MakeChunk(id, 0, NowMs())});
    assert(result);
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetConnection(*tx, id).has_value());
  assert(repo->ReadChunks(*tx, id, 0, std::nullopt, std::nullopt).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if RELAY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("stream_relay_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<relay::db::sqlite::SqliteDB>(db_path);
    relay::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<relay::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if RELAY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RELAY_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RELAY_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<relay::db::postgres::PgPool>(conninfo);
    relay::db::postgres::BootstrapSchema(pool);
    return std::make_shared<relay::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // ids are unique per run so a shared postgres database can be reused
  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  VerifyConnectionLifecycle(*repo, prefix + "-lifecycle");
  VerifyBufferUpsert(*repo, prefix + "-buffer");
  VerifyChunkHistory(*repo, prefix + "-chunks");
  VerifyBatchIsAllOrNothing(*repo, prefix + "-batch");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RELAY_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RELAY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "relay_integration_repository_parity: pass\n";
  return 0;
}
