#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/buffer/buffer_manager.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/stream/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/recording_repository.hpp"

namespace {

using relay::model::ConnectionStatus;
using relay::registry::ConnectionRegistry;
using relay::registry::CreateRequest;
using relay::registry::RegistryEvent;
using relay::testing::RecordingRepository;

struct Fixture {
  explicit Fixture(uint32_t max_connections = 4, bool encryption = false) {
    settings.max_connections    = max_connections;
    settings.encryption_enabled = encryption;
    repo                        = std::make_shared<RecordingRepository>();
    buffers                     = std::make_shared<relay::buffer::BufferManager>(repo, nullptr, nullptr);
    registry                    = std::make_shared<ConnectionRegistry>(settings, repo, buffers);
  }

  relay::config::RelaySettings                  settings;
  std::shared_ptr<RecordingRepository>          repo;
  std::shared_ptr<relay::buffer::BufferManager> buffers;
  std::shared_ptr<ConnectionRegistry>           registry;
};

CreateRequest Request(const std::string& client = "client-1") {
  CreateRequest request;
  request.client_id  = client;
  request.request_id = "req-" + client;
  request.provider   = "openai";
  request.model      = "gpt-4o";
  return request;
}

void TestCreateAppliesDefaults() {
  Fixture f;
  auto    connection = f.registry->Create(Request());

  assert(!connection.id.empty());
  assert(connection.status == ConnectionStatus::kConnecting);
  assert(connection.options.buffer_size_bytes == 8192);
  assert(connection.options.flush_interval_ms == 1000);
  assert(connection.options.heartbeat_interval_ms == 30000);
  assert(!connection.options.encryption_enabled);
  assert(connection.activity.chunks_received == 0);

  // durable copy and an open buffer
  auto tx = f.repo->Begin();
  assert(f.repo->GetConnection(*tx, connection.id).has_value());
  assert(f.repo->GetBuffer(*tx, connection.id).has_value());
  tx->Commit();
  assert(f.buffers->Stats(connection.id).has_value());

  assert(f.registry->ActiveCount() == 1);
  assert(f.registry->Counters().created == 1);
}

void TestCreateHonorsOverrides() {
  Fixture f(4, true);
  auto    request                  = Request();
  request.buffer_size_bytes        = 1024;
  request.flush_interval_ms        = 0; // zero means default
  request.heartbeat_interval_ms    = 5000;
  request.encryption_enabled       = true;
  auto connection                  = f.registry->Create(request);

  assert(connection.options.buffer_size_bytes == 1024);
  assert(connection.options.flush_interval_ms == 1000);
  assert(connection.options.heartbeat_interval_ms == 5000);
  assert(connection.options.encryption_enabled);

  auto options = f.registry->BufferOptionsFor(connection);
  assert(options.max_size_bytes == 1024);
  assert(options.flush_threshold == 0.8);
  assert(options.encryption_enabled);
}

void TestEncryptionNeedsServerKeys() {
  Fixture f(4, false);
  auto    request          = Request();
  request.encryption_enabled = true;

  bool threw = false;
  try {
    f.registry->Create(request);
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.registry->ActiveCount() == 0);
  assert(f.registry->Snapshot().empty());

  // the rejected create held no slot
  for (uint32_t i = 0; i < f.registry->MaxConnections(); ++i) {
    f.registry->Create(Request("plain-" + std::to_string(i)));
  }
  assert(f.registry->ActiveCount() == f.registry->MaxConnections());
}

void TestCapacityIsEnforced() {
  Fixture f(2);
  auto    first = f.registry->Create(Request("a"));
  f.registry->Create(Request("b"));

  bool threw = false;
  try {
    f.registry->Create(Request("c"));
  } catch (const relay::util::CapacityExceeded&) {
    threw = true;
  }
  assert(threw);
  assert(f.registry->ActiveCount() == 2);
  assert(f.registry->Counters().rejected == 1);

  // closing frees a slot for the next caller
  assert(f.registry->Close(first.id));
  auto third = f.registry->Create(Request("c"));
  assert(f.registry->ActiveCount() == 2);
  assert(f.registry->Get(third.id)->client_id == "c");
}

void TestConcurrentCreatesNeverExceedCapacity() {
  Fixture          f(8);
  std::atomic<int> admitted{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 32; ++i) {
    threads.emplace_back([&, i] {
      try {
        f.registry->Create(Request("client-" + std::to_string(i)));
        ++admitted;
      } catch (const relay::util::CapacityExceeded&) {
        ++rejected;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(admitted == 8);
  assert(rejected == 24);
  assert(f.registry->ActiveCount() == 8);
  assert(f.registry->Snapshot().size() == 8);
}

void TestCloseIsIdempotentAndPersists() {
  Fixture f;
  auto    connection = f.registry->Create(Request());

  auto token = std::make_shared<relay::stream::CancellationToken>();
  f.registry->AttachCancellation(connection.id, token);

  assert(f.registry->Close(connection.id));
  assert(token->IsCancelled());
  assert(!f.registry->Close(connection.id));
  assert(!f.registry->Close("unknown"));

  assert(f.registry->ActiveCount() == 0);
  assert(!f.buffers->Stats(connection.id).has_value());
  assert(f.registry->Counters().closed == 1);

  // still visible through the durable store
  auto stored = f.registry->Get(connection.id);
  assert(stored.has_value());
  assert(stored->status == ConnectionStatus::kDisconnected);
}

void TestCloseFlushesResidentChunks() {
  Fixture f;
  auto    connection = f.registry->Create(Request());

  relay::model::Chunk chunk;
  chunk.id            = "chunk-0";
  chunk.connection_id = connection.id;
  chunk.payload       = "{\"content\":\"hi\"}";
  chunk.size_bytes    = chunk.payload.size();
  f.buffers->Append(connection.id, chunk);

  assert(f.registry->Close(connection.id));
  assert(f.repo->Stored(connection.id).size() == 1);
}

void TestCloseSurvivesStoreFailure() {
  Fixture f;
  auto    connection = f.registry->Create(Request());

  f.repo->fail_connection_updates = true;
  assert(f.registry->Close(connection.id));
  assert(f.registry->ActiveCount() == 0);
}

void TestTransitions() {
  Fixture f;
  auto    connection = f.registry->Create(Request());

  bool threw = false;
  try {
    f.registry->Transition(connection.id, ConnectionStatus::kCompleted);
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "connecting cannot jump to completed");

  threw = false;
  try {
    f.registry->Transition(connection.id, ConnectionStatus::kStreaming, ConnectionStatus::kError);
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "expected status mismatch");

  f.registry->Transition(connection.id, ConnectionStatus::kStreaming, ConnectionStatus::kConnecting);
  f.registry->Transition(connection.id, ConnectionStatus::kCompleted);
  f.registry->Transition(connection.id, ConnectionStatus::kCompleted);
  assert(f.registry->Counters().completed == 1);

  threw = false;
  try {
    f.registry->Transition("unknown", ConnectionStatus::kStreaming);
  } catch (const relay::util::ConnectionNotFound&) {
    threw = true;
  }
  assert(threw);

  auto tx     = f.repo->Begin();
  auto record = f.repo->GetConnection(*tx, connection.id);
  tx->Commit();
  assert(record->status == "completed");
}

void TestStateMachine() {
  using relay::model::CanTransition;
  assert(CanTransition(ConnectionStatus::kConnecting, ConnectionStatus::kError));
  assert(CanTransition(ConnectionStatus::kStreaming, ConnectionStatus::kDisconnected));
  assert(CanTransition(ConnectionStatus::kCompleted, ConnectionStatus::kDisconnected));
  assert(!CanTransition(ConnectionStatus::kCompleted, ConnectionStatus::kStreaming));
  assert(!CanTransition(ConnectionStatus::kDisconnected, ConnectionStatus::kConnecting));
}

void TestObservers() {
  Fixture                    f;
  std::vector<RegistryEvent> seen;
  f.registry->AddObserver([&](RegistryEvent event, const relay::model::Connection&) { seen.push_back(event); });
  f.registry->AddObserver([](RegistryEvent, const relay::model::Connection&) { throw std::runtime_error("observer bug"); });

  auto connection = f.registry->Create(Request());
  f.registry->Transition(connection.id, ConnectionStatus::kError);
  f.registry->Close(connection.id);

  assert(seen.size() == 3);
  assert(seen[0] == RegistryEvent::kConnectionCreated);
  assert(seen[1] == RegistryEvent::kStreamError);
  assert(seen[2] == RegistryEvent::kConnectionClosed);
  assert(relay::registry::ToString(seen[2]) == "connection_closed");
  assert(f.registry->Counters().errored == 1);
}

void TestUpdateAndDisposal() {
  Fixture f;
  auto    connection = f.registry->Create(Request());

  auto updated = f.registry->Update(connection.id, [](relay::model::Connection& c) { c.activity.chunks_received = 3; });
  assert(updated.activity.chunks_received == 3);
  assert(f.registry->Persist(connection.id));

  const auto deadline = relay::util::Now() + std::chrono::seconds(5);
  assert(f.registry->ScheduleDisposal(connection.id, deadline));
  assert(f.registry->Get(connection.id)->dispose_at == deadline);
  assert(!f.registry->ScheduleDisposal("unknown", deadline));

  bool threw = false;
  try {
    f.registry->Update("unknown", [](relay::model::Connection&) {});
  } catch (const relay::util::ConnectionNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCloseAll() {
  Fixture f;
  for (int i = 0; i < 3; ++i) f.registry->Create(Request("c" + std::to_string(i)));
  assert(f.registry->CloseAll() == 3);
  assert(f.registry->ActiveCount() == 0);
  assert(f.buffers->OpenCount() == 0);
}

void TestReconnectsAreCounted() {
  Fixture f;
  f.registry->Create(Request("a"));
  f.registry->Create(Request("a"));
  f.registry->Create(Request("b"));
  assert(f.registry->Counters().reconnected == 1);

  // nothing left holding the pair once both are closed
  f.registry->CloseAll();
  f.registry->Create(Request("a"));
  assert(f.registry->Counters().reconnected == 1);
  assert(f.registry->Counters().created == 4);
}

} // namespace

int main() {
  TestCreateAppliesDefaults();
  TestCreateHonorsOverrides();
  TestEncryptionNeedsServerKeys();
  TestCapacityIsEnforced();
  TestConcurrentCreatesNeverExceedCapacity();
  TestCloseIsIdempotentAndPersists();
  TestCloseFlushesResidentChunks();
  TestCloseSurvivesStoreFailure();
  TestTransitions();
  TestStateMachine();
  TestObservers();
  TestUpdateAndDisposal();
  TestCloseAll();
  TestReconnectsAreCounted();

  std::cout << "relay_unit_connection_registry: pass\n";
  return 0;
}
