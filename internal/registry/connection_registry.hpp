#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/buffer/buffer_manager.hpp"
#include "internal/config/relay_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/connection.hpp"
#include "internal/stream/cancellation.hpp"

namespace relay::registry {

struct CreateRequest {
  std::string                client_id;
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::string                request_id;
  std::string                provider;
  std::string                model;

  // Unset fields take the relay defaults.
  std::optional<uint64_t> buffer_size_bytes;
  std::optional<uint64_t> flush_interval_ms;
  std::optional<bool>     compression_enabled;
  std::optional<bool>     encryption_enabled;
  std::optional<uint64_t> heartbeat_interval_ms;
};

enum class RegistryEvent {
  kConnectionCreated,
  kConnectionClosed,
  kStreamCompleted,
  kStreamError,
};

std::string_view ToString(RegistryEvent event);

struct RegistryCounters {
  uint64_t created   = 0;
  uint64_t completed = 0;
  uint64_t errored   = 0;
  uint64_t closed    = 0;
  uint64_t rejected  = 0;
  // creates whose client/request pair was still held by an earlier connection
  uint64_t reconnected = 0;
};

/*
  ConnectionRegistry

  Owns every open Connection. Storage is a slot arena with a free list
  plus an id -> slot index; all of it, the live count and the counters
  are guarded by one mutex. Store and buffer I/O happen outside it.

  Admission: open + reserved connections never exceed max_connections.
  A slot is reserved before the creation record is written and
  released again if the write fails.
*/
class ConnectionRegistry {
 public:
  using Observer = std::function<void(RegistryEvent, const model::Connection&)>;

  ConnectionRegistry(config::RelaySettings settings, std::shared_ptr<db::Repository> repository, std::shared_ptr<buffer::BufferManager> buffers);

  // Throws util::CapacityExceeded at the ceiling, util::InvalidState when
  // encryption is requested without configured keys.
  model::Connection Create(const CreateRequest& request);

  // In-memory first, then the durable store.
  std::optional<model::Connection> Get(const std::string& id) const;

  // Idempotent; false when the id is not open (or already closing).
  bool Close(const std::string& id);

  // Live on this relay and not closing.
  bool IsOpen(const std::string& id) const;

  // Applies mutation to the live record. Throws util::ConnectionNotFound.
  model::Connection Update(const std::string& id, const std::function<void(model::Connection&)>& mutation);

  // Validated status change, persisted. When expected is set the current
  // status must match it. Throws util::ConnectionNotFound or
  // util::InvalidState.
  model::Connection Transition(const std::string& id, model::ConnectionStatus to,
                               std::optional<model::ConnectionStatus> expected = std::nullopt);

  // Writes the live record to the store; logs and returns false on failure.
  bool Persist(const std::string& id);

  bool ScheduleDisposal(const std::string& id, util::TimePoint deadline);

  // Cancelled by Close().
  void AttachCancellation(const std::string& id, stream::CancellationTokenPtr token);

  std::vector<model::Connection> Snapshot() const;

  void AddObserver(Observer observer);

  std::size_t CloseAll();

  std::size_t      ActiveCount() const;
  uint32_t         MaxConnections() const {
    return settings_.max_connections;
  }
  RegistryCounters Counters() const;

  const config::RelaySettings& Settings() const {
    return settings_;
  }

  buffer::BufferOptions BufferOptionsFor(const model::Connection& connection) const;

 private:
  struct Slot {
    bool                        occupied = false;
    bool                        closing  = false;
    model::Connection           connection;
    stream::CancellationTokenPtr token;
  };

  Slot*       FindLocked(const std::string& id);
  const Slot* FindLocked(const std::string& id) const;
  void        Notify(RegistryEvent event, const model::Connection& connection);

  model::ConnectionOptions ResolveOptions(const CreateRequest& request) const;

  const config::RelaySettings            settings_;
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<buffer::BufferManager> buffers_;

  mutable std::mutex                      mutex_;
  std::vector<Slot>                       slots_;
  std::vector<std::size_t>                free_slots_;
  std::unordered_map<std::string, size_t> index_;
  std::size_t                             live_     = 0;
  std::size_t                             reserved_ = 0;
  RegistryCounters                        counters_;

  std::mutex            observers_mutex_;
  std::vector<Observer> observers_;
};

} // namespace relay::registry
