#include "connection_registry.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/registry/connection_records.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace relay::registry {

namespace {

void ThrowIfError(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error(what + ": " + result.Describe());
  }
}

} // namespace

std::string_view ToString(RegistryEvent event) {
  switch (event) {
    case RegistryEvent::kConnectionCreated:
      return "connection_created";
    case RegistryEvent::kConnectionClosed:
      return "connection_closed";
    case RegistryEvent::kStreamCompleted:
      return "stream_completed";
    case RegistryEvent::kStreamError:
      return "stream_error";
  }
  return "unknown";
}

ConnectionRegistry::ConnectionRegistry(config::RelaySettings settings, std::shared_ptr<db::Repository> repository,
                                       std::shared_ptr<buffer::BufferManager> buffers)
    : settings_(std::move(settings)), repository_(std::move(repository)), buffers_(std::move(buffers)) {
  if (!repository_) {
    throw std::invalid_argument("connection registry requires a repository");
  }
  if (!buffers_) {
    throw std::invalid_argument("connection registry requires a buffer manager");
  }
}

model::ConnectionOptions ConnectionRegistry::ResolveOptions(const CreateRequest& request) const {
  model::ConnectionOptions options;
  options.buffer_size_bytes = request.buffer_size_bytes.value_or(0);
  if (options.buffer_size_bytes == 0) options.buffer_size_bytes = settings_.buffer_size_bytes;

  options.flush_interval_ms = request.flush_interval_ms.value_or(0);
  if (options.flush_interval_ms == 0) options.flush_interval_ms = static_cast<uint64_t>(settings_.flush_interval.count());

  options.heartbeat_interval_ms = request.heartbeat_interval_ms.value_or(0);
  if (options.heartbeat_interval_ms == 0) options.heartbeat_interval_ms = static_cast<uint64_t>(settings_.heartbeat_interval.count());

  options.compression_enabled = request.compression_enabled.value_or(settings_.compression_enabled);

  // Keys only exist when encryption is configured server-side.
  const bool wants_encryption = request.encryption_enabled.value_or(settings_.encryption_enabled);
  if (wants_encryption && !settings_.encryption_enabled) {
    RELAY_LOG_WARN("encryption requested but not configured", {observability::StringField("request_id", request.request_id),
                                                                observability::StringField("client_id", request.client_id)});
    throw util::InvalidState("encryption requested but no encryption keys are configured");
  }
  options.encryption_enabled = wants_encryption;
  return options;
}

buffer::BufferOptions ConnectionRegistry::BufferOptionsFor(const model::Connection& connection) const {
  buffer::BufferOptions options;
  options.max_size_bytes      = connection.options.buffer_size_bytes;
  options.flush_threshold     = settings_.flush_threshold_fraction;
  options.flush_interval      = std::chrono::milliseconds(connection.options.flush_interval_ms);
  options.compression_enabled = connection.options.compression_enabled;
  options.encryption_enabled  = connection.options.encryption_enabled;
  return options;
}

model::Connection ConnectionRegistry::Create(const CreateRequest& request) {
  auto options = ResolveOptions(request);
  {
    std::lock_guard lock(mutex_);
    if (live_ + reserved_ >= settings_.max_connections) {
      ++counters_.rejected;
      RELAY_LOG_WARN("connection rejected at capacity", {observability::StringField("client_id", request.client_id),
                                                         observability::IntField("max_connections", settings_.max_connections)});
      throw util::CapacityExceeded("maximum connections reached (" + std::to_string(settings_.max_connections) + ")");
    }
    ++reserved_;
  }

  const auto        now = util::Now();
  model::Connection connection;
  connection.id                     = util::NewId();
  connection.client_id              = request.client_id;
  connection.user_id                = request.user_id;
  connection.session_id             = request.session_id;
  connection.request_id             = request.request_id;
  connection.status                 = model::ConnectionStatus::kConnecting;
  connection.provider               = request.provider;
  connection.model                  = request.model;
  connection.options                = std::move(options);
  connection.activity.connected_at  = now;
  connection.activity.last_activity = now;
  connection.created_at             = now;
  connection.updated_at             = now;

  const auto buffer_options = BufferOptionsFor(connection);

  try {
    auto tx = repository_->Begin();
    ThrowIfError(repository_->InsertConnection(*tx, ToRecord(connection)), "insert connection");
    ThrowIfError(repository_->UpsertBuffer(*tx, buffer::BufferManager::InitialRecord(connection.id, buffer_options, now)), "insert buffer");
    tx->Commit();

    buffers_->Open(connection.id, buffer_options, now);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      --reserved_;
    }
    RELAY_LOG_ERROR("connection create failed", {observability::StringField("connection_id", connection.id),
                                                 observability::StringField("error", e.what())});
    throw;
  }

  {
    std::lock_guard lock(mutex_);
    --reserved_;

    std::size_t index;
    if (!free_slots_.empty()) {
      index = free_slots_.back();
      free_slots_.pop_back();
    } else {
      index = slots_.size();
      slots_.emplace_back();
    }

    auto& slot      = slots_[index];
    slot.occupied   = true;
    slot.closing    = false;
    slot.connection = connection;
    slot.token.reset();
    index_.emplace(connection.id, index);

    ++live_;
    ++counters_.created;
    if (!connection.request_id.empty()) {
      for (const auto& other : slots_) {
        if (other.occupied && other.connection.id != connection.id && other.connection.client_id == connection.client_id &&
            other.connection.request_id == connection.request_id) {
          ++counters_.reconnected;
          break;
        }
      }
    }
  }

  RELAY_LOG_INFO("connection created", {observability::StringField("connection_id", connection.id),
                                        observability::StringField("client_id", connection.client_id),
                                        observability::StringField("provider", connection.provider),
                                        observability::StringField("model", connection.model)});
  Notify(RegistryEvent::kConnectionCreated, connection);
  return connection;
}

ConnectionRegistry::Slot* ConnectionRegistry::FindLocked(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &slots_[it->second];
}

const ConnectionRegistry::Slot* ConnectionRegistry::FindLocked(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &slots_[it->second];
}

std::optional<model::Connection> ConnectionRegistry::Get(const std::string& id) const {
  {
    std::lock_guard lock(mutex_);
    if (const auto* slot = FindLocked(id)) {
      return slot->connection;
    }
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetConnection(*tx, id);
  tx->Commit();
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

bool ConnectionRegistry::Close(const std::string& id) {
  stream::CancellationTokenPtr token;
  {
    std::lock_guard lock(mutex_);
    auto*           slot = FindLocked(id);
    if (!slot || slot->closing) return false;
    slot->closing = true;
    token         = slot->token;
  }

  if (token) token->Cancel();

  // Waits for any in-flight flush; appends after this point are refused.
  if (!buffers_->Close(id)) {
    RELAY_LOG_WARN("closing with unflushed chunks", {observability::StringField("connection_id", id)});
  }

  model::Connection closed;
  {
    std::lock_guard lock(mutex_);
    auto*           slot = FindLocked(id);
    slot->connection.status     = model::ConnectionStatus::kDisconnected;
    slot->connection.updated_at = util::Now();
    closed                      = slot->connection;
  }

  try {
    auto tx = repository_->Begin();
    ThrowIfError(repository_->UpdateConnection(*tx, ToRecord(closed)), "update connection");
    tx->Commit();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("failed to persist closed connection", {observability::StringField("connection_id", id),
                                                            observability::StringField("error", e.what())});
  }

  {
    std::lock_guard lock(mutex_);
    auto            it = index_.find(id);
    auto&           slot = slots_[it->second];
    slot.occupied        = false;
    slot.closing         = false;
    slot.token.reset();
    free_slots_.push_back(it->second);
    index_.erase(it);
    --live_;
    ++counters_.closed;
  }

  RELAY_LOG_INFO("connection closed", {observability::StringField("connection_id", id),
                                       observability::IntField("chunks", static_cast<std::int64_t>(closed.activity.chunks_received)),
                                       observability::IntField("bytes", static_cast<std::int64_t>(closed.activity.bytes_received))});
  Notify(RegistryEvent::kConnectionClosed, closed);
  return true;
}

model::Connection ConnectionRegistry::Update(const std::string& id, const std::function<void(model::Connection&)>& mutation) {
  std::lock_guard lock(mutex_);
  auto*           slot = FindLocked(id);
  if (!slot) {
    throw util::ConnectionNotFound("connection " + id + " not found");
  }
  mutation(slot->connection);
  slot->connection.updated_at = util::Now();
  return slot->connection;
}

model::Connection ConnectionRegistry::Transition(const std::string& id, model::ConnectionStatus to,
                                                 std::optional<model::ConnectionStatus> expected) {
  model::Connection updated;
  {
    std::lock_guard lock(mutex_);
    auto*           slot = FindLocked(id);
    if (!slot) {
      throw util::ConnectionNotFound("connection " + id + " not found");
    }

    const auto from = slot->connection.status;
    if (expected && from != *expected) {
      throw util::InvalidState("connection " + id + " is " + std::string(model::ToString(from)) + ", expected " +
                               std::string(model::ToString(*expected)));
    }
    if (!model::CanTransition(from, to)) {
      throw util::InvalidState("connection " + id + " cannot move from " + std::string(model::ToString(from)) + " to " +
                               std::string(model::ToString(to)));
    }

    slot->connection.status     = to;
    slot->connection.updated_at = util::Now();
    updated                     = slot->connection;

    if (from != to && to == model::ConnectionStatus::kCompleted) ++counters_.completed;
    if (from != to && to == model::ConnectionStatus::kError) ++counters_.errored;
  }

  try {
    auto tx = repository_->Begin();
    ThrowIfError(repository_->UpdateConnection(*tx, ToRecord(updated)), "update connection");
    tx->Commit();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("failed to persist status change", {observability::StringField("connection_id", id),
                                                        observability::StringField("status", model::ToString(to)),
                                                        observability::StringField("error", e.what())});
  }

  if (to == model::ConnectionStatus::kCompleted) {
    Notify(RegistryEvent::kStreamCompleted, updated);
  } else if (to == model::ConnectionStatus::kError) {
    Notify(RegistryEvent::kStreamError, updated);
  }
  return updated;
}

bool ConnectionRegistry::Persist(const std::string& id) {
  model::Connection current;
  {
    std::lock_guard lock(mutex_);
    const auto*     slot = FindLocked(id);
    if (!slot) return false;
    current = slot->connection;
  }

  try {
    auto tx = repository_->Begin();
    ThrowIfError(repository_->UpdateConnection(*tx, ToRecord(current)), "update connection");
    tx->Commit();
    return true;
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("failed to persist connection", {observability::StringField("connection_id", id),
                                                     observability::StringField("error", e.what())});
    return false;
  }
}

bool ConnectionRegistry::ScheduleDisposal(const std::string& id, util::TimePoint deadline) {
  std::lock_guard lock(mutex_);
  auto*           slot = FindLocked(id);
  if (!slot) return false;
  slot->connection.dispose_at = deadline;
  return true;
}

void ConnectionRegistry::AttachCancellation(const std::string& id, stream::CancellationTokenPtr token) {
  std::lock_guard lock(mutex_);
  auto*           slot = FindLocked(id);
  if (!slot) {
    throw util::ConnectionNotFound("connection " + id + " not found");
  }
  slot->token = std::move(token);
}

std::vector<model::Connection> ConnectionRegistry::Snapshot() const {
  std::lock_guard                lock(mutex_);
  std::vector<model::Connection> out;
  out.reserve(live_);
  for (const auto& slot : slots_) {
    if (slot.occupied) out.push_back(slot.connection);
  }
  return out;
}

void ConnectionRegistry::AddObserver(Observer observer) {
  std::lock_guard lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

void ConnectionRegistry::Notify(RegistryEvent event, const model::Connection& connection) {
  std::vector<Observer> observers;
  {
    std::lock_guard lock(observers_mutex_);
    observers = observers_;
  }

  for (const auto& observer : observers) {
    try {
      observer(event, connection);
    } catch (const std::exception& e) {
      RELAY_LOG_WARN("registry observer failed", {observability::StringField("event", ToString(event)),
                                                  observability::StringField("connection_id", connection.id),
                                                  observability::StringField("error", e.what())});
    }
  }
}

std::size_t ConnectionRegistry::CloseAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard lock(mutex_);
    ids.reserve(index_.size());
    for (const auto& [id, _] : index_) ids.push_back(id);
  }

  std::size_t closed = 0;
  for (const auto& id : ids) {
    if (Close(id)) ++closed;
  }
  return closed;
}

bool ConnectionRegistry::IsOpen(const std::string& id) const {
  std::lock_guard lock(mutex_);
  const auto*     slot = FindLocked(id);
  return slot && !slot->closing;
}

std::size_t ConnectionRegistry::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return live_;
}

RegistryCounters ConnectionRegistry::Counters() const {
  std::lock_guard lock(mutex_);
  return counters_;
}

} // namespace relay::registry
