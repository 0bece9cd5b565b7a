#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace relay::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertConnection(Transaction& t, const model::ConnectionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.connections.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "connection " + r.id);
  s.connections[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateConnection(Transaction& t, const model::ConnectionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.connections.contains(r.id)) return Result::Err(ErrorCode::NotFound, "connection " + r.id);
  s.connections[r.id] = r;
  return Result::Ok();
}

std::optional<model::ConnectionRecord> MemoryRepository::GetConnection(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.connections.find(id);
  if (it == s.connections.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertBuffer(Transaction& t, const model::BufferRecord& r) {
  TX(t).Mutable().buffers[r.connection_id] = r;
  return Result::Ok();
}

std::optional<model::BufferRecord> MemoryRepository::GetBuffer(Transaction& t, const std::string& connection_id) {
  const auto& s  = TX(t).View();
  auto        it = s.buffers.find(connection_id);
  if (it == s.buffers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SaveChunkBatch(Transaction& t, const std::vector<model::ChunkRecord>& chunks) {
  auto& s = TX(t).Mutable();

  // copy-on-write per touched connection
  std::unordered_map<std::string, std::shared_ptr<ChunkTable>> touched;
  for (const auto& chunk : chunks) {
    auto& table = touched[chunk.connection_id];
    if (!table) {
      auto existing = s.chunks.find(chunk.connection_id);
      table         = existing == s.chunks.end() ? std::make_shared<ChunkTable>() : std::make_shared<ChunkTable>(*existing->second);
    }
    if (!table->emplace(chunk.sequence, chunk).second) {
      return Result::Err(ErrorCode::AlreadyExists, "chunk " + chunk.connection_id + "#" + std::to_string(chunk.sequence));
    }
  }

  for (auto& [connection_id, table] : touched) {
    s.chunks[connection_id] = std::move(table);
  }
  return Result::Ok();
}

std::vector<model::ChunkRecord> MemoryRepository::ReadChunks(Transaction& t, const std::string& connection_id, uint64_t from_sequence,
                                                             std::optional<uint64_t> max_chunks, std::optional<uint64_t> min_timestamp_ms) {
  std::vector<model::ChunkRecord> out;
  const auto&                     s  = TX(t).View();
  const auto                      it = s.chunks.find(connection_id);
  if (it == s.chunks.end()) {
    return out;
  }

  for (auto entry = it->second->lower_bound(from_sequence); entry != it->second->end(); ++entry) {
    if (min_timestamp_ms.has_value() && entry->second.timestamp_ms < *min_timestamp_ms) {
      continue;
    }
    out.push_back(entry->second);
    if (max_chunks.has_value() && out.size() >= *max_chunks) {
      break;
    }
  }
  return out;
}

} // namespace relay::db::memory
