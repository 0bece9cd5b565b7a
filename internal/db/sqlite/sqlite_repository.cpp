#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* st = nullptr;
    ~Statement() { sqlite3_finalize(st); }
};

bool Prepare(sqlite3* db, const char* sql, Statement& out) {
    return sqlite3_prepare_v2(db, sql, -1, &out.st, nullptr) == SQLITE_OK;
}

} // namespace

// Extended result code on failure, so constraint kinds can be told apart.
static int Step(sqlite3_stmt* st, sqlite3* db) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) return rc;
    return sqlite3_extended_errcode(db);
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
    } else {
        BindText(st, idx, s);
    }
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Connections
// ------------------------------------------------------------------

static void BindConnection(sqlite3_stmt* st, const model::ConnectionRecord& r) {
    BindText(st, 1, r.id);
    BindText(st, 2, r.client_id);
    BindOptionalText(st, 3, r.user_id);
    BindOptionalText(st, 4, r.session_id);
    BindText(st, 5, r.request_id);
    BindText(st, 6, r.status);
    BindText(st, 7, r.provider);
    BindText(st, 8, r.model);
    BindU64(st, 9, r.connected_at_ms);
    BindU64(st, 10, r.last_activity_ms);
    BindU64(st, 11, r.chunks_received);
    BindU64(st, 12, r.bytes_received);
    BindDouble(st, 13, r.average_latency_ms);
    BindText(st, 14, r.options_json);
    BindU64(st, 15, r.created_at_ms);
    BindU64(st, 16, r.updated_at_ms);
}

Result SqliteRepository::InsertConnection(Transaction& t, const model::ConnectionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO stream_connections(id,client_id,user_id,session_id,request_id,status,provider,model,"
        "connected_at_ms,last_activity_ms,chunks_received,bytes_received,average_latency_ms,options,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    Statement st;
    if (!Prepare(db, sql, st)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindConnection(st.st, r);
    return Translate(db, Step(st.st, db));
}

Result SqliteRepository::UpdateConnection(Transaction& t, const model::ConnectionRecord& r) {
    auto* db = TX(t).Handle();

    // id stays the first bound parameter so BindConnection can be shared
    const char* sql =
        "UPDATE stream_connections SET client_id=?2,user_id=?3,session_id=?4,request_id=?5,status=?6,provider=?7,model=?8,"
        "connected_at_ms=?9,last_activity_ms=?10,chunks_received=?11,bytes_received=?12,average_latency_ms=?13,options=?14,"
        "created_at_ms=?15,updated_at_ms=?16 WHERE id=?1;";

    Statement st;
    if (!Prepare(db, sql, st)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindConnection(st.st, r);
    auto result = Translate(db, Step(st.st, db));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "connection " + r.id);
    }
    return result;
}

std::optional<model::ConnectionRecord> SqliteRepository::GetConnection(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,client_id,COALESCE(user_id,''),COALESCE(session_id,''),request_id,status,provider,model,"
        "connected_at_ms,last_activity_ms,chunks_received,bytes_received,average_latency_ms,options,created_at_ms,updated_at_ms "
        "FROM stream_connections WHERE id=?;";

    Statement st;
    if (!Prepare(db, sql, st)) return std::nullopt;

    BindText(st.st, 1, id);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;

    model::ConnectionRecord r;
    r.id = ColText(st.st, 0);
    r.client_id = ColText(st.st, 1);
    r.user_id = ColText(st.st, 2);
    r.session_id = ColText(st.st, 3);
    r.request_id = ColText(st.st, 4);
    r.status = ColText(st.st, 5);
    r.provider = ColText(st.st, 6);
    r.model = ColText(st.st, 7);
    r.connected_at_ms = ColU64(st.st, 8);
    r.last_activity_ms = ColU64(st.st, 9);
    r.chunks_received = ColU64(st.st, 10);
    r.bytes_received = ColU64(st.st, 11);
    r.average_latency_ms = ColDouble(st.st, 12);
    r.options_json = ColText(st.st, 13);
    r.created_at_ms = ColU64(st.st, 14);
    r.updated_at_ms = ColU64(st.st, 15);
    return r;
}

// ------------------------------------------------------------------
// Buffers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBuffer(Transaction& t, const model::BufferRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO stream_buffers(connection_id,max_size_bytes,flush_threshold,compression_enabled,encryption_enabled,"
        "resident_chunks,resident_bytes,flush_count,last_flush_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(connection_id) DO UPDATE SET max_size_bytes=excluded.max_size_bytes,flush_threshold=excluded.flush_threshold,"
        "compression_enabled=excluded.compression_enabled,encryption_enabled=excluded.encryption_enabled,"
        "resident_chunks=excluded.resident_chunks,resident_bytes=excluded.resident_bytes,flush_count=excluded.flush_count,"
        "last_flush_ms=excluded.last_flush_ms,updated_at_ms=excluded.updated_at_ms;";

    Statement st;
    if (!Prepare(db, sql, st)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.connection_id);
    BindU64(st.st, 2, r.max_size_bytes);
    BindDouble(st.st, 3, r.flush_threshold);
    sqlite3_bind_int(st.st, 4, r.compression_enabled ? 1 : 0);
    sqlite3_bind_int(st.st, 5, r.encryption_enabled ? 1 : 0);
    BindU64(st.st, 6, r.resident_chunks);
    BindU64(st.st, 7, r.resident_bytes);
    BindU64(st.st, 8, r.flush_count);
    BindU64(st.st, 9, r.last_flush_ms);
    BindU64(st.st, 10, r.updated_at_ms);

    return Translate(db, Step(st.st, db));
}

std::optional<model::BufferRecord> SqliteRepository::GetBuffer(Transaction& t, const std::string& connection_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT connection_id,max_size_bytes,flush_threshold,compression_enabled,encryption_enabled,"
        "resident_chunks,resident_bytes,flush_count,last_flush_ms,updated_at_ms FROM stream_buffers WHERE connection_id=?;";

    Statement st;
    if (!Prepare(db, sql, st)) return std::nullopt;

    BindText(st.st, 1, connection_id);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;

    model::BufferRecord r;
    r.connection_id = ColText(st.st, 0);
    r.max_size_bytes = ColU64(st.st, 1);
    r.flush_threshold = ColDouble(st.st, 2);
    r.compression_enabled = sqlite3_column_int(st.st, 3) != 0;
    r.encryption_enabled = sqlite3_column_int(st.st, 4) != 0;
    r.resident_chunks = ColU64(st.st, 5);
    r.resident_bytes = ColU64(st.st, 6);
    r.flush_count = ColU64(st.st, 7);
    r.last_flush_ms = ColU64(st.st, 8);
    r.updated_at_ms = ColU64(st.st, 9);
    return r;
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteRepository::SaveChunkBatch(Transaction& t, const std::vector<model::ChunkRecord>& chunks) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO stream_chunks(id,connection_id,sequence,type,data,compression,key_epoch,original_size,size_bytes,checksum,timestamp_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    Statement st;
    if (!Prepare(db, sql, st)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& c : chunks) {
        sqlite3_reset(st.st);
        sqlite3_clear_bindings(st.st);

        BindText(st.st, 1, c.id);
        BindText(st.st, 2, c.connection_id);
        BindU64(st.st, 3, c.sequence);
        BindText(st.st, 4, c.type);
        BindBlob(st.st, 5, c.data);
        BindText(st.st, 6, c.compression);
        if (c.key_epoch.has_value()) {
            BindU64(st.st, 7, *c.key_epoch);
        } else {
            sqlite3_bind_null(st.st, 7);
        }
        BindU64(st.st, 8, c.original_size);
        BindU64(st.st, 9, c.size_bytes);
        BindOptionalText(st.st, 10, c.checksum);
        BindU64(st.st, 11, c.timestamp_ms);

        auto result = Translate(db, Step(st.st, db));
        if (!result) return result;
    }
    return Result::Ok();
}

std::vector<model::ChunkRecord> SqliteRepository::ReadChunks(
    Transaction& t, const std::string& connection_id, uint64_t from_sequence,
    std::optional<uint64_t> max_chunks, std::optional<uint64_t> min_timestamp_ms) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT id,connection_id,sequence,type,data,compression,key_epoch,original_size,size_bytes,COALESCE(checksum,''),timestamp_ms "
        "FROM stream_chunks WHERE connection_id=? AND sequence>=?";
    if (min_timestamp_ms.has_value()) {
        sql += " AND timestamp_ms>=?";
    }
    sql += " ORDER BY sequence ASC";
    if (max_chunks.has_value()) {
        sql += " LIMIT ?";
    }
    sql += ";";

    Statement st;
    if (!Prepare(db, sql.c_str(), st)) return {};

    int bind_idx = 1;
    BindText(st.st, bind_idx++, connection_id);
    BindU64(st.st, bind_idx++, from_sequence);
    if (min_timestamp_ms.has_value()) {
        BindU64(st.st, bind_idx++, *min_timestamp_ms);
    }
    if (max_chunks.has_value()) {
        BindU64(st.st, bind_idx++, *max_chunks);
    }

    std::vector<model::ChunkRecord> out;
    while (sqlite3_step(st.st) == SQLITE_ROW) {
        model::ChunkRecord c;
        c.id = ColText(st.st, 0);
        c.connection_id = ColText(st.st, 1);
        c.sequence = ColU64(st.st, 2);
        c.type = ColText(st.st, 3);
        c.data = ColBlob(st.st, 4);
        c.compression = ColText(st.st, 5);
        if (sqlite3_column_type(st.st, 6) != SQLITE_NULL) {
            c.key_epoch = static_cast<uint32_t>(sqlite3_column_int64(st.st, 6));
        }
        c.original_size = ColU64(st.st, 7);
        c.size_bytes = ColU64(st.st, 8);
        c.checksum = ColText(st.st, 9);
        c.timestamp_ms = ColU64(st.st, 10);
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace relay::db::sqlite
