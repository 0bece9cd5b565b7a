#pragma once

#include "sqlite_db.hpp"

namespace relay::db::sqlite {

// Creates the stream_* tables if missing and probes their columns.
void BootstrapSchema(SqliteDB& db);

} // namespace relay::db::sqlite
