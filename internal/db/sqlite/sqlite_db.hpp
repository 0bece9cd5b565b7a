#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace relay::db::sqlite {

/*
  Thin RAII wrapper around sqlite3* + prepared statement cache.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  // One connection handle carries one transaction at a time.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace relay::db::sqlite
