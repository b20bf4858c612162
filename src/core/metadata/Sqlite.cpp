#include "Sqlite.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/errors/Error.hpp"

namespace vindex {

SqliteConnection::SqliteConnection(const std::string& dbPath, bool create)
  : db_(nullptr), path_(dbPath) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  if (create) flags |= SQLITE_OPEN_CREATE;
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw Error(ErrorCode::StorageIO, "Failed to open DB " + dbPath + ": " + msg);
  }
  db_ = db;
  sqlite3_busy_timeout(db_, 5000);
}

SqliteConnection::~SqliteConnection() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteConnection::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw Error(ErrorCode::StorageIO, "SQLite exec failed: " + msg);
  }
}

int64_t SqliteConnection::changes() const {
  return sqlite3_changes(db_);
}

std::string SqliteConnection::errmsg() const {
  return sqlite3_errmsg(db_);
}

// -------- statement --------

SqliteStatement::SqliteStatement(SqliteConnection& conn, const char* sql)
  : conn_(conn), st_(nullptr), sql_(sql) {
  if (sqlite3_prepare_v2(conn_.handle(), sql, -1, &st_, nullptr) != SQLITE_OK) {
    std::string err = conn_.errmsg();
    sqlite3_finalize(st_);
    st_ = nullptr;
    throw Error(ErrorCode::StorageIO, "prepare failed: " + err);
  }
}

SqliteStatement::~SqliteStatement() {
  sqlite3_finalize(st_);
}

SqliteStatement& SqliteStatement::bind(int idx, int64_t v) {
  if (sqlite3_bind_int64(st_, idx, v) != SQLITE_OK)
    throw Error(ErrorCode::StorageIO, "bind failed: " + conn_.errmsg());
  return *this;
}

SqliteStatement& SqliteStatement::bind(int idx, const std::string& v) {
  if (sqlite3_bind_text(st_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    throw Error(ErrorCode::StorageIO, "bind failed: " + conn_.errmsg());
  return *this;
}

SqliteStatement& SqliteStatement::bindNull(int idx) {
  if (sqlite3_bind_null(st_, idx) != SQLITE_OK)
    throw Error(ErrorCode::StorageIO, "bind failed: " + conn_.errmsg());
  return *this;
}

SqliteStatement& SqliteStatement::bindBlob(int idx, const void* data, size_t len) {
  if (sqlite3_bind_blob(st_, idx, data, static_cast<int>(len), SQLITE_TRANSIENT) != SQLITE_OK)
    throw Error(ErrorCode::StorageIO, "bind failed: " + conn_.errmsg());
  return *this;
}

bool SqliteStatement::step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw Error(ErrorCode::StorageIO, "step failed: " + conn_.errmsg());
}

void SqliteStatement::run() {
  if (step()) {
    spdlog::debug("statement returned rows where none were expected: {}", sql_);
  }
}

void SqliteStatement::reset() {
  sqlite3_reset(st_);
  sqlite3_clear_bindings(st_);
}

int64_t SqliteStatement::columnInt64(int col) const {
  return sqlite3_column_int64(st_, col);
}

std::string SqliteStatement::columnText(int col) const {
  const unsigned char* p = sqlite3_column_text(st_, col);
  if (!p) return {};
  return std::string(reinterpret_cast<const char*>(p),
                     static_cast<size_t>(sqlite3_column_bytes(st_, col)));
}

bool SqliteStatement::columnIsNull(int col) const {
  return sqlite3_column_type(st_, col) == SQLITE_NULL;
}

std::vector<uint8_t> SqliteStatement::columnBlob(int col) const {
  const auto* p = static_cast<const uint8_t*>(sqlite3_column_blob(st_, col));
  int n = sqlite3_column_bytes(st_, col);
  if (!p || n <= 0) return {};
  return std::vector<uint8_t>(p, p + n);
}

// -------- transaction --------

SqliteTransaction::SqliteTransaction(SqliteConnection& conn)
  : conn_(conn), committed_(false) {
  conn_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) return;
  char* err = nullptr;
  if (sqlite3_exec(conn_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::warn("rollback failed: {}", err ? err : "unknown error");
    sqlite3_free(err);
  }
}

void SqliteTransaction::commit() {
  conn_.exec("COMMIT;");
  committed_ = true;
}

// -------- online backup --------

void backupDatabase(SqliteConnection& src, const std::string& destPath) {
  sqlite3* dest = nullptr;
  if (sqlite3_open_v2(destPath.c_str(), &dest,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
    std::string msg = dest ? sqlite3_errmsg(dest) : "out of memory";
    sqlite3_close(dest);
    throw Error(ErrorCode::StorageIO, "Failed to open backup target " + destPath + ": " + msg);
  }

  sqlite3_backup* bk = sqlite3_backup_init(dest, "main", src.handle(), "main");
  if (!bk) {
    std::string msg = sqlite3_errmsg(dest);
    sqlite3_close(dest);
    throw Error(ErrorCode::StorageIO, "backup init failed: " + msg);
  }
  int rc = sqlite3_backup_step(bk, -1);
  sqlite3_backup_finish(bk);
  if (rc != SQLITE_DONE) {
    std::string msg = sqlite3_errstr(rc);
    sqlite3_close(dest);
    throw Error(ErrorCode::StorageIO, "backup step failed: " + msg);
  }
  rc = sqlite3_errcode(dest);
  sqlite3_close(dest);
  if (rc != SQLITE_OK) {
    throw Error(ErrorCode::StorageIO, "backup finish failed: " + std::string(sqlite3_errstr(rc)));
  }
}

} // namespace vindex
