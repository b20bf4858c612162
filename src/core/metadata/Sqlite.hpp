#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace vindex {

// Owns one sqlite3 connection. All failures throw Error{StorageIO}.
class SqliteConnection {
public:
  explicit SqliteConnection(const std::string& dbPath, bool create = true);
  ~SqliteConnection();

  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  sqlite3* handle() const { return db_; }
  const std::string& path() const { return path_; }

  // Runs one or more statements with no bound parameters.
  void exec(const std::string& sql);
  int64_t changes() const;
  std::string errmsg() const;

private:
  sqlite3* db_;
  std::string path_;
};

class SqliteStatement {
public:
  SqliteStatement(SqliteConnection& conn, const char* sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  SqliteStatement& bind(int idx, int64_t v);
  SqliteStatement& bind(int idx, const std::string& v);
  SqliteStatement& bindNull(int idx);
  SqliteStatement& bindBlob(int idx, const void* data, size_t len);

  // true when a row is available, false when done.
  bool step();
  // Steps a statement that must not return rows.
  void run();
  void reset();

  int64_t columnInt64(int col) const;
  std::string columnText(int col) const;
  bool columnIsNull(int col) const;
  std::vector<uint8_t> columnBlob(int col) const;

private:
  SqliteConnection& conn_;
  sqlite3_stmt* st_;
  std::string sql_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class SqliteTransaction {
public:
  explicit SqliteTransaction(SqliteConnection& conn);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void commit();

private:
  SqliteConnection& conn_;
  bool committed_;
};

// Copies every page of src into a fresh database file at destPath using the
// online backup API. The copy is a consistent point-in-time image.
void backupDatabase(SqliteConnection& src, const std::string& destPath);

} // namespace vindex
