// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"

#include <spdlog/spdlog.h>
#include <string>

#include "Sqlite.hpp"

namespace vindex {

namespace {

constexpr const char* kSchemaSQL = R"SQL(
  CREATE TABLE IF NOT EXISTS schema_version (
    id            INTEGER PRIMARY KEY CHECK (id = 1),
    version       INTEGER NOT NULL,
    embedding_dim INTEGER NOT NULL
  );

  CREATE TABLE IF NOT EXISTS projects (
    project_id TEXT PRIMARY KEY,
    created_at INTEGER NOT NULL
  );

  CREATE TABLE IF NOT EXISTS identity_mapping (
    internal_id INTEGER PRIMARY KEY AUTOINCREMENT,
    project_id  TEXT NOT NULL REFERENCES projects(project_id),
    item_id     TEXT NOT NULL,
    UNIQUE (project_id, item_id)
  );

  CREATE TABLE IF NOT EXISTS item_records (
    internal_id       INTEGER PRIMARY KEY
                      REFERENCES identity_mapping(internal_id) ON DELETE CASCADE,
    blob_key          TEXT NOT NULL,
    content_type      TEXT NOT NULL,
    original_filename TEXT,
    size_bytes        INTEGER NOT NULL
  );

  CREATE TABLE IF NOT EXISTS item_vectors (
    internal_id INTEGER PRIMARY KEY
                REFERENCES identity_mapping(internal_id) ON DELETE CASCADE,
    embedding   BLOB NOT NULL
  );
)SQL";

// Children first so foreign keys never block the drop.
constexpr const char* kDropSQL = R"SQL(
  DROP TABLE IF EXISTS item_vectors;
  DROP TABLE IF EXISTS item_records;
  DROP TABLE IF EXISTS identity_mapping;
  DROP TABLE IF EXISTS projects;
  DROP TABLE IF EXISTS schema_version;
)SQL";

bool tableExists(SqliteConnection& db, const char* name) {
  SqliteStatement st(db, "SELECT count(*) FROM sqlite_master WHERE type='table' AND name=?");
  st.bind(1, std::string(name));
  return st.step() && st.columnInt64(0) > 0;
}

} // namespace

SchemaStatus openOrInitialize(SqliteConnection& db, size_t dimension) {
  // Pragmas: concurrency + durability + integrity
  db.exec("PRAGMA journal_mode=WAL;");
  db.exec("PRAGMA synchronous=NORMAL;");
  db.exec("PRAGMA foreign_keys=ON;");

  SchemaStatus status;
  SqliteTransaction tx(db);

  bool hasTag = false;
  int64_t storedDim = 0;
  if (tableExists(db, "schema_version")) {
    SqliteStatement st(db, "SELECT version, embedding_dim FROM schema_version WHERE id = 1");
    if (st.step()) {
      hasTag = true;
      status.previousVersion = static_cast<int>(st.columnInt64(0));
      storedDim = st.columnInt64(1);
    }
  }

  if (!hasTag) {
    // Tables without a tag come from an unknown layout.
    if (tableExists(db, "identity_mapping") || tableExists(db, "item_vectors")) {
      spdlog::warn("store {} has tables but no schema tag; dropping all data", db.path());
      db.exec(kDropSQL);
      status.reset = true;
    }
    status.created = !status.reset;
  } else if (status.previousVersion != kSchemaVersion ||
             storedDim != static_cast<int64_t>(dimension)) {
    spdlog::warn("store {} schema v{} dim {} does not match v{} dim {}; "
                 "DROPPING ALL INDEXED DATA (no migration)",
                 db.path(), status.previousVersion, storedDim, kSchemaVersion, dimension);
    db.exec(kDropSQL);
    status.reset = true;
  }

  db.exec(kSchemaSQL);

  SqliteStatement tag(db, R"SQL(
    INSERT INTO schema_version (id, version, embedding_dim) VALUES (1, ?, ?)
    ON CONFLICT(id) DO UPDATE SET version = excluded.version,
                                  embedding_dim = excluded.embedding_dim
  )SQL");
  tag.bind(1, static_cast<int64_t>(kSchemaVersion));
  tag.bind(2, static_cast<int64_t>(dimension));
  tag.run();

  tx.commit();

  if (status.created) {
    spdlog::info("initialized store {} (schema v{}, dim {})", db.path(), kSchemaVersion, dimension);
  }
  return status;
}

} // namespace vindex
