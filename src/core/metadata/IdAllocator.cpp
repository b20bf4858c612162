#include "IdAllocator.hpp"

#include <sqlite3.h>
#include <ctime>

#include "Sqlite.hpp"
#include "core/errors/Error.hpp"

namespace vindex {

void IdAllocator::ensureProject(const std::string& project_id) {
  SqliteStatement st(db_, "INSERT OR IGNORE INTO projects (project_id, created_at) VALUES (?, ?)");
  st.bind(1, project_id);
  st.bind(2, static_cast<int64_t>(std::time(nullptr)));
  st.run();
}

bool IdAllocator::projectExists(const std::string& project_id) {
  SqliteStatement st(db_, "SELECT 1 FROM projects WHERE project_id = ?");
  st.bind(1, project_id);
  return st.step();
}

int64_t IdAllocator::projectCount() {
  SqliteStatement st(db_, "SELECT count(*) FROM projects");
  return st.step() ? st.columnInt64(0) : 0;
}

std::optional<InternalId> IdAllocator::resolve(const std::string& project_id,
                                               const std::string& item_id) {
  SqliteStatement st(db_,
    "SELECT internal_id FROM identity_mapping WHERE project_id = ? AND item_id = ?");
  st.bind(1, project_id);
  st.bind(2, item_id);
  if (!st.step()) return std::nullopt;
  return st.columnInt64(0);
}

InternalId IdAllocator::resolveOrCreate(const std::string& project_id,
                                        const std::string& item_id) {
  if (auto existing = resolve(project_id, item_id)) return *existing;

  ensureProject(project_id);
  SqliteStatement st(db_, "INSERT INTO identity_mapping (project_id, item_id) VALUES (?, ?)");
  st.bind(1, project_id);
  st.bind(2, item_id);
  st.run();
  InternalId id = sqlite3_last_insert_rowid(db_.handle());
  if (id <= 0) {
    throw Error(ErrorCode::StorageIO, "failed to allocate internal id for " + project_id + "/" + item_id);
  }
  return id;
}

void IdAllocator::release(InternalId id) {
  SqliteStatement st(db_, "DELETE FROM identity_mapping WHERE internal_id = ?");
  st.bind(1, id);
  st.run();
}

} // namespace vindex
