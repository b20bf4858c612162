#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/index/VectorIndex.hpp"

namespace vindex {

class SqliteConnection;

// Maps (project_id, item_id) to a dense internal id. Ids come from an
// AUTOINCREMENT key and are never handed out twice for one store file.
// Callers hold the store lock and an open transaction.
class IdAllocator {
public:
  explicit IdAllocator(SqliteConnection& db) : db_(db) {}

  void ensureProject(const std::string& project_id);
  bool projectExists(const std::string& project_id);
  int64_t projectCount();

  InternalId resolveOrCreate(const std::string& project_id, const std::string& item_id);
  std::optional<InternalId> resolve(const std::string& project_id, const std::string& item_id);
  void release(InternalId id);

private:
  SqliteConnection& db_;
};

} // namespace vindex
