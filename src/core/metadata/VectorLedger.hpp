#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "core/index/VectorIndex.hpp"

namespace vindex {

class SqliteConnection;

// Durable (internal_id, embedding) rows. This table is the source of truth;
// the in-memory index is rebuilt from it.
class VectorLedger {
public:
  explicit VectorLedger(SqliteConnection& db) : db_(db) {}

  void put(InternalId id, const Embedding& v);
  bool remove(InternalId id);
  int64_t count();

  // Visits every row together with the owning project.
  void forEach(const std::function<void(InternalId, const std::string&, const Embedding&)>& fn);

private:
  SqliteConnection& db_;
};

} // namespace vindex
