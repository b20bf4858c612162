#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/index/VectorIndex.hpp"

namespace vindex {

class SqliteConnection;

struct ItemRecord {
  std::string project_id;
  std::string item_id;
  std::string blob_key;
  std::string content_type;
  std::optional<std::string> original_filename;
  int64_t     size_bytes = 0;
};

bool operator==(const ItemRecord& a, const ItemRecord& b);
inline bool operator!=(const ItemRecord& a, const ItemRecord& b) { return !(a == b); }

// Rows of item_records joined with identity_mapping. Callers hold the store
// lock; writes run inside the caller's transaction.
class MetadataStore {
public:
  explicit MetadataStore(SqliteConnection& db) : db_(db) {}

  void putRecord(InternalId id, const ItemRecord& r);
  std::optional<ItemRecord> getRecord(const std::string& project_id, const std::string& item_id);
  std::optional<ItemRecord> getRecordById(InternalId id);
  // Ordered by item_id.
  std::vector<ItemRecord> listRecords(const std::string& project_id);
  bool deleteRecord(InternalId id);
  int64_t recordCount();

private:
  SqliteConnection& db_;
};

} // namespace vindex
