#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/index/HnswIndex.hpp"
#include "core/metadata/IdAllocator.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/metadata/Sqlite.hpp"
#include "core/metadata/VectorLedger.hpp"

namespace vindex {

struct SearchHit {
  ItemRecord record;
  float      score;  // cosine similarity
};

struct StoreStats {
  int64_t projects = 0;
  int64_t items = 0;
  size_t  indexed = 0;
  size_t  dimension = 0;
  size_t  capacity = 0;
};

// Project-scoped embedding store. One SQLite file holds projects, identity
// mapping, records and the vector ledger; the HNSW index is rebuilt from the
// ledger on open. Every public call takes the store-wide lock for its whole
// duration, so mutations are linearized and never observed half-applied.
class ItemStore {
public:
  ItemStore(const std::string& dbPath, size_t dimension, size_t maxElements);

  ItemStore(const ItemStore&) = delete;
  ItemStore& operator=(const ItemStore&) = delete;

  size_t dimension() const { return dim_; }
  const std::string& path() const { return db_.path(); }
  const SchemaStatus& schemaStatus() const { return schema_; }

  // Creates the project on first use, allocates or reuses the internal id and
  // writes ledger, record and index. All or nothing.
  void upsertItem(const ItemRecord& record, const Embedding& embedding);
  std::optional<ItemRecord> getRecord(const std::string& project_id, const std::string& item_id);
  std::vector<ItemRecord> listRecords(const std::string& project_id);
  // Returns whether the item existed. The removed record is copied to
  // *removed when given.
  bool deleteItem(const std::string& project_id, const std::string& item_id,
                  ItemRecord* removed = nullptr);
  bool projectExists(const std::string& project_id);

  // At most k hits from project_id, best first.
  std::vector<SearchHit> search(const std::string& project_id, const Embedding& query, size_t k);

  // Clears the index and reloads it from the ledger. Returns the row count.
  size_t rebuildFromLedger();
  // Drops the derived index only; the ledger is untouched and the next search
  // reloads from it.
  void clearIndex();

  // Consistent copy of the whole database file at destPath, taken under the
  // store lock with the SQLite online backup API.
  void backupTo(const std::string& destPath);

  StoreStats stats();

private:
  size_t rebuildLocked();
  void checkDimension(const Embedding& v, const char* what) const;

  std::mutex    mu_;
  size_t        dim_;
  size_t        maxElements_;
  SqliteConnection db_;
  SchemaStatus  schema_;
  IdAllocator   ids_;
  VectorLedger  ledger_;
  MetadataStore records_;
  HnswIndex     index_;
  bool          indexStale_ = false;
};

} // namespace vindex
