#include "MetadataStore.hpp"

#include "Sqlite.hpp"

namespace vindex {

namespace {

constexpr const char* kSelectColumns = R"SQL(
  SELECT m.project_id, m.item_id, r.blob_key, r.content_type, r.original_filename, r.size_bytes
  FROM item_records r
  JOIN identity_mapping m ON m.internal_id = r.internal_id
)SQL";

ItemRecord readRow(const SqliteStatement& st) {
  ItemRecord r;
  r.project_id   = st.columnText(0);
  r.item_id      = st.columnText(1);
  r.blob_key     = st.columnText(2);
  r.content_type = st.columnText(3);
  if (!st.columnIsNull(4)) r.original_filename = st.columnText(4);
  r.size_bytes   = st.columnInt64(5);
  return r;
}

} // namespace

bool operator==(const ItemRecord& a, const ItemRecord& b) {
  return a.project_id == b.project_id && a.item_id == b.item_id &&
         a.blob_key == b.blob_key && a.content_type == b.content_type &&
         a.original_filename == b.original_filename && a.size_bytes == b.size_bytes;
}

void MetadataStore::putRecord(InternalId id, const ItemRecord& r) {
  SqliteStatement st(db_, R"SQL(
    INSERT INTO item_records
      (internal_id, blob_key, content_type, original_filename, size_bytes)
    VALUES (?,?,?,?,?)
    ON CONFLICT(internal_id) DO UPDATE SET
      blob_key = excluded.blob_key,
      content_type = excluded.content_type,
      original_filename = excluded.original_filename,
      size_bytes = excluded.size_bytes
  )SQL");
  int i = 1;
  st.bind(i++, id);
  st.bind(i++, r.blob_key);
  st.bind(i++, r.content_type);
  if (r.original_filename) st.bind(i++, *r.original_filename);
  else st.bindNull(i++);
  st.bind(i++, r.size_bytes);
  st.run();
}

std::optional<ItemRecord> MetadataStore::getRecord(const std::string& project_id,
                                                   const std::string& item_id) {
  SqliteStatement st(db_, (std::string(kSelectColumns) +
                           " WHERE m.project_id = ? AND m.item_id = ?").c_str());
  st.bind(1, project_id);
  st.bind(2, item_id);
  if (!st.step()) return std::nullopt;
  return readRow(st);
}

std::optional<ItemRecord> MetadataStore::getRecordById(InternalId id) {
  SqliteStatement st(db_, (std::string(kSelectColumns) + " WHERE r.internal_id = ?").c_str());
  st.bind(1, id);
  if (!st.step()) return std::nullopt;
  return readRow(st);
}

std::vector<ItemRecord> MetadataStore::listRecords(const std::string& project_id) {
  SqliteStatement st(db_, (std::string(kSelectColumns) +
                           " WHERE m.project_id = ? ORDER BY m.item_id").c_str());
  st.bind(1, project_id);
  std::vector<ItemRecord> out;
  while (st.step()) out.push_back(readRow(st));
  return out;
}

bool MetadataStore::deleteRecord(InternalId id) {
  SqliteStatement st(db_, "DELETE FROM item_records WHERE internal_id = ?");
  st.bind(1, id);
  st.run();
  return db_.changes() > 0;
}

int64_t MetadataStore::recordCount() {
  SqliteStatement st(db_, "SELECT count(*) FROM item_records");
  return st.step() ? st.columnInt64(0) : 0;
}

} // namespace vindex
