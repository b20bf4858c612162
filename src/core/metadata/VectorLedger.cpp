#include "VectorLedger.hpp"

#include "Sqlite.hpp"
#include "core/index/Distance.hpp"

namespace vindex {

void VectorLedger::put(InternalId id, const Embedding& v) {
  const auto bytes = encode_embedding(v);
  SqliteStatement st(db_, R"SQL(
    INSERT INTO item_vectors (internal_id, embedding) VALUES (?, ?)
    ON CONFLICT(internal_id) DO UPDATE SET embedding = excluded.embedding
  )SQL");
  st.bind(1, id);
  st.bindBlob(2, bytes.data(), bytes.size());
  st.run();
}

bool VectorLedger::remove(InternalId id) {
  SqliteStatement st(db_, "DELETE FROM item_vectors WHERE internal_id = ?");
  st.bind(1, id);
  st.run();
  return db_.changes() > 0;
}

int64_t VectorLedger::count() {
  SqliteStatement st(db_, "SELECT count(*) FROM item_vectors");
  return st.step() ? st.columnInt64(0) : 0;
}

void VectorLedger::forEach(
    const std::function<void(InternalId, const std::string&, const Embedding&)>& fn) {
  SqliteStatement st(db_, R"SQL(
    SELECT v.internal_id, m.project_id, v.embedding
    FROM item_vectors v
    JOIN identity_mapping m ON m.internal_id = v.internal_id
    ORDER BY v.internal_id
  )SQL");
  while (st.step()) {
    fn(st.columnInt64(0), st.columnText(1), decode_embedding(st.columnBlob(2)));
  }
}

} // namespace vindex
