#include "ItemStore.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

#include "core/errors/Error.hpp"
#include "core/index/Distance.hpp"

namespace vindex {

ItemStore::ItemStore(const std::string& dbPath, size_t dimension, size_t maxElements)
  : dim_(dimension),
    maxElements_(maxElements),
    db_(dbPath),
    schema_(openOrInitialize(db_, dimension)),
    ids_(db_),
    ledger_(db_),
    records_(db_),
    index_(dimension, maxElements) {
  std::lock_guard<std::mutex> lk(mu_);
  // The index lives in memory only, so it is always empty here while the
  // ledger may hold rows.
  if (ledger_.count() > 0) {
    rebuildLocked();
  }
}

void ItemStore::checkDimension(const Embedding& v, const char* what) const {
  if (v.size() != dim_) {
    throw Error(ErrorCode::DimensionMismatch,
                std::string(what) + " has " + std::to_string(v.size()) +
                " components, store expects " + std::to_string(dim_));
  }
  if (!all_finite(v)) {
    throw Error(ErrorCode::InvalidArgument, std::string(what) + " has non-finite components");
  }
}

void ItemStore::upsertItem(const ItemRecord& record, const Embedding& embedding) {
  std::lock_guard<std::mutex> lk(mu_);
  checkDimension(embedding, "embedding");

  SqliteTransaction tx(db_);
  if (!ids_.resolve(record.project_id, record.item_id) &&
      ledger_.count() >= static_cast<int64_t>(maxElements_)) {
    throw Error(ErrorCode::CapacityExceeded,
                "index is full (" + std::to_string(maxElements_) + " elements)");
  }
  const InternalId id = ids_.resolveOrCreate(record.project_id, record.item_id);
  ledger_.put(id, embedding);
  records_.putRecord(id, record);
  tx.commit();

  try {
    index_.upsertScoped(id, record.project_id, embedding);
  } catch (const std::exception& e) {
    // Ledger is committed; the next query reloads the index from it.
    spdlog::error("index update for {}/{} failed after commit: {}",
                  record.project_id, record.item_id, e.what());
    indexStale_ = true;
    throw;
  }
}

std::optional<ItemRecord> ItemStore::getRecord(const std::string& project_id,
                                               const std::string& item_id) {
  std::lock_guard<std::mutex> lk(mu_);
  return records_.getRecord(project_id, item_id);
}

std::vector<ItemRecord> ItemStore::listRecords(const std::string& project_id) {
  std::lock_guard<std::mutex> lk(mu_);
  return records_.listRecords(project_id);
}

bool ItemStore::deleteItem(const std::string& project_id, const std::string& item_id,
                           ItemRecord* removed) {
  std::lock_guard<std::mutex> lk(mu_);

  SqliteTransaction tx(db_);
  const auto id = ids_.resolve(project_id, item_id);
  if (!id) return false;

  auto rec = records_.getRecordById(*id);
  ledger_.remove(*id);
  records_.deleteRecord(*id);
  ids_.release(*id);
  tx.commit();

  index_.remove(*id);
  if (removed && rec) *removed = std::move(*rec);
  return true;
}

bool ItemStore::projectExists(const std::string& project_id) {
  std::lock_guard<std::mutex> lk(mu_);
  return ids_.projectExists(project_id);
}

std::vector<SearchHit> ItemStore::search(const std::string& project_id,
                                         const Embedding& query, size_t k) {
  std::lock_guard<std::mutex> lk(mu_);
  checkDimension(query, "query");
  if (k == 0) return {};
  if (indexStale_ || (index_.size() == 0 && ledger_.count() > 0)) {
    rebuildLocked();
  }

  std::vector<SearchHit> out;
  for (const auto& hit : index_.searchScope(project_id, query, k)) {
    auto rec = records_.getRecordById(hit.id);
    if (!rec) {
      spdlog::warn("index member {} has no record; skipping", hit.id);
      continue;
    }
    out.push_back({std::move(*rec), hit.similarity});
  }
  return out;
}

size_t ItemStore::rebuildFromLedger() {
  std::lock_guard<std::mutex> lk(mu_);
  return rebuildLocked();
}

size_t ItemStore::rebuildLocked() {
  index_.clear();
  const int64_t rows = ledger_.count();
  if (rows > static_cast<int64_t>(index_.capacity())) {
    spdlog::warn("ledger holds {} vectors, more than max elements {}; growing the index "
                 "and refusing new items until it shrinks", rows, maxElements_);
    index_.reserve(static_cast<size_t>(rows));
  }

  size_t n = 0, skipped = 0;
  ledger_.forEach([&](InternalId id, const std::string& project_id, const Embedding& v) {
    try {
      index_.upsertScoped(id, project_id, v);
      ++n;
    } catch (const Error& e) {
      spdlog::warn("skipping ledger row {} ({}): {}", id, project_id, e.what());
      ++skipped;
    }
  });
  indexStale_ = false;
  if (skipped > 0) {
    spdlog::warn("rebuilt index from ledger: {} vectors, {} unusable rows skipped", n, skipped);
  } else {
    spdlog::info("rebuilt index from ledger: {} vectors", n);
  }
  return n;
}

void ItemStore::clearIndex() {
  std::lock_guard<std::mutex> lk(mu_);
  index_.clear();
  indexStale_ = true;
}

void ItemStore::backupTo(const std::string& destPath) {
  namespace fs = std::filesystem;
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  fs::remove(destPath, ec);
  if (ec) {
    throw Error(ErrorCode::StorageIO, "cannot replace backup target " + destPath + ": " + ec.message());
  }
  backupDatabase(db_, destPath);
}

StoreStats ItemStore::stats() {
  std::lock_guard<std::mutex> lk(mu_);
  StoreStats s;
  s.projects  = ids_.projectCount();
  s.items     = records_.recordCount();
  s.indexed   = index_.size();
  s.dimension = dim_;
  s.capacity  = maxElements_;
  return s;
}

} // namespace vindex
