#include "SnapshotManager.hpp"

#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include "core/errors/Error.hpp"
#include "core/metadata/Sqlite.hpp"
#include "core/storage/BlobStore.hpp"
#include "core/store/ItemStore.hpp"

namespace vindex {

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) throw Error(ErrorCode::StorageIO, "cannot read " + p.string());
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

void write_file(const fs::path& p, const std::string& bytes) {
  std::ofstream os(p, std::ios::binary | std::ios::trunc);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw Error(ErrorCode::StorageIO, "cannot write " + p.string());
}

void remove_quietly(const fs::path& p) {
  std::error_code ec;
  fs::remove(p, ec);
  if (ec) spdlog::warn("could not remove {}: {}", p.string(), ec.message());
}

// Per-call scratch file beside the store; concurrent backups never share one.
fs::path scratch_path(const std::string& dbPath) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
  return fs::path(dbPath + ".snapshot-" + buf);
}

// Opens the candidate file and asks SQLite whether it is intact.
void validate_database(const std::string& path) {
  SqliteConnection db(path, false);
  SqliteStatement st(db, "PRAGMA quick_check");
  if (!st.step() || st.columnText(0) != "ok") {
    throw Error(ErrorCode::StorageIO, "snapshot failed integrity check");
  }
}

} // namespace

const char* outcome_name(RestoreOutcome o) {
  switch (o) {
    case RestoreOutcome::SkippedLocalExists: return "skipped (local store exists)";
    case RestoreOutcome::Restored:           return "restored";
    case RestoreOutcome::NotFound:           return "no snapshot";
    case RestoreOutcome::Failed:             return "failed";
  }
  return "failed";
}

void SnapshotManager::backupTo(ItemStore& store, const std::string& destKey) {
  const fs::path tmp = scratch_path(store.path());
  try {
    store.backupTo(tmp.string());
    const std::string bytes = read_file(tmp);
    remote_.put(destKey, bytes);
    remove_quietly(tmp);
    spdlog::info("uploaded snapshot {} ({} bytes)", destKey, bytes.size());
  } catch (...) {
    remove_quietly(tmp);
    throw;
  }
}

bool SnapshotManager::tryBackup(ItemStore& store) {
  try {
    backup(store);
    return true;
  } catch (const std::exception& e) {
    spdlog::warn("snapshot backup to {} failed: {}", key_, e.what());
    return false;
  }
}

RestoreOutcome SnapshotManager::restoreFrom(const std::string& srcKey, const std::string& dbPath) {
  const fs::path target(dbPath);
  std::error_code ec;
  if (fs::exists(target, ec) && fs::file_size(target, ec) > 0) {
    spdlog::info("local store {} exists; skipping restore", dbPath);
    return RestoreOutcome::SkippedLocalExists;
  }

  fs::path tmp = target;
  tmp += ".restore";
  try {
    std::string bytes;
    try {
      bytes = remote_.get(srcKey);
    } catch (const Error& e) {
      if (e.code() != ErrorCode::NotFound) throw;
      spdlog::info("no snapshot at {}; starting with an empty store", srcKey);
      return RestoreOutcome::NotFound;
    }

    if (!target.parent_path().empty()) fs::create_directories(target.parent_path());
    write_file(tmp, bytes);
    validate_database(tmp.string());

    // Leftover journal files belong to a store that no longer exists.
    remove_quietly(dbPath + "-wal");
    remove_quietly(dbPath + "-shm");
    fs::rename(tmp, target);
    spdlog::info("restored {} from snapshot {} ({} bytes)", dbPath, srcKey, bytes.size());
    return RestoreOutcome::Restored;
  } catch (const std::exception& e) {
    spdlog::warn("restore from {} failed, starting with an empty store: {}", srcKey, e.what());
    remove_quietly(tmp);
    remove_quietly(target);
    return RestoreOutcome::Failed;
  }
}

// -------- periodic backup --------

PeriodicBackup::PeriodicBackup(SnapshotManager& snapshots, ItemStore& store,
                               std::chrono::milliseconds interval)
  : snapshots_(snapshots), store_(store), interval_(interval) {
  if (interval_.count() <= 0) {
    throw Error(ErrorCode::InvalidArgument, "backup interval must be positive");
  }
}

PeriodicBackup::~PeriodicBackup() {
  stop();
}

void PeriodicBackup::start() {
  if (running_ || cancel_.cancelled()) return;
  running_ = true;
  worker_ = std::thread([this] { run(); });
  spdlog::info("periodic backup every {} ms", interval_.count());
}

void PeriodicBackup::stop() {
  cancel_.cancel();
  if (worker_.joinable()) worker_.join();
  running_ = false;
}

void PeriodicBackup::run() {
  while (!cancel_.waitFor(interval_)) {
    ++attempts_;
    if (!snapshots_.tryBackup(store_)) ++failures_;
  }
  // Cancelled: one final best-effort backup before the task exits.
  ++attempts_;
  if (!snapshots_.tryBackup(store_)) ++failures_;
  spdlog::info("periodic backup stopped after {} attempts ({} failed)",
               attempts_.load(), failures_.load());
}

} // namespace vindex
