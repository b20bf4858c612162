#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

#include "core/concurrency/CancellationToken.hpp"

namespace vindex {

class BlobStore;
class ItemStore;

enum class RestoreOutcome {
  SkippedLocalExists,  // never overwrite a live store
  Restored,
  NotFound,            // no snapshot under the key; start empty
  Failed               // transfer or validation failed; start empty
};

const char* outcome_name(RestoreOutcome o);

// Moves whole-store snapshots between the local SQLite file and remote
// object storage.
class SnapshotManager {
public:
  SnapshotManager(BlobStore& remote, std::string snapshotKey)
    : remote_(remote), key_(std::move(snapshotKey)) {}

  const std::string& key() const { return key_; }

  // Takes a consistent copy under the store lock and uploads it to destKey.
  // Throws on failure.
  void backupTo(ItemStore& store, const std::string& destKey);
  void backup(ItemStore& store) { backupTo(store, key_); }
  // Logs instead of throwing. Returns whether the upload succeeded.
  bool tryBackup(ItemStore& store);

  // Startup only, before the store is opened. Downloads srcKey into dbPath
  // when dbPath does not exist yet. Never throws; any failure leaves no file
  // at dbPath so the store starts empty.
  RestoreOutcome restoreFrom(const std::string& srcKey, const std::string& dbPath);
  RestoreOutcome restoreIfMissing(const std::string& dbPath) { return restoreFrom(key_, dbPath); }

private:
  BlobStore& remote_;
  std::string key_;
};

// Supervised periodic backup. Every tick is best-effort; stop() cancels the
// schedule, waits for the task and the task runs one last backup on its way
// out.
class PeriodicBackup {
public:
  PeriodicBackup(SnapshotManager& snapshots, ItemStore& store, std::chrono::milliseconds interval);
  ~PeriodicBackup();

  PeriodicBackup(const PeriodicBackup&) = delete;
  PeriodicBackup& operator=(const PeriodicBackup&) = delete;

  void start();
  void stop();

  bool running() const { return running_; }
  size_t attempts() const { return attempts_; }
  size_t failures() const { return failures_; }

private:
  void run();

  SnapshotManager& snapshots_;
  ItemStore& store_;
  std::chrono::milliseconds interval_;
  CancellationToken cancel_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> attempts_{0};
  std::atomic<size_t> failures_{0};
};

} // namespace vindex
