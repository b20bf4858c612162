#pragma once
#include <memory>

#include "core/concurrency/ConcurrencyGate.hpp"
#include "core/config/Config.hpp"
#include "core/embedding/Embedder.hpp"
#include "core/snapshot/SnapshotManager.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/ItemStore.hpp"
#include "services/search/ImageSearchService.hpp"

namespace vindex {

// Everything a request handler needs, built once at startup in dependency
// order and torn down explicitly by shutdown().
class AppContext {
public:
  explicit AppContext(const Config& cfg);
  // Uses the given embedder instead of building one from cfg.
  AppContext(const Config& cfg, std::unique_ptr<Embedder> embedder);
  ~AppContext();

  AppContext(const AppContext&) = delete;
  AppContext& operator=(const AppContext&) = delete;

  const Config& config() const { return cfg_; }
  GateRegistry& gates() { return gates_; }
  Embedder& embedder() { return *embedder_; }
  ItemStore& store() { return *store_; }
  LocalFSBackend& blobs() { return *blobs_; }
  ImageSearchService& images() { return *images_; }
  SnapshotManager* snapshots() { return snapshots_.get(); }
  RestoreOutcome restoreOutcome() const { return restoreOutcome_; }
  bool backupRunning() const { return backup_ && backup_->running(); }

  // Stops the periodic backup (running its final snapshot). Idempotent.
  void shutdown();

private:
  void init();

  Config cfg_;
  GateRegistry gates_;
  std::unique_ptr<Embedder> embedder_;
  std::unique_ptr<LocalFSBackend> blobs_;
  std::unique_ptr<LocalFSBackend> snapshotStore_;
  std::unique_ptr<SnapshotManager> snapshots_;
  std::unique_ptr<ItemStore> store_;
  std::unique_ptr<PeriodicBackup> backup_;
  std::unique_ptr<ImageSearchService> images_;
  RestoreOutcome restoreOutcome_ = RestoreOutcome::SkippedLocalExists;
};

std::unique_ptr<Embedder> make_embedder(const Config& cfg);

} // namespace vindex
