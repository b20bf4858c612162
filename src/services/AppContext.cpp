#include "AppContext.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>

#include "core/errors/Error.hpp"
#include "services/inference/HttpEmbedder.hpp"

namespace vindex {

namespace {

void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

} // namespace

std::unique_ptr<Embedder> make_embedder(const Config& cfg) {
  if (cfg.embedder == "hashing") return std::make_unique<HashingEmbedder>(cfg.hashingDim);
  if (cfg.embedder == "http") return std::make_unique<HttpEmbedder>(cfg.embedderUrl, cfg.embedderTimeout);
  throw Error(ErrorCode::InvalidArgument, "unknown VINDEX_EMBEDDER '" + cfg.embedder + "'");
}

AppContext::AppContext(const Config& cfg) : cfg_(cfg) {
  embedder_ = make_embedder(cfg_);
  init();
}

AppContext::AppContext(const Config& cfg, std::unique_ptr<Embedder> embedder)
  : cfg_(cfg), embedder_(std::move(embedder)) {
  if (!embedder_) throw Error(ErrorCode::InvalidArgument, "embedder is required");
  init();
}

AppContext::~AppContext() {
  shutdown();
}

void AppContext::init() {
  gates_.registerGate(kEmbeddingGate, cfg_.gpuConcurrency);
  const size_t dim = ImageSearchService::probeDimension(*embedder_, gates_);

  blobs_ = std::make_unique<LocalFSBackend>(cfg_.blobRoot, cfg_.publicUrl);

  ensure_dirs_for(cfg_.dbPath);
  if (cfg_.backupEnabled) {
    snapshotStore_ = std::make_unique<LocalFSBackend>(cfg_.snapshotRoot);
    snapshots_ = std::make_unique<SnapshotManager>(*snapshotStore_, cfg_.snapshotKey);
    restoreOutcome_ = snapshots_->restoreIfMissing(cfg_.dbPath);
    spdlog::info("snapshot restore: {}", outcome_name(restoreOutcome_));
  }

  store_ = std::make_unique<ItemStore>(cfg_.dbPath, dim, cfg_.maxElements);
  if (store_->schemaStatus().reset) {
    spdlog::warn("store {} was reset because its schema changed", cfg_.dbPath);
  }

  if (snapshots_) {
    backup_ = std::make_unique<PeriodicBackup>(
      *snapshots_, *store_, std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.backupInterval));
    backup_->start();
  }

  ServiceLimits limits;
  limits.maxUploadBytes = cfg_.maxUploadBytes;
  limits.gateTimeout    = cfg_.gateTimeout;
  limits.presignTtl     = cfg_.presignTtl;
  images_ = std::make_unique<ImageSearchService>(*store_, *blobs_, *embedder_, gates_, limits);

  const auto s = store_->stats();
  spdlog::info("store ready: {} projects, {} items, dim {}", s.projects, s.items, s.dimension);
}

void AppContext::shutdown() {
  if (backup_) {
    backup_->stop();
    backup_.reset();
  }
}

} // namespace vindex
