#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace vindex {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

bool env_truthy(const char* key, bool defval) {
  std::string v = get_env_or(key, "");
  if (v.empty()) return defval;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return v == "1" || v == "true" || v == "yes" || v == "y" || v == "on";
}

namespace {

template <class T>
T env_number(const char* key, T defval) {
  const std::string v = get_env_or(key, "");
  if (v.empty()) return defval;
  try {
    long long n = std::stoll(v);
    if (n < 0) throw std::out_of_range("negative");
    return static_cast<T>(n);
  } catch (const std::exception&) {
    spdlog::warn("ignoring invalid {}='{}'", key, v);
    return defval;
  }
}

} // namespace

Config Config::fromEnv() {
  Config c;
  c.dbPath       = get_env_or("VINDEX_DB_PATH", c.dbPath);
  c.port         = env_number<int>("VINDEX_PORT", c.port);
  c.apiKey       = get_env_or("VINDEX_API_KEY", c.apiKey);
  c.logLevel     = get_env_or("VINDEX_LOG_LEVEL", c.logLevel);

  c.blobRoot     = get_env_or("VINDEX_BLOB_ROOT", c.blobRoot);
  c.snapshotRoot = get_env_or("VINDEX_SNAPSHOT_ROOT", c.snapshotRoot);
  c.snapshotKey  = get_env_or("VINDEX_SNAPSHOT_KEY", c.snapshotKey);
  c.backupEnabled = env_truthy("VINDEX_BACKUP_ENABLED", c.backupEnabled);
  c.backupInterval = std::chrono::seconds(
    env_number<long long>("VINDEX_BACKUP_INTERVAL_SEC", c.backupInterval.count()));
  if (c.backupInterval < kMinBackupInterval) {
    spdlog::warn("backup interval {}s below floor; using {}s",
                 c.backupInterval.count(), kMinBackupInterval.count());
    c.backupInterval = kMinBackupInterval;
  }

  c.maxElements  = env_number<size_t>("VINDEX_MAX_ELEMENTS", c.maxElements);
  c.embedder     = get_env_or("VINDEX_EMBEDDER", c.embedder);
  c.embedderUrl  = get_env_or("VINDEX_EMBEDDER_URL", c.embedderUrl);
  c.embedderTimeout = std::chrono::seconds(
    env_number<long long>("VINDEX_EMBEDDER_TIMEOUT_SEC", c.embedderTimeout.count()));
  c.hashingDim   = env_number<size_t>("VINDEX_HASHING_DIM", c.hashingDim);

  c.gpuConcurrency = env_number<size_t>("VINDEX_GPU_CONCURRENCY", c.gpuConcurrency);
  c.gateTimeout  = std::chrono::milliseconds(
    env_number<long long>("VINDEX_GATE_TIMEOUT_MS", c.gateTimeout.count()));

  c.maxUploadBytes = env_number<size_t>("VINDEX_MAX_UPLOAD_BYTES", c.maxUploadBytes);
  c.publicUrl    = get_env_or("VINDEX_PUBLIC_URL", "http://localhost:" + std::to_string(c.port));
  c.presignTtl   = std::chrono::seconds(
    env_number<long long>("VINDEX_PRESIGN_TTL_SEC", c.presignTtl.count()));
  return c;
}

} // namespace vindex
