#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace vindex {

// Shorter intervals are raised to this to keep snapshot churn down.
constexpr std::chrono::seconds kMinBackupInterval{60};

struct Config {
  std::string dbPath       = "data/vindex.db";
  int         port         = 8080;
  std::string apiKey;                         // empty = auth disabled
  std::string logLevel     = "info";

  std::string blobRoot     = "data/blobs";
  std::string snapshotRoot = "data/snapshots";
  std::string snapshotKey  = "vectordb/vindex.db";
  bool        backupEnabled = false;
  std::chrono::seconds backupInterval{300};

  size_t      maxElements  = 100000;
  std::string embedder     = "hashing";       // "hashing" | "http"
  std::string embedderUrl;
  std::chrono::seconds embedderTimeout{60};
  size_t      hashingDim   = 512;

  size_t      gpuConcurrency = 1;
  std::chrono::milliseconds gateTimeout{0};   // 0 = wait indefinitely

  size_t      maxUploadBytes = 20 * 1024 * 1024;
  std::string publicUrl;                      // default http://localhost:<port>
  std::chrono::seconds presignTtl{86400};

  // Reads VINDEX_* variables; unparseable numbers keep their defaults.
  static Config fromEnv();
};

std::string get_env_or(const char* key, const std::string& defval);
bool env_truthy(const char* key, bool defval);

} // namespace vindex
