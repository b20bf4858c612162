#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "BlobStore.hpp"

namespace vindex {

// Blob store over a directory tree; key "a/b.jpg" lives at <root>/a/b.jpg.
// publicBaseUrl, when set, is the HTTP origin serving /v1/blobs/<key>.
class LocalFSBackend : public BlobStore {
public:
  explicit LocalFSBackend(std::string root, std::string publicBaseUrl = {});

  void put(const std::string& key, std::string_view bytes) override;
  std::string get(const std::string& key) override;
  void remove(const std::string& key) override;
  bool exists(const std::string& key) override;
  std::string presignedUrl(const std::string& key, std::chrono::seconds ttl) override;

  const std::string& root() const { return root_; }
  // Throws InvalidArgument for keys that are empty, absolute or escape root.
  std::filesystem::path pathFor(const std::string& key) const;

private:
  std::string root_;
  std::string publicBaseUrl_;
};

} // namespace vindex
