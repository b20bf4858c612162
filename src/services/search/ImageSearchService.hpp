#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/store/ItemStore.hpp"

namespace vindex {

class BlobStore;
class Embedder;
class GateRegistry;

// Gate name for the embedding model; one slot per concurrent inference.
constexpr const char* kEmbeddingGate = "image_search";

struct ServiceLimits {
  size_t maxUploadBytes = 20 * 1024 * 1024;
  std::chrono::milliseconds gateTimeout{0};  // 0 = wait indefinitely
  std::chrono::seconds presignTtl{86400};
};

// Upload, search, list and delete of project-scoped images. Embedding runs
// inside the gate and outside the store lock; blob writes come first and are
// undone best-effort when anything after them fails.
class ImageSearchService {
public:
  ImageSearchService(ItemStore& store, BlobStore& blobs, Embedder& embedder,
                     GateRegistry& gates, ServiceLimits limits);

  ItemRecord registerImage(const std::string& projectId, std::string_view bytes,
                           const std::string& contentType,
                           const std::optional<std::string>& filename);
  std::vector<SearchHit> searchImages(const std::string& projectId, const std::string& query,
                                      int limit);
  std::vector<ItemRecord> listImages(const std::string& projectId);
  ItemRecord getImage(const std::string& projectId, const std::string& imageId);
  std::string imageUrl(const std::string& projectId, const std::string& imageId);
  void deleteImage(const std::string& projectId, const std::string& imageId);

  // Probes the embedder once under the gate and returns its dimension.
  static size_t probeDimension(Embedder& embedder, GateRegistry& gates);

  static std::string validateProjectId(const std::string& projectId);
  static std::string validateImageId(const std::string& imageId);
  static std::string safeSuffix(const std::optional<std::string>& filename);
  static std::string newImageId();

private:
  std::vector<float> embedGuarded(const std::function<std::vector<float>()>& fn);
  void discardBlob(const std::string& key) noexcept;

  ItemStore& store_;
  BlobStore& blobs_;
  Embedder& embedder_;
  GateRegistry& gates_;
  ServiceLimits limits_;
};

} // namespace vindex
