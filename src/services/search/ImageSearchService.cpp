#include "ImageSearchService.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <random>
#include <regex>

#include "core/concurrency/ConcurrencyGate.hpp"
#include "core/embedding/Embedder.hpp"
#include "core/errors/Error.hpp"
#include "core/storage/BlobStore.hpp"

namespace vindex {

namespace {

constexpr size_t kMaxQueryLength = 2000;
constexpr int kMaxSearchLimit = 100;

std::string trim(const std::string& s) {
  auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return b < e ? std::string(b, e) : std::string();
}

} // namespace

ImageSearchService::ImageSearchService(ItemStore& store, BlobStore& blobs, Embedder& embedder,
                                       GateRegistry& gates, ServiceLimits limits)
  : store_(store), blobs_(blobs), embedder_(embedder), gates_(gates), limits_(limits) {}

// -------- validation helpers --------

std::string ImageSearchService::validateProjectId(const std::string& projectId) {
  const std::string p = trim(projectId);
  if (p.empty()) throw Error(ErrorCode::InvalidArgument, "project_id is required");
  if (p.size() > 128) throw Error(ErrorCode::InvalidArgument, "project_id is too long");
  static const std::regex kProject("^[A-Za-z0-9][A-Za-z0-9._-]{0,127}$");
  if (!std::regex_match(p, kProject)) {
    throw Error(ErrorCode::InvalidArgument, "Invalid project_id format");
  }
  return p;
}

std::string ImageSearchService::validateImageId(const std::string& imageId) {
  static const std::regex kUuid(
    "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
  if (!std::regex_match(imageId, kUuid)) {
    throw Error(ErrorCode::InvalidArgument, "Invalid image id");
  }
  return imageId;
}

std::string ImageSearchService::safeSuffix(const std::optional<std::string>& filename) {
  if (!filename || filename->empty()) return ".bin";
  const std::string& f = *filename;
  const auto slash = f.find_last_of("/\\");
  const std::string base = slash == std::string::npos ? f : f.substr(slash + 1);
  const auto dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return ".bin";
  std::string suffix = base.substr(dot);
  if (suffix.size() > 16) return ".bin";
  for (size_t i = 1; i < suffix.size(); ++i) {
    if (!std::isalnum(static_cast<unsigned char>(suffix[i]))) return ".bin";
  }
  return suffix;
}

std::string ImageSearchService::newImageId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx...
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

// -------- gate + embedding --------

std::vector<float> ImageSearchService::embedGuarded(const std::function<std::vector<float>()>& fn) {
  GateGuard guard = limits_.gateTimeout.count() > 0
                      ? gates_.acquireFor(kEmbeddingGate, limits_.gateTimeout)
                      : gates_.acquire(kEmbeddingGate);
  try {
    return fn();
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw Error(ErrorCode::InferenceFailed, "Inference failed", e.what());
  }
}

size_t ImageSearchService::probeDimension(Embedder& embedder, GateRegistry& gates) {
  GateGuard guard = gates.acquire(kEmbeddingGate);
  const auto v = embedder.embedText("dimension probe");
  if (v.empty()) throw Error(ErrorCode::InferenceFailed, "embedder returned an empty probe vector");
  spdlog::info("embedder {} produces {}-dimensional vectors", embedder.name(), v.size());
  return v.size();
}

void ImageSearchService::discardBlob(const std::string& key) noexcept {
  try {
    blobs_.remove(key);
  } catch (const std::exception& e) {
    spdlog::warn("could not delete orphaned blob {}: {}", key, e.what());
  }
}

// -------- operations --------

ItemRecord ImageSearchService::registerImage(const std::string& projectId, std::string_view bytes,
                                             const std::string& contentType,
                                             const std::optional<std::string>& filename) {
  const std::string project = validateProjectId(projectId);
  if (contentType.rfind("image/", 0) != 0) {
    throw Error(ErrorCode::UnsupportedMedia, "Only image/* uploads are allowed");
  }
  if (bytes.empty()) throw Error(ErrorCode::InvalidArgument, "Uploaded file is empty");
  if (bytes.size() > limits_.maxUploadBytes) {
    throw Error(ErrorCode::PayloadTooLarge, "Uploaded file is too large");
  }

  ItemRecord rec;
  rec.project_id        = project;
  rec.item_id           = newImageId();
  rec.blob_key          = project + "/" + rec.item_id + safeSuffix(filename);
  rec.content_type      = contentType;
  rec.original_filename = filename;
  rec.size_bytes        = static_cast<int64_t>(bytes.size());

  blobs_.put(rec.blob_key, bytes);
  try {
    const auto vec = embedGuarded([&] { return embedder_.embedImage(bytes, contentType, filename); });
    store_.upsertItem(rec, vec);
  } catch (const std::exception& e) {
    spdlog::error("register {}/{} failed: {}", project, rec.item_id, e.what());
    discardBlob(rec.blob_key);
    throw;
  }
  spdlog::info("registered {}/{} ({} bytes)", project, rec.item_id, rec.size_bytes);
  return rec;
}

std::vector<SearchHit> ImageSearchService::searchImages(const std::string& projectId,
                                                        const std::string& query, int limit) {
  const std::string project = validateProjectId(projectId);
  if (query.empty() || query.size() > kMaxQueryLength) {
    throw Error(ErrorCode::InvalidArgument, "query must be 1..2000 characters");
  }
  if (limit < 1 || limit > kMaxSearchLimit) {
    throw Error(ErrorCode::InvalidArgument, "limit must be between 1 and 100");
  }
  if (!store_.projectExists(project)) throw Error(ErrorCode::NotFound, "Project not found");

  const auto vec = embedGuarded([&] { return embedder_.embedText(query); });
  return store_.search(project, vec, static_cast<size_t>(limit));
}

std::vector<ItemRecord> ImageSearchService::listImages(const std::string& projectId) {
  const std::string project = validateProjectId(projectId);
  if (!store_.projectExists(project)) throw Error(ErrorCode::NotFound, "Project not found");
  return store_.listRecords(project);
}

ItemRecord ImageSearchService::getImage(const std::string& projectId, const std::string& imageId) {
  const std::string project = validateProjectId(projectId);
  auto rec = store_.getRecord(project, validateImageId(imageId));
  if (!rec) throw Error(ErrorCode::NotFound, "Image not found");
  return *rec;
}

std::string ImageSearchService::imageUrl(const std::string& projectId, const std::string& imageId) {
  const ItemRecord rec = getImage(projectId, imageId);
  return blobs_.presignedUrl(rec.blob_key, limits_.presignTtl);
}

void ImageSearchService::deleteImage(const std::string& projectId, const std::string& imageId) {
  const std::string project = validateProjectId(projectId);
  ItemRecord removed;
  if (!store_.deleteItem(project, validateImageId(imageId), &removed)) {
    throw Error(ErrorCode::NotFound, "Image not found");
  }
  if (!removed.blob_key.empty()) discardBlob(removed.blob_key);
  spdlog::info("deleted {}/{}", project, imageId);
}

} // namespace vindex
