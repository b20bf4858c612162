#include "Embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

#include "core/errors/Error.hpp"

namespace vindex {

namespace {

// FNV-1a; std::hash is not stable across standard libraries and the vectors
// end up on disk.
uint64_t fnv1a(const std::string& s) {
  uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

} // namespace

HashingEmbedder::HashingEmbedder(size_t dim) : dim_(dim) {
  if (dim_ == 0) throw Error(ErrorCode::InvalidArgument, "hashing embedder dimension must be >= 1");
}

std::vector<float> HashingEmbedder::embedText(const std::string& text) {
  std::vector<float> vec(dim_, 0.0f);

  // Tokenize: lowercase, split on non-alphanumeric
  std::string token;
  auto flush = [&] {
    if (!token.empty()) {
      vec[fnv1a(token) % dim_] += 1.0f;
      token.clear();
    }
  };
  for (char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else {
      flush();
    }
  }
  flush();

  // L2-normalize
  float norm = 0.0f;
  for (float v : vec) norm += v * v;
  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float& v : vec) v /= norm;
  }
  return vec;
}

std::vector<float> HashingEmbedder::embedImage(std::string_view bytes,
                                               const std::string& contentType,
                                               const std::optional<std::string>& filename) {
  if (bytes.empty()) throw Error(ErrorCode::InferenceFailed, "cannot embed an empty image");
  std::string text = filename.value_or("");
  // Drop the extension so "cat.jpg" and the query "cat" share a token.
  if (auto dot = text.rfind('.'); dot != std::string::npos) text.resize(dot);
  if (text.empty()) text = contentType;
  return embedText(text);
}

} // namespace vindex
