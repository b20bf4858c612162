#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vindex {

// Produces fixed-length embeddings. Implementations throw
// Error{InferenceFailed} when the model cannot answer. Calls may block for a
// long time and must be made inside a gate guard, never under the store lock.
class Embedder {
public:
  virtual ~Embedder() = default;

  virtual std::string name() const = 0;
  virtual std::vector<float> embedText(const std::string& text) = 0;
  virtual std::vector<float> embedImage(std::string_view bytes,
                                        const std::string& contentType,
                                        const std::optional<std::string>& filename) = 0;
};

// Hashing-trick bag of words, L2-normalized. Runs offline; images are
// embedded from the tokens of their filename. Meant for development and tests.
class HashingEmbedder : public Embedder {
public:
  explicit HashingEmbedder(size_t dim);

  std::string name() const override { return "hashing"; }
  std::vector<float> embedText(const std::string& text) override;
  std::vector<float> embedImage(std::string_view bytes,
                                const std::string& contentType,
                                const std::optional<std::string>& filename) override;

private:
  size_t dim_;
};

} // namespace vindex
