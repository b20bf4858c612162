#pragma once
#include <chrono>
#include <string>

#include "core/embedding/Embedder.hpp"

namespace vindex {

// Client for an external inference service:
//   POST /embed/text   {"text": "..."}            -> {"embedding": [...]}
//   POST /embed/image  <raw bytes, Content-Type>  -> {"embedding": [...]}
class HttpEmbedder : public Embedder {
public:
  HttpEmbedder(std::string baseUrl, std::chrono::seconds timeout);

  std::string name() const override { return "http(" + baseUrl_ + ")"; }
  std::vector<float> embedText(const std::string& text) override;
  std::vector<float> embedImage(std::string_view bytes,
                                const std::string& contentType,
                                const std::optional<std::string>& filename) override;

private:
  std::vector<float> post(const std::string& path, const std::string& body,
                          const std::string& contentType,
                          const std::optional<std::string>& filename);

  std::string baseUrl_;
  std::chrono::seconds timeout_;
};

} // namespace vindex
