#include "HttpEmbedder.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/Error.hpp"

using nlohmann::json;

namespace vindex {

HttpEmbedder::HttpEmbedder(std::string baseUrl, std::chrono::seconds timeout)
  : baseUrl_(std::move(baseUrl)), timeout_(timeout) {
  while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
  if (baseUrl_.empty()) {
    throw Error(ErrorCode::InvalidArgument, "embedder URL is required for the http embedder");
  }
}

std::vector<float> HttpEmbedder::embedText(const std::string& text) {
  return post("/embed/text", json({{"text", text}}).dump(), "application/json", std::nullopt);
}

std::vector<float> HttpEmbedder::embedImage(std::string_view bytes,
                                            const std::string& contentType,
                                            const std::optional<std::string>& filename) {
  return post("/embed/image", std::string(bytes), contentType, filename);
}

std::vector<float> HttpEmbedder::post(const std::string& path, const std::string& body,
                                      const std::string& contentType,
                                      const std::optional<std::string>& filename) {
  // One client per call: calls arrive from several request threads.
  httplib::Client cli(baseUrl_);
  cli.set_connection_timeout(std::chrono::seconds(10));
  cli.set_read_timeout(timeout_);
  cli.set_write_timeout(timeout_);

  httplib::Headers headers;
  if (filename) headers.emplace("X-Filename", *filename);

  auto res = cli.Post(path, headers, body, contentType);
  if (!res) {
    throw Error(ErrorCode::InferenceFailed,
                "inference request " + path + " failed: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    spdlog::error("inference {} returned {}: {}", path, res->status, res->body);
    throw Error(ErrorCode::InferenceFailed,
                "inference " + path + " returned HTTP " + std::to_string(res->status));
  }

  try {
    json j = json::parse(res->body);
    if (!j.contains("embedding") || !j["embedding"].is_array()) {
      throw Error(ErrorCode::InferenceFailed, "inference response has no embedding array");
    }
    auto vec = j["embedding"].get<std::vector<float>>();
    if (vec.empty()) throw Error(ErrorCode::InferenceFailed, "inference returned an empty embedding");
    return vec;
  } catch (const json::exception& e) {
    throw Error(ErrorCode::InferenceFailed, std::string("invalid inference response: ") + e.what());
  }
}

} // namespace vindex
