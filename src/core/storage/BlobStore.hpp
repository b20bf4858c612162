#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace vindex {

// Object storage seen by the index: it only ever keeps keys, never bytes.
class BlobStore {
public:
  virtual ~BlobStore() = default;

  virtual void put(const std::string& key, std::string_view bytes) = 0;
  // Throws NotFound for a missing key.
  virtual std::string get(const std::string& key) = 0;
  // Missing keys are ignored.
  virtual void remove(const std::string& key) = 0;
  virtual bool exists(const std::string& key) = 0;
  virtual std::string presignedUrl(const std::string& key, std::chrono::seconds ttl) = 0;
};

} // namespace vindex
