#include "LocalFSBackend.hpp"

#include <cctype>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include "core/errors/Error.hpp"

namespace vindex {

namespace fs = std::filesystem;

namespace {

std::string url_encode_path(const std::string& s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += k[(c >> 4) & 0xF];
      out += k[c & 0xF];
    }
  }
  return out;
}

} // namespace

LocalFSBackend::LocalFSBackend(std::string root, std::string publicBaseUrl)
  : root_(std::move(root)), publicBaseUrl_(std::move(publicBaseUrl)) {
  fs::create_directories(root_);
  while (!publicBaseUrl_.empty() && publicBaseUrl_.back() == '/') publicBaseUrl_.pop_back();
}

fs::path LocalFSBackend::pathFor(const std::string& key) const {
  if (key.empty() || key.front() == '/' || key.find('\\') != std::string::npos) {
    throw Error(ErrorCode::InvalidArgument, "invalid blob key: '" + key + "'");
  }
  fs::path rel(key);
  for (const auto& part : rel) {
    if (part == ".." || part == ".") {
      throw Error(ErrorCode::InvalidArgument, "invalid blob key: '" + key + "'");
    }
  }
  return fs::path(root_) / rel;
}

void LocalFSBackend::put(const std::string& key, std::string_view bytes) {
  const fs::path file = pathFor(key);
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  if (ec) throw Error(ErrorCode::StorageIO, "mkdir " + file.parent_path().string() + ": " + ec.message());

  // Write beside the target and rename so readers never see a partial blob.
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  fs::path tmp = file;
  tmp += ".part-" + std::to_string(rng());
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw Error(ErrorCode::StorageIO, "write failed: " + tmp.string());
  }
  fs::rename(tmp, file, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw Error(ErrorCode::StorageIO, "rename failed: " + file.string());
  }
}

std::string LocalFSBackend::get(const std::string& key) {
  const fs::path file = pathFor(key);
  std::ifstream in(file, std::ios::binary);
  if (!in) throw Error(ErrorCode::NotFound, "blob not found: " + key);
  std::ostringstream buf; buf << in.rdbuf();
  if (in.bad()) throw Error(ErrorCode::StorageIO, "read failed: " + file.string());
  return buf.str();
}

void LocalFSBackend::remove(const std::string& key) {
  std::error_code ec;
  fs::remove(pathFor(key), ec);
  if (ec) throw Error(ErrorCode::StorageIO, "delete failed for " + key + ": " + ec.message());
}

bool LocalFSBackend::exists(const std::string& key) {
  std::error_code ec;
  return fs::is_regular_file(pathFor(key), ec);
}

std::string LocalFSBackend::presignedUrl(const std::string& key, std::chrono::seconds ttl) {
  if (ttl.count() < 1) throw Error(ErrorCode::InvalidArgument, "presign ttl must be >= 1s");
  const fs::path file = pathFor(key);
  if (publicBaseUrl_.empty()) {
    return "file://" + fs::weakly_canonical(file).string();
  }
  const int64_t expires = static_cast<int64_t>(std::time(nullptr)) + ttl.count();
  return publicBaseUrl_ + "/v1/blobs/" + url_encode_path(key) + "?expires=" + std::to_string(expires);
}

} // namespace vindex
