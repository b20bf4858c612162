#include <gtest/gtest.h>

#include <filesystem>
#include <thread>
#include <vector>

#include "TestUtil.hpp"
#include "core/errors/Error.hpp"
#include "core/storage/LocalFSBackend.hpp"

using namespace vindex;
using vindex::test::TempDir;
namespace fs = std::filesystem;

namespace {

size_t files_under(const fs::path& root) {
  size_t n = 0;
  for (const auto& e : fs::recursive_directory_iterator(root)) {
    if (e.is_regular_file()) ++n;
  }
  return n;
}

} // namespace

TEST(LocalFSBackendTest, PutGetRemove) {
  TempDir dir;
  LocalFSBackend blobs(dir.file("blobs"));
  const std::string bytes("\x89PNG\0\x01\x02", 7);

  blobs.put("proj/img.png", bytes);
  EXPECT_TRUE(blobs.exists("proj/img.png"));
  EXPECT_EQ(blobs.get("proj/img.png"), bytes);
  EXPECT_EQ(files_under(dir.path() / "blobs"), 1u);

  blobs.put("proj/img.png", "replaced");
  EXPECT_EQ(blobs.get("proj/img.png"), "replaced");

  blobs.remove("proj/img.png");
  EXPECT_FALSE(blobs.exists("proj/img.png"));
  EXPECT_NO_THROW(blobs.remove("proj/img.png"));
}

TEST(LocalFSBackendTest, MissingKeyIsNotFound) {
  TempDir dir;
  LocalFSBackend blobs(dir.file("blobs"));
  try {
    blobs.get("nope/missing.jpg");
    FAIL() << "expected NotFound";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::NotFound);
  }
}

TEST(LocalFSBackendTest, RejectsKeysOutsideRoot) {
  TempDir dir;
  LocalFSBackend blobs(dir.file("blobs"));
  for (const char* key : {"", "/etc/passwd", "../escape", "a/../../b", "a/./b", "a\\b"}) {
    EXPECT_THROW(blobs.pathFor(key), Error) << key;
  }
  EXPECT_THROW(blobs.put("../x", "data"), Error);
  EXPECT_NO_THROW(blobs.pathFor("proj/nested/file.jpg"));
}

TEST(LocalFSBackendTest, PresignedUrlCarriesExpiry) {
  TempDir dir;
  LocalFSBackend blobs(dir.file("blobs"), "http://example.test:8080/");
  blobs.put("p/a b.jpg", "x");

  const std::string url = blobs.presignedUrl("p/a b.jpg", std::chrono::seconds(60));
  EXPECT_EQ(url.rfind("http://example.test:8080/v1/blobs/p/a%20b.jpg?expires=", 0), 0u) << url;
  EXPECT_THROW(blobs.presignedUrl("p/a b.jpg", std::chrono::seconds(0)), Error);
}

TEST(LocalFSBackendTest, PresignedUrlWithoutPublicBaseIsFileUrl) {
  TempDir dir;
  LocalFSBackend blobs(dir.file("blobs"));
  blobs.put("p/x.jpg", "x");
  const std::string url = blobs.presignedUrl("p/x.jpg", std::chrono::seconds(60));
  EXPECT_EQ(url.rfind("file://", 0), 0u) << url;
}

TEST(LocalFSBackendTest, ConcurrentWritersToOneKeyLeaveOneWholeBlob) {
  TempDir dir;
  LocalFSBackend blobs(dir.file("blobs"));
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&blobs, t] {
      const std::string body(4096, static_cast<char>('a' + t));
      for (int i = 0; i < 20; ++i) blobs.put("shared/key.bin", body);
    });
  }
  for (auto& w : writers) w.join();

  const std::string got = blobs.get("shared/key.bin");
  ASSERT_EQ(got.size(), 4096u);
  EXPECT_EQ(got.find_first_not_of(got[0]), std::string::npos);
  EXPECT_EQ(files_under(dir.path() / "blobs"), 1u);
}
