#include <gtest/gtest.h>

#include <cmath>

#include "core/embedding/Embedder.hpp"
#include "core/errors/Error.hpp"

using namespace vindex;

namespace {

float norm(const std::vector<float>& v) {
  float s = 0.0f;
  for (float x : v) s += x * x;
  return std::sqrt(s);
}

float inner(const std::vector<float>& a, const std::vector<float>& b) {
  float s = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) s += a[i] * b[i];
  return s;
}

} // namespace

TEST(HashingEmbedderTest, ProducesUnitVectorsOfFixedLength) {
  HashingEmbedder e(64);
  const auto v = e.embedText("a red bicycle");
  ASSERT_EQ(v.size(), 64u);
  EXPECT_NEAR(norm(v), 1.0f, 1e-5);
}

TEST(HashingEmbedderTest, IsDeterministicAndCaseInsensitive) {
  HashingEmbedder e(128);
  EXPECT_EQ(e.embedText("Red Bicycle"), e.embedText("red, bicycle!"));
}

TEST(HashingEmbedderTest, ImageEmbeddingMatchesFilenameTokens) {
  HashingEmbedder e(256);
  const auto img = e.embedImage("bytes", "image/jpeg", std::string("cat.jpg"));
  const auto cat = e.embedText("cat");
  EXPECT_NEAR(inner(img, cat), 1.0f, 1e-5);
}

TEST(HashingEmbedderTest, ImageWithoutFilenameFallsBackToContentType) {
  HashingEmbedder e(32);
  const auto img = e.embedImage("bytes", "image/png", std::nullopt);
  EXPECT_EQ(img, e.embedText("image/png"));
}

TEST(HashingEmbedderTest, EmptyImageFails) {
  HashingEmbedder e(32);
  try {
    e.embedImage("", "image/png", std::string("x.png"));
    FAIL() << "expected InferenceFailed";
  } catch (const Error& err) {
    EXPECT_EQ(err.code(), ErrorCode::InferenceFailed);
  }
}

TEST(HashingEmbedderTest, ZeroDimensionIsRejected) {
  EXPECT_THROW(HashingEmbedder(0), Error);
}

TEST(HashingEmbedderTest, EmptyTextIsZeroVector) {
  HashingEmbedder e(8);
  const auto v = e.embedText("   ");
  ASSERT_EQ(v.size(), 8u);
  EXPECT_EQ(norm(v), 0.0f);
}
