#include <gtest/gtest.h>

#include <limits>
#include <random>
#include <set>
#include <thread>
#include <vector>

#include "TestUtil.hpp"
#include "core/errors/Error.hpp"
#include "core/metadata/Sqlite.hpp"
#include "core/store/ItemStore.hpp"

using namespace vindex;
using vindex::test::TempDir;

namespace {

ItemRecord make_record(const std::string& project, const std::string& item,
                       int64_t size = 100) {
  ItemRecord r;
  r.project_id = project;
  r.item_id = item;
  r.blob_key = project + "/" + item + ".jpg";
  r.content_type = "image/jpeg";
  r.original_filename = item + ".jpg";
  r.size_bytes = size;
  return r;
}

std::vector<float> random_vec(std::mt19937& rng, size_t dim) {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto& x : v) x = dist(rng);
  return v;
}

int64_t internal_id_of(const std::string& dbPath, const std::string& project, const std::string& item) {
  SqliteConnection db(dbPath, false);
  SqliteStatement st(db, "SELECT internal_id FROM identity_mapping WHERE project_id = ? AND item_id = ?");
  st.bind(1, project);
  st.bind(2, item);
  return st.step() ? st.columnInt64(0) : -1;
}

} // namespace

class ItemStoreTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string dbPath = dir.file("store.db");
};

TEST_F(ItemStoreTest, ExampleScenario) {
  ItemStore store(dbPath, 2, 100);
  ItemRecord rec = make_record("demo", "img-1", 1234);
  rec.blob_key = "demo/img-1.jpg";
  rec.original_filename.reset();
  store.upsertItem(rec, {1.0f, 0.0f});

  auto hits = store.search("demo", {0.9f, 0.1f}, 5);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].record.item_id, "img-1");
  EXPECT_NEAR(hits[0].score, 0.9939f, 1e-3);
}

TEST_F(ItemStoreTest, UpsertThenGetAndSearchRoundTrip) {
  ItemStore store(dbPath, 4, 100);
  const ItemRecord rec = make_record("p1", "item-a", 4321);
  const std::vector<float> emb = {0.5f, -1.0f, 2.0f, 0.25f};
  store.upsertItem(rec, emb);
  store.upsertItem(make_record("p1", "item-b"), {-0.5f, 1.0f, 0.0f, 0.0f});

  auto got = store.getRecord("p1", "item-a");
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, rec);

  auto hits = store.search("p1", emb, 2);
  ASSERT_FALSE(hits.empty());
  EXPECT_EQ(hits[0].record.item_id, "item-a");
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-4);
}

TEST_F(ItemStoreTest, NullFilenameRoundTrips) {
  ItemStore store(dbPath, 2, 10);
  ItemRecord rec = make_record("p", "x");
  rec.original_filename.reset();
  store.upsertItem(rec, {1.0f, 2.0f});
  auto got = store.getRecord("p", "x");
  ASSERT_TRUE(got.has_value());
  EXPECT_FALSE(got->original_filename.has_value());
}

TEST_F(ItemStoreTest, ProjectsAreIsolated) {
  ItemStore store(dbPath, 2, 100);
  store.upsertItem(make_record("a", "one"), {1.0f, 0.0f});
  store.upsertItem(make_record("a", "two"), {0.0f, 1.0f});
  store.upsertItem(make_record("b", "three"), {1.0f, 0.0f});

  auto hits = store.search("b", {1.0f, 0.0f}, 10);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].record.item_id, "three");

  auto listed = store.listRecords("b");
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].project_id, "b");
  EXPECT_EQ(store.listRecords("a").size(), 2u);
  EXPECT_FALSE(store.getRecord("b", "one").has_value());
}

TEST_F(ItemStoreTest, ListIsOrderedByItemId) {
  ItemStore store(dbPath, 2, 100);
  store.upsertItem(make_record("p", "charlie"), {1.0f, 0.0f});
  store.upsertItem(make_record("p", "alpha"), {1.0f, 0.0f});
  store.upsertItem(make_record("p", "bravo"), {1.0f, 0.0f});

  auto listed = store.listRecords("p");
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_EQ(listed[0].item_id, "alpha");
  EXPECT_EQ(listed[1].item_id, "bravo");
  EXPECT_EQ(listed[2].item_id, "charlie");
}

TEST_F(ItemStoreTest, ProjectExistsOnlyAfterFirstUpsert) {
  ItemStore store(dbPath, 2, 100);
  EXPECT_FALSE(store.projectExists("p"));
  store.upsertItem(make_record("p", "x"), {1.0f, 0.0f});
  EXPECT_TRUE(store.projectExists("p"));

  // Emptying a project keeps it registered.
  EXPECT_TRUE(store.deleteItem("p", "x"));
  EXPECT_TRUE(store.projectExists("p"));
  EXPECT_TRUE(store.listRecords("p").empty());
  EXPECT_TRUE(store.search("p", {1.0f, 0.0f}, 5).empty());
}

TEST_F(ItemStoreTest, DeleteIsIdempotent) {
  ItemStore store(dbPath, 2, 100);
  store.upsertItem(make_record("p", "keep"), {1.0f, 0.0f});
  const auto before = store.stats();

  EXPECT_FALSE(store.deleteItem("p", "missing"));
  EXPECT_FALSE(store.deleteItem("nope", "missing"));
  const auto after = store.stats();
  EXPECT_EQ(before.items, after.items);
  EXPECT_EQ(before.indexed, after.indexed);
  EXPECT_EQ(before.projects, after.projects);

  store.upsertItem(make_record("p", "gone"), {0.0f, 1.0f});
  ItemRecord removed;
  EXPECT_TRUE(store.deleteItem("p", "gone", &removed));
  EXPECT_EQ(removed.blob_key, "p/gone.jpg");
  EXPECT_FALSE(store.deleteItem("p", "gone"));
  EXPECT_FALSE(store.getRecord("p", "gone").has_value());
  EXPECT_EQ(store.stats().indexed, 1u);
}

TEST_F(ItemStoreTest, DimensionMismatchLeavesStoreUnchanged) {
  ItemStore store(dbPath, 3, 100);
  try {
    store.upsertItem(make_record("p", "bad"), {1.0f, 0.0f, 0.0f, 0.0f});
    FAIL() << "expected DimensionMismatch";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::DimensionMismatch);
  }
  EXPECT_FALSE(store.getRecord("p", "bad").has_value());
  EXPECT_FALSE(store.projectExists("p"));
  const auto s = store.stats();
  EXPECT_EQ(s.items, 0);
  EXPECT_EQ(s.indexed, 0u);
}

TEST_F(ItemStoreTest, CapacityExceededRollsBack) {
  ItemStore store(dbPath, 2, 1);
  store.upsertItem(make_record("p", "first"), {1.0f, 0.0f});
  try {
    store.upsertItem(make_record("q", "second"), {0.0f, 1.0f});
    FAIL() << "expected CapacityExceeded";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::CapacityExceeded);
  }
  EXPECT_FALSE(store.projectExists("q"));
  EXPECT_EQ(store.stats().items, 1);
  // Replacing an existing item still works when full.
  EXPECT_NO_THROW(store.upsertItem(make_record("p", "first", 7), {0.0f, 1.0f}));
  EXPECT_EQ(store.getRecord("p", "first")->size_bytes, 7);
}

TEST_F(ItemStoreTest, UpsertReplacesRecordAndVectorKeepingId) {
  ItemStore store(dbPath, 2, 100);
  store.upsertItem(make_record("p", "x", 1), {1.0f, 0.0f});
  const int64_t id1 = internal_id_of(dbPath, "p", "x");
  store.upsertItem(make_record("p", "x", 2), {0.0f, 1.0f});
  const int64_t id2 = internal_id_of(dbPath, "p", "x");

  EXPECT_EQ(id1, id2);
  EXPECT_EQ(store.getRecord("p", "x")->size_bytes, 2);
  EXPECT_EQ(store.stats().indexed, 1u);
  auto hits = store.search("p", {0.0f, 1.0f}, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-4);
}

TEST_F(ItemStoreTest, InternalIdsAreNeverReused) {
  ItemStore store(dbPath, 2, 100);
  store.upsertItem(make_record("p", "x"), {1.0f, 0.0f});
  const int64_t first = internal_id_of(dbPath, "p", "x");
  ASSERT_TRUE(store.deleteItem("p", "x"));
  store.upsertItem(make_record("p", "x"), {1.0f, 0.0f});
  EXPECT_GT(internal_id_of(dbPath, "p", "x"), first);
}

TEST_F(ItemStoreTest, RebuildFromLedgerRestoresSameResults) {
  ItemStore store(dbPath, 8, 1000);
  std::mt19937 rng(7);
  for (int i = 0; i < 40; ++i) {
    store.upsertItem(make_record(i % 2 ? "odd" : "even", "item-" + std::to_string(i)),
                     random_vec(rng, 8));
  }
  const auto query = random_vec(rng, 8);
  const auto before = store.search("even", query, 5);
  ASSERT_EQ(before.size(), 5u);

  store.clearIndex();
  EXPECT_EQ(store.stats().indexed, 0u);
  EXPECT_EQ(store.stats().items, 40);
  EXPECT_EQ(store.rebuildFromLedger(), 40u);

  const auto after = store.search("even", query, 5);
  ASSERT_EQ(after.size(), before.size());
  for (size_t i = 1; i < after.size(); ++i) EXPECT_GE(after[i - 1].score, after[i].score);
  std::set<std::string> want, got;
  for (size_t i = 0; i < before.size(); ++i) {
    want.insert(before[i].record.item_id);
    got.insert(after[i].record.item_id);
    EXPECT_NEAR(after[i].score, before[i].score, 1e-4);
  }
  EXPECT_EQ(got, want);
}

TEST_F(ItemStoreTest, SearchRebuildsAnEmptyIndex) {
  ItemStore store(dbPath, 2, 10);
  store.upsertItem(make_record("p", "x"), {1.0f, 0.0f});
  store.clearIndex();
  auto hits = store.search("p", {1.0f, 0.0f}, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].record.item_id, "x");
}

TEST_F(ItemStoreTest, ReopenRebuildsIndexFromDisk) {
  {
    ItemStore store(dbPath, 2, 10);
    store.upsertItem(make_record("p", "x"), {1.0f, 0.0f});
    store.upsertItem(make_record("p", "y"), {0.0f, 1.0f});
  }
  ItemStore reopened(dbPath, 2, 10);
  EXPECT_FALSE(reopened.schemaStatus().reset);
  EXPECT_EQ(reopened.stats().indexed, 2u);
  auto hits = reopened.search("p", {0.0f, 1.0f}, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].record.item_id, "y");
}

TEST_F(ItemStoreTest, ZeroKReturnsEmpty) {
  ItemStore store(dbPath, 2, 10);
  store.upsertItem(make_record("p", "x"), {1.0f, 0.0f});
  EXPECT_TRUE(store.search("p", {1.0f, 0.0f}, 0).empty());
  EXPECT_TRUE(store.search("unknown", {1.0f, 0.0f}, 3).empty());
}

TEST_F(ItemStoreTest, ConcurrentWritersAreSerialized) {
  ItemStore store(dbPath, 4, 1000);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t] {
      std::mt19937 rng(t);
      for (int i = 0; i < 25; ++i) {
        store.upsertItem(make_record("p", "t" + std::to_string(t) + "-" + std::to_string(i)),
                         random_vec(rng, 4));
      }
    });
  }
  for (auto& th : threads) th.join();

  const auto s = store.stats();
  EXPECT_EQ(s.items, 100);
  EXPECT_EQ(s.indexed, 100u);
  EXPECT_EQ(store.listRecords("p").size(), 100u);
}

TEST_F(ItemStoreTest, WritesAfterClearingIndexDoNotHideOlderItems) {
  ItemStore store(dbPath, 2, 10);
  store.upsertItem(make_record("p", "a"), {1.0f, 0.0f});
  store.upsertItem(make_record("p", "b"), {0.9f, 0.1f});
  store.clearIndex();
  store.upsertItem(make_record("p", "c"), {0.8f, 0.2f});

  auto hits = store.search("p", {1.0f, 0.0f}, 5);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].record.item_id, "a");
  EXPECT_EQ(hits[1].record.item_id, "b");
  EXPECT_EQ(hits[2].record.item_id, "c");
  EXPECT_EQ(store.stats().indexed, 3u);
}

TEST_F(ItemStoreTest, ReopenWithSmallerCapacityKeepsEveryItem) {
  {
    ItemStore store(dbPath, 2, 10);
    store.upsertItem(make_record("p", "a"), {1.0f, 0.0f});
    store.upsertItem(make_record("p", "b"), {0.0f, 1.0f});
    store.upsertItem(make_record("p", "c"), {1.0f, 1.0f});
  }
  ItemStore shrunk(dbPath, 2, 2);
  EXPECT_EQ(shrunk.stats().indexed, 3u);
  EXPECT_EQ(shrunk.search("p", {1.0f, 0.0f}, 5).size(), 3u);

  // Over the limit: replacements work, new items are refused.
  EXPECT_NO_THROW(shrunk.upsertItem(make_record("p", "a", 9), {1.0f, 0.0f}));
  try {
    shrunk.upsertItem(make_record("p", "d"), {0.5f, 0.5f});
    FAIL() << "expected CapacityExceeded";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::CapacityExceeded);
  }
  EXPECT_TRUE(shrunk.deleteItem("p", "a"));
  EXPECT_TRUE(shrunk.deleteItem("p", "b"));
  EXPECT_NO_THROW(shrunk.upsertItem(make_record("p", "d"), {0.5f, 0.5f}));
}

TEST_F(ItemStoreTest, NonFiniteEmbeddingsAreRejected) {
  ItemStore store(dbPath, 2, 10);
  const float nan = std::numeric_limits<float>::quiet_NaN();
  try {
    store.upsertItem(make_record("p", "x"), {nan, 1.0f});
    FAIL() << "expected InvalidArgument";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
  }
  EXPECT_FALSE(store.projectExists("p"));
  EXPECT_EQ(store.stats().items, 0);

  store.upsertItem(make_record("p", "y"), {1.0f, 0.0f});
  EXPECT_THROW(store.search("p", {std::numeric_limits<float>::infinity(), 0.0f}, 1), Error);
}
