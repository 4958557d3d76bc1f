// File: tests/test_table_dir_source.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "compchat/adapters/table_dir/caching_dataset_source.hpp"
#include "compchat/adapters/table_dir/table_dir_source.hpp"
#include "temp_dir.hpp"
#include "test_doubles.hpp"

using namespace compchat;
using namespace compchat::test;

namespace {

const char* kCmp1 =
    "id: cmp-1\n"
    "title: Methods\n"
    "items: [P1, P2, P3]\n"
    "properties:\n"
    "  - label: method\n"
    "    values: [X, [X, Y], ~]\n"
    "  - label: year\n"
    "    values: [2021, 2022, 2023]\n";

}  // namespace

TEST(TableDirSourceTest, LoadsCellsOfEveryShape) {
  TempDir dir;
  dir.write("cmp-1.yaml", kCmp1);
  TableDirSource src(TableDirSourceConfig{dir.path().string()});

  auto r = src.fetch("cmp-1");
  ASSERT_TRUE(r.ok()) << to_string(r.status());
  const ComparisonTable& t = *r;
  EXPECT_EQ(t.id(), "cmp-1");
  EXPECT_EQ(t.title(), "Methods");
  EXPECT_EQ(t.rows(), 2u);
  EXPECT_EQ(t.cols(), 3u);
  EXPECT_EQ(t.find("method", "P1")->joined(), "X");
  EXPECT_TRUE(t.find("method", "P2")->multi_valued());
  EXPECT_TRUE(t.find("method", "P3")->empty());
  EXPECT_EQ(t.find("year", "P3")->joined(), "2023");
}

TEST(TableDirSourceTest, MissingDatasetIsUnavailable) {
  TempDir dir;
  TableDirSource src(TableDirSourceConfig{dir.path().string()});
  EXPECT_EQ(src.fetch("cmp-404").status().code(), Status::Code::kDatasetUnavailable);
}

TEST(TableDirSourceTest, PathLikeIdsAreRejected) {
  TempDir dir;
  dir.write("inner/cmp-1.yaml", kCmp1);
  TableDirSource src(TableDirSourceConfig{dir.path().string()});
  EXPECT_EQ(src.fetch("inner/cmp-1").status().code(), Status::Code::kDatasetUnavailable);
  EXPECT_EQ(src.fetch("..").status().code(), Status::Code::kDatasetUnavailable);
  EXPECT_EQ(src.fetch("").status().code(), Status::Code::kDatasetUnavailable);
}

TEST(TableDirSourceTest, MalformedFilesAreUnavailable) {
  TempDir dir;
  dir.write("ragged.yaml",
            "items: [P1, P2]\n"
            "properties:\n"
            "  - label: method\n"
            "    values: [X]\n");
  dir.write("nested.yaml",
            "items: [P1]\n"
            "properties:\n"
            "  - label: method\n"
            "    values: [[[X]]]\n");
  dir.write("dupes.yaml",
            "items: [P1, P1]\n"
            "properties:\n"
            "  - label: method\n"
            "    values: [X, Y]\n");
  dir.write("broken.yaml", "items: [P1\n");
  dir.write("empty.yaml", "items: []\nproperties: []\n");

  TableDirSource src(TableDirSourceConfig{dir.path().string()});
  for (const char* id : {"ragged", "nested", "dupes", "broken", "empty"}) {
    auto r = src.fetch(id);
    EXPECT_EQ(r.status().code(), Status::Code::kDatasetUnavailable) << id;
  }
}

TEST(TableDirSourceTest, ShippedSamplesLoad) {
  TableDirSource src(TableDirSourceConfig{std::string(COMPCHAT_SOURCE_DIR) + "/data/comparisons"});
  for (const char* id : {"cmp-1", "cmp-2"}) {
    auto r = src.fetch(id);
    ASSERT_TRUE(r.ok()) << id << ": " << to_string(r.status());
    EXPECT_FALSE(r->empty());
  }
}

// ============================================================================
// CachingDatasetSource
// ============================================================================

TEST(CachingDatasetSourceTest, HitsSkipTheInnerSource) {
  FakeDatasetSource inner;
  inner.put(small_table("a"));
  CachingDatasetSource cache(inner, 4, 0);

  ASSERT_TRUE(cache.fetch("a").ok());
  ASSERT_TRUE(cache.fetch("a").ok());
  EXPECT_EQ(inner.fetches(), 1);
  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.misses(), 1u);
}

TEST(CachingDatasetSourceTest, FailuresAreNotCached) {
  FakeDatasetSource inner;
  CachingDatasetSource cache(inner, 4, 0);

  EXPECT_FALSE(cache.fetch("late").ok());
  inner.put(small_table("late"));
  EXPECT_TRUE(cache.fetch("late").ok());
  EXPECT_EQ(inner.fetches(), 2);
}

TEST(CachingDatasetSourceTest, EvictsLeastRecentlyUsed) {
  FakeDatasetSource inner;
  for (const char* id : {"a", "b", "c"}) inner.put(small_table(id));
  CachingDatasetSource cache(inner, 2, 0);

  ASSERT_TRUE(cache.fetch("a").ok());
  ASSERT_TRUE(cache.fetch("b").ok());
  ASSERT_TRUE(cache.fetch("a").ok());  // a is now most recent
  ASSERT_TRUE(cache.fetch("c").ok());  // evicts b
  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(inner.fetches(), 3);

  ASSERT_TRUE(cache.fetch("a").ok());
  EXPECT_EQ(inner.fetches(), 3);
  ASSERT_TRUE(cache.fetch("b").ok());
  EXPECT_EQ(inner.fetches(), 4);
}

TEST(CachingDatasetSourceTest, ExpiredEntriesAreRefetched) {
  FakeDatasetSource inner;
  inner.put(small_table("a"));
  CachingDatasetSource cache(inner, 4, seconds_to_ns(0.01));

  ASSERT_TRUE(cache.fetch("a").ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  ASSERT_TRUE(cache.fetch("a").ok());
  EXPECT_EQ(inner.fetches(), 2);
}
