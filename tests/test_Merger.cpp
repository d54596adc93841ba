#include <gtest/gtest.h>
#include "FakeCatalog.hpp"
#include "Merger.hpp"

using namespace plsync;
using plsync::fake::kDay;
using plsync::fake::track;

static CollectedItem collected(const std::string &key,
                               const std::string &replica,
                               std::optional<int64_t> ts) {
  return {track(key, ts), replica, ts};
}

TEST(MergerTest, EarliestWinsKeepsFirstAdder) {
  std::vector<CollectedItem> in = {collected("X", "B", 200),
                                   collected("X", "A", 100)};
  auto merged = Merger::earliestWins(in);

  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].replica, "A");
  EXPECT_EQ(merged[0].timestamp, 100);
}

TEST(MergerTest, EarliestWinsIgnoresLaterOccurrence) {
  std::vector<CollectedItem> in = {collected("X", "A", 100),
                                   collected("X", "B", 200)};
  auto merged = Merger::earliestWins(in);

  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].replica, "A");
  EXPECT_EQ(merged[0].timestamp, 100);
}

TEST(MergerTest, EarliestWinsPresentTimestampBeatsAbsent) {
  std::vector<CollectedItem> in = {collected("X", "A", std::nullopt),
                                   collected("X", "B", 500)};
  auto merged = Merger::earliestWins(in);

  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].replica, "B");
  EXPECT_EQ(merged[0].timestamp, 500);
}

TEST(MergerTest, EarliestWinsOrdersNewestFirstAbsentLast) {
  std::vector<CollectedItem> in = {
      collected("old", "A", 10), collected("none", "A", std::nullopt),
      collected("new", "B", 30), collected("mid", "C", 20)};
  auto merged = Merger::earliestWins(in);

  ASSERT_EQ(merged.size(), 4u);
  EXPECT_EQ(merged[0].item.key, "new");
  EXPECT_EQ(merged[1].item.key, "mid");
  EXPECT_EQ(merged[2].item.key, "old");
  EXPECT_EQ(merged[3].item.key, "none");
}

TEST(MergerTest, OneRecordPerKeyAcrossManyReplicas) {
  std::vector<CollectedItem> in;
  for (int r = 0; r < 5; ++r) {
    in.push_back(collected("shared", "R" + std::to_string(r), 100 + r));
    in.push_back(collected("own" + std::to_string(r), "R" + std::to_string(r),
                           50));
  }

  auto earliest = Merger::earliestWins(in);
  auto latest = Merger::latestRated(in);

  for (const auto *merged : {&earliest, &latest}) {
    int shared = 0;
    for (const auto &r : *merged)
      shared += r.item.key == "shared";
    EXPECT_EQ(shared, 1);
    EXPECT_EQ(merged->size(), 6u);
  }
  EXPECT_EQ(earliest[0].replica, "R0");
  EXPECT_EQ(latest[0].replica, "R4");
}

TEST(MergerTest, LatestRatedScenario) {
  // A rated T1 on day 1 and T2 on day 3; B rated T2 on day 2 and T3 on day 5
  std::vector<CollectedItem> in = {
      collected("T1", "A", 1 * kDay), collected("T2", "A", 3 * kDay),
      collected("T2", "B", 2 * kDay), collected("T3", "B", 5 * kDay)};
  auto merged = Merger::latestRated(in);

  ASSERT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged[0].item.key, "T3");
  EXPECT_EQ(merged[0].replica, "B");
  EXPECT_EQ(merged[0].timestamp, 5 * kDay);
  EXPECT_EQ(merged[1].item.key, "T2");
  EXPECT_EQ(merged[1].replica, "A");
  EXPECT_EQ(merged[1].timestamp, 3 * kDay);
  EXPECT_EQ(merged[2].item.key, "T1");
  EXPECT_EQ(merged[2].replica, "A");
}

TEST(MergerTest, LatestRatedKeepsNewestWithinCap) {
  std::vector<CollectedItem> in;
  for (int i = 0; i < 60; ++i)
    in.push_back(collected("T" + std::to_string(i), "A", i));

  auto merged = Merger::latestRated(in, 50);

  ASSERT_EQ(merged.size(), 50u);
  EXPECT_EQ(merged.front().item.key, "T59");
  EXPECT_EQ(merged.back().item.key, "T10");
}

TEST(MergerTest, LatestRatedZeroCapMeansUnlimited) {
  std::vector<CollectedItem> in;
  for (int i = 0; i < 70; ++i)
    in.push_back(collected("T" + std::to_string(i), "A", i));

  EXPECT_EQ(Merger::latestRated(in, 0).size(), 70u);
}

TEST(MergerTest, EqualTimestampsAreStable) {
  std::vector<CollectedItem> in = {collected("b", "A", 7),
                                   collected("a", "B", 7),
                                   collected("c", "C", 7)};

  auto first = Merger::earliestWins(in);
  auto second = Merger::earliestWins(in);

  ASSERT_EQ(first.size(), 3u);
  EXPECT_EQ(first[0].item.key, "b");
  EXPECT_EQ(first[1].item.key, "a");
  EXPECT_EQ(first[2].item.key, "c");
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].item.key, second[i].item.key);
    EXPECT_EQ(first[i].replica, second[i].replica);
  }
}

TEST(MergerTest, DedupeKeepsInputOrder) {
  std::vector<CollectedItem> in = {collected("b", "A", 1),
                                   collected("a", "A", 9),
                                   collected("b", "B", 5)};
  auto merged = Merger::dedupe(in);

  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(merged[0].item.key, "b");
  EXPECT_EQ(merged[0].replica, "A");
  EXPECT_EQ(merged[1].item.key, "a");
}

TEST(MergerTest, ItemsCarryMergedTimestamp) {
  std::vector<CollectedItem> in = {collected("X", "B", 200),
                                   collected("X", "A", 100)};
  auto items = Merger::itemsOf(Merger::earliestWins(in));

  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].key, "X");
  EXPECT_EQ(items[0].timestamp, 100);
}

TEST(MergerTest, EmptyInputGivesEmptyOutput) {
  EXPECT_TRUE(Merger::earliestWins({}).empty());
  EXPECT_TRUE(Merger::latestRated({}).empty());
}
