#include <gtest/gtest.h>
#include "Report.hpp"

using namespace plsync;

// 2024-03-05 12:00:00 UTC
static constexpr int64_t kMarchFifth = 1709640000;

TEST(ReportTest, ShortDateIsMonthAndDay) {
  EXPECT_EQ(Report::shortDate(kMarchFifth), "03/05");
  EXPECT_EQ(Report::shortDate(std::nullopt), "");
}

TEST(ReportTest, TracksFallBackToUnknown) {
  MergeRecord r;
  r.item = {"1", "Song", "", std::nullopt};
  r.timestamp = kMarchFifth;

  auto tracks = Report::tracks({r});

  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_EQ(tracks[0].title, "Song");
  EXPECT_EQ(tracks[0].artist, "Unknown");
  EXPECT_EQ(tracks[0].user, "Unknown");
  EXPECT_EQ(tracks[0].timestamp, kMarchFifth);
}

TEST(ReportTest, JsonCarriesCountsTracksAndFailures) {
  SyncResult result;
  result.total = 1;
  result.added = 2;
  result.replicasUpdated = 2;
  result.tracks.push_back({"Song", "Band", "alice", kMarchFifth});
  result.failures.push_back(
      {"bob", Stage::Write, ErrorKind::PlaylistWriteFailure, "boom"});

  auto data = Report::toJson(result);

  EXPECT_EQ(data["total"], 1);
  EXPECT_EQ(data["added"], 2);
  EXPECT_EQ(data["replicas_updated"], 2);
  EXPECT_EQ(data["dry_run"], false);
  ASSERT_EQ(data["tracks"].size(), 1u);
  EXPECT_EQ(data["tracks"][0]["user"], "alice");
  EXPECT_EQ(data["tracks"][0]["date"], "03/05");
  EXPECT_EQ(data["tracks"][0]["timestamp"], kMarchFifth);
  ASSERT_EQ(data["failures"].size(), 1u);
  EXPECT_EQ(data["failures"][0]["stage"], "write");
  EXPECT_EQ(data["failures"][0]["error"], "PlaylistWriteFailure");
}

TEST(ReportTest, TextListsTracksInOrder) {
  SyncResult result;
  result.total = 2;
  result.replicasUpdated = 1;
  result.dryRun = true;
  result.tracks.push_back({"First", "A", "alice", kMarchFifth});
  result.tracks.push_back({"Second", "B", "bob", std::nullopt});

  auto text = Report::toText("Jam Jar", result);

  EXPECT_NE(text.find("Jam Jar: 2 tracks, 0 added, 1 replicas updated (dry run)"),
            std::string::npos);
  EXPECT_NE(text.find("1. First - A (alice, 03/05)"), std::string::npos);
  EXPECT_NE(text.find("2. Second - B (bob)"), std::string::npos);
  EXPECT_LT(text.find("First"), text.find("Second"));
}
