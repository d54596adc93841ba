#include <gtest/gtest.h>
#include "FakeCatalog.hpp"
#include "PlexClient.hpp"
#include <atomic>
#include <chrono>
#include <httplib.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

using namespace plsync;
using plsync::fake::keysOf;
using plsync::fake::track;
using json = nlohmann::json;

using Keys = std::vector<std::string>;

// Minimal Plex Media Server answering the endpoints PlexClient uses
class PlexClientTest : public ::testing::Test {
protected:
  httplib::Server server;
  std::thread serverThread;
  int port = 0;

  std::mutex mutex;
  std::map<std::string, std::string> seen; // last query params by route
  std::vector<std::string> deleted;
  std::vector<std::string> queriedSections;
  std::atomic<bool> failPlaylists{false};
  std::atomic<bool> failWrites{false};

  void SetUp() override {
    routes();
    port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    serverThread = std::thread([this] { server.listen_after_bind(); });
    for (int i = 0; i < 200 && !server.is_running(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(server.is_running());
  }

  void TearDown() override {
    server.stop();
    if (serverThread.joinable())
      serverThread.join();
  }

  std::unique_ptr<PlexClient> client() {
    std::map<std::string, std::string> tokens{{"alice", "tok-alice"},
                                              {"eve", "revoked"}};
    return std::make_unique<PlexClient>(
        "http://127.0.0.1:" + std::to_string(port), "admin", "tok-admin",
        tokens);
  }

  static void reply(httplib::Response &res, const json &container) {
    json body;
    body["MediaContainer"] = container;
    res.set_content(body.dump(), "application/json");
  }

  void routes() {
    server.Get("/identity", [](const httplib::Request &req,
                               httplib::Response &res) {
      auto token = req.get_header_value("X-Plex-Token");
      if (token != "tok-admin" && token != "tok-alice") {
        res.status = 401;
        return;
      }
      reply(res, {{"machineIdentifier", "m1"}});
    });

    server.Get("/playlists", [this](const httplib::Request &,
                                    httplib::Response &res) {
      if (failPlaylists) {
        res.status = 500;
        return;
      }
      reply(res, {{"Metadata", {{{"ratingKey", "77"}, {"title", "Raves"}}}}});
    });

    server.Get("/playlists/77/items", [](const httplib::Request &,
                                         httplib::Response &res) {
      json entries = json::array();
      entries.push_back({{"ratingKey", "1"},
                         {"title", "One"},
                         {"grandparentTitle", "Band"},
                         {"addedAt", 100},
                         {"playlistItemID", 501}});
      entries.push_back({{"ratingKey", "2"},
                         {"title", "Two"},
                         {"originalTitle", "Solo"},
                         {"addedAt", 0},
                         {"playlistItemID", 502}});
      entries.push_back(
          {{"ratingKey", "1"}, {"title", "One"}, {"playlistItemID", 503}});
      reply(res, {{"Metadata", entries}});
    });

    server.Put("/playlists/77/items", [this](const httplib::Request &req,
                                             httplib::Response &res) {
      if (failWrites) {
        res.status = 403;
        return;
      }
      std::lock_guard<std::mutex> lock(mutex);
      seen["put.uri"] = req.get_param_value("uri");
      res.set_content("{}", "application/json");
    });

    server.Delete(R"(/playlists/77/items/(\d+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    std::lock_guard<std::mutex> lock(mutex);
                    deleted.push_back(req.matches[1]);
                    res.set_content("{}", "application/json");
                  });

    server.Post("/playlists", [this](const httplib::Request &req,
                                     httplib::Response &res) {
      std::lock_guard<std::mutex> lock(mutex);
      seen["post.title"] = req.get_param_value("title");
      seen["post.uri"] = req.get_param_value("uri");
      reply(res, {{"Metadata", {{{"ratingKey", "88"}}}}});
    });

    server.Get("/library/sections", [](const httplib::Request &,
                                       httplib::Response &res) {
      reply(res, {{"Directory",
                   {{{"key", "3"}, {"type", "artist"}},
                    {{"key", "4"}, {"type", "show"}}}}});
    });

    server.Get(R"(/library/sections/(\d+)/all)",
               [this](const httplib::Request &req, httplib::Response &res) {
                 std::lock_guard<std::mutex> lock(mutex);
                 queriedSections.push_back(req.matches[1]);
                 seen["search.type"] = req.get_param_value("type");
                 seen["search.rating"] = req.get_param_value("userRating>>");
                 json tracks = json::array();
                 tracks.push_back({{"ratingKey", "10"},
                                   {"title", "Edge"},
                                   {"grandparentTitle", "Band"},
                                   {"userRating", 8.0},
                                   {"lastRatedAt", 500}});
                 tracks.push_back({{"ratingKey", "11"},
                                   {"title", "Top"},
                                   {"grandparentTitle", "Band"},
                                   {"userRating", 10.0},
                                   {"lastRatedAt", -1}});
                 tracks.push_back({{"ratingKey", "12"},
                                   {"title", "Near"},
                                   {"grandparentTitle", "Band"},
                                   {"userRating", 7.95}});
                 reply(res, {{"Metadata", tracks}});
               });
  }
};

TEST_F(PlexClientTest, ScopesAndReplicaListing) {
  auto plex = client();
  EXPECT_EQ(plex->rootScope()->replicaId(), "admin");
  EXPECT_EQ(plex->switchScope("alice")->replicaId(), "alice");
  EXPECT_EQ(plex->switchScope("admin")->replicaId(), "admin");
  EXPECT_EQ(plex->listReplicas(), (Keys{"alice", "eve"}));
}

TEST_F(PlexClientTest, PlaylistEntriesMapArtistTimeAndEntry) {
  auto scope = client()->switchScope("alice");
  EXPECT_EQ(scope->findPlaylist("Missing"), nullptr);

  auto playlist = scope->findPlaylist("Raves");
  ASSERT_NE(playlist, nullptr);
  auto items = playlist->items();

  EXPECT_EQ(keysOf(items), (Keys{"1", "2", "1"}));
  EXPECT_EQ(items[0].artist, "Band");
  EXPECT_EQ(items[1].artist, "Solo");
  EXPECT_EQ(items[2].artist, "Unknown");
  EXPECT_EQ(items[0].timestamp, 100);
  EXPECT_FALSE(items[1].timestamp.has_value());
  EXPECT_FALSE(items[2].timestamp.has_value());
  EXPECT_EQ(items[0].entryId, "501");
  EXPECT_EQ(items[2].entryId, "503");
}

TEST_F(PlexClientTest, RatingSearchIncludesExactThreshold) {
  auto scope = client()->switchScope("alice");
  auto found = scope->searchByRating("artist", 8.0);

  EXPECT_EQ(keysOf(found), (Keys{"10", "11"}));
  EXPECT_EQ(found[0].timestamp, 500);
  EXPECT_FALSE(found[1].timestamp.has_value());

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(queriedSections, Keys{"3"});
  EXPECT_EQ(seen["search.type"], "10");
  EXPECT_NEAR(std::stod(seen["search.rating"]), 7.9, 1e-9);
}

TEST_F(PlexClientTest, AddSendsLibraryUri) {
  auto playlist = client()->switchScope("alice")->findPlaylist("Raves");
  ASSERT_NE(playlist, nullptr);
  playlist->addItems({track("1"), track("2")});

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(seen["put.uri"],
            "server://m1/com.plexapp.plugins.library/library/metadata/1,2");
}

TEST_F(PlexClientTest, RemoveDeletesOnlyTheNamedEntry) {
  auto playlist = client()->switchScope("alice")->findPlaylist("Raves");
  ASSERT_NE(playlist, nullptr);
  auto items = playlist->items();
  playlist->removeItems({items[2]});

  {
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(deleted, Keys{"503"});
  }
  EXPECT_THROW(playlist->removeItems({track("1")}), CatalogError);
}

TEST_F(PlexClientTest, CreatePostsTitleAndUri) {
  auto scope = client()->switchScope("alice");
  auto playlist = scope->createPlaylist("Jam Jar", {track("5")});
  ASSERT_NE(playlist, nullptr);
  EXPECT_EQ(playlist->title(), "Jam Jar");

  {
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen["post.title"], "Jam Jar");
    EXPECT_EQ(seen["post.uri"],
              "server://m1/com.plexapp.plugins.library/library/metadata/5");
  }

  try {
    scope->createPlaylist("Empty", {});
    FAIL() << "expected CatalogError";
  } catch (const CatalogError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::PlaylistWriteFailure);
  }
}

TEST_F(PlexClientTest, FailuresMapToErrorKinds) {
  auto plex = client();

  auto kindOf = [](const std::function<void()> &call) {
    try {
      call();
    } catch (const CatalogError &e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected CatalogError";
    return ErrorKind::ScopeUnavailable;
  };

  EXPECT_EQ(kindOf([&] { plex->switchScope("bob"); }),
            ErrorKind::ScopeUnavailable);
  EXPECT_EQ(kindOf([&] { plex->switchScope("eve"); }),
            ErrorKind::ScopeUnavailable);

  auto scope = plex->switchScope("alice");
  auto playlist = scope->findPlaylist("Raves");
  ASSERT_NE(playlist, nullptr);

  failWrites = true;
  EXPECT_EQ(kindOf([&] { playlist->addItems({track("9")}); }),
            ErrorKind::PlaylistWriteFailure);

  failPlaylists = true;
  EXPECT_EQ(kindOf([&] { scope->findPlaylist("Raves"); }),
            ErrorKind::PlaylistReadFailure);
}
