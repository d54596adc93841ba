#pragma once
#include "CatalogClient.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plsync {

struct ReplicaRow {
  std::string id;
  bool root = false;
  bool reachable = true;
};

struct TrackRow {
  int64_t id = 0;
  std::string replica;
  std::string ratingKey;
  std::string title;
  std::string artist;
  std::string sectionType;
  double userRating = 0;
  std::optional<int64_t> lastRatedAt;
};

struct PlaylistRow {
  int64_t id = 0;
  std::string replica;
  std::string title;
};

// Position in the playlist is the entry id order
struct PlaylistEntryRow {
  int64_t id = 0;
  int64_t playlistId = 0;
  std::string ratingKey;
  std::string title;
  std::string artist;
  std::optional<int64_t> addedAt;
};

/**
 * CatalogStore is a catalog kept in a local SQLite file (or ":memory:").
 * It honours the same scoped contract as a media server, so every policy
 * can be rehearsed offline against it.
 */
class CatalogStore : public CatalogClient {
public:
  explicit CatalogStore(const std::string &dbPath);
  ~CatalogStore() override;

  // Connection management
  bool open();
  void initializeSchema();

  // Catalog administration
  bool addReplica(const std::string &id, bool root = false);
  bool setReachable(const std::string &id, bool reachable);
  bool rateTrack(const std::string &replica, const Item &item, double rating,
                 const std::string &sectionType = "artist");

  // CatalogClient
  std::unique_ptr<ScopedCatalog> rootScope() override;
  std::unique_ptr<ScopedCatalog>
  switchScope(const std::string &replicaId) override;
  std::vector<std::string> listReplicas() override;

  struct Impl;

private:
  std::string m_dbPath;
  std::unique_ptr<Impl> m_impl;
};

} // namespace plsync
