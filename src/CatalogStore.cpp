#include "CatalogStore.hpp"
#include <ctime>
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace plsync {

// Helper that lets decltype name the storage type
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<ReplicaRow>(
          "Replica", make_column("id", &ReplicaRow::id, primary_key()),
          make_column("root", &ReplicaRow::root),
          make_column("reachable", &ReplicaRow::reachable)),
      make_table<TrackRow>(
          "Track",
          make_column("id", &TrackRow::id, primary_key().autoincrement()),
          make_column("replica", &TrackRow::replica),
          make_column("ratingKey", &TrackRow::ratingKey),
          make_column("title", &TrackRow::title),
          make_column("artist", &TrackRow::artist),
          make_column("sectionType", &TrackRow::sectionType),
          make_column("userRating", &TrackRow::userRating),
          make_column("lastRatedAt", &TrackRow::lastRatedAt),
          sqlite_orm::unique(&TrackRow::replica, &TrackRow::ratingKey)),
      make_table<PlaylistRow>(
          "Playlist",
          make_column("id", &PlaylistRow::id, primary_key().autoincrement()),
          make_column("replica", &PlaylistRow::replica),
          make_column("title", &PlaylistRow::title),
          sqlite_orm::unique(&PlaylistRow::replica, &PlaylistRow::title)),
      make_table<PlaylistEntryRow>(
          "PlaylistEntry",
          make_column("id", &PlaylistEntryRow::id,
                      primary_key().autoincrement()),
          make_column("playlistId", &PlaylistEntryRow::playlistId),
          make_column("ratingKey", &PlaylistEntryRow::ratingKey),
          make_column("title", &PlaylistEntryRow::title),
          make_column("artist", &PlaylistEntryRow::artist),
          make_column("addedAt", &PlaylistEntryRow::addedAt),
          foreign_key(&PlaylistEntryRow::playlistId)
              .references(&PlaylistRow::id)));
}

using Storage = decltype(create_storage_impl(""));

struct CatalogStore::Impl {
  Storage storage;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}

  std::vector<Item> entries(int64_t playlistId) {
    auto rows = storage.get_all<PlaylistEntryRow>(
        where(c(&PlaylistEntryRow::playlistId) == playlistId),
        order_by(&PlaylistEntryRow::id));
    std::vector<Item> items;
    items.reserve(rows.size());
    for (const auto &r : rows)
      items.push_back(
          {r.ratingKey, r.title, r.artist, r.addedAt, std::to_string(r.id)});
    return items;
  }

  void append(int64_t playlistId, const std::vector<Item> &items) {
    const int64_t now = static_cast<int64_t>(std::time(nullptr));
    for (const auto &item : items) {
      PlaylistEntryRow row;
      row.playlistId = playlistId;
      row.ratingKey = item.key;
      row.title = item.title;
      row.artist = item.artist;
      // Keep the membership time the item already carries
      row.addedAt = item.timestamp ? item.timestamp : std::optional<int64_t>(now);
      storage.insert(row);
    }
  }
};

namespace {

class StorePlaylist : public PlaylistHandle {
public:
  StorePlaylist(CatalogStore::Impl &impl, std::string replica, PlaylistRow row)
      : m_impl(impl), m_replica(std::move(replica)), m_row(std::move(row)) {}

  std::string title() const override { return m_row.title; }

  std::vector<Item> items() override {
    try {
      return m_impl.entries(m_row.id);
    } catch (const std::exception &e) {
      throw CatalogError(ErrorKind::PlaylistReadFailure, m_replica, e.what());
    }
  }

  void addItems(const std::vector<Item> &items) override {
    try {
      m_impl.storage.transaction([&] {
        m_impl.append(m_row.id, items);
        return true;
      });
    } catch (const std::exception &e) {
      throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica, e.what());
    }
  }

  void removeItems(const std::vector<Item> &items) override {
    std::vector<int64_t> ids;
    ids.reserve(items.size());
    try {
      for (const auto &item : items)
        ids.push_back(std::stoll(item.entryId));
    } catch (const std::exception &) {
      throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica,
                         "removeItems needs entries read from '" +
                             m_row.title + "'");
    }
    try {
      m_impl.storage.remove_all<PlaylistEntryRow>(
          where(c(&PlaylistEntryRow::playlistId) == m_row.id and
                in(&PlaylistEntryRow::id, ids)));
    } catch (const std::exception &e) {
      throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica, e.what());
    }
  }

private:
  CatalogStore::Impl &m_impl;
  std::string m_replica;
  PlaylistRow m_row;
};

class StoreScope : public ScopedCatalog {
public:
  StoreScope(CatalogStore::Impl &impl, std::string replica)
      : m_impl(impl), m_replica(std::move(replica)) {}

  const std::string &replicaId() const override { return m_replica; }

  std::unique_ptr<PlaylistHandle>
  findPlaylist(const std::string &name) override {
    std::vector<PlaylistRow> rows;
    try {
      rows = m_impl.storage.get_all<PlaylistRow>(
          where(c(&PlaylistRow::replica) == m_replica and
                c(&PlaylistRow::title) == name));
    } catch (const std::exception &e) {
      throw CatalogError(ErrorKind::PlaylistReadFailure, m_replica, e.what());
    }
    if (rows.empty())
      return nullptr;
    return std::make_unique<StorePlaylist>(m_impl, m_replica, rows[0]);
  }

  std::unique_ptr<PlaylistHandle>
  createPlaylist(const std::string &name,
                 const std::vector<Item> &items) override {
    PlaylistRow row;
    row.replica = m_replica;
    row.title = name;
    try {
      m_impl.storage.transaction([&] {
        row.id = m_impl.storage.insert(row);
        m_impl.append(row.id, items);
        return true;
      });
    } catch (const std::exception &e) {
      throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica, e.what());
    }
    return std::make_unique<StorePlaylist>(m_impl, m_replica, row);
  }

  std::vector<Item> searchByRating(const std::string &sectionType,
                                   double minRating) override {
    std::vector<TrackRow> rows;
    try {
      rows = m_impl.storage.get_all<TrackRow>(
          where(c(&TrackRow::replica) == m_replica and
                c(&TrackRow::sectionType) == sectionType and
                c(&TrackRow::userRating) >= minRating),
          order_by(&TrackRow::id));
    } catch (const std::exception &e) {
      throw CatalogError(ErrorKind::PlaylistReadFailure, m_replica, e.what());
    }
    std::vector<Item> items;
    items.reserve(rows.size());
    for (const auto &r : rows)
      items.push_back({r.ratingKey, r.title, r.artist, r.lastRatedAt});
    return items;
  }

private:
  CatalogStore::Impl &m_impl;
  std::string m_replica;
};

} // namespace

CatalogStore::CatalogStore(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

CatalogStore::~CatalogStore() = default;

bool CatalogStore::open() {
  try {
    // ":memory:" only lives as long as its connection
    m_impl->storage.open_forever();
    std::cout << "[Store] Catalog opened: " << m_dbPath << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Store] Failed to open " << m_dbPath << ": " << e.what()
              << std::endl;
    return false;
  }
}

void CatalogStore::initializeSchema() {
  m_impl->storage.sync_schema();
  std::cout << "[Store] Schema synchronized." << std::endl;
}

bool CatalogStore::addReplica(const std::string &id, bool root) {
  try {
    ReplicaRow row;
    row.id = id;
    row.root = root;
    m_impl->storage.replace(row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Store] addReplica Error: " << e.what() << std::endl;
    return false;
  }
}

bool CatalogStore::setReachable(const std::string &id, bool reachable) {
  try {
    auto row = m_impl->storage.get_optional<ReplicaRow>(id);
    if (!row)
      return false;
    row->reachable = reachable;
    m_impl->storage.update(*row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Store] setReachable Error: " << e.what() << std::endl;
    return false;
  }
}

bool CatalogStore::rateTrack(const std::string &replica, const Item &item,
                             double rating, const std::string &sectionType) {
  try {
    auto existing = m_impl->storage.get_all<TrackRow>(
        where(c(&TrackRow::replica) == replica and
              c(&TrackRow::ratingKey) == item.key));
    TrackRow row;
    if (!existing.empty())
      row = existing[0];
    row.replica = replica;
    row.ratingKey = item.key;
    row.title = item.title;
    row.artist = item.artist;
    row.sectionType = sectionType;
    row.userRating = rating;
    row.lastRatedAt = item.timestamp;
    if (existing.empty())
      m_impl->storage.insert(row);
    else
      m_impl->storage.update(row);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Store] rateTrack Error: " << e.what() << std::endl;
    return false;
  }
}

std::unique_ptr<ScopedCatalog> CatalogStore::rootScope() {
  std::vector<ReplicaRow> roots;
  try {
    roots = m_impl->storage.get_all<ReplicaRow>(
        where(c(&ReplicaRow::root) == true));
  } catch (const std::exception &e) {
    throw CatalogError(ErrorKind::ScopeUnavailable, "root", e.what());
  }
  if (roots.empty())
    throw CatalogError(ErrorKind::ScopeUnavailable, "root",
                       "catalog has no root replica");
  if (!roots[0].reachable)
    throw CatalogError(ErrorKind::ScopeUnavailable, roots[0].id,
                       "root replica is unreachable");
  return std::make_unique<StoreScope>(*m_impl, roots[0].id);
}

std::unique_ptr<ScopedCatalog>
CatalogStore::switchScope(const std::string &replicaId) {
  std::optional<ReplicaRow> row;
  try {
    row = m_impl->storage.get_optional<ReplicaRow>(replicaId);
  } catch (const std::exception &e) {
    throw CatalogError(ErrorKind::ScopeUnavailable, replicaId, e.what());
  }
  if (!row)
    throw CatalogError(ErrorKind::ScopeUnavailable, replicaId,
                       "unknown replica '" + replicaId + "'");
  if (!row->reachable)
    throw CatalogError(ErrorKind::ScopeUnavailable, replicaId,
                       "replica '" + replicaId + "' is unreachable");
  return std::make_unique<StoreScope>(*m_impl, replicaId);
}

std::vector<std::string> CatalogStore::listReplicas() {
  std::vector<std::string> ids;
  try {
    auto rows = m_impl->storage.get_all<ReplicaRow>(
        where(c(&ReplicaRow::root) == false), order_by(&ReplicaRow::id));
    for (const auto &r : rows)
      ids.push_back(r.id);
  } catch (const std::exception &e) {
    throw CatalogError(ErrorKind::ScopeUnavailable, "*", e.what());
  }
  return ids;
}

} // namespace plsync
