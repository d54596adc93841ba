#include "Collector.hpp"
#include <iostream>

namespace plsync {

Collector::Collector(CatalogClient &catalog, const std::atomic<bool> *cancel)
    : m_catalog(catalog), m_cancel(cancel) {}

bool Collector::cancelled() const { return m_cancel && m_cancel->load(); }

void Collector::recordFailure(Collection &out, const std::string &replica,
                              const CatalogError &e) {
  std::cerr << "[Collector] Skipping '" << replica << "' (" << toString(e.kind())
            << "): " << e.what() << std::endl;
  ReplicaOutcome outcome;
  outcome.replica = replica;
  outcome.stage = Stage::Collect;
  outcome.error = e.kind();
  outcome.message = e.what();
  out.failures.push_back(outcome);
}

void Collector::collectRated(ScopedCatalog &scope, double minRating,
                             bool requireTimestamp, Collection &out) {
  auto tracks = scope.searchByRating(kMusicSection, minRating);
  size_t kept = 0;
  for (auto &track : tracks) {
    // Without a rating time the track cannot be ordered
    if (requireTimestamp && !track.timestamp)
      continue;
    CollectedItem c;
    c.timestamp = track.timestamp;
    c.replica = scope.replicaId();
    c.item = std::move(track);
    out.items.push_back(std::move(c));
    kept++;
  }
  std::cout << "[Collector] Fetched " << kept << " tracks rated >= "
            << minRating << " for " << scope.replicaId() << std::endl;
}

Collection Collector::byRating(const std::vector<std::string> &replicas,
                               double minRating, bool requireTimestamp) {
  Collection out;
  for (const auto &replica : replicas) {
    if (cancelled()) {
      out.cancelled = true;
      break;
    }
    try {
      auto scope = m_catalog.switchScope(replica);
      collectRated(*scope, minRating, requireTimestamp, out);
    } catch (const CatalogError &e) {
      recordFailure(out, replica, e);
    } catch (const std::exception &e) {
      recordFailure(out, replica,
                    CatalogError(ErrorKind::PlaylistReadFailure, replica,
                                 e.what()));
    }
  }
  return out;
}

Collection Collector::rootByRating(double minRating, bool requireTimestamp) {
  Collection out;
  // No try here: an unreachable root aborts the invocation
  auto root = m_catalog.rootScope();
  try {
    collectRated(*root, minRating, requireTimestamp, out);
  } catch (const CatalogError &e) {
    recordFailure(out, root->replicaId(), e);
  } catch (const std::exception &e) {
    recordFailure(out, root->replicaId(),
                  CatalogError(ErrorKind::PlaylistReadFailure,
                               root->replicaId(), e.what()));
  }
  return out;
}

Collection Collector::byMembership(const std::vector<std::string> &replicas,
                                   const std::string &playlistName) {
  Collection out;
  for (const auto &replica : replicas) {
    if (cancelled()) {
      out.cancelled = true;
      break;
    }
    try {
      auto scope = m_catalog.switchScope(replica);
      auto playlist = scope->findPlaylist(playlistName);
      if (!playlist) {
        std::cout << "[Collector] No '" << playlistName << "' playlist for "
                  << replica << std::endl;
        continue;
      }
      auto items = playlist->items();
      std::cout << "[Collector] Found " << items.size() << " tracks in '"
                << playlistName << "' for " << replica << std::endl;
      for (auto &item : items) {
        CollectedItem c;
        c.timestamp = item.timestamp;
        c.replica = replica;
        c.item = std::move(item);
        out.items.push_back(std::move(c));
      }
    } catch (const CatalogError &e) {
      recordFailure(out, replica, e);
    } catch (const std::exception &e) {
      recordFailure(out, replica,
                    CatalogError(ErrorKind::PlaylistReadFailure, replica,
                                 e.what()));
    }
  }
  return out;
}

} // namespace plsync
