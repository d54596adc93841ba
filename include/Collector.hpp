#pragma once

#include "CatalogClient.hpp"
#include "types.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace plsync {

struct Collection {
  std::vector<CollectedItem> items;
  std::vector<ReplicaOutcome> failures;
  bool cancelled = false;
};

/**
 * Collector pulls candidate items from replicas. It never writes and never
 * deduplicates; a replica that fails is logged, recorded and skipped.
 */
class Collector {
public:
  explicit Collector(CatalogClient &catalog,
                     const std::atomic<bool> *cancel = nullptr);

  // Tracks rated >= minRating in every music section of each replica.
  // With requireTimestamp, tracks lacking a last-rated time are dropped.
  Collection byRating(const std::vector<std::string> &replicas,
                      double minRating, bool requireTimestamp = true);

  // Same search, run against the root scope only
  Collection rootByRating(double minRating, bool requireTimestamp);

  // Members of the named playlist in each replica; a replica without the
  // playlist contributes nothing.
  Collection byMembership(const std::vector<std::string> &replicas,
                          const std::string &playlistName);

  static constexpr const char *kMusicSection = "artist";

private:
  CatalogClient &m_catalog;
  const std::atomic<bool> *m_cancel;

  bool cancelled() const;
  void collectRated(ScopedCatalog &scope, double minRating,
                    bool requireTimestamp, Collection &out);
  void recordFailure(Collection &out, const std::string &replica,
                     const CatalogError &e);
};

} // namespace plsync
