#pragma once
#include "CatalogClient.hpp"
#include "Collector.hpp"
#include "Merger.hpp"
#include "PlaylistWriter.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace plsync {

/**
 * ReconciliationService runs one collect -> merge -> fan-out cycle per call.
 * Replicas are processed one at a time. A replica that cannot be read or
 * written is recorded in SyncResult::failures and skipped; only an
 * unreachable root scope escapes as a CatalogError.
 */
class ReconciliationService {
public:
  explicit ReconciliationService(CatalogClient &catalog,
                                 const std::atomic<bool> *cancel = nullptr);

  // Incremental and capped: newest top-rated tracks of the contributors are
  // appended to each contributor's playlist, which never exceeds maxSongs.
  SyncResult updateRecentRaves(const std::vector<std::string> &contributors,
                               const std::string &playlistName,
                               size_t maxSongs = Merger::kDefaultCap,
                               double minRating = 9.9, bool dryRun = false);

  // Union of every member's playlist, rewritten onto every member.
  SyncResult syncJamJar(const std::vector<std::string> &members,
                        const std::string &playlistName, bool dryRun = false);

  // Union of the curators' playlists, rewritten onto the root scope and
  // every known replica.
  SyncResult syncStaffPicks(const std::vector<std::string> &curators,
                            const std::string &playlistName,
                            bool dryRun = false);

  // Root scope only: its rated tracks replace the named playlist.
  SyncResult syncTopRated(double minRating, const std::string &playlistName,
                          bool dryRun = false);

private:
  using WriteFn = std::function<int32_t(ScopedCatalog &)>;

  CatalogClient &m_catalog;
  const std::atomic<bool> *m_cancel;

  bool cancelled() const;
  std::string requireRoot();
  std::optional<int32_t> writeReplica(const std::string &replica, bool isRoot,
                                      const WriteFn &write,
                                      SyncResult &result);
  void recordWriteFailure(SyncResult &result, const std::string &replica,
                          ErrorKind kind, const std::string &message);
};

} // namespace plsync
