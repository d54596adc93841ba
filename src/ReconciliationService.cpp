#include "ReconciliationService.hpp"
#include "Report.hpp"
#include <iostream>
#include <set>

namespace plsync {

ReconciliationService::ReconciliationService(CatalogClient &catalog,
                                             const std::atomic<bool> *cancel)
    : m_catalog(catalog), m_cancel(cancel) {}

bool ReconciliationService::cancelled() const {
  return m_cancel && m_cancel->load();
}

std::string ReconciliationService::requireRoot() {
  // Propagates: nothing can be reconciled without the root scope
  auto root = m_catalog.rootScope();
  return root->replicaId();
}

void ReconciliationService::recordWriteFailure(SyncResult &result,
                                               const std::string &replica,
                                               ErrorKind kind,
                                               const std::string &message) {
  std::cerr << "[Reconcile] Failed to update playlist for " << replica << " ("
            << toString(kind) << "): " << message << std::endl;
  ReplicaOutcome outcome;
  outcome.replica = replica;
  outcome.stage = Stage::Write;
  outcome.error = kind;
  outcome.message = message;
  result.failures.push_back(outcome);
}

std::optional<int32_t>
ReconciliationService::writeReplica(const std::string &replica, bool isRoot,
                                    const WriteFn &write, SyncResult &result) {
  try {
    auto scope = isRoot ? m_catalog.rootScope() : m_catalog.switchScope(replica);
    int32_t written = write(*scope);
    result.replicasUpdated++;
    return written;
  } catch (const CatalogError &e) {
    recordWriteFailure(result, replica, e.kind(), e.what());
  } catch (const std::exception &e) {
    recordWriteFailure(result, replica, ErrorKind::PlaylistWriteFailure,
                       e.what());
  }
  return std::nullopt;
}

SyncResult ReconciliationService::updateRecentRaves(
    const std::vector<std::string> &contributors,
    const std::string &playlistName, size_t maxSongs, double minRating,
    bool dryRun) {
  std::cout << "[Reconcile] Updating '" << playlistName << "' from "
            << contributors.size() << " contributors" << std::endl;
  requireRoot();

  SyncResult result;
  result.dryRun = dryRun;

  Collector collector(m_catalog, m_cancel);
  Collection collection = collector.byRating(contributors, minRating);
  result.failures = collection.failures;
  if (collection.cancelled) {
    result.cancelled = true;
    return result;
  }

  auto merged = Merger::latestRated(collection.items, maxSongs);
  if (merged.empty()) {
    std::cout << "[Reconcile] No rated tracks found across contributors."
              << std::endl;
    return result;
  }

  result.total = static_cast<int32_t>(merged.size());
  result.tracks = Report::tracks(merged);
  const auto items = Merger::itemsOf(merged);

  PlaylistWriter writer(dryRun);
  for (const auto &replica : contributors) {
    if (cancelled()) {
      result.cancelled = true;
      break;
    }
    auto added = writeReplica(
        replica, false,
        [&](ScopedCatalog &scope) {
          return writer.appendMissing(scope, playlistName, items, maxSongs);
        },
        result);
    if (added)
      result.added += *added;
  }
  return result;
}

SyncResult ReconciliationService::syncJamJar(
    const std::vector<std::string> &members, const std::string &playlistName,
    bool dryRun) {
  std::cout << "[Reconcile] Syncing '" << playlistName << "' across "
            << members.size() << " members" << std::endl;
  requireRoot();

  SyncResult result;
  result.dryRun = dryRun;

  Collector collector(m_catalog, m_cancel);
  Collection collection = collector.byMembership(members, playlistName);
  result.failures = collection.failures;
  if (collection.cancelled) {
    result.cancelled = true;
    return result;
  }

  auto merged = Merger::earliestWins(collection.items);
  if (merged.empty()) {
    // A playlist cannot be created empty, so there is nothing to push
    std::cout << "[Reconcile] No tracks found in any '" << playlistName
              << "' playlist." << std::endl;
    return result;
  }

  result.total = static_cast<int32_t>(merged.size());
  result.tracks = Report::tracks(merged);
  const auto items = Merger::itemsOf(merged);

  PlaylistWriter writer(dryRun);
  for (const auto &replica : members) {
    if (cancelled()) {
      result.cancelled = true;
      break;
    }
    auto written = writeReplica(
        replica, false,
        [&](ScopedCatalog &scope) {
          return writer.replace(scope, playlistName, items);
        },
        result);
    if (written)
      result.added += *written;
  }
  return result;
}

SyncResult ReconciliationService::syncStaffPicks(
    const std::vector<std::string> &curators, const std::string &playlistName,
    bool dryRun) {
  std::cout << "[Reconcile] Syncing '" << playlistName << "' from "
            << curators.size() << " curators" << std::endl;
  const std::string rootId = requireRoot();

  SyncResult result;
  result.dryRun = dryRun;

  Collector collector(m_catalog, m_cancel);
  Collection collection = collector.byMembership(curators, playlistName);
  result.failures = collection.failures;
  if (collection.cancelled) {
    result.cancelled = true;
    return result;
  }

  auto merged = Merger::earliestWins(collection.items);
  if (merged.empty()) {
    std::cout << "[Reconcile] No tracks found in any curator's '"
              << playlistName << "'." << std::endl;
    return result;
  }

  result.total = static_cast<int32_t>(merged.size());
  result.tracks = Report::tracks(merged);
  const auto items = Merger::itemsOf(merged);

  // Root first, then everyone the catalog knows about, each exactly once
  std::vector<std::string> targets{rootId};
  try {
    std::set<std::string> seen{rootId};
    for (const auto &replica : m_catalog.listReplicas()) {
      if (seen.insert(replica).second)
        targets.push_back(replica);
    }
  } catch (const CatalogError &e) {
    recordWriteFailure(result, "*", e.kind(), e.what());
  } catch (const std::exception &e) {
    recordWriteFailure(result, "*", ErrorKind::ScopeUnavailable, e.what());
  }

  PlaylistWriter writer(dryRun);
  for (size_t i = 0; i < targets.size(); ++i) {
    if (cancelled()) {
      result.cancelled = true;
      break;
    }
    auto written = writeReplica(
        targets[i], i == 0,
        [&](ScopedCatalog &scope) {
          return writer.replace(scope, playlistName, items);
        },
        result);
    if (written)
      result.added += *written;
  }
  std::cout << "[Reconcile] '" << playlistName << "' pushed to "
            << result.replicasUpdated << " of " << targets.size()
            << " replicas" << std::endl;
  return result;
}

SyncResult ReconciliationService::syncTopRated(double minRating,
                                               const std::string &playlistName,
                                               bool dryRun) {
  std::cout << "[Reconcile] Syncing '" << playlistName
            << "' with tracks rated >= " << minRating << std::endl;
  const std::string rootId = requireRoot();

  SyncResult result;
  result.dryRun = dryRun;

  Collector collector(m_catalog, m_cancel);
  Collection collection = collector.rootByRating(minRating, false);
  result.failures = collection.failures;

  auto merged = Merger::dedupe(collection.items);
  if (merged.empty())
    return result;

  result.total = static_cast<int32_t>(merged.size());
  result.tracks = Report::tracks(merged);
  const auto items = Merger::itemsOf(merged);

  PlaylistWriter writer(dryRun);
  auto written = writeReplica(
      rootId, true,
      [&](ScopedCatalog &scope) {
        return writer.replace(scope, playlistName, items);
      },
      result);
  if (written)
    result.added = *written;
  return result;
}

} // namespace plsync
