#include "CatalogStore.hpp"
#include "Config.hpp"
#include "PlexClient.hpp"
#include "ReconciliationService.hpp"
#include "Report.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

std::atomic<bool> cancelRequested{false};

static void signalHandler(int sig) {
  // Checked between replicas; the replica in flight finishes its write
  (void)sig;
  cancelRequested.store(true);
}

static void usage() {
  std::cerr << "usage: plsync <config.json> "
               "<recent-raves|jam-jar|staff-picks|top-rated> "
               "[--dry-run] [--json]"
            << std::endl;
}

static std::unique_ptr<plsync::CatalogClient>
makeCatalog(const plsync::CatalogConfig &cfg) {
  if (cfg.backend == "sqlite") {
    auto store = std::make_unique<plsync::CatalogStore>(cfg.path);
    if (!store->open())
      throw std::runtime_error("Failed to open catalog " + cfg.path);
    store->initializeSchema();
    return store;
  }
  return std::make_unique<plsync::PlexClient>(cfg.url, cfg.admin, cfg.token,
                                              cfg.replicas);
}

int main(int argc, char **argv) {
  if (argc < 3) {
    usage();
    return 2;
  }
  const std::string configPath = argv[1];
  const std::string command = argv[2];
  bool dryRun = false;
  bool asJson = false;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dry-run") {
      dryRun = true;
    } else if (arg == "--json") {
      asJson = true;
    } else {
      usage();
      return 2;
    }
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    plsync::Config cfg = plsync::loadConfig(configPath);
    auto catalog = makeCatalog(cfg.catalog);
    std::cout << "[Main] Catalog backend: " << cfg.catalog.backend << std::endl;

    plsync::ReconciliationService service(*catalog, &cancelRequested);
    plsync::SyncResult result;
    std::string playlist;

    if (command == "recent-raves") {
      playlist = cfg.recentRaves.playlist;
      result = service.updateRecentRaves(
          cfg.recentRaves.contributors, playlist, cfg.recentRaves.maxSongs,
          cfg.recentRaves.minRating, dryRun);
    } else if (command == "jam-jar") {
      playlist = cfg.jamJar.playlist;
      result = service.syncJamJar(cfg.jamJar.members, playlist, dryRun);
    } else if (command == "staff-picks") {
      playlist = cfg.staffPicks.playlist;
      result =
          service.syncStaffPicks(cfg.staffPicks.curators, playlist, dryRun);
    } else if (command == "top-rated") {
      playlist = cfg.topRated.playlist;
      result =
          service.syncTopRated(cfg.topRated.minRating, playlist, dryRun);
    } else {
      usage();
      return 2;
    }

    if (asJson)
      std::cout << plsync::Report::toJson(result).dump(2) << std::endl;
    else
      std::cout << plsync::Report::toText(playlist, result);

  } catch (const plsync::CatalogError &e) {
    std::cerr << "[Main] Error (" << plsync::toString(e.kind()) << " on "
              << e.replica() << "): " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
