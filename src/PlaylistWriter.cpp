#include "PlaylistWriter.hpp"
#include <iostream>
#include <set>

namespace plsync {

PlaylistWriter::PlaylistWriter(bool dryRun) : m_dryRun(dryRun) {}

int32_t PlaylistWriter::replace(ScopedCatalog &scope, const std::string &name,
                                const std::vector<Item> &items) {
  const std::string &replica = scope.replicaId();
  auto playlist = scope.findPlaylist(name);

  if (m_dryRun) {
    std::cout << "[Writer] (dry run) would " << (playlist ? "replace" : "create")
              << " '" << name << "' for " << replica << " with "
              << items.size() << " tracks" << std::endl;
    return static_cast<int32_t>(items.size());
  }

  if (playlist) {
    auto current = playlist->items();
    if (!current.empty())
      playlist->removeItems(current);
    playlist->addItems(items);
    std::cout << "[Writer] Updated '" << name << "' for " << replica
              << " with " << items.size() << " tracks" << std::endl;
  } else {
    scope.createPlaylist(name, items);
    std::cout << "[Writer] Created '" << name << "' for " << replica
              << " with " << items.size() << " tracks" << std::endl;
  }
  return static_cast<int32_t>(items.size());
}

int32_t PlaylistWriter::appendMissing(ScopedCatalog &scope,
                                      const std::string &name,
                                      const std::vector<Item> &items,
                                      size_t cap) {
  const std::string &replica = scope.replicaId();
  auto playlist = scope.findPlaylist(name);

  if (!playlist) {
    if (m_dryRun) {
      std::cout << "[Writer] (dry run) would create '" << name << "' for "
                << replica << " with " << items.size() << " tracks"
                << std::endl;
    } else {
      scope.createPlaylist(name, items);
      std::cout << "[Writer] Created '" << name << "' for " << replica
                << " with " << items.size() << " tracks" << std::endl;
    }
    return static_cast<int32_t>(items.size());
  }

  auto existing = playlist->items();
  std::set<std::string> existingKeys;
  for (const auto &item : existing)
    existingKeys.insert(item.key);

  std::vector<Item> missing;
  for (const auto &item : items) {
    if (existingKeys.find(item.key) == existingKeys.end())
      missing.push_back(item);
  }

  if (m_dryRun) {
    std::cout << "[Writer] (dry run) would add " << missing.size()
              << " tracks to '" << name << "' for " << replica << std::endl;
    return static_cast<int32_t>(missing.size());
  }

  if (missing.empty()) {
    std::cout << "[Writer] No new tracks for " << replica << std::endl;
  } else {
    playlist->addItems(missing);
    std::cout << "[Writer] Added " << missing.size() << " tracks to '" << name
              << "' for " << replica << std::endl;
    existing = playlist->items();
  }

  // Evict by position: everything past the cap boundary goes
  if (cap != 0 && existing.size() > cap) {
    std::vector<Item> overflow(existing.begin() + cap, existing.end());
    playlist->removeItems(overflow);
    std::cout << "[Writer] Trimmed '" << name << "' to " << cap
              << " tracks for " << replica << std::endl;
  }
  return static_cast<int32_t>(missing.size());
}

} // namespace plsync
