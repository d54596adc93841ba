#pragma once
#include "CatalogClient.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace plsync {

/**
 * Write primitives applied to one replica at a time. Catalog failures are
 * not caught here; the caller decides how a failed replica is reported.
 * In dry-run mode playlists are read but never mutated and the returned
 * counts describe what would have been written.
 */
class PlaylistWriter {
public:
  explicit PlaylistWriter(bool dryRun = false);

  // Make the playlist contain exactly `items`, creating it when missing.
  // Returns the number of items written.
  int32_t replace(ScopedCatalog &scope, const std::string &name,
                  const std::vector<Item> &items);

  // Append the items whose key is not already present, then drop
  // everything past position `cap`. Returns the number appended.
  int32_t appendMissing(ScopedCatalog &scope, const std::string &name,
                        const std::vector<Item> &items, size_t cap);

  bool dryRun() const { return m_dryRun; }

private:
  bool m_dryRun;
};

} // namespace plsync
