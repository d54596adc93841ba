#pragma once

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace plsync {

/**
 * A named, ordered collection of items inside exactly one replica scope.
 * Mutations hit the remote catalog directly; a failed batch may leave the
 * playlist partially updated.
 */
class PlaylistHandle {
public:
  virtual ~PlaylistHandle() = default;

  virtual std::string title() const = 0;
  // Ordered entries, each carrying its Item::entryId
  virtual std::vector<Item> items() = 0;
  virtual void addItems(const std::vector<Item> &items) = 0;
  // Removes exactly the entries named by Item::entryId, so duplicates of the
  // same key elsewhere in the playlist survive
  virtual void removeItems(const std::vector<Item> &items) = 0;
};

/**
 * Read/write access to the catalog as seen by one replica. Every call
 * applies to this replica only.
 */
class ScopedCatalog {
public:
  virtual ~ScopedCatalog() = default;

  virtual const std::string &replicaId() const = 0;

  // nullptr when no playlist with that title exists
  virtual std::unique_ptr<PlaylistHandle>
  findPlaylist(const std::string &name) = 0;
  virtual std::unique_ptr<PlaylistHandle>
  createPlaylist(const std::string &name, const std::vector<Item> &items) = 0;

  // Items rated >= minRating in sections of the given type. Item::timestamp
  // carries the last-rated time when the catalog knows it.
  virtual std::vector<Item> searchByRating(const std::string &sectionType,
                                           double minRating) = 0;
};

/**
 * Entry point to a shared catalog with one root (admin) scope and any
 * number of peer replica scopes. Failures are reported as CatalogError.
 */
class CatalogClient {
public:
  virtual ~CatalogClient() = default;

  virtual std::unique_ptr<ScopedCatalog> rootScope() = 0;
  virtual std::unique_ptr<ScopedCatalog>
  switchScope(const std::string &replicaId) = 0;

  // Known replicas other than the root scope
  virtual std::vector<std::string> listReplicas() = 0;
};

} // namespace plsync
