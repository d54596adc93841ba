#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace plsync {

struct Item {
  std::string key; // catalog ratingKey, the only identity used for dedup
  std::string title;
  std::string artist;
  std::optional<int64_t> timestamp; // unix seconds, meaning set by collector
  // Playlist entry this item was read from; empty for library items. Ignored
  // on add, required on remove.
  std::string entryId;
};

struct CollectedItem {
  Item item;
  std::string replica;
  std::optional<int64_t> timestamp;
};

struct MergeRecord {
  Item item;
  std::optional<int64_t> timestamp;
  std::string replica;
};

enum class ErrorKind {
  ScopeUnavailable,
  PlaylistReadFailure,
  PlaylistWriteFailure
};

const char *toString(ErrorKind kind);

class CatalogError : public std::runtime_error {
public:
  CatalogError(ErrorKind kind, const std::string &replica,
               const std::string &message)
      : std::runtime_error(message), m_kind(kind), m_replica(replica) {}

  ErrorKind kind() const { return m_kind; }
  const std::string &replica() const { return m_replica; }

private:
  ErrorKind m_kind;
  std::string m_replica;
};

enum class Stage { Collect, Write };

struct ReplicaOutcome {
  std::string replica;
  Stage stage;
  ErrorKind error;
  std::string message;
};

struct TrackInfo {
  std::string title;
  std::string artist;
  std::string user;
  std::optional<int64_t> timestamp;
};

struct SyncResult {
  int32_t total = 0;
  int32_t added = 0;
  int32_t replicasUpdated = 0;
  std::vector<TrackInfo> tracks;
  std::vector<ReplicaOutcome> failures;
  bool cancelled = false;
  bool dryRun = false;
};

} // namespace plsync
