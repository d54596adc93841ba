#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace plsync {

class Report {
public:
  static std::vector<TrackInfo> tracks(const std::vector<MergeRecord> &merged);

  // "MM/DD" in UTC, empty when there is no timestamp
  static std::string shortDate(const std::optional<int64_t> &timestamp);

  static std::string toText(const std::string &playlistName,
                            const SyncResult &result);
  static nlohmann::json toJson(const SyncResult &result);
};

} // namespace plsync
