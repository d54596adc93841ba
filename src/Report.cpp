#include "Report.hpp"
#include <ctime>
#include <sstream>

using json = nlohmann::json;

namespace plsync {

std::vector<TrackInfo>
Report::tracks(const std::vector<MergeRecord> &merged) {
  std::vector<TrackInfo> list;
  list.reserve(merged.size());
  for (const auto &r : merged) {
    TrackInfo t;
    t.title = r.item.title;
    t.artist = r.item.artist.empty() ? "Unknown" : r.item.artist;
    t.user = r.replica.empty() ? "Unknown" : r.replica;
    t.timestamp = r.timestamp;
    list.push_back(t);
  }
  return list;
}

std::string Report::shortDate(const std::optional<int64_t> &timestamp) {
  if (!timestamp)
    return "";
  std::time_t t = static_cast<std::time_t>(*timestamp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[8];
  std::strftime(buf, sizeof(buf), "%m/%d", &tm);
  return buf;
}

std::string Report::toText(const std::string &playlistName,
                           const SyncResult &result) {
  std::ostringstream out;
  out << playlistName << ": " << result.total << " tracks, " << result.added
      << " added, " << result.replicasUpdated << " replicas updated";
  if (result.dryRun)
    out << " (dry run)";
  if (result.cancelled)
    out << " (cancelled)";
  out << "\n";

  int i = 1;
  for (const auto &t : result.tracks) {
    out << i++ << ". " << t.title << " - " << t.artist << " (" << t.user;
    std::string date = shortDate(t.timestamp);
    if (!date.empty())
      out << ", " << date;
    out << ")\n";
  }
  for (const auto &f : result.failures) {
    out << "! " << f.replica << " "
        << (f.stage == Stage::Collect ? "collect" : "write") << " failed ["
        << toString(f.error) << "]: " << f.message << "\n";
  }
  return out.str();
}

json Report::toJson(const SyncResult &result) {
  json data;
  data["total"] = result.total;
  data["added"] = result.added;
  data["replicas_updated"] = result.replicasUpdated;
  data["cancelled"] = result.cancelled;
  data["dry_run"] = result.dryRun;

  data["tracks"] = json::array();
  for (const auto &t : result.tracks) {
    json track;
    track["title"] = t.title;
    track["artist"] = t.artist;
    track["user"] = t.user;
    if (t.timestamp)
      track["timestamp"] = *t.timestamp;
    else
      track["timestamp"] = nullptr;
    track["date"] = shortDate(t.timestamp);
    data["tracks"].push_back(track);
  }

  data["failures"] = json::array();
  for (const auto &f : result.failures) {
    json failure;
    failure["replica"] = f.replica;
    failure["stage"] = f.stage == Stage::Collect ? "collect" : "write";
    failure["error"] = toString(f.error);
    failure["message"] = f.message;
    data["failures"].push_back(failure);
  }
  return data;
}

} // namespace plsync
