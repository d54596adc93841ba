#include "Config.hpp"
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace plsync {

namespace {

template <typename T>
T getOrDefault(const json &node, const char *key, const T &def) {
  if (!node.contains(key) || node[key].is_null())
    return def;
  try {
    return node[key].get<T>();
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("[Config] Invalid value for '") +
                             key + "': " + e.what());
  }
}

const json &section(const json &root, const char *name) {
  static const json empty = json::object();
  if (!root.contains(name))
    return empty;
  if (!root[name].is_object())
    throw std::runtime_error(std::string("[Config] Section '") + name +
                             "' must be an object");
  return root[name];
}

} // namespace

Config parseConfig(const json &root) {
  if (!root.is_object())
    throw std::runtime_error("[Config] Top level must be an object");

  Config cfg;

  const auto &catalog = section(root, "catalog");
  cfg.catalog.backend = getOrDefault(catalog, "backend", cfg.catalog.backend);
  cfg.catalog.url = getOrDefault(catalog, "url", cfg.catalog.url);
  cfg.catalog.admin = getOrDefault(catalog, "admin", cfg.catalog.admin);
  cfg.catalog.token = getOrDefault(catalog, "token", cfg.catalog.token);
  cfg.catalog.replicas = getOrDefault(catalog, "replicas", cfg.catalog.replicas);
  cfg.catalog.path = getOrDefault(catalog, "path", cfg.catalog.path);
  if (cfg.catalog.backend != "plex" && cfg.catalog.backend != "sqlite")
    throw std::runtime_error("[Config] Unknown catalog backend '" +
                             cfg.catalog.backend + "'");

  const auto &raves = section(root, "recent_raves");
  cfg.recentRaves.playlist =
      getOrDefault(raves, "playlist", cfg.recentRaves.playlist);
  cfg.recentRaves.contributors =
      getOrDefault(raves, "contributors", cfg.recentRaves.contributors);
  const auto maxSongs = getOrDefault<int64_t>(
      raves, "max_songs", static_cast<int64_t>(cfg.recentRaves.maxSongs));
  if (maxSongs < 0)
    throw std::runtime_error("[Config] 'max_songs' must not be negative");
  cfg.recentRaves.maxSongs = static_cast<size_t>(maxSongs);
  cfg.recentRaves.minRating =
      getOrDefault(raves, "min_rating", cfg.recentRaves.minRating);

  const auto &jamJar = section(root, "jam_jar");
  cfg.jamJar.playlist = getOrDefault(jamJar, "playlist", cfg.jamJar.playlist);
  cfg.jamJar.members = getOrDefault(jamJar, "members", cfg.jamJar.members);

  const auto &picks = section(root, "staff_picks");
  cfg.staffPicks.playlist =
      getOrDefault(picks, "playlist", cfg.staffPicks.playlist);
  cfg.staffPicks.curators =
      getOrDefault(picks, "curators", cfg.staffPicks.curators);

  const auto &top = section(root, "top_rated");
  cfg.topRated.playlist = getOrDefault(top, "playlist", cfg.topRated.playlist);
  cfg.topRated.minRating =
      getOrDefault(top, "min_rating", cfg.topRated.minRating);

  return cfg;
}

Config loadConfig(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("[Config] Cannot open " + path);
  json root;
  try {
    root = json::parse(in);
  } catch (const json::exception &e) {
    throw std::runtime_error("[Config] JSON Parse Error in " + path + ": " +
                             e.what());
  }
  return parseConfig(root);
}

} // namespace plsync
