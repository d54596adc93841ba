#pragma once

#include <cstddef>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace plsync {

struct CatalogConfig {
  std::string backend = "plex"; // "plex" or "sqlite"
  std::string url = "http://localhost:32400";
  std::string admin = "admin";
  std::string token;
  std::map<std::string, std::string> replicas; // replica id -> token
  std::string path = "catalog.db";
};

struct RecentRavesConfig {
  std::string playlist = "Recent Raves";
  std::vector<std::string> contributors;
  size_t maxSongs = 50;
  double minRating = 9.9;
};

struct JamJarConfig {
  std::string playlist = "Jam Jar";
  std::vector<std::string> members;
};

struct StaffPicksConfig {
  std::string playlist = "Staff Picks";
  std::vector<std::string> curators;
};

struct TopRatedConfig {
  std::string playlist = "Top Rated";
  double minRating = 8.0;
};

struct Config {
  CatalogConfig catalog;
  RecentRavesConfig recentRaves;
  JamJarConfig jamJar;
  StaffPicksConfig staffPicks;
  TopRatedConfig topRated;
};

// Throws std::runtime_error when the file is unreadable or malformed
Config loadConfig(const std::string &path);
Config parseConfig(const nlohmann::json &root);

} // namespace plsync
