#include "PlexClient.hpp"
#include <httplib.h>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace plsync {

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

namespace {

constexpr const char *kTrackType = "10";
constexpr double kRatingStep = 0.1;

std::string stringField(const json &m, const char *name) {
  if (!m.contains(name) || m[name].is_null())
    return "";
  if (m[name].is_string())
    return m[name].get<std::string>();
  return m[name].dump();
}

std::optional<int64_t> timeField(const json &m, const char *name) {
  if (!m.contains(name) || !m[name].is_number_integer())
    return std::nullopt;
  int64_t value = m[name].get<int64_t>();
  if (value <= 0)
    return std::nullopt;
  return value;
}

Item itemFromMetadata(const json &m, const char *timestampField) {
  Item item;
  item.key = stringField(m, "ratingKey");
  item.title = stringField(m, "title");
  item.artist = stringField(m, "grandparentTitle");
  if (item.artist.empty())
    item.artist = stringField(m, "originalTitle");
  if (item.artist.empty())
    item.artist = "Unknown";
  item.timestamp = timeField(m, timestampField);
  return item;
}

const json &metadataOf(const json &body, const char *list = "Metadata") {
  static const json empty = json::array();
  if (!body.contains("MediaContainer"))
    return empty;
  const auto &container = body["MediaContainer"];
  if (!container.contains(list))
    return empty;
  return container[list];
}

} // namespace

struct PlexClient::Impl {
  httplib::Client client;
  std::string machineId;

  Impl(const std::string &baseUrl) : client(baseUrl) {
    client.set_connection_timeout(30, 0);
    client.set_read_timeout(30, 0);
    client.set_write_timeout(30, 0);
    client.set_follow_location(true);
  }

  static httplib::Headers headers(const std::string &token) {
    return {{"X-Plex-Token", token}, {"Accept", "application/json"}};
  }

  static void check(const httplib::Result &res, const std::string &what,
                    ErrorKind kind, const std::string &replica) {
    if (!res)
      throw CatalogError(kind, replica,
                         what + ": " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
      throw CatalogError(kind, replica,
                         what + ": HTTP " + std::to_string(res->status));
  }

  json get(const std::string &path, const std::string &token, ErrorKind kind,
           const std::string &replica) {
    auto res = client.Get(path, headers(token));
    check(res, "GET " + path, kind, replica);
    try {
      return json::parse(res->body);
    } catch (const json::exception &e) {
      throw CatalogError(kind, replica,
                         "GET " + path + ": JSON Parse Error: " + e.what());
    }
  }

  json post(const std::string &path, const std::string &token,
            const std::string &replica) {
    auto res = client.Post(path, headers(token), "", "text/plain");
    check(res, "POST " + path, ErrorKind::PlaylistWriteFailure, replica);
    try {
      return json::parse(res->body);
    } catch (const json::exception &e) {
      throw CatalogError(ErrorKind::PlaylistWriteFailure, replica,
                         "POST " + path + ": JSON Parse Error: " + e.what());
    }
  }

  void put(const std::string &path, const std::string &token,
           const std::string &replica) {
    auto res = client.Put(path, headers(token), "", "text/plain");
    check(res, "PUT " + path, ErrorKind::PlaylistWriteFailure, replica);
  }

  void del(const std::string &path, const std::string &token,
           const std::string &replica) {
    auto res = client.Delete(path, headers(token));
    check(res, "DELETE " + path, ErrorKind::PlaylistWriteFailure, replica);
  }

  std::string itemsUri(const std::vector<Item> &items) const {
    std::string keys;
    for (const auto &item : items) {
      if (!keys.empty())
        keys += ",";
      keys += item.key;
    }
    return "server://" + machineId +
           "/com.plexapp.plugins.library/library/metadata/" + keys;
  }
};

namespace {

class PlexPlaylist : public PlaylistHandle {
public:
  PlexPlaylist(PlexClient::Impl &impl, std::string replica, std::string token,
               std::string id, std::string title)
      : m_impl(impl), m_replica(std::move(replica)), m_token(std::move(token)),
        m_id(std::move(id)), m_title(std::move(title)) {}

  std::string title() const override { return m_title; }

  std::vector<Item> items() override {
    std::vector<Item> items;
    for (const auto &m : fetch()) {
      Item item = itemFromMetadata(m, "addedAt");
      item.entryId = stringField(m, "playlistItemID");
      items.push_back(item);
    }
    return items;
  }

  void addItems(const std::vector<Item> &items) override {
    if (items.empty())
      return;
    std::string path = "/playlists/" + m_id +
                       "/items?uri=" + urlEncode(m_impl.itemsUri(items));
    m_impl.put(path, m_token, m_replica);
  }

  void removeItems(const std::vector<Item> &items) override {
    // Removal is addressed by playlist entry, not by library key
    for (const auto &item : items) {
      if (item.entryId.empty())
        throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica,
                           "no playlist entry for item " + item.key);
    }
    for (const auto &item : items)
      m_impl.del("/playlists/" + m_id + "/items/" + item.entryId, m_token,
                 m_replica);
  }

private:
  PlexClient::Impl &m_impl;
  std::string m_replica;
  std::string m_token;
  std::string m_id;
  std::string m_title;

  json fetch() {
    auto body = m_impl.get("/playlists/" + m_id + "/items", m_token,
                           ErrorKind::PlaylistReadFailure, m_replica);
    return metadataOf(body);
  }
};

class PlexScope : public ScopedCatalog {
public:
  PlexScope(PlexClient::Impl &impl, std::string replica, std::string token)
      : m_impl(impl), m_replica(std::move(replica)), m_token(std::move(token)) {}

  const std::string &replicaId() const override { return m_replica; }

  std::unique_ptr<PlaylistHandle>
  findPlaylist(const std::string &name) override {
    auto body = m_impl.get("/playlists?playlistType=audio", m_token,
                           ErrorKind::PlaylistReadFailure, m_replica);
    for (const auto &m : metadataOf(body)) {
      if (stringField(m, "title") == name)
        return std::make_unique<PlexPlaylist>(m_impl, m_replica, m_token,
                                              stringField(m, "ratingKey"),
                                              name);
    }
    return nullptr;
  }

  std::unique_ptr<PlaylistHandle>
  createPlaylist(const std::string &name,
                 const std::vector<Item> &items) override {
    if (items.empty())
      throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica,
                         "cannot create empty playlist '" + name + "'");
    std::string path = "/playlists?type=audio&title=" + urlEncode(name) +
                       "&smart=0&uri=" + urlEncode(m_impl.itemsUri(items));
    auto body = m_impl.post(path, m_token, m_replica);
    const auto &created = metadataOf(body);
    if (created.empty())
      throw CatalogError(ErrorKind::PlaylistWriteFailure, m_replica,
                         "server returned no playlist for '" + name + "'");
    return std::make_unique<PlexPlaylist>(m_impl, m_replica, m_token,
                                          stringField(created[0], "ratingKey"),
                                          name);
  }

  std::vector<Item> searchByRating(const std::string &sectionType,
                                   double minRating) override {
    auto sections = m_impl.get("/library/sections", m_token,
                               ErrorKind::PlaylistReadFailure, m_replica);
    std::vector<Item> items;
    for (const auto &section : metadataOf(sections, "Directory")) {
      if (stringField(section, "type") != sectionType)
        continue;
      // The server compares strictly, so step below the threshold and let
      // the check below restore the inclusive bound
      std::ostringstream path;
      path << "/library/sections/" << stringField(section, "key")
           << "/all?type=" << kTrackType
           << "&userRating>>=" << minRating - kRatingStep;
      auto body = m_impl.get(path.str(), m_token,
                             ErrorKind::PlaylistReadFailure, m_replica);
      for (const auto &m : metadataOf(body)) {
        if (!m.contains("userRating") || !m["userRating"].is_number() ||
            m["userRating"].get<double>() < minRating)
          continue;
        items.push_back(itemFromMetadata(m, "lastRatedAt"));
      }
    }
    return items;
  }

private:
  PlexClient::Impl &m_impl;
  std::string m_replica;
  std::string m_token;
};

} // namespace

PlexClient::PlexClient(const std::string &baseUrl,
                       const std::string &adminName,
                       const std::string &adminToken,
                       const std::map<std::string, std::string> &replicaTokens)
    : m_impl(std::make_unique<Impl>(baseUrl)), m_baseUrl(baseUrl),
      m_adminName(adminName), m_adminToken(adminToken),
      m_replicaTokens(replicaTokens) {}

PlexClient::~PlexClient() = default;

std::unique_ptr<ScopedCatalog> PlexClient::open(const std::string &replica,
                                                const std::string &token) {
  // Every scope switch doubles as a reachability check
  auto identity =
      m_impl->get("/identity", token, ErrorKind::ScopeUnavailable, replica);
  if (m_impl->machineId.empty()) {
    if (!identity.contains("MediaContainer"))
      throw CatalogError(ErrorKind::ScopeUnavailable, replica,
                         "identity response without MediaContainer");
    m_impl->machineId =
        stringField(identity["MediaContainer"], "machineIdentifier");
    std::cout << "[Plex] Connected to " << m_baseUrl << " (machine "
              << m_impl->machineId << ")" << std::endl;
  }
  return std::make_unique<PlexScope>(*m_impl, replica, token);
}

std::unique_ptr<ScopedCatalog> PlexClient::rootScope() {
  return open(m_adminName, m_adminToken);
}

std::unique_ptr<ScopedCatalog>
PlexClient::switchScope(const std::string &replicaId) {
  if (replicaId == m_adminName)
    return rootScope();
  auto it = m_replicaTokens.find(replicaId);
  if (it == m_replicaTokens.end())
    throw CatalogError(ErrorKind::ScopeUnavailable, replicaId,
                       "no access token configured for '" + replicaId + "'");
  return open(replicaId, it->second);
}

std::vector<std::string> PlexClient::listReplicas() {
  std::vector<std::string> ids;
  for (const auto &[id, token] : m_replicaTokens) {
    if (id != m_adminName)
      ids.push_back(id);
  }
  return ids;
}

} // namespace plsync
