#pragma once

#include "CatalogClient.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace plsync {

/**
 * PlexClient talks to a Plex Media Server.
 * Uses cpp-httplib for networking and nlohmann/json for parsing. Each
 * replica is reached with its own access token; the admin token backs the
 * root scope.
 */
class PlexClient : public CatalogClient {
public:
  PlexClient(const std::string &baseUrl, const std::string &adminName,
             const std::string &adminToken,
             const std::map<std::string, std::string> &replicaTokens);
  ~PlexClient() override;

  std::unique_ptr<ScopedCatalog> rootScope() override;
  std::unique_ptr<ScopedCatalog>
  switchScope(const std::string &replicaId) override;
  std::vector<std::string> listReplicas() override;

  struct Impl;

private:
  std::unique_ptr<Impl> m_impl;
  std::string m_baseUrl;
  std::string m_adminName;
  std::string m_adminToken;
  std::map<std::string, std::string> m_replicaTokens;

  std::unique_ptr<ScopedCatalog> open(const std::string &replica,
                                      const std::string &token);
};

} // namespace plsync
