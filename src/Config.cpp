#include "Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace neurosync {

std::optional<std::string>
ProcessEnvironment::lookup(const std::string &name) const {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0')
    return std::nullopt;
  return std::string(value);
}

std::optional<std::string>
MapEnvironment::lookup(const std::string &name) const {
  auto it = m_values.find(name);
  if (it == m_values.end() || it->second.empty())
    return std::nullopt;
  return it->second;
}

CredentialStore::CredentialStore(std::string path) : m_path(std::move(path)) {}

StoredCredentials CredentialStore::load() const {
  StoredCredentials creds;
  if (!fs::exists(m_path))
    return creds;

  std::ifstream in(m_path);
  if (!in)
    throw ConfigError("cannot read credential file " + m_path);

  json data;
  try {
    data = json::parse(in);
  } catch (const json::parse_error &e) {
    throw ConfigError("malformed credential file " + m_path + ": " + e.what());
  }
  if (!data.is_object())
    throw ConfigError("credential file " + m_path + " is not a JSON object");

  if (data.contains("server") && data["server"].is_string())
    creds.server = data["server"].get<std::string>();
  if (data.contains("token") && data["token"].is_string())
    creds.token = data["token"].get<std::string>();
  return creds;
}

void CredentialStore::save(const StoredCredentials &credentials) const {
  json data = json::object();
  if (credentials.server)
    data["server"] = *credentials.server;
  if (credentials.token)
    data["token"] = *credentials.token;

  fs::path target{m_path};
  if (target.has_parent_path())
    fs::create_directories(target.parent_path());

  {
    // Create empty and restrict permissions before the token is written.
    std::ofstream touch(m_path, std::ios::trunc);
    if (!touch)
      throw ConfigError("cannot write credential file " + m_path);
  }
  fs::permissions(m_path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace);

  std::ofstream out(m_path, std::ios::trunc);
  out << data.dump(2) << std::endl;
  if (!out)
    throw ConfigError("cannot write credential file " + m_path);
}

std::string defaultCredentialPath(const Environment &env) {
  if (auto path = env.lookup(kConfigPathEnv))
    return *path;
  if (auto home = env.lookup("HOME"))
    return (fs::path(*home) / ".openneuro.json").string();
  return ".openneuro.json";
}

std::string normalizeServerUrl(const std::string &server) {
  std::string url = server;
  if (url.find("://") == std::string::npos)
    url = "https://" + url;
  while (!url.empty() && url.back() == '/')
    url.pop_back();
  return url;
}

ClientConfig resolveConfig(const Environment &env,
                           const CredentialStore &store) {
  ClientConfig config;
  config.credentialPath = store.path();
  StoredCredentials stored = store.load();

  if (auto server = env.lookup(kServerEnv))
    config.server = *server;
  else if (stored.server && !stored.server->empty())
    config.server = *stored.server;
  config.server = normalizeServerUrl(config.server);

  if (auto token = env.lookup(kTokenEnv))
    config.token = token;
  else if (stored.token && !stored.token->empty())
    config.token = stored.token;

  if (!config.token) {
    std::cout << "[Config] No token configured; using anonymous access to "
              << config.server << std::endl;
  }
  return config;
}

} // namespace neurosync
