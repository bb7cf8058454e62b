#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace neurosync {

constexpr const char *kDefaultServer = "https://openneuro.org";
constexpr const char *kServerEnv = "OPENNEURO_SERVER";
constexpr const char *kTokenEnv = "OPENNEURO_TOKEN";
constexpr const char *kConfigPathEnv = "OPENNEURO_CONFIG";

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ClientConfig {
  std::string server = kDefaultServer;
  std::optional<std::string> token;
  std::string credentialPath;
};

/**
 * Environment hides where variables come from so resolution can be tested
 * without touching the process environment.
 */
class Environment {
public:
  virtual ~Environment() = default;
  virtual std::optional<std::string> lookup(const std::string &name) const = 0;
};

class ProcessEnvironment : public Environment {
public:
  std::optional<std::string> lookup(const std::string &name) const override;
};

class MapEnvironment : public Environment {
public:
  explicit MapEnvironment(std::map<std::string, std::string> values)
      : m_values(std::move(values)) {}
  std::optional<std::string> lookup(const std::string &name) const override;

private:
  std::map<std::string, std::string> m_values;
};

struct StoredCredentials {
  std::optional<std::string> server;
  std::optional<std::string> token;
};

// JSON credential file: {"server": "...", "token": "..."}
class CredentialStore {
public:
  explicit CredentialStore(std::string path);

  // Missing file yields empty credentials; unreadable or malformed throws.
  StoredCredentials load() const;
  void save(const StoredCredentials &credentials) const;
  const std::string &path() const { return m_path; }

private:
  std::string m_path;
};

std::string defaultCredentialPath(const Environment &env);
std::string normalizeServerUrl(const std::string &server);

// Environment first, then the credential file, then the built-in server.
ClientConfig resolveConfig(const Environment &env, const CredentialStore &store);

} // namespace neurosync
