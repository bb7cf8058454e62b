#include "ApiClient.hpp"
#include "FileSystemScanner.hpp"
#include <httplib.h>
#include <array>
#include <cctype>
#include <exception>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <vector>

#ifndef NEUROSYNC_VERSION
#define NEUROSYNC_VERSION "0.1.0"
#endif

using json = nlohmann::json;

namespace neurosync {

namespace {

const char *kGraphqlPath = "/crn/graphql";

const char *kCreateDataset =
    "mutation createDataset($affirmedDefaced: Boolean, $affirmedConsent: "
    "Boolean) { createDataset(affirmedDefaced: $affirmedDefaced, "
    "affirmedConsent: $affirmedConsent) { id } }";

const char *kUpdateFiles =
    "mutation updateFiles($datasetId: ID!, $files: FileTree!) { "
    "updateFiles(datasetId: $datasetId, files: $files) }";

const char *kDeleteFiles =
    "mutation deleteFiles($datasetId: ID!, $files: [DeleteFile]) { "
    "deleteFiles(datasetId: $datasetId, files: $files) }";

const char *kPublishDataset =
    "mutation publishDataset($datasetId: ID!) { "
    "publishDataset(datasetId: $datasetId) }";

constexpr size_t kChunkSize = 64 * 1024;

void configure(httplib::Client &client) {
  client.set_connection_timeout(30, 0);
  client.set_read_timeout(300, 0);
  client.set_write_timeout(300, 0);
  client.set_follow_location(true);
}

template <typename Error>
void checkResponse(const httplib::Result &res, const std::string &what) {
  if (!res) {
    std::cerr << "[API] " << what << " failed: "
              << httplib::to_string(res.error()) << std::endl;
    throw Error(what + ": " + httplib::to_string(res.error()));
  }
  if (res->status == 401 || res->status == 403) {
    std::cerr << "[API] " << what << " rejected with status: " << res->status
              << std::endl;
    throw AuthError(what + ": not authorized (HTTP " +
                    std::to_string(res->status) + ")");
  }
  if (res->status < 200 || res->status >= 300) {
    std::cerr << "[API] " << what << " failed with status: " << res->status
              << std::endl;
    throw Error(what + ": HTTP " + std::to_string(res->status));
  }
}

json parseGraphqlResponse(const std::string &body, const std::string &what) {
  json data;
  try {
    data = json::parse(body);
  } catch (const json::parse_error &e) {
    std::cerr << "[API] JSON Parse Error: " << e.what() << std::endl;
    throw RemoteError(what + ": invalid response");
  }
  if (data.contains("errors") && data["errors"].is_array() &&
      !data["errors"].empty()) {
    const json &first = data["errors"][0];
    std::string message = first.dump();
    if (first.is_object() && first.contains("message") &&
        first["message"].is_string())
      message = first["message"].get<std::string>();
    throw RemoteError(what + ": " + message);
  }
  if (!data.contains("data"))
    throw RemoteError(what + ": response has no data");
  return data["data"];
}

} // namespace

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

void validateDatasetId(const std::string &datasetId) {
  if (datasetId.empty())
    throw RemoteError("dataset id is empty");
  for (char c : datasetId) {
    if (c == '/' || c == '\\' || c == '?' || c == '#' ||
        std::isspace(static_cast<unsigned char>(c)))
      throw RemoteError("invalid dataset id '" + datasetId + "'");
  }
  if (datasetId == "." || datasetId == "..")
    throw RemoteError("invalid dataset id '" + datasetId + "'");
}

std::pair<std::string, std::string> splitUrl(const std::string &url) {
  auto scheme = url.find("://");
  if (scheme == std::string::npos)
    throw TransferError("not an absolute URL: " + url);
  auto slash = url.find('/', scheme + 3);
  if (slash == std::string::npos)
    return {url, "/"};
  return {url.substr(0, slash), url.substr(slash)};
}

json buildFileTree(const std::string &remotePath, std::string &uploadSlot) {
  std::vector<std::string> segments;
  std::stringstream ss(FileSystemScanner::normalizeRemoteKey(remotePath));
  std::string item;
  while (std::getline(ss, item, '/'))
    segments.push_back(item);
  if (segments.empty())
    throw TransferError("cannot upload to an empty path");

  json root = {{"name", ""},
               {"files", json::array()},
               {"directories", json::array()}};
  json *node = &root;
  uploadSlot = "variables.files";
  for (size_t i = 0; i + 1 < segments.size(); ++i) {
    (*node)["directories"].push_back({{"name", segments[i]},
                                      {"files", json::array()},
                                      {"directories", json::array()}});
    node = &(*node)["directories"].back();
    uploadSlot += ".directories.0";
  }
  (*node)["files"].push_back(nullptr);
  uploadSlot += ".files.0";
  return root;
}

struct ApiClient::Impl {
  httplib::Client client;
  explicit Impl(const std::string &baseUrl) : client(baseUrl) {
    if (!client.is_valid())
      throw ConfigError("unusable server URL " + baseUrl);
    configure(client);
  }

  static std::unique_ptr<Impl> create(const std::string &baseUrl) {
    try {
      return std::make_unique<Impl>(baseUrl);
    } catch (const std::invalid_argument &e) {
      std::cerr << "[API] Rejected server URL " << baseUrl << ": " << e.what()
                << std::endl;
      throw ConfigError("unsupported server URL " + baseUrl + ": " + e.what());
    }
  }

  json graphql(const std::string &what, const std::string &query,
               const json &variables) {
    json body = {{"query", query}, {"variables", variables}};
    auto res = client.Post(kGraphqlPath, body.dump(), "application/json");
    checkResponse<RemoteError>(res, what);
    return parseGraphqlResponse(res->body, what);
  }
};

ApiClient::ApiClient(const ClientConfig &config,
                     const CancellationToken *cancel)
    : m_impl(Impl::create(config.server)), m_config(config),
      m_cancel(cancel) {
  httplib::Headers headers = {
      {"User-Agent", std::string("neurosync/") + NEUROSYNC_VERSION}};
  if (m_config.token)
    headers.emplace("Cookie", "accessToken=" + *m_config.token);
  m_impl->client.set_default_headers(headers);
}

ApiClient::~ApiClient() = default;

bool ApiClient::authenticated() const { return m_config.token.has_value(); }

bool ApiClient::cancelled() const {
  return m_cancel != nullptr && m_cancel->cancelled();
}

void ApiClient::requireToken(const std::string &operation) const {
  if (!authenticated())
    throw AuthError(operation +
                    " requires an access token; run `openneuro-cli login`");
}

std::string
ApiClient::datasetPath(const std::string &datasetId,
                       const std::optional<std::string> &version) {
  validateDatasetId(datasetId);
  std::string path = "/crn/datasets/" + urlEncode(datasetId);
  if (version)
    path += "/snapshots/" + urlEncode(*version);
  path += "/download";
  return path;
}

RemoteListing
ApiClient::listFiles(const std::string &datasetId,
                     const std::optional<std::string> &version) {
  std::string path = datasetPath(datasetId, version);
  auto res = m_impl->client.Get(path);
  checkResponse<RemoteError>(res, "listing " + datasetId);

  RemoteListing listing;
  try {
    auto data = json::parse(res->body);
    listing.datasetId = data.value("datasetId", std::string());
    for (const auto &item : data.at("files")) {
      RemoteFile file;
      file.filename = item.at("filename").get<std::string>();
      file.size = item.at("size").get<int64_t>();
      if (item.contains("urls") && item["urls"].is_array()) {
        for (const auto &url : item["urls"])
          file.urls.push_back(url.get<std::string>());
      }
      listing.files.push_back(file);
    }
  } catch (const json::exception &e) {
    std::cerr << "[API] JSON Parse Error: " << e.what() << std::endl;
    throw RemoteError("malformed listing for " + datasetId + ": " + e.what());
  }
  return listing;
}

std::string ApiClient::createDataset() {
  requireToken("creating a dataset");
  json variables = {{"affirmedDefaced", true}, {"affirmedConsent", true}};
  json data = m_impl->graphql("createDataset", kCreateDataset, variables);
  try {
    std::string id = data.at("createDataset").at("id").get<std::string>();
    std::cout << "[API] Created dataset " << id << std::endl;
    return id;
  } catch (const json::exception &e) {
    throw RemoteError(std::string("createDataset: unexpected response: ") +
                      e.what());
  }
}

void ApiClient::uploadFile(const std::string &datasetId, ByteStream &source,
                           const std::string &remotePath) {
  requireToken("uploading");
  validateDatasetId(datasetId);

  std::string slot;
  json files = buildFileTree(remotePath, slot);
  json operations = {{"query", kUpdateFiles},
                     {"variables", {{"datasetId", datasetId}, {"files", files}}}};
  json map = {{"0", json::array({slot})}};
  std::string filename =
      remotePath.substr(remotePath.find_last_of('/') + 1);

  std::exception_ptr failure;
  auto buffer = std::make_shared<std::array<char, kChunkSize>>();
  auto provider = [&, buffer](size_t /*offset*/, httplib::DataSink &sink) {
    if (cancelled())
      return false;
    size_t n = 0;
    try {
      n = source.read(buffer->data(), buffer->size());
    } catch (...) {
      failure = std::current_exception();
      return false;
    }
    if (n == 0) {
      sink.done();
      return true;
    }
    return sink.write(buffer->data(), n);
  };

  httplib::UploadFormDataItems items = {
      {"operations", operations.dump(), "", "application/json"},
      {"map", map.dump(), "", "application/json"}};
  httplib::FormDataProviderItems providers = {
      {"0", provider, filename, "application/octet-stream"}};

  auto res = m_impl->client.Post(kGraphqlPath, httplib::Headers{}, items,
                                 providers);
  if (failure)
    std::rethrow_exception(failure);
  checkResponse<TransferError>(res, "upload " + remotePath);
  try {
    parseGraphqlResponse(res->body, "upload " + remotePath);
  } catch (const RemoteError &e) {
    throw TransferError(e.what());
  }
}

void ApiClient::deleteFile(const std::string &datasetId,
                           const std::string &remotePath) {
  requireToken("deleting");
  validateDatasetId(datasetId);
  std::string key = FileSystemScanner::normalizeRemoteKey(remotePath);
  auto slash = key.find_last_of('/');
  std::string dir = slash == std::string::npos ? "" : key.substr(0, slash);
  std::string filename =
      slash == std::string::npos ? key : key.substr(slash + 1);

  json variables = {
      {"datasetId", datasetId},
      {"files", json::array({{{"path", dir}, {"filename", filename}}})}};
  m_impl->graphql("delete " + key, kDeleteFiles, variables);
}

void ApiClient::publishDataset(const std::string &datasetId) {
  requireToken("publishing");
  validateDatasetId(datasetId);
  m_impl->graphql("publish " + datasetId, kPublishDataset,
                  {{"datasetId", datasetId}});
  std::cout << "[API] Published dataset " << datasetId << std::endl;
}

void ApiClient::download(const std::string &url, ByteStream &destination) {
  std::pair<std::string, std::string> parts = splitUrl(url);
  const std::string &origin = parts.first;
  const std::string &target = parts.second;

  std::exception_ptr failure;
  auto receiver = [&](const char *data, size_t length) {
    if (cancelled())
      return false;
    try {
      destination.write(data, length);
    } catch (...) {
      failure = std::current_exception();
      return false;
    }
    return true;
  };

  httplib::Result res;
  if (origin == m_config.server) {
    res = m_impl->client.Get(target, receiver);
  } else {
    // Mirrors on other hosts never see the access token.
    std::unique_ptr<httplib::Client> mirror;
    try {
      mirror = std::make_unique<httplib::Client>(origin);
    } catch (const std::invalid_argument &e) {
      throw TransferError("unsupported mirror " + origin + ": " + e.what());
    }
    configure(*mirror);
    mirror->set_default_headers(
        {{"User-Agent", std::string("neurosync/") + NEUROSYNC_VERSION}});
    res = mirror->Get(target, receiver);
  }
  if (failure)
    std::rethrow_exception(failure);
  checkResponse<TransferError>(res, "download " + url);
}

} // namespace neurosync
