#pragma once
#include "Cancellation.hpp"
#include "Config.hpp"
#include "ProgressReporter.hpp"
#include "RemoteService.hpp"
#include "types.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace neurosync {

enum ExitCode : int {
  kExitOk = 0,
  kExitFatal = 1,
  kExitPartial = 2,
  kExitInterrupted = 130,
};

struct UploadOptions {
  std::optional<std::string> datasetId;
  std::string path = ".";
  bool deleteOrphans = false;
  bool force = false;
};

struct DownloadOptions {
  std::string datasetId;
  std::optional<std::string> version;
  std::string path = ".";
  bool deleteOrphans = false;
};

/**
 * SyncCommands runs one CLI command end to end: list, plan, transfer and
 * optionally delete. Fatal errors (listing, auth) propagate to the caller;
 * per-file failures only affect the returned exit code.
 */
class SyncCommands {
public:
  SyncCommands(RemoteService &remote, const CancellationToken &cancel,
               ProgressSink *progress = nullptr, std::istream &in = std::cin,
               std::ostream &out = std::cout);

  int upload(const UploadOptions &options);
  int download(const DownloadOptions &options);
  int publish(const std::string &datasetId);

  // Dataset used by the last upload, including one created on the fly.
  const std::string &lastDatasetId() const { return m_lastDatasetId; }

private:
  RemoteService &m_remote;
  const CancellationToken &m_cancel;
  ProgressSink *m_progress;
  std::istream &m_in;
  std::ostream &m_out;
  std::string m_lastDatasetId;

  bool confirm(const std::string &question);
  int summarize(const ReconciliationPlan &plan, const BatchOutcome &transfers,
                const std::optional<DeletionOutcome> &deletions);
};

// Persists the token for server, replacing any stored credentials.
void saveLogin(const CredentialStore &store, const std::string &server,
               const std::string &token);

} // namespace neurosync
