#include "SyncCommands.hpp"
#include "DeletionExecutor.hpp"
#include "FileSystemScanner.hpp"
#include "ReconciliationService.hpp"
#include "RemoteListingIndex.hpp"
#include "TransferExecutor.hpp"
#include <algorithm>
#include <cctype>

namespace neurosync {

SyncCommands::SyncCommands(RemoteService &remote,
                           const CancellationToken &cancel,
                           ProgressSink *progress, std::istream &in,
                           std::ostream &out)
    : m_remote(remote), m_cancel(cancel), m_progress(progress), m_in(in),
      m_out(out) {}

bool SyncCommands::confirm(const std::string &question) {
  m_out << question << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(m_in, answer))
    return false;
  answer.erase(std::remove_if(answer.begin(), answer.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               answer.end());
  std::transform(answer.begin(), answer.end(), answer.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return answer == "y" || answer == "yes";
}

int SyncCommands::summarize(const ReconciliationPlan &plan,
                            const BatchOutcome &transfers,
                            const std::optional<DeletionOutcome> &deletions) {
  for (const auto &rejected : plan.rejected) {
    std::cerr << "[Main] Skipped " << rejected.key << ": " << rejected.reason
              << std::endl;
  }

  size_t failures = transfers.failed() + plan.rejected.size();
  bool cancelled = transfers.cancelled || m_cancel.cancelled();
  m_out << "Transferred " << transfers.succeeded() << " of "
        << plan.toTransfer.size() << " files ("
        << plan.alreadySynchronized.size() << " already in sync)";
  if (deletions) {
    failures += deletions->failed();
    cancelled = cancelled || deletions->cancelled;
    m_out << ", deleted " << deletions->succeeded() << " of "
          << plan.orphanedOnTarget.size() << " orphans";
  } else if (!plan.orphanedOnTarget.empty()) {
    m_out << ", " << plan.orphanedOnTarget.size()
          << " orphans kept (use --delete to remove)";
  }
  m_out << std::endl;

  if (cancelled) {
    std::cerr << "[Main] Interrupted" << std::endl;
    return kExitInterrupted;
  }
  if (failures > 0) {
    std::cerr << "[Main] " << failures << " item(s) failed" << std::endl;
    return kExitPartial;
  }
  return kExitOk;
}

int SyncCommands::upload(const UploadOptions &options) {
  if (!m_remote.authenticated())
    throw AuthError("upload requires an access token; run `openneuro-cli login`");

  std::string datasetId;
  if (options.datasetId) {
    datasetId = *options.datasetId;
  } else if (options.force ||
             confirm("No dataset given. Create a new dataset?")) {
    datasetId = m_remote.createDataset();
    m_out << "Created dataset " << datasetId << std::endl;
  } else {
    m_out << "Aborted: no dataset to upload to." << std::endl;
    return kExitFatal;
  }
  m_lastDatasetId = datasetId;

  RemoteIndex index = RemoteListingIndex(m_remote).list(datasetId, std::nullopt);
  ReconciliationPlan plan =
      ReconciliationService(options.path).plan(index, Direction::Upload);

  FileSystemScanner scanner(options.path);
  TransferExecutor transfers(m_remote, datasetId, scanner, m_cancel,
                             m_progress);
  BatchOutcome transferred = transfers.transferAll(plan.toTransfer,
                                                   Direction::Upload);

  std::optional<DeletionOutcome> deleted;
  if (options.deleteOrphans && !transferred.cancelled) {
    DeletionExecutor deletions(m_remote, datasetId, m_cancel);
    deleted = deletions.deleteAll(plan.orphanedOnTarget, Side::Remote);
  }
  return summarize(plan, transferred, deleted);
}

int SyncCommands::download(const DownloadOptions &options) {
  RemoteIndex index =
      RemoteListingIndex(m_remote).list(options.datasetId, options.version);
  ReconciliationPlan plan =
      ReconciliationService(options.path).plan(index, Direction::Download);

  FileSystemScanner scanner(options.path);
  TransferExecutor transfers(m_remote, options.datasetId, scanner, m_cancel,
                             m_progress);
  BatchOutcome transferred = transfers.transferAll(plan.toTransfer,
                                                   Direction::Download);

  std::optional<DeletionOutcome> deleted;
  if (options.deleteOrphans && !transferred.cancelled) {
    DeletionExecutor deletions(m_remote, options.datasetId, m_cancel);
    deleted = deletions.deleteAll(plan.orphanedOnTarget, Side::Local);
  }
  return summarize(plan, transferred, deleted);
}

int SyncCommands::publish(const std::string &datasetId) {
  m_remote.publishDataset(datasetId);
  m_out << "Published " << datasetId << std::endl;
  return kExitOk;
}

void saveLogin(const CredentialStore &store, const std::string &server,
               const std::string &token) {
  if (token.empty())
    throw ConfigError("empty token");
  StoredCredentials creds;
  creds.server = normalizeServerUrl(server);
  creds.token = token;
  store.save(creds);
  std::cout << "[Login] Saved credentials for " << *creds.server << " to "
            << store.path() << std::endl;
}

} // namespace neurosync
