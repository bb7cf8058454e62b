#pragma once
#include "ByteStream.hpp"
#include "Cancellation.hpp"
#include "FileSystemScanner.hpp"
#include "ProgressReporter.hpp"
#include "RemoteService.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace neurosync {

// Unused sibling of destination that downloads are written to before the
// final rename.
std::filesystem::path stagingPathFor(const std::filesystem::path &destination);

/**
 * TransferExecutor moves planned files one at a time. A failing file is
 * recorded and skipped; AuthError and cancellation end the batch.
 */
class TransferExecutor {
public:
  TransferExecutor(RemoteService &remote, const std::string &datasetId,
                   const FileSystemScanner &scanner,
                   const CancellationToken &cancel,
                   ProgressSink *progress = nullptr);

  TransferOutcome transfer(const PlanEntry &item, Direction direction);
  BatchOutcome transferAll(const std::vector<PlanEntry> &items,
                           Direction direction);

private:
  RemoteService &m_remote;
  std::string m_datasetId;
  const FileSystemScanner &m_scanner;
  const CancellationToken &m_cancel;
  ProgressSink *m_progress;

  void upload(const PlanEntry &item, const ProgressStream::Callback &onProgress);
  void download(const PlanEntry &item,
                const ProgressStream::Callback &onProgress);
};

} // namespace neurosync
