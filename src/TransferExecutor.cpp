#include "TransferExecutor.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace neurosync {

namespace {

std::atomic<unsigned> stagingCounter{0};

int processId() {
#ifdef _WIN32
  return _getpid();
#else
  return static_cast<int>(getpid());
#endif
}

} // namespace

fs::path stagingPathFor(const fs::path &destination) {
  // Dataset keys may end in anything, so never reuse a path that exists.
  fs::path candidate;
  do {
    candidate = destination;
    candidate += ".neurosync-" + std::to_string(processId()) + "-" +
                 std::to_string(stagingCounter++) + ".tmp";
  } while (fs::exists(candidate) || fs::is_symlink(candidate));
  return candidate;
}

TransferExecutor::TransferExecutor(RemoteService &remote,
                                   const std::string &datasetId,
                                   const FileSystemScanner &scanner,
                                   const CancellationToken &cancel,
                                   ProgressSink *progress)
    : m_remote(remote), m_datasetId(datasetId), m_scanner(scanner),
      m_cancel(cancel), m_progress(progress) {}

void TransferExecutor::upload(const PlanEntry &item,
                              const ProgressStream::Callback &onProgress) {
  FileStream source(item.absPath, FileStream::Mode::Read);
  ProgressStream observed(source, onProgress);
  m_remote.uploadFile(m_datasetId, observed, item.key);
}

void TransferExecutor::download(const PlanEntry &item,
                                const ProgressStream::Callback &onProgress) {
  if (item.urls.empty())
    throw TransferError("no download URL for " + item.key);

  fs::path destination = m_scanner.resolveInsideRoot(item.key);
  fs::create_directories(destination.parent_path());
  fs::path partial = stagingPathFor(destination);

  try {
    FileStream sink(partial.string(), FileStream::Mode::Write);
    ProgressStream observed(sink, onProgress);
    m_remote.download(item.urls.front(), observed);
    observed.flush();
    int64_t written = observed.position();
    sink.close();
    if (written != item.size) {
      throw TransferError("size mismatch for " + item.key + ": expected " +
                          std::to_string(item.size) + " bytes, received " +
                          std::to_string(written));
    }
    fs::rename(partial, destination);
  } catch (...) {
    std::error_code ec;
    fs::remove(partial, ec);
    throw;
  }
}

TransferOutcome TransferExecutor::transfer(const PlanEntry &item,
                                           Direction direction) {
  TransferOutcome outcome{item.key, ItemStatus::Succeeded, "", 0};
  int64_t position = 0;
  auto onProgress = [this, &position](int64_t pos) {
    position = pos;
    if (m_progress)
      m_progress->update(pos);
  };

  if (m_progress)
    m_progress->start(item.key, item.size);
  try {
    if (direction == Direction::Upload)
      upload(item, onProgress);
    else
      download(item, onProgress);
    outcome.bytes = position;
  } catch (const AuthError &) {
    if (m_progress)
      m_progress->finish(false);
    throw;
  } catch (const std::exception &e) {
    outcome.bytes = position;
    if (m_cancel.cancelled()) {
      outcome.status = ItemStatus::Cancelled;
      outcome.message = "interrupted";
    } else {
      outcome.status = ItemStatus::Failed;
      outcome.message = e.what();
    }
  }
  if (m_progress)
    m_progress->finish(outcome.status == ItemStatus::Succeeded);

  if (outcome.status == ItemStatus::Failed) {
    std::cerr << "[Transfer] Failed " << item.key << ": " << outcome.message
              << std::endl;
  }
  return outcome;
}

BatchOutcome TransferExecutor::transferAll(const std::vector<PlanEntry> &items,
                                           Direction direction) {
  BatchOutcome batch;
  for (const auto &item : items) {
    if (m_cancel.cancelled()) {
      batch.cancelled = true;
      break;
    }
    batch.items.push_back(transfer(item, direction));
    if (batch.items.back().status == ItemStatus::Cancelled) {
      batch.cancelled = true;
      break;
    }
  }

  std::cout << "[Transfer] " << batch.succeeded() << " transferred, "
            << batch.failed() << " failed"
            << (batch.cancelled ? ", interrupted" : "") << std::endl;
  return batch;
}

} // namespace neurosync
