#pragma once
#include "FileSystemScanner.hpp"
#include "types.hpp"
#include <map>
#include <string>

namespace neurosync {

/**
 * ReconciliationService compares the local tree against a remote index and
 * classifies every key. Size is the only identity check available.
 */
class ReconciliationService {
public:
  explicit ReconciliationService(const std::string &localRoot);

  ReconciliationPlan plan(const RemoteIndex &remoteIndex, Direction direction);

private:
  std::string m_localRoot;
  FileSystemScanner m_scanner;

  void planUpload(const ScanResult &scan, const RemoteIndex &remoteIndex,
                  ReconciliationPlan &result);
  void planDownload(const ScanResult &scan, const RemoteIndex &remoteIndex,
                    ReconciliationPlan &result);
};

} // namespace neurosync
