#include "ReconciliationService.hpp"
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace neurosync {

namespace {

// First file wins a key; later files that normalize to the same key are
// rejected so neither side acts on an ambiguous path.
std::map<std::string, LocalEntry> indexLocalFiles(const ScanResult &scan,
                                                  ReconciliationPlan &result) {
  std::map<std::string, LocalEntry> byKey;
  for (const auto &file : scan.files) {
    auto [it, inserted] = byKey.emplace(file.key, file);
    if (!inserted) {
      std::cerr << "[Plan] " << file.absPath << " and " << it->second.absPath
                << " both map to " << file.key << std::endl;
      result.rejected.push_back(
          {file.key, "local file " + file.absPath + " collides with " +
                         it->second.absPath});
    }
  }
  return byKey;
}

} // namespace

ReconciliationService::ReconciliationService(const std::string &localRoot)
    : m_localRoot(localRoot), m_scanner(localRoot) {}

ReconciliationPlan ReconciliationService::plan(const RemoteIndex &remoteIndex,
                                               Direction direction) {
  std::cout << "[Plan] Scanning " << m_localRoot << "..." << std::endl;
  ScanResult scan = m_scanner.scan();

  ReconciliationPlan result;
  result.direction = direction;
  if (direction == Direction::Upload)
    planUpload(scan, remoteIndex, result);
  else
    planDownload(scan, remoteIndex, result);

  std::cout << "[Plan] " << (direction == Direction::Upload ? "upload" : "download")
            << ": " << result.toTransfer.size() << " to transfer, "
            << result.alreadySynchronized.size() << " in sync, "
            << result.orphanedOnTarget.size() << " orphaned, "
            << result.rejected.size() << " rejected" << std::endl;
  return result;
}

void ReconciliationService::planUpload(const ScanResult &scan,
                                       const RemoteIndex &remoteIndex,
                                       ReconciliationPlan &result) {
  // Remote keys not claimed by a local file end up as orphans.
  RemoteIndex remaining = remoteIndex;

  for (const auto &key : scan.skipped) {
    remaining.erase(key);
    result.rejected.push_back({key, "local file could not be inspected"});
  }

  std::map<std::string, LocalEntry> localByKey = indexLocalFiles(scan, result);

  for (const auto &[key, local] : localByKey) {
    auto it = remoteIndex.find(key);
    if (it != remoteIndex.end() && it->second.size == local.size) {
      result.alreadySynchronized.push_back(key);
    } else {
      result.toTransfer.push_back({key, local.absPath, local.size, {}});
    }
    remaining.erase(key);
  }

  for (const auto &[key, remote] : remaining) {
    std::string localPath = (fs::path(m_localRoot) / key).string();
    result.orphanedOnTarget.push_back({key, localPath, remote.size, remote.urls});
  }
}

void ReconciliationService::planDownload(const ScanResult &scan,
                                         const RemoteIndex &remoteIndex,
                                         ReconciliationPlan &result) {
  std::map<std::string, LocalEntry> remaining = indexLocalFiles(scan, result);
  std::set<std::string> skipped(scan.skipped.begin(), scan.skipped.end());

  for (const auto &[key, remote] : remoteIndex) {
    if (skipped.count(key)) {
      result.rejected.push_back({key, "local file could not be inspected"});
      continue;
    }

    fs::path destination;
    try {
      destination = m_scanner.resolveInsideRoot(key);
    } catch (const PathEscapeError &e) {
      std::cerr << "[Plan] Rejecting remote entry: " << e.what() << std::endl;
      result.rejected.push_back({key, e.what()});
      continue;
    }

    auto it = remaining.find(key);
    if (it != remaining.end() && it->second.size == remote.size) {
      result.alreadySynchronized.push_back(key);
    } else {
      result.toTransfer.push_back(
          {key, destination.string(), remote.size, remote.urls});
    }
    if (it != remaining.end())
      remaining.erase(it);
  }

  for (const auto &[key, local] : remaining)
    result.orphanedOnTarget.push_back({key, local.absPath, local.size, {}});
}

} // namespace neurosync
