#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace neurosync {

enum class Direction { Upload, Download };

// Which side of the reconciliation an operation touches.
enum class Side { Local, Remote };

struct LocalEntry {
  std::string path; // Relative path from the local root, OS separators
  std::string key;  // Same path with '/' separators (comparison key)
  std::string absPath;
  int64_t size;
};

struct ScanResult {
  std::vector<LocalEntry> files;
  std::vector<std::string> skipped; // keys that could not be inspected
};

// One element of a dataset listing as returned by the remote service.
struct RemoteFile {
  std::string filename;
  int64_t size;
  std::vector<std::string> urls;
};

struct RemoteListing {
  std::string datasetId;
  std::vector<RemoteFile> files;
};

struct RemoteEntry {
  std::string path; // remote-canonical, '/' separated
  int64_t size;
  std::vector<std::string> urls;
  std::string datasetId;
  std::optional<std::string> version; // empty = draft
};

using RemoteIndex = std::map<std::string, RemoteEntry>;

struct PlanEntry {
  std::string key;
  std::string absPath; // local counterpart, may not exist yet
  int64_t size;        // size on the authoritative side
  std::vector<std::string> urls;
};

struct RejectedEntry {
  std::string key;
  std::string reason;
};

struct ReconciliationPlan {
  Direction direction;
  std::vector<PlanEntry> toTransfer;
  std::vector<std::string> alreadySynchronized;
  std::vector<PlanEntry> orphanedOnTarget;
  std::vector<RejectedEntry> rejected;
};

enum class ItemStatus { Succeeded, Failed, Cancelled };

struct ItemOutcome {
  std::string key;
  ItemStatus status;
  std::string message;
  int64_t bytes = 0;
};

struct BatchOutcome {
  std::vector<ItemOutcome> items;
  bool cancelled = false;

  size_t count(ItemStatus status) const {
    size_t n = 0;
    for (const auto &item : items)
      if (item.status == status)
        ++n;
    return n;
  }
  size_t succeeded() const { return count(ItemStatus::Succeeded); }
  size_t failed() const { return count(ItemStatus::Failed); }
};

using TransferOutcome = ItemOutcome;
using DeletionOutcome = BatchOutcome;

} // namespace neurosync
