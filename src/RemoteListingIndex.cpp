#include "RemoteListingIndex.hpp"
#include "FileSystemScanner.hpp"
#include <iostream>

namespace neurosync {

RemoteListingIndex::RemoteListingIndex(RemoteService &remote)
    : m_remote(remote) {}

RemoteIndex
RemoteListingIndex::list(const std::string &datasetId,
                         const std::optional<std::string> &version) {
  RemoteListing listing = m_remote.listFiles(datasetId, version);
  if (listing.datasetId != datasetId) {
    std::cerr << "[Index] Warning: listing for " << datasetId
              << " reports dataset '" << listing.datasetId << "'" << std::endl;
  }

  RemoteIndex index;
  for (const auto &file : listing.files) {
    std::string key = FileSystemScanner::normalizeRemoteKey(file.filename);
    if (key.empty()) {
      std::cerr << "[Index] Ignoring entry with empty name" << std::endl;
      continue;
    }
    RemoteEntry entry;
    entry.path = key;
    entry.size = file.size;
    entry.urls = file.urls;
    entry.datasetId = datasetId;
    entry.version = version;
    if (!index.insert_or_assign(key, entry).second) {
      std::cerr << "[Index] Warning: duplicate entry " << key
                << ", keeping the last one" << std::endl;
    }
  }

  std::cout << "[Index] " << index.size() << " remote files in " << datasetId
            << (version ? " @ " + *version : std::string(" (draft)"))
            << std::endl;
  return index;
}

} // namespace neurosync
