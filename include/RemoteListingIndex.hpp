#pragma once
#include "RemoteService.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace neurosync {

/**
 * RemoteListingIndex turns one listing call into a key -> RemoteEntry map.
 * Errors from the remote are not caught here.
 */
class RemoteListingIndex {
public:
  explicit RemoteListingIndex(RemoteService &remote);

  RemoteIndex list(const std::string &datasetId,
                   const std::optional<std::string> &version);

private:
  RemoteService &m_remote;
};

} // namespace neurosync
