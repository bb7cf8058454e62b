#pragma once
#include "Cancellation.hpp"
#include "RemoteService.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace neurosync {

class DeletionExecutor {
public:
  DeletionExecutor(RemoteService &remote, const std::string &datasetId,
                   const CancellationToken &cancel);

  // Removes each orphan from the given side, at most once per key.
  DeletionOutcome deleteAll(const std::vector<PlanEntry> &items, Side side);

private:
  RemoteService &m_remote;
  std::string m_datasetId;
  const CancellationToken &m_cancel;

  ItemOutcome deleteOne(const PlanEntry &item, Side side);
};

} // namespace neurosync
