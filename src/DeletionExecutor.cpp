#include "DeletionExecutor.hpp"
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace neurosync {

DeletionExecutor::DeletionExecutor(RemoteService &remote,
                                   const std::string &datasetId,
                                   const CancellationToken &cancel)
    : m_remote(remote), m_datasetId(datasetId), m_cancel(cancel) {}

ItemOutcome DeletionExecutor::deleteOne(const PlanEntry &item, Side side) {
  ItemOutcome outcome{item.key, ItemStatus::Succeeded, "", 0};
  try {
    if (side == Side::Remote) {
      m_remote.deleteFile(m_datasetId, item.key);
    } else if (!fs::remove(item.absPath)) {
      outcome.status = ItemStatus::Failed;
      outcome.message = "no such file: " + item.absPath;
    }
  } catch (const AuthError &) {
    throw;
  } catch (const std::exception &e) {
    outcome.status =
        m_cancel.cancelled() ? ItemStatus::Cancelled : ItemStatus::Failed;
    outcome.message = m_cancel.cancelled() ? "interrupted" : e.what();
  }

  if (outcome.status == ItemStatus::Succeeded) {
    std::cout << "[Delete] Removed " << item.key
              << (side == Side::Remote ? " (remote)" : " (local)") << std::endl;
  } else if (outcome.status == ItemStatus::Failed) {
    std::cerr << "[Delete] Failed " << item.key << ": " << outcome.message
              << std::endl;
  }
  return outcome;
}

DeletionOutcome DeletionExecutor::deleteAll(const std::vector<PlanEntry> &items,
                                            Side side) {
  DeletionOutcome batch;
  std::set<std::string> attempted;
  for (const auto &item : items) {
    if (m_cancel.cancelled()) {
      batch.cancelled = true;
      break;
    }
    if (!attempted.insert(item.key).second)
      continue;
    batch.items.push_back(deleteOne(item, side));
    if (batch.items.back().status == ItemStatus::Cancelled) {
      batch.cancelled = true;
      break;
    }
  }

  std::cout << "[Delete] " << batch.succeeded() << " removed, "
            << batch.failed() << " failed"
            << (batch.cancelled ? ", interrupted" : "") << std::endl;
  return batch;
}

} // namespace neurosync
