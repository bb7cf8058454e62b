#pragma once
#include <atomic>

namespace neurosync {

/**
 * CancellationToken is set once the user asks to stop. Batch loops check it
 * between items and the HTTP layer checks it between chunks.
 */
class CancellationToken {
public:
  void cancel() { m_cancelled.store(true); }
  bool cancelled() const { return m_cancelled.load(); }

private:
  std::atomic<bool> m_cancelled{false};
};

// Routes SIGINT/SIGTERM to the given token for the lifetime of the process.
void installSignalHandlers(CancellationToken &token);

} // namespace neurosync
