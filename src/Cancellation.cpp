#include "Cancellation.hpp"
#include <csignal>

namespace neurosync {

namespace {
std::atomic<CancellationToken *> g_token{nullptr};

void signalHandler(int) {
  if (auto *token = g_token.load())
    token->cancel();
}
} // namespace

void installSignalHandlers(CancellationToken &token) {
  g_token.store(&token);
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
}

} // namespace neurosync
